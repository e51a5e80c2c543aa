#pragma once
#include "events/RawEvents.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>
#include <vector>

namespace TS {

// Latest value of every axis for one tool. Values persist across frames since
// servers only resend what changed.
struct AxisState {
    std::optional<std::array<float, 2>> position;
    std::optional<float>                distance;
    std::optional<float>                pressure;
    std::optional<float>                buttonPressure;
    std::optional<std::array<float, 2>> tilt;
    std::optional<float>                roll;
    std::optional<float>                slider;
    std::optional<std::array<float, 2>> contactSize;
    // Relative, summed within one frame.
    std::optional<Wheel> wheel;
};

// nullopt when the position is NaN. Other NaN axes are reported as absent.
[[nodiscard]] auto buildPose(AxisState const& axes) -> std::optional<Pose>;

/**
 * Collects the messages a protocol delivers for one tool between frame
 * boundaries, then emits them in a fixed order:
 * In, Down, Pose, Buttons, Up, Out and finally Frame.
 *
 * Down is only emitted while the tool is In and Up is synthesized when a tool
 * leaves proximity while still touching. A tool that enters another tablet
 * without leaving the first gets Out for the old tablet ahead of the new In.
 */
template <typename Id>
class FrameAssembler {
public:
    auto proximityIn(Id const& tool, Id const& tablet) -> void {
        auto& acc      = this->accumulator(tool);
        acc.pendingOut = false;
        if (acc.in && acc.tablet == tablet) {
            acc.pendingIn.reset();
            return;
        }
        acc.pendingIn = tablet;
    }

    auto proximityOut(Id const& tool) -> void {
        auto it = this->position(tool);
        if (it == this->accumulators.end())
            return;
        if (it->in || it->pendingIn)
            it->pendingOut = true;
    }

    auto down(Id const& tool) -> void {
        auto& acc = this->accumulator(tool);
        if (acc.pendingUp) {
            acc.pendingUp = false;
            return;
        }
        if (!acc.down)
            acc.pendingDown = true;
    }

    auto up(Id const& tool) -> void {
        auto& acc = this->accumulator(tool);
        if (acc.down || acc.pendingDown)
            acc.pendingUp = true;
    }

    auto motion(Id const& tool, float x, float y) -> void { this->touch(tool).position = std::array<float, 2>{x, y}; }
    auto distance(Id const& tool, float value) -> void { this->touch(tool).distance = value; }
    auto pressure(Id const& tool, float value) -> void { this->touch(tool).pressure = value; }
    auto buttonPressure(Id const& tool, float value) -> void { this->touch(tool).buttonPressure = value; }
    auto tilt(Id const& tool, float x, float y) -> void { this->touch(tool).tilt = std::array<float, 2>{x, y}; }
    auto roll(Id const& tool, float value) -> void { this->touch(tool).roll = value; }
    auto slider(Id const& tool, float value) -> void { this->touch(tool).slider = value; }
    auto contactSize(Id const& tool, float w, float h) -> void { this->touch(tool).contactSize = std::array<float, 2>{w, h}; }

    auto wheel(Id const& tool, float radians, std::int32_t clicks) -> void {
        auto& axes = this->touch(tool);
        if (!axes.wheel)
            axes.wheel = Wheel{};
        axes.wheel->radians += radians;
        axes.wheel->clicks += clicks;
    }

    auto button(Id const& tool, ButtonId button, bool pressed) -> void {
        this->accumulator(tool).buttons.push_back(ToolButton{button, pressed});
    }

    // Emits everything gathered for `tool`, always closed by one Frame.
    auto frame(Id const& tool, std::optional<FrameTimestamp> timestamp, std::vector<RawEvent<Id>>& out) -> void {
        auto push = [&](RawToolEvent<Id> event) { out.push_back(RawToolRecord<Id>{tool, std::move(event)}); };
        auto it   = this->position(tool);
        if (it != this->accumulators.end()) {
            auto& acc = *it;
            if (acc.pendingIn) {
                if (acc.in) {
                    // Moved to another tablet.
                    if (acc.down) {
                        push(ToolUp{});
                        acc.down = false;
                    }
                    push(ToolOut{});
                }
                push(RawToolIn<Id>{*acc.pendingIn});
                acc.in     = true;
                acc.tablet = *acc.pendingIn;
            }
            if (acc.pendingDown) {
                if (acc.in) {
                    push(ToolDown{});
                    acc.down = true;
                } else {
                    ts_log("Dropping contact for a tool that never entered proximity", "Frame");
                }
            }
            if (acc.dirty) {
                if (auto pose = buildPose(acc.axes))
                    push(ToolPose{*pose});
            }
            for (auto const& button : acc.buttons)
                push(button);
            if (acc.pendingUp && acc.down) {
                push(ToolUp{});
                acc.down = false;
            }
            bool const leaving = acc.pendingOut;
            if (leaving) {
                if (acc.down) {
                    push(ToolUp{});
                    acc.down = false;
                }
                push(ToolOut{});
            }

            acc.pendingIn.reset();
            acc.pendingDown = acc.pendingUp = acc.pendingOut = false;
            acc.dirty                                        = false;
            acc.axes.wheel.reset();
            acc.buttons.clear();
            if (leaving)
                this->accumulators.erase(it);
        }
        push(ToolFrame{timestamp});
    }

    // Drops all state for a tool that no longer exists.
    auto forget(Id const& tool) -> void {
        std::erase_if(this->accumulators, [&](Accumulator const& acc) { return acc.tool == tool; });
    }

    auto clear() -> void { this->accumulators.clear(); }

    [[nodiscard]] auto hasPending(Id const& tool) const -> bool {
        auto it = std::find_if(this->accumulators.begin(), this->accumulators.end(), [&](Accumulator const& acc) { return acc.tool == tool; });
        if (it == this->accumulators.end())
            return false;
        return it->pendingIn || it->pendingDown || it->pendingUp || it->pendingOut || it->dirty || !it->buttons.empty();
    }

    [[nodiscard]] auto isIn(Id const& tool) const -> bool {
        auto const* acc = this->find(tool);
        return acc != nullptr && (acc->in || acc->pendingIn);
    }

    [[nodiscard]] auto isDown(Id const& tool) const -> bool {
        auto const* acc = this->find(tool);
        return acc != nullptr && acc->down;
    }

    [[nodiscard]] auto trackedTools() const -> std::vector<Id> {
        std::vector<Id> tools;
        tools.reserve(this->accumulators.size());
        for (auto const& acc : this->accumulators)
            tools.push_back(acc.tool);
        return tools;
    }

private:
    struct Accumulator {
        Id                      tool;
        std::optional<Id>       tablet;
        bool                    in   = false;
        bool                    down = false;
        std::optional<Id>       pendingIn;
        bool                    pendingDown = false;
        bool                    pendingUp   = false;
        bool                    pendingOut  = false;
        bool                    dirty       = false;
        AxisState               axes;
        std::vector<ToolButton> buttons;
    };

    auto position(Id const& tool) -> typename std::vector<Accumulator>::iterator {
        return std::find_if(this->accumulators.begin(), this->accumulators.end(), [&](Accumulator const& acc) { return acc.tool == tool; });
    }

    [[nodiscard]] auto find(Id const& tool) const -> Accumulator const* {
        for (auto const& acc : this->accumulators)
            if (acc.tool == tool)
                return &acc;
        return nullptr;
    }

    auto accumulator(Id const& tool) -> Accumulator& {
        auto it = this->position(tool);
        if (it != this->accumulators.end())
            return *it;
        Accumulator acc;
        acc.tool = tool;
        this->accumulators.push_back(std::move(acc));
        return this->accumulators.back();
    }

    auto touch(Id const& tool) -> AxisState& {
        auto& acc = this->accumulator(tool);
        acc.dirty = true;
        return acc.axes;
    }

    std::vector<Accumulator> accumulators;
};

} // namespace TS
