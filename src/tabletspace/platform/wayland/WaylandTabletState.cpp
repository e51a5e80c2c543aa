#include "platform/wayland/WaylandTabletState.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <numbers>
#include <sstream>

namespace TS {

namespace {
constexpr double kDegreesToRadians = std::numbers::pi / 180.0;

auto toRadians(double degrees) -> float {
    return static_cast<float>(degrees * kDegreesToRadians);
}

// Protocol values are 0..65535 carried in a u32.
auto unitFromU16(std::uint32_t value) -> float {
    return static_cast<float>(std::min<std::uint32_t>(value, 65535u)) / 65535.0f;
}

auto hiLo(std::uint32_t hi, std::uint32_t lo) -> std::uint64_t {
    return (static_cast<std::uint64_t>(hi) << 32) | static_cast<std::uint64_t>(lo);
}

auto toolTypeFrom(WaylandToolType type) -> std::optional<ToolType> {
    switch (type) {
    case WaylandToolType::Pen:
        return ToolType::Pen;
    case WaylandToolType::Eraser:
        return ToolType::Eraser;
    case WaylandToolType::Brush:
        return ToolType::Brush;
    case WaylandToolType::Pencil:
        return ToolType::Pencil;
    case WaylandToolType::Airbrush:
        return ToolType::Airbrush;
    case WaylandToolType::Finger:
        return ToolType::Finger;
    case WaylandToolType::Mouse:
        return ToolType::Mouse;
    case WaylandToolType::Lens:
        return ToolType::Lens;
    }
    return std::nullopt;
}
} // namespace

template <typename T>
auto WaylandTabletState::construct(ConstructionTable<T, WaylandId>& table, WaylandId id, char const* what) -> T* {
    auto record = table.beginOrGet(id);
    if (!record) {
        // The server restarted a burst for a live object. Nothing sane to do.
#ifdef TS_LOG_DEBUG
        std::ostringstream oss;
        oss << "Ignoring construction message for finalized " << what << " " << InternalID{id};
        ts_log(oss.str(), "Construct", "Wayland");
#else
        (void)what;
#endif
        return nullptr;
    }
    return *record;
}

auto WaylandTabletState::beginCycle() -> void {
    events_.clear();
    for (auto const& deferred : destroyNextCycle_) {
        switch (deferred.kind) {
        case DeferredKind::Tool:
            tools_.destroy(deferred.id);
            frames_.forget(deferred.id);
            break;
        case DeferredKind::Tablet:
            tablets_.destroy(deferred.id);
            break;
        case DeferredKind::Pad: {
            if (auto const* pad = pads_.findFinished(deferred.id)) {
                for (auto const& group : pad->groups) {
                    for (auto const& ring : group.rings)
                        if (auto const* id = ring.internalId.as<WaylandId>())
                            ringToGroup_.erase(id->handle);
                    for (auto const& strip : group.strips)
                        if (auto const* id = strip.internalId.as<WaylandId>())
                            stripToGroup_.erase(id->handle);
                    if (auto const* id = group.internalId.as<WaylandId>())
                        groupToPad_.erase(id->handle);
                }
            }
            pads_.destroy(deferred.id);
            break;
        }
        }
    }
    destroyNextCycle_.clear();
}

auto WaylandTabletState::reset() -> void {
    tools_.clear();
    tablets_.clear();
    pads_.clear();
    groups_.clear();
    destroyNextCycle_.clear();
    ringToGroup_.clear();
    stripToGroup_.clear();
    groupToPad_.clear();
    frames_.clear();
    events_.clear();
}

// ---- Tools ----

auto WaylandTabletState::toolType(WaylandId tool, WaylandToolType type) -> void {
    if (auto* ctor = this->construct(tools_, tool, "tool"))
        ctor->type = toolTypeFrom(type);
}

auto WaylandTabletState::toolHardwareSerial(WaylandId tool, std::uint32_t hi, std::uint32_t lo) -> void {
    if (auto* ctor = this->construct(tools_, tool, "tool"))
        ctor->hardwareId = hiLo(hi, lo);
}

auto WaylandTabletState::toolHardwareIdWacom(WaylandId tool, std::uint32_t hi, std::uint32_t lo) -> void {
    if (auto* ctor = this->construct(tools_, tool, "tool"))
        ctor->wacomId = hiLo(hi, lo);
}

auto WaylandTabletState::toolCapability(WaylandId tool, WaylandToolCapability capability) -> void {
    auto* ctor = this->construct(tools_, tool, "tool");
    if (!ctor)
        return;
    auto& axes = ctor->axes;
    switch (capability) {
    case WaylandToolCapability::Tilt:
        axes.tilt = Info{};
        break;
    case WaylandToolCapability::Pressure:
        axes.pressure = NormalizedInfo{};
        break;
    case WaylandToolCapability::Distance:
        axes.distance = LengthInfo{LengthInfo::Normalized{}};
        break;
    case WaylandToolCapability::Rotation:
        axes.roll = CircularInfo{};
        break;
    case WaylandToolCapability::Slider:
        axes.slider = SliderInfo{};
        break;
    case WaylandToolCapability::Wheel:
        axes.wheel = CircularInfo{};
        break;
    }
}

auto WaylandTabletState::toolDone(WaylandId tool) -> void {
    // A tool may be announced with no properties at all.
    if (!this->construct(tools_, tool, "tool"))
        return;
    auto finished = tools_.finalize(tool);
    if (finished && *finished)
        events_.push_back(RawToolRecord<WaylandId>{tool, ToolAdded{}});
}

auto WaylandTabletState::toolRemoved(WaylandId tool) -> void {
    tools_.abandon(tool);
    destroyNextCycle_.push_back(Deferred{DeferredKind::Tool, tool});
    events_.push_back(RawToolRecord<WaylandId>{tool, ToolRemoved{}});
}

auto WaylandTabletState::toolProximityIn(WaylandId tool, WaylandId tablet) -> void {
    frames_.proximityIn(tool, tablet);
}

auto WaylandTabletState::toolProximityOut(WaylandId tool) -> void {
    frames_.proximityOut(tool);
}

auto WaylandTabletState::toolDown(WaylandId tool) -> void {
    frames_.down(tool);
}

auto WaylandTabletState::toolUp(WaylandId tool) -> void {
    frames_.up(tool);
}

auto WaylandTabletState::toolMotion(WaylandId tool, double x, double y) -> void {
    frames_.motion(tool, static_cast<float>(x), static_cast<float>(y));
}

auto WaylandTabletState::toolPressure(WaylandId tool, std::uint32_t pressure) -> void {
    frames_.pressure(tool, unitFromU16(pressure));
}

auto WaylandTabletState::toolDistance(WaylandId tool, std::uint32_t distance) -> void {
    frames_.distance(tool, unitFromU16(distance));
}

auto WaylandTabletState::toolTilt(WaylandId tool, double degreesX, double degreesY) -> void {
    frames_.tilt(tool, toRadians(degreesX), toRadians(degreesY));
}

auto WaylandTabletState::toolRotation(WaylandId tool, double degrees) -> void {
    frames_.roll(tool, toRadians(degrees));
}

auto WaylandTabletState::toolSlider(WaylandId tool, std::int32_t position) -> void {
    auto const clamped = std::clamp(position, -65535, 65535);
    frames_.slider(tool, static_cast<float>(clamped) / 65535.0f);
}

auto WaylandTabletState::toolWheel(WaylandId tool, double degrees, std::int32_t clicks) -> void {
    frames_.wheel(tool, toRadians(degrees), clicks);
}

auto WaylandTabletState::toolButton(WaylandId tool, std::uint32_t button, bool pressed) -> void {
    frames_.button(tool, ButtonId::fromCode(button), pressed);
}

auto WaylandTabletState::toolFrame(WaylandId tool, std::uint32_t millis) -> void {
    frames_.frame(tool, FrameTimestamp::fromMillis(millis), events_);
}

// ---- Tablets ----

auto WaylandTabletState::tabletName(WaylandId tablet, std::string name) -> void {
    if (auto* ctor = this->construct(tablets_, tablet, "tablet"))
        ctor->name = std::move(name);
}

auto WaylandTabletState::tabletId(WaylandId tablet, std::uint32_t vid, std::uint32_t pid) -> void {
    auto* ctor = this->construct(tablets_, tablet, "tablet");
    if (!ctor)
        return;
    if (vid <= 0xFFFF && pid <= 0xFFFF)
        ctor->usbId = UsbId{static_cast<std::uint16_t>(vid), static_cast<std::uint16_t>(pid)};
    else
        ctor->usbId.reset();
}

auto WaylandTabletState::tabletDone(WaylandId tablet) -> void {
    if (!this->construct(tablets_, tablet, "tablet"))
        return;
    auto finished = tablets_.finalize(tablet);
    if (finished && *finished)
        events_.push_back(RawTabletRecord<WaylandId>{tablet, TabletAdded{}});
}

auto WaylandTabletState::tabletRemoved(WaylandId tablet) -> void {
    tablets_.abandon(tablet);
    destroyNextCycle_.push_back(Deferred{DeferredKind::Tablet, tablet});
    events_.push_back(RawTabletRecord<WaylandId>{tablet, TabletRemoved{}});
}

// ---- Pads ----

auto WaylandTabletState::padGroup(WaylandId pad, WaylandId group) -> void {
    auto* ctor = this->construct(pads_, pad, "pad");
    if (!ctor)
        return;
    PadGroup placeholder;
    placeholder.internalId = group;
    ctor->groups.push_back(std::move(placeholder));
    groupToPad_[group.handle] = pad;
}

auto WaylandTabletState::padButtons(WaylandId pad, std::uint32_t buttons) -> void {
    if (auto* ctor = this->construct(pads_, pad, "pad"))
        ctor->totalButtons = buttons;
}

auto WaylandTabletState::padDone(WaylandId pad) -> void {
    auto finished = pads_.finalize(pad);
    if (!finished)
        return;
    if (!*finished) {
#ifdef TS_LOG_DEBUG
        ts_log("Rejected pad: " + describeError(finished->error()), "Construct", "Wayland");
#endif
        return;
    }
    events_.push_back(RawPadRecord<WaylandId>{pad, PadAdded{}});
}

auto WaylandTabletState::padRemoved(WaylandId pad) -> void {
    pads_.abandon(pad);
    destroyNextCycle_.push_back(Deferred{DeferredKind::Pad, pad});
    events_.push_back(RawPadRecord<WaylandId>{pad, PadRemoved{}});
}

auto WaylandTabletState::padButton(WaylandId pad, std::uint32_t button, bool pressed) -> void {
    events_.push_back(RawPadRecord<WaylandId>{pad, RawPadButton{button, pressed}});
}

auto WaylandTabletState::padEnter(WaylandId pad, WaylandId tablet) -> void {
    events_.push_back(RawPadRecord<WaylandId>{pad, RawPadEnter<WaylandId>{tablet}});
}

auto WaylandTabletState::padLeave(WaylandId pad) -> void {
    events_.push_back(RawPadRecord<WaylandId>{pad, PadExit{}});
}

// ---- Pad groups ----

auto WaylandTabletState::groupButtons(WaylandId group, std::span<std::uint8_t const> buttons) -> void {
    auto* ctor = this->construct(groups_, group, "group");
    if (!ctor)
        return;
    for (std::size_t offset = 0; offset + sizeof(std::uint32_t) <= buttons.size(); offset += sizeof(std::uint32_t)) {
        std::uint32_t index = 0;
        std::memcpy(&index, buttons.data() + offset, sizeof(index));
        ctor->buttons.push_back(index);
    }
    std::sort(ctor->buttons.begin(), ctor->buttons.end());
    ctor->buttons.erase(std::unique(ctor->buttons.begin(), ctor->buttons.end()), ctor->buttons.end());
}

auto WaylandTabletState::groupModes(WaylandId group, std::uint32_t modes) -> void {
    auto* ctor = this->construct(groups_, group, "group");
    if (!ctor)
        return;
    if (modes != 0)
        ctor->modeCount = modes;
    else
        ctor->modeCount.reset();
}

auto WaylandTabletState::groupRing(WaylandId group, WaylandId ring) -> void {
    ringToGroup_[ring.handle] = group;
    if (auto* ctor = this->construct(groups_, group, "group"))
        ctor->rings.push_back(Ring{ring, std::nullopt});
}

auto WaylandTabletState::groupStrip(WaylandId group, WaylandId strip) -> void {
    stripToGroup_[strip.handle] = group;
    if (auto* ctor = this->construct(groups_, group, "group"))
        ctor->strips.push_back(Strip{strip, std::nullopt});
}

auto WaylandTabletState::groupDone(WaylandId group) -> void {
    auto finished = groups_.finalize(group);
    if (!finished || !*finished)
        return;
    // The group now lives inside its pad.
    PadGroup done = std::move(**finished);
    groups_.destroy(group);

    auto padId = this->padOfGroup(group);
    if (!padId)
        return;
    Pad* pad = pads_.findFinished(*padId);
    if (!pad)
        pad = this->construct(pads_, *padId, "pad");
    if (!pad)
        return;
    auto slot = std::find_if(pad->groups.begin(), pad->groups.end(), [&](PadGroup const& g) { return idMatches(g.internalId, group); });
    if (slot != pad->groups.end())
        *slot = std::move(done);
    else
        pad->groups.push_back(std::move(done));
}

auto WaylandTabletState::groupModeSwitch(WaylandId group, std::uint32_t mode) -> void {
    this->pushGroupEvent(group, GroupMode{mode});
}

auto WaylandTabletState::padOfGroup(WaylandId group) const -> std::optional<WaylandId> {
    auto it = groupToPad_.find(group.handle);
    if (it == groupToPad_.end())
        return std::nullopt;
    return it->second;
}

auto WaylandTabletState::pushGroupEvent(WaylandId group, RawGroupEvent<WaylandId> event) -> void {
    auto pad = this->padOfGroup(group);
    if (!pad) {
        ts_log("Group event for a group without a pad", "Wayland");
        return;
    }
    events_.push_back(RawPadRecord<WaylandId>{*pad, RawPadGroupUpdate<WaylandId>{group, std::move(event)}});
}

// ---- Rings and strips ----

auto WaylandTabletState::pushRingEvent(WaylandId ring, TouchStripEvent event) -> void {
    auto it = ringToGroup_.find(ring.handle);
    if (it == ringToGroup_.end())
        return;
    this->pushGroupEvent(it->second, RawRingUpdate<WaylandId>{ring, event});
}

auto WaylandTabletState::pushStripEvent(WaylandId strip, TouchStripEvent event) -> void {
    auto it = stripToGroup_.find(strip.handle);
    if (it == stripToGroup_.end())
        return;
    this->pushGroupEvent(it->second, RawStripUpdate<WaylandId>{strip, event});
}

auto WaylandTabletState::ringAngle(WaylandId ring, double degrees) -> void {
    if (std::isnan(degrees))
        return;
    this->pushRingEvent(ring, TouchPose{toRadians(degrees)});
}

auto WaylandTabletState::ringSource(WaylandId ring, TouchSource source) -> void {
    this->pushRingEvent(ring, TouchSourceChanged{source});
}

auto WaylandTabletState::ringStop(WaylandId ring) -> void {
    this->pushRingEvent(ring, TouchUp{});
}

auto WaylandTabletState::ringFrame(WaylandId ring, std::uint32_t millis) -> void {
    this->pushRingEvent(ring, TouchFrame{FrameTimestamp::fromMillis(millis)});
}

auto WaylandTabletState::stripPosition(WaylandId strip, std::uint32_t position) -> void {
    this->pushStripEvent(strip, TouchPose{unitFromU16(position)});
}

auto WaylandTabletState::stripSource(WaylandId strip, TouchSource source) -> void {
    this->pushStripEvent(strip, TouchSourceChanged{source});
}

auto WaylandTabletState::stripStop(WaylandId strip) -> void {
    this->pushStripEvent(strip, TouchUp{});
}

auto WaylandTabletState::stripFrame(WaylandId strip, std::uint32_t millis) -> void {
    this->pushStripEvent(strip, TouchFrame{FrameTimestamp::fromMillis(millis)});
}

} // namespace TS
