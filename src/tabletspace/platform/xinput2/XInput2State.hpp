#pragma once
#include "calibration/Calibration.hpp"
#include "device/Pad.hpp"
#include "device/Tablet.hpp"
#include "device/Tool.hpp"
#include "events/RawEvents.hpp"
#include "frame/FrameAssembler.hpp"
#include "config/XInput2Heuristics.hpp"

#include <parallel_hashmap/phmap.h>

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace TS {

struct XInput2ValuatorInfo {
    std::uint16_t number = 0;
    // Label atom name, empty when the driver left it unset.
    std::string  label;
    double       min        = 0.0;
    double       max        = 0.0;
    std::int32_t resolution = 0;
    bool         absolute   = true;
};

/**
 * One slave pointer as reported by XIQueryDevice, together with the device
 * properties the heuristics table asks for. Integer and atom properties are
 * stored by property name; atoms are stored as their names.
 */
struct XInput2DeviceSnapshot {
    std::uint16_t                    deviceId = 0;
    std::string                      name;
    bool                             enabled = true;
    std::vector<XInput2ValuatorInfo> valuators;
    std::uint32_t                    buttonCount = 0;

    phmap::flat_hash_map<std::string, std::vector<std::int64_t>> integerProperties;
    phmap::flat_hash_map<std::string, std::string>               textProperties;

    [[nodiscard]] auto integerProperty(std::string const& property) const -> std::span<std::int64_t const>;
    [[nodiscard]] auto textProperty(std::string const& property) const -> std::optional<std::string_view>;
};

// Pointer position in window coordinates plus the valuators the server
// included in the event mask.
struct XInput2DeviceEvent {
    std::uint16_t                                 deviceId = 0;
    std::uint32_t                                 time     = 0;
    double                                        x        = 0.0;
    double                                        y        = 0.0;
    std::vector<std::pair<std::uint16_t, double>> valuators;
};

/**
 * Tools, tablets and pads recovered from the XInput2 device list, and the
 * events derived from pointer traffic. The transport adapter forwards X events
 * here; tests call these methods directly.
 *
 * X recycles device ids, so every rescan starts a new generation. Objects of
 * the previous generation are announced Removed and stay readable until the
 * next cycle, when the new generation replaces them and is announced Added.
 */
class XInput2State {
public:
    explicit XInput2State(XInput2Heuristics heuristics = XInput2Heuristics::defaults());

    auto beginCycle() -> void;
    // Closes every frame still open at the end of a dispatch cycle.
    auto endCycle() -> void;
    auto reset() -> void;

    auto rescan(std::span<XInput2DeviceSnapshot const> devices) -> void;
    auto motion(XInput2DeviceEvent const& event) -> void;
    auto button(XInput2DeviceEvent const& event, std::uint32_t button, bool pressed) -> void;
    auto leave(std::uint16_t deviceId, std::uint32_t time) -> void;
    // New value of the wacom serial ids property. A zero current serial means
    // the tool left proximity.
    auto serialIds(std::uint16_t deviceId, std::span<std::int64_t const> ids, std::uint32_t time) -> void;

    [[nodiscard]] auto generation() const -> std::uint32_t { return generation_; }
    [[nodiscard]] auto heuristics() const -> XInput2Heuristics const& { return heuristics_; }

    [[nodiscard]] auto tools() const -> std::span<Tool const> { return current_.tools; }
    [[nodiscard]] auto tablets() const -> std::span<Tablet const> { return current_.tablets; }
    [[nodiscard]] auto pads() const -> std::span<Pad const> { return current_.pads; }
    [[nodiscard]] auto events() const -> std::span<RawEvent<XInput2Id> const> { return events_; }

private:
    struct Binding {
        std::uint16_t   number = 0;
        XInput2Valuator valuator = XInput2Valuator::X;
        Scaler          scaler;
    };

    struct ToolDevice {
        XInput2Id                    tool;
        XInput2Id                    tablet;
        std::vector<Binding>         bindings;
        std::optional<std::uint32_t> frameTime;
        std::optional<std::uint32_t> lastTime;
        std::array<float, 2>         tilt{0.0f, 0.0f};
    };

    struct PadControl {
        std::uint16_t        number = 0;
        bool                 ring   = false;
        XInput2Id            control;
        XInput2Id            group;
        double               min = 0.0;
        double               max = 0.0;
        std::optional<float> last;
    };

    struct PadDevice {
        XInput2Id                pad;
        std::optional<XInput2Id> tablet;
        std::vector<PadControl>  controls;
    };

    struct Generation {
        std::vector<Tool>                                 tools;
        std::vector<Tablet>                               tablets;
        std::vector<Pad>                                  pads;
        phmap::flat_hash_map<std::uint16_t, ToolDevice>   toolDevices;
        phmap::flat_hash_map<std::uint16_t, PadDevice>    padDevices;

        [[nodiscard]] auto empty() const -> bool { return tools.empty() && tablets.empty() && pads.empty(); }
    };

    auto build(std::span<XInput2DeviceSnapshot const> devices) const -> Generation;
    auto announceRemoved() -> void;
    auto announceAdded() -> void;

    auto acceptsDeviceEvents() const -> bool;
    auto enter(ToolDevice& device, std::uint32_t time) -> void;
    auto applyValuators(ToolDevice& device, XInput2DeviceEvent const& event) -> void;
    auto applyPadValuators(PadDevice& device, XInput2DeviceEvent const& event) -> void;
    auto closeFrame(ToolDevice& device) -> void;

    XInput2Heuristics         heuristics_;
    std::uint32_t             generation_ = 0;
    Generation                current_;
    std::optional<Generation> pending_;
    bool                      removalAnnounced_ = false;

    FrameAssembler<XInput2Id>        frames_;
    std::vector<RawEvent<XInput2Id>> events_;
};

} // namespace TS
