#pragma once
#include "core/Error.hpp"
#include "core/MetricUnit.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace TS {

// What an absolute valuator carries, decided from its label atom.
enum class XInput2Valuator : std::uint8_t {
    X,
    Y,
    Pressure,
    Distance,
    TiltX,
    TiltY,
    Roll,
    Slider,
    ButtonPressure,
};

/**
 * XInput2 has no notion of tablets, so tools and pads are recognised from
 * driver-specific device properties and names. The strings below are what the
 * wacom, libinput and Xwayland drivers publish; they can be overridden with a
 * JSON document when a driver changes them.
 */
struct XInput2Heuristics {
    static constexpr std::uint64_t kVersion = 1;

    struct Properties {
        std::string wacomToolType             = "Wacom Tool Type";
        std::string wacomSerialIds            = "Wacom Serial IDs";
        std::string libinputToolSerial        = "libinput Tablet Tool Serial";
        std::string libinputToolId            = "libinput Tablet Tool ID";
        std::string libinputPadModesAvailable = "libinput Pad Mode Groups Modes Available";
        std::string libinputPadButtonGroups   = "libinput Pad Mode Group Buttons";
        std::string libinputPadStripGroups    = "libinput Pad Mode Group Strips";
        std::string libinputPadRingGroups     = "libinput Pad Mode Group Rings";
        std::string libinputSendEventsDefault = "libinput Send Events Mode Enabled Default";
        std::string productId                 = "Device Product ID";
        std::string deviceNode                = "Device Node";
    };

    // Atom names stored in the wacom tool type property.
    struct WacomToolTypes {
        std::string stylus = "STYLUS";
        std::string eraser = "ERASER";
        std::string cursor = "CURSOR";
        std::string pad    = "PAD";
        std::string touch  = "TOUCH";
    };

    // Xwayland names its emulated devices "<prefix>-<kind>:<seat>".
    struct Xwayland {
        std::string prefix        = "xwayland-tablet";
        std::string padSuffix     = "-pad";
        std::string eraserSuffix  = " eraser";
        std::string stylusSuffix  = " stylus";
        std::string cursorSuffix  = " cursor";
        char        seatSeparator = ':';
    };

    struct ValuatorLabel {
        std::string     label;
        XInput2Valuator valuator;
    };

    struct PadLayout {
        // X buttons the drivers use to emulate scrolling on pads.
        std::vector<std::uint32_t> scrollButtons{4, 5, 6, 7};
        std::vector<std::uint16_t> ringValuators{5, 6};
        std::vector<std::uint16_t> stripValuators{3, 4};
    };

    Properties                 properties;
    WacomToolTypes             wacomToolTypes;
    Xwayland                   xwayland;
    std::vector<ValuatorLabel> valuatorLabels{
            {"Abs X", XInput2Valuator::X},
            {"Abs Y", XInput2Valuator::Y},
            {"Abs Pressure", XInput2Valuator::Pressure},
            {"Abs Distance", XInput2Valuator::Distance},
            {"Abs Tilt X", XInput2Valuator::TiltX},
            {"Abs Tilt Y", XInput2Valuator::TiltY},
            {"Abs Rotary Z", XInput2Valuator::Roll},
            {"Abs Wheel", XInput2Valuator::Slider},
            {"Abs Throttle", XInput2Valuator::ButtonPressure},
    };
    // Unit of the tilt valuators. X carries no unit information of its own.
    MetricUnit tiltUnit = MetricUnit::Degrees;
    PadLayout  pad;

    [[nodiscard]] static auto defaults() -> XInput2Heuristics;

    [[nodiscard]] auto valuatorForLabel(std::string_view label) const -> std::optional<XInput2Valuator>;
    // Pad-wide index of a 1-based X button with the scroll buttons removed.
    // nullopt for the scroll buttons themselves.
    [[nodiscard]] auto padButtonIndex(std::uint32_t xButton) const -> std::optional<std::uint32_t>;
};

// Applies a JSON override on top of the defaults. Absent fields keep their
// default value.
[[nodiscard]] auto loadXInput2Heuristics(nlohmann::json const& json) -> Expected<XInput2Heuristics>;
[[nodiscard]] auto loadXInput2HeuristicsFile(std::filesystem::path const& path) -> Expected<XInput2Heuristics>;
// TABLETSPACE_XI_HEURISTICS when set, otherwise the defaults.
[[nodiscard]] auto xinput2HeuristicsFromEnvironment() -> Expected<XInput2Heuristics>;

} // namespace TS
