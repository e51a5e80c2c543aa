#pragma once
#include "core/Axis.hpp"
#include "core/FrameTimestamp.hpp"
#include "device/Pad.hpp"
#include "device/Tablet.hpp"
#include "device/Tool.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <ostream>
#include <variant>

namespace TS {

/**
 * Opaque tool button identity. Wayland and XInput2 button codes sit in the low
 * word, Windows Ink reports a 128-bit GUID.
 */
struct ButtonId {
    std::uint64_t high = 0;
    std::uint64_t low  = 0;

    [[nodiscard]] static constexpr auto fromCode(std::uint32_t code) -> ButtonId { return ButtonId{0, code}; }
    [[nodiscard]] static auto           fromGuid(std::array<std::uint8_t, 16> const& guid) -> ButtonId;

    friend auto operator<=>(ButtonId const&, ButtonId const&) = default;
};

// Payloads shared between raw and resolved events.
struct ToolAdded {};
struct ToolRemoved {};
struct ToolDown {};
struct ToolUp {};
struct ToolOut {};
struct ToolButton {
    ButtonId button;
    bool     pressed = false;
};
struct ToolPose {
    Pose pose;
};
// Closes the group of events for one tool. The timestamp is absent when the
// backend could not attribute one.
struct ToolFrame {
    std::optional<FrameTimestamp> timestamp;
};

struct TabletAdded {};
struct TabletRemoved {};

struct TouchPose {
    float value = 0.0f;
};
struct TouchSourceChanged {
    TouchSource source = TouchSource::Unknown;
};
struct TouchFrame {
    std::optional<FrameTimestamp> timestamp;
};
struct TouchUp {};
using TouchStripEvent = std::variant<TouchPose, TouchSourceChanged, TouchFrame, TouchUp>;

struct GroupMode {
    std::uint32_t mode = 0;
};

struct PadAdded {};
struct PadRemoved {};
struct PadExit {};

// Resolved vocabulary. Pointers refer into the Manager's tables and stay
// valid until the next pump.
struct ToolIn {
    Tablet const* tablet = nullptr;
};
using ToolEvent   = std::variant<ToolAdded, ToolRemoved, ToolIn, ToolDown, ToolButton, ToolPose, ToolFrame, ToolUp, ToolOut>;
using TabletEvent = std::variant<TabletAdded, TabletRemoved>;

struct RingUpdate {
    Ring const*     ring = nullptr;
    TouchStripEvent event;
};
struct StripUpdate {
    Strip const*    strip = nullptr;
    TouchStripEvent event;
};
using GroupEvent = std::variant<RingUpdate, StripUpdate, GroupMode>;

struct PadGroupUpdate {
    PadGroup const* group = nullptr;
    GroupEvent      event;
};
struct PadButton {
    std::uint32_t   button  = 0;
    bool            pressed = false;
    PadGroup const* group   = nullptr; // null when no group claims the button
};
struct PadEnter {
    Tablet const* tablet = nullptr;
};
using PadEvent = std::variant<PadAdded, PadRemoved, PadGroupUpdate, PadButton, PadEnter, PadExit>;

struct ToolUpdate {
    Tool const* tool = nullptr;
    ToolEvent   event;
};
struct TabletUpdate {
    Tablet const* tablet = nullptr;
    TabletEvent   event;
};
struct PadUpdate {
    Pad const* pad = nullptr;
    PadEvent   event;
};
using Event = std::variant<ToolUpdate, TabletUpdate, PadUpdate>;

auto operator<<(std::ostream& os, ButtonId const& button) -> std::ostream&;
auto operator<<(std::ostream& os, ToolEvent const& event) -> std::ostream&;
auto operator<<(std::ostream& os, TouchStripEvent const& event) -> std::ostream&;
auto operator<<(std::ostream& os, Event const& event) -> std::ostream&;

/**
 * Signed rotation from `from` to `to` for a ring reporting in [0, tau). The
 * shortest way around wins, so crossing the zero point gives a small delta
 * instead of one close to a full turn.
 */
[[nodiscard]] auto ringDelta(float from, float to) -> float;

} // namespace TS
