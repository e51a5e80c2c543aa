#pragma once
#include "construct/ConstructionTable.hpp"
#include "device/Pad.hpp"
#include "device/Tablet.hpp"
#include "device/Tool.hpp"
#include "events/RawEvents.hpp"
#include "frame/FrameAssembler.hpp"

#include <parallel_hashmap/phmap.h>

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace TS {

// zwp_tablet_tool_v2.type values.
enum class WaylandToolType : std::uint32_t {
    Pen      = 0x140,
    Eraser   = 0x141,
    Brush    = 0x142,
    Pencil   = 0x143,
    Airbrush = 0x144,
    Finger   = 0x145,
    Mouse    = 0x146,
    Lens     = 0x147,
};

// zwp_tablet_tool_v2.capability values.
enum class WaylandToolCapability : std::uint32_t {
    Tilt     = 1,
    Pressure = 2,
    Distance = 3,
    Rotation = 4,
    Slider   = 5,
    Wheel    = 6,
};

/**
 * Everything the tablet-unstable-v2 protocol told us, independent of the
 * connection it arrived on. Each method mirrors one protocol message; the
 * transport adapter forwards messages here and tests call them directly.
 *
 * Objects are described by a burst of messages closed by "done". Removals are
 * applied at the start of the next cycle so Removed events can still refer to
 * the record.
 */
class WaylandTabletState {
public:
    // Start of a dispatch cycle. Drops the previous events and applies the
    // removals announced during the previous cycle.
    auto beginCycle() -> void;
    // Forgets every object, for a lost connection.
    auto reset() -> void;

    auto toolType(WaylandId tool, WaylandToolType type) -> void;
    auto toolHardwareSerial(WaylandId tool, std::uint32_t hi, std::uint32_t lo) -> void;
    auto toolHardwareIdWacom(WaylandId tool, std::uint32_t hi, std::uint32_t lo) -> void;
    auto toolCapability(WaylandId tool, WaylandToolCapability capability) -> void;
    auto toolDone(WaylandId tool) -> void;
    auto toolRemoved(WaylandId tool) -> void;
    auto toolProximityIn(WaylandId tool, WaylandId tablet) -> void;
    auto toolProximityOut(WaylandId tool) -> void;
    auto toolDown(WaylandId tool) -> void;
    auto toolUp(WaylandId tool) -> void;
    auto toolMotion(WaylandId tool, double x, double y) -> void;
    auto toolPressure(WaylandId tool, std::uint32_t pressure) -> void;
    auto toolDistance(WaylandId tool, std::uint32_t distance) -> void;
    auto toolTilt(WaylandId tool, double degreesX, double degreesY) -> void;
    auto toolRotation(WaylandId tool, double degrees) -> void;
    auto toolSlider(WaylandId tool, std::int32_t position) -> void;
    auto toolWheel(WaylandId tool, double degrees, std::int32_t clicks) -> void;
    auto toolButton(WaylandId tool, std::uint32_t button, bool pressed) -> void;
    auto toolFrame(WaylandId tool, std::uint32_t millis) -> void;

    auto tabletName(WaylandId tablet, std::string name) -> void;
    auto tabletId(WaylandId tablet, std::uint32_t vid, std::uint32_t pid) -> void;
    auto tabletDone(WaylandId tablet) -> void;
    auto tabletRemoved(WaylandId tablet) -> void;

    auto padGroup(WaylandId pad, WaylandId group) -> void;
    auto padButtons(WaylandId pad, std::uint32_t buttons) -> void;
    auto padDone(WaylandId pad) -> void;
    auto padRemoved(WaylandId pad) -> void;
    auto padButton(WaylandId pad, std::uint32_t button, bool pressed) -> void;
    auto padEnter(WaylandId pad, WaylandId tablet) -> void;
    auto padLeave(WaylandId pad) -> void;

    // `buttons` is the raw wl_array payload: native-endian u32 indices.
    auto groupButtons(WaylandId group, std::span<std::uint8_t const> buttons) -> void;
    auto groupModes(WaylandId group, std::uint32_t modes) -> void;
    auto groupRing(WaylandId group, WaylandId ring) -> void;
    auto groupStrip(WaylandId group, WaylandId strip) -> void;
    auto groupDone(WaylandId group) -> void;
    auto groupModeSwitch(WaylandId group, std::uint32_t mode) -> void;

    auto ringAngle(WaylandId ring, double degrees) -> void;
    auto ringSource(WaylandId ring, TouchSource source) -> void;
    auto ringStop(WaylandId ring) -> void;
    auto ringFrame(WaylandId ring, std::uint32_t millis) -> void;

    auto stripPosition(WaylandId strip, std::uint32_t position) -> void;
    auto stripSource(WaylandId strip, TouchSource source) -> void;
    auto stripStop(WaylandId strip) -> void;
    auto stripFrame(WaylandId strip, std::uint32_t millis) -> void;

    [[nodiscard]] auto tools() const -> std::span<Tool const> { return tools_.finished(); }
    [[nodiscard]] auto tablets() const -> std::span<Tablet const> { return tablets_.finished(); }
    [[nodiscard]] auto pads() const -> std::span<Pad const> { return pads_.finished(); }
    [[nodiscard]] auto events() const -> std::span<RawEvent<WaylandId> const> { return events_; }

private:
    enum class DeferredKind : std::uint8_t { Tool, Tablet, Pad };
    struct Deferred {
        DeferredKind kind;
        WaylandId    id;
    };

    template <typename T>
    auto construct(ConstructionTable<T, WaylandId>& table, WaylandId id, char const* what) -> T*;

    auto padOfGroup(WaylandId group) const -> std::optional<WaylandId>;
    auto pushGroupEvent(WaylandId group, RawGroupEvent<WaylandId> event) -> void;
    auto pushRingEvent(WaylandId ring, TouchStripEvent event) -> void;
    auto pushStripEvent(WaylandId strip, TouchStripEvent event) -> void;

    ConstructionTable<Tool, WaylandId>     tools_;
    ConstructionTable<Tablet, WaylandId>   tablets_;
    ConstructionTable<Pad, WaylandId>      pads_;
    ConstructionTable<PadGroup, WaylandId> groups_;
    std::vector<Deferred>                  destroyNextCycle_;

    // child -> parent, keyed by handle
    phmap::flat_hash_map<std::uint64_t, WaylandId> ringToGroup_;
    phmap::flat_hash_map<std::uint64_t, WaylandId> stripToGroup_;
    phmap::flat_hash_map<std::uint64_t, WaylandId> groupToPad_;

    FrameAssembler<WaylandId>     frames_;
    std::vector<RawEvent<WaylandId>> events_;
};

} // namespace TS
