#pragma once
#include "device/Tablet.hpp"
#include "device/Tool.hpp"
#include "events/RawEvents.hpp"
#include "frame/StylusPhase.hpp"
#include "platform/ink/InkHost.hpp"
#include "platform/ink/InkPacket.hpp"

#include <parallel_hashmap/phmap.h>

#include <cstdint>
#include <span>
#include <variant>
#include <vector>

namespace TS {

/**
 * Everything the stylus callbacks have reported since the last pump. One
 * instance lives behind the session lock and is copied into a consumer-side
 * snapshot on every pump; copy assignment keeps the snapshot's allocations.
 *
 * Tablet slots mirror the RealTimeStylus' own tablet list, which is addressed
 * by position. Removed slots stay in place until frameEndCleanup() so that the
 * events of the current frame still resolve.
 */
class InkFrame {
public:
    struct DummyTablet {
        std::uint32_t tcid = 0;
    };
    // Ink reports capabilities per tablet; they are copied onto every tool
    // that enters it.
    struct ConcreteTablet {
        Interpreter   interpreter;
        FullInfo      axes;
        std::uint32_t tcid = 0;
    };
    using TabletSlot = std::variant<DummyTablet, ConcreteTablet>;

    // Always appends a slot. A tablet whose packets cannot be interpreted
    // gets a dummy slot and no public Tablet.
    auto appendTablet(InkPacketLayout const& layout, std::uint32_t tcid, InkTabletInfo const& info) -> void;
    // `index` counts slots not already pending deletion. InvalidArgument when
    // out of range.
    auto deleteTabletByIndex(std::int32_t index) -> Expected<void>;

    // `cursor` describes the stylus when it is new to this frame. It is looked
    // up by the caller before the session lock is taken, since the query goes
    // back to the RealTimeStylus.
    auto handlePackets(InkStylusInfo const& stylus, InkCursorInfo const* cursor, std::uint32_t packetCount, std::span<std::int32_t const> words, StylusPhase phase) -> void;
    auto stylusOutOfRange(std::uint32_t sid) -> void;
    auto stylusButton(std::uint32_t sid, ButtonId button, bool pressed) -> void;

    // After the snapshot was taken: drop the events and apply deletions.
    auto frameEndCleanup() -> void;
    // Forgets everything, consistent or not. The scale factor survives.
    auto reset() -> void;

    auto setHimetricToPx(float scale) -> void { himetricToPx_ = scale; }
    [[nodiscard]] auto himetricToPx() const -> float { return himetricToPx_; }

    [[nodiscard]] auto hasTool(std::uint32_t sid) const -> bool;
    [[nodiscard]] auto tools() const -> std::span<Tool const> { return tools_; }
    [[nodiscard]] auto tablets() const -> std::span<Tablet const> { return tablets_; }
    [[nodiscard]] auto events() const -> std::span<RawEvent<InkId> const> { return events_; }
    [[nodiscard]] auto tabletSlots() const -> std::span<TabletSlot const> { return slots_; }
    [[nodiscard]] auto pendingDeletions() const -> std::span<std::size_t const> { return deletions_; }

private:
    auto toolFor_(std::uint32_t sid, InkCursorInfo const* cursor) -> Tool*;
    auto findTool_(std::uint32_t sid) -> Tool*;
    auto liveTablet_(std::uint32_t tcid) const -> ConcreteTablet const*;
    auto isPendingDeletion_(std::size_t physical) const -> bool;
    auto push_(InkId const& tool, RawToolEvent<InkId> event) -> void;

    float himetricToPx_ = 1.0f;
    // Present while in range.
    phmap::flat_hash_map<std::uint32_t, StylusPhase> phases_;
    std::vector<Tool>                                tools_;
    // Physical slot indices, sorted and unique.
    std::vector<std::size_t>   deletions_;
    std::vector<TabletSlot>    slots_;
    std::vector<Tablet>        tablets_;
    std::vector<RawEvent<InkId>> events_;
};

[[nodiscard]] auto tcidOf(InkFrame::TabletSlot const& slot) -> std::uint32_t;

} // namespace TS
