#pragma once
#include "events/Events.hpp"

#include <cstdint>
#include <variant>

namespace TS {

/**
 * Backend-local events. Every reference is a native id that still has to be
 * looked up in the backend's tables before it can be handed to a consumer.
 */
template <typename Id>
struct RawToolIn {
    Id tablet;
};

template <typename Id>
using RawToolEvent = std::variant<ToolAdded, ToolRemoved, RawToolIn<Id>, ToolDown, ToolButton, ToolPose, ToolFrame, ToolUp, ToolOut>;

template <typename Id>
struct RawRingUpdate {
    Id              ring;
    TouchStripEvent event;
};

template <typename Id>
struct RawStripUpdate {
    Id              strip;
    TouchStripEvent event;
};

template <typename Id>
using RawGroupEvent = std::variant<RawRingUpdate<Id>, RawStripUpdate<Id>, GroupMode>;

template <typename Id>
struct RawPadGroupUpdate {
    Id                group;
    RawGroupEvent<Id> event;
};

// The owning group is found during resolution.
struct RawPadButton {
    std::uint32_t button  = 0;
    bool          pressed = false;
};

template <typename Id>
struct RawPadEnter {
    Id tablet;
};

template <typename Id>
using RawPadEvent = std::variant<PadAdded, PadRemoved, RawPadGroupUpdate<Id>, RawPadButton, RawPadEnter<Id>, PadExit>;

template <typename Id>
struct RawToolRecord {
    Id               tool;
    RawToolEvent<Id> event;
};

template <typename Id>
struct RawTabletRecord {
    Id          tablet;
    TabletEvent event;
};

template <typename Id>
struct RawPadRecord {
    Id              pad;
    RawPadEvent<Id> event;
};

template <typename Id>
using RawEvent = std::variant<RawToolRecord<Id>, RawTabletRecord<Id>, RawPadRecord<Id>>;

} // namespace TS
