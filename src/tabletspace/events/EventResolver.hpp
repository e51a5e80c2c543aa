#pragma once
#include "events/RawEvents.hpp"
#include "log/TaggedLogger.hpp"

#include <optional>
#include <span>
#include <sstream>
#include <type_traits>
#include <variant>
#include <vector>

namespace TS {

struct DeviceView {
    std::span<Tool const>   tools;
    std::span<Tablet const> tablets;
    std::span<Pad const>    pads;
};

namespace detail {

template <typename T, typename Id>
auto findById(std::span<T const> records, Id const& id) -> T const* {
    for (auto const& record : records)
        if (idMatches(record.internalId, id))
            return &record;
    return nullptr;
}

template <typename T, typename Id>
auto findById(std::vector<T> const& records, Id const& id) -> T const* {
    return findById(std::span<T const>{records}, id);
}

// Groups never outlive their pad, so only the owning pad is searched.
inline auto groupOwning(Pad const& pad, std::uint32_t button) -> PadGroup const* {
    for (auto const& group : pad.groups)
        if (group.ownsButton(button))
            return &group;
    return nullptr;
}

template <typename Id>
auto logUnresolved(char const* what, Id const& id) -> void {
#ifdef TS_LOG_DEBUG
    std::ostringstream oss;
    oss << "Dropping event for unknown " << what << " " << InternalID{id};
    ts_log(oss.str(), "Resolve");
#else
    (void)what;
    (void)id;
#endif
}

template <typename Id>
auto resolveGroupEvent(PadGroup const& group, RawGroupEvent<Id> const& raw) -> std::optional<GroupEvent> {
    if (auto const* ring = std::get_if<RawRingUpdate<Id>>(&raw)) {
        auto const* target = findById(group.rings, ring->ring);
        if (!target) {
            logUnresolved("ring", ring->ring);
            return std::nullopt;
        }
        return GroupEvent{RingUpdate{target, ring->event}};
    }
    if (auto const* strip = std::get_if<RawStripUpdate<Id>>(&raw)) {
        auto const* target = findById(group.strips, strip->strip);
        if (!target) {
            logUnresolved("strip", strip->strip);
            return std::nullopt;
        }
        return GroupEvent{StripUpdate{target, strip->event}};
    }
    return GroupEvent{std::get<GroupMode>(raw)};
}

template <typename Id>
auto resolveToolEvent(RawToolEvent<Id> const& raw, DeviceView const& view) -> std::optional<ToolEvent> {
    if (auto const* in = std::get_if<RawToolIn<Id>>(&raw)) {
        auto const* tablet = findById(view.tablets, in->tablet);
        if (!tablet) {
            logUnresolved("tablet", in->tablet);
            return std::nullopt;
        }
        return ToolEvent{ToolIn{tablet}};
    }
    return std::visit(
            [](auto const& payload) -> std::optional<ToolEvent> {
                using P = std::decay_t<decltype(payload)>;
                if constexpr (std::is_same_v<P, RawToolIn<Id>>)
                    return std::nullopt;
                else
                    return ToolEvent{payload};
            },
            raw);
}

template <typename Id>
auto resolvePadEvent(Pad const& pad, RawPadEvent<Id> const& raw, DeviceView const& view) -> std::optional<PadEvent> {
    return std::visit(
            [&](auto const& payload) -> std::optional<PadEvent> {
                using P = std::decay_t<decltype(payload)>;
                if constexpr (std::is_same_v<P, RawPadGroupUpdate<Id>>) {
                    auto const* group = findById(pad.groups, payload.group);
                    if (!group) {
                        logUnresolved("pad group", payload.group);
                        return std::nullopt;
                    }
                    auto event = resolveGroupEvent(*group, payload.event);
                    if (!event)
                        return std::nullopt;
                    return PadEvent{PadGroupUpdate{group, std::move(*event)}};
                } else if constexpr (std::is_same_v<P, RawPadButton>) {
                    return PadEvent{PadButton{payload.button, payload.pressed, groupOwning(pad, payload.button)}};
                } else if constexpr (std::is_same_v<P, RawPadEnter<Id>>) {
                    auto const* tablet = findById(view.tablets, payload.tablet);
                    if (!tablet) {
                        logUnresolved("tablet", payload.tablet);
                        return std::nullopt;
                    }
                    return PadEvent{PadEnter{tablet}};
                } else {
                    return PadEvent{payload};
                }
            },
            raw);
}

} // namespace detail

/**
 * Maps one backend event onto the public vocabulary by looking every native
 * id up in the current tables. Events referring to objects that are gone, or
 * to ids from an older generation, yield nullopt.
 */
template <typename Id>
auto resolveEvent(RawEvent<Id> const& raw, DeviceView const& view) -> std::optional<Event> {
    if (auto const* tool = std::get_if<RawToolRecord<Id>>(&raw)) {
        auto const* target = detail::findById(view.tools, tool->tool);
        if (!target) {
            detail::logUnresolved("tool", tool->tool);
            return std::nullopt;
        }
        auto event = detail::resolveToolEvent<Id>(tool->event, view);
        if (!event)
            return std::nullopt;
        return Event{ToolUpdate{target, std::move(*event)}};
    }
    if (auto const* tablet = std::get_if<RawTabletRecord<Id>>(&raw)) {
        auto const* target = detail::findById(view.tablets, tablet->tablet);
        if (!target) {
            detail::logUnresolved("tablet", tablet->tablet);
            return std::nullopt;
        }
        return Event{TabletUpdate{target, tablet->event}};
    }
    auto const& pad    = std::get<RawPadRecord<Id>>(raw);
    auto const* target = detail::findById(view.pads, pad.pad);
    if (!target) {
        detail::logUnresolved("pad", pad.pad);
        return std::nullopt;
    }
    auto event = detail::resolvePadEvent<Id>(*target, pad.event, view);
    if (!event)
        return std::nullopt;
    return Event{PadUpdate{target, std::move(*event)}};
}

// Resolves a whole span, skipping events that do not resolve.
template <typename Id>
auto resolveAll(std::span<RawEvent<Id> const> raw, DeviceView const& view) -> std::vector<Event> {
    std::vector<Event> events;
    events.reserve(raw.size());
    for (auto const& event : raw)
        if (auto resolved = resolveEvent(event, view))
            events.push_back(std::move(*resolved));
    return events;
}

} // namespace TS
