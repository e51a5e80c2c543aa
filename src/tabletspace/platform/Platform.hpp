#pragma once
#include "core/Error.hpp"
#include "core/InternalID.hpp"
#include "device/Pad.hpp"
#include "device/Tablet.hpp"
#include "device/Tool.hpp"
#include "events/RawEvents.hpp"

#include <chrono>
#include <optional>
#include <span>
#include <variant>

namespace TS {

// Exactly one alternative is populated, matching the backend that produced it.
using RawEventSpan = std::variant<std::span<RawEvent<WaylandId> const>, std::span<RawEvent<XInput2Id> const>, std::span<RawEvent<InkId> const>>;

/**
 * One native tablet backend. pump() replaces the previous cycle's events and
 * applies the removals announced during it; everything returned by the
 * accessors stays valid until the next pump().
 */
class Platform {
public:
    virtual ~Platform() = default;

    virtual auto pump() -> Expected<void> = 0;

    [[nodiscard]] virtual auto tools() const -> std::span<Tool const>     = 0;
    [[nodiscard]] virtual auto tablets() const -> std::span<Tablet const> = 0;
    [[nodiscard]] virtual auto pads() const -> std::span<Pad const>       = 0;
    [[nodiscard]] virtual auto rawEvents() const -> RawEventSpan          = 0;
    // Smallest step between two frame timestamps, when the backend knows it.
    [[nodiscard]] virtual auto timestampGranularity() const -> std::optional<std::chrono::microseconds> = 0;
    [[nodiscard]] virtual auto backend() const -> Backend                                              = 0;
};

} // namespace TS
