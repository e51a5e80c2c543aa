#pragma once
#include "core/Axis.hpp"
#include "core/InternalID.hpp"

#include <cstdint>
#include <optional>
#include <ostream>
#include <vector>

namespace TS {

enum class TouchSource : std::uint8_t {
    Unknown,
    Finger,
};

// Absolute rotary control, radians in [0, tau).
struct Ring {
    InternalID                 internalId;
    std::optional<Granularity> granularity;
};

// Absolute linear control, [0, 1].
struct Strip {
    InternalID                 internalId;
    std::optional<Granularity> granularity;
};

/**
 * Buttons, rings and strips sharing one mode. `buttons` holds pad-wide button
 * indices, sorted and deduplicated.
 */
struct PadGroup {
    InternalID                   internalId;
    std::vector<std::uint32_t>   buttons;
    std::vector<Ring>            rings;
    std::vector<Strip>           strips;
    std::optional<std::uint32_t> modeCount;

    [[nodiscard]] auto ownsButton(std::uint32_t button) const -> bool;
};

struct Pad {
    InternalID            internalId;
    std::uint32_t         totalButtons = 0;
    std::vector<PadGroup> groups;

    friend auto operator<<(std::ostream& os, Pad const& pad) -> std::ostream&;
};

} // namespace TS
