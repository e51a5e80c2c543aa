#pragma once
#include <cstdint>
#include <optional>
#include <vector>

namespace TS {

/**
 * Proximity state of a callback-driven stylus. TouchEnter and TouchLeave mark
 * a contact change reported ahead of the packets that confirm it.
 */
enum class StylusPhase : std::uint8_t {
    InAir,
    Touched,
    TouchEnter,
    TouchLeave,
};

enum class PhaseStep : std::uint8_t {
    In,
    Down,
    Up,
    Out,
};

[[nodiscard]] auto isTouching(StylusPhase phase) -> bool;

// Steps to emit when a stylus moves from `from` (nullopt: out of range) to `to`.
[[nodiscard]] auto phaseTransition(std::optional<StylusPhase> from, StylusPhase to) -> std::vector<PhaseStep>;

// Steps to emit when a stylus leaves range.
[[nodiscard]] auto outOfRangeTransition(std::optional<StylusPhase> from) -> std::vector<PhaseStep>;

} // namespace TS
