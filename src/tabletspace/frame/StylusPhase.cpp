#include "frame/StylusPhase.hpp"

namespace TS {

auto isTouching(StylusPhase phase) -> bool {
    return phase == StylusPhase::Touched || phase == StylusPhase::TouchEnter;
}

auto phaseTransition(std::optional<StylusPhase> from, StylusPhase to) -> std::vector<PhaseStep> {
    std::vector<PhaseStep> steps;
    if (!from) {
        steps.push_back(PhaseStep::In);
        if (isTouching(to))
            steps.push_back(PhaseStep::Down);
        return steps;
    }
    bool const was = isTouching(*from);
    bool const now = isTouching(to);
    if (!was && now)
        steps.push_back(PhaseStep::Down);
    else if (was && !now)
        steps.push_back(PhaseStep::Up);
    return steps;
}

auto outOfRangeTransition(std::optional<StylusPhase> from) -> std::vector<PhaseStep> {
    if (!from)
        return {};
    if (isTouching(*from))
        return {PhaseStep::Up, PhaseStep::Out};
    return {PhaseStep::Out};
}

} // namespace TS
