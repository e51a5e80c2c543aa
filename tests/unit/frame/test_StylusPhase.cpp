#include "frame/StylusPhase.hpp"

#include <doctest/doctest.h>

using namespace TS;

TEST_SUITE("frame.stylus_phase") {

TEST_CASE("Entering range announces In and a Down when touching") {
    CHECK(phaseTransition(std::nullopt, StylusPhase::InAir) == std::vector<PhaseStep>{PhaseStep::In});
    CHECK(phaseTransition(std::nullopt, StylusPhase::Touched) == std::vector<PhaseStep>{PhaseStep::In, PhaseStep::Down});
    CHECK(phaseTransition(std::nullopt, StylusPhase::TouchEnter) == std::vector<PhaseStep>{PhaseStep::In, PhaseStep::Down});
}

TEST_CASE("Contact changes within range") {
    CHECK(phaseTransition(StylusPhase::InAir, StylusPhase::Touched) == std::vector<PhaseStep>{PhaseStep::Down});
    CHECK(phaseTransition(StylusPhase::Touched, StylusPhase::InAir) == std::vector<PhaseStep>{PhaseStep::Up});
    CHECK(phaseTransition(StylusPhase::Touched, StylusPhase::TouchLeave) == std::vector<PhaseStep>{PhaseStep::Up});
    CHECK(phaseTransition(StylusPhase::Touched, StylusPhase::Touched).empty());
    CHECK(phaseTransition(StylusPhase::InAir, StylusPhase::TouchLeave).empty());
}

TEST_CASE("Leaving range lifts a touching stylus first") {
    CHECK(outOfRangeTransition(std::nullopt).empty());
    CHECK(outOfRangeTransition(StylusPhase::InAir) == std::vector<PhaseStep>{PhaseStep::Out});
    CHECK(outOfRangeTransition(StylusPhase::Touched) == std::vector<PhaseStep>{PhaseStep::Up, PhaseStep::Out});
}

TEST_CASE("Touch phases") {
    CHECK(isTouching(StylusPhase::Touched));
    CHECK(isTouching(StylusPhase::TouchEnter));
    CHECK_FALSE(isTouching(StylusPhase::TouchLeave));
    CHECK_FALSE(isTouching(StylusPhase::InAir));
}

} // TEST_SUITE
