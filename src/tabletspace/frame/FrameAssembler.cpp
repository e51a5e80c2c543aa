#include "frame/FrameAssembler.hpp"

#include <cmath>

namespace TS {

namespace {
auto finitePair(std::optional<std::array<float, 2>> const& pair) -> std::optional<std::array<float, 2>> {
    if (pair && !std::isnan((*pair)[0]) && !std::isnan((*pair)[1]))
        return pair;
    return std::nullopt;
}

auto niche(std::optional<float> const& value) -> NicheF32 {
    return value ? NicheF32::fromLossy(*value) : NicheF32::none();
}
} // namespace

auto buildPose(AxisState const& axes) -> std::optional<Pose> {
    // A tool that only reported auxiliary axes so far sits at the origin.
    auto const position = axes.position.value_or(std::array<float, 2>{0.0f, 0.0f});
    if (std::isnan(position[0]) || std::isnan(position[1]))
        return std::nullopt;

    Pose pose;
    pose.position       = position;
    pose.distance       = niche(axes.distance);
    pose.pressure       = niche(axes.pressure);
    pose.buttonPressure = niche(axes.buttonPressure);
    pose.tilt           = finitePair(axes.tilt);
    pose.roll           = niche(axes.roll);
    pose.slider         = niche(axes.slider);
    pose.contactSize    = finitePair(axes.contactSize);
    if (axes.wheel && !std::isnan(axes.wheel->radians))
        pose.wheel = axes.wheel;
    return pose;
}

} // namespace TS
