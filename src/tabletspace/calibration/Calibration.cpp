#include "calibration/Calibration.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <numbers>

namespace TS {

auto Scaler::apply(std::int32_t word) const -> Expected<float> {
    auto const biased = static_cast<double>(static_cast<std::int64_t>(word) + static_cast<std::int64_t>(this->bias));
    auto const value  = static_cast<float>(biased * this->multiply);
    if (std::isnan(value))
        return std::unexpected(Error{Error::Code::Value, "scaled property is NaN"});
    return value;
}

auto readSlot(ScalerSlot const& slot, std::span<std::int32_t const>& words) -> Expected<NicheF32> {
    if (slot.state() == ScalerSlot::State::NotIncluded)
        return NicheF32::none();
    if (words.empty())
        return std::unexpected(Error{Error::Code::NotEnoughData, "property slice empty"});
    auto const word = words.front();
    words           = words.subspan(1);
    if (slot.state() == ScalerSlot::State::Malformed)
        return NicheF32::none();
    auto value = slot.value()->apply(word);
    if (!value)
        return std::unexpected(value.error());
    return NicheF32::fromLossy(*value);
}

auto calcLimits(PropertyMetrics const& metrics, double scale) -> std::optional<Limits> {
    if (std::isnan(scale))
        return std::nullopt;
    auto const min = static_cast<float>(static_cast<double>(metrics.logicalMin) * scale);
    auto const max = static_cast<float>(static_cast<double>(metrics.logicalMax) * scale);
    if (std::isinf(min) || std::isinf(max) || std::isnan(min) || std::isnan(max))
        return std::nullopt;
    return Limits{min, max};
}

auto calcGranularity(PropertyMetrics const& metrics) -> std::optional<Granularity> {
    auto const diff = static_cast<std::uint64_t>(std::abs(static_cast<std::int64_t>(metrics.logicalMax) - static_cast<std::int64_t>(metrics.logicalMin)));
    // Inclusive bounds, so one more state than the difference.
    auto const states = std::min<std::uint64_t>(diff + 1, std::numeric_limits<std::uint32_t>::max());
    return Granularity::make(static_cast<std::uint32_t>(states));
}

auto normalized(PropertyMetrics const& metrics, Limits onto) -> Tristate<std::pair<Scaler, Info>> {
    using Result = Tristate<std::pair<Scaler, Info>>;

    auto width = static_cast<std::int64_t>(metrics.logicalMax) - static_cast<std::int64_t>(metrics.logicalMin);
    width += (width > 0) - (width < 0);

    auto const magnitude   = static_cast<std::uint64_t>(width < 0 ? -width : width);
    auto const granularity = Granularity::make(static_cast<std::uint32_t>(std::min<std::uint64_t>(magnitude, std::numeric_limits<std::uint32_t>::max())));
    if (!granularity)
        return Result::malformed();

    auto const ontoWidth  = static_cast<double>(onto.max) - static_cast<double>(onto.min);
    auto const multiplier = ontoWidth / static_cast<double>(width);
    // Solve (min + bias) * multiplier == onto.min for bias.
    auto const bias = static_cast<double>(onto.min) / multiplier - static_cast<double>(metrics.logicalMin);
    if (!std::isfinite(bias))
        return Result::malformed();

    auto const clamped = std::clamp(bias, static_cast<double>(std::numeric_limits<std::int32_t>::min()), static_cast<double>(std::numeric_limits<std::int32_t>::max()));
    return Result::ok({Scaler{static_cast<std::int32_t>(clamped), multiplier}, Info{onto, granularity}});
}

auto linearScaleFactor(MetricUnit unit) -> std::optional<double> {
    switch (unit) {
    case MetricUnit::Centimeters:
        return 1.0;
    case MetricUnit::Inches:
        return 2.54;
    default:
        return std::nullopt;
    }
}

auto angularScaleFactor(MetricUnit unit) -> std::optional<double> {
    constexpr double degree = std::numbers::pi / 180.0;
    switch (unit) {
    case MetricUnit::Radians:
        return 1.0;
    case MetricUnit::Degrees:
        return degree;
    case MetricUnit::Seconds:
        return degree / 3600.0;
    default:
        return std::nullopt;
    }
}

auto linearOrNormalize(PropertyMetrics const& metrics) -> Tristate<std::pair<Scaler, LengthInfo>> {
    if (auto unit = linearScaleFactor(metrics.units)) {
        // Resolution is dots per unit.
        auto const scale = *unit / static_cast<double>(metrics.resolution);
        LengthInfo info  = LengthInfo::Centimeters{Info{calcLimits(metrics, scale), calcGranularity(metrics)}};
        return Tristate<std::pair<Scaler, LengthInfo>>::ok({Scaler{0, scale}, info});
    }
    return normalized(metrics, Limits{0.0f, 1.0f}).mapOk([](std::pair<Scaler, Info> const& n) {
        return std::pair<Scaler, LengthInfo>{n.first, LengthInfo::Normalized{NormalizedInfo{n.second.granularity}}};
    });
}

auto halfAngleOrNormalize(PropertyMetrics const& metrics) -> Tristate<std::pair<Scaler, Info>> {
    if (auto unit = angularScaleFactor(metrics.units)) {
        auto const scale = *unit / static_cast<double>(metrics.resolution);
        return Tristate<std::pair<Scaler, Info>>::ok({Scaler{0, scale}, Info{calcLimits(metrics, scale), calcGranularity(metrics)}});
    }
    return normalized(metrics, Limits{-kPi, kPi});
}

} // namespace TS
