#include "core/Axis.hpp"

namespace TS {

auto axisName(Axis axis) -> std::string_view {
    switch (axis) {
    case Axis::Pressure:
        return "pressure";
    case Axis::Tilt:
        return "tilt";
    case Axis::Distance:
        return "distance";
    case Axis::Roll:
        return "roll";
    case Axis::Wheel:
        return "wheel";
    case Axis::Slider:
        return "slider";
    case Axis::ButtonPressure:
        return "button_pressure";
    case Axis::ContactSize:
        return "contact_size";
    }
    return "unknown";
}

auto AvailableAxes::flagFor(Axis axis) -> std::uint16_t {
    switch (axis) {
    case Axis::Pressure:
        return PRESSURE;
    case Axis::Tilt:
        return TILT;
    case Axis::Distance:
        return DISTANCE;
    case Axis::Roll:
        return ROLL;
    case Axis::Wheel:
        return WHEEL;
    case Axis::Slider:
        return SLIDER;
    case Axis::ButtonPressure:
        return BUTTON_PRESSURE;
    case Axis::ContactSize:
        return CONTACT_SIZE;
    }
    return 0;
}

auto AvailableAxes::axes() const -> std::vector<Axis> {
    static constexpr std::array order{Axis::Pressure, Axis::Tilt, Axis::Distance, Axis::Roll, Axis::Wheel, Axis::Slider, Axis::ButtonPressure, Axis::ContactSize};
    std::vector<Axis>           result;
    for (auto axis : order)
        if (this->contains(axis))
            result.push_back(axis);
    return result;
}

auto LengthInfo::limits() const -> std::optional<Limits> {
    if (auto const* cm = std::get_if<Centimeters>(&this->value))
        return cm->info.limits;
    return Limits{0.0f, 1.0f};
}

auto LengthInfo::granularity() const -> std::optional<Granularity> {
    if (auto const* cm = std::get_if<Centimeters>(&this->value))
        return cm->info.granularity;
    return std::get<Normalized>(this->value).info.granularity;
}

auto LengthInfo::unionWith(LengthInfo const& other) const -> LengthInfo {
    auto const* lhsCm = std::get_if<Centimeters>(&this->value);
    auto const* rhsCm = std::get_if<Centimeters>(&other.value);
    if (lhsCm && rhsCm)
        return Centimeters{lhsCm->info.unionWith(rhsCm->info)};
    // Both normalized, or the siblings disagree on units. Neither limit is
    // trustworthy in the mixed case so fall back to the unitless range.
    return Normalized{NormalizedInfo{unionOptional(this->granularity(), other.granularity())}};
}

auto FullInfo::unionWith(FullInfo const& other) const -> FullInfo {
    FullInfo result;
    result.position       = {this->position[0].unionWith(other.position[0]), this->position[1].unionWith(other.position[1])};
    result.slider         = unionOptional(this->slider, other.slider);
    result.roll           = unionOptional(this->roll, other.roll);
    result.pressure       = unionOptional(this->pressure, other.pressure);
    result.buttonPressure = unionOptional(this->buttonPressure, other.buttonPressure);
    result.tilt           = unionOptional(this->tilt, other.tilt);
    result.wheel          = unionOptional(this->wheel, other.wheel);
    result.distance       = unionOptional(this->distance, other.distance);
    result.contactSize    = unionOptional(this->contactSize, other.contactSize);
    return result;
}

auto FullInfo::available() const -> AvailableAxes {
    AvailableAxes axes;
    if (this->slider)
        axes.insert(Axis::Slider);
    if (this->roll)
        axes.insert(Axis::Roll);
    if (this->pressure)
        axes.insert(Axis::Pressure);
    if (this->buttonPressure)
        axes.insert(Axis::ButtonPressure);
    if (this->tilt)
        axes.insert(Axis::Tilt);
    if (this->wheel)
        axes.insert(Axis::Wheel);
    if (this->distance)
        axes.insert(Axis::Distance);
    if (this->contactSize)
        axes.insert(Axis::ContactSize);
    return axes;
}

namespace {
auto unsupported(Axis axis) -> Error {
    return Error{Error::Code::NotSupported, std::string("axis not supported: ") + std::string(axisName(axis))};
}

template <typename T>
auto granularityOf(std::optional<T> const& info, Axis axis) -> Expected<std::optional<Granularity>> {
    if (!info)
        return std::unexpected(unsupported(axis));
    return info->granularity;
}
} // namespace

auto FullInfo::granularity(Axis axis) const -> Expected<std::optional<Granularity>> {
    switch (axis) {
    case Axis::Pressure:
        return granularityOf(this->pressure, axis);
    case Axis::ButtonPressure:
        return granularityOf(this->buttonPressure, axis);
    case Axis::Roll:
        return granularityOf(this->roll, axis);
    case Axis::Wheel:
        return granularityOf(this->wheel, axis);
    case Axis::Slider:
        return granularityOf(this->slider, axis);
    case Axis::Tilt:
        return granularityOf(this->tilt, axis);
    case Axis::Distance:
        if (!this->distance)
            return std::unexpected(unsupported(axis));
        return this->distance->granularity();
    case Axis::ContactSize:
        if (!this->contactSize)
            return std::unexpected(unsupported(axis));
        return this->contactSize->granularity();
    }
    return std::unexpected(unsupported(axis));
}

auto FullInfo::limits(Axis axis) const -> Expected<std::optional<Limits>> {
    auto fixed = [axis](bool present, Limits limits) -> Expected<std::optional<Limits>> {
        if (!present)
            return std::unexpected(unsupported(axis));
        return std::optional<Limits>{limits};
    };
    switch (axis) {
    case Axis::Pressure:
        return fixed(this->pressure.has_value(), Limits{0.0f, 1.0f});
    case Axis::ButtonPressure:
        return fixed(this->buttonPressure.has_value(), Limits{0.0f, 1.0f});
    case Axis::Roll:
        return fixed(this->roll.has_value(), Limits{0.0f, kTauExclusive});
    case Axis::Wheel:
        return fixed(this->wheel.has_value(), Limits{0.0f, kTauExclusive});
    case Axis::Slider:
        return fixed(this->slider.has_value(), Limits{-1.0f, 1.0f});
    case Axis::Tilt:
        if (!this->tilt)
            return std::unexpected(unsupported(axis));
        return this->tilt->limits;
    case Axis::Distance:
        if (!this->distance)
            return std::unexpected(unsupported(axis));
        return this->distance->limits();
    case Axis::ContactSize:
        if (!this->contactSize)
            return std::unexpected(unsupported(axis));
        return this->contactSize->limits();
    }
    return std::unexpected(unsupported(axis));
}

auto operator<<(std::ostream& os, Pose const& pose) -> std::ostream& {
    os << "Pose{pos=(" << pose.position[0] << ", " << pose.position[1] << ")";
    auto niche = [&os](char const* name, NicheF32 const& value) {
        if (auto v = value.get())
            os << ", " << name << "=" << *v;
    };
    niche("distance", pose.distance);
    niche("pressure", pose.pressure);
    niche("button_pressure", pose.buttonPressure);
    if (pose.tilt)
        os << ", tilt=(" << (*pose.tilt)[0] << ", " << (*pose.tilt)[1] << ")";
    niche("roll", pose.roll);
    if (pose.wheel)
        os << ", wheel=(" << pose.wheel->radians << "rad, " << pose.wheel->clicks << " clicks)";
    niche("slider", pose.slider);
    if (pose.contactSize)
        os << ", contact=(" << (*pose.contactSize)[0] << ", " << (*pose.contactSize)[1] << ")";
    return os << "}";
}

} // namespace TS
