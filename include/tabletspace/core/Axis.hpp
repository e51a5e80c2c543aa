#pragma once
#include "core/Error.hpp"
#include "core/NicheF32.hpp"

#include <algorithm>
#include <array>
#include <bit>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>
#include <variant>
#include <vector>

namespace TS {

// Largest float below tau. Circular axes report in [0, kTauExclusive].
inline constexpr float kTauExclusive = std::bit_cast<float>(std::uint32_t{0x40C90FDA});
inline constexpr float kPi           = 3.14159265358979323846f;

enum class Axis : std::uint8_t {
    Pressure,
    Tilt,
    Distance,
    Roll,
    Wheel,
    Slider,
    ButtonPressure,
    ContactSize,
};

[[nodiscard]] auto axisName(Axis axis) -> std::string_view;

// Bitmask summary of axes. X and Y are implicit and always available.
struct AvailableAxes {
    static constexpr std::uint16_t PRESSURE        = 1;
    static constexpr std::uint16_t TILT            = 2;
    static constexpr std::uint16_t DISTANCE        = 4;
    static constexpr std::uint16_t ROLL            = 8;
    static constexpr std::uint16_t WHEEL           = 16;
    static constexpr std::uint16_t SLIDER          = 32;
    static constexpr std::uint16_t BUTTON_PRESSURE = 64;
    static constexpr std::uint16_t CONTACT_SIZE    = 128;

    std::uint16_t bits = 0;

    [[nodiscard]] static auto flagFor(Axis axis) -> std::uint16_t;
    [[nodiscard]] auto        contains(Axis axis) const -> bool { return (this->bits & flagFor(axis)) != 0; }
    auto                      insert(Axis axis) -> void { this->bits |= flagFor(axis); }
    [[nodiscard]] auto        empty() const -> bool { return this->bits == 0; }
    // Axes in flag order.
    [[nodiscard]] auto axes() const -> std::vector<Axis>;

    friend auto operator==(AvailableAxes const&, AvailableAxes const&) -> bool = default;
};

// Number of distinct states over the whole range of an axis. Never zero.
struct Granularity {
    std::uint32_t value = 1;

    [[nodiscard]] static auto make(std::uint32_t value) -> std::optional<Granularity> {
        if (value == 0)
            return std::nullopt;
        return Granularity{value};
    }
    [[nodiscard]] auto unionWith(Granularity const& other) const -> Granularity {
        return Granularity{std::max(this->value, other.value)};
    }

    friend auto operator<=>(Granularity const&, Granularity const&) = default;
};

// Dots per logical pixel for the position axes.
struct PositionGranularity {
    std::uint32_t value = 1;

    [[nodiscard]] auto unionWith(PositionGranularity const& other) const -> PositionGranularity {
        return PositionGranularity{std::max(this->value, other.value)};
    }
    friend auto operator<=>(PositionGranularity const&, PositionGranularity const&) = default;
};

/**
 * Hint for the reported range of an axis. Values are not clamped and the
 * hardware may exceed it in either direction.
 */
struct Limits {
    float min = 0.0f;
    float max = 0.0f;

    [[nodiscard]] auto unionWith(Limits const& other) const -> Limits {
        return Limits{std::min(this->min, other.min), std::max(this->max, other.max)};
    }
    friend auto operator==(Limits const&, Limits const&) -> bool = default;
};

// Optional union: both present yields the union, one present yields that one.
template <typename T>
[[nodiscard]] auto unionOptional(std::optional<T> const& lhs, std::optional<T> const& rhs) -> std::optional<T> {
    if (lhs && rhs)
        return lhs->unionWith(*rhs);
    if (lhs)
        return lhs;
    return rhs;
}

// Fixed [0, 1] range. Only the granularity varies.
struct NormalizedInfo {
    std::optional<Granularity> granularity;

    [[nodiscard]] auto unionWith(NormalizedInfo const& other) const -> NormalizedInfo {
        return NormalizedInfo{unionOptional(this->granularity, other.granularity)};
    }
};

// Axis with hardware-defined limits.
struct Info {
    std::optional<Limits>      limits;
    std::optional<Granularity> granularity;

    [[nodiscard]] auto unionWith(Info const& other) const -> Info {
        return Info{unionOptional(this->limits, other.limits), unionOptional(this->granularity, other.granularity)};
    }
};

// [0, tau) circular axis.
struct CircularInfo {
    std::optional<Granularity> granularity;

    [[nodiscard]] auto unionWith(CircularInfo const& other) const -> CircularInfo {
        return CircularInfo{unionOptional(this->granularity, other.granularity)};
    }
};

// [-1, 1] slider, zero at rest.
struct SliderInfo {
    std::optional<Granularity> granularity;

    [[nodiscard]] auto unionWith(SliderInfo const& other) const -> SliderInfo {
        return SliderInfo{unionOptional(this->granularity, other.granularity)};
    }
};

struct PositionInfo {
    std::optional<PositionGranularity> granularity;

    [[nodiscard]] auto unionWith(PositionInfo const& other) const -> PositionInfo {
        return PositionInfo{unionOptional(this->granularity, other.granularity)};
    }
};

/**
 * Length axis reported either as a unitless [0, 1] value or as physical
 * centimeters within Info::limits.
 */
class LengthInfo {
public:
    struct Normalized {
        NormalizedInfo info;
    };
    struct Centimeters {
        Info info;
    };

    LengthInfo() : value(Normalized{}) {}
    LengthInfo(Normalized n) : value(n) {}
    LengthInfo(Centimeters cm) : value(cm) {}

    [[nodiscard]] auto isNormalized() const -> bool { return std::holds_alternative<Normalized>(this->value); }
    [[nodiscard]] auto limits() const -> std::optional<Limits>;
    [[nodiscard]] auto granularity() const -> std::optional<Granularity>;
    // Mixed kinds collapse to normalized with the larger granularity.
    [[nodiscard]] auto unionWith(LengthInfo const& other) const -> LengthInfo;

private:
    std::variant<Normalized, Centimeters> value;
};

/**
 * Capabilities and limits of every axis. An empty optional means the axis is
 * not supported by the tool.
 */
struct FullInfo {
    std::array<PositionInfo, 2>   position{};
    std::optional<SliderInfo>     slider;
    std::optional<CircularInfo>   roll;
    std::optional<NormalizedInfo> pressure;
    std::optional<NormalizedInfo> buttonPressure;
    std::optional<Info>           tilt;
    std::optional<CircularInfo>   wheel;
    std::optional<LengthInfo>     distance;
    std::optional<LengthInfo>     contactSize;

    [[nodiscard]] auto unionWith(FullInfo const& other) const -> FullInfo;
    [[nodiscard]] auto available() const -> AvailableAxes;
    // NotSupported when the axis is absent. An empty optional means unknown.
    [[nodiscard]] auto granularity(Axis axis) const -> Expected<std::optional<Granularity>>;
    [[nodiscard]] auto limits(Axis axis) const -> Expected<std::optional<Limits>>;
};

struct Wheel {
    float        radians = 0.0f;
    std::int32_t clicks  = 0;

    friend auto operator==(Wheel const&, Wheel const&) -> bool = default;
};

/**
 * Snapshot of every axis of a tool. Position is in logical pixels from the top
 * left of the window. No present field is NaN.
 */
struct Pose {
    std::array<float, 2>                position{0.0f, 0.0f};
    NicheF32                            distance;
    NicheF32                            pressure;
    NicheF32                            buttonPressure;
    std::optional<std::array<float, 2>> tilt;
    NicheF32                            roll;
    std::optional<Wheel>                wheel;
    NicheF32                            slider;
    std::optional<std::array<float, 2>> contactSize;

    friend auto operator==(Pose const&, Pose const&) -> bool = default;
    friend auto operator<<(std::ostream& os, Pose const& pose) -> std::ostream&;
};

} // namespace TS
