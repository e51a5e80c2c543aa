#pragma once
#include "core/Axis.hpp"
#include "core/Error.hpp"
#include "core/MetricUnit.hpp"
#include "core/NicheF32.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <utility>

namespace TS {

// Integer range advertised for one packet property. Min and max are inclusive.
struct PropertyMetrics {
    std::int32_t logicalMin = 0;
    std::int32_t logicalMax = 0;
    MetricUnit   units      = MetricUnit::Default;
    float        resolution = 1.0f;
};

/**
 * `(word + bias) * multiply`. The sum is formed in 64 bits and the product in
 * double precision so absurd hardware ranges still map precisely before the
 * final narrowing to float.
 */
struct Scaler {
    std::int32_t bias     = 0;
    double       multiply = 1.0;

    // Value error when the result is NaN.
    [[nodiscard]] auto apply(std::int32_t word) const -> Expected<float>;
};

/**
 * State of an optional packet property. Malformed properties still occupy a
 * word in every packet but never report a value.
 */
template <typename T>
class Tristate {
public:
    enum class State : std::uint8_t {
        NotIncluded,
        Malformed,
        Ok,
    };

    Tristate() = default;

    [[nodiscard]] static auto notIncluded() -> Tristate { return Tristate{}; }
    [[nodiscard]] static auto malformed() -> Tristate {
        Tristate t;
        t.state_ = State::Malformed;
        return t;
    }
    [[nodiscard]] static auto ok(T value) -> Tristate {
        Tristate t;
        t.state_ = State::Ok;
        t.value_ = std::move(value);
        return t;
    }

    [[nodiscard]] auto state() const -> State { return this->state_; }
    [[nodiscard]] auto value() const -> std::optional<T> const& { return this->value_; }

    template <typename F>
    [[nodiscard]] auto mapOk(F&& f) const -> Tristate<decltype(f(std::declval<T const&>()))> {
        using U = decltype(f(std::declval<T const&>()));
        switch (this->state_) {
        case State::Ok:
            return Tristate<U>::ok(f(*this->value_));
        case State::Malformed:
            return Tristate<U>::malformed();
        case State::NotIncluded:
            break;
        }
        return Tristate<U>::notIncluded();
    }

private:
    State            state_ = State::NotIncluded;
    std::optional<T> value_;
};

using ScalerSlot = Tristate<Scaler>;

// Reads one property from the front of `words`, advancing it if the slot
// occupies a word. NotEnoughData when the slot needs a word that is missing.
[[nodiscard]] auto readSlot(ScalerSlot const& slot, std::span<std::int32_t const>& words) -> Expected<NicheF32>;

// Limits of the raw range after scaling. nullopt on overflow or NaN scale.
[[nodiscard]] auto calcLimits(PropertyMetrics const& metrics, double scale) -> std::optional<Limits>;
// |max - min| + 1, saturating.
[[nodiscard]] auto calcGranularity(PropertyMetrics const& metrics) -> std::optional<Granularity>;

// Squashes the raw range onto `onto` regardless of unit. Malformed when the
// range is degenerate.
[[nodiscard]] auto normalized(PropertyMetrics const& metrics, Limits onto) -> Tristate<std::pair<Scaler, Info>>;
// Centimeters for length units, otherwise [0, 1].
[[nodiscard]] auto linearOrNormalize(PropertyMetrics const& metrics) -> Tristate<std::pair<Scaler, LengthInfo>>;
// Radians for angular units, otherwise [-pi, pi].
[[nodiscard]] auto halfAngleOrNormalize(PropertyMetrics const& metrics) -> Tristate<std::pair<Scaler, Info>>;

[[nodiscard]] auto linearScaleFactor(MetricUnit unit) -> std::optional<double>;
[[nodiscard]] auto angularScaleFactor(MetricUnit unit) -> std::optional<double>;

} // namespace TS
