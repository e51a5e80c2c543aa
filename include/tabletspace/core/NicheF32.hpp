#pragma once
#include "core/Error.hpp"

#include <cmath>
#include <limits>
#include <optional>

namespace TS {

/**
 * Optional float stored in four bytes. NaN is the "absent" sentinel, so a
 * present value can never be NaN.
 */
class NicheF32 {
public:
    constexpr NicheF32() = default;

    [[nodiscard]] static auto none() -> NicheF32 { return NicheF32{}; }

    // Absent when `value` is NaN.
    [[nodiscard]] static auto newSome(float value) -> std::optional<NicheF32> {
        if (std::isnan(value))
            return std::nullopt;
        NicheF32 result;
        result.value = value;
        return result;
    }

    // NaN collapses to absent.
    [[nodiscard]] static auto fromLossy(float value) -> NicheF32 {
        NicheF32 result;
        if (!std::isnan(value))
            result.value = value;
        return result;
    }

    [[nodiscard]] static auto fromOptional(std::optional<float> value) -> Expected<NicheF32> {
        if (!value)
            return NicheF32{};
        if (std::isnan(*value))
            return std::unexpected(Error{Error::Code::Value, "NaN is reserved for the absent state"});
        NicheF32 result;
        result.value = *value;
        return result;
    }

    [[nodiscard]] auto get() const -> std::optional<float> {
        if (std::isnan(this->value))
            return std::nullopt;
        return this->value;
    }

    [[nodiscard]] auto isSome() const -> bool { return !std::isnan(this->value); }

    friend auto operator==(NicheF32 const& lhs, NicheF32 const& rhs) -> bool {
        return lhs.get() == rhs.get();
    }

private:
    float value = std::numeric_limits<float>::quiet_NaN();
};

static_assert(sizeof(NicheF32) == sizeof(float));

} // namespace TS
