#pragma once
#include <chrono>
#include <cstdint>
#include <ostream>

namespace TS {

// Time since an unspecified, backend-specific epoch. Only differences between
// timestamps from the same backend are meaningful.
class FrameTimestamp {
public:
    using Duration = std::chrono::microseconds;

    constexpr FrameTimestamp() = default;
    constexpr explicit FrameTimestamp(Duration sinceEpoch) : sinceEpoch(sinceEpoch) {}

    [[nodiscard]] static constexpr auto epoch() -> FrameTimestamp { return FrameTimestamp{}; }
    [[nodiscard]] static constexpr auto fromMillis(std::uint64_t ms) -> FrameTimestamp {
        return FrameTimestamp{std::chrono::duration_cast<Duration>(std::chrono::milliseconds{static_cast<std::int64_t>(ms)})};
    }

    [[nodiscard]] constexpr auto sinceOrigin() const -> Duration { return this->sinceEpoch; }

    friend constexpr auto operator-(FrameTimestamp const& lhs, FrameTimestamp const& rhs) -> Duration {
        return lhs.sinceEpoch - rhs.sinceEpoch;
    }
    friend constexpr auto operator+(FrameTimestamp const& lhs, Duration rhs) -> FrameTimestamp {
        return FrameTimestamp{lhs.sinceEpoch + rhs};
    }
    friend constexpr auto operator<=>(FrameTimestamp const&, FrameTimestamp const&) = default;

    friend auto operator<<(std::ostream& os, FrameTimestamp const& ts) -> std::ostream& {
        return os << ts.sinceEpoch.count() << "us";
    }

private:
    Duration sinceEpoch{0};
};

} // namespace TS
