#pragma once
#include "platform/Platform.hpp"
#include "platform/wayland/WaylandTabletState.hpp"

#include <memory>

namespace TS {

// Source of tablet-v2 messages. Dispatches whatever is queued, without
// blocking, into `state`.
class WaylandConnection {
public:
    virtual ~WaylandConnection() = default;

    virtual auto dispatchPending(WaylandTabletState& state) -> Expected<void> = 0;
};

class WaylandPlatform final : public Platform {
public:
    explicit WaylandPlatform(std::unique_ptr<WaylandConnection> connection);

    auto pump() -> Expected<void> override;

    [[nodiscard]] auto tools() const -> std::span<Tool const> override { return state_.tools(); }
    [[nodiscard]] auto tablets() const -> std::span<Tablet const> override { return state_.tablets(); }
    [[nodiscard]] auto pads() const -> std::span<Pad const> override { return state_.pads(); }
    [[nodiscard]] auto rawEvents() const -> RawEventSpan override { return state_.events(); }
    [[nodiscard]] auto timestampGranularity() const -> std::optional<std::chrono::microseconds> override;
    [[nodiscard]] auto backend() const -> Backend override { return Backend::Wayland; }

private:
    std::unique_ptr<WaylandConnection> connection_;
    WaylandTabletState                 state_;
};

#if defined(TABLETSPACE_BACKEND_WAYLAND)
// Binds the tablet manager on the application's wl_display using a private
// event queue, so the application's own dispatching is left untouched.
auto makeWaylandClientConnection(void* display) -> Expected<std::unique_ptr<WaylandConnection>>;
#endif

} // namespace TS
