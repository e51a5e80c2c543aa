#include "platform/wayland/WaylandPlatform.hpp"
#include "log/TaggedLogger.hpp"

namespace TS {

WaylandPlatform::WaylandPlatform(std::unique_ptr<WaylandConnection> connection)
    : connection_(std::move(connection)) {}

auto WaylandPlatform::pump() -> Expected<void> {
    state_.beginCycle();
    if (!connection_)
        return std::unexpected(Error{Error::Code::TransportFailure, "no wayland connection"});
    if (auto dispatched = connection_->dispatchPending(state_); !dispatched) {
        ts_log("Wayland dispatch failed", "Wayland", "Error");
        return std::unexpected(dispatched.error());
    }
    return {};
}

auto WaylandPlatform::timestampGranularity() const -> std::optional<std::chrono::microseconds> {
    return std::chrono::milliseconds{1};
}

} // namespace TS
