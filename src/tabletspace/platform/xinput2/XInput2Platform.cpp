#include "platform/xinput2/XInput2Platform.hpp"
#include "log/TaggedLogger.hpp"

namespace TS {

XInput2Platform::XInput2Platform(std::unique_ptr<XInput2Connection> connection, XInput2Heuristics heuristics)
    : connection_(std::move(connection)), state_(std::move(heuristics)) {}

auto XInput2Platform::pump() -> Expected<void> {
    state_.beginCycle();
    if (!connection_)
        return std::unexpected(Error{Error::Code::TransportFailure, "no X connection"});
    auto drained = connection_->drain(state_);
    // Frames cut short by a failing drain are still delivered.
    state_.endCycle();
    if (!drained) {
        ts_log("XInput2 drain failed", "XInput2", "Error");
        return std::unexpected(drained.error());
    }
    return {};
}

auto XInput2Platform::timestampGranularity() const -> std::optional<std::chrono::microseconds> {
    return std::chrono::milliseconds{1};
}

} // namespace TS
