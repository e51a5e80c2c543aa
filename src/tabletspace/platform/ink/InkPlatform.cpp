#include "platform/ink/InkPlatform.hpp"
#include "log/TaggedLogger.hpp"

namespace TS {

InkPlatform::InkPlatform(std::unique_ptr<InkHost> host, std::shared_ptr<InkSession> session)
    : host_(std::move(host)), session_(std::move(session)) {}

InkPlatform::~InkPlatform() {
    // The plugin keeps the session alive; detaching it stops the callbacks.
    if (host_)
        host_->shutdown();
}

auto InkPlatform::pump() -> Expected<void> {
    if (!session_)
        return std::unexpected(Error{Error::Code::TransportFailure, "no stylus session"});
    auto snapshot = session_->snapshot(local_);
    if (!snapshot && snapshot.error().code != Error::Code::Poisoned)
        ts_log("Ink pump failed: " + describeError(snapshot.error()), "Ink", "Error");
    return snapshot;
}

auto InkPlatform::timestampGranularity() const -> std::optional<std::chrono::microseconds> {
    // TimerTick carries no unit; drivers appear to report milliseconds.
    return std::chrono::milliseconds{1};
}

} // namespace TS
