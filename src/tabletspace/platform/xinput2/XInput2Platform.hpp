#pragma once
#include "platform/Platform.hpp"
#include "platform/xinput2/XInput2State.hpp"

#include <memory>

namespace TS {

// Source of XInput2 traffic. Drains whatever the server already sent, without
// blocking, into `state`; rescans the device list whenever the hierarchy
// changed since the last drain.
class XInput2Connection {
public:
    virtual ~XInput2Connection() = default;

    virtual auto drain(XInput2State& state) -> Expected<void> = 0;
};

class XInput2Platform final : public Platform {
public:
    XInput2Platform(std::unique_ptr<XInput2Connection> connection, XInput2Heuristics heuristics);

    auto pump() -> Expected<void> override;

    [[nodiscard]] auto tools() const -> std::span<Tool const> override { return state_.tools(); }
    [[nodiscard]] auto tablets() const -> std::span<Tablet const> override { return state_.tablets(); }
    [[nodiscard]] auto pads() const -> std::span<Pad const> override { return state_.pads(); }
    [[nodiscard]] auto rawEvents() const -> RawEventSpan override { return state_.events(); }
    [[nodiscard]] auto timestampGranularity() const -> std::optional<std::chrono::microseconds> override;
    [[nodiscard]] auto backend() const -> Backend override { return Backend::XInput2; }

private:
    std::unique_ptr<XInput2Connection> connection_;
    XInput2State                       state_;
};

#if defined(TABLETSPACE_BACKEND_XINPUT2)
// Opens a private display connection to the server `display` is connected to
// and selects XInput2 events on `window`.
auto makeXlibConnection(void* display, unsigned long window) -> Expected<std::unique_ptr<XInput2Connection>>;
#endif

} // namespace TS
