#pragma once
#include "platform/Platform.hpp"
#include "platform/ink/InkFrame.hpp"
#include "platform/ink/InkHost.hpp"
#include "platform/ink/InkSession.hpp"

#include <memory>

namespace TS {

class InkPlatform final : public Platform {
public:
    // `session` must have been created against `*host`.
    InkPlatform(std::unique_ptr<InkHost> host, std::shared_ptr<InkSession> session);
    ~InkPlatform() override;

    InkPlatform(InkPlatform const&)                    = delete;
    auto operator=(InkPlatform const&) -> InkPlatform& = delete;

    auto pump() -> Expected<void> override;

    [[nodiscard]] auto tools() const -> std::span<Tool const> override { return local_.tools(); }
    [[nodiscard]] auto tablets() const -> std::span<Tablet const> override { return local_.tablets(); }
    // Ink reports no pad hardware.
    [[nodiscard]] auto pads() const -> std::span<Pad const> override { return {}; }
    [[nodiscard]] auto rawEvents() const -> RawEventSpan override { return local_.events(); }
    [[nodiscard]] auto timestampGranularity() const -> std::optional<std::chrono::microseconds> override;
    [[nodiscard]] auto backend() const -> Backend override { return Backend::Ink; }

private:
    std::unique_ptr<InkHost>    host_;
    std::shared_ptr<InkSession> session_;
    InkFrame                    local_;
};

#if defined(_WIN32) && defined(TABLETSPACE_BACKEND_INK)
// Claims Ink input for the whole client area of `hwnd`, which must outlive
// the returned platform.
auto makeRealTimeStylusPlatform(void* hwnd, bool emulateToolFromMouse, InkPacketLayout layout) -> Expected<std::unique_ptr<Platform>>;
#endif

} // namespace TS
