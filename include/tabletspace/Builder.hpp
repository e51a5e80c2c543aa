#pragma once
#include "Manager.hpp"
#include "config/InkPacketLayout.hpp"
#include "config/XInput2Heuristics.hpp"
#include "core/Error.hpp"

#include <memory>
#include <optional>
#include <variant>

namespace TS {

// A `wl_display*`.
struct WaylandDisplayHandle {
    void* display = nullptr;
};

// A `Display*` and the window events are collected for.
struct XlibWindowHandle {
    void*         display = nullptr;
    unsigned long window  = 0;
};

// An `HWND`.
struct Win32WindowHandle {
    void* hwnd = nullptr;
};

using NativeHandle = std::variant<WaylandDisplayHandle, XlibWindowHandle, Win32WindowHandle>;

/**
 * Picks the backend matching the handle. NotSupported when that backend was
 * not compiled in, HandleError for a null handle.
 */
class Builder {
public:
    // Ink only: let the mouse act as a tool.
    auto emulateToolFromMouse(bool enabled) -> Builder&;
    // Defaults to the table named by TABLETSPACE_XI_HEURISTICS, or the
    // built-in one.
    auto xinput2Heuristics(XInput2Heuristics heuristics) -> Builder&;
    auto inkPacketLayout(InkPacketLayout layout) -> Builder&;

    // The caller keeps the display or window alive for the Manager's lifetime.
    [[nodiscard]] auto buildRaw(NativeHandle handle) const -> Expected<Manager>;
    // The Manager keeps `owner` alive, and with it the handle.
    [[nodiscard]] auto buildShared(std::shared_ptr<void> owner, NativeHandle handle) const -> Expected<Manager>;

private:
    bool                             emulateMouse = false;
    std::optional<XInput2Heuristics> heuristics;
    InkPacketLayout                  layout;
};

} // namespace TS
