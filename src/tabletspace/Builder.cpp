#include "Builder.hpp"
#include "log/TaggedLogger.hpp"
#include "platform/Platform.hpp"

#if defined(TABLETSPACE_BACKEND_WAYLAND)
#include "platform/wayland/WaylandPlatform.hpp"
#endif
#if defined(TABLETSPACE_BACKEND_XINPUT2)
#include "platform/xinput2/XInput2Platform.hpp"
#endif
#if defined(_WIN32) && defined(TABLETSPACE_BACKEND_INK)
#include "platform/ink/InkPlatform.hpp"
#endif

namespace TS {

namespace {

auto notCompiled(char const* backend) -> Error {
    return Error{Error::Code::NotSupported, std::string{backend} + " backend not compiled in"};
}

} // namespace

auto Builder::emulateToolFromMouse(bool enabled) -> Builder& {
    this->emulateMouse = enabled;
    return *this;
}

auto Builder::xinput2Heuristics(XInput2Heuristics heuristics) -> Builder& {
    this->heuristics = std::move(heuristics);
    return *this;
}

auto Builder::inkPacketLayout(InkPacketLayout layout) -> Builder& {
    this->layout = std::move(layout);
    return *this;
}

auto Builder::buildRaw(NativeHandle handle) const -> Expected<Manager> {
    return this->buildShared(nullptr, handle);
}

auto Builder::buildShared(std::shared_ptr<void> owner, NativeHandle handle) const -> Expected<Manager> {
    Expected<std::unique_ptr<Platform>> platform = std::unexpected(Error{Error::Code::UnknownError, "no backend selected"});

    if (auto const* wayland = std::get_if<WaylandDisplayHandle>(&handle)) {
#if defined(TABLETSPACE_BACKEND_WAYLAND)
        if (!wayland->display)
            return std::unexpected(Error{Error::Code::HandleError, "null wl_display"});
        auto connection = makeWaylandClientConnection(wayland->display);
        if (!connection)
            return std::unexpected(connection.error());
        platform = std::make_unique<WaylandPlatform>(std::move(*connection));
#else
        (void)wayland;
        return std::unexpected(notCompiled("Wayland"));
#endif
    } else if (auto const* xlib = std::get_if<XlibWindowHandle>(&handle)) {
#if defined(TABLETSPACE_BACKEND_XINPUT2)
        auto connection = makeXlibConnection(xlib->display, xlib->window);
        if (!connection)
            return std::unexpected(connection.error());
        auto table = this->heuristics ? Expected<XInput2Heuristics>{*this->heuristics} : xinput2HeuristicsFromEnvironment();
        if (!table)
            return std::unexpected(table.error());
        platform = std::make_unique<XInput2Platform>(std::move(*connection), std::move(*table));
#else
        (void)xlib;
        return std::unexpected(notCompiled("XInput2"));
#endif
    } else {
        auto const& win32 = std::get<Win32WindowHandle>(handle);
#if defined(_WIN32) && defined(TABLETSPACE_BACKEND_INK)
        platform = makeRealTimeStylusPlatform(win32.hwnd, this->emulateMouse, this->layout);
#else
        (void)win32;
        return std::unexpected(notCompiled("Ink"));
#endif
    }

    if (!platform)
        return std::unexpected(platform.error());
    ts_log("Built manager", "Manager");
    return Manager{std::move(*platform), std::move(owner)};
}

} // namespace TS
