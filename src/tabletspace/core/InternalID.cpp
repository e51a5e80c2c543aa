#include "core/InternalID.hpp"

namespace TS {

auto backendName(Backend backend) -> std::string_view {
    switch (backend) {
    case Backend::Wayland:
        return "wayland";
    case Backend::XInput2:
        return "xinput2";
    case Backend::Ink:
        return "ink";
    }
    return "unknown";
}

namespace {
auto kindName(XInput2Kind kind) -> std::string_view {
    switch (kind) {
    case XInput2Kind::Tool:
        return "tool";
    case XInput2Kind::Tablet:
        return "tablet";
    case XInput2Kind::Pad:
        return "pad";
    case XInput2Kind::Group:
        return "group";
    case XInput2Kind::Ring:
        return "ring";
    case XInput2Kind::Strip:
        return "strip";
    }
    return "unknown";
}
} // namespace

auto operator<<(std::ostream& os, InternalID const& id) -> std::ostream& {
    if (auto const* wl = id.as<WaylandId>())
        return os << "wl#" << wl->handle;
    if (auto const* xi = id.as<XInput2Id>())
        return os << "xi:" << kindName(xi->kind) << "#" << xi->device << "." << xi->index << "@g" << xi->generation;
    if (auto const* ink = id.as<InkId>()) {
        os << (ink->kind == InkKind::Tablet ? "ink:tablet#" : "ink:stylus#") << ink->value;
        if (ink->cursorId)
            os << "/c" << *ink->cursorId;
    }
    return os;
}

} // namespace TS
