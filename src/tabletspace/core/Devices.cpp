#include "device/Pad.hpp"
#include "device/Tablet.hpp"
#include "device/Tool.hpp"

#include <algorithm>

namespace TS {

auto toolTypeName(ToolType type) -> std::string_view {
    switch (type) {
    case ToolType::Pen:
        return "pen";
    case ToolType::Pencil:
        return "pencil";
    case ToolType::Brush:
        return "brush";
    case ToolType::Eraser:
        return "eraser";
    case ToolType::Airbrush:
        return "airbrush";
    case ToolType::Lens:
        return "lens";
    case ToolType::Finger:
        return "finger";
    case ToolType::Mouse:
        return "mouse";
    }
    return "unknown";
}

auto operator<<(std::ostream& os, Tool const& tool) -> std::ostream& {
    os << "Tool{" << tool.internalId;
    if (tool.name)
        os << ", name=\"" << *tool.name << "\"";
    if (tool.type)
        os << ", type=" << toolTypeName(*tool.type);
    if (tool.hardwareId)
        os << ", hw=" << std::hex << *tool.hardwareId << std::dec;
    if (tool.wacomId)
        os << ", wacom=" << std::hex << *tool.wacomId << std::dec;
    os << ", axes=[";
    bool first = true;
    for (auto axis : tool.axes.available().axes()) {
        if (!first)
            os << ' ';
        os << axisName(axis);
        first = false;
    }
    return os << "]}";
}

auto operator<<(std::ostream& os, Tablet const& tablet) -> std::ostream& {
    os << "Tablet{" << tablet.internalId;
    if (tablet.name)
        os << ", name=\"" << *tablet.name << "\"";
    if (tablet.usbId)
        os << ", usb=" << std::hex << tablet.usbId->vid << ":" << tablet.usbId->pid << std::dec;
    return os << "}";
}

auto PadGroup::ownsButton(std::uint32_t button) const -> bool {
    return std::binary_search(this->buttons.begin(), this->buttons.end(), button);
}

auto operator<<(std::ostream& os, Pad const& pad) -> std::ostream& {
    os << "Pad{" << pad.internalId << ", buttons=" << pad.totalButtons << ", groups=[";
    for (std::size_t i = 0; i < pad.groups.size(); ++i) {
        auto const& group = pad.groups[i];
        if (i != 0)
            os << ", ";
        os << "{buttons=" << group.buttons.size() << " rings=" << group.rings.size() << " strips=" << group.strips.size();
        if (group.modeCount)
            os << " modes=" << *group.modeCount;
        os << "}";
    }
    return os << "]}";
}

} // namespace TS
