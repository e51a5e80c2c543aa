#include "platform/xinput2/XInput2State.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <limits>
#include <numbers>
#include <sstream>

namespace TS {

namespace {

enum class DeviceRole : std::uint8_t {
    Ignored,
    Tool,
    Pad,
};

struct Classification {
    DeviceRole              role = DeviceRole::Ignored;
    std::optional<ToolType> toolType;
};

auto endsWith(std::string_view text, std::string_view suffix) -> bool {
    return !suffix.empty() && text.size() >= suffix.size() && text.substr(text.size() - suffix.size()) == suffix;
}

auto startsWith(std::string_view text, std::string_view prefix) -> bool {
    return !prefix.empty() && text.substr(0, prefix.size()) == prefix;
}

// "name:17" -> "name" when everything after the separator is a seat number.
auto stripSeat(std::string_view name, char separator) -> std::string_view {
    auto const at = name.rfind(separator);
    if (at == std::string_view::npos || at + 1 == name.size())
        return name;
    auto const seat = name.substr(at + 1);
    if (!std::all_of(seat.begin(), seat.end(), [](char c) { return c >= '0' && c <= '9'; }))
        return name;
    return name.substr(0, at);
}

auto stripFirstSuffix(std::string_view name, std::initializer_list<std::string_view> suffixes) -> std::string_view {
    for (auto suffix : suffixes)
        if (endsWith(name, suffix))
            return name.substr(0, name.size() - suffix.size());
    return name;
}

// Shared part of the names a driver gives the devices of one tablet, e.g.
// "Wacom Intuos S Pen stylus" and "Wacom Intuos S Pad pad".
auto nameStem(std::string_view name, XInput2Heuristics const& heuristics) -> std::string {
    auto const& xw = heuristics.xwayland;
    if (startsWith(name, xw.prefix))
        name = stripSeat(name, xw.seatSeparator);
    name = stripFirstSuffix(name, {xw.padSuffix, xw.eraserSuffix, xw.stylusSuffix, xw.cursorSuffix, " pad"});
    name = stripFirstSuffix(name, {" Pen", " Pad"});
    return std::string{name};
}

auto toolTypeFromSuffix(std::string_view name, XInput2Heuristics::Xwayland const& xw) -> std::optional<ToolType> {
    if (endsWith(name, xw.eraserSuffix))
        return ToolType::Eraser;
    if (endsWith(name, xw.cursorSuffix))
        return ToolType::Mouse;
    if (endsWith(name, xw.stylusSuffix))
        return ToolType::Pen;
    return std::nullopt;
}

auto classify(XInput2DeviceSnapshot const& device, XInput2Heuristics const& heuristics) -> Classification {
    if (!device.enabled)
        return {};

    auto const& props = heuristics.properties;
    if (auto type = device.textProperty(props.wacomToolType)) {
        auto const& types = heuristics.wacomToolTypes;
        if (*type == types.stylus)
            return {DeviceRole::Tool, ToolType::Pen};
        if (*type == types.eraser)
            return {DeviceRole::Tool, ToolType::Eraser};
        if (*type == types.cursor)
            return {DeviceRole::Tool, ToolType::Mouse};
        if (*type == types.pad)
            return {DeviceRole::Pad, std::nullopt};
        return {};
    }

    auto const& xw = heuristics.xwayland;
    if (startsWith(device.name, xw.prefix)) {
        auto const base = stripSeat(device.name, xw.seatSeparator);
        if (endsWith(base, xw.padSuffix))
            return {DeviceRole::Pad, std::nullopt};
        if (auto type = toolTypeFromSuffix(base, xw))
            return {DeviceRole::Tool, type};
        return {};
    }

    if (!device.integerProperty(props.libinputPadModesAvailable).empty())
        return {DeviceRole::Pad, std::nullopt};
    if (!device.integerProperty(props.libinputToolSerial).empty() || !device.integerProperty(props.libinputToolId).empty())
        return {DeviceRole::Tool, toolTypeFromSuffix(device.name, xw).value_or(ToolType::Pen)};

    bool const hasPressure = std::any_of(device.valuators.begin(), device.valuators.end(), [&](XInput2ValuatorInfo const& v) {
        return v.absolute && heuristics.valuatorForLabel(v.label) == XInput2Valuator::Pressure;
    });
    if (hasPressure)
        return {DeviceRole::Tool, toolTypeFromSuffix(device.name, xw).value_or(ToolType::Pen)};
    return {};
}

// Devices of one physical tablet share a product id, otherwise an evdev node,
// otherwise a name stem.
auto tabletKey(XInput2DeviceSnapshot const& device, XInput2Heuristics const& heuristics) -> std::string {
    auto const& props = heuristics.properties;
    if (auto product = device.integerProperty(props.productId); product.size() >= 2)
        return "usb:" + std::to_string(product[0]) + ":" + std::to_string(product[1]);
    if (auto node = device.textProperty(props.deviceNode))
        return "node:" + std::string{*node};
    return "name:" + nameStem(device.name, heuristics);
}

auto usbIdOf(XInput2DeviceSnapshot const& device, XInput2Heuristics const& heuristics) -> std::optional<UsbId> {
    auto product = device.integerProperty(heuristics.properties.productId);
    if (product.size() < 2)
        return std::nullopt;
    auto fits = [](std::int64_t v) { return v >= 0 && v <= 0xFFFF; };
    if (!fits(product[0]) || !fits(product[1]))
        return std::nullopt;
    return UsbId{static_cast<std::uint16_t>(product[0]), static_cast<std::uint16_t>(product[1])};
}

auto firstNonZero(std::initializer_list<std::int64_t> values) -> std::optional<std::uint64_t> {
    for (auto value : values)
        if (value != 0)
            return static_cast<std::uint64_t>(value);
    return std::nullopt;
}

auto toLogical(double value) -> std::int32_t {
    if (std::isnan(value))
        return 0;
    auto const clamped = std::clamp(value, static_cast<double>(std::numeric_limits<std::int32_t>::min()), static_cast<double>(std::numeric_limits<std::int32_t>::max()));
    return static_cast<std::int32_t>(std::lround(clamped));
}

auto metricsOf(XInput2ValuatorInfo const& valuator, MetricUnit units) -> PropertyMetrics {
    return PropertyMetrics{toLogical(valuator.min), toLogical(valuator.max), units, 1.0f};
}

auto controlGranularity(XInput2ValuatorInfo const& valuator) -> std::optional<Granularity> {
    auto const span = std::floor(valuator.max) - std::ceil(valuator.min) + 1.0;
    if (!(span >= 1.0))
        return std::nullopt;
    return Granularity::make(static_cast<std::uint32_t>(std::min(span, static_cast<double>(std::numeric_limits<std::uint32_t>::max()))));
}

// Group an entry of a libinput "... Group ..." property points at. Entries
// past the end of the property belong to the first group.
auto groupFor(std::span<std::int64_t const> table, std::size_t index, std::size_t groupCount) -> std::optional<std::size_t> {
    if (index >= table.size())
        return 0;
    auto const group = table[index];
    if (group < 0)
        return std::nullopt;
    if (static_cast<std::size_t>(group) >= groupCount)
        return 0;
    return static_cast<std::size_t>(group);
}

} // namespace

auto XInput2DeviceSnapshot::integerProperty(std::string const& property) const -> std::span<std::int64_t const> {
    if (auto it = this->integerProperties.find(property); it != this->integerProperties.end())
        return it->second;
    return {};
}

auto XInput2DeviceSnapshot::textProperty(std::string const& property) const -> std::optional<std::string_view> {
    if (auto it = this->textProperties.find(property); it != this->textProperties.end())
        return std::string_view{it->second};
    return std::nullopt;
}

XInput2State::XInput2State(XInput2Heuristics heuristics)
    : heuristics_(std::move(heuristics)) {}

auto XInput2State::beginCycle() -> void {
    events_.clear();
    if (!pending_)
        return;
    current_ = std::move(*pending_);
    pending_.reset();
    removalAnnounced_ = false;
    this->announceAdded();
}

auto XInput2State::endCycle() -> void {
    for (auto& [deviceId, device] : current_.toolDevices)
        this->closeFrame(device);
}

auto XInput2State::reset() -> void {
    current_ = Generation{};
    pending_.reset();
    removalAnnounced_ = false;
    frames_.clear();
    events_.clear();
}

auto XInput2State::rescan(std::span<XInput2DeviceSnapshot const> devices) -> void {
    if (!removalAnnounced_ && !current_.empty())
        this->announceRemoved();
    frames_.clear();
    ++generation_;

    auto next = this->build(devices);
#ifdef TS_LOG_DEBUG
    std::ostringstream oss;
    oss << "Generation " << generation_ << ": " << next.tools.size() << " tools, " << next.tablets.size() << " tablets, " << next.pads.size() << " pads";
    ts_log(oss.str(), "XInput2");
#endif
    if (current_.empty()) {
        current_ = std::move(next);
        pending_.reset();
        removalAnnounced_ = false;
        this->announceAdded();
        return;
    }
    pending_ = std::move(next);
}

auto XInput2State::build(std::span<XInput2DeviceSnapshot const> devices) const -> Generation {
    Generation next;
    phmap::flat_hash_map<std::string, XInput2Id> tabletsByKey;

    auto tabletFor = [&](XInput2DeviceSnapshot const& device) -> XInput2Id {
        auto key = tabletKey(device, heuristics_);
        if (auto it = tabletsByKey.find(key); it != tabletsByKey.end())
            return it->second;
        XInput2Id id{XInput2Kind::Tablet, device.deviceId, 0, generation_};
        Tablet    tablet;
        tablet.internalId = id;
        tablet.name       = nameStem(device.name, heuristics_);
        tablet.usbId      = usbIdOf(device, heuristics_);
        next.tablets.push_back(std::move(tablet));
        tabletsByKey.emplace(std::move(key), id);
        return id;
    };

    for (auto const& device : devices) {
        auto const classification = classify(device, heuristics_);
        switch (classification.role) {
        case DeviceRole::Ignored:
            break;
        case DeviceRole::Tool: {
            XInput2Id const id{XInput2Kind::Tool, device.deviceId, 0, generation_};
            Tool            tool;
            tool.internalId = id;
            tool.name       = device.name;
            tool.type       = classification.toolType;

            auto const& props  = heuristics_.properties;
            auto        serial = device.integerProperty(props.libinputToolSerial);
            auto        toolId = device.integerProperty(props.libinputToolId);
            auto        wacom  = device.integerProperty(props.wacomSerialIds);
            if (!serial.empty())
                tool.hardwareId = firstNonZero({serial[0]});
            if (!toolId.empty())
                tool.wacomId = firstNonZero({toolId[0]});
            // tablet id, old serial, old hw id, current serial, current hw id
            if (wacom.size() >= 5) {
                if (!tool.hardwareId)
                    tool.hardwareId = firstNonZero({wacom[3], wacom[1]});
                if (!tool.wacomId)
                    tool.wacomId = firstNonZero({wacom[4], wacom[2]});
            }

            ToolDevice runtime;
            runtime.tool   = id;
            runtime.tablet = tabletFor(device);
            for (auto const& valuator : device.valuators) {
                if (!valuator.absolute)
                    continue;
                auto const kind = heuristics_.valuatorForLabel(valuator.label);
                if (!kind)
                    continue;
                auto bind = [&](Scaler scaler) { runtime.bindings.push_back(Binding{valuator.number, *kind, scaler}); };
                auto const metrics = metricsOf(valuator, MetricUnit::Default);
                switch (*kind) {
                case XInput2Valuator::X:
                case XInput2Valuator::Y:
                    // Position comes from the event coordinates.
                    break;
                case XInput2Valuator::Pressure:
                case XInput2Valuator::ButtonPressure: {
                    auto n = normalized(metrics, Limits{0.0f, 1.0f});
                    if (n.state() != ScalerSlot::State::Ok)
                        break;
                    bind(n.value()->first);
                    auto& slot = *kind == XInput2Valuator::Pressure ? tool.axes.pressure : tool.axes.buttonPressure;
                    slot       = NormalizedInfo{n.value()->second.granularity};
                    break;
                }
                case XInput2Valuator::Distance: {
                    auto n = linearOrNormalize(metrics);
                    if (n.state() != ScalerSlot::State::Ok)
                        break;
                    bind(n.value()->first);
                    tool.axes.distance = n.value()->second;
                    break;
                }
                case XInput2Valuator::TiltX:
                case XInput2Valuator::TiltY: {
                    auto n = halfAngleOrNormalize(metricsOf(valuator, heuristics_.tiltUnit));
                    if (n.state() != ScalerSlot::State::Ok)
                        break;
                    bind(n.value()->first);
                    tool.axes.tilt = unionOptional(tool.axes.tilt, std::optional<Info>{n.value()->second});
                    break;
                }
                case XInput2Valuator::Roll: {
                    auto n = normalized(metrics, Limits{0.0f, kTauExclusive});
                    if (n.state() != ScalerSlot::State::Ok)
                        break;
                    bind(n.value()->first);
                    tool.axes.roll = CircularInfo{n.value()->second.granularity};
                    break;
                }
                case XInput2Valuator::Slider: {
                    auto n = normalized(metrics, Limits{-1.0f, 1.0f});
                    if (n.state() != ScalerSlot::State::Ok)
                        break;
                    bind(n.value()->first);
                    tool.axes.slider = SliderInfo{n.value()->second.granularity};
                    break;
                }
                }
            }
            next.tools.push_back(std::move(tool));
            next.toolDevices.emplace(device.deviceId, std::move(runtime));
            break;
        }
        case DeviceRole::Pad: {
            XInput2Id const id{XInput2Kind::Pad, device.deviceId, 0, generation_};
            auto const&     props = heuristics_.properties;
            Pad             pad;
            pad.internalId = id;
            for (std::uint32_t button = 1; button <= device.buttonCount; ++button)
                if (heuristics_.padButtonIndex(button))
                    ++pad.totalButtons;

            auto const modes      = device.integerProperty(props.libinputPadModesAvailable);
            auto const groupCount = std::max<std::size_t>(modes.size(), 1);
            for (std::size_t g = 0; g < groupCount; ++g) {
                PadGroup group;
                group.internalId = XInput2Id{XInput2Kind::Group, device.deviceId, static_cast<std::uint16_t>(g), generation_};
                if (g < modes.size() && modes[g] > 0)
                    group.modeCount = static_cast<std::uint32_t>(modes[g]);
                pad.groups.push_back(std::move(group));
            }

            auto const buttonGroups = device.integerProperty(props.libinputPadButtonGroups);
            for (std::uint32_t button = 0; button < pad.totalButtons; ++button)
                if (auto g = groupFor(buttonGroups, button, groupCount))
                    pad.groups[*g].buttons.push_back(button);

            PadDevice runtime;
            runtime.pad    = id;
            runtime.tablet = tabletFor(device);

            auto addControls = [&](std::vector<std::uint16_t> const& numbers, std::span<std::int64_t const> groups, bool ring) {
                std::uint16_t index = 0;
                for (auto number : numbers) {
                    auto valuator = std::find_if(device.valuators.begin(), device.valuators.end(), [&](XInput2ValuatorInfo const& v) { return v.number == number; });
                    if (valuator == device.valuators.end())
                        continue;
                    auto const g         = groupFor(groups, index, groupCount).value_or(0);
                    auto&      group     = pad.groups[g];
                    XInput2Id  controlId = {ring ? XInput2Kind::Ring : XInput2Kind::Strip, device.deviceId, index, generation_};
                    if (ring)
                        group.rings.push_back(Ring{controlId, controlGranularity(*valuator)});
                    else
                        group.strips.push_back(Strip{controlId, controlGranularity(*valuator)});
                    runtime.controls.push_back(PadControl{number, ring, controlId, *group.internalId.as<XInput2Id>(), valuator->min, valuator->max, std::nullopt});
                    ++index;
                }
            };
            addControls(heuristics_.pad.ringValuators, device.integerProperty(props.libinputPadRingGroups), true);
            addControls(heuristics_.pad.stripValuators, device.integerProperty(props.libinputPadStripGroups), false);

            next.pads.push_back(std::move(pad));
            next.padDevices.emplace(device.deviceId, std::move(runtime));
            break;
        }
        }
    }
    return next;
}

auto XInput2State::announceRemoved() -> void {
    for (auto& [deviceId, device] : current_.toolDevices) {
        this->closeFrame(device);
        if (!frames_.isIn(device.tool))
            continue;
        frames_.proximityOut(device.tool);
        std::optional<FrameTimestamp> timestamp;
        if (device.lastTime)
            timestamp = FrameTimestamp::fromMillis(*device.lastTime);
        frames_.frame(device.tool, timestamp, events_);
    }
    for (auto const& tool : current_.tools)
        events_.push_back(RawToolRecord<XInput2Id>{*tool.internalId.as<XInput2Id>(), ToolRemoved{}});
    for (auto const& pad : current_.pads)
        events_.push_back(RawPadRecord<XInput2Id>{*pad.internalId.as<XInput2Id>(), PadRemoved{}});
    for (auto const& tablet : current_.tablets)
        events_.push_back(RawTabletRecord<XInput2Id>{*tablet.internalId.as<XInput2Id>(), TabletRemoved{}});
    removalAnnounced_ = true;
}

auto XInput2State::announceAdded() -> void {
    for (auto const& tablet : current_.tablets)
        events_.push_back(RawTabletRecord<XInput2Id>{*tablet.internalId.as<XInput2Id>(), TabletAdded{}});
    for (auto const& tool : current_.tools)
        events_.push_back(RawToolRecord<XInput2Id>{*tool.internalId.as<XInput2Id>(), ToolAdded{}});
    for (auto const& pad : current_.pads) {
        auto const id = *pad.internalId.as<XInput2Id>();
        events_.push_back(RawPadRecord<XInput2Id>{id, PadAdded{}});
        if (auto it = current_.padDevices.find(id.device); it != current_.padDevices.end() && it->second.tablet)
            events_.push_back(RawPadRecord<XInput2Id>{id, RawPadEnter<XInput2Id>{*it->second.tablet}});
    }
}

auto XInput2State::acceptsDeviceEvents() const -> bool {
    if (!pending_)
        return true;
    ts_log("Dropping device event until the next device generation is live", "XInput2");
    return false;
}

auto XInput2State::closeFrame(ToolDevice& device) -> void {
    if (!device.frameTime)
        return;
    if (frames_.hasPending(device.tool))
        frames_.frame(device.tool, FrameTimestamp::fromMillis(*device.frameTime), events_);
    device.frameTime.reset();
}

auto XInput2State::enter(ToolDevice& device, std::uint32_t time) -> void {
    if (device.frameTime && *device.frameTime != time)
        this->closeFrame(device);
    device.frameTime = time;
    device.lastTime  = time;
    if (!frames_.isIn(device.tool))
        frames_.proximityIn(device.tool, device.tablet);
}

auto XInput2State::applyValuators(ToolDevice& device, XInput2DeviceEvent const& event) -> void {
    for (auto const& [number, raw] : event.valuators) {
        auto binding = std::find_if(device.bindings.begin(), device.bindings.end(), [&](Binding const& b) { return b.number == number; });
        if (binding == device.bindings.end())
            continue;
        auto value = binding->scaler.apply(toLogical(raw));
        if (!value)
            continue;
        auto const tool = device.tool;
        switch (binding->valuator) {
        case XInput2Valuator::X:
        case XInput2Valuator::Y:
            break;
        case XInput2Valuator::Pressure:
            frames_.pressure(tool, *value);
            break;
        case XInput2Valuator::ButtonPressure:
            frames_.buttonPressure(tool, *value);
            break;
        case XInput2Valuator::Distance:
            frames_.distance(tool, *value);
            break;
        case XInput2Valuator::TiltX:
            device.tilt[0] = *value;
            frames_.tilt(tool, device.tilt[0], device.tilt[1]);
            break;
        case XInput2Valuator::TiltY:
            device.tilt[1] = *value;
            frames_.tilt(tool, device.tilt[0], device.tilt[1]);
            break;
        case XInput2Valuator::Roll:
            frames_.roll(tool, *value);
            break;
        case XInput2Valuator::Slider:
            frames_.slider(tool, *value);
            break;
        }
    }
}

// A value outside the advertised range means the finger left the control.
auto XInput2State::applyPadValuators(PadDevice& device, XInput2DeviceEvent const& event) -> void {
    for (auto& control : device.controls) {
        auto it = std::find_if(event.valuators.begin(), event.valuators.end(), [&](auto const& v) { return v.first == control.number; });
        if (it == event.valuators.end())
            continue;
        auto push = [&](TouchStripEvent touch) {
            RawGroupEvent<XInput2Id> groupEvent = control.ring ? RawGroupEvent<XInput2Id>{RawRingUpdate<XInput2Id>{control.control, touch}}
                                                               : RawGroupEvent<XInput2Id>{RawStripUpdate<XInput2Id>{control.control, touch}};
            events_.push_back(RawPadRecord<XInput2Id>{device.pad, RawPadGroupUpdate<XInput2Id>{control.group, std::move(groupEvent)}});
        };
        auto const timestamp = FrameTimestamp::fromMillis(event.time);
        auto const raw       = it->second;
        if (std::isnan(raw) || raw < control.min || raw > control.max) {
            if (control.last) {
                push(TouchUp{});
                push(TouchFrame{timestamp});
                control.last.reset();
            }
            continue;
        }
        float value = 0.0f;
        if (control.ring) {
            auto const steps = control.max - control.min + 1.0;
            value            = std::min(static_cast<float>((raw - control.min) / steps * 2.0 * std::numbers::pi), kTauExclusive);
        } else if (control.max > control.min) {
            value = static_cast<float>((raw - control.min) / (control.max - control.min));
        }
        if (control.last && *control.last == value)
            continue;
        control.last = value;
        push(TouchPose{value});
        push(TouchFrame{timestamp});
    }
}

auto XInput2State::motion(XInput2DeviceEvent const& event) -> void {
    if (!this->acceptsDeviceEvents())
        return;
    if (auto it = current_.toolDevices.find(event.deviceId); it != current_.toolDevices.end()) {
        auto& device = it->second;
        this->enter(device, event.time);
        frames_.motion(device.tool, static_cast<float>(event.x), static_cast<float>(event.y));
        this->applyValuators(device, event);
        return;
    }
    if (auto it = current_.padDevices.find(event.deviceId); it != current_.padDevices.end())
        this->applyPadValuators(it->second, event);
}

auto XInput2State::button(XInput2DeviceEvent const& event, std::uint32_t button, bool pressed) -> void {
    if (!this->acceptsDeviceEvents())
        return;
    if (auto it = current_.toolDevices.find(event.deviceId); it != current_.toolDevices.end()) {
        auto& device = it->second;
        this->enter(device, event.time);
        frames_.motion(device.tool, static_cast<float>(event.x), static_cast<float>(event.y));
        this->applyValuators(device, event);
        if (button == 1) {
            if (pressed)
                frames_.down(device.tool);
            else
                frames_.up(device.tool);
        } else {
            frames_.button(device.tool, ButtonId::fromCode(button), pressed);
        }
        return;
    }
    if (auto it = current_.padDevices.find(event.deviceId); it != current_.padDevices.end()) {
        auto& device = it->second;
        this->applyPadValuators(device, event);
        if (auto index = heuristics_.padButtonIndex(button))
            events_.push_back(RawPadRecord<XInput2Id>{device.pad, RawPadButton{*index, pressed}});
    }
}

auto XInput2State::leave(std::uint16_t deviceId, std::uint32_t time) -> void {
    if (!this->acceptsDeviceEvents())
        return;
    auto it = current_.toolDevices.find(deviceId);
    if (it == current_.toolDevices.end())
        return;
    auto& device = it->second;
    if (!frames_.isIn(device.tool))
        return;
    if (device.frameTime && *device.frameTime != time)
        this->closeFrame(device);
    device.frameTime = time;
    device.lastTime  = time;
    frames_.proximityOut(device.tool);
    this->closeFrame(device);
}

auto XInput2State::serialIds(std::uint16_t deviceId, std::span<std::int64_t const> ids, std::uint32_t time) -> void {
    // tablet id, old serial, old hw id, current serial, current hw id
    if (ids.size() < 4 || ids[3] != 0)
        return;
    this->leave(deviceId, time);
}

} // namespace TS
