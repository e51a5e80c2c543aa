#include "Manager.hpp"
#include "events/EventResolver.hpp"
#include "platform/xinput2/XInput2Platform.hpp"
#include "../TabletSpaceTestHelper.hpp"

#include <doctest/doctest.h>

#include <deque>
#include <functional>
#include <memory>
#include <numbers>

using namespace TS;

namespace {

using Step = std::function<void(XInput2State&)>;

class ScriptedConnection final : public XInput2Connection {
public:
    explicit ScriptedConnection(std::shared_ptr<std::deque<Step>> script) : script(std::move(script)) {}

    auto drain(XInput2State& state) -> Expected<void> override {
        if (this->script->empty())
            return {};
        auto step = std::move(this->script->front());
        this->script->pop_front();
        if (!step)
            return std::unexpected(Error{Error::Code::TransportFailure, "X connection closed"});
        step(state);
        return {};
    }

private:
    std::shared_ptr<std::deque<Step>> script;
};

constexpr std::uint16_t kStylus = 10;
constexpr std::uint16_t kEraser = 11;
constexpr std::uint16_t kPadDev = 12;
constexpr std::uint16_t kXtest  = 13;

auto valuator(std::uint16_t number, std::string label, double min, double max) -> XInput2ValuatorInfo {
    XInput2ValuatorInfo info;
    info.number = number;
    info.label  = std::move(label);
    info.min    = min;
    info.max    = max;
    return info;
}

auto wacomDevice(std::uint16_t id, std::string name, std::string toolType) -> XInput2DeviceSnapshot {
    XInput2DeviceSnapshot device;
    device.deviceId                                 = id;
    device.name                                     = std::move(name);
    device.textProperties["Wacom Tool Type"]        = std::move(toolType);
    device.integerProperties["Device Product ID"] = {0x056a, 0x0357};
    return device;
}

auto intuos() -> std::vector<XInput2DeviceSnapshot> {
    auto stylus      = wacomDevice(kStylus, "Wacom Intuos Pro M Pen stylus", "STYLUS");
    stylus.valuators = {
            valuator(0, "Abs X", 0, 44800),
            valuator(1, "Abs Y", 0, 29600),
            valuator(2, "Abs Pressure", 0, 2047),
            valuator(3, "Abs Tilt X", -64, 63),
            valuator(4, "Abs Tilt Y", -64, 63),
    };
    stylus.integerProperties["Wacom Serial IDs"] = {0x357, 0, 0, 0x1234, 0x802};

    auto eraser      = wacomDevice(kEraser, "Wacom Intuos Pro M Pen eraser", "ERASER");
    eraser.valuators = {valuator(2, "Abs Pressure", 0, 2047)};

    auto pad        = wacomDevice(kPadDev, "Wacom Intuos Pro M Pad pad", "PAD");
    pad.buttonCount = 13;
    pad.valuators   = {valuator(3, "Abs Wheel", 0, 4096), valuator(5, "Abs Rotary Z", 0, 71)};

    XInput2DeviceSnapshot xtest;
    xtest.deviceId = kXtest;
    xtest.name     = "Virtual core XTEST pointer";

    return {stylus, eraser, pad, xtest};
}

auto pointerEvent(std::uint16_t device, std::uint32_t time, std::vector<std::pair<std::uint16_t, double>> valuators = {}) -> XInput2DeviceEvent {
    return XInput2DeviceEvent{device, time, 10.0, 20.0, std::move(valuators)};
}

auto makeManager(std::shared_ptr<std::deque<Step>> script) -> Manager {
    return Manager{std::make_unique<XInput2Platform>(std::make_unique<ScriptedConnection>(std::move(script)), XInput2Heuristics::defaults())};
}

auto scanIntuos(XInput2State& state) -> void {
    auto const devices = intuos();
    state.rescan(devices);
}

} // namespace

TEST_SUITE("platform.xinput2") {

TEST_CASE("Wacom devices are grouped into one tablet") {
    auto script = std::make_shared<std::deque<Step>>();
    script->push_back(scanIntuos);
    auto manager = makeManager(script);
    REQUIRE(manager.pump().has_value());
    CHECK(manager.backend() == Backend::XInput2);

    REQUIRE(manager.tablets().size() == 1);
    CHECK(manager.tablets()[0].name == "Wacom Intuos Pro M");
    REQUIRE(manager.tablets()[0].usbId.has_value());
    CHECK(*manager.tablets()[0].usbId == UsbId{0x056a, 0x0357});

    REQUIRE(manager.tools().size() == 2);
    auto const& stylus = manager.tools()[0];
    CHECK(stylus.type == ToolType::Pen);
    CHECK(stylus.hardwareId == 0x1234u);
    CHECK(stylus.wacomId == 0x802u);
    CHECK(stylus.axes.available().contains(Axis::Pressure));
    CHECK(stylus.axes.available().contains(Axis::Tilt));
    CHECK(manager.tools()[1].type == ToolType::Eraser);

    REQUIRE(manager.pads().size() == 1);
    auto const& pad = manager.pads()[0];
    // 13 X buttons minus the four scroll buttons.
    CHECK(pad.totalButtons == 9);
    REQUIRE(pad.groups.size() == 1);
    CHECK(pad.groups[0].buttons.size() == 9);
    CHECK(pad.groups[0].rings.size() == 1);
    CHECK(pad.groups[0].strips.size() == 1);

    CHECK(TabletSpaceTestHelper::labels(manager.events())
          == std::vector<std::string>{"tablet:Added", "tool:Added", "tool:Added", "pad:Added", "pad:Enter"});
}

TEST_CASE("Xwayland and libinput devices are recognised") {
    std::vector<XInput2DeviceSnapshot> devices(5);
    devices[0].deviceId = 20;
    devices[0].name     = "xwayland-tablet stylus:11";
    devices[1].deviceId = 21;
    devices[1].name     = "xwayland-tablet eraser:11";
    devices[2].deviceId = 22;
    devices[2].name     = "xwayland-tablet-pad:11";
    devices[3].deviceId                                       = 23;
    devices[3].name                                           = "HUION Kamvas Pen";
    devices[3].integerProperties["libinput Tablet Tool Serial"] = {0x99};
    devices[4].deviceId  = 24;
    devices[4].name      = "Generic Tablet";
    devices[4].enabled   = false;
    devices[4].valuators = {valuator(2, "Abs Pressure", 0, 1023)};

    XInput2State state;
    state.rescan(devices);
    REQUIRE(state.tools().size() == 3);
    CHECK(state.tools()[0].type == ToolType::Pen);
    CHECK(state.tools()[1].type == ToolType::Eraser);
    CHECK(state.tools()[2].hardwareId == 0x99u);
    REQUIRE(state.pads().size() == 1);
    // The xwayland devices share a name stem, the libinput pen stands alone.
    CHECK(state.tablets().size() == 2);
    CHECK(state.generation() == 1);
}

TEST_CASE("Pressure alone is enough to call a device a pen") {
    XInput2DeviceSnapshot device;
    device.deviceId  = 30;
    device.name      = "Generic Tablet";
    device.valuators = {valuator(2, "Abs Pressure", 0, 1023)};

    XInput2State state;
    state.rescan(std::span<XInput2DeviceSnapshot const>{&device, 1});
    REQUIRE(state.tools().size() == 1);
    CHECK(state.tools()[0].type == ToolType::Pen);

    device.valuators[0].absolute = false;
    state.rescan(std::span<XInput2DeviceSnapshot const>{&device, 1});
    state.beginCycle();
    CHECK(state.tools().empty());
}

TEST_CASE("Pointer traffic becomes one frame per timestamp") {
    auto script = std::make_shared<std::deque<Step>>();
    script->push_back(scanIntuos);
    script->push_back([](XInput2State& s) {
        s.motion(pointerEvent(kStylus, 100, {{2, 1024.0}, {3, 45.0}, {4, 0.0}}));
        s.button(pointerEvent(kStylus, 100), 1, true);
        s.button(pointerEvent(kStylus, 100), 2, true);
    });
    script->push_back([](XInput2State& s) {
        s.motion(pointerEvent(kStylus, 110, {{2, 0.0}}));
        s.button(pointerEvent(kStylus, 110), 1, false);
        s.leave(kStylus, 120);
    });
    auto manager = makeManager(script);
    REQUIRE(manager.pump().has_value());
    REQUIRE(manager.pump().has_value());

    auto events = manager.events();
    CHECK(TabletSpaceTestHelper::labels(events)
          == std::vector<std::string>{"tool:In", "tool:Down", "tool:Pose", "tool:Button", "tool:Frame"});
    auto const* pose = TabletSpaceTestHelper::findTool<ToolPose>(events);
    REQUIRE(pose != nullptr);
    CHECK(pose->pose.position[0] == doctest::Approx(10.0f));
    CHECK(pose->pose.position[1] == doctest::Approx(20.0f));
    CHECK(pose->pose.pressure.get().value() == doctest::Approx(0.5f));
    REQUIRE(pose->pose.tilt.has_value());
    CHECK((*pose->pose.tilt)[0] == doctest::Approx(std::numbers::pi_v<float> / 4.0f));
    CHECK((*pose->pose.tilt)[1] == doctest::Approx(0.0f));
    auto const* frame = TabletSpaceTestHelper::findTool<ToolFrame>(events);
    REQUIRE(frame != nullptr);
    CHECK(frame->timestamp == FrameTimestamp::fromMillis(100));

    REQUIRE(manager.pump().has_value());
    CHECK(TabletSpaceTestHelper::labels(manager.events())
          == std::vector<std::string>{"tool:Pose", "tool:Up", "tool:Frame", "tool:Out", "tool:Frame"});
}

TEST_CASE("Rescan retires the old generation before the new one goes live") {
    auto script = std::make_shared<std::deque<Step>>();
    script->push_back(scanIntuos);
    script->push_back([](XInput2State& s) {
        s.button(pointerEvent(kStylus, 100, {{2, 1024.0}}), 1, true);
    });
    script->push_back([](XInput2State& s) {
        scanIntuos(s);
        // Ids may already be recycled, so traffic waits for the new generation.
        s.motion(pointerEvent(kStylus, 200, {{2, 512.0}}));
    });
    auto manager = makeManager(script);
    REQUIRE(manager.pump().has_value());
    REQUIRE(manager.pump().has_value());
    auto const oldStylus = *manager.tools()[0].internalId.as<XInput2Id>();
    CHECK(oldStylus.generation == 1);

    REQUIRE(manager.pump().has_value());
    CHECK(TabletSpaceTestHelper::labels(manager.events())
          == std::vector<std::string>{"tool:Up", "tool:Out", "tool:Frame", "tool:Removed", "tool:Removed", "pad:Removed", "tablet:Removed"});
    // Removed objects are still readable during the cycle that announced them.
    CHECK(manager.tools().size() == 2);

    REQUIRE(manager.pump().has_value());
    CHECK(TabletSpaceTestHelper::labels(manager.events())
          == std::vector<std::string>{"tablet:Added", "tool:Added", "tool:Added", "pad:Added", "pad:Enter"});
    auto const newStylus = *manager.tools()[0].internalId.as<XInput2Id>();
    CHECK(newStylus.device == oldStylus.device);
    CHECK(newStylus.generation == 2);

    // A stale id for the same device no longer names anything.
    RawEvent<XInput2Id> stale = RawToolRecord<XInput2Id>{oldStylus, ToolDown{}};
    CHECK_FALSE(resolveEvent(stale, DeviceView{manager.tools(), manager.tablets(), manager.pads()}).has_value());
}

TEST_CASE("Pad rings report angles and lift when out of range") {
    auto script = std::make_shared<std::deque<Step>>();
    script->push_back(scanIntuos);
    script->push_back([](XInput2State& s) {
        s.motion(pointerEvent(kPadDev, 50, {{5, 18.0}}));
        s.motion(pointerEvent(kPadDev, 51, {{5, 18.0}}));
        s.motion(pointerEvent(kPadDev, 52, {{5, 72.0}}));
        s.motion(pointerEvent(kPadDev, 53, {{5, 72.0}}));
    });
    auto manager = makeManager(script);
    REQUIRE(manager.pump().has_value());
    REQUIRE(manager.pump().has_value());

    auto events = manager.events();
    // Unchanged values and repeated lifts are not reported twice.
    REQUIRE(TabletSpaceTestHelper::labels(events) == std::vector<std::string>{"pad:Ring", "pad:Ring", "pad:Ring", "pad:Ring"});
    auto const& pose = std::get<RingUpdate>(std::get<PadGroupUpdate>(std::get<PadUpdate>(events[0]).event).event);
    CHECK(pose.ring == &manager.pads()[0].groups[0].rings[0]);
    CHECK(std::get<TouchPose>(pose.event).value == doctest::Approx(std::numbers::pi_v<float> / 2.0f));
    auto const& lift = std::get<RingUpdate>(std::get<PadGroupUpdate>(std::get<PadUpdate>(events[2]).event).event);
    CHECK(std::holds_alternative<TouchUp>(lift.event));
}

TEST_CASE("Pad buttons skip the emulated scroll buttons") {
    auto script = std::make_shared<std::deque<Step>>();
    script->push_back(scanIntuos);
    script->push_back([](XInput2State& s) {
        s.button(pointerEvent(kPadDev, 60), 4, true);
        s.button(pointerEvent(kPadDev, 60), 8, true);
    });
    auto manager = makeManager(script);
    REQUIRE(manager.pump().has_value());
    REQUIRE(manager.pump().has_value());

    auto events = manager.events();
    REQUIRE(events.size() == 1);
    auto const& button = std::get<PadButton>(std::get<PadUpdate>(events[0]).event);
    CHECK(button.button == 3);
    CHECK(button.pressed);
    CHECK(button.group == &manager.pads()[0].groups[0]);
}

TEST_CASE("Drain failure still closes open frames") {
    auto script = std::make_shared<std::deque<Step>>();
    script->push_back(scanIntuos);
    script->push_back([](XInput2State& s) { s.motion(pointerEvent(kStylus, 100)); });
    script->push_back(Step{});
    auto manager = makeManager(script);
    REQUIRE(manager.pump().has_value());
    REQUIRE(manager.pump().has_value());
    CHECK(TabletSpaceTestHelper::labels(manager.events()) == std::vector<std::string>{"tool:In", "tool:Pose", "tool:Frame"});

    auto failed = manager.pump();
    REQUIRE_FALSE(failed.has_value());
    CHECK(failed.error().code == Error::Code::TransportFailure);
    CHECK(manager.tools().size() == 2);
}

} // TEST_SUITE
