#include "Manager.hpp"
#include "platform/wayland/WaylandPlatform.hpp"
#include "../TabletSpaceTestHelper.hpp"

#include <doctest/doctest.h>

#include <cstring>
#include <deque>
#include <functional>
#include <memory>
#include <numbers>

using namespace TS;

namespace {

using Step = std::function<void(WaylandTabletState&)>;

// Replays one scripted burst of protocol messages per dispatch.
class ScriptedConnection final : public WaylandConnection {
public:
    explicit ScriptedConnection(std::shared_ptr<std::deque<Step>> script) : script(std::move(script)) {}

    auto dispatchPending(WaylandTabletState& state) -> Expected<void> override {
        if (this->script->empty())
            return {};
        auto step = std::move(this->script->front());
        this->script->pop_front();
        if (!step)
            return std::unexpected(Error{Error::Code::TransportFailure, "connection lost"});
        step(state);
        return {};
    }

private:
    std::shared_ptr<std::deque<Step>> script;
};

WaylandId const kTablet{100};
WaylandId const kPen{200};
WaylandId const kPad{300};
WaylandId const kGroup{301};
WaylandId const kRing{302};
WaylandId const kStrip{303};

auto announceDevices(WaylandTabletState& s) -> void {
    s.tabletName(kTablet, "Wacom Intuos Pro M");
    s.tabletId(kTablet, 0x056a, 0x0357);
    s.tabletDone(kTablet);

    s.toolType(kPen, WaylandToolType::Pen);
    s.toolHardwareSerial(kPen, 0, 0x1234);
    s.toolHardwareIdWacom(kPen, 0, 0x802);
    s.toolCapability(kPen, WaylandToolCapability::Pressure);
    s.toolCapability(kPen, WaylandToolCapability::Tilt);
    s.toolDone(kPen);

    s.padGroup(kPad, kGroup);
    std::uint32_t const buttons[] = {1, 0, 1};
    std::uint8_t        bytes[sizeof(buttons)];
    std::memcpy(bytes, buttons, sizeof(buttons));
    s.groupButtons(kGroup, bytes);
    s.groupModes(kGroup, 4);
    s.groupRing(kGroup, kRing);
    s.groupStrip(kGroup, kStrip);
    s.groupDone(kGroup);
    s.padButtons(kPad, 4);
    s.padDone(kPad);
    s.padEnter(kPad, kTablet);
}

auto makeManager(std::shared_ptr<std::deque<Step>> script) -> Manager {
    return Manager{std::make_unique<WaylandPlatform>(std::make_unique<ScriptedConnection>(std::move(script)))};
}

} // namespace

TEST_SUITE("platform.wayland") {

TEST_CASE("Devices appear once their burst is done") {
    auto script = std::make_shared<std::deque<Step>>();
    script->push_back(announceDevices);
    auto manager = makeManager(script);

    REQUIRE(manager.pump().has_value());
    CHECK(manager.backend() == Backend::Wayland);
    REQUIRE(manager.tablets().size() == 1);
    REQUIRE(manager.tools().size() == 1);
    REQUIRE(manager.pads().size() == 1);

    auto const& tablet = manager.tablets()[0];
    CHECK(tablet.name == "Wacom Intuos Pro M");
    REQUIRE(tablet.usbId.has_value());
    CHECK(tablet.usbId->vid == 0x056a);
    CHECK(tablet.usbId->pid == 0x0357);

    auto const& tool = manager.tools()[0];
    CHECK(tool.type == ToolType::Pen);
    CHECK(tool.hardwareId == 0x1234u);
    CHECK(tool.wacomId == 0x802u);
    CHECK(tool.axes.available().contains(Axis::Pressure));
    CHECK(tool.axes.available().contains(Axis::Tilt));
    CHECK_FALSE(tool.axes.available().contains(Axis::Wheel));

    auto const& pad = manager.pads()[0];
    CHECK(pad.totalButtons == 4);
    REQUIRE(pad.groups.size() == 1);
    CHECK(pad.groups[0].buttons == std::vector<std::uint32_t>{0, 1});
    CHECK(pad.groups[0].modeCount == 4u);
    CHECK(pad.groups[0].rings.size() == 1);
    CHECK(pad.groups[0].strips.size() == 1);

    CHECK(TabletSpaceTestHelper::labels(manager.events())
          == std::vector<std::string>{"tablet:Added", "tool:Added", "pad:Added", "pad:Enter"});
}

TEST_CASE("Stroke is delivered as one ordered frame") {
    auto script = std::make_shared<std::deque<Step>>();
    script->push_back(announceDevices);
    script->push_back([](WaylandTabletState& s) {
        s.toolMotion(kPen, 120.5, 80.25);
        s.toolPressure(kPen, 65535);
        s.toolTilt(kPen, 45.0, -45.0);
        s.toolDown(kPen);
        s.toolProximityIn(kPen, kTablet);
        s.toolButton(kPen, 0x14b, true);
        s.toolFrame(kPen, 1000);
    });
    auto manager = makeManager(script);
    REQUIRE(manager.pump().has_value());
    REQUIRE(manager.pump().has_value());

    auto events = manager.events();
    CHECK(TabletSpaceTestHelper::labels(events)
          == std::vector<std::string>{"tool:In", "tool:Down", "tool:Pose", "tool:Button", "tool:Frame"});

    auto const* in = TabletSpaceTestHelper::findTool<ToolIn>(events);
    REQUIRE(in != nullptr);
    CHECK(in->tablet == &manager.tablets()[0]);

    auto const* pose = TabletSpaceTestHelper::findTool<ToolPose>(events);
    REQUIRE(pose != nullptr);
    CHECK(pose->pose.position[0] == doctest::Approx(120.5f));
    CHECK(pose->pose.pressure.get().value() == doctest::Approx(1.0f));
    REQUIRE(pose->pose.tilt.has_value());
    CHECK((*pose->pose.tilt)[0] == doctest::Approx(std::numbers::pi_v<float> / 4.0f));
    CHECK((*pose->pose.tilt)[1] == doctest::Approx(-std::numbers::pi_v<float> / 4.0f));

    auto const* button = TabletSpaceTestHelper::findTool<ToolButton>(events);
    REQUIRE(button != nullptr);
    CHECK(button->button == ButtonId::fromCode(0x14b));

    auto const* frame = TabletSpaceTestHelper::findTool<ToolFrame>(events);
    REQUIRE(frame != nullptr);
    CHECK(frame->timestamp == FrameTimestamp::fromMillis(1000));
}

TEST_CASE("Leaving while touching lifts the tool first") {
    auto script = std::make_shared<std::deque<Step>>();
    script->push_back(announceDevices);
    script->push_back([](WaylandTabletState& s) {
        s.toolProximityIn(kPen, kTablet);
        s.toolDown(kPen);
        s.toolFrame(kPen, 10);
    });
    script->push_back([](WaylandTabletState& s) {
        s.toolProximityOut(kPen);
        s.toolFrame(kPen, 20);
    });
    auto manager = makeManager(script);
    for (int i = 0; i < 3; ++i)
        REQUIRE(manager.pump().has_value());
    CHECK(TabletSpaceTestHelper::labels(manager.events()) == std::vector<std::string>{"tool:Up", "tool:Out", "tool:Frame"});
}

TEST_CASE("Slider and wheel are scaled") {
    auto script = std::make_shared<std::deque<Step>>();
    script->push_back(announceDevices);
    script->push_back([](WaylandTabletState& s) {
        s.toolProximityIn(kPen, kTablet);
        s.toolSlider(kPen, 200000);
        s.toolWheel(kPen, 15.0, 1);
        s.toolWheel(kPen, 15.0, 1);
        s.toolFrame(kPen, 10);
    });
    auto manager = makeManager(script);
    REQUIRE(manager.pump().has_value());
    REQUIRE(manager.pump().has_value());

    auto const* pose = TabletSpaceTestHelper::findTool<ToolPose>(manager.events());
    REQUIRE(pose != nullptr);
    CHECK(pose->pose.slider.get().value() == doctest::Approx(1.0f));
    REQUIRE(pose->pose.wheel.has_value());
    CHECK(pose->pose.wheel->clicks == 2);
    CHECK(pose->pose.wheel->radians == doctest::Approx(std::numbers::pi_v<float> / 6.0f));
}

TEST_CASE("Ring and strip updates resolve through the pad") {
    auto script = std::make_shared<std::deque<Step>>();
    script->push_back(announceDevices);
    script->push_back([](WaylandTabletState& s) {
        s.ringSource(kRing, TouchSource::Finger);
        s.ringAngle(kRing, 90.0);
        s.ringFrame(kRing, 5);
        s.stripPosition(kStrip, 65535);
        s.stripStop(kStrip);
        s.stripFrame(kStrip, 6);
        s.groupModeSwitch(kGroup, 2);
        s.padButton(kPad, 1, true);
    });
    auto manager = makeManager(script);
    REQUIRE(manager.pump().has_value());
    REQUIRE(manager.pump().has_value());

    auto events = manager.events();
    CHECK(TabletSpaceTestHelper::labels(events)
          == std::vector<std::string>{"pad:Ring", "pad:Ring", "pad:Ring", "pad:Strip", "pad:Strip", "pad:Strip", "pad:Mode", "pad:Button"});

    auto const& ring = std::get<RingUpdate>(std::get<PadGroupUpdate>(std::get<PadUpdate>(events[1]).event).event);
    CHECK(ring.ring == &manager.pads()[0].groups[0].rings[0]);
    CHECK(std::get<TouchPose>(ring.event).value == doctest::Approx(std::numbers::pi_v<float> / 2.0f));

    auto const& strip = std::get<StripUpdate>(std::get<PadGroupUpdate>(std::get<PadUpdate>(events[3]).event).event);
    CHECK(std::get<TouchPose>(strip.event).value == doctest::Approx(1.0f));

    auto const& button = std::get<PadButton>(std::get<PadUpdate>(events.back()).event);
    CHECK(button.group == &manager.pads()[0].groups[0]);
}

TEST_CASE("Removed objects stay readable for one cycle") {
    auto script = std::make_shared<std::deque<Step>>();
    script->push_back(announceDevices);
    script->push_back([](WaylandTabletState& s) {
        s.toolRemoved(kPen);
        s.padRemoved(kPad);
    });
    auto manager = makeManager(script);
    REQUIRE(manager.pump().has_value());
    REQUIRE(manager.pump().has_value());

    CHECK(TabletSpaceTestHelper::labels(manager.events()) == std::vector<std::string>{"tool:Removed", "pad:Removed"});
    CHECK(manager.tools().size() == 1);
    CHECK(manager.pads().size() == 1);

    REQUIRE(manager.pump().has_value());
    CHECK(manager.events().empty());
    CHECK(manager.tools().empty());
    CHECK(manager.pads().empty());
    CHECK(manager.tablets().size() == 1);
}

TEST_CASE("Repeated construction messages for a live tool are ignored") {
    auto script = std::make_shared<std::deque<Step>>();
    script->push_back(announceDevices);
    script->push_back([](WaylandTabletState& s) {
        s.toolType(kPen, WaylandToolType::Eraser);
        s.toolDone(kPen);
    });
    auto manager = makeManager(script);
    REQUIRE(manager.pump().has_value());
    REQUIRE(manager.pump().has_value());
    REQUIRE(manager.tools().size() == 1);
    CHECK(manager.tools()[0].type == ToolType::Pen);
    CHECK(manager.events().empty());
}

TEST_CASE("Dispatch failure keeps the last state readable") {
    auto script = std::make_shared<std::deque<Step>>();
    script->push_back(announceDevices);
    script->push_back(Step{});
    auto manager = makeManager(script);
    REQUIRE(manager.pump().has_value());

    auto failed = manager.pump();
    REQUIRE_FALSE(failed.has_value());
    CHECK(failed.error().code == Error::Code::TransportFailure);
    CHECK(manager.tools().size() == 1);
    CHECK(manager.timestampGranularity() == std::chrono::microseconds{1000});
}

} // TEST_SUITE
