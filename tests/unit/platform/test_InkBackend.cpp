#include "Manager.hpp"
#include "platform/ink/InkPlatform.hpp"
#include "FakeInkHost.hpp"
#include "../TabletSpaceTestHelper.hpp"

#include <doctest/doctest.h>

#include <array>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace TS;

namespace {

constexpr std::uint32_t kPenSid = 7;

auto makeHost() -> std::unique_ptr<FakeInkHost> {
    auto host                = std::make_unique<FakeInkHost>();
    host->cursors[kPenSid]   = InkCursorInfo{42, std::string{"Pen"}, false};
    host->cursors[8]         = InkCursorInfo{43, std::string{"Eraser"}, true};
    host->tabletInfo[1]      = FakeInkHost::penTablet("Intuos");
    host->tabletInfo[2]      = FakeInkHost::penTablet("Cintiq");
    host->tabletInfo[3]      = FakeInkHost::penTablet("Bamboo");
    host->tabletInfo[9].name = "Unreadable";
    return host;
}

// One Manager driving an InkPlatform, with the session kept for injecting
// callbacks the way the stylus thread would.
struct InkRig {
    std::shared_ptr<std::vector<std::string>> calls;
    FakeInkHost*                              host = nullptr;
    std::shared_ptr<InkSession>               session;
    Manager                                   manager;

    explicit InkRig(std::unique_ptr<FakeInkHost> fake = makeHost())
        : calls(fake->calls)
        , host(fake.get())
        , session(std::make_shared<InkSession>(*fake, InkPacketLayout::defaults()))
        , manager(std::make_unique<InkPlatform>(std::move(fake), session)) {}
};

auto packet(std::int32_t x, std::int32_t y, std::int32_t pressure, std::int32_t tick, std::int32_t status = 0) -> std::array<std::int32_t, 5> {
    return {x, y, pressure, tick, status};
}

} // namespace

TEST_SUITE("platform.ink.frame") {

TEST_CASE("Tablets are removed by position, highest slot first") {
    auto           host   = makeHost();
    auto const     layout = InkPacketLayout::defaults();
    InkFrame       frame;
    for (std::uint32_t tcid : {1u, 2u, 3u})
        frame.appendTablet(layout, tcid, *host->tablet(tcid));
    REQUIRE(frame.tablets().size() == 3);

    REQUIRE(frame.deleteTabletByIndex(1).has_value());
    // Index 1 now names the slot after the one already going away.
    REQUIRE(frame.deleteTabletByIndex(1).has_value());
    CHECK(frame.pendingDeletions().size() == 2);
    auto late = frame.deleteTabletByIndex(1);
    REQUIRE_FALSE(late.has_value());
    CHECK(late.error().code == Error::Code::InvalidArgument);
    CHECK_FALSE(frame.deleteTabletByIndex(-1).has_value());

    // Still resolvable until the frame ends.
    CHECK(frame.tablets().size() == 3);
    CHECK(frame.events().size() == 5);

    frame.frameEndCleanup();
    CHECK(frame.events().empty());
    CHECK(frame.pendingDeletions().empty());
    REQUIRE(frame.tabletSlots().size() == 1);
    CHECK(tcidOf(frame.tabletSlots()[0]) == 1u);
    REQUIRE(frame.tablets().size() == 1);
    CHECK(frame.tablets()[0].name == "Intuos");
}

TEST_CASE("An unreadable tablet shadows a later one with the same context") {
    auto       host   = makeHost();
    auto const layout = InkPacketLayout::defaults();
    InkFrame   frame;
    InkTabletInfo broken;
    frame.appendTablet(layout, 5, broken);
    frame.appendTablet(layout, 5, FakeInkHost::penTablet("Intuos"));
    REQUIRE(frame.tabletSlots().size() == 2);
    CHECK(std::holds_alternative<InkFrame::DummyTablet>(frame.tabletSlots()[0]));
    CHECK(frame.tablets().size() == 1);

    auto const words = packet(10, 10, 0, 1);
    auto const pen   = host->cursor(kPenSid);
    REQUIRE(pen.has_value());
    frame.handlePackets(InkStylusInfo{5, kPenSid}, &*pen, 1, words, StylusPhase::InAir);
    // Only the tool announcement, the packets have no interpreter.
    REQUIRE(frame.events().size() == 2);
    CHECK(std::holds_alternative<ToolAdded>(std::get<RawToolRecord<InkId>>(frame.events()[1]).event));

    REQUIRE(frame.deleteTabletByIndex(0).has_value());
    frame.frameEndCleanup();
    CHECK(frame.tablets().size() == 1);

    CHECK(frame.hasTool(kPenSid));
    // Known tools need no cursor.
    frame.handlePackets(InkStylusInfo{5, kPenSid}, nullptr, 1, words, StylusPhase::InAir);
    CHECK(frame.events().size() == 3);
}

} // TEST_SUITE

TEST_SUITE("platform.ink") {

TEST_CASE("Enabled tablets appear on the next pump") {
    InkRig                             rig;
    std::array<std::uint32_t, 2> const tcids{1, 2};
    REQUIRE(rig.session->realTimeStylusEnabled(2, tcids.data()).has_value());
    REQUIRE(rig.manager.pump().has_value());

    CHECK(rig.manager.backend() == Backend::Ink);
    CHECK(rig.manager.pads().empty());
    REQUIRE(rig.manager.tablets().size() == 2);
    CHECK(rig.manager.tablets()[1].name == "Cintiq");
    CHECK(TabletSpaceTestHelper::labels(rig.manager.events()) == std::vector<std::string>{"tablet:Added", "tablet:Added"});
    CHECK(rig.manager.timestampGranularity() == std::chrono::microseconds{1000});
}

TEST_CASE("A stroke is reported through phase changes and packets") {
    auto fake   = makeHost();
    fake->scale = 0.5f;
    InkRig rig{std::move(fake)};
    REQUIRE(rig.session->tabletAdded(1).has_value());
    REQUIRE(rig.manager.pump().has_value());

    InkStylusInfo const pen{1, kPenSid};
    auto const          hover = packet(100, 200, 0, 10);
    REQUIRE(rig.session->inAirPackets(&pen, 1, 5, hover.data()).has_value());
    auto const down = packet(100, 200, 512, 11, StatusWord::DOWN);
    REQUIRE(rig.session->stylusDown(&pen, 5, down.data()).has_value());
    std::array<std::int32_t, 10> const drag{110, 210, 600, 12, StatusWord::DOWN, 120, 220, 700, 13, StatusWord::DOWN};
    REQUIRE(rig.session->packets(&pen, 2, 10, drag.data()).has_value());
    auto const up = packet(120, 220, 0, 14);
    REQUIRE(rig.session->stylusUp(&pen, 5, up.data()).has_value());
    REQUIRE(rig.session->stylusOutOfRange(kPenSid).has_value());
    REQUIRE(rig.manager.pump().has_value());

    auto events = rig.manager.events();
    CHECK(TabletSpaceTestHelper::labels(events)
          == std::vector<std::string>{"tool:Added", "tool:In",   "tool:Pose", "tool:Frame", "tool:Down", "tool:Pose", "tool:Frame", "tool:Pose",
                                      "tool:Frame", "tool:Pose", "tool:Frame", "tool:Up",   "tool:Pose", "tool:Frame", "tool:Out",  "tool:Frame"});

    REQUIRE(rig.manager.tools().size() == 1);
    auto const& tool = rig.manager.tools()[0];
    CHECK(tool.type == ToolType::Pen);
    CHECK(tool.hardwareId == 42u);
    CHECK(tool.name == "Pen");
    // Capabilities come from the tablet the tool entered.
    CHECK(tool.axes.available().contains(Axis::Pressure));

    auto const* in = TabletSpaceTestHelper::findTool<ToolIn>(events);
    REQUIRE(in != nullptr);
    CHECK(in->tablet == &rig.manager.tablets()[0]);
    auto const* pose = TabletSpaceTestHelper::findTool<ToolPose>(events);
    REQUIRE(pose != nullptr);
    CHECK(pose->pose.position[0] == doctest::Approx(50.0f));
    CHECK(pose->pose.position[1] == doctest::Approx(100.0f));
    auto const* frame = TabletSpaceTestHelper::findTool<ToolFrame>(events);
    REQUIRE(frame != nullptr);
    CHECK(frame->timestamp == FrameTimestamp::fromMillis(10));

    // Frames without a packet carry no timestamp.
    auto const& last = std::get<ToolFrame>(std::get<ToolUpdate>(events.back()).event);
    CHECK_FALSE(last.timestamp.has_value());
}

TEST_CASE("Leaving range while touching lifts the tool") {
    InkRig rig;
    REQUIRE(rig.session->tabletAdded(1).has_value());
    InkStylusInfo const eraser{1, 8};
    auto const          down = packet(0, 0, 800, 1, StatusWord::DOWN | StatusWord::INVERTED);
    REQUIRE(rig.session->stylusDown(&eraser, 5, down.data()).has_value());
    REQUIRE(rig.manager.pump().has_value());
    REQUIRE(rig.manager.tools().size() == 1);
    CHECK(rig.manager.tools()[0].type == ToolType::Eraser);

    REQUIRE(rig.session->stylusOutOfRange(8).has_value());
    REQUIRE(rig.manager.pump().has_value());
    CHECK(TabletSpaceTestHelper::labels(rig.manager.events()) == std::vector<std::string>{"tool:Up", "tool:Out", "tool:Frame"});
}

TEST_CASE("Buttons count only while the tool is in range") {
    InkRig rig;
    REQUIRE(rig.session->tabletAdded(1).has_value());
    std::array<std::uint8_t, 16> guid{};
    guid[0] = 0x39;

    REQUIRE(rig.session->stylusButton(kPenSid, &guid, true).has_value());
    REQUIRE(rig.manager.pump().has_value());
    CHECK(TabletSpaceTestHelper::labels(rig.manager.events()) == std::vector<std::string>{"tablet:Added"});

    InkStylusInfo const pen{1, kPenSid};
    auto const          hover = packet(1, 1, 0, 1);
    REQUIRE(rig.session->inAirPackets(&pen, 1, 5, hover.data()).has_value());
    REQUIRE(rig.manager.pump().has_value());

    REQUIRE(rig.session->stylusButton(kPenSid, &guid, true).has_value());
    REQUIRE(rig.manager.pump().has_value());
    auto events = rig.manager.events();
    CHECK(TabletSpaceTestHelper::labels(events) == std::vector<std::string>{"tool:Button", "tool:Frame"});
    auto const* button = TabletSpaceTestHelper::findTool<ToolButton>(events);
    REQUIRE(button != nullptr);
    CHECK(button->button == ButtonId::fromGuid(guid));
    CHECK(button->pressed);

    auto nullGuid = rig.session->stylusButton(kPenSid, nullptr, false);
    REQUIRE_FALSE(nullGuid.has_value());
    CHECK(nullGuid.error().code == Error::Code::NullPointer);
    CHECK_FALSE(rig.session->poisoned());
}

TEST_CASE("Malformed packet buffers are refused without poisoning") {
    InkRig              rig;
    InkStylusInfo const pen{1, kPenSid};
    std::vector<std::int32_t> const huge(InkSession::kMaxPacketWords + 1, 0);
    auto                           refused = rig.session->packets(&pen, 1, static_cast<std::uint32_t>(huge.size()), huge.data());
    REQUIRE_FALSE(refused.has_value());
    CHECK(refused.error().code == Error::Code::InvalidArgument);

    auto noStylus = rig.session->stylusDown(nullptr, 0, nullptr);
    REQUIRE_FALSE(noStylus.has_value());
    CHECK(noStylus.error().code == Error::Code::NullPointer);
    CHECK_FALSE(rig.session->poisoned());
}

TEST_CASE("A desynchronised tablet list poisons the session until the next pump") {
    InkRig rig;
    REQUIRE(rig.session->tabletAdded(1).has_value());
    REQUIRE(rig.manager.pump().has_value());

    SUBCASE("Too many tablets") {
        std::array<std::uint32_t, 9> const tcids{1, 2, 3, 1, 2, 3, 1, 2, 3};
        auto                               enabled = rig.session->realTimeStylusEnabled(9, tcids.data());
        REQUIRE_FALSE(enabled.has_value());
        CHECK(enabled.error().code == Error::Code::InvalidArgument);
    }
    SUBCASE("Unknown tablet index") {
        auto removed = rig.session->tabletRemoved(4);
        REQUIRE_FALSE(removed.has_value());
        CHECK(removed.error().code == Error::Code::InvalidArgument);
    }
    SUBCASE("Tablet the stylus cannot describe") {
        CHECK_FALSE(rig.session->tabletAdded(77).has_value());
    }
    REQUIRE(rig.session->poisoned());

    // Everything is refused until recovery.
    auto refused = rig.session->tabletAdded(2);
    REQUIRE_FALSE(refused.has_value());
    CHECK(refused.error().code == Error::Code::Poisoned);

    auto recovered = rig.manager.pump();
    REQUIRE_FALSE(recovered.has_value());
    CHECK(recovered.error().code == Error::Code::Poisoned);
    CHECK(*rig.calls == std::vector<std::string>{"disable", "clear", "enable"});
    CHECK_FALSE(rig.session->poisoned());
    CHECK(rig.manager.tablets().empty());
    CHECK(rig.manager.tools().empty());
    CHECK(rig.manager.events().empty());

    // The restarted stylus announces its tablets again.
    std::array<std::uint32_t, 1> const tcids{1};
    REQUIRE(rig.session->realTimeStylusEnabled(1, tcids.data()).has_value());
    REQUIRE(rig.manager.pump().has_value());
    CHECK(rig.manager.tablets().size() == 1);
}

TEST_CASE("Failed recovery keeps the session poisoned") {
    InkRig rig;
    rig.session->poison();
    rig.host->failDisable = true;

    auto failed = rig.manager.pump();
    REQUIRE_FALSE(failed.has_value());
    CHECK(failed.error().code == Error::Code::UnknownError);
    CHECK(rig.session->poisoned());
    CHECK(*rig.calls == std::vector<std::string>{"disable"});

    rig.host->failDisable = false;
    auto retried          = rig.manager.pump();
    REQUIRE_FALSE(retried.has_value());
    CHECK(retried.error().code == Error::Code::Poisoned);
    CHECK_FALSE(rig.session->poisoned());
}

TEST_CASE("An exception out of a stylus callback poisons the session") {
    InkRig rig;
    REQUIRE(rig.session->tabletAdded(1).has_value());
    REQUIRE(rig.manager.pump().has_value());
    REQUIRE(rig.manager.tablets().size() == 1);

    SUBCASE("Standard exception") {
        rig.host->onQuery = [] { throw std::runtime_error{"cursor query failed"}; };
    }
    SUBCASE("Value of any other type") {
        rig.host->onQuery = [] { throw 42; };
    }

    // The stylus is new, so its cursor is queried and the query throws.
    InkStylusInfo const pen{1, kPenSid};
    auto const          down   = packet(5, 5, 300, 1, StatusWord::DOWN);
    auto                thrown = rig.session->stylusDown(&pen, 5, down.data());
    REQUIRE_FALSE(thrown.has_value());
    CHECK(thrown.error().code == Error::Code::UnknownError);
    CHECK(rig.session->poisoned());

    rig.host->onQuery = nullptr;
    auto const hover   = packet(6, 6, 0, 2);
    auto       refused = rig.session->inAirPackets(&pen, 1, 5, hover.data());
    REQUIRE_FALSE(refused.has_value());
    CHECK(refused.error().code == Error::Code::Poisoned);

    auto recovered = rig.manager.pump();
    REQUIRE_FALSE(recovered.has_value());
    CHECK(recovered.error().code == Error::Code::Poisoned);
    CHECK(rig.manager.tablets().empty());
    CHECK(rig.manager.tools().empty());
    CHECK(rig.manager.pads().empty());
    CHECK(rig.manager.events().empty());
}

TEST_CASE("A tablet query that throws poisons the session") {
    InkRig rig;
    rig.host->onQuery = [] { throw std::string{"driver gone"}; };
    auto added        = rig.session->tabletAdded(1);
    REQUIRE_FALSE(added.has_value());
    CHECK(added.error().code == Error::Code::UnknownError);
    CHECK(rig.session->poisoned());

    rig.host->onQuery = nullptr;
    auto recovered    = rig.manager.pump();
    REQUIRE_FALSE(recovered.has_value());
    CHECK(recovered.error().code == Error::Code::Poisoned);
    CHECK(rig.manager.tablets().empty());
}

TEST_CASE("A host may call back into the session while describing a cursor") {
    InkRig rig;
    REQUIRE(rig.session->tabletAdded(1).has_value());

    int  queries  = 0;
    bool remapped = false;
    rig.host->onQuery = [&] {
        ++queries;
        remapped = rig.session->updateMapping().has_value();
    };

    InkStylusInfo const pen{1, kPenSid};
    auto const          hover = packet(3, 4, 0, 5);
    REQUIRE(rig.session->inAirPackets(&pen, 1, 5, hover.data()).has_value());
    CHECK(queries == 1);
    CHECK(remapped);

    // Known styluses are not looked up again.
    auto const moved = packet(4, 5, 0, 6);
    REQUIRE(rig.session->inAirPackets(&pen, 1, 5, moved.data()).has_value());
    CHECK(queries == 1);

    REQUIRE(rig.manager.pump().has_value());
    CHECK(TabletSpaceTestHelper::labels(rig.manager.events())
          == std::vector<std::string>{"tablet:Added", "tool:Added", "tool:In", "tool:Pose", "tool:Frame", "tool:Pose", "tool:Frame"});
}

TEST_CASE("Dropping the platform detaches the stylus") {
    auto calls = std::make_shared<std::vector<std::string>>();
    {
        InkRig rig;
        calls = rig.calls;
    }
    CHECK(*calls == std::vector<std::string>{"shutdown"});
}

} // TEST_SUITE
