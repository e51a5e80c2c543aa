#include "events/EventResolver.hpp"

#include <doctest/doctest.h>

#include <numbers>
#include <sstream>
#include <vector>

using namespace TS;

namespace {

struct Tables {
    std::vector<Tool>   tools;
    std::vector<Tablet> tablets;
    std::vector<Pad>    pads;

    [[nodiscard]] auto view() const -> DeviceView { return DeviceView{tools, tablets, pads}; }
};

auto makeTables() -> Tables {
    Tables t;
    Tool tool;
    tool.internalId = WaylandId{1};
    t.tools.push_back(tool);

    Tablet tablet;
    tablet.internalId = WaylandId{2};
    tablet.name       = "Intuos";
    t.tablets.push_back(tablet);

    PadGroup group;
    group.internalId = WaylandId{11};
    group.buttons    = {0, 1};
    group.rings.push_back(Ring{WaylandId{12}, std::nullopt});
    group.strips.push_back(Strip{WaylandId{13}, std::nullopt});
    Pad pad;
    pad.internalId   = WaylandId{10};
    pad.totalButtons = 4;
    pad.groups.push_back(group);
    t.pads.push_back(pad);
    return t;
}

} // namespace

TEST_SUITE("events.resolver") {

TEST_CASE("Tool In resolves the tablet") {
    auto const tables = makeTables();
    RawEvent<WaylandId> raw = RawToolRecord<WaylandId>{WaylandId{1}, RawToolIn<WaylandId>{WaylandId{2}}};
    auto event = resolveEvent(raw, tables.view());
    REQUIRE(event.has_value());
    auto const& update = std::get<ToolUpdate>(*event);
    CHECK(update.tool == &tables.tools[0]);
    CHECK(std::get<ToolIn>(update.event).tablet == &tables.tablets[0]);
}

TEST_CASE("Events for unknown objects are skipped") {
    auto const tables = makeTables();
    std::vector<RawEvent<WaylandId>> raw{
            RawToolRecord<WaylandId>{WaylandId{99}, ToolDown{}},
            RawToolRecord<WaylandId>{WaylandId{1}, RawToolIn<WaylandId>{WaylandId{98}}},
            RawTabletRecord<WaylandId>{WaylandId{2}, TabletAdded{}},
            RawPadRecord<WaylandId>{WaylandId{97}, PadAdded{}},
    };
    auto events = resolveAll(std::span<RawEvent<WaylandId> const>{raw}, tables.view());
    REQUIRE(events.size() == 1);
    CHECK(std::holds_alternative<TabletUpdate>(events[0]));
}

TEST_CASE("Ring and strip updates resolve through their group") {
    auto const tables = makeTables();
    RawEvent<WaylandId> ring = RawPadRecord<WaylandId>{
            WaylandId{10}, RawPadGroupUpdate<WaylandId>{WaylandId{11}, RawRingUpdate<WaylandId>{WaylandId{12}, TouchPose{1.0f}}}};
    auto event = resolveEvent(ring, tables.view());
    REQUIRE(event.has_value());
    auto const& groupUpdate = std::get<PadGroupUpdate>(std::get<PadUpdate>(*event).event);
    CHECK(groupUpdate.group == &tables.pads[0].groups[0]);
    CHECK(std::get<RingUpdate>(groupUpdate.event).ring == &tables.pads[0].groups[0].rings[0]);

    // A strip id sent as a ring does not resolve.
    RawEvent<WaylandId> wrong = RawPadRecord<WaylandId>{
            WaylandId{10}, RawPadGroupUpdate<WaylandId>{WaylandId{11}, RawRingUpdate<WaylandId>{WaylandId{13}, TouchUp{}}}};
    CHECK_FALSE(resolveEvent(wrong, tables.view()).has_value());

    RawEvent<WaylandId> strip = RawPadRecord<WaylandId>{
            WaylandId{10}, RawPadGroupUpdate<WaylandId>{WaylandId{11}, RawStripUpdate<WaylandId>{WaylandId{13}, TouchUp{}}}};
    CHECK(resolveEvent(strip, tables.view()).has_value());
}

TEST_CASE("Pad buttons find their owning group") {
    auto const tables = makeTables();
    RawEvent<WaylandId> owned = RawPadRecord<WaylandId>{WaylandId{10}, RawPadButton{1, true}};
    auto                event = resolveEvent(owned, tables.view());
    REQUIRE(event.has_value());
    auto const& button = std::get<PadButton>(std::get<PadUpdate>(*event).event);
    CHECK(button.group == &tables.pads[0].groups[0]);
    CHECK(button.pressed);

    RawEvent<WaylandId> orphan = RawPadRecord<WaylandId>{WaylandId{10}, RawPadButton{3, false}};
    event                      = resolveEvent(orphan, tables.view());
    REQUIRE(event.has_value());
    CHECK(std::get<PadButton>(std::get<PadUpdate>(*event).event).group == nullptr);
}

TEST_CASE("Pad enter resolves the tablet") {
    auto const tables = makeTables();
    RawEvent<WaylandId> enter = RawPadRecord<WaylandId>{WaylandId{10}, RawPadEnter<WaylandId>{WaylandId{2}}};
    auto                event = resolveEvent(enter, tables.view());
    REQUIRE(event.has_value());
    CHECK(std::get<PadEnter>(std::get<PadUpdate>(*event).event).tablet == &tables.tablets[0]);
}

TEST_CASE("Resolved events print") {
    auto const tables = makeTables();
    RawEvent<WaylandId> raw = RawToolRecord<WaylandId>{WaylandId{1}, ToolFrame{FrameTimestamp::fromMillis(3)}};
    auto event = resolveEvent(raw, tables.view());
    REQUIRE(event.has_value());
    std::ostringstream oss;
    oss << *event;
    CHECK_FALSE(oss.str().empty());
}

} // TEST_SUITE

TEST_SUITE("events.ring_delta") {

TEST_CASE("Shortest way around wins") {
    CHECK(ringDelta(0.1f, 0.3f) == doctest::Approx(0.2f));
    CHECK(ringDelta(0.3f, 0.1f) == doctest::Approx(-0.2f));
    // Crossing zero forwards and backwards.
    CHECK(ringDelta(6.2f, 0.1f) == doctest::Approx(0.1f + 2.0f * std::numbers::pi_v<float> - 6.2f).epsilon(1e-4));
    CHECK(ringDelta(0.1f, 6.2f) == doctest::Approx(-(0.1f + 2.0f * std::numbers::pi_v<float> - 6.2f)).epsilon(1e-4));
    CHECK(ringDelta(1.0f, 1.0f) == doctest::Approx(0.0f));
}

} // TEST_SUITE

TEST_SUITE("events.button_id") {

TEST_CASE("Codes and GUIDs occupy distinct ranges") {
    CHECK(ButtonId::fromCode(0x14b) == ButtonId{0, 0x14b});
    std::array<std::uint8_t, 16> guid{};
    guid[0]  = 0xAB;
    guid[15] = 0x01;
    auto id  = ButtonId::fromGuid(guid);
    CHECK(id.high == 0xAB00000000000000ull);
    CHECK(id.low == 0x01ull);
}

} // TEST_SUITE
