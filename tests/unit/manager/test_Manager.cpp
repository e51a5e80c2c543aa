#include "Builder.hpp"
#include "Manager.hpp"
#include "platform/Platform.hpp"
#include "../TabletSpaceTestHelper.hpp"

#include <doctest/doctest.h>

#include <memory>
#include <string>
#include <vector>

using namespace TS;

namespace {

using Journal = std::shared_ptr<std::vector<std::string>>;

// Fixed tables and raw events, standing in for a native backend.
class FakePlatform final : public Platform {
public:
    FakePlatform(std::string name, Journal journal) : name(std::move(name)), journal(std::move(journal)) {
        Tool tool;
        tool.internalId = WaylandId{1};
        tool.type       = ToolType::Pencil;
        this->toolTable.push_back(tool);

        Tablet tablet;
        tablet.internalId = WaylandId{2};
        this->tabletTable.push_back(tablet);
    }
    ~FakePlatform() override { this->journal->push_back("platform " + this->name); }

    auto pump() -> Expected<void> override {
        ++this->pumps;
        this->raw = {
                RawToolRecord<WaylandId>{WaylandId{1}, RawToolIn<WaylandId>{WaylandId{2}}},
                RawToolRecord<WaylandId>{WaylandId{9}, ToolDown{}},
                RawToolRecord<WaylandId>{WaylandId{1}, ToolFrame{FrameTimestamp::fromMillis(this->pumps)}},
        };
        if (this->failNext)
            return std::unexpected(Error{Error::Code::ProtocolViolation, "bad message"});
        return {};
    }

    [[nodiscard]] auto tools() const -> std::span<Tool const> override { return this->toolTable; }
    [[nodiscard]] auto tablets() const -> std::span<Tablet const> override { return this->tabletTable; }
    [[nodiscard]] auto pads() const -> std::span<Pad const> override { return {}; }
    [[nodiscard]] auto rawEvents() const -> RawEventSpan override { return std::span<RawEvent<WaylandId> const>{this->raw}; }
    [[nodiscard]] auto timestampGranularity() const -> std::optional<std::chrono::microseconds> override { return std::nullopt; }
    [[nodiscard]] auto backend() const -> Backend override { return Backend::Wayland; }

    bool failNext = false;

private:
    std::string                      name;
    Journal                          journal;
    std::uint64_t                    pumps = 0;
    std::vector<Tool>                toolTable;
    std::vector<Tablet>              tabletTable;
    std::vector<RawEvent<WaylandId>> raw;
};

// Handle owner that notes when it is released.
auto trackedHandle(std::string name, Journal journal) -> std::shared_ptr<void> {
    return std::shared_ptr<void>(new int{0}, [name = std::move(name), journal = std::move(journal)](void* p) {
        journal->push_back("handle " + name);
        delete static_cast<int*>(p);
    });
}

} // namespace

TEST_SUITE("manager") {

TEST_CASE("Events are resolved against the current tables") {
    auto    journal = std::make_shared<std::vector<std::string>>();
    Manager manager{std::make_unique<FakePlatform>("a", journal)};
    CHECK(manager.events().empty());
    REQUIRE(manager.pump().has_value());

    auto events = manager.events();
    // The Down for an unknown tool is skipped.
    CHECK(TabletSpaceTestHelper::labels(events) == std::vector<std::string>{"tool:In", "tool:Frame"});
    auto const& in = std::get<ToolUpdate>(events[0]);
    CHECK(in.tool == &manager.tools()[0]);
    CHECK(std::get<ToolIn>(in.event).tablet == &manager.tablets()[0]);
    CHECK(TabletSpaceTestHelper::toolLabels(events, &manager.tools()[0]) == std::vector<std::string>{"In", "Frame"});
    CHECK_FALSE(manager.timestampGranularity().has_value());
    CHECK(manager.backend() == Backend::Wayland);
}

TEST_CASE("Pump errors are passed through") {
    auto journal  = std::make_shared<std::vector<std::string>>();
    auto platform = std::make_unique<FakePlatform>("a", journal);
    auto* fake    = platform.get();
    Manager manager{std::move(platform)};
    fake->failNext = true;
    auto pumped    = manager.pump();
    REQUIRE_FALSE(pumped.has_value());
    CHECK(pumped.error().code == Error::Code::ProtocolViolation);
    CHECK(manager.tools().size() == 1);
}

TEST_CASE("A Manager without a backend reports a transport failure") {
    Manager manager{nullptr};
    auto    pumped = manager.pump();
    REQUIRE_FALSE(pumped.has_value());
    CHECK(pumped.error().code == Error::Code::TransportFailure);
    CHECK(manager.tools().empty());
    CHECK(manager.tablets().empty());
    CHECK(manager.pads().empty());
    CHECK(manager.events().empty());
    CHECK_FALSE(manager.timestampGranularity().has_value());
}

TEST_CASE("The backend is dropped before the handle it uses") {
    auto journal = std::make_shared<std::vector<std::string>>();
    {
        Manager manager{std::make_unique<FakePlatform>("a", journal), trackedHandle("a", journal)};
        REQUIRE(manager.pump().has_value());
    }
    CHECK(*journal == std::vector<std::string>{"platform a", "handle a"});
}

TEST_CASE("Move assignment releases the old backend first") {
    auto    journal = std::make_shared<std::vector<std::string>>();
    Manager first{std::make_unique<FakePlatform>("a", journal), trackedHandle("a", journal)};
    Manager second{std::make_unique<FakePlatform>("b", journal), trackedHandle("b", journal)};

    first = std::move(second);
    CHECK(*journal == std::vector<std::string>{"platform a", "handle a"});
    REQUIRE(first.pump().has_value());
    CHECK(first.tools().size() == 1);

    Manager third{std::move(first)};
    CHECK(third.pump().has_value());
    CHECK(first.tools().empty());
}

} // TEST_SUITE

TEST_SUITE("builder") {

TEST_CASE("Wayland handles") {
    auto built = Builder{}.buildRaw(WaylandDisplayHandle{nullptr});
    REQUIRE_FALSE(built.has_value());
#if defined(TABLETSPACE_BACKEND_WAYLAND)
    CHECK(built.error().code == Error::Code::HandleError);
#else
    CHECK(built.error().code == Error::Code::NotSupported);
    CHECK(built.error().message == "Wayland backend not compiled in");
#endif
}

TEST_CASE("Xlib handles") {
    auto built = Builder{}.xinput2Heuristics(XInput2Heuristics::defaults()).buildRaw(XlibWindowHandle{nullptr, 0});
    REQUIRE_FALSE(built.has_value());
#if defined(TABLETSPACE_BACKEND_XINPUT2)
    CHECK(built.error().code == Error::Code::HandleError);
#else
    CHECK(built.error().code == Error::Code::NotSupported);
#endif
}

#if !(defined(_WIN32) && defined(TABLETSPACE_BACKEND_INK))
TEST_CASE("Win32 handles need the Ink backend") {
    auto owner = std::make_shared<int>(0);
    auto built = Builder{}.emulateToolFromMouse(true).buildShared(owner, Win32WindowHandle{nullptr});
    REQUIRE_FALSE(built.has_value());
    CHECK(built.error().code == Error::Code::NotSupported);
    // A failed build does not hold on to the owner.
    CHECK(owner.use_count() == 1);
}
#endif

} // TEST_SUITE
