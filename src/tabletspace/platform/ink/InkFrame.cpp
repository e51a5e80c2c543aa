#include "platform/ink/InkFrame.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>

namespace TS {

auto tcidOf(InkFrame::TabletSlot const& slot) -> std::uint32_t {
    return std::visit([](auto const& s) { return s.tcid; }, slot);
}

auto InkFrame::appendTablet(InkPacketLayout const& layout, std::uint32_t tcid, InkTabletInfo const& info) -> void {
    if (info.properties) {
        auto interpreter = makeInterpreter(layout, *info.properties);
        if (interpreter) {
            InkId const id{InkKind::Tablet, tcid, std::nullopt};
            slots_.emplace_back(ConcreteTablet{std::move(interpreter->first), interpreter->second, tcid});
            tablets_.push_back(Tablet{id, info.name, std::nullopt});
            events_.emplace_back(RawTabletRecord<InkId>{id, TabletAdded{}});
            return;
        }
        ts_log("Tablet " + std::to_string(tcid) + " has no usable packet description: " + describeError(interpreter.error()), "Ink");
    }
    slots_.emplace_back(DummyTablet{tcid});
}

auto InkFrame::isPendingDeletion_(std::size_t physical) const -> bool {
    return std::binary_search(deletions_.begin(), deletions_.end(), physical);
}

auto InkFrame::deleteTabletByIndex(std::int32_t index) -> Expected<void> {
    if (index < 0 || static_cast<std::size_t>(index) >= slots_.size() - deletions_.size())
        return std::unexpected(Error{Error::Code::InvalidArgument, "tablet index out of range"});

    auto logical = static_cast<std::size_t>(index);
    for (std::size_t physical = 0; physical < slots_.size(); ++physical) {
        auto const at = std::lower_bound(deletions_.begin(), deletions_.end(), physical);
        if (at != deletions_.end() && *at == physical)
            continue;
        if (logical-- != 0)
            continue;
        deletions_.insert(at, physical);
        // Dummy slots never had a public tablet.
        if (std::holds_alternative<ConcreteTablet>(slots_[physical]))
            events_.emplace_back(RawTabletRecord<InkId>{InkId{InkKind::Tablet, tcidOf(slots_[physical]), std::nullopt}, TabletRemoved{}});
        return {};
    }
    return std::unexpected(Error{Error::Code::InvalidArgument, "tablet index out of range"});
}

auto InkFrame::findTool_(std::uint32_t sid) -> Tool* {
    for (auto& tool : tools_) {
        auto const* id = tool.internalId.as<InkId>();
        if (id && id->kind == InkKind::Stylus && id->value == sid)
            return &tool;
    }
    return nullptr;
}

auto InkFrame::hasTool(std::uint32_t sid) const -> bool {
    return std::any_of(tools_.begin(), tools_.end(), [&](Tool const& tool) {
        auto const* id = tool.internalId.as<InkId>();
        return id && id->kind == InkKind::Stylus && id->value == sid;
    });
}

auto InkFrame::toolFor_(std::uint32_t sid, InkCursorInfo const* cursor) -> Tool* {
    if (auto* tool = this->findTool_(sid))
        return tool;
    if (!cursor)
        return nullptr;

    // A tip and its eraser are separate cursors with unrelated ids.
    Tool tool;
    tool.internalId = InkId{InkKind::Stylus, sid, cursor->cursorId};
    tool.name       = cursor->name;
    if (cursor->cursorId)
        tool.hardwareId = static_cast<std::uint64_t>(*cursor->cursorId);
    if (cursor->inverted)
        tool.type = *cursor->inverted ? ToolType::Eraser : ToolType::Pen;
    tools_.push_back(std::move(tool));
    auto& added = tools_.back();
    this->push_(*added.internalId.as<InkId>(), ToolAdded{});
    return &added;
}

auto InkFrame::liveTablet_(std::uint32_t tcid) const -> ConcreteTablet const* {
    for (std::size_t physical = 0; physical < slots_.size(); ++physical) {
        if (this->isPendingDeletion_(physical) || tcidOf(slots_[physical]) != tcid)
            continue;
        // A dummy slot shadows anything behind it with the same tcid.
        return std::get_if<ConcreteTablet>(&slots_[physical]);
    }
    return nullptr;
}

auto InkFrame::push_(InkId const& tool, RawToolEvent<InkId> event) -> void {
    events_.emplace_back(RawToolRecord<InkId>{tool, std::move(event)});
}

auto InkFrame::handlePackets(InkStylusInfo const& stylus, InkCursorInfo const* cursor, std::uint32_t packetCount, std::span<std::int32_t const> words, StylusPhase phase) -> void {
    auto* tool = this->toolFor_(stylus.sid, cursor);
    if (!tool)
        return;
    // Packets of unknown or unreadable tablets cannot be interpreted.
    auto const* tablet = this->liveTablet_(stylus.tcid);
    if (!tablet)
        return;

    InkId const toolId = *tool->internalId.as<InkId>();
    InkId const tabletId{InkKind::Tablet, stylus.tcid, std::nullopt};

    std::optional<StylusPhase> previous;
    if (auto it = phases_.find(stylus.sid); it != phases_.end())
        previous = it->second;
    if (!previous)
        tool->axes = tool->axes.unionWith(tablet->axes);

    bool needsFrame = false;
    for (auto step : phaseTransition(previous, phase)) {
        switch (step) {
        case PhaseStep::In:
            this->push_(toolId, RawToolIn<InkId>{tabletId});
            break;
        case PhaseStep::Down:
            this->push_(toolId, ToolDown{});
            break;
        case PhaseStep::Up:
            this->push_(toolId, ToolUp{});
            break;
        case PhaseStep::Out:
            this->push_(toolId, ToolOut{});
            break;
        }
        needsFrame = true;
    }
    phases_[stylus.sid] = phase;

    if (packetCount > 0) {
        for (auto const& packet : decodePackets(tablet->interpreter, himetricToPx_, words, words.size() / packetCount)) {
            this->push_(toolId, ToolPose{packet.pose});
            this->push_(toolId, ToolFrame{packet.timestamp});
            needsFrame = false;
        }
    }
    // Phase changes with no decodable packet behind them.
    if (needsFrame)
        this->push_(toolId, ToolFrame{std::nullopt});
}

auto InkFrame::stylusOutOfRange(std::uint32_t sid) -> void {
    auto* tool = this->findTool_(sid);
    if (!tool)
        return;
    std::optional<StylusPhase> previous;
    if (auto it = phases_.find(sid); it != phases_.end()) {
        previous = it->second;
        phases_.erase(it);
    }
    InkId const toolId = *tool->internalId.as<InkId>();
    auto const  steps  = outOfRangeTransition(previous);
    for (auto step : steps) {
        if (step == PhaseStep::Up)
            this->push_(toolId, ToolUp{});
        else if (step == PhaseStep::Out)
            this->push_(toolId, ToolOut{});
    }
    if (!steps.empty())
        this->push_(toolId, ToolFrame{std::nullopt});
}

auto InkFrame::stylusButton(std::uint32_t sid, ButtonId button, bool pressed) -> void {
    auto* tool = this->findTool_(sid);
    if (!tool || phases_.find(sid) == phases_.end())
        return;
    InkId const toolId = *tool->internalId.as<InkId>();
    this->push_(toolId, ToolButton{button, pressed});
    this->push_(toolId, ToolFrame{std::nullopt});
}

auto InkFrame::frameEndCleanup() -> void {
    events_.clear();
    // Highest first so the remaining indices stay put.
    for (auto it = deletions_.rbegin(); it != deletions_.rend(); ++it) {
        auto const slot = slots_.begin() + static_cast<std::ptrdiff_t>(*it);
        if (std::holds_alternative<ConcreteTablet>(*slot)) {
            InkId const id{InkKind::Tablet, tcidOf(*slot), std::nullopt};
            auto        tablet = std::find_if(tablets_.begin(), tablets_.end(), [&](Tablet const& t) { return idMatches(t.internalId, id); });
            if (tablet != tablets_.end())
                tablets_.erase(tablet);
        }
        slots_.erase(slot);
    }
    deletions_.clear();
}

auto InkFrame::reset() -> void {
    phases_.clear();
    tools_.clear();
    deletions_.clear();
    slots_.clear();
    tablets_.clear();
    events_.clear();
}

} // namespace TS
