#include "events/Events.hpp"

#include <cmath>
#include <iomanip>

namespace TS {

auto ButtonId::fromGuid(std::array<std::uint8_t, 16> const& guid) -> ButtonId {
    ButtonId id;
    for (std::size_t i = 0; i < 8; ++i) {
        id.high = (id.high << 8) | guid[i];
        id.low  = (id.low << 8) | guid[i + 8];
    }
    return id;
}

auto ringDelta(float from, float to) -> float {
    constexpr float tau = 2.0f * kPi;
    float const     candidates[] = {to - (from - tau), to - from, to - (from + tau)};
    float           nearest      = candidates[0];
    for (float candidate : candidates)
        if (std::abs(candidate) < std::abs(nearest))
            nearest = candidate;
    return nearest;
}

auto operator<<(std::ostream& os, ButtonId const& button) -> std::ostream& {
    if (button.high == 0)
        return os << "button:" << button.low;
    auto const flags = os.flags();
    os << "button:" << std::hex << std::setfill('0') << std::setw(16) << button.high << std::setw(16) << button.low;
    os.flags(flags);
    return os;
}

namespace {
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

auto printTimestamp(std::ostream& os, std::optional<FrameTimestamp> const& ts) -> void {
    if (ts)
        os << "@" << *ts;
    else
        os << "@?";
}
} // namespace

auto operator<<(std::ostream& os, ToolEvent const& event) -> std::ostream& {
    std::visit(Overloaded{
                       [&](ToolAdded const&) { os << "Added"; },
                       [&](ToolRemoved const&) { os << "Removed"; },
                       [&](ToolIn const& in) {
                           os << "In";
                           if (in.tablet)
                               os << "(" << in.tablet->internalId << ")";
                       },
                       [&](ToolDown const&) { os << "Down"; },
                       [&](ToolButton const& b) { os << "Button(" << b.button << ", " << (b.pressed ? "pressed" : "released") << ")"; },
                       [&](ToolPose const& p) { os << p.pose; },
                       [&](ToolFrame const& f) {
                           os << "Frame";
                           printTimestamp(os, f.timestamp);
                       },
                       [&](ToolUp const&) { os << "Up"; },
                       [&](ToolOut const&) { os << "Out"; },
               },
               event);
    return os;
}

auto operator<<(std::ostream& os, TouchStripEvent const& event) -> std::ostream& {
    std::visit(Overloaded{
                       [&](TouchPose const& p) { os << "Pose(" << p.value << ")"; },
                       [&](TouchSourceChanged const& s) { os << "Source(" << (s.source == TouchSource::Finger ? "finger" : "unknown") << ")"; },
                       [&](TouchFrame const& f) {
                           os << "Frame";
                           printTimestamp(os, f.timestamp);
                       },
                       [&](TouchUp const&) { os << "Up"; },
               },
               event);
    return os;
}

auto operator<<(std::ostream& os, Event const& event) -> std::ostream& {
    std::visit(Overloaded{
                       [&](ToolUpdate const& t) { os << "Tool " << t.tool->internalId << " " << t.event; },
                       [&](TabletUpdate const& t) {
                           os << "Tablet " << t.tablet->internalId << " " << (std::holds_alternative<TabletAdded>(t.event) ? "Added" : "Removed");
                       },
                       [&](PadUpdate const& p) {
                           os << "Pad " << p.pad->internalId << " ";
                           std::visit(Overloaded{
                                              [&](PadAdded const&) { os << "Added"; },
                                              [&](PadRemoved const&) { os << "Removed"; },
                                              [&](PadButton const& b) {
                                                  os << "Button(" << b.button << ", " << (b.pressed ? "pressed" : "released") << ")";
                                              },
                                              [&](PadEnter const& e) {
                                                  os << "Enter";
                                                  if (e.tablet)
                                                      os << "(" << e.tablet->internalId << ")";
                                              },
                                              [&](PadExit const&) { os << "Exit"; },
                                              [&](PadGroupUpdate const& g) {
                                                  os << "Group " << g.group->internalId << " ";
                                                  std::visit(Overloaded{
                                                                     [&](RingUpdate const& r) { os << "Ring " << r.ring->internalId << " " << r.event; },
                                                                     [&](StripUpdate const& s) { os << "Strip " << s.strip->internalId << " " << s.event; },
                                                                     [&](GroupMode const& m) { os << "Mode(" << m.mode << ")"; },
                                                             },
                                                             g.event);
                                              },
                                      },
                                      p.event);
                       },
               },
               event);
    return os;
}

} // namespace TS
