#include "platform/wayland/WaylandPlatform.hpp"
#include "platform/wayland/WaylandProxyTable.hpp"
#include "log/TaggedLogger.hpp"

#include <wayland-client.h>

#include "tablet-unstable-v2-client-protocol.h"

#include <poll.h>

#include <cerrno>
#include <cstring>
#include <string>

namespace TS {

namespace {

// Protocol destructors, in the shape the proxy table stores.
template <typename Proxy, void (*Destructor)(Proxy*)>
void destroyProxy(void* proxy) {
    Destructor(static_cast<Proxy*>(proxy));
}

/**
 * libwayland-client adapter. Proxies are created on a private queue; their
 * handles live in a WaylandProxyTable.
 */
class WaylandClientConnection final : public WaylandConnection {
public:
    explicit WaylandClientConnection(wl_display* display) : display_(display) {}

    ~WaylandClientConnection() override {
        // Device proxies go before the seat and queue they were created on.
        proxies_.clear();
        if (tabletSeat_)
            zwp_tablet_seat_v2_destroy(tabletSeat_);
        if (manager_)
            zwp_tablet_manager_v2_destroy(manager_);
        if (seat_)
            wl_seat_destroy(seat_);
        if (registry_)
            wl_registry_destroy(registry_);
        if (wrapper_)
            wl_proxy_wrapper_destroy(wrapper_);
        if (queue_)
            wl_event_queue_destroy(queue_);
    }

    auto initialize() -> Expected<void> {
        queue_   = wl_display_create_queue(display_);
        wrapper_ = static_cast<wl_display*>(wl_proxy_create_wrapper(display_));
        if (!queue_ || !wrapper_)
            return std::unexpected(Error{Error::Code::TransportFailure, "failed to create wayland event queue"});
        wl_proxy_set_queue(reinterpret_cast<wl_proxy*>(wrapper_), queue_);
        registry_ = wl_display_get_registry(wrapper_);
        if (!registry_)
            return std::unexpected(Error{Error::Code::TransportFailure, "failed to get wayland registry"});
        wl_registry_add_listener(registry_, &registryListener, this);
        return {};
    }

    auto dispatchPending(WaylandTabletState& state) -> Expected<void> override {
        sink_ = &state;
        auto result = this->dispatch_();
        sink_       = nullptr;
        return result;
    }

private:
    auto dispatch_() -> Expected<void> {
        if (!announced_) {
            // Globals first, then the bursts describing the devices present at startup.
            if (wl_display_roundtrip_queue(display_, queue_) < 0 || wl_display_roundtrip_queue(display_, queue_) < 0)
                return std::unexpected(this->failure_("initial roundtrip"));
            announced_ = true;
        }
        while (wl_display_prepare_read_queue(display_, queue_) != 0) {
            if (wl_display_dispatch_queue_pending(display_, queue_) < 0)
                return std::unexpected(this->failure_("dispatch"));
        }
        if (wl_display_flush(display_) < 0 && errno != EAGAIN) {
            wl_display_cancel_read(display_);
            return std::unexpected(this->failure_("flush"));
        }
        pollfd fd{wl_display_get_fd(display_), POLLIN, 0};
        if (::poll(&fd, 1, 0) > 0 && (fd.revents & POLLIN)) {
            if (wl_display_read_events(display_) < 0)
                return std::unexpected(this->failure_("read"));
        } else {
            wl_display_cancel_read(display_);
        }
        if (wl_display_dispatch_queue_pending(display_, queue_) < 0)
            return std::unexpected(this->failure_("dispatch"));
        return {};
    }

    auto failure_(char const* stage) -> Error {
        auto const code = wl_display_get_error(display_);
        return Error{Error::Code::TransportFailure, std::string("wayland ") + stage + " failed: " + std::strerror(code != 0 ? code : errno)};
    }

    auto id_(void* proxy) const -> WaylandId { return proxies_.id(proxy); }

    auto release_(void* proxy) -> void { proxies_.release(proxy); }

    static auto self(void* data) -> WaylandClientConnection& { return *static_cast<WaylandClientConnection*>(data); }

    auto acquireTabletSeat_() -> void {
        if (tabletSeat_ || !seat_ || !manager_)
            return;
        tabletSeat_ = zwp_tablet_manager_v2_get_tablet_seat(manager_, seat_);
        zwp_tablet_seat_v2_add_listener(tabletSeat_, &seatListener, this);
    }

    // ---- registry ----
    static void onGlobal(void* data, wl_registry* registry, std::uint32_t name, char const* interface, std::uint32_t) {
        auto& conn = self(data);
        if (std::strcmp(interface, wl_seat_interface.name) == 0 && !conn.seat_) {
            conn.seat_ = static_cast<wl_seat*>(wl_registry_bind(registry, name, &wl_seat_interface, 1));
            conn.acquireTabletSeat_();
        } else if (std::strcmp(interface, zwp_tablet_manager_v2_interface.name) == 0 && !conn.manager_) {
            conn.manager_ = static_cast<zwp_tablet_manager_v2*>(wl_registry_bind(registry, name, &zwp_tablet_manager_v2_interface, 1));
            conn.acquireTabletSeat_();
        }
    }
    static void onGlobalRemove(void*, wl_registry*, std::uint32_t) {}

    // ---- tablet seat ----
    static void onTabletAdded(void* data, zwp_tablet_seat_v2*, zwp_tablet_v2* tablet) {
        self(data).proxies_.track(tablet, destroyProxy<zwp_tablet_v2, zwp_tablet_v2_destroy>);
        zwp_tablet_v2_add_listener(tablet, &tabletListener, data);
    }
    static void onToolAdded(void* data, zwp_tablet_seat_v2*, zwp_tablet_tool_v2* tool) {
        self(data).proxies_.track(tool, destroyProxy<zwp_tablet_tool_v2, zwp_tablet_tool_v2_destroy>);
        zwp_tablet_tool_v2_add_listener(tool, &toolListener, data);
    }
    static void onPadAdded(void* data, zwp_tablet_seat_v2*, zwp_tablet_pad_v2* pad) {
        self(data).proxies_.track(pad, destroyProxy<zwp_tablet_pad_v2, zwp_tablet_pad_v2_destroy>);
        zwp_tablet_pad_v2_add_listener(pad, &padListener, data);
    }

    // ---- tablet ----
    static void onTabletName(void* data, zwp_tablet_v2* tablet, char const* name) {
        auto& conn = self(data);
        conn.sink_->tabletName(conn.id_(tablet), name ? std::string(name) : std::string());
    }
    static void onTabletId(void* data, zwp_tablet_v2* tablet, std::uint32_t vid, std::uint32_t pid) {
        auto& conn = self(data);
        conn.sink_->tabletId(conn.id_(tablet), vid, pid);
    }
    static void onTabletPath(void*, zwp_tablet_v2*, char const*) {}
    static void onTabletDone(void* data, zwp_tablet_v2* tablet) {
        auto& conn = self(data);
        conn.sink_->tabletDone(conn.id_(tablet));
    }
    static void onTabletRemoved(void* data, zwp_tablet_v2* tablet) {
        auto& conn = self(data);
        conn.sink_->tabletRemoved(conn.id_(tablet));
        conn.release_(tablet);
    }

    // ---- tool ----
    static void onToolType(void* data, zwp_tablet_tool_v2* tool, std::uint32_t type) {
        auto& conn = self(data);
        conn.sink_->toolType(conn.id_(tool), static_cast<WaylandToolType>(type));
    }
    static void onToolSerial(void* data, zwp_tablet_tool_v2* tool, std::uint32_t hi, std::uint32_t lo) {
        auto& conn = self(data);
        conn.sink_->toolHardwareSerial(conn.id_(tool), hi, lo);
    }
    static void onToolWacomId(void* data, zwp_tablet_tool_v2* tool, std::uint32_t hi, std::uint32_t lo) {
        auto& conn = self(data);
        conn.sink_->toolHardwareIdWacom(conn.id_(tool), hi, lo);
    }
    static void onToolCapability(void* data, zwp_tablet_tool_v2* tool, std::uint32_t capability) {
        auto& conn = self(data);
        if (capability >= 1 && capability <= 6)
            conn.sink_->toolCapability(conn.id_(tool), static_cast<WaylandToolCapability>(capability));
    }
    static void onToolDone(void* data, zwp_tablet_tool_v2* tool) {
        auto& conn = self(data);
        conn.sink_->toolDone(conn.id_(tool));
    }
    static void onToolRemoved(void* data, zwp_tablet_tool_v2* tool) {
        auto& conn = self(data);
        conn.sink_->toolRemoved(conn.id_(tool));
        conn.release_(tool);
    }
    static void onProximityIn(void* data, zwp_tablet_tool_v2* tool, std::uint32_t, zwp_tablet_v2* tablet, wl_surface*) {
        auto& conn = self(data);
        conn.sink_->toolProximityIn(conn.id_(tool), conn.id_(tablet));
    }
    static void onProximityOut(void* data, zwp_tablet_tool_v2* tool) {
        auto& conn = self(data);
        conn.sink_->toolProximityOut(conn.id_(tool));
    }
    static void onDown(void* data, zwp_tablet_tool_v2* tool, std::uint32_t) {
        auto& conn = self(data);
        conn.sink_->toolDown(conn.id_(tool));
    }
    static void onUp(void* data, zwp_tablet_tool_v2* tool) {
        auto& conn = self(data);
        conn.sink_->toolUp(conn.id_(tool));
    }
    static void onMotion(void* data, zwp_tablet_tool_v2* tool, wl_fixed_t x, wl_fixed_t y) {
        auto& conn = self(data);
        conn.sink_->toolMotion(conn.id_(tool), wl_fixed_to_double(x), wl_fixed_to_double(y));
    }
    static void onPressure(void* data, zwp_tablet_tool_v2* tool, std::uint32_t pressure) {
        auto& conn = self(data);
        conn.sink_->toolPressure(conn.id_(tool), pressure);
    }
    static void onDistance(void* data, zwp_tablet_tool_v2* tool, std::uint32_t distance) {
        auto& conn = self(data);
        conn.sink_->toolDistance(conn.id_(tool), distance);
    }
    static void onTilt(void* data, zwp_tablet_tool_v2* tool, wl_fixed_t x, wl_fixed_t y) {
        auto& conn = self(data);
        conn.sink_->toolTilt(conn.id_(tool), wl_fixed_to_double(x), wl_fixed_to_double(y));
    }
    static void onRotation(void* data, zwp_tablet_tool_v2* tool, wl_fixed_t degrees) {
        auto& conn = self(data);
        conn.sink_->toolRotation(conn.id_(tool), wl_fixed_to_double(degrees));
    }
    static void onSlider(void* data, zwp_tablet_tool_v2* tool, std::int32_t position) {
        auto& conn = self(data);
        conn.sink_->toolSlider(conn.id_(tool), position);
    }
    static void onWheel(void* data, zwp_tablet_tool_v2* tool, wl_fixed_t degrees, std::int32_t clicks) {
        auto& conn = self(data);
        conn.sink_->toolWheel(conn.id_(tool), wl_fixed_to_double(degrees), clicks);
    }
    static void onToolButton(void* data, zwp_tablet_tool_v2* tool, std::uint32_t, std::uint32_t button, std::uint32_t state) {
        auto& conn = self(data);
        conn.sink_->toolButton(conn.id_(tool), button, state == ZWP_TABLET_TOOL_V2_BUTTON_STATE_PRESSED);
    }
    static void onToolFrame(void* data, zwp_tablet_tool_v2* tool, std::uint32_t time) {
        auto& conn = self(data);
        conn.sink_->toolFrame(conn.id_(tool), time);
    }

    // ---- pad ----
    static void onPadGroup(void* data, zwp_tablet_pad_v2* pad, zwp_tablet_pad_group_v2* group) {
        auto& conn    = self(data);
        auto  groupId = conn.proxies_.track(group, destroyProxy<zwp_tablet_pad_group_v2, zwp_tablet_pad_group_v2_destroy>, pad);
        zwp_tablet_pad_group_v2_add_listener(group, &groupListener, data);
        conn.sink_->padGroup(conn.id_(pad), groupId);
    }
    static void onPadPath(void*, zwp_tablet_pad_v2*, char const*) {}
    static void onPadButtons(void* data, zwp_tablet_pad_v2* pad, std::uint32_t buttons) {
        auto& conn = self(data);
        conn.sink_->padButtons(conn.id_(pad), buttons);
    }
    static void onPadDone(void* data, zwp_tablet_pad_v2* pad) {
        auto& conn = self(data);
        conn.sink_->padDone(conn.id_(pad));
    }
    static void onPadButton(void* data, zwp_tablet_pad_v2* pad, std::uint32_t, std::uint32_t button, std::uint32_t state) {
        auto& conn = self(data);
        conn.sink_->padButton(conn.id_(pad), button, state == ZWP_TABLET_PAD_V2_BUTTON_STATE_PRESSED);
    }
    static void onPadEnter(void* data, zwp_tablet_pad_v2* pad, std::uint32_t, zwp_tablet_v2* tablet, wl_surface*) {
        auto& conn = self(data);
        conn.sink_->padEnter(conn.id_(pad), conn.id_(tablet));
    }
    static void onPadLeave(void* data, zwp_tablet_pad_v2* pad, std::uint32_t, wl_surface*) {
        auto& conn = self(data);
        conn.sink_->padLeave(conn.id_(pad));
    }
    static void onPadRemoved(void* data, zwp_tablet_pad_v2* pad) {
        auto& conn = self(data);
        conn.sink_->padRemoved(conn.id_(pad));
        // Takes the pad's groups, rings and strips with it.
        conn.release_(pad);
    }

    // ---- pad group ----
    static void onGroupButtons(void* data, zwp_tablet_pad_group_v2* group, wl_array* buttons) {
        auto& conn  = self(data);
        auto* bytes = static_cast<std::uint8_t const*>(buttons->data);
        conn.sink_->groupButtons(conn.id_(group), std::span<std::uint8_t const>(bytes, buttons->size));
    }
    static void onGroupRing(void* data, zwp_tablet_pad_group_v2* group, zwp_tablet_pad_ring_v2* ring) {
        auto& conn   = self(data);
        auto  ringId = conn.proxies_.track(ring, destroyProxy<zwp_tablet_pad_ring_v2, zwp_tablet_pad_ring_v2_destroy>, group);
        zwp_tablet_pad_ring_v2_add_listener(ring, &ringListener, data);
        conn.sink_->groupRing(conn.id_(group), ringId);
    }
    static void onGroupStrip(void* data, zwp_tablet_pad_group_v2* group, zwp_tablet_pad_strip_v2* strip) {
        auto& conn    = self(data);
        auto  stripId = conn.proxies_.track(strip, destroyProxy<zwp_tablet_pad_strip_v2, zwp_tablet_pad_strip_v2_destroy>, group);
        zwp_tablet_pad_strip_v2_add_listener(strip, &stripListener, data);
        conn.sink_->groupStrip(conn.id_(group), stripId);
    }
    static void onGroupModes(void* data, zwp_tablet_pad_group_v2* group, std::uint32_t modes) {
        auto& conn = self(data);
        conn.sink_->groupModes(conn.id_(group), modes);
    }
    static void onGroupDone(void* data, zwp_tablet_pad_group_v2* group) {
        auto& conn = self(data);
        conn.sink_->groupDone(conn.id_(group));
    }
    static void onGroupModeSwitch(void* data, zwp_tablet_pad_group_v2* group, std::uint32_t, std::uint32_t, std::uint32_t mode) {
        auto& conn = self(data);
        conn.sink_->groupModeSwitch(conn.id_(group), mode);
    }

    // ---- ring / strip ----
    static auto touchSource(std::uint32_t source) -> TouchSource {
        return source == ZWP_TABLET_PAD_RING_V2_SOURCE_FINGER ? TouchSource::Finger : TouchSource::Unknown;
    }
    static void onRingSource(void* data, zwp_tablet_pad_ring_v2* ring, std::uint32_t source) {
        auto& conn = self(data);
        conn.sink_->ringSource(conn.id_(ring), touchSource(source));
    }
    static void onRingAngle(void* data, zwp_tablet_pad_ring_v2* ring, wl_fixed_t degrees) {
        auto& conn = self(data);
        conn.sink_->ringAngle(conn.id_(ring), wl_fixed_to_double(degrees));
    }
    static void onRingStop(void* data, zwp_tablet_pad_ring_v2* ring) {
        auto& conn = self(data);
        conn.sink_->ringStop(conn.id_(ring));
    }
    static void onRingFrame(void* data, zwp_tablet_pad_ring_v2* ring, std::uint32_t time) {
        auto& conn = self(data);
        conn.sink_->ringFrame(conn.id_(ring), time);
    }
    static void onStripSource(void* data, zwp_tablet_pad_strip_v2* strip, std::uint32_t source) {
        auto& conn = self(data);
        conn.sink_->stripSource(conn.id_(strip), source == ZWP_TABLET_PAD_STRIP_V2_SOURCE_FINGER ? TouchSource::Finger : TouchSource::Unknown);
    }
    static void onStripPosition(void* data, zwp_tablet_pad_strip_v2* strip, std::uint32_t position) {
        auto& conn = self(data);
        conn.sink_->stripPosition(conn.id_(strip), position);
    }
    static void onStripStop(void* data, zwp_tablet_pad_strip_v2* strip) {
        auto& conn = self(data);
        conn.sink_->stripStop(conn.id_(strip));
    }
    static void onStripFrame(void* data, zwp_tablet_pad_strip_v2* strip, std::uint32_t time) {
        auto& conn = self(data);
        conn.sink_->stripFrame(conn.id_(strip), time);
    }

    static constexpr wl_registry_listener registryListener{
            .global        = onGlobal,
            .global_remove = onGlobalRemove,
    };
    static constexpr zwp_tablet_seat_v2_listener seatListener{
            .tablet_added = onTabletAdded,
            .tool_added   = onToolAdded,
            .pad_added    = onPadAdded,
    };
    static constexpr zwp_tablet_v2_listener tabletListener{
            .name    = onTabletName,
            .id      = onTabletId,
            .path    = onTabletPath,
            .done    = onTabletDone,
            .removed = onTabletRemoved,
    };
    static constexpr zwp_tablet_tool_v2_listener toolListener{
            .type              = onToolType,
            .hardware_serial   = onToolSerial,
            .hardware_id_wacom = onToolWacomId,
            .capability        = onToolCapability,
            .done              = onToolDone,
            .removed           = onToolRemoved,
            .proximity_in      = onProximityIn,
            .proximity_out     = onProximityOut,
            .down              = onDown,
            .up                = onUp,
            .motion            = onMotion,
            .pressure          = onPressure,
            .distance          = onDistance,
            .tilt              = onTilt,
            .rotation          = onRotation,
            .slider            = onSlider,
            .wheel             = onWheel,
            .button            = onToolButton,
            .frame             = onToolFrame,
    };
    static constexpr zwp_tablet_pad_v2_listener padListener{
            .group   = onPadGroup,
            .path    = onPadPath,
            .buttons = onPadButtons,
            .done    = onPadDone,
            .button  = onPadButton,
            .enter   = onPadEnter,
            .leave   = onPadLeave,
            .removed = onPadRemoved,
    };
    static constexpr zwp_tablet_pad_group_v2_listener groupListener{
            .buttons     = onGroupButtons,
            .ring        = onGroupRing,
            .strip       = onGroupStrip,
            .modes       = onGroupModes,
            .done        = onGroupDone,
            .mode_switch = onGroupModeSwitch,
    };
    static constexpr zwp_tablet_pad_ring_v2_listener ringListener{
            .source = onRingSource,
            .angle  = onRingAngle,
            .stop   = onRingStop,
            .frame  = onRingFrame,
    };
    static constexpr zwp_tablet_pad_strip_v2_listener stripListener{
            .source   = onStripSource,
            .position = onStripPosition,
            .stop     = onStripStop,
            .frame    = onStripFrame,
    };

    wl_display*            display_    = nullptr;
    wl_display*            wrapper_    = nullptr;
    wl_event_queue*        queue_      = nullptr;
    wl_registry*           registry_   = nullptr;
    wl_seat*               seat_       = nullptr;
    zwp_tablet_manager_v2* manager_    = nullptr;
    zwp_tablet_seat_v2*    tabletSeat_ = nullptr;
    WaylandTabletState*    sink_       = nullptr;
    bool                   announced_  = false;
    WaylandProxyTable      proxies_;
};

} // namespace

auto makeWaylandClientConnection(void* display) -> Expected<std::unique_ptr<WaylandConnection>> {
    if (!display)
        return std::unexpected(Error{Error::Code::HandleError, "null wl_display"});
    auto connection = std::make_unique<WaylandClientConnection>(static_cast<wl_display*>(display));
    if (auto ready = connection->initialize(); !ready)
        return std::unexpected(ready.error());
    ts_log("Bound wayland tablet manager queue", "Wayland");
    return std::unique_ptr<WaylandConnection>(std::move(connection));
}

} // namespace TS
