#include "platform/xinput2/XInput2Platform.hpp"
#include "log/TaggedLogger.hpp"

#include <X11/Xatom.h>
#include <X11/Xlib.h>
#include <X11/extensions/XInput2.h>

#include <parallel_hashmap/phmap.h>

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace TS {

namespace {

/**
 * Xlib adapter. Runs on its own display connection so reading events never
 * competes with the application's event loop, and selects device events on the
 * application's window plus hierarchy and property events on the root window.
 */
class XlibConnection final : public XInput2Connection {
public:
    XlibConnection(Display* display, Window window) : display_(display), window_(window) {}

    ~XlibConnection() override {
        if (display_)
            XCloseDisplay(display_);
    }

    XlibConnection(XlibConnection const&)                    = delete;
    auto operator=(XlibConnection const&) -> XlibConnection& = delete;

    auto initialize() -> Expected<void> {
        int event = 0;
        int error = 0;
        if (!XQueryExtension(display_, "XInputExtension", &opcode_, &event, &error))
            return std::unexpected(Error{Error::Code::NotSupported, "X server lacks the XInputExtension"});
        int major = 2;
        int minor = 2;
        if (XIQueryVersion(display_, &major, &minor) != Success)
            return std::unexpected(Error{Error::Code::NotSupported, "X server lacks XInput 2.2"});

        unsigned char windowBits[XIMaskLen(XI_LASTEVENT)] = {};
        XISetMask(windowBits, XI_Motion);
        XISetMask(windowBits, XI_ButtonPress);
        XISetMask(windowBits, XI_ButtonRelease);
        XISetMask(windowBits, XI_Leave);
        XIEventMask windowMask{XIAllDevices, static_cast<int>(sizeof(windowBits)), windowBits};
        if (XISelectEvents(display_, window_, &windowMask, 1) != Success)
            return std::unexpected(Error{Error::Code::TransportFailure, "XISelectEvents on window failed"});

        unsigned char rootBits[XIMaskLen(XI_LASTEVENT)] = {};
        XISetMask(rootBits, XI_HierarchyChanged);
        XISetMask(rootBits, XI_PropertyEvent);
        XIEventMask rootMask{XIAllDevices, static_cast<int>(sizeof(rootBits)), rootBits};
        if (XISelectEvents(display_, DefaultRootWindow(display_), &rootMask, 1) != Success)
            return std::unexpected(Error{Error::Code::TransportFailure, "XISelectEvents on root failed"});
        XFlush(display_);
        return {};
    }

    auto drain(XInput2State& state) -> Expected<void> override {
        if (needsRescan_) {
            this->rescan_(state);
            needsRescan_ = false;
        }
        while (XPending(display_) > 0) {
            XEvent event;
            XNextEvent(display_, &event);
            auto* cookie = &event.xcookie;
            if (cookie->type != GenericEvent || cookie->extension != opcode_ || !XGetEventData(display_, cookie))
                continue;
            bool rescan = false;
            switch (cookie->evtype) {
            case XI_HierarchyChanged:
                rescan = true;
                break;
            case XI_Motion:
            case XI_ButtonPress:
            case XI_ButtonRelease:
                this->deviceEvent_(state, cookie->evtype, *static_cast<XIDeviceEvent const*>(cookie->data));
                break;
            case XI_Leave: {
                auto const& leave = *static_cast<XILeaveEvent const*>(cookie->data);
                state.leave(static_cast<std::uint16_t>(leave.sourceid), static_cast<std::uint32_t>(leave.time));
                break;
            }
            case XI_PropertyEvent:
                this->propertyEvent_(state, *static_cast<XIPropertyEvent const*>(cookie->data));
                break;
            default:
                break;
            }
            XFreeEventData(display_, cookie);
            if (rescan)
                this->rescan_(state);
        }
        return {};
    }

private:
    auto deviceEvent_(XInput2State& state, int type, XIDeviceEvent const& device) -> void {
        XInput2DeviceEvent event;
        event.deviceId = static_cast<std::uint16_t>(device.sourceid);
        event.time     = static_cast<std::uint32_t>(device.time);
        event.x        = device.event_x;
        event.y        = device.event_y;
        double const* values = device.valuators.values;
        for (int bit = 0; bit < device.valuators.mask_len * 8; ++bit)
            if (XIMaskIsSet(device.valuators.mask, bit))
                event.valuators.emplace_back(static_cast<std::uint16_t>(bit), *values++);

        if (type == XI_Motion)
            state.motion(event);
        else
            state.button(event, static_cast<std::uint32_t>(device.detail), type == XI_ButtonPress);
    }

    auto propertyEvent_(XInput2State& state, XIPropertyEvent const& property) -> void {
        if (property.what == XIPropertyDeleted)
            return;
        auto const serialIds = this->atom_(state.heuristics().properties.wacomSerialIds);
        if (serialIds == None || property.property != serialIds)
            return;
        std::vector<std::int64_t> ids;
        std::string               unused;
        if (!this->readProperty_(property.deviceid, serialIds, ids, unused))
            return;
        state.serialIds(static_cast<std::uint16_t>(property.deviceid), ids, static_cast<std::uint32_t>(property.time));
    }

    auto rescan_(XInput2State& state) -> void {
        int  count   = 0;
        auto devices = XIQueryDevice(display_, XIAllDevices, &count);
        if (!devices) {
            ts_log("XIQueryDevice returned nothing", "XInput2", "Error");
            return;
        }
        auto const& props = state.heuristics().properties;
        std::string const* const propertyNames[] = {
                &props.wacomToolType,
                &props.wacomSerialIds,
                &props.libinputToolSerial,
                &props.libinputToolId,
                &props.libinputPadModesAvailable,
                &props.libinputPadButtonGroups,
                &props.libinputPadStripGroups,
                &props.libinputPadRingGroups,
                &props.libinputSendEventsDefault,
                &props.productId,
                &props.deviceNode,
        };

        std::vector<XInput2DeviceSnapshot> snapshots;
        for (int i = 0; i < count; ++i) {
            auto const& info = devices[i];
            if (info.use != XISlavePointer && info.use != XIFloatingSlave)
                continue;
            XInput2DeviceSnapshot snapshot;
            snapshot.deviceId = static_cast<std::uint16_t>(info.deviceid);
            snapshot.name     = info.name ? info.name : "";
            snapshot.enabled  = info.enabled != 0;
            for (int c = 0; c < info.num_classes; ++c) {
                auto const* any = info.classes[c];
                if (any->type == XIValuatorClass) {
                    auto const*         valuator = reinterpret_cast<XIValuatorClassInfo const*>(any);
                    XInput2ValuatorInfo out;
                    out.number     = static_cast<std::uint16_t>(valuator->number);
                    out.label      = this->atomName_(valuator->label);
                    out.min        = valuator->min;
                    out.max        = valuator->max;
                    out.resolution = valuator->resolution;
                    out.absolute   = valuator->mode == XIModeAbsolute;
                    snapshot.valuators.push_back(std::move(out));
                } else if (any->type == XIButtonClass) {
                    snapshot.buttonCount = static_cast<std::uint32_t>(reinterpret_cast<XIButtonClassInfo const*>(any)->num_buttons);
                }
            }
            for (auto const* name : propertyNames) {
                auto const atom = this->atom_(*name);
                if (atom == None)
                    continue;
                std::vector<std::int64_t> integers;
                std::string               text;
                if (!this->readProperty_(info.deviceid, atom, integers, text))
                    continue;
                if (!integers.empty())
                    snapshot.integerProperties.emplace(*name, std::move(integers));
                else
                    snapshot.textProperties.emplace(*name, std::move(text));
            }
            snapshots.push_back(std::move(snapshot));
        }
        XIFreeDeviceInfo(devices);
        state.rescan(snapshots);
    }

    // Integer and cardinal properties land in `integers`, atom and string
    // properties in `text`.
    auto readProperty_(int deviceId, Atom property, std::vector<std::int64_t>& integers, std::string& text) -> bool {
        Atom           type      = None;
        int            format    = 0;
        unsigned long  items     = 0;
        unsigned long  remaining = 0;
        unsigned char* data      = nullptr;
        if (XIGetProperty(display_, deviceId, property, 0, 1024, False, AnyPropertyType, &type, &format, &items, &remaining, &data) != Success)
            return false;
        if (!data)
            return false;

        bool ok = true;
        if (type == XA_ATOM && format == 32) {
            if (items > 0)
                text = this->atomName_(static_cast<Atom>(reinterpret_cast<std::uint32_t const*>(data)[0]));
        } else if (type == XA_STRING && format == 8) {
            text.assign(reinterpret_cast<char const*>(data), ::strnlen(reinterpret_cast<char const*>(data), items));
        } else if (type == XA_INTEGER || type == XA_CARDINAL) {
            bool const isSigned = type == XA_INTEGER;
            for (unsigned long i = 0; i < items; ++i) {
                switch (format) {
                case 8:
                    integers.push_back(isSigned ? reinterpret_cast<std::int8_t const*>(data)[i] : data[i]);
                    break;
                case 16:
                    integers.push_back(isSigned ? reinterpret_cast<std::int16_t const*>(data)[i] : reinterpret_cast<std::uint16_t const*>(data)[i]);
                    break;
                case 32:
                    integers.push_back(isSigned ? reinterpret_cast<std::int32_t const*>(data)[i] : reinterpret_cast<std::uint32_t const*>(data)[i]);
                    break;
                default:
                    ok = false;
                    break;
                }
            }
        } else {
            ok = false;
        }
        XFree(data);
        return ok && (!integers.empty() || !text.empty());
    }

    // None until some client created the atom, which drivers do when they
    // create the property.
    auto atom_(std::string const& name) -> Atom {
        if (auto it = atoms_.find(name); it != atoms_.end())
            return it->second;
        auto const atom = XInternAtom(display_, name.c_str(), True);
        if (atom != None)
            atoms_.emplace(name, atom);
        return atom;
    }

    auto atomName_(Atom atom) -> std::string {
        if (atom == None)
            return {};
        char* raw = XGetAtomName(display_, atom);
        if (!raw)
            return {};
        std::string name{raw};
        XFree(raw);
        return name;
    }

    Display*                                   display_     = nullptr;
    Window                                     window_      = 0;
    int                                        opcode_      = 0;
    bool                                       needsRescan_ = true;
    phmap::flat_hash_map<std::string, Atom>    atoms_;
};

} // namespace

auto makeXlibConnection(void* display, unsigned long window) -> Expected<std::unique_ptr<XInput2Connection>> {
    if (!display || window == 0)
        return std::unexpected(Error{Error::Code::HandleError, "null X display or window"});
    auto* own = XOpenDisplay(DisplayString(static_cast<Display*>(display)));
    if (!own)
        return std::unexpected(Error{Error::Code::TransportFailure, "XOpenDisplay failed"});
    auto connection = std::make_unique<XlibConnection>(own, static_cast<Window>(window));
    if (auto ready = connection->initialize(); !ready)
        return std::unexpected(ready.error());
    ts_log("Selected XInput2 events", "XInput2");
    return std::unique_ptr<XInput2Connection>(std::move(connection));
}

} // namespace TS
