#include "platform/ink/InkPlatform.hpp"
#include "log/TaggedLogger.hpp"

#include <windows.h>
#include <unknwn.h>
#include <winrt/base.h>

#include <initguid.h>
#include <msinkaut.h>
#include <rtscom.h>

#include <array>
#include <cstring>
#include <string>
#include <vector>

namespace TS {

namespace {

static_assert(sizeof(LONG) == sizeof(std::int32_t));

constexpr float kHimetricPerInch = 2540.0f;

auto himetricToPxFor(HWND hwnd) -> float {
    // Depends on the calling thread's DPI awareness, which is the caller's call.
    auto dpi = GetDpiForWindow(hwnd);
    if (dpi == 0)
        dpi = GetDpiForSystem();
    return static_cast<float>(dpi) / kHimetricPerInch;
}

auto propertyGuid(InkProperty property) -> GUID const& {
    switch (property) {
    case InkProperty::X:
        return GUID_PACKETPROPERTY_GUID_X;
    case InkProperty::Y:
        return GUID_PACKETPROPERTY_GUID_Y;
    case InkProperty::NormalPressure:
        return GUID_PACKETPROPERTY_GUID_NORMAL_PRESSURE;
    case InkProperty::XTilt:
        return GUID_PACKETPROPERTY_GUID_X_TILT_ORIENTATION;
    case InkProperty::YTilt:
        return GUID_PACKETPROPERTY_GUID_Y_TILT_ORIENTATION;
    case InkProperty::Z:
        return GUID_PACKETPROPERTY_GUID_Z;
    case InkProperty::Twist:
        return GUID_PACKETPROPERTY_GUID_TWIST_ORIENTATION;
    case InkProperty::ButtonPressure:
        return GUID_PACKETPROPERTY_GUID_BUTTON_PRESSURE;
    case InkProperty::Width:
        return GUID_PACKETPROPERTY_GUID_WIDTH;
    case InkProperty::Height:
        return GUID_PACKETPROPERTY_GUID_HEIGHT;
    case InkProperty::TimerTick:
        return GUID_PACKETPROPERTY_GUID_TIMER_TICK;
    case InkProperty::PacketStatus:
        break;
    }
    return GUID_PACKETPROPERTY_GUID_PACKET_STATUS;
}

auto propertyFromGuid(GUID const& guid) -> std::optional<InkProperty> {
    for (auto property : InkPacketLayout::defaults().properties)
        if (IsEqualGUID(guid, propertyGuid(property)))
            return property;
    return std::nullopt;
}

auto unitFrom(PROPERTY_UNITS units) -> MetricUnit {
    auto const raw = static_cast<std::int32_t>(units);
    if (raw < static_cast<std::int32_t>(MetricUnit::Default) || raw > static_cast<std::int32_t>(MetricUnit::Grams))
        return MetricUnit::Default;
    return static_cast<MetricUnit>(raw);
}

// Takes ownership of `text`.
auto narrow(BSTR text) -> std::optional<std::string> {
    if (!text)
        return std::nullopt;
    auto const wide = static_cast<int>(SysStringLen(text));
    std::string out;
    if (wide > 0) {
        auto const bytes = WideCharToMultiByte(CP_UTF8, 0, text, wide, nullptr, 0, nullptr, nullptr);
        out.resize(static_cast<std::size_t>(bytes));
        WideCharToMultiByte(CP_UTF8, 0, text, wide, out.data(), bytes, nullptr, nullptr);
    }
    SysFreeString(text);
    return out;
}

auto hresultOf(Error const& error) -> HRESULT {
    switch (error.code) {
    case Error::Code::InvalidArgument:
        return E_INVALIDARG;
    case Error::Code::NullPointer:
        return E_POINTER;
    default:
        break;
    }
    return E_FAIL;
}

auto failure(char const* call, HRESULT hr) -> Error {
    return Error{Error::Code::TransportFailure, std::string{call} + " failed with HRESULT " + std::to_string(static_cast<std::uint32_t>(hr))};
}

class RealTimeStylusHost final : public InkHost {
public:
    RealTimeStylusHost(winrt::com_ptr<IRealTimeStylus> rts, HWND hwnd) : rts_(std::move(rts)), hwnd_(hwnd) {}

    auto attach(winrt::com_ptr<IStylusAsyncPlugin> plugin) -> void { plugin_ = std::move(plugin); }

    auto cursor(std::uint32_t sid) -> Expected<InkCursorInfo> override {
        winrt::com_ptr<IInkCursor> cursor;
        if (auto hr = rts_->GetStylusForId(sid, cursor.put()); FAILED(hr))
            return std::unexpected(failure("GetStylusForId", hr));
        InkCursorInfo info;
        long id = 0;
        if (SUCCEEDED(cursor->get_Id(&id)))
            info.cursorId = static_cast<std::int32_t>(id);
        BSTR name = nullptr;
        if (SUCCEEDED(cursor->get_Name(&name)))
            info.name = narrow(name);
        VARIANT_BOOL inverted = VARIANT_FALSE;
        if (SUCCEEDED(cursor->get_Inverted(&inverted)))
            info.inverted = inverted != VARIANT_FALSE;
        return info;
    }

    auto tablet(std::uint32_t tcid) -> Expected<InkTabletInfo> override {
        winrt::com_ptr<IInkTablet> tablet;
        if (auto hr = rts_->GetTabletFromTabletContextId(tcid, tablet.put()); FAILED(hr))
            return std::unexpected(failure("GetTabletFromTabletContextId", hr));
        InkTabletInfo info;
        BSTR          name = nullptr;
        if (SUCCEEDED(tablet->get_Name(&name)))
            info.name = narrow(name);

        float            scaleX     = 0.0f;
        float            scaleY     = 0.0f;
        ULONG            count      = 0;
        PACKET_PROPERTY* properties = nullptr;
        if (FAILED(rts_->GetPacketDescriptionData(tcid, &scaleX, &scaleY, &count, &properties)))
            return info;
        std::vector<InkPropertyDescription> described;
        bool                                known = true;
        for (ULONG i = 0; i < count; ++i) {
            auto property = propertyFromGuid(properties[i].guid);
            if (!property) {
                known = false;
                break;
            }
            auto const& metrics = properties[i].PropertyMetrics;
            described.push_back(InkPropertyDescription{*property, PropertyMetrics{metrics.nLogicalMin, metrics.nLogicalMax, unitFrom(metrics.Units), metrics.fResolution}});
        }
        CoTaskMemFree(properties);
        if (known)
            info.properties = std::move(described);
        return info;
    }

    auto himetricToPx() -> float override { return himetricToPxFor(hwnd_); }

    auto disable() -> Expected<void> override {
        if (auto hr = rts_->put_Enabled(FALSE); FAILED(hr))
            return std::unexpected(failure("put_Enabled(FALSE)", hr));
        return {};
    }

    auto clearQueues() -> Expected<void> override {
        if (auto hr = rts_->ClearStylusQueues(); FAILED(hr))
            return std::unexpected(failure("ClearStylusQueues", hr));
        return {};
    }

    auto enable() -> Expected<void> override {
        if (auto hr = rts_->put_Enabled(TRUE); FAILED(hr))
            return std::unexpected(failure("put_Enabled(TRUE)", hr));
        return {};
    }

    // The stylus and the plugin hold each other; removing the plugin breaks
    // the cycle.
    auto shutdown() -> void override {
        if (!rts_)
            return;
        if (FAILED(rts_->put_Enabled(FALSE)))
            ts_log("Disabling the stylus failed", "Ink", "Error");
        if (FAILED(rts_->RemoveAllStylusAsyncPlugins()))
            ts_log("Detaching the stylus plugin failed", "Ink", "Error");
        plugin_ = nullptr;
        rts_    = nullptr;
    }

private:
    winrt::com_ptr<IRealTimeStylus>    rts_;
    winrt::com_ptr<IStylusAsyncPlugin> plugin_;
    HWND                               hwnd_ = nullptr;
};

/**
 * Async plugin, so callbacks arrive on a low priority thread where taking the
 * session lock is harmless. C++/WinRT supplies the free-threaded marshaler the
 * stylus asks for.
 */
struct StylusPlugin : winrt::implements<StylusPlugin, IStylusAsyncPlugin> {
    StylusPlugin(IRealTimeStylus* rts, std::shared_ptr<InkSession> session) : rts_(rts), session_(std::move(session)) {}

    auto __stdcall DataInterest(RealTimeStylusDataInterest* interest) noexcept -> HRESULT override {
        if (!interest)
            return E_POINTER;
        *interest = static_cast<RealTimeStylusDataInterest>(RTSDI_RealTimeStylusEnabled | RTSDI_TabletAdded | RTSDI_TabletRemoved | RTSDI_StylusOutOfRange
                                                            | RTSDI_InAirPackets | RTSDI_Packets | RTSDI_StylusDown | RTSDI_StylusUp | RTSDI_StylusButtonUp
                                                            | RTSDI_StylusButtonDown | RTSDI_UpdateMapping);
        return S_OK;
    }

    auto __stdcall RealTimeStylusEnabled(IRealTimeStylus* rts, ULONG count, TABLET_CONTEXT_ID const* tcids) noexcept -> HRESULT override {
        if (rts != rts_) {
            session_->poison();
            return E_INVALIDARG;
        }
        return this->result(session_->realTimeStylusEnabled(count, tcids));
    }

    auto __stdcall TabletAdded(IRealTimeStylus* rts, IInkTablet* tablet) noexcept -> HRESULT override {
        if (rts != rts_) {
            session_->poison();
            return E_INVALIDARG;
        }
        if (!tablet) {
            session_->poison();
            return E_POINTER;
        }
        TABLET_CONTEXT_ID tcid = 0;
        if (auto hr = rts_->GetTabletContextIdFromTablet(tablet, &tcid); FAILED(hr)) {
            session_->poison();
            return hr;
        }
        return this->result(session_->tabletAdded(tcid));
    }

    auto __stdcall TabletRemoved(IRealTimeStylus*, LONG index) noexcept -> HRESULT override {
        return this->result(session_->tabletRemoved(index));
    }

    auto __stdcall StylusOutOfRange(IRealTimeStylus* rts, TABLET_CONTEXT_ID, STYLUS_ID sid) noexcept -> HRESULT override {
        if (rts != rts_)
            return E_INVALIDARG;
        return this->result(session_->stylusOutOfRange(sid));
    }

    auto __stdcall StylusDown(IRealTimeStylus* rts, StylusInfo const* stylus, ULONG count, LONG* packet, LONG**) noexcept -> HRESULT override {
        if (rts != rts_)
            return E_INVALIDARG;
        auto const info = infoFrom(stylus);
        return this->result(session_->stylusDown(stylus ? &info : nullptr, count, reinterpret_cast<std::int32_t const*>(packet)));
    }

    auto __stdcall StylusUp(IRealTimeStylus* rts, StylusInfo const* stylus, ULONG count, LONG* packet, LONG**) noexcept -> HRESULT override {
        if (rts != rts_)
            return E_INVALIDARG;
        auto const info = infoFrom(stylus);
        return this->result(session_->stylusUp(stylus ? &info : nullptr, count, reinterpret_cast<std::int32_t const*>(packet)));
    }

    // The documented parameter names are wrong: the first count is the number
    // of packets, the second the total number of words across all of them.
    auto __stdcall InAirPackets(IRealTimeStylus* rts, StylusInfo const* stylus, ULONG packets, ULONG words, LONG* data, ULONG*, LONG**) noexcept -> HRESULT override {
        if (rts != rts_)
            return E_INVALIDARG;
        auto const info = infoFrom(stylus);
        return this->result(session_->inAirPackets(stylus ? &info : nullptr, packets, words, reinterpret_cast<std::int32_t const*>(data)));
    }

    auto __stdcall Packets(IRealTimeStylus* rts, StylusInfo const* stylus, ULONG packets, ULONG words, LONG* data, ULONG*, LONG**) noexcept -> HRESULT override {
        if (rts != rts_)
            return E_INVALIDARG;
        auto const info = infoFrom(stylus);
        return this->result(session_->packets(stylus ? &info : nullptr, packets, words, reinterpret_cast<std::int32_t const*>(data)));
    }

    auto __stdcall StylusButtonDown(IRealTimeStylus* rts, STYLUS_ID sid, GUID const* button, POINT*) noexcept -> HRESULT override {
        return this->button(rts, sid, button, true);
    }

    auto __stdcall StylusButtonUp(IRealTimeStylus* rts, STYLUS_ID sid, GUID const* button, POINT*) noexcept -> HRESULT override {
        return this->button(rts, sid, button, false);
    }

    auto __stdcall UpdateMapping(IRealTimeStylus*) noexcept -> HRESULT override {
        return this->result(session_->updateMapping());
    }

    // Filtered out by DataInterest.
    auto __stdcall RealTimeStylusDisabled(IRealTimeStylus*, ULONG, TABLET_CONTEXT_ID const*) noexcept -> HRESULT override { return S_OK; }
    auto __stdcall StylusInRange(IRealTimeStylus*, TABLET_CONTEXT_ID, STYLUS_ID) noexcept -> HRESULT override { return S_OK; }
    auto __stdcall CustomStylusDataAdded(IRealTimeStylus*, GUID const*, ULONG, BYTE const*) noexcept -> HRESULT override { return S_OK; }
    auto __stdcall SystemEvent(IRealTimeStylus*, TABLET_CONTEXT_ID, STYLUS_ID, SYSTEM_EVENT, SYSTEM_EVENT_DATA) noexcept -> HRESULT override { return S_OK; }
    auto __stdcall Error(IRealTimeStylus*, IStylusPlugin*, RealTimeStylusDataInterest, HRESULT, LONG_PTR*) noexcept -> HRESULT override { return S_OK; }

private:
    static auto infoFrom(StylusInfo const* stylus) -> InkStylusInfo {
        if (!stylus)
            return {};
        return InkStylusInfo{stylus->tcid, stylus->cid};
    }

    auto button(IRealTimeStylus* rts, STYLUS_ID sid, GUID const* guid, bool pressed) -> HRESULT {
        if (rts != rts_)
            return E_INVALIDARG;
        if (!guid)
            return this->result(session_->stylusButton(sid, nullptr, pressed));
        std::array<std::uint8_t, 16> bytes{};
        std::memcpy(bytes.data(), guid, bytes.size());
        return this->result(session_->stylusButton(sid, &bytes, pressed));
    }

    auto result(Expected<void> const& outcome) const -> HRESULT {
        if (outcome)
            return S_OK;
        return hresultOf(outcome.error());
    }

    // Identity only; the stylus owns this plugin, not the other way round.
    IRealTimeStylus*            rts_ = nullptr;
    std::shared_ptr<InkSession> session_;
};

} // namespace

auto makeRealTimeStylusPlatform(void* hwnd, bool emulateToolFromMouse, InkPacketLayout layout) -> Expected<std::unique_ptr<Platform>> {
    if (!hwnd)
        return std::unexpected(Error{Error::Code::HandleError, "null HWND"});
    if (auto valid = layout.validate(); !valid)
        return std::unexpected(valid.error());
    auto const window = static_cast<HWND>(hwnd);

    winrt::com_ptr<IRealTimeStylus> rts;
    if (auto hr = CoCreateInstance(__uuidof(RealTimeStylus), nullptr, CLSCTX_ALL, __uuidof(IRealTimeStylus), rts.put_void()); FAILED(hr))
        return std::unexpected(Error{Error::Code::NotSupported, "RealTimeStylus unavailable"});

    // Most settings require the stylus to be disabled.
    if (auto hr = rts->put_Enabled(FALSE); FAILED(hr))
        return std::unexpected(failure("put_Enabled(FALSE)", hr));
    std::vector<GUID> desired;
    for (auto property : layout.properties)
        desired.push_back(propertyGuid(property));
    if (auto hr = rts->SetDesiredPacketDescription(static_cast<ULONG>(desired.size()), desired.data()); FAILED(hr))
        return std::unexpected(failure("SetDesiredPacketDescription", hr));
    if (auto hr = rts->put_HWND(reinterpret_cast<HANDLE_PTR>(window)); FAILED(hr))
        return std::unexpected(failure("put_HWND", hr));

    auto host    = std::make_unique<RealTimeStylusHost>(rts, window);
    auto session = std::make_shared<InkSession>(*host, std::move(layout));
    auto plugin  = winrt::make_self<StylusPlugin>(rts.get(), session).as<IStylusAsyncPlugin>();

    // Sole plugin, so the data arrives unfiltered.
    if (auto hr = rts->RemoveAllStylusSyncPlugins(); FAILED(hr))
        return std::unexpected(failure("RemoveAllStylusSyncPlugins", hr));
    if (auto hr = rts->RemoveAllStylusAsyncPlugins(); FAILED(hr))
        return std::unexpected(failure("RemoveAllStylusAsyncPlugins", hr));
    if (auto hr = rts->AddStylusAsyncPlugin(0, plugin.get()); FAILED(hr))
        return std::unexpected(failure("AddStylusAsyncPlugin", hr));
    host->attach(plugin);

    // From here on the host detaches the plugin again if anything fails.
    auto platform = std::make_unique<InkPlatform>(std::move(host), std::move(session));
    if (auto hr = rts->SetAllTabletsMode(emulateToolFromMouse ? TRUE : FALSE); FAILED(hr))
        return std::unexpected(failure("SetAllTabletsMode", hr));
    if (auto hr = rts->put_Enabled(TRUE); FAILED(hr))
        return std::unexpected(failure("put_Enabled(TRUE)", hr));
    ts_log("RealTimeStylus enabled", "Ink");
    return std::unique_ptr<Platform>(std::move(platform));
}

} // namespace TS
