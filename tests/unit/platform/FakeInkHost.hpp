#pragma once

#include "platform/ink/InkHost.hpp"

#include <parallel_hashmap/phmap.h>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace TS {

// Stands in for the RealTimeStylus. Records the restart calls made during
// recovery and fails them on request.
class FakeInkHost final : public InkHost {
public:
    auto cursor(std::uint32_t sid) -> Expected<InkCursorInfo> override {
        if (this->onQuery)
            this->onQuery();
        if (auto it = this->cursors.find(sid); it != this->cursors.end())
            return it->second;
        return std::unexpected(Error{Error::Code::NotFound, "no cursor " + std::to_string(sid)});
    }

    auto tablet(std::uint32_t tcid) -> Expected<InkTabletInfo> override {
        if (this->onQuery)
            this->onQuery();
        if (auto it = this->tabletInfo.find(tcid); it != this->tabletInfo.end())
            return it->second;
        return std::unexpected(Error{Error::Code::NotFound, "no tablet " + std::to_string(tcid)});
    }

    auto himetricToPx() -> float override { return this->scale; }

    auto disable() -> Expected<void> override { return this->record("disable", this->failDisable); }
    auto clearQueues() -> Expected<void> override { return this->record("clear", this->failClear); }
    auto enable() -> Expected<void> override { return this->record("enable", false); }
    auto shutdown() -> void override { this->calls->push_back("shutdown"); }

    // X, Y, pressure 0..1023, timer, status: five words per packet.
    static auto penTablet(std::string name) -> InkTabletInfo {
        InkTabletInfo info;
        info.name       = std::move(name);
        info.properties = std::vector<InkPropertyDescription>{
                {InkProperty::X, PropertyMetrics{0, 30000, MetricUnit::Centimeters, 1000.0f}},
                {InkProperty::Y, PropertyMetrics{0, 20000, MetricUnit::Centimeters, 1000.0f}},
                {InkProperty::NormalPressure, PropertyMetrics{0, 1023, MetricUnit::Default, 1.0f}},
                {InkProperty::TimerTick, PropertyMetrics{}},
                {InkProperty::PacketStatus, PropertyMetrics{}},
        };
        return info;
    }

    phmap::flat_hash_map<std::uint32_t, InkCursorInfo> cursors;
    phmap::flat_hash_map<std::uint32_t, InkTabletInfo> tabletInfo;
    float                                              scale       = 1.0f;
    bool                                               failDisable = false;
    bool                                               failClear   = false;
    // Runs at the start of every cursor or tablet query, on the caller's thread.
    std::function<void()> onQuery;
    // Shared so it can be read after the platform dropped the host.
    std::shared_ptr<std::vector<std::string>> calls = std::make_shared<std::vector<std::string>>();

private:
    auto record(char const* call, bool fail) -> Expected<void> {
        this->calls->push_back(call);
        if (fail)
            return std::unexpected(Error{Error::Code::UnknownError, std::string{call} + " failed"});
        return {};
    }
};

} // namespace TS
