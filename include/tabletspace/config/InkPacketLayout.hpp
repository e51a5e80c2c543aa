#pragma once
#include "core/Error.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace TS {

// RealTimeStylus packet properties, by the GUID_PACKETPROPERTY_GUID_* they
// stand for.
enum class InkProperty : std::uint8_t {
    X,
    Y,
    NormalPressure,
    XTilt,
    YTilt,
    Z,
    Twist,
    ButtonPressure,
    Width,
    Height,
    TimerTick,
    PacketStatus,
};

[[nodiscard]] auto inkPropertyName(InkProperty property) -> std::string_view;
[[nodiscard]] auto inkPropertyFromName(std::string_view name) -> std::optional<InkProperty>;

/**
 * Packet description requested from the stylus. Ink always puts X and Y first
 * and the status word last; every other property lands in the packet in the
 * order it was requested, when the tablet supports it.
 */
struct InkPacketLayout {
    static constexpr std::uint64_t kVersion = 1;

    std::vector<InkProperty> properties{
            InkProperty::X,
            InkProperty::Y,
            InkProperty::NormalPressure,
            InkProperty::XTilt,
            InkProperty::YTilt,
            InkProperty::Z,
            InkProperty::Twist,
            InkProperty::ButtonPressure,
            InkProperty::Width,
            InkProperty::Height,
            InkProperty::TimerTick,
            InkProperty::PacketStatus,
    };

    [[nodiscard]] static auto defaults() -> InkPacketLayout;
    // X and Y first, PacketStatus last, no duplicates.
    [[nodiscard]] auto validate() const -> Expected<void>;
};

// {"version": 1, "properties": ["X", "Y", ..., "PacketStatus"]}
[[nodiscard]] auto loadInkPacketLayout(nlohmann::json const& json) -> Expected<InkPacketLayout>;

} // namespace TS
