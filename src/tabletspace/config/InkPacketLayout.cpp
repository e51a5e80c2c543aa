#include "config/InkPacketLayout.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <string>
#include <utility>

namespace TS {
namespace {

using Json = nlohmann::json;

constexpr std::array<std::pair<InkProperty, std::string_view>, 12> kPropertyNames{{
        {InkProperty::X, "X"},
        {InkProperty::Y, "Y"},
        {InkProperty::NormalPressure, "NormalPressure"},
        {InkProperty::XTilt, "XTilt"},
        {InkProperty::YTilt, "YTilt"},
        {InkProperty::Z, "Z"},
        {InkProperty::Twist, "Twist"},
        {InkProperty::ButtonPressure, "ButtonPressure"},
        {InkProperty::Width, "Width"},
        {InkProperty::Height, "Height"},
        {InkProperty::TimerTick, "TimerTick"},
        {InkProperty::PacketStatus, "PacketStatus"},
}};

[[nodiscard]] auto make_error(Error::Code code, std::string_view field, std::string_view detail) -> Error {
    std::string message;
    message.reserve(field.size() + detail.size() + 2);
    message.append(field);
    if (!detail.empty()) {
        message.append(": ");
        message.append(detail);
    }
    return Error{code, std::move(message)};
}

[[nodiscard]] auto read_uint64(Json const& json, char const* key) -> Expected<std::uint64_t> {
    if (auto it = json.find(key); it != json.end()) {
        if (it->is_number_unsigned()) {
            return it->get<std::uint64_t>();
        }
        if (it->is_number_integer()) {
            auto value = it->get<std::int64_t>();
            if (value < 0) {
                return std::unexpected(make_error(Error::Code::MalformedInput, key, "must be non-negative"));
            }
            return static_cast<std::uint64_t>(value);
        }
        return std::unexpected(make_error(Error::Code::MalformedInput, key, "must be an integer"));
    }
    return std::unexpected(make_error(Error::Code::MalformedInput, key, "is required"));
}

} // namespace

auto inkPropertyName(InkProperty property) -> std::string_view {
    for (auto const& [candidate, name] : kPropertyNames)
        if (candidate == property)
            return name;
    return "Unknown";
}

auto inkPropertyFromName(std::string_view name) -> std::optional<InkProperty> {
    for (auto const& [property, candidate] : kPropertyNames)
        if (candidate == name)
            return property;
    return std::nullopt;
}

auto InkPacketLayout::defaults() -> InkPacketLayout {
    return InkPacketLayout{};
}

auto InkPacketLayout::validate() const -> Expected<void> {
    auto const& p = this->properties;
    if (p.size() < 3 || p[0] != InkProperty::X || p[1] != InkProperty::Y || p.back() != InkProperty::PacketStatus)
        return std::unexpected(make_error(Error::Code::MalformedInput, "properties", "must start with X, Y and end with PacketStatus"));
    auto sorted = p;
    std::sort(sorted.begin(), sorted.end());
    if (std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end())
        return std::unexpected(make_error(Error::Code::MalformedInput, "properties", "entries must be unique"));
    return {};
}

auto loadInkPacketLayout(nlohmann::json const& json) -> Expected<InkPacketLayout> {
    if (!json.is_object())
        return std::unexpected(make_error(Error::Code::MalformedInput, "layout", "must be a JSON object"));
    auto version = read_uint64(json, "version");
    if (!version)
        return std::unexpected(version.error());
    if (*version != InkPacketLayout::kVersion)
        return std::unexpected(make_error(Error::Code::MalformedInput, "version", "unsupported layout version " + std::to_string(*version)));

    auto layout = InkPacketLayout::defaults();
    if (auto it = json.find("properties"); it != json.end()) {
        if (!it->is_array())
            return std::unexpected(make_error(Error::Code::MalformedInput, "properties", "must be an array"));
        layout.properties.clear();
        for (auto const& entry : *it) {
            if (!entry.is_string())
                return std::unexpected(make_error(Error::Code::MalformedInput, "properties", "entries must be strings"));
            auto property = inkPropertyFromName(entry.get<std::string>());
            if (!property)
                return std::unexpected(make_error(Error::Code::MalformedInput, "properties", "unknown property " + entry.get<std::string>()));
            layout.properties.push_back(*property);
        }
    }
    if (auto valid = layout.validate(); !valid)
        return std::unexpected(valid.error());
    return layout;
}

} // namespace TS
