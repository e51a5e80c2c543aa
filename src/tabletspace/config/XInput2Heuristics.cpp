#include "config/XInput2Heuristics.hpp"
#include "log/TaggedLogger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <utility>

namespace TS {
namespace {

using Json = nlohmann::json;

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

[[nodiscard]] auto ensure_object(Json const& json, std::string_view context) -> Expected<void> {
    if (!json.is_object()) {
        return std::unexpected(make_error(Error::Code::MalformedInput, context, "must be a JSON object"));
    }
    return {};
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

// Overwrites `target` when `key` is present.
[[nodiscard]] auto read_optional_string(Json const& json, char const* key, std::string& target) -> Expected<void> {
    if (auto it = json.find(key); it != json.end()) {
        if (!it->is_string()) {
            return std::unexpected(make_error(Error::Code::MalformedInput, key, "must be a string"));
        }
        target = it->get<std::string>();
    }
    return {};
}

template <typename T>
[[nodiscard]] auto read_optional_uint_list(Json const& json, char const* key, std::vector<T>& target) -> Expected<void> {
    auto it = json.find(key);
    if (it == json.end())
        return {};
    if (!it->is_array()) {
        return std::unexpected(make_error(Error::Code::MalformedInput, key, "must be an array"));
    }
    std::vector<T> values;
    values.reserve(it->size());
    for (auto const& entry : *it) {
        if (!entry.is_number_integer()) {
            return std::unexpected(make_error(Error::Code::MalformedInput, key, "entries must be integers"));
        }
        auto value = entry.get<std::int64_t>();
        if (value < 0 || static_cast<std::uint64_t>(value) > std::numeric_limits<T>::max()) {
            return std::unexpected(make_error(Error::Code::MalformedInput, key, "entry out of range"));
        }
        values.push_back(static_cast<T>(value));
    }
    target = std::move(values);
    return {};
}

[[nodiscard]] auto section(Json const& json, char const* key) -> Expected<Json const*> {
    auto it = json.find(key);
    if (it == json.end())
        return static_cast<Json const*>(nullptr);
    if (auto object = ensure_object(*it, key); !object)
        return std::unexpected(object.error());
    return &*it;
}

[[nodiscard]] auto parse_unit(std::string_view name) -> std::optional<MetricUnit> {
    static constexpr std::pair<std::string_view, MetricUnit> kUnits[] = {
            {"default", MetricUnit::Default},
            {"degrees", MetricUnit::Degrees},
            {"radians", MetricUnit::Radians},
            {"arcseconds", MetricUnit::Seconds},
    };
    for (auto const& [label, unit] : kUnits)
        if (label == name)
            return unit;
    return std::nullopt;
}

[[nodiscard]] auto parse_valuator(std::string_view name) -> std::optional<XInput2Valuator> {
    static constexpr std::pair<std::string_view, XInput2Valuator> kValuators[] = {
            {"x", XInput2Valuator::X},
            {"y", XInput2Valuator::Y},
            {"pressure", XInput2Valuator::Pressure},
            {"distance", XInput2Valuator::Distance},
            {"tiltX", XInput2Valuator::TiltX},
            {"tiltY", XInput2Valuator::TiltY},
            {"roll", XInput2Valuator::Roll},
            {"slider", XInput2Valuator::Slider},
            {"buttonPressure", XInput2Valuator::ButtonPressure},
    };
    for (auto const& [label, valuator] : kValuators)
        if (label == name)
            return valuator;
    return std::nullopt;
}

[[nodiscard]] auto parse_properties(Json const& json, XInput2Heuristics::Properties& out) -> Expected<void> {
    std::pair<char const*, std::string*> const fields[] = {
            {"wacomToolType", &out.wacomToolType},
            {"wacomSerialIds", &out.wacomSerialIds},
            {"libinputToolSerial", &out.libinputToolSerial},
            {"libinputToolId", &out.libinputToolId},
            {"libinputPadModesAvailable", &out.libinputPadModesAvailable},
            {"libinputPadButtonGroups", &out.libinputPadButtonGroups},
            {"libinputPadStripGroups", &out.libinputPadStripGroups},
            {"libinputPadRingGroups", &out.libinputPadRingGroups},
            {"libinputSendEventsDefault", &out.libinputSendEventsDefault},
            {"productId", &out.productId},
            {"deviceNode", &out.deviceNode},
    };
    for (auto const& [key, target] : fields) {
        if (auto read = read_optional_string(json, key, *target); !read)
            return read;
    }
    return {};
}

[[nodiscard]] auto parse_wacom_tool_types(Json const& json, XInput2Heuristics::WacomToolTypes& out) -> Expected<void> {
    std::pair<char const*, std::string*> const fields[] = {
            {"stylus", &out.stylus},
            {"eraser", &out.eraser},
            {"cursor", &out.cursor},
            {"pad", &out.pad},
            {"touch", &out.touch},
    };
    for (auto const& [key, target] : fields) {
        if (auto read = read_optional_string(json, key, *target); !read)
            return read;
    }
    return {};
}

[[nodiscard]] auto parse_xwayland(Json const& json, XInput2Heuristics::Xwayland& out) -> Expected<void> {
    std::pair<char const*, std::string*> const fields[] = {
            {"prefix", &out.prefix},
            {"padSuffix", &out.padSuffix},
            {"eraserSuffix", &out.eraserSuffix},
            {"stylusSuffix", &out.stylusSuffix},
            {"cursorSuffix", &out.cursorSuffix},
    };
    for (auto const& [key, target] : fields) {
        if (auto read = read_optional_string(json, key, *target); !read)
            return read;
    }
    std::string separator;
    if (auto read = read_optional_string(json, "seatSeparator", separator); !read)
        return read;
    if (json.contains("seatSeparator")) {
        if (separator.size() != 1)
            return std::unexpected(make_error(Error::Code::MalformedInput, "seatSeparator", "must be a single character"));
        out.seatSeparator = separator.front();
    }
    return {};
}

// {"Abs X": "x", ...}. Replaces the whole label table.
[[nodiscard]] auto parse_valuator_labels(Json const& json, std::vector<XInput2Heuristics::ValuatorLabel>& out) -> Expected<void> {
    std::vector<XInput2Heuristics::ValuatorLabel> labels;
    for (auto const& [label, value] : json.items()) {
        if (!value.is_string())
            return std::unexpected(make_error(Error::Code::MalformedInput, "valuatorLabels", "values must be strings"));
        auto valuator = parse_valuator(value.get<std::string>());
        if (!valuator)
            return std::unexpected(make_error(Error::Code::MalformedInput, "valuatorLabels", "unknown valuator " + value.get<std::string>()));
        labels.push_back({label, *valuator});
    }
    out = std::move(labels);
    return {};
}

[[nodiscard]] auto parse_pad(Json const& json, XInput2Heuristics::PadLayout& out) -> Expected<void> {
    if (auto read = read_optional_uint_list(json, "scrollButtons", out.scrollButtons); !read)
        return read;
    if (auto read = read_optional_uint_list(json, "ringValuators", out.ringValuators); !read)
        return read;
    return read_optional_uint_list(json, "stripValuators", out.stripValuators);
}

[[nodiscard]] auto read_text_file(std::filesystem::path const& path) -> Expected<std::string> {
    std::ifstream stream(path);
    if (!stream) {
        return std::unexpected(Error{Error::Code::NotFound, "File not found: " + path.string()});
    }
    std::ostringstream oss;
    oss << stream.rdbuf();
    if (!stream.good() && !stream.eof()) {
        return std::unexpected(Error{Error::Code::UnknownError, "Failed to read file: " + path.string()});
    }
    return oss.str();
}

} // namespace

auto XInput2Heuristics::defaults() -> XInput2Heuristics {
    return XInput2Heuristics{};
}

auto XInput2Heuristics::valuatorForLabel(std::string_view label) const -> std::optional<XInput2Valuator> {
    for (auto const& entry : this->valuatorLabels)
        if (entry.label == label)
            return entry.valuator;
    return std::nullopt;
}

auto XInput2Heuristics::padButtonIndex(std::uint32_t xButton) const -> std::optional<std::uint32_t> {
    if (xButton == 0)
        return std::nullopt;
    auto const& scroll = this->pad.scrollButtons;
    if (std::find(scroll.begin(), scroll.end(), xButton) != scroll.end())
        return std::nullopt;
    auto const skipped = std::count_if(scroll.begin(), scroll.end(), [&](std::uint32_t b) { return b != 0 && b < xButton; });
    return xButton - 1 - static_cast<std::uint32_t>(skipped);
}

auto loadXInput2Heuristics(nlohmann::json const& json) -> Expected<XInput2Heuristics> {
    if (auto object = ensure_object(json, "heuristics"); !object)
        return std::unexpected(object.error());
    auto version = read_uint64(json, "version");
    if (!version)
        return std::unexpected(version.error());
    if (*version != XInput2Heuristics::kVersion)
        return std::unexpected(make_error(Error::Code::MalformedInput, "version", "unsupported heuristics version " + std::to_string(*version)));

    auto heuristics = XInput2Heuristics::defaults();

    auto properties = section(json, "properties");
    if (!properties)
        return std::unexpected(properties.error());
    if (*properties != nullptr) {
        if (auto parsed = parse_properties(**properties, heuristics.properties); !parsed)
            return std::unexpected(parsed.error());
    }

    auto toolTypes = section(json, "wacomToolTypes");
    if (!toolTypes)
        return std::unexpected(toolTypes.error());
    if (*toolTypes != nullptr) {
        if (auto parsed = parse_wacom_tool_types(**toolTypes, heuristics.wacomToolTypes); !parsed)
            return std::unexpected(parsed.error());
    }

    auto xwayland = section(json, "xwayland");
    if (!xwayland)
        return std::unexpected(xwayland.error());
    if (*xwayland != nullptr) {
        if (auto parsed = parse_xwayland(**xwayland, heuristics.xwayland); !parsed)
            return std::unexpected(parsed.error());
    }

    auto labels = section(json, "valuatorLabels");
    if (!labels)
        return std::unexpected(labels.error());
    if (*labels != nullptr) {
        if (auto parsed = parse_valuator_labels(**labels, heuristics.valuatorLabels); !parsed)
            return std::unexpected(parsed.error());
    }

    std::string tiltUnit;
    if (auto read = read_optional_string(json, "tiltUnit", tiltUnit); !read)
        return std::unexpected(read.error());
    if (!tiltUnit.empty()) {
        auto unit = parse_unit(tiltUnit);
        if (!unit)
            return std::unexpected(make_error(Error::Code::MalformedInput, "tiltUnit", "unknown unit " + tiltUnit));
        heuristics.tiltUnit = *unit;
    }

    auto pad = section(json, "pad");
    if (!pad)
        return std::unexpected(pad.error());
    if (*pad != nullptr) {
        if (auto parsed = parse_pad(**pad, heuristics.pad); !parsed)
            return std::unexpected(parsed.error());
    }

    return heuristics;
}

auto loadXInput2HeuristicsFile(std::filesystem::path const& path) -> Expected<XInput2Heuristics> {
    auto text = read_text_file(path);
    if (!text)
        return std::unexpected(text.error());
    auto json = Json::parse(*text, nullptr, false);
    if (json.is_discarded())
        return std::unexpected(make_error(Error::Code::MalformedInput, path.string(), "not valid JSON"));
    return loadXInput2Heuristics(json);
}

auto xinput2HeuristicsFromEnvironment() -> Expected<XInput2Heuristics> {
    auto const* raw = std::getenv("TABLETSPACE_XI_HEURISTICS");
    if (raw == nullptr || *raw == '\0')
        return XInput2Heuristics::defaults();
    ts_log(std::string("Loading XInput2 heuristics from ") + raw, "Heuristics", "XInput2");
    return loadXInput2HeuristicsFile(raw);
}

} // namespace TS
