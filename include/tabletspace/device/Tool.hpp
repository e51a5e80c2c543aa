#pragma once
#include "core/Axis.hpp"
#include "core/InternalID.hpp"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace TS {

enum class ToolType : std::uint8_t {
    Pen,
    Pencil,
    Brush,
    Eraser,
    Airbrush,
    Lens,
    Finger,
    Mouse,
};

[[nodiscard]] auto toolTypeName(ToolType type) -> std::string_view;

// A stylus or other hand-held tool. A pen and its eraser end are separate
// tools sharing a hardwareId.
struct Tool {
    InternalID                   internalId;
    std::optional<std::string>   name;
    std::optional<std::uint64_t> hardwareId;
    std::optional<std::uint64_t> wacomId;
    std::optional<ToolType>      type;
    FullInfo                     axes;

    friend auto operator<<(std::ostream& os, Tool const& tool) -> std::ostream&;
};

} // namespace TS
