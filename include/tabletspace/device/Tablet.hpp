#pragma once
#include "core/InternalID.hpp"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace TS {

struct UsbId {
    std::uint16_t vid = 0;
    std::uint16_t pid = 0;

    friend auto operator==(UsbId const&, UsbId const&) -> bool = default;
};

struct Tablet {
    InternalID                 internalId;
    std::optional<std::string> name;
    std::optional<UsbId>       usbId;

    friend auto operator<<(std::ostream& os, Tablet const& tablet) -> std::ostream&;
};

} // namespace TS
