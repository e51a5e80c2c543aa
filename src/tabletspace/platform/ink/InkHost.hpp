#pragma once
#include "core/Error.hpp"
#include "platform/ink/InkPacket.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace TS {

// IInkCursor as far as tools care about it.
struct InkCursorInfo {
    std::optional<std::int32_t> cursorId;
    std::optional<std::string>  name;
    // Unknown when the cursor refused to say.
    std::optional<bool> inverted;
};

struct InkTabletInfo {
    std::optional<std::string> name;
    // nullopt when the packet description could not be queried. The tablet
    // then still takes a slot so later indices stay in sync.
    std::optional<std::vector<InkPropertyDescription>> properties;
};

// Fields of the StylusInfo passed with every packet callback.
struct InkStylusInfo {
    std::uint32_t tcid = 0;
    std::uint32_t sid  = 0;
};

/**
 * The RealTimeStylus object the session is plugged into. Queries are made from
 * the callback thread, the enable/disable calls from the pumping thread.
 */
class InkHost {
public:
    virtual ~InkHost() = default;

    virtual auto cursor(std::uint32_t sid) -> Expected<InkCursorInfo>   = 0;
    virtual auto tablet(std::uint32_t tcid) -> Expected<InkTabletInfo>  = 0;
    // Logical pixels per HIMETRIC unit for the window right now.
    virtual auto himetricToPx() -> float = 0;

    virtual auto disable() -> Expected<void>     = 0;
    virtual auto clearQueues() -> Expected<void> = 0;
    virtual auto enable() -> Expected<void>      = 0;
    // Detaches the plugin. No callbacks arrive afterwards.
    virtual auto shutdown() -> void = 0;
};

} // namespace TS
