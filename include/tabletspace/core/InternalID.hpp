#pragma once
#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>
#include <variant>

namespace TS {

enum class Backend : std::uint8_t {
    Wayland,
    XInput2,
    Ink,
};

[[nodiscard]] auto backendName(Backend backend) -> std::string_view;

// Wayland proxies get a fresh handle each, so handles are never reused.
struct WaylandId {
    std::uint64_t handle = 0;

    friend auto operator<=>(WaylandId const&, WaylandId const&) = default;
};

enum class XInput2Kind : std::uint8_t {
    Tool,
    Tablet,
    Pad,
    Group,
    Ring,
    Strip,
};

/**
 * X device ids are recycled by the server. The generation is bumped on every
 * hierarchy rescan so an id minted before the rescan never matches an object
 * created after it.
 */
struct XInput2Id {
    XInput2Kind   kind       = XInput2Kind::Tool;
    std::uint16_t device     = 0;
    std::uint16_t index      = 0;
    std::uint32_t generation = 0;

    friend auto operator<=>(XInput2Id const&, XInput2Id const&) = default;
};

enum class InkKind : std::uint8_t {
    Tablet,
    Stylus,
};

struct InkId {
    InkKind                     kind  = InkKind::Tablet;
    std::uint32_t               value = 0;
    std::optional<std::int32_t> cursorId;

    friend auto operator==(InkId const&, InkId const&) -> bool = default;
};

/**
 * Opaque identity of a tool, tablet, pad or pad component. Only comparable to
 * ids from the same Manager.
 */
class InternalID {
public:
    using Storage = std::variant<WaylandId, XInput2Id, InkId>;

    InternalID() = default;
    InternalID(WaylandId id) : storage(id) {}
    InternalID(XInput2Id id) : storage(id) {}
    InternalID(InkId id) : storage(id) {}

    [[nodiscard]] auto backend() const -> Backend { return static_cast<Backend>(this->storage.index()); }

    template <typename Id>
    [[nodiscard]] auto as() const -> Id const* {
        return std::get_if<Id>(&this->storage);
    }

    friend auto operator==(InternalID const&, InternalID const&) -> bool = default;
    friend auto operator<<(std::ostream& os, InternalID const& id) -> std::ostream&;

private:
    Storage storage;
};

// Backend-native id matching, so resolution code can compare raw ids against
// a record's InternalID without unwrapping the variant at every call site.
template <typename Id>
[[nodiscard]] auto idMatches(InternalID const& id, Id const& native) -> bool {
    auto const* own = id.as<Id>();
    return own != nullptr && *own == native;
}

} // namespace TS
