#pragma once
#include "core/InternalID.hpp"

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace TS {

/**
 * Handles for live protocol proxies. Every tracked proxy gets a fresh handle,
 * so an id never refers to two objects even when the allocator reuses a proxy
 * address.
 *
 * A proxy may be tracked under an owner. Pad groups belong to their pad, rings
 * and strips to their group; releasing the owner destroys the whole subtree,
 * children first, since the protocol never announces their removal.
 */
class WaylandProxyTable {
public:
    using Destroy = void (*)(void* proxy);

    WaylandProxyTable() = default;
    // Destroys whatever is still tracked.
    ~WaylandProxyTable();

    WaylandProxyTable(WaylandProxyTable const&)                    = delete;
    auto operator=(WaylandProxyTable const&) -> WaylandProxyTable& = delete;

    auto track(void* proxy, Destroy destroy, void* owner = nullptr) -> WaylandId;
    // Handle 0 for anything not tracked.
    [[nodiscard]] auto id(void* proxy) const -> WaylandId;
    auto release(void* proxy) -> void;
    auto clear() -> void;

    [[nodiscard]] auto size() const -> std::size_t { return entries_.size(); }

private:
    struct Entry {
        std::uint64_t      handle  = 0;
        Destroy            destroy = nullptr;
        void*              owner   = nullptr;
        std::vector<void*> children;
    };

    auto releaseSubtree_(void* proxy) -> void;

    std::uint64_t                      nextHandle_ = 1;
    phmap::flat_hash_map<void*, Entry> entries_;
};

} // namespace TS
