#include "platform/wayland/WaylandProxyTable.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <utility>

namespace TS {

WaylandProxyTable::~WaylandProxyTable() {
    this->clear();
}

auto WaylandProxyTable::track(void* proxy, Destroy destroy, void* owner) -> WaylandId {
    auto const id = WaylandId{nextHandle_++};
    if (owner) {
        auto parent = entries_.find(owner);
        if (parent == entries_.end()) {
            ts_log("Owner of a new proxy is not tracked", "Wayland", "Error");
            owner = nullptr;
        } else {
            parent->second.children.push_back(proxy);
        }
    }
    entries_[proxy] = Entry{.handle = id.handle, .destroy = destroy, .owner = owner, .children = {}};
    return id;
}

auto WaylandProxyTable::id(void* proxy) const -> WaylandId {
    auto it = entries_.find(proxy);
    return it == entries_.end() ? WaylandId{0} : WaylandId{it->second.handle};
}

auto WaylandProxyTable::release(void* proxy) -> void {
    auto it = entries_.find(proxy);
    if (it == entries_.end())
        return;
    if (auto* owner = it->second.owner) {
        if (auto parent = entries_.find(owner); parent != entries_.end())
            std::erase(parent->second.children, proxy);
    }
    this->releaseSubtree_(proxy);
}

auto WaylandProxyTable::clear() -> void {
    std::vector<void*> roots;
    for (auto const& [proxy, entry] : entries_)
        if (!entry.owner)
            roots.push_back(proxy);
    for (auto* root : roots)
        this->releaseSubtree_(root);
}

auto WaylandProxyTable::releaseSubtree_(void* proxy) -> void {
    auto it = entries_.find(proxy);
    if (it == entries_.end())
        return;
    auto entry = std::move(it->second);
    entries_.erase(it);
    for (auto* child : entry.children)
        this->releaseSubtree_(child);
    if (entry.destroy)
        entry.destroy(proxy);
}

} // namespace TS
