#pragma once
#include "core/Error.hpp"
#include "core/InternalID.hpp"
#include "device/Pad.hpp"

#include <algorithm>
#include <optional>
#include <span>
#include <vector>

namespace TS {

// Consistency check run when a construction burst is finalized.
template <typename T>
auto validateRecord(T const&) -> Expected<void> {
    return {};
}

inline auto validateRecord(Pad const& pad) -> Expected<void> {
    if (pad.groups.empty())
        return std::unexpected(Error{Error::Code::ValidationFailed, "pad announced without any group"});
    return {};
}

/**
 * Records under construction plus the finished ones, for protocols that
 * announce an object and then stream its properties until a "done" message.
 *
 * A record is only visible through finished() once finalize() accepted it, so
 * consumers never observe a half-described device. Both tables are small and
 * scanned linearly.
 */
template <typename T, typename Id>
class ConstructionTable {
public:
    // Record for `id` that is still being described, created on first use.
    // A finished record with the same id means the server restarted a burst
    // for a live object.
    auto beginOrGet(Id const& id) -> Expected<T*> {
        if (this->findFinished(id) != nullptr)
            return std::unexpected(Error{Error::Code::AlreadyFinalized, "construction message for a finalized object"});
        if (auto* existing = this->findConstructing(id))
            return existing;
        T record{};
        record.internalId = InternalID{id};
        this->constructing.push_back(std::move(record));
        return &this->constructing.back();
    }

    // nullopt when nothing is under construction for `id`. A record failing
    // validation is dropped and its error returned.
    auto finalize(Id const& id) -> std::optional<Expected<T*>> {
        auto it = this->constructingPosition(id);
        if (it == this->constructing.end())
            return std::nullopt;
        T record = std::move(*it);
        this->constructing.erase(it);
        if (auto valid = validateRecord(record); !valid)
            return std::optional<Expected<T*>>{std::unexpected(valid.error())};
        this->done.push_back(std::move(record));
        return std::optional<Expected<T*>>{&this->done.back()};
    }

    // Drops an in-progress record only. Finished records stay readable.
    auto abandon(Id const& id) -> void {
        std::erase_if(this->constructing, [&](T const& record) { return idMatches(record.internalId, id); });
    }

    auto destroy(Id const& id) -> void {
        this->abandon(id);
        std::erase_if(this->done, [&](T const& record) { return idMatches(record.internalId, id); });
    }

    auto clear() -> void {
        this->constructing.clear();
        this->done.clear();
    }

    [[nodiscard]] auto findConstructing(Id const& id) -> T* {
        auto it = this->constructingPosition(id);
        return it == this->constructing.end() ? nullptr : &*it;
    }

    [[nodiscard]] auto findFinished(Id const& id) -> T* {
        auto it = std::find_if(this->done.begin(), this->done.end(), [&](T const& record) { return idMatches(record.internalId, id); });
        return it == this->done.end() ? nullptr : &*it;
    }

    [[nodiscard]] auto finished() const -> std::span<T const> { return this->done; }
    [[nodiscard]] auto pendingCount() const -> std::size_t { return this->constructing.size(); }

private:
    auto constructingPosition(Id const& id) -> typename std::vector<T>::iterator {
        return std::find_if(this->constructing.begin(), this->constructing.end(), [&](T const& record) { return idMatches(record.internalId, id); });
    }

    std::vector<T> constructing;
    std::vector<T> done;
};

} // namespace TS
