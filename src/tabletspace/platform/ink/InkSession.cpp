#include "platform/ink/InkSession.hpp"
#include "log/TaggedLogger.hpp"

#include <exception>
#include <span>
#include <string>
#include <vector>

namespace TS {

InkSession::InkSession(InkHost& host, InkPacketLayout layout)
    : host_(host), layout_(std::move(layout)) {
    shared_.setHimetricToPx(host_.himetricToPx());
}

auto InkSession::poison() -> void {
    poisoned_.store(true, std::memory_order_seq_cst);
}

auto InkSession::poisonBail() const -> Expected<void> {
    if (poisoned_.load(std::memory_order_relaxed))
        return std::unexpected(Error{Error::Code::Poisoned, "ink session poisoned"});
    return {};
}

template <typename F>
auto InkSession::guarded(char const* callback, F&& body) -> Expected<void> {
    if (auto bail = this->poisonBail(); !bail)
        return bail;
    try {
        return body();
    } catch (std::exception const& ex) {
        this->poison();
        ts_log(std::string{callback} + " threw: " + ex.what(), "Ink", "Poison");
        return std::unexpected(Error{Error::Code::UnknownError, std::string{callback} + ": " + ex.what()});
    } catch (...) {
        // Hresult wrappers and host code may throw anything; none of it may
        // cross the COM boundary.
        this->poison();
        ts_log(std::string{callback} + " threw a non-standard exception", "Ink", "Poison");
        return std::unexpected(Error{Error::Code::UnknownError, std::string{callback} + ": non-standard exception in ink callback"});
    }
}

auto InkSession::lookupCursor(std::uint32_t sid) -> std::optional<InkCursorInfo> {
    {
        std::lock_guard lock{mutex_};
        if (shared_.hasTool(sid))
            return std::nullopt;
    }
    auto cursor = host_.cursor(sid);
    if (!cursor) {
        ts_log("No cursor for stylus " + std::to_string(sid) + ": " + describeError(cursor.error()), "Ink");
        return std::nullopt;
    }
    return std::move(*cursor);
}

auto InkSession::realTimeStylusEnabled(std::uint32_t tabletCount, std::uint32_t const* tcids) -> Expected<void> {
    return this->guarded("RealTimeStylusEnabled", [&]() -> Expected<void> {
        Poison poison{poisoned_};
        if (tabletCount > kMaxEnabledTablets)
            return std::unexpected(Error{Error::Code::InvalidArgument, "more than 8 tablets enabled"});
        if (tabletCount > 0 && !tcids)
            return std::unexpected(Error{Error::Code::NullPointer, "tablet context ids"});

        std::vector<std::pair<std::uint32_t, InkTabletInfo>> arrived;
        for (auto tcid : std::span{tcids, tabletCount}) {
            auto info = host_.tablet(tcid);
            if (!info)
                return std::unexpected(info.error());
            arrived.emplace_back(tcid, std::move(*info));
        }
        {
            std::lock_guard lock{mutex_};
            for (auto const& [tcid, info] : arrived)
                shared_.appendTablet(layout_, tcid, info);
        }
        poison.disarm();
        ts_log("Stylus enabled with " + std::to_string(tabletCount) + " tablets", "Ink");
        return {};
    });
}

auto InkSession::tabletAdded(std::uint32_t tcid) -> Expected<void> {
    return this->guarded("TabletAdded", [&]() -> Expected<void> {
        Poison poison{poisoned_};
        auto   info = host_.tablet(tcid);
        if (!info)
            return std::unexpected(info.error());
        {
            std::lock_guard lock{mutex_};
            shared_.appendTablet(layout_, tcid, *info);
        }
        poison.disarm();
        return {};
    });
}

auto InkSession::tabletRemoved(std::int32_t index) -> Expected<void> {
    return this->guarded("TabletRemoved", [&]() -> Expected<void> {
        Poison         poison{poisoned_};
        Expected<void> removed;
        {
            std::lock_guard lock{mutex_};
            removed = shared_.deleteTabletByIndex(index);
        }
        if (!removed) {
            ts_log("Removal of unknown tablet index " + std::to_string(index), "Ink", "Poison");
            return removed;
        }
        poison.disarm();
        return {};
    });
}

auto InkSession::stylusTransition(InkStylusInfo const* stylus, std::uint32_t propertyCount, std::int32_t const* packet, StylusPhase phase) -> Expected<void> {
    if (propertyCount > kMaxPacketProperties)
        return std::unexpected(Error{Error::Code::InvalidArgument, "more than 32 packet properties"});
    if (propertyCount > 0 && !packet)
        return std::unexpected(Error{Error::Code::NullPointer, "packet"});
    if (!stylus)
        return std::unexpected(Error{Error::Code::NullPointer, "stylus info"});
    auto const      cursor = this->lookupCursor(stylus->sid);
    std::lock_guard lock{mutex_};
    shared_.handlePackets(*stylus, cursor ? &*cursor : nullptr, 1, std::span{packet, propertyCount}, phase);
    return {};
}

auto InkSession::packetBatch(InkStylusInfo const* stylus, std::uint32_t packetCount, std::uint32_t wordCount, std::int32_t const* words, StylusPhase phase) -> Expected<void> {
    if (wordCount > kMaxPacketWords)
        return std::unexpected(Error{Error::Code::InvalidArgument, "packet buffer too long"});
    if (wordCount > 0 && !words)
        return std::unexpected(Error{Error::Code::NullPointer, "packet buffer"});
    if (!stylus)
        return std::unexpected(Error{Error::Code::NullPointer, "stylus info"});
    auto const      cursor = this->lookupCursor(stylus->sid);
    std::lock_guard lock{mutex_};
    shared_.handlePackets(*stylus, cursor ? &*cursor : nullptr, packetCount, std::span{words, wordCount}, phase);
    return {};
}

auto InkSession::stylusDown(InkStylusInfo const* stylus, std::uint32_t propertyCount, std::int32_t const* packet) -> Expected<void> {
    return this->guarded("StylusDown", [&] { return this->stylusTransition(stylus, propertyCount, packet, StylusPhase::Touched); });
}

auto InkSession::stylusUp(InkStylusInfo const* stylus, std::uint32_t propertyCount, std::int32_t const* packet) -> Expected<void> {
    return this->guarded("StylusUp", [&] { return this->stylusTransition(stylus, propertyCount, packet, StylusPhase::InAir); });
}

auto InkSession::inAirPackets(InkStylusInfo const* stylus, std::uint32_t packetCount, std::uint32_t wordCount, std::int32_t const* words) -> Expected<void> {
    return this->guarded("InAirPackets", [&] { return this->packetBatch(stylus, packetCount, wordCount, words, StylusPhase::InAir); });
}

auto InkSession::packets(InkStylusInfo const* stylus, std::uint32_t packetCount, std::uint32_t wordCount, std::int32_t const* words) -> Expected<void> {
    return this->guarded("Packets", [&] { return this->packetBatch(stylus, packetCount, wordCount, words, StylusPhase::Touched); });
}

auto InkSession::stylusOutOfRange(std::uint32_t sid) -> Expected<void> {
    return this->guarded("StylusOutOfRange", [&]() -> Expected<void> {
        std::lock_guard lock{mutex_};
        shared_.stylusOutOfRange(sid);
        return {};
    });
}

auto InkSession::stylusButton(std::uint32_t sid, std::array<std::uint8_t, 16> const* guid, bool pressed) -> Expected<void> {
    return this->guarded(pressed ? "StylusButtonDown" : "StylusButtonUp", [&]() -> Expected<void> {
        if (!guid)
            return std::unexpected(Error{Error::Code::NullPointer, "button guid"});
        std::lock_guard lock{mutex_};
        shared_.stylusButton(sid, ButtonId::fromGuid(*guid), pressed);
        return {};
    });
}

auto InkSession::updateMapping() -> Expected<void> {
    return this->guarded("UpdateMapping", [&]() -> Expected<void> {
        auto const scale = host_.himetricToPx();
        std::lock_guard lock{mutex_};
        shared_.setHimetricToPx(scale);
        return {};
    });
}

auto InkSession::snapshot(InkFrame& local) -> Expected<void> {
    if (!poisoned_.load(std::memory_order_relaxed)) {
        std::lock_guard lock{mutex_};
        local = shared_;
        shared_.frameEndCleanup();
        return {};
    }

    ts_log("Recovering poisoned ink session", "Ink", "Poison");
    // The disable and the queue flush have to land before the reset.
    if (auto disabled = host_.disable(); !disabled)
        return std::unexpected(disabled.error());
    if (auto cleared = host_.clearQueues(); !cleared)
        return std::unexpected(cleared.error());

    auto const scale = host_.himetricToPx();
    {
        std::lock_guard lock{mutex_};
        shared_.reset();
        shared_.setHimetricToPx(scale);
    }
    local.reset();
    local.setHimetricToPx(scale);
    poisoned_.store(false, std::memory_order_seq_cst);

    if (auto enabled = host_.enable(); !enabled)
        return std::unexpected(enabled.error());
    return std::unexpected(Error{Error::Code::Poisoned, "ink session was reset"});
}

} // namespace TS
