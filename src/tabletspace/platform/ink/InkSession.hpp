#pragma once
#include "platform/ink/InkFrame.hpp"
#include "platform/ink/InkHost.hpp"
#include "platform/ink/InkPacket.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>

namespace TS {

/**
 * Receiving end of the stylus plugin. Every callback method runs on the
 * driver's thread and only ever takes the frame mutex; snapshot() runs on the
 * pumping thread.
 *
 * The plugin's tablet list has to stay in lockstep with the stylus'. When a
 * callback that changes it fails halfway, or anything throws out of a
 * callback, the session is poisoned: further callbacks are refused and the
 * next snapshot() resets everything and re-enables the stylus.
 */
class InkSession {
public:
    static constexpr std::uint32_t kMaxEnabledTablets = 8;
    static constexpr std::uint32_t kMaxPacketProperties = 32;
    static constexpr std::uint32_t kMaxPacketWords = 0x7FFF;

    InkSession(InkHost& host, InkPacketLayout layout);

    InkSession(InkSession const&)                    = delete;
    auto operator=(InkSession const&) -> InkSession& = delete;

    auto realTimeStylusEnabled(std::uint32_t tabletCount, std::uint32_t const* tcids) -> Expected<void>;
    auto tabletAdded(std::uint32_t tcid) -> Expected<void>;
    auto tabletRemoved(std::int32_t index) -> Expected<void>;

    auto stylusDown(InkStylusInfo const* stylus, std::uint32_t propertyCount, std::int32_t const* packet) -> Expected<void>;
    auto stylusUp(InkStylusInfo const* stylus, std::uint32_t propertyCount, std::int32_t const* packet) -> Expected<void>;
    auto inAirPackets(InkStylusInfo const* stylus, std::uint32_t packetCount, std::uint32_t wordCount, std::int32_t const* words) -> Expected<void>;
    auto packets(InkStylusInfo const* stylus, std::uint32_t packetCount, std::uint32_t wordCount, std::int32_t const* words) -> Expected<void>;
    auto stylusOutOfRange(std::uint32_t sid) -> Expected<void>;
    auto stylusButton(std::uint32_t sid, std::array<std::uint8_t, 16> const* guid, bool pressed) -> Expected<void>;
    // DPI changed.
    auto updateMapping() -> Expected<void>;

    /**
     * Copies the shared frame into `local` and starts the next frame. When
     * poisoned, recovers instead: both frames are emptied, the stylus is
     * restarted and the result is Poisoned.
     */
    auto snapshot(InkFrame& local) -> Expected<void>;

    [[nodiscard]] auto poisoned() const -> bool { return poisoned_.load(std::memory_order_relaxed); }
    // Exposed for the adapter's own failure paths.
    auto poison() -> void;

private:
    // Sets the poison flag on destruction unless disarmed.
    class Poison {
    public:
        explicit Poison(std::atomic<bool>& flag) : flag_(flag) {}
        ~Poison() {
            if (armed_)
                flag_.store(true, std::memory_order_seq_cst);
        }
        Poison(Poison const&)                    = delete;
        auto operator=(Poison const&) -> Poison& = delete;

        auto disarm() -> void { armed_ = false; }

    private:
        std::atomic<bool>& flag_;
        bool               armed_ = true;
    };

    auto poisonBail() const -> Expected<void>;
    // Runs a callback body, turning an escaping exception into poison.
    template <typename F>
    auto guarded(char const* callback, F&& body) -> Expected<void>;

    // The cursor of a stylus the shared frame has not seen yet. The host is
    // queried without holding the frame mutex.
    auto lookupCursor(std::uint32_t sid) -> std::optional<InkCursorInfo>;
    auto stylusTransition(InkStylusInfo const* stylus, std::uint32_t propertyCount, std::int32_t const* packet, StylusPhase phase) -> Expected<void>;
    auto packetBatch(InkStylusInfo const* stylus, std::uint32_t packetCount, std::uint32_t wordCount, std::int32_t const* words, StylusPhase phase) -> Expected<void>;

    InkHost&          host_;
    InkPacketLayout   layout_;
    std::atomic<bool> poisoned_{false};
    std::mutex        mutex_;
    InkFrame          shared_;
};

} // namespace TS
