#pragma once
#ifdef TS_LOG_DEBUG
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <set>
#include <source_location>
#include <string>
#include <thread>
#include <unordered_map>

namespace TS {

/**
 * Asynchronous stderr logger. Callers only format the record and queue it, a
 * worker thread does the writing, so the Ink callback thread never waits on
 * the terminal.
 *
 * Filtering happens before queueing. A record is dropped when any of its tags
 * is skipped, or when an enabled set is given and one of its tags is not in
 * it. The queue is bounded; when the writer falls behind the newest records
 * are discarded and counted.
 */
class TaggedLogger {
public:
    struct Record {
        std::chrono::system_clock::time_point when;
        std::set<std::string>                 tags;
        std::string                           text;
        std::string                           thread;
        std::source_location                  where;
    };

    static constexpr std::size_t kDefaultCapacity = 4096;

    TaggedLogger();
    ~TaggedLogger();

    TaggedLogger(TaggedLogger const&)                    = delete;
    auto operator=(TaggedLogger const&) -> TaggedLogger& = delete;

    template <typename... Tags>
    auto log_impl(std::string const& text, std::source_location const& where, Tags&&... tags) -> void;

    auto setThreadName(std::string const& name) -> void;
    auto setLoggingEnabled(bool enabled) -> void;
    auto setSkipTags(std::set<std::string> tags) -> void;
    auto setEnabledTags(std::set<std::string> tags) -> void;
    auto setCapacity(std::size_t records) -> void;
    // Blocks until everything queued so far is written.
    auto flush() -> void;

    [[nodiscard]] auto dropped() const -> std::size_t { return droppedRecords.load(std::memory_order_relaxed); }

    // Held while a line goes to stderr. Test reporters take it too.
    static std::mutex outputMutex;

private:
    auto accepts(std::set<std::string> const& tags) const -> bool;
    auto enqueue(Record record) -> void;
    auto run() -> void;
    auto write(Record const& record) const -> void;
    auto threadName() -> std::string;

    std::deque<Record>      pending;
    std::size_t             capacity = kDefaultCapacity;
    bool                    busy     = false;
    bool                    stopping = false;
    mutable std::mutex      pendingMutex;
    std::condition_variable wake;
    std::condition_variable idle;

    // Per-packet tags are too chatty for a default session.
    std::set<std::string> skipTags{"Frame", "Packet"};
    std::set<std::string> enabledTags;
    mutable std::mutex    filterMutex;

    std::unordered_map<std::thread::id, std::string> names;
    std::mutex                                       namesMutex;
    int                                              unnamedThreads = 0;

    std::atomic<bool>        enabled{false};
    std::atomic<std::size_t> droppedRecords{0};
    std::thread              writer;
};

auto logger() -> TaggedLogger&;

template <typename... Tags>
auto TaggedLogger::log_impl(std::string const& text, std::source_location const& where, Tags&&... tags) -> void {
    if (!this->enabled.load(std::memory_order_relaxed))
        return;
    std::set<std::string> tagSet{std::string(std::forward<Tags>(tags))...};
    if (!this->accepts(tagSet))
        return;
    this->enqueue(Record{.when   = std::chrono::system_clock::now(),
                         .tags   = std::move(tagSet),
                         .text   = text,
                         .thread = this->threadName(),
                         .where  = where});
}

auto set_thread_name(std::string const& name) -> void;
auto set_logging_enabled(bool enabled) -> void;

} // namespace TS

#define ts_log(message, ...) ::TS::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)

#else
#define ts_log(message, ...) ((void)0)
#endif // TS_LOG_DEBUG
