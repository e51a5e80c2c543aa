#ifdef TS_LOG_DEBUG
#include "TaggedLogger.hpp"

#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace TS {

namespace {

// "parent/file.cpp", enough to tell backends apart.
auto shortSource(char const* file) -> std::string {
    std::filesystem::path const path{file};
    auto const                  parent = path.parent_path().filename();
    return parent.empty() ? path.filename().string() : (parent / path.filename()).string();
}

auto formatLine(TaggedLogger::Record const& record) -> std::string {
    auto const seconds = std::chrono::system_clock::to_time_t(record.when);
    auto const millis  = std::chrono::duration_cast<std::chrono::milliseconds>(record.when.time_since_epoch()).count() % 1000;
    std::tm    local{};
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif

    std::ostringstream line;
    line << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis << ' ';
    for (auto const& tag : record.tags)
        line << '[' << tag << ']';
    line << " [" << record.thread << "] [" << shortSource(record.where.file_name()) << ':' << record.where.line() << "] "
         << record.text << '\n';
    return line.str();
}

} // namespace

std::mutex TaggedLogger::outputMutex;

auto logger() -> TaggedLogger& {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger() {
    this->writer = std::thread([this] { this->run(); });
}

TaggedLogger::~TaggedLogger() {
    {
        std::lock_guard lock{this->pendingMutex};
        this->stopping = true;
    }
    this->wake.notify_one();
    if (this->writer.joinable())
        this->writer.join();
}

auto TaggedLogger::setThreadName(std::string const& name) -> void {
    std::lock_guard lock{this->namesMutex};
    this->names[std::this_thread::get_id()] = name;
}

auto TaggedLogger::setLoggingEnabled(bool on) -> void {
    this->enabled.store(on, std::memory_order_relaxed);
}

auto TaggedLogger::setSkipTags(std::set<std::string> tags) -> void {
    std::lock_guard lock{this->filterMutex};
    this->skipTags = std::move(tags);
}

auto TaggedLogger::setEnabledTags(std::set<std::string> tags) -> void {
    std::lock_guard lock{this->filterMutex};
    this->enabledTags = std::move(tags);
}

auto TaggedLogger::setCapacity(std::size_t records) -> void {
    std::lock_guard lock{this->pendingMutex};
    this->capacity = records;
}

auto TaggedLogger::flush() -> void {
    std::unique_lock lock{this->pendingMutex};
    this->idle.wait(lock, [this] { return this->pending.empty() && !this->busy; });
}

auto TaggedLogger::accepts(std::set<std::string> const& tags) const -> bool {
    std::lock_guard lock{this->filterMutex};
    for (auto const& tag : tags) {
        if (this->skipTags.contains(tag))
            return false;
        if (!this->enabledTags.empty() && !this->enabledTags.contains(tag))
            return false;
    }
    return true;
}

auto TaggedLogger::enqueue(Record record) -> void {
    {
        std::lock_guard lock{this->pendingMutex};
        if (this->pending.size() >= this->capacity) {
            this->droppedRecords.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        this->pending.push_back(std::move(record));
    }
    this->wake.notify_one();
}

auto TaggedLogger::run() -> void {
    std::unique_lock lock{this->pendingMutex};
    for (;;) {
        this->wake.wait(lock, [this] { return this->stopping || !this->pending.empty(); });
        while (!this->pending.empty()) {
            auto record = std::move(this->pending.front());
            this->pending.pop_front();
            this->busy = true;
            lock.unlock();
            this->write(record);
            lock.lock();
            this->busy = false;
        }
        this->idle.notify_all();
        if (this->stopping)
            return;
    }
}

auto TaggedLogger::write(Record const& record) const -> void {
    auto const line = formatLine(record);
    std::lock_guard lock{outputMutex};
    std::cerr << line << std::flush;
}

auto TaggedLogger::threadName() -> std::string {
    std::lock_guard lock{this->namesMutex};
    auto [it, inserted] = this->names.try_emplace(std::this_thread::get_id());
    if (inserted)
        it->second = "Thread " + std::to_string(this->unnamedThreads++);
    return it->second;
}

auto set_thread_name(std::string const& name) -> void {
    logger().setThreadName(name);
}

auto set_logging_enabled(bool enabled) -> void {
    logger().setLoggingEnabled(enabled);
}

} // namespace TS
#endif // TS_LOG_DEBUG
