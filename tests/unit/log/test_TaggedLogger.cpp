#include <doctest/doctest.h>
#include "log/TaggedLogger.hpp"

#ifdef TS_LOG_DEBUG
#include <cstddef>
#include <functional>
#include <iostream>
#include <source_location>
#include <sstream>
#include <string>

namespace {

auto captureStderr(std::function<void(TS::TaggedLogger&)> fn) -> std::string {
    std::ostringstream captured;
    auto*              previous = std::cerr.rdbuf(captured.rdbuf());
    {
        TS::TaggedLogger logger;
        fn(logger);
        logger.flush();
    }
    std::cerr.rdbuf(previous);
    return captured.str();
}

} // namespace

TEST_SUITE("log") {

TEST_CASE("A disabled logger writes nothing") {
    auto output = captureStderr([](TS::TaggedLogger& logger) {
        logger.log_impl("should not appear", std::source_location::current(), "Manager");
    });
    CHECK(output.empty());
}

TEST_CASE("Lines carry tags, thread and text") {
    auto output = captureStderr([](TS::TaggedLogger& logger) {
        logger.setLoggingEnabled(true);
        logger.log_impl("session poisoned", std::source_location::current(), "Ink", "Poison");
    });
    CHECK(output.find("[Ink][Poison]") != std::string::npos);
    CHECK(output.find("session poisoned") != std::string::npos);
    CHECK(output.find("Thread 0") != std::string::npos);
}

TEST_CASE("Per-packet tags are skipped by default") {
    auto output = captureStderr([](TS::TaggedLogger& logger) {
        logger.setLoggingEnabled(true);
        logger.log_impl("frame noise", std::source_location::current(), "Frame");
        logger.log_impl("packet noise", std::source_location::current(), "Ink", "Packet");
    });
    CHECK(output.empty());
}

TEST_CASE("Clearing the skip set lets packet logs through") {
    auto output = captureStderr([](TS::TaggedLogger& logger) {
        logger.setLoggingEnabled(true);
        logger.setSkipTags({});
        logger.log_impl("packet detail", std::source_location::current(), "Packet");
    });
    CHECK(output.find("packet detail") != std::string::npos);
}

TEST_CASE("An enabled set rejects records with other tags") {
    auto accepted = captureStderr([](TS::TaggedLogger& logger) {
        logger.setLoggingEnabled(true);
        logger.setEnabledTags({"XInput2"});
        logger.log_impl("device rescan", std::source_location::current(), "XInput2");
    });
    CHECK(accepted.find("device rescan") != std::string::npos);

    auto rejected = captureStderr([](TS::TaggedLogger& logger) {
        logger.setLoggingEnabled(true);
        logger.setEnabledTags({"XInput2"});
        logger.log_impl("mixed record", std::source_location::current(), "XInput2", "Wayland");
    });
    CHECK(rejected.empty());
}

TEST_CASE("Named threads are reported by name") {
    auto output = captureStderr([](TS::TaggedLogger& logger) {
        logger.setLoggingEnabled(true);
        logger.setThreadName("Pump-1");
        logger.log_impl("with name", std::source_location::current(), "Manager");
    });
    CHECK(output.find("[Pump-1]") != std::string::npos);
}

TEST_CASE("A full queue drops and counts records") {
    std::size_t dropped = 0;
    auto        output  = captureStderr([&](TS::TaggedLogger& logger) {
        logger.setLoggingEnabled(true);
        logger.setCapacity(0);
        logger.log_impl("no room", std::source_location::current(), "Ink");
        logger.log_impl("still no room", std::source_location::current(), "Ink");
        dropped = logger.dropped();
    });
    CHECK(output.empty());
    CHECK(dropped == 2);
}

TEST_CASE("Filtered records are not counted as dropped") {
    std::size_t dropped = 1;
    captureStderr([&](TS::TaggedLogger& logger) {
        logger.setLoggingEnabled(true);
        logger.setCapacity(0);
        logger.log_impl("skipped", std::source_location::current(), "Frame");
        dropped = logger.dropped();
    });
    CHECK(dropped == 0);
}

TEST_CASE("Source locations keep the parent directory") {
    auto output = captureStderr([](TS::TaggedLogger& logger) {
        logger.setLoggingEnabled(true);
#line 42 "platform/wayland/WaylandPump.cpp"
        logger.log_impl("dispatching", std::source_location::current(), "Wayland");
#line 100 "tests/unit/log/test_TaggedLogger.cpp"
    });
    CHECK(output.find("wayland/WaylandPump.cpp:42") != std::string::npos);
}

} // TEST_SUITE

#else

TEST_CASE("log macro compiles away without TS_LOG_DEBUG") {
    ts_log("ignored", "Manager");
    CHECK(true);
}

#endif // TS_LOG_DEBUG
