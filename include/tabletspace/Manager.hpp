#pragma once
#include "core/Error.hpp"
#include "core/InternalID.hpp"
#include "device/Pad.hpp"
#include "device/Tablet.hpp"
#include "device/Tool.hpp"
#include "events/Events.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace TS {

class Platform;

/**
 * Owns exactly one tablet backend. Everything returned by the accessors, and
 * every pointer inside the events, stays valid until the next pump().
 *
 * Built through Builder. The Manager must be dropped before the display or
 * window it was built from, unless it was given shared ownership of it.
 */
class Manager {
public:
    explicit Manager(std::unique_ptr<Platform> platform, std::shared_ptr<void> handleOwner = {});
    ~Manager();

    Manager(Manager&&) noexcept;
    auto operator=(Manager&&) noexcept -> Manager&;
    Manager(Manager const&)                    = delete;
    auto operator=(Manager const&) -> Manager& = delete;

    // Processes whatever the backend has buffered, without blocking. On
    // failure the last known state stays readable.
    auto pump() -> Expected<void>;

    [[nodiscard]] auto tools() const -> std::span<Tool const>;
    [[nodiscard]] auto tablets() const -> std::span<Tablet const>;
    [[nodiscard]] auto pads() const -> std::span<Pad const>;

    // Events of the last pump, in arrival order. Events naming objects that
    // are gone are skipped.
    [[nodiscard]] auto events() const -> std::vector<Event>;

    [[nodiscard]] auto timestampGranularity() const -> std::optional<std::chrono::microseconds>;
    // Not meaningful on a Manager that was moved from or built without a
    // backend.
    [[nodiscard]] auto backend() const -> Backend;

private:
    // Declared first so the backend is torn down before the handle it uses.
    std::shared_ptr<void>     handleOwner;
    std::unique_ptr<Platform> platform;
};

} // namespace TS
