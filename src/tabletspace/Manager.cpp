#include "Manager.hpp"
#include "events/EventResolver.hpp"
#include "log/TaggedLogger.hpp"
#include "platform/Platform.hpp"

namespace TS {

Manager::Manager(std::unique_ptr<Platform> platform, std::shared_ptr<void> handleOwner)
    : handleOwner(std::move(handleOwner)), platform(std::move(platform)) {}

Manager::~Manager() = default;

Manager::Manager(Manager&&) noexcept = default;

auto Manager::operator=(Manager&& other) noexcept -> Manager& {
    // Old backend first, then the handle it was using.
    this->platform    = std::move(other.platform);
    this->handleOwner = std::move(other.handleOwner);
    return *this;
}

auto Manager::pump() -> Expected<void> {
    if (!this->platform)
        return std::unexpected(Error{Error::Code::TransportFailure, "manager has no backend"});
    auto pumped = this->platform->pump();
    if (!pumped)
        ts_log("Pump failed: " + describeError(pumped.error()), "Manager", "Error");
    return pumped;
}

auto Manager::tools() const -> std::span<Tool const> {
    return this->platform ? this->platform->tools() : std::span<Tool const>{};
}

auto Manager::tablets() const -> std::span<Tablet const> {
    return this->platform ? this->platform->tablets() : std::span<Tablet const>{};
}

auto Manager::pads() const -> std::span<Pad const> {
    return this->platform ? this->platform->pads() : std::span<Pad const>{};
}

auto Manager::events() const -> std::vector<Event> {
    if (!this->platform)
        return {};
    DeviceView const view{this->tools(), this->tablets(), this->pads()};
    return std::visit([&](auto raw) { return resolveAll(raw, view); }, this->platform->rawEvents());
}

auto Manager::timestampGranularity() const -> std::optional<std::chrono::microseconds> {
    if (!this->platform)
        return std::nullopt;
    return this->platform->timestampGranularity();
}

auto Manager::backend() const -> Backend {
    return this->platform ? this->platform->backend() : Backend::Wayland;
}

} // namespace TS
