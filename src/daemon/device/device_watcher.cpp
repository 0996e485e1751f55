#include "device/device_watcher.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <print>

DeviceWatcher::DeviceWatcher(DeviceProbe& probe, EventSink& sink,
                             std::chrono::milliseconds interval)
    : probe_(probe), sink_(sink), interval_(interval) {}

DeviceWatcher::~DeviceWatcher() {
    stop();
}

bool DeviceWatcher::start() {
    if (thread_.joinable()) return false;
    thread_ = std::jthread([this](std::stop_token st) { run(st); });
    return true;
}

void DeviceWatcher::stop() {
    if (!thread_.joinable()) return;
    thread_.request_stop();
    thread_.join();
    thread_ = std::jthread();
}

bool DeviceWatcher::running() const {
    return thread_.joinable();
}

std::set<std::string> DeviceWatcher::snapshot() const {
    std::lock_guard lock(mutex_);
    return devices_;
}

void DeviceWatcher::poll_once() {
    auto result = probe_.enumerate_devices();
    if (!result) {
        // Recoverable: keep the previous snapshot and try again next cycle.
        std::println(stderr, "watcher: device probe failed: {}", result.error());
        deliver(DiagnosticLog{"device probe failed: " + result.error()});
        return;
    }

    std::set<std::string> current(result->begin(), result->end());
    std::set<std::string> added;
    std::set<std::string> removed;
    {
        std::lock_guard lock(mutex_);
        std::ranges::set_difference(current, devices_, std::inserter(added, added.end()));
        std::ranges::set_difference(devices_, current, std::inserter(removed, removed.end()));
        devices_ = std::move(current);
    }

    if (!added.empty()) deliver(DeviceConnected{std::move(added)});
    if (!removed.empty()) deliver(DeviceDisconnected{std::move(removed)});
}

void DeviceWatcher::deliver(Event event) {
    try {
        sink_.emit(std::move(event));
    } catch (const std::exception& e) {
        std::println(stderr, "watcher: event delivery failed: {}", e.what());
    }
}

void DeviceWatcher::run(std::stop_token st) {
    while (!st.stop_requested()) {
        poll_once();

        std::unique_lock lock(sleep_mutex_);
        wake_.wait_for(lock, st, interval_, [] { return false; });
    }
}
