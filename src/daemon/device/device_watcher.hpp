#pragma once

#include "events.hpp"
#include "platform/device_probe.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <set>
#include <stop_token>
#include <string>
#include <thread>

// Polls the device probe on a fixed interval and turns the level-triggered
// device list into DeviceConnected / DeviceDisconnected edges.
class DeviceWatcher {
public:
    DeviceWatcher(DeviceProbe& probe, EventSink& sink, std::chrono::milliseconds interval);
    ~DeviceWatcher();

    DeviceWatcher(const DeviceWatcher&) = delete;
    DeviceWatcher& operator=(const DeviceWatcher&) = delete;

    // Returns false if the polling thread is already running.
    bool start();

    // Wakes a sleeping loop and joins it. A probe call in flight completes first.
    void stop();

    bool running() const;

    // Last successful enumeration.
    std::set<std::string> snapshot() const;

    // One diff cycle: probe, diff, replace snapshot, emit.
    void poll_once();

private:
    void run(std::stop_token st);
    // Sink failures are logged and never interrupt polling.
    void deliver(Event event);

    DeviceProbe& probe_;
    EventSink& sink_;
    std::chrono::milliseconds interval_;

    mutable std::mutex mutex_;
    std::set<std::string> devices_;

    std::mutex sleep_mutex_;
    std::condition_variable_any wake_;
    std::jthread thread_;
};
