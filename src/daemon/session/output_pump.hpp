#pragma once

#include "events.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

// Reads the stdout/stderr pipes of every session on one thread and emits each
// completed line as a SessionLog. A stream is closed and dropped at EOF; the
// pump never touches session state.
class OutputPump {
public:
    static constexpr size_t kMaxLineBytes = 64 * 1024;

    explicit OutputPump(EventSink& sink);
    ~OutputPump();

    OutputPump(const OutputPump&) = delete;
    OutputPump& operator=(const OutputPump&) = delete;

    bool start();
    void stop();

    // Takes ownership of fd.
    void add_stream(const std::string& device_id, int fd);

    // Streams not yet at EOF, including ones queued but not yet polled.
    size_t active_streams() const { return active_.load(std::memory_order_acquire); }

    // Block until every stream reached EOF or the timeout expired.
    bool wait_idle(std::chrono::milliseconds timeout) const;

private:
    struct Stream {
        std::string device_id;
        int fd;
        std::string pending;
    };

    void run(std::stop_token st);
    void wake();
    // Returns false once the stream is finished.
    bool pump_stream(Stream& stream);
    void emit_line(const std::string& device_id, std::string line);

    EventSink& sink_;
    int wake_fd_ = -1;

    std::mutex mutex_;
    std::vector<Stream> incoming_;
    std::atomic<size_t> active_{0};

    std::jthread thread_;
};
