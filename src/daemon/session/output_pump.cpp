#include "session/output_pump.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <exception>
#include <poll.h>
#include <print>
#include <string_view>
#include <sys/eventfd.h>
#include <unistd.h>

OutputPump::OutputPump(EventSink& sink) : sink_(sink) {}

OutputPump::~OutputPump() {
    stop();
    for (auto& s : incoming_) ::close(s.fd);
    incoming_.clear();
    if (wake_fd_ >= 0) ::close(wake_fd_);
}

bool OutputPump::start() {
    if (thread_.joinable()) return true;

    if (wake_fd_ < 0) {
        wake_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wake_fd_ < 0) {
            std::println(stderr, "session: eventfd failed: {}", std::strerror(errno));
            return false;
        }
    }

    thread_ = std::jthread([this](std::stop_token st) { run(st); });
    return true;
}

void OutputPump::stop() {
    if (!thread_.joinable()) return;
    thread_.request_stop();
    wake();
    thread_.join();
    thread_ = std::jthread();
}

void OutputPump::add_stream(const std::string& device_id, int fd) {
    {
        std::lock_guard lock(mutex_);
        incoming_.push_back({device_id, fd, {}});
    }
    active_.fetch_add(1, std::memory_order_acq_rel);
    wake();
}

bool OutputPump::wait_idle(std::chrono::milliseconds timeout) const {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (active_streams() > 0) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

void OutputPump::wake() {
    if (wake_fd_ < 0) return;
    uint64_t val = 1;
    if (::write(wake_fd_, &val, sizeof(val)) < 0 && errno != EAGAIN) {
        std::println(stderr, "session: pump wakeup failed: {}", std::strerror(errno));
    }
}

void OutputPump::run(std::stop_token st) {
    std::vector<Stream> streams;
    std::vector<pollfd> fds;

    while (!st.stop_requested()) {
        {
            std::lock_guard lock(mutex_);
            for (auto& s : incoming_) streams.push_back(std::move(s));
            incoming_.clear();
        }

        fds.clear();
        fds.push_back({.fd = wake_fd_, .events = POLLIN, .revents = 0});
        for (auto& s : streams) {
            fds.push_back({.fd = s.fd, .events = POLLIN, .revents = 0});
        }

        int n = ::poll(fds.data(), fds.size(), -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "session: poll failed: {}", std::strerror(errno));
            break;
        }

        if (fds[0].revents & POLLIN) {
            uint64_t val;
            if (::read(wake_fd_, &val, sizeof(val)) < 0 && errno != EAGAIN) {
                std::println(stderr, "session: pump wakeup read failed: {}", std::strerror(errno));
            }
        }

        // fds[i + 1] belongs to streams[i]; walk backwards so erasing is safe.
        for (size_t i = streams.size(); i-- > 0;) {
            if (fds[i + 1].revents == 0) continue;
            if (!pump_stream(streams[i])) {
                ::close(streams[i].fd);
                streams.erase(streams.begin() + static_cast<std::ptrdiff_t>(i));
                active_.fetch_sub(1, std::memory_order_acq_rel);
            }
        }
    }

    for (auto& s : streams) {
        ::close(s.fd);
        active_.fetch_sub(1, std::memory_order_acq_rel);
    }
}

bool OutputPump::pump_stream(Stream& stream) {
    char buf[4096];
    ssize_t n = ::read(stream.fd, buf, sizeof(buf));
    if (n < 0) {
        if (errno == EINTR || errno == EAGAIN) return true;
        std::println(stderr, "session: read from {} failed: {}", stream.device_id, std::strerror(errno));
        n = 0; // treat as end of stream
    }

    if (n == 0) {
        if (!stream.pending.empty()) {
            emit_line(stream.device_id, std::move(stream.pending));
            stream.pending.clear();
        }
        return false;
    }

    stream.pending.append(buf, static_cast<size_t>(n));

    size_t start = 0;
    for (;;) {
        auto pos = stream.pending.find('\n', start);
        if (pos == std::string::npos) break;
        emit_line(stream.device_id, stream.pending.substr(start, pos - start));
        start = pos + 1;
    }
    stream.pending.erase(0, start);

    while (stream.pending.size() >= kMaxLineBytes) {
        emit_line(stream.device_id, stream.pending.substr(0, kMaxLineBytes));
        stream.pending.erase(0, kMaxLineBytes);
    }
    return true;
}

void OutputPump::emit_line(const std::string& device_id, std::string line) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    try {
        std::string_view rest(line);
        while (rest.size() > kMaxLineBytes) {
            sink_.emit(SessionLog{device_id, std::string(rest.substr(0, kMaxLineBytes))});
            rest.remove_prefix(kMaxLineBytes);
        }
        sink_.emit(SessionLog{device_id, std::string(rest)});
    } catch (const std::exception& e) {
        std::println(stderr, "session: event delivery failed: {}", e.what());
    }
}
