#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

// Fixed-capacity ring of log lines. Once full, each write overwrites the
// oldest line. Not thread-safe: owned and used by the main thread.
class LogBuffer {
public:
    explicit LogBuffer(size_t capacity_lines)
        : buf_(capacity_lines), capacity_(capacity_lines) {}

    void write(std::string line) {
        if (capacity_ == 0) return;
        buf_[write_pos_ % capacity_] = std::move(line);
        write_pos_++;
    }

    // The newest `limit` lines, oldest first.
    std::vector<std::string> recent(size_t limit) const {
        size_t avail = available();
        size_t count = std::min(limit, avail);
        std::vector<std::string> out;
        out.reserve(count);
        for (size_t pos = write_pos_ - count; pos < write_pos_; pos++) {
            out.push_back(buf_[pos % capacity_]);
        }
        return out;
    }

    size_t available() const {
        return std::min(write_pos_, capacity_);
    }

    // Total lines ever written, including overwritten ones.
    size_t total_written() const { return write_pos_; }

    void reset() {
        std::fill(buf_.begin(), buf_.end(), std::string{});
        write_pos_ = 0;
    }

private:
    std::vector<std::string> buf_;
    size_t capacity_;
    size_t write_pos_ = 0;
};
