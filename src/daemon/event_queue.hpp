#pragma once

#include "events.hpp"

#include <deque>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

// Multi-producer queue drained by the main thread. Worker threads push events
// and poke the main loop through the notify callback (an eventfd write).
class EventQueue : public EventSink {
public:
    using NotifyCallback = std::function<void()>;

    explicit EventQueue(NotifyCallback notify = {}) : notify_(std::move(notify)) {}

    void emit(Event event) override {
        {
            std::lock_guard lock(mutex_);
            events_.push_back(std::move(event));
        }
        if (notify_) notify_();
    }

    std::vector<Event> drain() {
        std::lock_guard lock(mutex_);
        std::vector<Event> out(std::make_move_iterator(events_.begin()),
                               std::make_move_iterator(events_.end()));
        events_.clear();
        return out;
    }

    size_t pending() const {
        std::lock_guard lock(mutex_);
        return events_.size();
    }

private:
    NotifyCallback notify_;
    mutable std::mutex mutex_;
    std::deque<Event> events_;
};
