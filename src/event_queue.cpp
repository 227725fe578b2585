#include "event_queue.h"

#include <algorithm>
#include <utility>
#include <vector>

namespace event_queue {

void EventQueue::post(events::Event evt) {
    queue_.push_back(std::move(evt));
}

TimerId EventQueue::post_after(uint32_t delay_ms, events::Event evt) {
    return post_at(Clock::now() + std::chrono::milliseconds(delay_ms), std::move(evt));
}

TimerId EventQueue::post_at(Clock::time_point due, events::Event evt) {
    TimerId id = next_id_++;
    timers_.emplace(id, Timer{due, std::move(evt)});
    return id;
}

bool EventQueue::cancel(TimerId id) {
    return timers_.erase(id) > 0;
}

bool EventQueue::receive(events::Event& evt) {
    if (queue_.empty()) return false;
    evt = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

size_t EventQueue::fire_due(Clock::time_point now) {
    std::vector<std::pair<Clock::time_point, TimerId>> due;
    for (const auto& t : timers_) {
        if (t.second.due <= now) due.emplace_back(t.second.due, t.first);
    }
    std::sort(due.begin(), due.end());

    for (const auto& d : due) {
        auto it = timers_.find(d.second);
        queue_.push_back(std::move(it->second.evt));
        timers_.erase(it);
    }
    return due.size();
}

int EventQueue::next_timeout_ms(Clock::time_point now) const {
    if (timers_.empty()) return -1;

    Clock::time_point earliest = Clock::time_point::max();
    for (const auto& t : timers_) {
        earliest = std::min(earliest, t.second.due);
    }
    if (earliest <= now) return 0;

    auto wait = std::chrono::duration_cast<std::chrono::microseconds>(earliest - now).count();
    return static_cast<int>((wait + 999) / 1000);
}

} // namespace event_queue
