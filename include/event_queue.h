#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include "events.h"

// ─── Event Queue ────────────────────────────────────────────────────────────
// FIFO of dispatcher events plus one-shot timers that post an event when
// they expire. Owned by the dispatcher thread; not thread-safe.

namespace event_queue {

using Clock   = std::chrono::steady_clock;
using TimerId = uint64_t;

constexpr TimerId NO_TIMER = 0;

class EventQueue {
public:
    /// Push an event to the back of the queue.
    void post(events::Event evt);

    /// Post evt once delay_ms has elapsed. Returns an id for cancel().
    TimerId post_after(uint32_t delay_ms, events::Event evt);

    /// Post evt at an absolute time.
    TimerId post_at(Clock::time_point due, events::Event evt);

    /// Cancel a timer that has not fired. Returns false if unknown.
    bool cancel(TimerId id);

    /// Pop the oldest event. Returns true if an event was available.
    bool receive(events::Event& evt);

    /// Check if events are waiting.
    bool pending() const { return !queue_.empty(); }

    size_t size() const { return queue_.size(); }
    size_t timer_count() const { return timers_.size(); }

    /// Move every timer due at or before now into the queue, earliest first.
    /// Timers with equal due times keep the order they were armed in.
    size_t fire_due(Clock::time_point now);

    /// Milliseconds until the next timer (rounded up), 0 if one is due,
    /// -1 if none are armed.
    int next_timeout_ms(Clock::time_point now) const;

private:
    struct Timer {
        Clock::time_point due;
        events::Event     evt;
    };

    std::deque<events::Event> queue_;
    std::map<TimerId, Timer>  timers_;
    TimerId                   next_id_ = 1;
};

} // namespace event_queue
