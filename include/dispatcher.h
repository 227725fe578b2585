#pragma once

#include <functional>
#include <vector>
#include <poll.h>
#include "event_queue.h"
#include "events.h"

// ─── Dispatcher ─────────────────────────────────────────────────────────────
// Single-threaded loop: poll() over every registered descriptor, turn
// readiness and expired timers into events, hand each event to the
// handler in order.

namespace dispatcher {

/// Something with a file descriptor the loop should wait on.
class PollSource {
public:
    virtual ~PollSource() = default;

    /// Fill pfd for this cycle (fd < 0 = nothing to wait on). May lower
    /// timeout_ms (-1 = no limit).
    virtual void prepare(pollfd& pfd, int& timeout_ms) = 0;

    /// Called after poll() with the returned events (0 if none).
    virtual void dispatch(short revents) = 0;
};

class Dispatcher {
public:
    using Handler = std::function<void(events::Event& evt)>;

    Dispatcher(event_queue::EventQueue& queue, Handler handler);

    void add_source(PollSource* source);

    /// Loop until stop(). Returns the stop code.
    int run();

    /// Leave run() after the current cycle.
    void stop(int code);
    bool stopped() const { return stopped_; }

    /// One cycle, waiting at most max_wait_ms (-1 = until something
    /// happens). Returns false if poll() failed.
    bool run_once(int max_wait_ms);

    /// Handle queued events and due timers until none are left.
    void drain();

private:
    event_queue::EventQueue&  queue_;
    Handler                   handler_;
    std::vector<PollSource*>  sources_;
    bool                      stopped_   = false;
    int                       exit_code_ = 0;
};

} // namespace dispatcher
