#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <vector>
#include "dispatcher.h"
#include "event_queue.h"
#include "hid_peripheral.h"
#include "pipe_cursor.h"
#include "readiness_flag.h"
#include "report_encoder.h"
#include "settings.h"

// ─── FIFO Bridge ────────────────────────────────────────────────────────────
// Reads UTF-8 text from the named pipe, queues it, and types it on the
// subscribed host one report at a time with a fixed gap between reports.
// While nobody is subscribed text stays queued; when the queue is full the
// pipe is no longer read, so writers block instead of losing data.

namespace fifo_bridge {

struct Stats {
    uint64_t bytes_read    = 0;
    uint64_t chars_queued  = 0;
    uint64_t chars_sent    = 0;
    uint64_t chars_dropped = 0;   // no key sequence in the layout
    uint64_t frames_sent   = 0;
    uint32_t send_failures = 0;
    uint32_t reopens       = 0;
};

class FifoBridge : public dispatcher::PollSource {
public:
    FifoBridge(const Settings& settings,
               hid_peripheral::ReportSink& sink,
               event_queue::EventQueue& queue,
               readiness_flag::ReadinessFlag& flag);
    ~FifoBridge() override;

    FifoBridge(const FifoBridge&) = delete;
    FifoBridge& operator=(const FifoBridge&) = delete;

    /// Create the FIFO if needed and open it for reading. On failure a
    /// retry is scheduled and false returned.
    bool open();
    void close();

    // ─── Dispatched events ──────────────────────────────────────────────
    void on_readable();
    void on_retry();
    void on_throttle_elapsed();

    /// Subscription changed: publish or withdraw the flag, resume sending.
    void set_subscribed(bool subscribed);

    /// Queue decoded text. "\r\n" collapses to a single Enter.
    void feed(const std::vector<char32_t>& chars);

    // ─── PollSource ─────────────────────────────────────────────────────
    void prepare(pollfd& pfd, int& timeout_ms) override;
    void dispatch(short revents) override;

    // ─── Status ─────────────────────────────────────────────────────────
    size_t pending_chars() const { return text_.size(); }
    bool frames_in_flight() const { return frame_pos_ < frames_.size(); }
    bool reading_paused() const { return text_.size() >= settings_.pending_text_limit; }
    bool is_open() const { return fd_ >= 0; }
    const Stats& stats() const { return stats_; }

private:
    void pump();
    bool load_next_char();
    void arm_throttle(uint32_t delay_ms);
    void schedule_retry();

    const Settings&                settings_;
    hid_peripheral::ReportSink&    sink_;
    event_queue::EventQueue&       queue_;
    readiness_flag::ReadinessFlag& flag_;

    int                      fd_ = -1;
    pipe_cursor::PipeCursor  cursor_;
    bool                     last_was_cr_ = false;

    std::deque<char32_t>                    text_;
    std::vector<report_encoder::ReportFrame> frames_;   // current character
    size_t                                  frame_pos_ = 0;

    event_queue::TimerId throttle_timer_ = event_queue::NO_TIMER;
    event_queue::TimerId retry_timer_    = event_queue::NO_TIMER;

    Stats stats_;
};

} // namespace fifo_bridge
