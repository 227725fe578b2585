#include "fifo_bridge.h"
#include "config.h"
#include "logging.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fifo_bridge {

FifoBridge::FifoBridge(const Settings& settings,
                       hid_peripheral::ReportSink& sink,
                       event_queue::EventQueue& queue,
                       readiness_flag::ReadinessFlag& flag)
    : settings_(settings), sink_(sink), queue_(queue), flag_(flag) {}

FifoBridge::~FifoBridge() {
    close();
}

// ─── Pipe lifecycle ─────────────────────────────────────────────────────────

bool FifoBridge::open() {
    const char* path = settings_.fifo_path.c_str();

    struct stat st;
    if (stat(path, &st) != 0) {
        if (errno != ENOENT || mkfifo(path, FIFO_MODE) != 0) {
            logging::error("[FIFO] Cannot create %s: %s", path, strerror(errno));
            schedule_retry();
            return false;
        }
        logging::info("[FIFO] Created %s", path);
    } else if (!S_ISFIFO(st.st_mode)) {
        logging::error("[FIFO] %s exists and is not a FIFO", path);
        schedule_retry();
        return false;
    }

    // mkfifo() honours the umask; producers run as other users.
    if (chmod(path, FIFO_MODE) != 0) {
        logging::warn("[FIFO] chmod %s: %s", path, strerror(errno));
    }

    fd_ = ::open(path, O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd_ < 0) {
        logging::error("[FIFO] Cannot open %s: %s", path, strerror(errno));
        schedule_retry();
        return false;
    }
    logging::debug("[FIFO] Listening on %s", path);
    return true;
}

void FifoBridge::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void FifoBridge::schedule_retry() {
    if (retry_timer_ != event_queue::NO_TIMER) queue_.cancel(retry_timer_);
    retry_timer_ = queue_.post_after(FIFO_RETRY_MS, events::RetryTimer{events::RetryTarget::PIPE});
}

void FifoBridge::on_retry() {
    retry_timer_ = event_queue::NO_TIMER;
    if (fd_ < 0) open();
}

// ─── Reading ────────────────────────────────────────────────────────────────

void FifoBridge::prepare(pollfd& pfd, int& /*timeout_ms*/) {
    if (fd_ < 0 || reading_paused()) return;
    pfd.fd = fd_;
    pfd.events = POLLIN;
}

void FifoBridge::dispatch(short revents) {
    if (revents & (POLLIN | POLLHUP | POLLERR)) {
        queue_.post(events::PipeReadable{});
    }
}

void FifoBridge::on_readable() {
    if (fd_ < 0) return;

    size_t room = settings_.pending_text_limit - std::min(settings_.pending_text_limit, text_.size());
    if (room == 0) return;  // resumes once pump() drains the queue

    uint8_t buf[FIFO_READ_CHUNK];
    ssize_t n = read(fd_, buf, std::min(room, sizeof(buf)));
    if (n > 0) {
        stats_.bytes_read += static_cast<uint64_t>(n);
        std::vector<char32_t> chars;
        cursor_.feed(buf, static_cast<size_t>(n), chars);
        feed(chars);
        return;
    }
    if (n == 0) {
        // Last writer closed. Reopen so poll() stops reporting POLLHUP.
        logging::debug("[FIFO] Writer closed after %llu bytes", static_cast<unsigned long long>(stats_.bytes_read));
        close();
        ++stats_.reopens;
        open();
        return;
    }
    if (errno == EAGAIN || errno == EINTR) return;

    logging::error("[FIFO] read: %s", strerror(errno));
    close();
    schedule_retry();
}

void FifoBridge::feed(const std::vector<char32_t>& chars) {
    for (char32_t c : chars) {
        if (c == U'\n' && last_was_cr_) {
            last_was_cr_ = false;
            continue;
        }
        last_was_cr_ = c == U'\r';
        text_.push_back(c);
        ++stats_.chars_queued;
    }
    pump();
}

// ─── Sending ────────────────────────────────────────────────────────────────

void FifoBridge::set_subscribed(bool subscribed) {
    if (subscribed) {
        if (!flag_.publish()) {
            logging::warn("[FIFO] Readiness flag not published; producers may wait");
        }
        pump();
    } else if (!flag_.withdraw()) {
        logging::warn("[FIFO] Readiness flag could not be removed");
    }
}

void FifoBridge::on_throttle_elapsed() {
    throttle_timer_ = event_queue::NO_TIMER;
    pump();
}

void FifoBridge::arm_throttle(uint32_t delay_ms) {
    throttle_timer_ = queue_.post_after(delay_ms, events::ThrottleElapsed{});
}

bool FifoBridge::load_next_char() {
    while (!text_.empty()) {
        char32_t c = text_.front();
        text_.pop_front();

        frames_.clear();
        frame_pos_ = 0;
        if (report_encoder::encode(c, settings_.layout, frames_)) return true;

        ++stats_.chars_dropped;
        logging::warn("[FIFO] Unsupported character U+%04X dropped (layout %s)",
                      static_cast<unsigned>(c), keycode_table::layout_name(settings_.layout));
    }
    return false;
}

// One frame per call; the throttle timer brings us back for the next one.
// A character's frames all go out before the next character is encoded.
void FifoBridge::pump() {
    if (throttle_timer_ != event_queue::NO_TIMER) return;
    if (!sink_.subscribed()) return;
    if (!frames_in_flight() && !load_next_char()) return;

    const report_encoder::ReportFrame& frame = frames_[frame_pos_];
    if (!sink_.send_report(frame)) {
        ++stats_.send_failures;
        arm_throttle(FRAME_RETRY_MS);
        return;
    }

    ++frame_pos_;
    ++stats_.frames_sent;
    if (!frames_in_flight()) {
        ++stats_.chars_sent;
        frames_.clear();
        frame_pos_ = 0;
    }
    arm_throttle(settings_.frame_interval_ms);
}

} // namespace fifo_bridge
