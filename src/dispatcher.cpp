#include "dispatcher.h"
#include "logging.h"

#include <cerrno>
#include <cstring>

namespace dispatcher {

Dispatcher::Dispatcher(event_queue::EventQueue& queue, Handler handler)
    : queue_(queue), handler_(std::move(handler)) {}

void Dispatcher::add_source(PollSource* source) {
    sources_.push_back(source);
}

void Dispatcher::stop(int code) {
    if (!stopped_) exit_code_ = code;
    stopped_ = true;
}

int Dispatcher::run() {
    while (!stopped_) {
        if (!run_once(-1)) {
            stop(1);
        }
    }
    return exit_code_;
}

void Dispatcher::drain() {
    queue_.fire_due(event_queue::Clock::now());
    events::Event evt;
    while (!stopped_ && queue_.receive(evt)) {
        handler_(evt);
        if (!queue_.pending()) queue_.fire_due(event_queue::Clock::now());
    }
}

bool Dispatcher::run_once(int max_wait_ms) {
    drain();
    if (stopped_) return true;

    std::vector<pollfd> fds(sources_.size());
    int timeout = max_wait_ms;
    for (size_t i = 0; i < sources_.size(); ++i) {
        fds[i] = pollfd{-1, 0, 0};
        sources_[i]->prepare(fds[i], timeout);
    }

    int timer_wait = queue_.next_timeout_ms(event_queue::Clock::now());
    if (timer_wait >= 0 && (timeout < 0 || timer_wait < timeout)) timeout = timer_wait;

    int rc = poll(fds.data(), fds.size(), timeout);
    if (rc < 0) {
        if (errno == EINTR) return true;
        logging::error("[LOOP] poll failed: %s", strerror(errno));
        return false;
    }

    for (size_t i = 0; i < sources_.size(); ++i) {
        sources_[i]->dispatch(fds[i].fd >= 0 ? fds[i].revents : 0);
    }
    drain();
    return true;
}

} // namespace dispatcher
