#include <gtest/gtest.h>
#include <string>
#include <vector>
#include <unistd.h>
#include "dispatcher.h"

using dispatcher::Dispatcher;

namespace {

class PipeSource : public dispatcher::PollSource {
public:
    PipeSource() {
        if (pipe(fds_) != 0) fds_[0] = fds_[1] = -1;
    }
    ~PipeSource() override {
        if (fds_[0] >= 0) close(fds_[0]);
        if (fds_[1] >= 0) close(fds_[1]);
    }

    void prepare(pollfd& pfd, int&) override {
        pfd.fd = fds_[0];
        pfd.events = POLLIN;
    }
    void dispatch(short revents) override {
        if (revents & POLLIN) {
            char c;
            if (read(fds_[0], &c, 1) == 1) ++reads;
        }
    }

    bool poke() { return write(fds_[1], "x", 1) == 1; }

    int reads = 0;

private:
    int fds_[2];
};

} // namespace

TEST(Dispatcher, DrainHandlesEventsInOrder) {
    event_queue::EventQueue q;
    std::vector<std::string> seen;
    Dispatcher loop(q, [&](events::Event& e) { seen.push_back(events::name(e)); });

    q.post(events::Connected{"/org/bluez/hci0/dev_1", "00:00:00:00:00:01", false});
    q.post(events::PipeReadable{});
    loop.drain();
    EXPECT_EQ(seen, (std::vector<std::string>{"Connected", "PipeReadable"}));
}

TEST(Dispatcher, HandlerMayPostMoreEvents) {
    event_queue::EventQueue q;
    int ticks = 0;
    Dispatcher loop(q, [&](events::Event& e) {
        if (std::holds_alternative<events::PipeReadable>(e)) q.post(events::StatusTick{});
        if (std::holds_alternative<events::StatusTick>(e)) ++ticks;
    });
    q.post(events::PipeReadable{});
    loop.drain();
    EXPECT_EQ(ticks, 1);
}

TEST(Dispatcher, TimerFiresAfterPoll) {
    event_queue::EventQueue q;
    int ticks = 0;
    Dispatcher loop(q, [&](events::Event&) { ++ticks; });

    q.post_after(5, events::StatusTick{});
    for (int i = 0; i < 10 && ticks == 0; ++i) {
        ASSERT_TRUE(loop.run_once(100));
    }
    EXPECT_EQ(ticks, 1);
}

TEST(Dispatcher, SourceSeesReadiness) {
    event_queue::EventQueue q;
    Dispatcher loop(q, [](events::Event&) {});
    PipeSource src;
    loop.add_source(&src);

    ASSERT_TRUE(src.poke());
    ASSERT_TRUE(loop.run_once(100));
    EXPECT_EQ(src.reads, 1);

    // Nothing ready: returns after the timeout.
    ASSERT_TRUE(loop.run_once(10));
    EXPECT_EQ(src.reads, 1);
}

TEST(Dispatcher, StopFromHandlerEndsRun) {
    event_queue::EventQueue q;
    Dispatcher* self = nullptr;
    Dispatcher loop(q, [&self](events::Event&) { self->stop(3); });
    self = &loop;

    q.post_after(1, events::StatusTick{});
    EXPECT_EQ(loop.run(), 3);
    EXPECT_TRUE(loop.stopped());
}

TEST(Dispatcher, FirstStopCodeWins) {
    event_queue::EventQueue q;
    Dispatcher loop(q, [](events::Event&) {});
    loop.stop(1);
    loop.stop(0);
    EXPECT_EQ(loop.run(), 1);
}
