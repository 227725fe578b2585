#include <gtest/gtest.h>
#include "event_queue.h"

using event_queue::Clock;
using event_queue::EventQueue;

TEST(EventQueue, PostedEventsComeOutInOrder) {
    EventQueue q;
    q.post(events::PipeReadable{});
    q.post(events::StatusTick{});
    EXPECT_EQ(q.size(), 2u);

    events::Event evt;
    ASSERT_TRUE(q.receive(evt));
    EXPECT_TRUE(std::holds_alternative<events::PipeReadable>(evt));
    ASSERT_TRUE(q.receive(evt));
    EXPECT_TRUE(std::holds_alternative<events::StatusTick>(evt));
    EXPECT_FALSE(q.receive(evt));
}

TEST(EventQueue, TimersFireByDueTimeThenArmingOrder) {
    EventQueue q;
    auto t0 = Clock::now();
    q.post_at(t0 + std::chrono::milliseconds(20), events::StatusTick{});
    q.post_at(t0 + std::chrono::milliseconds(10), events::RetryTimer{events::RetryTarget::PIPE});
    q.post_at(t0 + std::chrono::milliseconds(10), events::RetryTimer{events::RetryTarget::ADVERTISING});

    EXPECT_EQ(q.fire_due(t0), 0u);
    EXPECT_EQ(q.fire_due(t0 + std::chrono::milliseconds(30)), 3u);
    EXPECT_EQ(q.timer_count(), 0u);

    events::Event evt;
    ASSERT_TRUE(q.receive(evt));
    EXPECT_EQ(std::get<events::RetryTimer>(evt).target, events::RetryTarget::PIPE);
    ASSERT_TRUE(q.receive(evt));
    EXPECT_EQ(std::get<events::RetryTimer>(evt).target, events::RetryTarget::ADVERTISING);
    ASSERT_TRUE(q.receive(evt));
    EXPECT_TRUE(std::holds_alternative<events::StatusTick>(evt));
}

TEST(EventQueue, CancelledTimerNeverFires) {
    EventQueue q;
    auto id = q.post_after(0, events::ThrottleElapsed{});
    EXPECT_NE(id, event_queue::NO_TIMER);
    EXPECT_TRUE(q.cancel(id));
    EXPECT_FALSE(q.cancel(id));
    EXPECT_EQ(q.fire_due(Clock::now() + std::chrono::seconds(1)), 0u);
    EXPECT_FALSE(q.pending());
}

TEST(EventQueue, NextTimeout) {
    EventQueue q;
    auto now = Clock::now();
    EXPECT_EQ(q.next_timeout_ms(now), -1);

    q.post_at(now + std::chrono::microseconds(1500), events::StatusTick{});
    EXPECT_EQ(q.next_timeout_ms(now), 2);
    EXPECT_EQ(q.next_timeout_ms(now + std::chrono::milliseconds(5)), 0);
}

TEST(EventQueue, EventNames) {
    EXPECT_STREQ(events::name(events::Event{events::PipeReadable{}}), "PipeReadable");
    EXPECT_STREQ(events::name(events::Event{events::AgentDeadline{}}), "AgentDeadline");
}
