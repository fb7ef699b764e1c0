/**
 * test_events.cpp - Tests for EventEmitter
 */

#include <gtest/gtest.h>
#include <rowstream/events.hpp>
#include <string>
#include <vector>

using rowstream::Event;
using rowstream::EventEmitter;

TEST(EventsTest, DeliversInRegistrationOrder) {
    EventEmitter em;
    std::vector<std::string> calls;
    em.on(Event::pause, [&] { calls.push_back("first"); });
    em.on(Event::pause, [&] { calls.push_back("second"); });
    em.on(Event::resume, [&] { calls.push_back("resume"); });

    em.emit(Event::pause);
    EXPECT_EQ(calls, (std::vector<std::string>{"first", "second"}));
}

TEST(EventsTest, OffRemovesListener) {
    EventEmitter em;
    int count = 0;
    auto id = em.on(Event::cancel, [&] { ++count; });
    EXPECT_EQ(em.listener_count(Event::cancel), 1);

    EXPECT_TRUE(em.off(Event::cancel, id));
    EXPECT_FALSE(em.off(Event::cancel, id));
    EXPECT_EQ(em.listener_count(Event::cancel), 0);

    em.emit(Event::cancel);
    EXPECT_EQ(count, 0);
}

TEST(EventsTest, OffUsesTheRightEvent) {
    EventEmitter em;
    auto id = em.on(Event::pause, [] {});
    EXPECT_FALSE(em.off(Event::resume, id));
    EXPECT_EQ(em.listener_count(Event::pause), 1);
}

TEST(EventsTest, ListenerRemovedDuringDeliveryIsSkipped) {
    EventEmitter em;
    std::vector<std::string> calls;
    rowstream::ListenerId second = 0;
    em.on(Event::complete, [&] {
        calls.push_back("first");
        em.off(Event::complete, second);
    });
    second = em.on(Event::complete, [&] { calls.push_back("second"); });

    em.emit(Event::complete);
    EXPECT_EQ(calls, (std::vector<std::string>{"first"}));
}

TEST(EventsTest, ListenerAddedDuringDeliveryWaitsForNextEmit) {
    EventEmitter em;
    int late = 0;
    bool added = false;
    em.on(Event::resume, [&] {
        if (!added) {
            added = true;
            em.on(Event::resume, [&] { ++late; });
        }
    });

    em.emit(Event::resume);
    EXPECT_EQ(late, 0);
    em.emit(Event::resume);
    EXPECT_EQ(late, 1);
}

TEST(EventsTest, EventNames) {
    EXPECT_STREQ(rowstream::event_name(Event::pause), "pause");
    EXPECT_STREQ(rowstream::event_name(Event::resume), "resume");
    EXPECT_STREQ(rowstream::event_name(Event::cancel), "cancel");
    EXPECT_STREQ(rowstream::event_name(Event::complete), "complete");
}
