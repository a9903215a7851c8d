#include <gtest/gtest.h>
#include "../nav_scheduling/event_loop.h"
#include "../nav_scheduling/single_shot_timer.h"
#include <functional>
#include <thread>
#include <vector>

using tripnav::nav_scheduling::EventLoop;
using tripnav::nav_scheduling::SingleShotTimer;
using tripnav::nav_scheduling::TimerId;

// ============================================================================
// Test Suite: EventLoop
// ============================================================================

TEST(EventLoop, RunsPostedTasksInOrder) {
    EventLoop loop;
    std::vector<int> order;
    loop.post([&order]() { order.push_back(1); });
    loop.post([&order]() { order.push_back(2); });
    loop.post([&order]() { order.push_back(3); });

    EXPECT_EQ(loop.getPendingTaskCount(), 3u);
    EXPECT_EQ(loop.runPending(), 3u);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(loop.getPendingTaskCount(), 0u);
}

TEST(EventLoop, TasksPostedWhileRunningRunAfterQueuedOnes) {
    EventLoop loop;
    std::vector<int> order;
    loop.post([&]() {
        order.push_back(1);
        loop.post([&order]() { order.push_back(3); });
    });
    loop.post([&order]() { order.push_back(2); });

    EXPECT_EQ(loop.runPending(), 3u);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(EventLoop, TimerFiresAtItsDeadline) {
    EventLoop loop;
    int fired = 0;
    int64_t fired_at = -1;
    loop.scheduleAfter(1500, [&]() {
        ++fired;
        fired_at = loop.nowMs();
    });

    loop.advanceBy(1499);
    EXPECT_EQ(fired, 0);
    loop.advanceBy(1);
    EXPECT_EQ(fired, 1);
    EXPECT_EQ(fired_at, 1500);
    EXPECT_EQ(loop.nowMs(), 1500);
}

TEST(EventLoop, TimersFireInDeadlineOrderThenSchedulingOrder) {
    EventLoop loop;
    std::vector<char> order;
    loop.scheduleAfter(300, [&order]() { order.push_back('c'); });
    loop.scheduleAfter(100, [&order]() { order.push_back('a'); });
    loop.scheduleAfter(300, [&order]() { order.push_back('d'); });
    loop.scheduleAfter(200, [&order]() { order.push_back('b'); });

    loop.advanceBy(1000);
    EXPECT_EQ(order, (std::vector<char>{'a', 'b', 'c', 'd'}));
    EXPECT_EQ(loop.nowMs(), 1000);
}

TEST(EventLoop, TasksPostedByATimerRunBeforeTheNextTimer) {
    EventLoop loop;
    std::vector<int> order;
    loop.scheduleAfter(10, [&]() {
        order.push_back(1);
        loop.post([&order]() { order.push_back(2); });
    });
    loop.scheduleAfter(20, [&order]() { order.push_back(3); });

    loop.advanceBy(50);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(EventLoop, CancelledTimerNeverFires) {
    EventLoop loop;
    int fired = 0;
    TimerId id = loop.scheduleAfter(100, [&fired]() { ++fired; });
    EXPECT_TRUE(loop.isTimerArmed(id));

    EXPECT_TRUE(loop.cancelTimer(id));
    EXPECT_FALSE(loop.isTimerArmed(id));
    EXPECT_FALSE(loop.cancelTimer(id));

    loop.advanceBy(1000);
    EXPECT_EQ(fired, 0);
    EXPECT_EQ(loop.getArmedTimerCount(), 0u);
}

TEST(EventLoop, CancelAfterFiringReportsFalse) {
    EventLoop loop;
    TimerId id = loop.scheduleAfter(10, []() {});
    loop.advanceBy(10);
    EXPECT_FALSE(loop.cancelTimer(id));
}

TEST(EventLoop, PostIsSafeFromOtherThreads) {
    EventLoop loop;
    int executed = 0;
    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.emplace_back([&loop, &executed]() {
            for (int i = 0; i < 250; ++i) {
                loop.post([&executed]() { ++executed; });
            }
        });
    }
    for (auto& producer : producers) {
        producer.join();
    }

    EXPECT_EQ(loop.runPending(), 1000u);
    EXPECT_EQ(executed, 1000);
}

// ============================================================================
// Test Suite: SingleShotTimer
// ============================================================================

TEST(SingleShotTimer, FiresOnceAndDisarms) {
    EventLoop loop;
    SingleShotTimer timer(loop);
    int fired = 0;
    ASSERT_TRUE(timer.start(100, [&fired]() { ++fired; }));
    EXPECT_TRUE(timer.isArmed());

    loop.advanceBy(500);
    EXPECT_EQ(fired, 1);
    EXPECT_FALSE(timer.isArmed());
}

TEST(SingleShotTimer, StartWhileArmedKeepsOriginalDeadline) {
    EventLoop loop;
    SingleShotTimer timer(loop);
    std::vector<int64_t> fire_times;
    ASSERT_TRUE(timer.start(1500, [&]() { fire_times.push_back(loop.nowMs()); }));

    loop.advanceBy(1000);
    EXPECT_FALSE(timer.start(1500, [&]() { fire_times.push_back(-1); }));

    loop.advanceBy(2000);
    ASSERT_EQ(fire_times.size(), 1u);
    EXPECT_EQ(fire_times[0], 1500);
}

TEST(SingleShotTimer, CancelIsIdempotent) {
    EventLoop loop;
    SingleShotTimer timer(loop);
    int fired = 0;
    ASSERT_TRUE(timer.start(100, [&fired]() { ++fired; }));

    timer.cancel();
    timer.cancel();
    EXPECT_FALSE(timer.isArmed());
    loop.advanceBy(500);
    EXPECT_EQ(fired, 0);

    ASSERT_TRUE(timer.start(100, [&fired]() { ++fired; }));
    loop.advanceBy(100);
    timer.cancel();
    EXPECT_EQ(fired, 1);
}

TEST(SingleShotTimer, CanBeRestartedFromItsOwnCallback) {
    EventLoop loop;
    SingleShotTimer timer(loop);
    int fired = 0;
    std::function<void()> tick;
    tick = [&]() {
        ++fired;
        if (fired < 3) {
            EXPECT_TRUE(timer.start(100, tick));
        }
    };
    ASSERT_TRUE(timer.start(100, tick));

    loop.advanceBy(1000);
    EXPECT_EQ(fired, 3);
    EXPECT_FALSE(timer.isArmed());
}

TEST(SingleShotTimer, DestructionCancels) {
    EventLoop loop;
    int fired = 0;
    {
        SingleShotTimer timer(loop);
        ASSERT_TRUE(timer.start(100, [&fired]() { ++fired; }));
    }
    EXPECT_EQ(loop.getArmedTimerCount(), 0u);
    loop.advanceBy(500);
    EXPECT_EQ(fired, 0);
}
