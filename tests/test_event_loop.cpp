#include <gtest/gtest.h>
#include "core/EventLoop.hpp"
#include "support/LoopHelpers.hpp"
#include <atomic>
#include <thread>
#include <vector>

TEST(EventLoopTest, PostedTasksRunInOrderOnLaterTurn) {
    EventLoop loop;
    std::vector<int> order;

    loop.post([&] { order.push_back(1); });
    loop.post([&] { order.push_back(2); });
    EXPECT_TRUE(order.empty());

    drain(loop);
    EXPECT_EQ(order, (std::vector<int>{1, 2}));
}

TEST(EventLoopTest, TaskPostedFromTaskRunsNextTurn) {
    EventLoop loop;
    bool inner = false;

    loop.post([&] {
        loop.post([&] { inner = true; });
    });

    loop.runOnce();
    EXPECT_FALSE(inner);
    loop.runOnce();
    EXPECT_TRUE(inner);
}

TEST(EventLoopTest, OneShotTimerFiresOnce) {
    EventLoop loop;
    int fired = 0;
    loop.callAfter(std::chrono::milliseconds(20), [&] { fired++; });

    loop.runFor(std::chrono::milliseconds(10));
    EXPECT_EQ(fired, 0);
    loop.runFor(std::chrono::milliseconds(60));
    EXPECT_EQ(fired, 1);
    EXPECT_EQ(loop.activeTimers(), 0u);
}

TEST(EventLoopTest, RepeatingTimerUntilCancelled) {
    EventLoop loop;
    int fired = 0;
    EventLoop::TimerId id = 0;
    id = loop.callEvery(std::chrono::milliseconds(5), [&] {
        if (++fired == 3) loop.cancelTimer(id);
    });

    loop.runFor(std::chrono::milliseconds(100));
    EXPECT_EQ(fired, 3);
    EXPECT_EQ(loop.activeTimers(), 0u);
}

TEST(EventLoopTest, CancelledTimerNeverFires) {
    EventLoop loop;
    bool fired = false;
    auto id = loop.callAfter(std::chrono::milliseconds(5), [&] { fired = true; });
    loop.cancelTimer(id);
    loop.cancelTimer(0);

    loop.runFor(std::chrono::milliseconds(30));
    EXPECT_FALSE(fired);
}

TEST(EventLoopTest, OffloadRunsOffLoopAndPostsBack) {
    EventLoop loop;
    std::thread::id workerId;
    std::thread::id resultId;
    bool done = false;

    loop.offload([&] {
        workerId = std::this_thread::get_id();
        loop.post([&] {
            resultId = std::this_thread::get_id();
            done = true;
        });
    });

    ASSERT_TRUE(runUntil(loop, [&] { return done; }));
    EXPECT_NE(workerId, std::this_thread::get_id());
    EXPECT_EQ(resultId, std::this_thread::get_id());
}

TEST(EventLoopTest, BlockedPlaybackLaneDoesNotHoldCaptureLane) {
    EventLoop loop;
    std::atomic<bool> releasePlayback{false};
    std::atomic<bool> captureRan{false};
    std::thread::id playbackId, captureId;

    loop.offload([&] {
        playbackId = std::this_thread::get_id();
        while (!releasePlayback)
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }, EventLoop::WorkLane::Playback);
    loop.offload([&] { captureId = std::this_thread::get_id(); captureRan = true; });

    ASSERT_TRUE(runUntil(loop, [&] { return captureRan.load(); }, 1000));
    releasePlayback = true;

    ASSERT_TRUE(runUntil(loop, [&] {
        return loop.pendingWork(EventLoop::WorkLane::Playback) == 0;
    }));
    EXPECT_NE(playbackId, captureId);
}

TEST(EventLoopTest, JobsWithinLaneRunInOrder) {
    EventLoop loop;
    std::vector<int> order;
    std::atomic<int> done{0};

    for (int i = 0; i < 4; i++)
        loop.offload([&, i] { order.push_back(i); done++; }, EventLoop::WorkLane::Playback);

    ASSERT_TRUE(runUntil(loop, [&] { return done.load() == 4; }));
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3}));
}

TEST(EventLoopTest, ThrowingTaskDoesNotStopLoop) {
    EventLoop loop;
    bool after = false;
    loop.post([] { throw std::runtime_error("boom"); });
    loop.post([&] { after = true; });

    drain(loop);
    EXPECT_TRUE(after);
}

TEST(EventLoopTest, QuitFromAnotherThreadEndsRun) {
    EventLoop loop;
    std::atomic<bool> returned{false};

    std::thread runner([&] {
        loop.run();
        returned = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    loop.quit();
    runner.join();

    EXPECT_TRUE(returned);
}

TEST(EventLoopTest, RunUntilTimesOut) {
    EventLoop loop;
    auto start = EventLoop::Clock::now();
    EXPECT_FALSE(loop.runUntil([] { return false; }, std::chrono::milliseconds(30)));
    EXPECT_GE(EventLoop::Clock::now() - start, std::chrono::milliseconds(30));
}
