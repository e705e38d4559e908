#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

// Single-threaded cooperative event loop.
//
// Every state machine in the core is mutated on the loop thread only.
// Work that blocks (device open, bridge HTTP calls, encode/decode) goes to
// a background worker via offload(); the worker hands results back with
// post(). Completions therefore always land on a later loop turn than the
// call that issued them.
//
// Each WorkLane has its own worker thread, FIFO within the lane, so a slow
// playback fetch never holds up a capture finalize.
class EventLoop {
public:
    using Task    = std::function<void()>;
    using Clock   = std::chrono::steady_clock;
    using TimerId = uint64_t;

    enum class WorkLane { Capture, Playback };

    EventLoop();
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    // Thread-safe. Runs task on a later turn, FIFO.
    void post(Task task);

    TimerId callAfter(std::chrono::milliseconds delay, Task task);
    TimerId callEvery(std::chrono::milliseconds interval, Task task);
    void    cancelTimer(TimerId id);

    // Runs work on the lane's worker thread.
    void offload(Task work, WorkLane lane = WorkLane::Capture);
    size_t pendingWork(WorkLane lane) const;

    // Runs all ready tasks and due timers, waiting up to maxWait for
    // something to become ready. Returns true if anything ran.
    bool runOnce(std::chrono::milliseconds maxWait = std::chrono::milliseconds(0));
    void runFor(std::chrono::milliseconds duration);
    bool runUntil(const std::function<bool()>& done,
                  std::chrono::milliseconds timeout);

    // Blocks until quit(). quit() is thread-safe.
    void run();
    void quit();

    Clock::time_point now() const { return Clock::now(); }
    bool isLoopThread() const;

    size_t pendingTasks() const;
    size_t activeTimers() const;

private:
    struct Timer {
        Clock::time_point         due;
        std::chrono::milliseconds interval{0};   // 0 = one-shot
        Task                      task;
    };

    struct Worker {
        mutable std::mutex      mtx;
        std::condition_variable cv;
        std::deque<Task>        jobs;
        bool                    stop = false;
        std::thread             thread;
    };

    static void workerLoop(Worker& worker, const char* name);
    Worker& worker(WorkLane lane);
    const Worker& worker(WorkLane lane) const;
    bool runTimer(TimerId id);

    mutable std::mutex       mtx_;
    std::condition_variable  cv_;
    std::deque<Task>         tasks_;
    std::map<TimerId, Timer> timers_;
    TimerId                  nextTimerId_ = 1;
    std::atomic<bool>        quit_{false};
    std::thread::id          loopThread_;

    Worker captureWorker_;
    Worker playbackWorker_;
};
