#include "core/EventLoop.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <functional>
#include <utility>
#include <vector>

EventLoop::EventLoop()
    : loopThread_(std::this_thread::get_id())
{
    captureWorker_.thread  = std::thread(&EventLoop::workerLoop,
                                         std::ref(captureWorker_), "capture");
    playbackWorker_.thread = std::thread(&EventLoop::workerLoop,
                                         std::ref(playbackWorker_), "playback");
}

EventLoop::~EventLoop() {
    for (Worker* w : {&captureWorker_, &playbackWorker_}) {
        {
            std::lock_guard lock(w->mtx);
            w->stop = true;
        }
        w->cv.notify_all();
    }
    for (Worker* w : {&captureWorker_, &playbackWorker_})
        if (w->thread.joinable()) w->thread.join();
}

EventLoop::Worker& EventLoop::worker(WorkLane lane) {
    return lane == WorkLane::Playback ? playbackWorker_ : captureWorker_;
}

const EventLoop::Worker& EventLoop::worker(WorkLane lane) const {
    return lane == WorkLane::Playback ? playbackWorker_ : captureWorker_;
}

void EventLoop::post(Task task) {
    {
        std::lock_guard lock(mtx_);
        tasks_.push_back(std::move(task));
    }
    cv_.notify_all();
}

EventLoop::TimerId EventLoop::callAfter(std::chrono::milliseconds delay,
                                        Task task) {
    std::lock_guard lock(mtx_);
    TimerId id = nextTimerId_++;
    timers_[id] = {Clock::now() + delay, std::chrono::milliseconds(0),
                   std::move(task)};
    cv_.notify_all();
    return id;
}

EventLoop::TimerId EventLoop::callEvery(std::chrono::milliseconds interval,
                                        Task task) {
    if (interval.count() <= 0)
        interval = std::chrono::milliseconds(1);

    std::lock_guard lock(mtx_);
    TimerId id = nextTimerId_++;
    timers_[id] = {Clock::now() + interval, interval, std::move(task)};
    cv_.notify_all();
    return id;
}

void EventLoop::cancelTimer(TimerId id) {
    if (id == 0) return;
    std::lock_guard lock(mtx_);
    timers_.erase(id);
}

void EventLoop::offload(Task work, WorkLane lane) {
    Worker& w = worker(lane);
    {
        std::lock_guard lock(w.mtx);
        w.jobs.push_back(std::move(work));
    }
    w.cv.notify_one();
}

size_t EventLoop::pendingWork(WorkLane lane) const {
    const Worker& w = worker(lane);
    std::lock_guard lock(w.mtx);
    return w.jobs.size();
}

bool EventLoop::runOnce(std::chrono::milliseconds maxWait) {
    std::deque<Task> ready;
    std::vector<std::pair<Clock::time_point, TimerId>> due;

    {
        std::unique_lock lock(mtx_);
        loopThread_ = std::this_thread::get_id();
        auto deadline = Clock::now() + maxWait;

        auto nextDue = [&]() {
            auto wake = deadline;
            for (auto& [id, t] : timers_)
                wake = std::min(wake, t.due);
            return wake;
        };
        auto hasWork = [&]() {
            if (!tasks_.empty()) return true;
            auto n = Clock::now();
            for (auto& [id, t] : timers_)
                if (t.due <= n) return true;
            return false;
        };

        while (!hasWork() && !quit_) {
            if (Clock::now() >= deadline) break;
            cv_.wait_until(lock, nextDue());
        }

        ready.swap(tasks_);
        auto n = Clock::now();
        for (auto& [id, t] : timers_)
            if (t.due <= n) due.emplace_back(t.due, id);
    }

    for (auto& task : ready) {
        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("Event loop task threw: {}", e.what());
        }
    }

    std::sort(due.begin(), due.end());
    bool ranTimer = false;
    for (auto& [when, id] : due)
        ranTimer |= runTimer(id);

    return !ready.empty() || ranTimer;
}

bool EventLoop::runTimer(TimerId id) {
    Task task;
    {
        std::lock_guard lock(mtx_);
        auto it = timers_.find(id);
        if (it == timers_.end()) return false;   // cancelled earlier this turn

        task = it->second.task;
        if (it->second.interval.count() > 0) {
            auto n = Clock::now();
            it->second.due += it->second.interval;
            if (it->second.due <= n)
                it->second.due = n + it->second.interval;
        } else {
            timers_.erase(it);
        }
    }

    try {
        task();
    } catch (const std::exception& e) {
        spdlog::error("Timer {} threw: {}", id, e.what());
    }
    return true;
}

void EventLoop::runFor(std::chrono::milliseconds duration) {
    auto end = Clock::now() + duration;
    while (!quit_) {
        auto n = Clock::now();
        if (n >= end) break;
        runOnce(std::chrono::duration_cast<std::chrono::milliseconds>(end - n));
    }
}

bool EventLoop::runUntil(const std::function<bool()>& done,
                         std::chrono::milliseconds timeout) {
    auto end = Clock::now() + timeout;
    while (!done()) {
        auto n = Clock::now();
        if (n >= end || quit_) return done();
        auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(end - n);
        runOnce(std::min(remaining, std::chrono::milliseconds(10)));
    }
    return true;
}

void EventLoop::run() {
    spdlog::debug("Event loop running");
    while (!quit_)
        runOnce(std::chrono::milliseconds(100));
    quit_ = false;
    spdlog::debug("Event loop stopped");
}

void EventLoop::quit() {
    quit_ = true;
    cv_.notify_all();
}

bool EventLoop::isLoopThread() const {
    std::lock_guard lock(mtx_);
    return loopThread_ == std::this_thread::get_id();
}

size_t EventLoop::pendingTasks() const {
    std::lock_guard lock(mtx_);
    return tasks_.size();
}

size_t EventLoop::activeTimers() const {
    std::lock_guard lock(mtx_);
    return timers_.size();
}

void EventLoop::workerLoop(Worker& w, const char* name) {
    spdlog::debug("{} worker started", name);
    while (true) {
        Task job;
        {
            std::unique_lock lock(w.mtx);
            w.cv.wait(lock, [&w] { return w.stop || !w.jobs.empty(); });
            if (w.jobs.empty()) break;   // stop requested and drained
            job = std::move(w.jobs.front());
            w.jobs.pop_front();
        }
        try {
            job();
        } catch (const std::exception& e) {
            spdlog::error("Offloaded {} job threw: {}", name, e.what());
        }
    }
    spdlog::debug("{} worker stopped", name);
}
