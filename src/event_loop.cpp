#include "event_loop.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace streamtap {

// ── EventLoop ───────────────────────────────────────────────────

void EventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

TimerId EventLoop::schedule(std::chrono::milliseconds delay, Task task) {
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_timer_id_++;
        timers_.emplace(id, Timer{Clock::now() + delay, std::move(task)});
    }
    cv_.notify_one();
    return id;
}

void EventLoop::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    timers_.erase(id);
}

void EventLoop::run() {
    run_until(Clock::time_point::max());
}

void EventLoop::run_for(std::chrono::milliseconds timeout) {
    run_until(Clock::now() + timeout);
}

void EventLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
    }
    cv_.notify_all();
}

size_t EventLoop::pending_timers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

void EventLoop::run_until(Clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    stopped_ = false;

    while (!stopped_ && Clock::now() < deadline) {
        // Posted tasks first, in post order. Tasks posted while this batch
        // runs wait for the next iteration.
        if (!tasks_.empty()) {
            std::deque<Task> batch;
            batch.swap(tasks_);
            lock.unlock();
            for (auto& task : batch) task();
            lock.lock();
            continue;
        }

        // Earliest due timer, one at a time so a timer may cancel another.
        auto earliest = std::min_element(timers_.begin(), timers_.end(),
            [](const auto& a, const auto& b) { return a.second.due < b.second.due; });
        auto now = Clock::now();
        if (earliest != timers_.end() && earliest->second.due <= now) {
            Task task = std::move(earliest->second.task);
            timers_.erase(earliest);
            lock.unlock();
            task();
            lock.lock();
            continue;
        }

        auto wake = deadline;
        if (earliest != timers_.end()) wake = std::min(wake, earliest->second.due);
        if (wake == Clock::time_point::max()) {
            cv_.wait(lock);
        } else {
            cv_.wait_until(lock, wake);
        }
    }
}

// ── WorkerPool ──────────────────────────────────────────────────

WorkerPool::WorkerPool(size_t threads) {
    if (threads == 0) {
        throw std::invalid_argument("WorkerPool requires at least one thread");
    }
    threads_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        threads_.emplace_back([this]() { worker_loop(); });
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::submit(Task job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return;
        jobs_.push_back(std::move(job));
    }
    cv_.notify_one();
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && threads_.empty()) return;
        stopping_ = true;
        jobs_.clear();
    }
    cv_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
}

void WorkerPool::worker_loop() {
    for (;;) {
        Task job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stopping_ || !jobs_.empty(); });
            if (stopping_) return;
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }
        try {
            job();
        } catch (const std::exception& e) {
            std::cerr << "[worker] Job failed: " << e.what() << '\n';
        }
    }
}

} // namespace streamtap
