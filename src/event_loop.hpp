#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace streamtap {

using Task = std::function<void()>;
using TimerId = uint64_t;

// Single-threaded cooperative scheduler. Everything it runs executes on the
// loop thread, posted tasks in post order. Injectable for testing.
class Scheduler {
public:
    virtual ~Scheduler() = default;

    // Queue a task. Safe to call from any thread.
    virtual void post(Task task) = 0;

    // Run a task once after delay. Safe to call from any thread.
    virtual TimerId schedule(std::chrono::milliseconds delay, Task task) = 0;

    // Cancel a pending timer. Unknown or already-fired ids are ignored.
    virtual void cancel(TimerId id) = 0;
};

class EventLoop : public Scheduler {
public:
    EventLoop() = default;
    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void post(Task task) override;
    TimerId schedule(std::chrono::milliseconds delay, Task task) override;
    void cancel(TimerId id) override;

    // Run tasks and timers on the calling thread until stop().
    void run();

    // Run until stop() or until timeout elapses.
    void run_for(std::chrono::milliseconds timeout);

    // Safe to call from any thread, including from a task.
    void stop();

    size_t pending_timers() const;

private:
    using Clock = std::chrono::steady_clock;

    struct Timer {
        Clock::time_point due;
        Task task;
    };

    void run_until(Clock::time_point deadline);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    std::map<TimerId, Timer> timers_;
    TimerId next_timer_id_ = 1;
    bool stopped_ = false;
};

// Runs blocking jobs (HTTP, socket connects) off the loop thread. Jobs hand
// their results back with Scheduler::post.
class TaskRunner {
public:
    virtual ~TaskRunner() = default;
    virtual void submit(Task job) = 0;
};

class WorkerPool : public TaskRunner {
public:
    explicit WorkerPool(size_t threads);
    ~WorkerPool() override;
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void submit(Task job) override;

    // Drop queued jobs and join the workers. Running jobs finish first.
    void shutdown();

private:
    void worker_loop();

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> jobs_;
    std::vector<std::thread> threads_;
    bool stopping_ = false;
};

} // namespace streamtap
