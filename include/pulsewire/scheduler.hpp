/**
 * @file scheduler.hpp
 * @brief Cancellable timer scheduling for PulseWire
 */

#ifndef PULSEWIRE_SCHEDULER_HPP
#define PULSEWIRE_SCHEDULER_HPP

#include "types.hpp"
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>
#include <spdlog/logger.h>

namespace pulsewire {

using TaskId = uint64_t;
using Task = std::function<void()>;

constexpr TaskId INVALID_TASK = 0;

/**
 * Single timeline on which every runtime timer is scheduled
 */
class Scheduler {
public:
    virtual ~Scheduler() = default;

    /**
     * Current time on the scheduler's clock
     */
    virtual TimePoint now() const = 0;

    /**
     * Run a task once after a delay
     * @param delay Delay from now
     * @param task Task to run
     * @return Task handle for cancel()
     */
    virtual TaskId schedule_after(Millis delay, Task task) = 0;

    /**
     * Run a task repeatedly, first after one interval
     * @param interval Period
     * @param task Task to run
     * @return Task handle for cancel()
     */
    virtual TaskId schedule_every(Millis interval, Task task) = 0;

    /**
     * Cancel a task. Unknown or already finished handles are ignored.
     */
    virtual void cancel(TaskId id) = 0;

    /**
     * Cancel a task and block until a run of it already in progress returns.
     * Called from inside a running task it does not block.
     * Must not be called while holding a lock the task may take.
     */
    virtual void cancel_and_wait(TaskId id) = 0;

    /**
     * Convert a scheduler time point to wall-clock milliseconds since epoch
     */
    virtual int64_t wall_time(TimePoint tp) const = 0;
};

/**
 * Ordered task table shared by the concrete schedulers
 */
class QueuedScheduler : public Scheduler {
public:
    TaskId schedule_after(Millis delay, Task task) override;
    TaskId schedule_every(Millis interval, Task task) override;
    void cancel(TaskId id) override;
    void cancel_and_wait(TaskId id) override;

    /**
     * Number of tasks still scheduled
     */
    std::size_t pending() const;

protected:
    struct Entry {
        TimePoint due;
        Millis interval{0};
        std::shared_ptr<Task> task;
    };

    TaskId insert_locked(TimePoint due, Millis interval, Task task);

    // Pops the earliest entry due at or before limit and re-arms periodic entries
    bool pop_due_locked(TimePoint limit, TaskId& id, TimePoint& due, std::shared_ptr<Task>& task);

    bool next_due_locked(TimePoint& due) const;

    void erase_locked(TaskId id);
    void clear_locked();

    // Bracket a task run so cancel_and_wait can see it
    void begin_run_locked(TaskId id);
    void end_run_locked();

    // Called with the lock held after a new entry is inserted
    virtual void on_inserted_locked() {}

    virtual TimePoint now_locked() const = 0;

    mutable std::mutex mutex_;

private:
    std::map<std::pair<TimePoint, TaskId>, TaskId> order_;
    std::unordered_map<TaskId, Entry> entries_;
    TaskId next_id_ = 1;
    TaskId running_ = INVALID_TASK;
    std::thread::id running_thread_;
    std::condition_variable idle_cv_;
};

/**
 * Scheduler backed by one worker thread and the steady clock
 */
class ThreadScheduler : public QueuedScheduler {
public:
    explicit ThreadScheduler(std::shared_ptr<spdlog::logger> logger = nullptr);
    ~ThreadScheduler() override;

    ThreadScheduler(const ThreadScheduler&) = delete;
    ThreadScheduler& operator=(const ThreadScheduler&) = delete;

    TimePoint now() const override;
    int64_t wall_time(TimePoint tp) const override;

    /**
     * Stop the worker and drop pending tasks. A task already running is
     * allowed to finish.
     */
    void stop();

protected:
    void on_inserted_locked() override;
    TimePoint now_locked() const override;

private:
    void run();

    std::shared_ptr<spdlog::logger> logger_;
    std::condition_variable cv_;
    bool stopping_;
    std::thread worker_;
};

/**
 * Scheduler whose clock only moves when advanced explicitly
 */
class ManualScheduler : public QueuedScheduler {
public:
    ManualScheduler();

    TimePoint now() const override;
    int64_t wall_time(TimePoint tp) const override;

    /**
     * Move time forward, running every task that falls due on the way
     * @param delta Amount of time to advance
     * @return Number of tasks run
     */
    std::size_t advance(Millis delta);

    /**
     * Run tasks already due at the current time
     * @return Number of tasks run
     */
    std::size_t run_pending();

protected:
    TimePoint now_locked() const override;

private:
    TimePoint epoch_;
    TimePoint now_;
    int64_t wall_epoch_ms_;
};

} // namespace pulsewire

#endif // PULSEWIRE_SCHEDULER_HPP
