/**
 * @file scheduler.cpp
 * @brief Scheduler implementations for PulseWire
 */

#include "pulsewire/scheduler.hpp"
#include <exception>

namespace pulsewire {

// =============================================================================
// QueuedScheduler
// =============================================================================

TaskId QueuedScheduler::schedule_after(Millis delay, Task task) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (delay < Millis(0)) {
        delay = Millis(0);
    }
    return insert_locked(now_locked() + delay, Millis(0), std::move(task));
}

TaskId QueuedScheduler::schedule_every(Millis interval, Task task) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (interval <= Millis(0)) {
        interval = Millis(1);
    }
    return insert_locked(now_locked() + interval, interval, std::move(task));
}

void QueuedScheduler::cancel(TaskId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    erase_locked(id);
}

void QueuedScheduler::cancel_and_wait(TaskId id) {
    std::unique_lock<std::mutex> lock(mutex_);
    erase_locked(id);
    if (id == INVALID_TASK || running_thread_ == std::this_thread::get_id()) {
        return;
    }
    idle_cv_.wait(lock, [this, id]() { return running_ != id; });
}

void QueuedScheduler::erase_locked(TaskId id) {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return;
    }
    order_.erase({it->second.due, id});
    entries_.erase(it);
}

void QueuedScheduler::clear_locked() {
    order_.clear();
    entries_.clear();
}

void QueuedScheduler::begin_run_locked(TaskId id) {
    running_ = id;
    running_thread_ = std::this_thread::get_id();
}

void QueuedScheduler::end_run_locked() {
    running_ = INVALID_TASK;
    running_thread_ = std::thread::id();
    idle_cv_.notify_all();
}

std::size_t QueuedScheduler::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

TaskId QueuedScheduler::insert_locked(TimePoint due, Millis interval, Task task) {
    TaskId id = next_id_++;
    Entry entry;
    entry.due = due;
    entry.interval = interval;
    entry.task = std::make_shared<Task>(std::move(task));
    entries_.emplace(id, std::move(entry));
    order_.emplace(std::make_pair(due, id), id);
    on_inserted_locked();
    return id;
}

bool QueuedScheduler::pop_due_locked(TimePoint limit, TaskId& id, TimePoint& due, std::shared_ptr<Task>& task) {
    if (order_.empty()) {
        return false;
    }
    auto first = order_.begin();
    if (first->first.first > limit) {
        return false;
    }

    id = first->second;
    due = first->first.first;
    order_.erase(first);

    auto it = entries_.find(id);
    task = it->second.task;

    if (it->second.interval > Millis(0)) {
        it->second.due = due + it->second.interval;
        order_.emplace(std::make_pair(it->second.due, id), id);
    } else {
        entries_.erase(it);
    }
    return true;
}

bool QueuedScheduler::next_due_locked(TimePoint& due) const {
    if (order_.empty()) {
        return false;
    }
    due = order_.begin()->first.first;
    return true;
}

// =============================================================================
// ThreadScheduler
// =============================================================================

ThreadScheduler::ThreadScheduler(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)),
      stopping_(false) {
    worker_ = std::thread([this]() { run(); });
}

ThreadScheduler::~ThreadScheduler() {
    stop();
}

TimePoint ThreadScheduler::now() const {
    return Clock::now();
}

TimePoint ThreadScheduler::now_locked() const {
    return Clock::now();
}

int64_t ThreadScheduler::wall_time(TimePoint tp) const {
    return current_time_ms() +
        std::chrono::duration_cast<Millis>(tp - Clock::now()).count();
}

void ThreadScheduler::on_inserted_locked() {
    cv_.notify_one();
}

void ThreadScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
        clear_locked();
    }
    cv_.notify_all();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    } else if (worker_.joinable()) {
        worker_.detach();
    }
}

void ThreadScheduler::run() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (!stopping_) {
        TimePoint due;
        if (!next_due_locked(due)) {
            cv_.wait(lock);
            continue;
        }
        if (due > Clock::now()) {
            cv_.wait_until(lock, due);
            continue;
        }

        TaskId id;
        std::shared_ptr<Task> task;
        if (!pop_due_locked(Clock::now(), id, due, task)) {
            continue;
        }

        begin_run_locked(id);
        lock.unlock();
        try {
            (*task)();
        } catch (const std::exception& e) {
            if (logger_) {
                logger_->error("Scheduled task failed: {}", e.what());
            }
        }
        lock.lock();
        end_run_locked();
    }
}

// =============================================================================
// ManualScheduler
// =============================================================================

ManualScheduler::ManualScheduler()
    : epoch_(Clock::now()),
      now_(epoch_),
      wall_epoch_ms_(current_time_ms()) {
}

TimePoint ManualScheduler::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
}

TimePoint ManualScheduler::now_locked() const {
    return now_;
}

int64_t ManualScheduler::wall_time(TimePoint tp) const {
    return wall_epoch_ms_ + std::chrono::duration_cast<Millis>(tp - epoch_).count();
}

std::size_t ManualScheduler::advance(Millis delta) {
    std::size_t ran = 0;
    TimePoint target;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        target = now_ + delta;
    }

    while (true) {
        std::shared_ptr<Task> task;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            TaskId id;
            TimePoint due;
            if (!pop_due_locked(target, id, due, task)) {
                now_ = target;
                break;
            }
            if (due > now_) {
                now_ = due;
            }
            begin_run_locked(id);
        }
        try {
            (*task)();
        } catch (...) {
            std::lock_guard<std::mutex> lock(mutex_);
            end_run_locked();
            throw;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            end_run_locked();
        }
        ++ran;
    }
    return ran;
}

std::size_t ManualScheduler::run_pending() {
    return advance(Millis(0));
}

} // namespace pulsewire
