/**
 * @file retry_queue.cpp
 * @brief Bounded priority queue with retry backoff for PulseWire
 */

#include "pulsewire/retry_queue.hpp"
#include "pulsewire/errors.hpp"
#include <algorithm>
#include <exception>
#include <vector>

namespace pulsewire {

json QueueStats::to_json() const {
    json band_sizes = json::object();
    for (std::size_t i = 0; i < bands.size(); i++) {
        band_sizes[std::to_string(i + 1)] = bands[i];
    }
    return {
        {"processed", processed},
        {"failed", failed},
        {"retried", retried},
        {"dropped", dropped},
        {"bands", band_sizes},
        {"waiting_retry", waiting_retry},
        {"in_flight", in_flight},
        {"total", total},
        {"paused", paused}
    };
}

Millis retry_backoff(int64_t base_ms, int attempts) {
    const int64_t cap = MAX_RETRY_DELAY.count();
    int64_t delay = std::min(base_ms, cap);
    for (int i = 1; i < attempts && delay < cap; i++) {
        delay = std::min(delay * 2, cap);
    }
    return Millis(delay);
}

RetryQueue::RetryQueue(const QueueOptions& options, RuntimeContext& context)
    : context_(context),
      logger_(context.logger("queue")),
      options_(options),
      in_flight_(0),
      processed_(0),
      failed_(0),
      retried_(0),
      dropped_(0),
      paused_(false),
      stopped_(false),
      tick_task_(INVALID_TASK),
      generation_(0) {
    tick_task_ = context_.scheduler().schedule_every(
        Millis(options_.processing_interval_ms), [this]() { process(); });
}

RetryQueue::~RetryQueue() {
    shutdown();
}

void RetryQueue::shutdown() {
    std::vector<TaskId> timers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
        paused_ = true;
        generation_++;
        if (tick_task_ != INVALID_TASK) {
            timers.push_back(tick_task_);
            tick_task_ = INVALID_TASK;
        }
        for (const auto& [id, task] : retry_timers_) {
            timers.push_back(task);
        }
        retry_timers_.clear();
        waiting_.clear();
        for (auto& band : bands_) {
            band.clear();
        }
    }
    for (TaskId task : timers) {
        context_.scheduler().cancel_and_wait(task);
    }
}

void RetryQueue::set_delivery(DeliveryFunction delivery) {
    std::lock_guard<std::mutex> lock(mutex_);
    delivery_ = std::move(delivery);
}

void RetryQueue::on_delivered(DeliveredHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    delivered_handler_ = std::move(handler);
}

void RetryQueue::on_retry(RetryHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    retry_handler_ = std::move(handler);
}

void RetryQueue::on_failed(FailedHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    failed_handler_ = std::move(handler);
}

std::string RetryQueue::enqueue(const json& payload, int priority, std::optional<TimePoint> scheduled_at) {
    if (priority < MIN_PRIORITY || priority > MAX_PRIORITY) {
        throw ValidationError("Priority must be between 1 and 5", "priority", std::to_string(priority));
    }

    TimePoint now = context_.scheduler().now();

    std::lock_guard<std::mutex> lock(mutex_);
    if (size_locked() >= options_.max_size) {
        dropped_++;
        logger_->warn("Queue full ({} operations), rejecting enqueue", options_.max_size);
        throw QueueFullError(options_.max_size);
    }

    QueuedOperation op;
    op.id = generate_uuid();
    op.payload = payload;
    op.priority = priority;
    op.max_attempts = options_.max_retries;
    op.created_at = now;
    op.scheduled_at = scheduled_at.value_or(now);

    std::string id = op.id;
    bands_[priority - 1].push_back(std::move(op));
    logger_->debug("Queued operation {} at priority {}", id, priority);
    return id;
}

std::string RetryQueue::schedule(const json& payload, Millis delay, int priority) {
    return enqueue(payload, priority, context_.scheduler().now() + delay);
}

bool RetryQueue::cancel(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    for (auto& band : bands_) {
        auto it = std::find_if(band.begin(), band.end(),
            [&id](const QueuedOperation& op) { return op.id == id; });
        if (it != band.end()) {
            band.erase(it);
            return true;
        }
    }

    auto waiting = waiting_.find(id);
    if (waiting != waiting_.end()) {
        waiting_.erase(waiting);
        auto timer = retry_timers_.find(id);
        if (timer != retry_timers_.end()) {
            context_.scheduler().cancel(timer->second);
            retry_timers_.erase(timer);
        }
        return true;
    }

    return false;
}

void RetryQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& band : bands_) {
        band.clear();
    }
    waiting_.clear();
    for (const auto& [id, task] : retry_timers_) {
        context_.scheduler().cancel(task);
    }
    retry_timers_.clear();
    generation_++;
}

void RetryQueue::pause() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (paused_) {
        return;
    }
    paused_ = true;
    if (tick_task_ != INVALID_TASK) {
        context_.scheduler().cancel(tick_task_);
        tick_task_ = INVALID_TASK;
    }
    logger_->debug("Queue paused");
}

void RetryQueue::resume() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!paused_ || stopped_) {
        return;
    }
    paused_ = false;
    tick_task_ = context_.scheduler().schedule_every(
        Millis(options_.processing_interval_ms), [this]() { process(); });
    logger_->debug("Queue resumed");
}

bool RetryQueue::paused() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paused_;
}

std::size_t RetryQueue::process() {
    std::vector<QueuedOperation> batch;
    uint64_t generation;
    TimePoint now = context_.scheduler().now();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t limit = static_cast<std::size_t>(std::max(options_.batch_size, 1));

        for (auto& band : bands_) {
            // A future-scheduled head holds back the rest of its band only
            while (batch.size() < limit && !band.empty() && band.front().scheduled_at <= now) {
                QueuedOperation op = std::move(band.front());
                band.pop_front();
                op.status = OperationStatus::InFlight;
                batch.push_back(std::move(op));
                in_flight_++;
            }
            if (batch.size() >= limit) {
                break;
            }
        }
        generation = generation_;
    }

    if (!batch.empty()) {
        logger_->trace("Dispatching {} operations", batch.size());
    }

    for (auto& op : batch) {
        deliver(std::move(op), generation);
    }

    return batch.size();
}

void RetryQueue::deliver(QueuedOperation op, uint64_t generation) {
    DeliveryFunction delivery;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        delivery = delivery_;
    }

    std::string error;
    bool ok = false;
    if (!delivery) {
        error = "No delivery function configured";
    } else {
        try {
            delivery(op);
            ok = true;
        } catch (const std::exception& e) {
            error = e.what();
        }
    }

    if (ok) {
        DeliveredHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            in_flight_--;
            processed_++;
            handler = delivered_handler_;
        }
        op.status = OperationStatus::Done;
        if (handler) handler(op);
        return;
    }

    op.attempts++;
    op.last_error = error;
    logger_->warn("Delivery of {} failed (attempt {}/{}): {}",
                  op.id, op.attempts, op.max_attempts, error);

    if (op.attempts < op.max_attempts) {
        Millis delay = retry_backoff(options_.retry_delay_ms, op.attempts);
        RetryHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            in_flight_--;
            if (generation != generation_) {
                // Cleared while in flight
                return;
            }
            retried_++;
            op.status = OperationStatus::Pending;
            std::string id = op.id;
            waiting_[id] = op;
            retry_timers_[id] = context_.scheduler().schedule_after(
                delay, [this, id, generation]() { requeue(id, generation); });
            handler = retry_handler_;
        }
        if (handler) handler(op, delay);
        return;
    }

    FailedHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_--;
        failed_++;
        handler = failed_handler_;
    }
    op.status = OperationStatus::Failed;
    logger_->error("Operation {} failed permanently after {} attempts", op.id, op.attempts);
    if (handler) handler(op);
}

void RetryQueue::requeue(const std::string& id, uint64_t generation) {
    TimePoint now = context_.scheduler().now();

    std::lock_guard<std::mutex> lock(mutex_);
    if (generation != generation_) {
        return;
    }
    auto it = waiting_.find(id);
    if (it == waiting_.end()) {
        return;
    }

    QueuedOperation op = std::move(it->second);
    waiting_.erase(it);
    retry_timers_.erase(id);

    op.scheduled_at = now;
    int priority = op.priority;
    bands_[priority - 1].push_front(std::move(op));
}

std::size_t RetryQueue::size_locked() const {
    std::size_t total = waiting_.size() + in_flight_;
    for (const auto& band : bands_) {
        total += band.size();
    }
    return total;
}

std::size_t RetryQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return size_locked();
}

QueueStats RetryQueue::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    QueueStats result;
    result.processed = processed_;
    result.failed = failed_;
    result.retried = retried_;
    result.dropped = dropped_;
    for (std::size_t i = 0; i < bands_.size(); i++) {
        result.bands[i] = bands_[i].size();
    }
    result.waiting_retry = waiting_.size();
    result.in_flight = in_flight_;
    result.total = size_locked();
    result.paused = paused_;
    return result;
}

} // namespace pulsewire
