/**
 * @file retry_queue.hpp
 * @brief Bounded priority queue with retry backoff for PulseWire
 */

#ifndef PULSEWIRE_RETRY_QUEUE_HPP
#define PULSEWIRE_RETRY_QUEUE_HPP

#include "config.hpp"
#include "context.hpp"
#include "types.hpp"
#include <array>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace pulsewire {

/**
 * Outbound operation owned by the queue
 */
struct QueuedOperation {
    std::string id;
    json payload;
    int priority = DEFAULT_PRIORITY;
    int attempts = 0;
    int max_attempts = 3;
    TimePoint created_at;
    TimePoint scheduled_at;
    OperationStatus status = OperationStatus::Pending;
    std::string last_error;
};

struct QueueStats {
    uint64_t processed = 0;
    uint64_t failed = 0;
    uint64_t retried = 0;
    uint64_t dropped = 0;
    std::array<std::size_t, MAX_PRIORITY> bands{};
    std::size_t waiting_retry = 0;
    std::size_t in_flight = 0;
    std::size_t total = 0;
    bool paused = false;

    json to_json() const;
};

/// Upper bound on a single retry delay
constexpr Millis MAX_RETRY_DELAY = std::chrono::hours(24);

/**
 * Delay before the next attempt: base * 2^(attempts-1), capped at MAX_RETRY_DELAY
 */
Millis retry_backoff(int64_t base_ms, int attempts);

/**
 * Priority bands 1 (highest) to 5, FIFO inside a band.
 *
 * A dispatch tick on the scheduler hands up to batch_size due operations to
 * the delivery function. A delivery that throws is retried after
 * retry_delay * 2^(attempts-1) at the front of its band, until max_retries
 * attempts have failed.
 */
class RetryQueue {
public:
    /// Delivers one operation; throwing marks the attempt as failed
    using DeliveryFunction = std::function<void(const QueuedOperation&)>;
    using DeliveredHandler = std::function<void(const QueuedOperation&)>;
    using RetryHandler = std::function<void(const QueuedOperation&, Millis delay)>;
    using FailedHandler = std::function<void(const QueuedOperation&)>;

    RetryQueue(const QueueOptions& options, RuntimeContext& context);
    ~RetryQueue();

    RetryQueue(const RetryQueue&) = delete;
    RetryQueue& operator=(const RetryQueue&) = delete;

    void set_delivery(DeliveryFunction delivery);
    void on_delivered(DeliveredHandler handler);
    void on_retry(RetryHandler handler);
    void on_failed(FailedHandler handler);

    /**
     * Add an operation
     * @param payload Operation payload
     * @param priority Priority band, 1 (highest) to 5
     * @param scheduled_at Earliest dispatch time, now if absent
     * @return Operation ID
     * @throws QueueFullError if max_size operations are already held
     * @throws ValidationError if the priority is out of range
     */
    std::string enqueue(
        const json& payload,
        int priority = DEFAULT_PRIORITY,
        std::optional<TimePoint> scheduled_at = std::nullopt
    );

    /**
     * Add an operation that becomes due after a delay
     */
    std::string schedule(const json& payload, Millis delay, int priority = DEFAULT_PRIORITY);

    /**
     * Remove a pending operation
     * @param id Operation ID
     * @return False if the ID is unknown or the operation is being delivered
     */
    bool cancel(const std::string& id);

    /**
     * Drop every pending and retry-waiting operation
     */
    void clear();

    /**
     * Stop the dispatch tick. Queued content is kept.
     */
    void pause();

    /**
     * Restart the dispatch tick
     */
    void resume();

    bool paused() const;

    /**
     * Stop dispatching for good. Returns once a tick or retry timer already
     * running has finished; operations still held are dropped.
     */
    void shutdown();

    /**
     * Run one dispatch tick
     * @return Number of operations handed to the delivery function
     */
    std::size_t process();

    std::size_t size() const;

    QueueStats stats() const;

private:
    std::size_t size_locked() const;
    void deliver(QueuedOperation op, uint64_t generation);
    void requeue(const std::string& id, uint64_t generation);

    RuntimeContext& context_;
    std::shared_ptr<spdlog::logger> logger_;
    QueueOptions options_;

    std::array<std::deque<QueuedOperation>, MAX_PRIORITY> bands_;
    std::unordered_map<std::string, QueuedOperation> waiting_;
    std::unordered_map<std::string, TaskId> retry_timers_;
    std::size_t in_flight_;

    DeliveryFunction delivery_;
    DeliveredHandler delivered_handler_;
    RetryHandler retry_handler_;
    FailedHandler failed_handler_;

    uint64_t processed_;
    uint64_t failed_;
    uint64_t retried_;
    uint64_t dropped_;

    bool paused_;
    bool stopped_;
    TaskId tick_task_;
    uint64_t generation_;
    mutable std::mutex mutex_;
};

} // namespace pulsewire

#endif // PULSEWIRE_RETRY_QUEUE_HPP
