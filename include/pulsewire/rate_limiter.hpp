/**
 * @file rate_limiter.hpp
 * @brief Sliding-window admission control for PulseWire
 */

#ifndef PULSEWIRE_RATE_LIMITER_HPP
#define PULSEWIRE_RATE_LIMITER_HPP

#include "config.hpp"
#include "context.hpp"
#include "types.hpp"
#include <array>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

namespace pulsewire {

/**
 * Per-window counts for one identifier and action
 */
struct RateLimitUsage {
    int burst = 0;
    int minute = 0;
    int hour = 0;
    int day = 0;

    json to_json() const;
};

struct RateLimiterStats {
    bool enabled = true;
    std::size_t tracked_keys = 0;
    std::size_t tracked_timestamps = 0;
};

/**
 * Burst, minute, hour and day windows keyed by "identifier:action".
 *
 * A call either passes every window and is recorded in all of them, or is
 * rejected and recorded in none.
 */
class RateLimiter {
public:
    RateLimiter(const RateLimitOptions& options, RuntimeContext& context);
    ~RateLimiter();

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /**
     * Admit one call or reject it
     * @param identifier Caller identity (recipient, user, ...)
     * @param action Action name
     * @throws RateLimitError naming the first full window and the time until it frees up
     */
    void check_limit(const std::string& identifier, const std::string& action);

    /**
     * Count of recorded calls still inside each window. Never mutates state.
     */
    RateLimitUsage get_usage(const std::string& identifier, const std::string& action) const;

    /**
     * Calls left in each window. Disabled windows report -1.
     */
    RateLimitUsage get_remaining(const std::string& identifier, const std::string& action) const;

    void reset(const std::string& identifier, const std::string& action);
    void reset_all();

    /**
     * A disabled limiter admits everything and records nothing
     */
    void set_enabled(bool enabled);
    bool enabled() const;

    /**
     * Replace the window caps and the enabled flag. Recorded calls are kept;
     * a window that was disabled starts out empty. The cleanup interval is
     * fixed at construction.
     */
    void update_limits(const RateLimitOptions& options);

    /**
     * Evict windows whose newest entry has aged out
     * @return Number of keys dropped entirely
     */
    std::size_t cleanup();

    RateLimiterStats stats() const;

private:
    static constexpr std::size_t WINDOW_COUNT = 4;

    struct WindowSpec {
        const char* name;
        Millis size;
        int cap;
    };

    using Windows = std::array<std::deque<TimePoint>, WINDOW_COUNT>;

    static std::string make_key(const std::string& identifier, const std::string& action);
    int count_within(const std::deque<TimePoint>& window, Millis size, TimePoint now) const;

    RuntimeContext& context_;
    std::shared_ptr<spdlog::logger> logger_;
    std::array<WindowSpec, WINDOW_COUNT> specs_;
    bool enabled_;
    std::unordered_map<std::string, Windows> windows_;
    TaskId cleanup_task_;
    mutable std::mutex mutex_;
};

} // namespace pulsewire

#endif // PULSEWIRE_RATE_LIMITER_HPP
