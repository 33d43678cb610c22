/**
 * @file rate_limiter.cpp
 * @brief Sliding-window admission control for PulseWire
 */

#include "pulsewire/rate_limiter.hpp"
#include "pulsewire/errors.hpp"
#include <algorithm>
#include <chrono>
#include <iterator>

namespace pulsewire {

json RateLimitUsage::to_json() const {
    return {
        {"burst", burst},
        {"minute", minute},
        {"hour", hour},
        {"day", day}
    };
}

RateLimiter::RateLimiter(const RateLimitOptions& options, RuntimeContext& context)
    : context_(context),
      logger_(context.logger("ratelimit")),
      specs_{{
          {"burst", std::chrono::seconds(1), options.burst},
          {"minute", std::chrono::minutes(1), options.per_minute},
          {"hour", std::chrono::hours(1), options.per_hour},
          {"day", std::chrono::hours(24), options.per_day}
      }},
      enabled_(options.enabled),
      cleanup_task_(INVALID_TASK) {
    if (options.cleanup_interval_ms > 0) {
        cleanup_task_ = context_.scheduler().schedule_every(
            Millis(options.cleanup_interval_ms), [this]() { cleanup(); });
    }
}

RateLimiter::~RateLimiter() {
    context_.scheduler().cancel_and_wait(cleanup_task_);
}

std::string RateLimiter::make_key(const std::string& identifier, const std::string& action) {
    return identifier + ":" + action;
}

int RateLimiter::count_within(const std::deque<TimePoint>& window, Millis size, TimePoint now) const {
    auto first = std::upper_bound(window.begin(), window.end(), now - size);
    return static_cast<int>(std::distance(first, window.end()));
}

void RateLimiter::check_limit(const std::string& identifier, const std::string& action) {
    TimePoint now = context_.scheduler().now();
    std::string key = make_key(identifier, action);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!enabled_) {
        return;
    }

    Windows& windows = windows_[key];

    for (std::size_t i = 0; i < WINDOW_COUNT; i++) {
        const WindowSpec& spec = specs_[i];
        auto& window = windows[i];

        while (!window.empty() && window.front() <= now - spec.size) {
            window.pop_front();
        }

        if (spec.cap <= 0) {
            continue;
        }

        if (static_cast<int>(window.size()) >= spec.cap) {
            auto retry_after = std::chrono::duration_cast<Millis>(window.front() + spec.size - now);
            logger_->warn("Rate limit hit for {} in {} window, retry after {}ms",
                          key, spec.name, retry_after.count());
            throw RateLimitError(
                "Rate limit exceeded for " + key + " (" + spec.name + " window)",
                retry_after, spec.name);
        }
    }

    for (std::size_t i = 0; i < WINDOW_COUNT; i++) {
        if (specs_[i].cap > 0) {
            windows[i].push_back(now);
        }
    }
}

RateLimitUsage RateLimiter::get_usage(const std::string& identifier, const std::string& action) const {
    TimePoint now = context_.scheduler().now();
    RateLimitUsage usage;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = windows_.find(make_key(identifier, action));
    if (it == windows_.end()) {
        return usage;
    }

    const Windows& windows = it->second;
    usage.burst = count_within(windows[0], specs_[0].size, now);
    usage.minute = count_within(windows[1], specs_[1].size, now);
    usage.hour = count_within(windows[2], specs_[2].size, now);
    usage.day = count_within(windows[3], specs_[3].size, now);
    return usage;
}

RateLimitUsage RateLimiter::get_remaining(const std::string& identifier, const std::string& action) const {
    RateLimitUsage used = get_usage(identifier, action);
    std::array<WindowSpec, WINDOW_COUNT> specs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        specs = specs_;
    }

    auto remaining = [](int cap, int count) {
        return cap > 0 ? std::max(0, cap - count) : -1;
    };

    RateLimitUsage result;
    result.burst = remaining(specs[0].cap, used.burst);
    result.minute = remaining(specs[1].cap, used.minute);
    result.hour = remaining(specs[2].cap, used.hour);
    result.day = remaining(specs[3].cap, used.day);
    return result;
}

void RateLimiter::reset(const std::string& identifier, const std::string& action) {
    std::lock_guard<std::mutex> lock(mutex_);
    windows_.erase(make_key(identifier, action));
}

void RateLimiter::reset_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    windows_.clear();
}

void RateLimiter::set_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    enabled_ = enabled;
}

bool RateLimiter::enabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return enabled_;
}

void RateLimiter::update_limits(const RateLimitOptions& options) {
    std::lock_guard<std::mutex> lock(mutex_);
    specs_[0].cap = options.burst;
    specs_[1].cap = options.per_minute;
    specs_[2].cap = options.per_hour;
    specs_[3].cap = options.per_day;
    enabled_ = options.enabled;
    logger_->info("Rate limits updated: burst {}, minute {}, hour {}, day {}",
                  options.burst, options.per_minute, options.per_hour, options.per_day);
}

std::size_t RateLimiter::cleanup() {
    TimePoint now = context_.scheduler().now();
    std::size_t dropped = 0;

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = windows_.begin(); it != windows_.end();) {
        bool empty = true;
        for (std::size_t i = 0; i < WINDOW_COUNT; i++) {
            auto& window = it->second[i];
            if (!window.empty() && window.back() <= now - specs_[i].size) {
                window.clear();
            }
            if (!window.empty()) {
                empty = false;
            }
        }

        if (empty) {
            it = windows_.erase(it);
            dropped++;
        } else {
            ++it;
        }
    }

    if (dropped > 0) {
        logger_->debug("Rate limiter cleanup dropped {} keys, {} remain", dropped, windows_.size());
    }
    return dropped;
}

RateLimiterStats RateLimiter::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    RateLimiterStats result;
    result.enabled = enabled_;
    result.tracked_keys = windows_.size();
    for (const auto& [key, windows] : windows_) {
        for (const auto& window : windows) {
            result.tracked_timestamps += window.size();
        }
    }
    return result;
}

} // namespace pulsewire
