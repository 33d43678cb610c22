/**
 * @file context.hpp
 * @brief Runtime context shared by PulseWire components
 */

#ifndef PULSEWIRE_CONTEXT_HPP
#define PULSEWIRE_CONTEXT_HPP

#include "scheduler.hpp"
#include <memory>
#include <string>
#include <spdlog/logger.h>

namespace pulsewire {

/**
 * Everything a component needs from its surroundings. Owned by whoever
 * constructs the client; components only keep references.
 */
class RuntimeContext {
public:
    RuntimeContext(Scheduler& scheduler, std::shared_ptr<spdlog::logger> logger)
        : scheduler_(scheduler), logger_(std::move(logger)) {}

    Scheduler& scheduler() const { return scheduler_; }

    const std::shared_ptr<spdlog::logger>& root_logger() const { return logger_; }

    /**
     * Child logger sharing the root's sinks and level
     * @param name Component name appended to the root name
     */
    std::shared_ptr<spdlog::logger> logger(const std::string& name) const {
        return logger_->clone(logger_->name() + "." + name);
    }

private:
    Scheduler& scheduler_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace pulsewire

#endif // PULSEWIRE_CONTEXT_HPP
