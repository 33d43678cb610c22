/**
 * @file logging.hpp
 * @brief Logger construction for PulseWire
 */

#ifndef PULSEWIRE_LOGGING_HPP
#define PULSEWIRE_LOGGING_HPP

#include "types.hpp"
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace pulsewire {

/**
 * Map the client log level onto spdlog
 */
spdlog::level::level_enum to_spdlog_level(LogLevel level);

/**
 * Create a root logger writing to stderr
 * @param name Logger name
 * @param level Minimum level
 * @return Logger, not registered in the spdlog global registry
 */
std::shared_ptr<spdlog::logger> make_logger(const std::string& name, LogLevel level);

/**
 * Create a logger that discards everything
 */
std::shared_ptr<spdlog::logger> make_null_logger(const std::string& name = "pulsewire");

} // namespace pulsewire

#endif // PULSEWIRE_LOGGING_HPP
