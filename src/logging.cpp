/**
 * @file logging.cpp
 * @brief Logger construction for PulseWire
 */

#include "pulsewire/logging.hpp"
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace pulsewire {

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::None: return spdlog::level::off;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Warning: return spdlog::level::warn;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::All: return spdlog::level::trace;
        default: return spdlog::level::info;
    }
}

std::shared_ptr<spdlog::logger> make_logger(const std::string& name, LogLevel level) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(name, sink);
    logger->set_level(to_spdlog_level(level));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    return logger;
}

std::shared_ptr<spdlog::logger> make_null_logger(const std::string& name) {
    auto sink = std::make_shared<spdlog::sinks::null_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(name, sink);
    logger->set_level(spdlog::level::off);
    return logger;
}

} // namespace pulsewire
