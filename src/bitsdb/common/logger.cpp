#include "bitsdb/common/logger.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>

namespace bitsdb {
namespace common {

std::shared_ptr<spdlog::logger> Logger::Init(spdlog::level::level_enum level) {
    auto logger = spdlog::get(kLoggerName);
    if (!logger) {
        try {
            logger = spdlog::stdout_color_mt(kLoggerName);
            logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [thread %t] %v");
        } catch (const spdlog::spdlog_ex& ex) {
            // registered by a concurrent Init
            logger = spdlog::get(kLoggerName);
            if (!logger) {
                std::cerr << "Log initialization failed: " << ex.what() << std::endl;
                return spdlog::default_logger();
            }
        }
    }
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);
    return logger;
}

void Logger::SetLevel(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

spdlog::level::level_enum Logger::Level() {
    return spdlog::get_level();
}

ScopedLogLevel::ScopedLogLevel(spdlog::level::level_enum level) : previous_(Logger::Level()) {
    Logger::SetLevel(level);
}

ScopedLogLevel::~ScopedLogLevel() {
    Logger::SetLevel(previous_);
}

} // namespace common
} // namespace bitsdb
