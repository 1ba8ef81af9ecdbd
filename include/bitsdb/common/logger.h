#ifndef BITSDB_COMMON_LOGGER_H_
#define BITSDB_COMMON_LOGGER_H_

#include <memory>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

namespace bitsdb {
namespace common {

constexpr const char* kLoggerName = "bitsdb";

/**
 * @brief Process-wide logging setup.
 *
 * Init() registers the "bitsdb" console logger and makes it spdlog's
 * default, so the BITSDB_* macros below write through it. Calling Init()
 * again reuses the registered logger and only changes the level.
 */
class Logger {
public:
    static std::shared_ptr<spdlog::logger> Init(
        spdlog::level::level_enum level = spdlog::level::info);
    static void SetLevel(spdlog::level::level_enum level);
    static spdlog::level::level_enum Level();
};

/**
 * @brief Switches the log level until destruction, then restores the
 * previous one. Used to trace lock order and retries of a single call.
 */
class ScopedLogLevel {
public:
    explicit ScopedLogLevel(spdlog::level::level_enum level);
    ~ScopedLogLevel();

    ScopedLogLevel(const ScopedLogLevel&) = delete;
    ScopedLogLevel& operator=(const ScopedLogLevel&) = delete;

private:
    spdlog::level::level_enum previous_;
};

} // namespace common
} // namespace bitsdb

#define BITSDB_TRACE(...) spdlog::trace(__VA_ARGS__)
#define BITSDB_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define BITSDB_INFO(...)  spdlog::info(__VA_ARGS__)
#define BITSDB_WARN(...)  spdlog::warn(__VA_ARGS__)
#define BITSDB_ERROR(...) spdlog::error(__VA_ARGS__)
#define BITSDB_CRITICAL(...) spdlog::critical(__VA_ARGS__)

#endif // BITSDB_COMMON_LOGGER_H_
