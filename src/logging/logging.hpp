/**
 * @file logging.hpp
 * @brief Printf-style log macros and the sink based Logger
 *
 * Every call site goes through the LOG_* macros. The tag is the source file name,
 * resolved at compile time. A file may lower its own ceiling before the include:
 *
 *   #define LOG_LOCAL_LEVEL 3  // nothing above INFO compiled in here
 *   #include "logging/logging.hpp"
 *
 * Formatted records are fanned out to the registered sinks. stderr is attached by
 * default, the UDP sink once a target is configured.
 */

#pragma once

#include "config/features.hpp"
#include "log_levels.hpp"

#include <cstdarg>
#include <cstddef>
#include <cstdint>

#include <etl/vector.h>

namespace magicloc {
namespace log {
namespace detail {

// Basename of __FILE__
constexpr const char* extractFilename(const char* path) {
    const char* file = path;
    while (*path) {
        if (*path == '/' || *path == '\\') {
            file = path + 1;
        }
        path++;
    }
    return file;
}

} // namespace detail
} // namespace log
} // namespace magicloc

#ifndef LOG_GLOBAL_LEVEL
    #ifdef USE_LOGGING
        #define LOG_GLOBAL_LEVEL 5
    #else
        #define LOG_GLOBAL_LEVEL 0
    #endif
#endif

#ifndef LOG_LOCAL_LEVEL
    #define LOG_LOCAL_LEVEL LOG_GLOBAL_LEVEL
#endif

#ifdef USE_LOGGING

namespace magicloc {
namespace log {

/**
 * @brief One formatted log line as handed to the sinks
 *
 * Pointers are only valid for the duration of ILogSink::Write.
 */
struct LogRecord {
    uint32_t timestampMs;   ///< Since process start
    LogLevel level;
    const char* tag;
    const char* message;    ///< Formatted, no trailing newline
};

class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(const LogRecord& record) = 0;
};

/**
 * @brief Process wide logger
 *
 * Formatting and fan-out happen under one mutex, sinks never see concurrent calls.
 */
class Logger {
public:
    static constexpr size_t kMaxSinks = 4;
    static constexpr size_t kMaxMessage = 448;

    /**
     * @brief Attach the compiled-in default sinks, idempotent
     */
    static void init();

    static void log(LogLevel level, const char* tag, const char* format, ...)
        __attribute__((format(printf, 3, 4)));
    static void logv(LogLevel level, const char* tag, const char* format, va_list args);

    static void setLevel(LogLevel level);
    static LogLevel getLevel();
    static bool isEnabled(LogLevel level);

    /**
     * @brief Register an additional sink, must outlive its registration
     *
     * @return false if the sink table is full or the sink is already registered
     */
    static bool addSink(ILogSink* sink);
    static void removeSink(ILogSink* sink);
    static size_t getSinkCount();

    static void setStderrEnabled(bool enabled);

    /**
     * @brief Point the UDP sink at host:port and attach it
     *
     * @return false if UDP logging is not compiled in or the sink could not be opened
     */
    static bool setUdpTarget(const char* host, uint16_t port);
    static void disableUdp();

    static constexpr uint8_t getCompiledLogLevel() { return LOG_GLOBAL_LEVEL; }

private:
    static bool s_initialized;
    static LogLevel s_level;

    static etl::vector<ILogSink*, kMaxSinks>& sinks();

    static bool addSinkLocked(ILogSink* sink);
    static void removeSinkLocked(ILogSink* sink);
};

} // namespace log
} // namespace magicloc

#endif // USE_LOGGING

#define LOG_TAG magicloc::log::detail::extractFilename(__FILE__)

#ifdef USE_LOGGING

#define LOG_IMPL(level, tag, fmt, ...)                                         \
    do {                                                                        \
        if constexpr (static_cast<uint8_t>(level) <= LOG_LOCAL_LEVEL) {        \
            magicloc::log::Logger::log(level, tag, fmt, ##__VA_ARGS__);        \
        }                                                                       \
    } while (0)

#define LOG_ERROR(fmt, ...)   LOG_IMPL(magicloc::log::LogLevel::ERROR, LOG_TAG, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)    LOG_IMPL(magicloc::log::LogLevel::WARN, LOG_TAG, fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)    LOG_IMPL(magicloc::log::LogLevel::INFO, LOG_TAG, fmt, ##__VA_ARGS__)
#define LOG_DEBUG(fmt, ...)   LOG_IMPL(magicloc::log::LogLevel::DEBUG, LOG_TAG, fmt, ##__VA_ARGS__)
#define LOG_VERBOSE(fmt, ...) LOG_IMPL(magicloc::log::LogLevel::VERBOSE, LOG_TAG, fmt, ##__VA_ARGS__)

#else // USE_LOGGING

#define LOG_IMPL(level, tag, fmt, ...) do {} while (0)
#define LOG_ERROR(fmt, ...)            do {} while (0)
#define LOG_WARN(fmt, ...)             do {} while (0)
#define LOG_INFO(fmt, ...)             do {} while (0)
#define LOG_DEBUG(fmt, ...)            do {} while (0)
#define LOG_VERBOSE(fmt, ...)          do {} while (0)

#endif // USE_LOGGING
