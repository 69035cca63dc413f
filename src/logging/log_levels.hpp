/**
 * @file log_levels.hpp
 * @brief Severity levels of the gateway log
 */

#pragma once

#include <cstdint>

namespace magicloc {
namespace log {

/**
 * @brief Log severity, lower value = more severe
 *
 * The runtime threshold admits every level up to and including itself.
 */
enum class LogLevel : uint8_t {
    NONE    = 0,
    ERROR   = 1,
    WARN    = 2,
    INFO    = 3,  ///< Startup, per batch positions
    DEBUG   = 4,  ///< Dropped frames, synchronizer discards
    VERBOSE = 5   ///< Raw frames, queue depths, IMU intervals
};

// Single letter used in the stderr line prefix
constexpr const char* logLevelToChar(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR:   return "E";
        case LogLevel::WARN:    return "W";
        case LogLevel::INFO:    return "I";
        case LogLevel::DEBUG:   return "D";
        case LogLevel::VERBOSE: return "V";
        default:                return "?";
    }
}

constexpr const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::WARN:    return "WARN";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::VERBOSE: return "VERBOSE";
        default:                return "NONE";
    }
}

/**
 * @brief Threshold selected by the number of -v flags
 *
 * 0 -> INFO, 1 -> DEBUG, 2 or more -> VERBOSE
 */
constexpr LogLevel logLevelFromVerbosity(uint8_t verbosity) {
    return verbosity == 0 ? LogLevel::INFO
         : verbosity == 1 ? LogLevel::DEBUG
         : LogLevel::VERBOSE;
}

} // namespace log
} // namespace magicloc
