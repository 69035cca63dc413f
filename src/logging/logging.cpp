#include "config/features.hpp"

#ifdef USE_LOGGING

#include "logging.hpp"
#include "log_udp_backend.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <mutex>

namespace magicloc {
namespace log {

namespace {

// [timestamp][L][tag] message
class StderrSink : public ILogSink {
public:
    void Write(const LogRecord& record) override {
        fprintf(stderr, "[%lu][%s][%s] %s\n",
                static_cast<unsigned long>(record.timestampMs),
                logLevelToChar(record.level),
                record.tag,
                record.message);
    }
};

// Constant initialized, usable from other translation units' static constructors
std::mutex s_logMutex;

// Everything below is constructed on first use, frontends log before main()
#ifdef USE_LOGGING_STDERR
StderrSink& StderrSinkInstance()
{
    static StderrSink sink;
    return sink;
}
#endif

#ifdef USE_LOGGING_UDP
UdpLogSink& UdpSinkInstance()
{
    static UdpLogSink sink;
    return sink;
}
#endif

uint32_t MillisSinceStart()
{
    static const std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::steady_clock::now() - start;
    return static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
}

}

bool Logger::s_initialized = false;
LogLevel Logger::s_level = LogLevel::INFO;

etl::vector<ILogSink*, Logger::kMaxSinks>& Logger::sinks()
{
    static etl::vector<ILogSink*, kMaxSinks> table;
    return table;
}

void Logger::init()
{
    std::lock_guard<std::mutex> lock(s_logMutex);
    if (s_initialized) {
        return;
    }
#ifdef USE_LOGGING_STDERR
    addSinkLocked(&StderrSinkInstance());
#endif
    s_initialized = true;
}

void Logger::log(LogLevel level, const char* tag, const char* format, ...)
{
    va_list args;
    va_start(args, format);
    logv(level, tag, format, args);
    va_end(args);
}

void Logger::logv(LogLevel level, const char* tag, const char* format, va_list args)
{
    if (!s_initialized) {
        init();
    }
    if (!isEnabled(level)) {
        return;
    }

    std::lock_guard<std::mutex> lock(s_logMutex);
    etl::vector<ILogSink*, kMaxSinks>& table = sinks();
    if (table.empty()) {
        return;
    }

    char message[kMaxMessage];
    vsnprintf(message, sizeof(message), format, args);

    const LogRecord record{MillisSinceStart(), level, tag, message};
    for (ILogSink* sink : table) {
        sink->Write(record);
    }
}

void Logger::setLevel(LogLevel level)
{
    s_level = level;
}

LogLevel Logger::getLevel()
{
    return s_level;
}

bool Logger::isEnabled(LogLevel level)
{
    return level != LogLevel::NONE &&
           static_cast<uint8_t>(level) <= static_cast<uint8_t>(s_level);
}

bool Logger::addSink(ILogSink* sink)
{
    std::lock_guard<std::mutex> lock(s_logMutex);
    return addSinkLocked(sink);
}

void Logger::removeSink(ILogSink* sink)
{
    std::lock_guard<std::mutex> lock(s_logMutex);
    removeSinkLocked(sink);
}

size_t Logger::getSinkCount()
{
    std::lock_guard<std::mutex> lock(s_logMutex);
    return sinks().size();
}

bool Logger::addSinkLocked(ILogSink* sink)
{
    etl::vector<ILogSink*, kMaxSinks>& table = sinks();
    if (sink == nullptr || table.full()) {
        return false;
    }
    if (std::find(table.begin(), table.end(), sink) != table.end()) {
        return false;
    }
    table.push_back(sink);
    return true;
}

void Logger::removeSinkLocked(ILogSink* sink)
{
    etl::vector<ILogSink*, kMaxSinks>& table = sinks();
    auto it = std::find(table.begin(), table.end(), sink);
    if (it != table.end()) {
        table.erase(it);
    }
}

void Logger::setStderrEnabled(bool enabled)
{
#ifdef USE_LOGGING_STDERR
    std::lock_guard<std::mutex> lock(s_logMutex);
    if (enabled) {
        addSinkLocked(&StderrSinkInstance());
    } else {
        removeSinkLocked(&StderrSinkInstance());
    }
#else
    (void)enabled;
#endif
}

bool Logger::setUdpTarget(const char* host, uint16_t port)
{
#ifdef USE_LOGGING_UDP
    std::lock_guard<std::mutex> lock(s_logMutex);
    UdpLogSink& udpSink = UdpSinkInstance();
    if (!udpSink.Open(host, port)) {
        return false;
    }
    // Already attached is fine, only the target changed
    addSinkLocked(&udpSink);
    return true;
#else
    (void)host;
    (void)port;
    return false;
#endif
}

void Logger::disableUdp()
{
#ifdef USE_LOGGING_UDP
    std::lock_guard<std::mutex> lock(s_logMutex);
    removeSinkLocked(&UdpSinkInstance());
#endif
}

} // namespace log
} // namespace magicloc

#endif // USE_LOGGING
