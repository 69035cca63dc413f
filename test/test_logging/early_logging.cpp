#include "capture_sink.hpp"

using magicloc::log::Logger;

CaptureSink& EarlySink()
{
    static CaptureSink sink;
    return sink;
}

namespace {

// Same shape as a parameter frontend: a global that logs from its constructor
struct EarlyLogger {
    EarlyLogger() {
        Logger::addSink(&EarlySink());
        LOG_WARN("logged before main");
    }
};

EarlyLogger s_earlyLogger;

}
