#pragma once

#include <string>
#include <vector>

#include "logging/logging.hpp"

class CaptureSink : public magicloc::log::ILogSink {
public:
    struct Entry {
        magicloc::log::LogLevel level;
        std::string tag;
        std::string message;
    };

    void Write(const magicloc::log::LogRecord& record) override {
        entries.push_back({record.level, record.tag, record.message});
    }

    std::vector<Entry> entries;
};

// Registered by a global constructor in early_logging.cpp, before main()
CaptureSink& EarlySink();
