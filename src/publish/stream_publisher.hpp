#pragma once

#include <cstdio>

#include "publisher_interface.hpp"

namespace publish {

    // One "<topic> <payload>" line per message
    class StreamPublisher : public IPublisher {
    public:
        explicit StreamPublisher(FILE* stream) : m_Stream(stream) {}

        bool Publish(etl::string_view topic, etl::span<const uint8_t> payload) override;

    private:
        FILE* m_Stream;
    };

}
