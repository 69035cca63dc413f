#pragma once

#include <cstdint>
#include <string>

#include <etl/span.h>
#include <etl/string_view.h>

namespace publish {

    static constexpr const char* kRangesTopic = "ranges";
    static constexpr const char* kPointsTopic = "points";
    static constexpr const char* kImuTopic = "imu";
    static constexpr const char* kCirTopic = "cir";

    /**
     * @brief Sink for (topic, payload) messages
     *
     * Failures are reported through the return value and are never fatal for the caller.
     */
    class IPublisher {
    public:
        virtual ~IPublisher() = default;
        virtual bool Publish(etl::string_view topic, etl::span<const uint8_t> payload) = 0;
    };

    inline bool PublishText(IPublisher& publisher, etl::string_view topic, const std::string& text) {
        return publisher.Publish(topic, etl::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), text.size()));
    }

}
