#include "stream_publisher.hpp"

namespace publish {

    bool StreamPublisher::Publish(etl::string_view topic, etl::span<const uint8_t> payload)
    {
        if (m_Stream == nullptr) {
            return false;
        }

        if (fwrite(topic.data(), 1, topic.size(), m_Stream) != topic.size() ||
            fputc(' ', m_Stream) == EOF ||
            fwrite(payload.data(), 1, payload.size(), m_Stream) != payload.size() ||
            fputc('\n', m_Stream) == EOF) {
            return false;
        }

        return fflush(m_Stream) == 0;
    }

}
