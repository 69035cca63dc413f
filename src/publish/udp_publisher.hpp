#pragma once

#include <cstdint>
#include <vector>

#include <netinet/in.h>

#include "publisher_interface.hpp"

namespace publish {

    /**
     * @brief One datagram per message: "<topic> <payload>"
     *
     * Subscribers filter on the topic prefix.
     */
    class UdpPublisher : public IPublisher {
    public:
        /**
         * @throws std::runtime_error if the socket can't be created or the host is not an IPv4 address
         */
        UdpPublisher(const char* host, uint16_t port);
        ~UdpPublisher() override;

        UdpPublisher(const UdpPublisher&) = delete;
        UdpPublisher& operator=(const UdpPublisher&) = delete;

        bool Publish(etl::string_view topic, etl::span<const uint8_t> payload) override;

        uint32_t GetSendErrors() const { return m_SendErrors; }

    private:
        int m_Socket = -1;
        sockaddr_in m_Target = {};
        std::vector<uint8_t> m_Datagram;
        uint32_t m_SendErrors = 0;
    };

}
