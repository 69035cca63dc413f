#include "udp_publisher.hpp"

#include <arpa/inet.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

#include "logging/logging.hpp"

namespace publish {

    static constexpr size_t kMaxDatagramSize = 65507;

    UdpPublisher::UdpPublisher(const char* host, uint16_t port)
    {
        m_Socket = socket(AF_INET, SOCK_DGRAM, 0);
        if (m_Socket < 0) {
            throw std::runtime_error(std::string("Failed to create UDP socket: ") + strerror(errno));
        }

        m_Target.sin_family = AF_INET;
        m_Target.sin_port = htons(port);
        if (inet_pton(AF_INET, host, &m_Target.sin_addr) <= 0) {
            close(m_Socket);
            m_Socket = -1;
            throw std::runtime_error(std::string("Invalid publish address: ") + host);
        }

        m_Datagram.reserve(4096);
        LOG_INFO("Publishing to udp://%s:%u", host, static_cast<unsigned>(port));
    }

    UdpPublisher::~UdpPublisher()
    {
        if (m_Socket >= 0) {
            close(m_Socket);
        }
    }

    bool UdpPublisher::Publish(etl::string_view topic, etl::span<const uint8_t> payload)
    {
        if (topic.size() + 1 + payload.size() > kMaxDatagramSize) {
            m_SendErrors++;
            return false;
        }

        m_Datagram.clear();
        m_Datagram.insert(m_Datagram.end(), topic.begin(), topic.end());
        m_Datagram.push_back(' ');
        m_Datagram.insert(m_Datagram.end(), payload.begin(), payload.end());

        ssize_t sent = sendto(m_Socket, m_Datagram.data(), m_Datagram.size(), MSG_DONTWAIT,
                              reinterpret_cast<const sockaddr*>(&m_Target), sizeof(m_Target));
        if (sent < 0 || static_cast<size_t>(sent) != m_Datagram.size()) {
            m_SendErrors++;
            return false;
        }
        return true;
    }

}
