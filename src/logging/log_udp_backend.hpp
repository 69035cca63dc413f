/**
 * @file log_udp_backend.hpp
 * @brief Log sink sending one JSON datagram per record
 *
 *   {"ts":123456,"lvl":"INFO","tag":"app.cpp","msg":"..."}
 */

#pragma once

#include "config/features.hpp"

#ifdef USE_LOGGING_UDP

#include <netinet/in.h>

#include <cstddef>
#include <cstdint>

#include "logging.hpp"

namespace magicloc {
namespace log {

class UdpLogSink : public ILogSink {
public:
    static constexpr uint16_t kDefaultPort = 3334;
    static constexpr size_t kMaxDatagram = 768;

    UdpLogSink() = default;
    ~UdpLogSink() override;

    UdpLogSink(const UdpLogSink&) = delete;
    UdpLogSink& operator=(const UdpLogSink&) = delete;

    /**
     * @brief Open the socket on first use and resolve the target
     *
     * @param host Dotted IPv4 address
     * @return false if the address does not parse or the socket cannot be created
     */
    bool Open(const char* host, uint16_t port);
    bool IsOpen() const { return m_Socket >= 0 && m_HasTarget; }

    void Write(const LogRecord& record) override;

    /**
     * @brief Render a record as JSON, the message is escaped
     *
     * @return Length written, 0 if the record does not fit
     */
    static size_t Format(const LogRecord& record, char* out, size_t size);

    // Datagrams that could not be handed to the socket
    uint32_t GetDropped() const { return m_Dropped; }

private:
    int m_Socket = -1;
    bool m_HasTarget = false;
    sockaddr_in m_Target = {};
    uint32_t m_Dropped = 0;
    char m_Buffer[kMaxDatagram] = {};
};

} // namespace log
} // namespace magicloc

#endif // USE_LOGGING_UDP
