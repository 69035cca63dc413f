#include "config/features.hpp"

#ifdef USE_LOGGING_UDP

#include "log_udp_backend.hpp"

#include <arpa/inet.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>

namespace magicloc {
namespace log {

UdpLogSink::~UdpLogSink()
{
    if (m_Socket >= 0) {
        close(m_Socket);
    }
}

bool UdpLogSink::Open(const char* host, uint16_t port)
{
    sockaddr_in target = {};
    target.sin_family = AF_INET;
    target.sin_port = htons(port);
    if (host == nullptr || inet_pton(AF_INET, host, &target.sin_addr) != 1) {
        return false;
    }

    if (m_Socket < 0) {
        m_Socket = socket(AF_INET, SOCK_DGRAM, 0);
        if (m_Socket < 0) {
            // The logger itself is the failing output
            fprintf(stderr, "UdpLogSink: socket failed: %s\n", strerror(errno));
            return false;
        }
    }

    m_Target = target;
    m_HasTarget = true;
    return true;
}

// JSON string body, stops at the last character that fits with its escape
static size_t AppendEscaped(const char* text, char* out, size_t size)
{
    size_t j = 0;
    for (size_t i = 0; text[i] != '\0'; i++) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        char escaped[8] = {};
        switch (c) {
            case '"':  escaped[0] = '\\'; escaped[1] = '"'; break;
            case '\\': escaped[0] = '\\'; escaped[1] = '\\'; break;
            case '\n': escaped[0] = '\\'; escaped[1] = 'n'; break;
            case '\r': escaped[0] = '\\'; escaped[1] = 'r'; break;
            case '\t': escaped[0] = '\\'; escaped[1] = 't'; break;
            default:
                if (c < 0x20) {
                    snprintf(escaped, sizeof(escaped), "\\u%04x", c);
                } else {
                    escaped[0] = static_cast<char>(c);
                }
                break;
        }

        const size_t needed = strlen(escaped);
        if (j + needed >= size) {
            break;
        }
        memcpy(out + j, escaped, needed);
        j += needed;
    }
    out[j] = '\0';
    return j;
}

size_t UdpLogSink::Format(const LogRecord& record, char* out, size_t size)
{
    char message[Logger::kMaxMessage * 2];
    AppendEscaped(record.message, message, sizeof(message));

    const int len = snprintf(out, size, "{\"ts\":%lu,\"lvl\":\"%s\",\"tag\":\"%s\",\"msg\":\"%s\"}",
                             static_cast<unsigned long>(record.timestampMs),
                             logLevelToString(record.level),
                             record.tag,
                             message);
    if (len <= 0 || static_cast<size_t>(len) >= size) {
        return 0;
    }
    return static_cast<size_t>(len);
}

void UdpLogSink::Write(const LogRecord& record)
{
    if (!IsOpen()) {
        return;
    }

    const size_t len = Format(record, m_Buffer, sizeof(m_Buffer));
    if (len == 0) {
        m_Dropped++;
        return;
    }

    // Never block the pipeline on a lost log datagram
    const ssize_t sent = sendto(m_Socket, m_Buffer, len, MSG_DONTWAIT,
                                reinterpret_cast<const sockaddr*>(&m_Target), sizeof(m_Target));
    if (sent != static_cast<ssize_t>(len)) {
        m_Dropped++;
    }
}

} // namespace log
} // namespace magicloc

#endif // USE_LOGGING_UDP
