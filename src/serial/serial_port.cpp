#include "serial_port.hpp"

#include <fcntl.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>
#include <linux/serial.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

#include "logging/logging.hpp"

namespace serial {

    struct BaudEntry {
        uint32_t rate;
        speed_t speed;
    };

    static constexpr BaudEntry kBaudTable[] = {
        {9600, B9600},
        {19200, B19200},
        {38400, B38400},
        {57600, B57600},
        {115200, B115200},
        {230400, B230400},
        {460800, B460800},
        {921600, B921600},
        {1000000, B1000000},
        {2000000, B2000000},
    };

    static bool LookupSpeed(uint32_t rate, speed_t& speed)
    {
        for (const BaudEntry& entry : kBaudTable) {
            if (entry.rate == rate) {
                speed = entry.speed;
                return true;
            }
        }
        return false;
    }

    static std::runtime_error PortError(const char* path, const char* what)
    {
        return std::runtime_error(std::string(path) + ": " + what + ": " + strerror(errno));
    }

    SerialPort::SerialPort(const char* path, uint32_t baudRate, bool lowLatency)
        : FdSource(Open(path, baudRate, lowLatency), path)
    {
        LOG_INFO("Opened %s at %u baud%s", path, static_cast<unsigned>(baudRate), lowLatency ? ", low latency" : "");
    }

    int SerialPort::Open(const char* path, uint32_t baudRate, bool lowLatency)
    {
        speed_t speed;
        if (!LookupSpeed(baudRate, speed)) {
            throw std::runtime_error(std::string(path) + ": unsupported baud rate " + std::to_string(baudRate));
        }

        int fd = open(path, O_RDWR | O_NOCTTY | O_NONBLOCK);
        if (fd < 0) {
            throw PortError(path, "open failed");
        }

        struct termios tty;
        memset(&tty, 0, sizeof(tty));
        if (tcgetattr(fd, &tty) != 0) {
            std::runtime_error err = PortError(path, "tcgetattr failed");
            close(fd);
            throw err;
        }

        cfmakeraw(&tty);
        cfsetospeed(&tty, speed);
        cfsetispeed(&tty, speed);

        tty.c_cflag |= (CLOCAL | CREAD);
        tty.c_cflag &= ~PARENB;     // No parity
        tty.c_cflag &= ~CSTOPB;     // 1 stop bit
        tty.c_cflag &= ~CSIZE;
        tty.c_cflag |= CS8;
        tty.c_cflag &= ~CRTSCTS;
        tty.c_iflag &= ~(IXON | IXOFF | IXANY);

        // Non blocking reads, readiness comes from poll()
        tty.c_cc[VMIN] = 0;
        tty.c_cc[VTIME] = 0;

        if (tcsetattr(fd, TCSANOW, &tty) != 0) {
            std::runtime_error err = PortError(path, "tcsetattr failed");
            close(fd);
            throw err;
        }

#ifdef USE_SERIAL_LOW_LATENCY
        if (lowLatency) {
            struct serial_struct serialInfo;
            if (ioctl(fd, TIOCGSERIAL, &serialInfo) == 0) {
                serialInfo.flags |= ASYNC_LOW_LATENCY;
                if (ioctl(fd, TIOCSSERIAL, &serialInfo) != 0) {
                    LOG_WARN("%s: low latency mode rejected: %s", path, strerror(errno));
                }
            } else {
                LOG_WARN("%s: low latency mode not supported: %s", path, strerror(errno));
            }
        }
#else
        (void)lowLatency;
#endif

        // Drop whatever the anchor sent before we were listening
        if (tcflush(fd, TCIFLUSH) != 0) {
            LOG_WARN("%s: input flush failed: %s", path, strerror(errno));
        }

        return fd;
    }

}
