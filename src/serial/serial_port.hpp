#pragma once

#include <cstdint>

#include "serial_source_interface.hpp"

namespace serial {

    /**
     * @brief Anchor serial device: raw 8N1, configured baud rate, input flushed on open
     *
     * With lowLatency the Linux ASYNC_LOW_LATENCY flag is requested. Drivers that don't
     * support it only produce a warning.
     */
    class SerialPort : public FdSource {
    public:
        /**
         * @throws std::runtime_error if the device can't be opened or configured
         */
        SerialPort(const char* path, uint32_t baudRate, bool lowLatency);

    private:
        static int Open(const char* path, uint32_t baudRate, bool lowLatency);
    };

}
