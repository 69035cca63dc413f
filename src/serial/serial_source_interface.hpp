#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "stream_decoder.hpp"

namespace serial {

    enum class ReadStatus : uint8_t {
        OK = 0,
        WOULD_BLOCK,
        END_OF_STREAM,
        IO_ERROR
    };

    const char* ToString(ReadStatus status);

    /**
     * @brief Append-only byte feed of one anchor
     *
     * The fd is only used to wait for readiness, reading goes through Read().
     */
    class ISerialSource {
    public:
        virtual ~ISerialSource() = default;
        virtual int GetFd() const = 0;
        virtual const char* GetName() const = 0;

        /**
         * @brief Append whatever is available without blocking
         *
         * @param buffer Stream buffer, data is appended at the end
         * @param bytesRead Number of bytes appended
         */
        virtual ReadStatus Read(proto::ByteBuffer& buffer, size_t& bytesRead) = 0;
    };

    /**
     * @brief Source over an already open file descriptor (serial device, pipe, replay file)
     */
    class FdSource : public ISerialSource {
    public:
        FdSource(int fd, const char* name, bool ownsFd = true);
        ~FdSource() override;

        FdSource(const FdSource&) = delete;
        FdSource& operator=(const FdSource&) = delete;

        int GetFd() const override { return m_Fd; }
        const char* GetName() const override { return m_Name.c_str(); }
        ReadStatus Read(proto::ByteBuffer& buffer, size_t& bytesRead) override;

    private:
        static constexpr size_t kReadChunk = 4096;

        int m_Fd;
        std::string m_Name;
        bool m_OwnsFd;
    };

}
