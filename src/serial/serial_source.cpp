#include "serial_source_interface.hpp"

#include <unistd.h>

#include <cerrno>

namespace serial {

    FdSource::FdSource(int fd, const char* name, bool ownsFd)
        : m_Fd(fd), m_Name(name), m_OwnsFd(ownsFd)
    {
    }

    FdSource::~FdSource()
    {
        if (m_OwnsFd && m_Fd >= 0) {
            close(m_Fd);
        }
    }

    ReadStatus FdSource::Read(proto::ByteBuffer& buffer, size_t& bytesRead)
    {
        bytesRead = 0;

        const size_t oldSize = buffer.size();
        buffer.resize(oldSize + kReadChunk);

        ssize_t n = ::read(m_Fd, buffer.data() + oldSize, kReadChunk);
        if (n > 0) {
            buffer.resize(oldSize + static_cast<size_t>(n));
            bytesRead = static_cast<size_t>(n);
            return ReadStatus::OK;
        }

        const int err = errno;
        buffer.resize(oldSize);
        if (n == 0) {
            return ReadStatus::END_OF_STREAM;
        }
        if (err == EAGAIN || err == EWOULDBLOCK || err == EINTR) {
            return ReadStatus::WOULD_BLOCK;
        }
        errno = err;
        return ReadStatus::IO_ERROR;
    }

    const char* ToString(ReadStatus status)
    {
        switch (status) {
            case ReadStatus::OK:            return "OK";
            case ReadStatus::WOULD_BLOCK:   return "WOULD_BLOCK";
            case ReadStatus::END_OF_STREAM: return "END_OF_STREAM";
            case ReadStatus::IO_ERROR:      return "IO_ERROR";
            default:                        return "UNKNOWN";
        }
    }

}
