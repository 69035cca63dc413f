#include "stream_decoder.hpp"

#include <algorithm>

namespace proto {

    std::optional<RawFrame> FrameDecoder::Next(ByteBuffer& buffer)
    {
        std::optional<RawFrame> frame;

        m_State = State::SeekDelimiter;
        while (Step(buffer, frame)) {
        }

        return frame;
    }

    bool FrameDecoder::Step(ByteBuffer& buffer, std::optional<RawFrame>& frame)
    {
        switch (m_State) {
            case State::SeekDelimiter:
                return SeekDelimiter(buffer);
            case State::ValidatingHeader:
                return ValidateHeader(buffer);
            case State::AccumulatingPayload:
                return AccumulatePayload(buffer, frame);
            default:
                m_State = State::SeekDelimiter;
                return false;
        }
    }

    bool FrameDecoder::SeekDelimiter(ByteBuffer& buffer)
    {
        auto delimiter = std::find(buffer.begin(), buffer.end(), 0);
        if (delimiter == buffer.end()) {
            Discard(buffer, buffer.size());
            return false;
        }

        Discard(buffer, static_cast<size_t>(delimiter - buffer.begin()));
        m_State = State::ValidatingHeader;
        return true;
    }

    bool FrameDecoder::ValidateHeader(ByteBuffer& buffer)
    {
        if (buffer.size() < kFramePayloadOffset) {
            // Wait for the rest of the header
            return false;
        }

        if (!std::equal(kFrameHeader.begin(), kFrameHeader.end(), buffer.begin() + 1)) {
            // Resync on the next delimiter, position 0 is the one that just failed
            auto next = std::find(buffer.begin() + 1, buffer.end(), 0);
            Discard(buffer, static_cast<size_t>(next - buffer.begin()));
            m_Stats.header_mismatches++;
            m_State = State::SeekDelimiter;
            return false;
        }

        m_State = State::AccumulatingPayload;
        return true;
    }

    bool FrameDecoder::AccumulatePayload(ByteBuffer& buffer, std::optional<RawFrame>& frame)
    {
        // The header itself carries a zero, the terminator search starts after it
        auto terminator = std::find(buffer.begin() + kFramePayloadOffset, buffer.end(), 0);
        if (terminator == buffer.end()) {
            if (buffer.size() > kMaxFrameSize) {
                // Can never fit a frame anymore, drop it and look for the next delimiter
                Discard(buffer, buffer.size());
                m_Stats.oversized_frames++;
                m_State = State::SeekDelimiter;
            }
            return false;
        }

        const size_t frame_size = static_cast<size_t>(terminator - buffer.begin());
        if (frame_size > kMaxFrameSize) {
            Discard(buffer, frame_size);
            m_Stats.oversized_frames++;
            m_State = State::SeekDelimiter;
            return false;
        }

        frame.emplace(buffer.begin(), terminator);
        // The terminator stays in the buffer, it may open the next frame
        buffer.erase(buffer.begin(), terminator);
        m_Stats.frames++;
        m_State = State::SeekDelimiter;
        return false;
    }

    void FrameDecoder::Discard(ByteBuffer& buffer, size_t count)
    {
        count = std::min(count, buffer.size());
        buffer.erase(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(count));
        m_Stats.discarded_bytes += static_cast<uint32_t>(count);
    }

    const char* ToString(FrameDecoder::State state)
    {
        switch (state) {
            case FrameDecoder::State::SeekDelimiter:       return "SeekDelimiter";
            case FrameDecoder::State::ValidatingHeader:    return "ValidatingHeader";
            case FrameDecoder::State::AccumulatingPayload: return "AccumulatingPayload";
            default:                                       return "Unknown";
        }
    }

}
