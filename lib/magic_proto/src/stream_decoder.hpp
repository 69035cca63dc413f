#pragma once

#include <cstdint>
#include <cstddef>
#include <optional>
#include <vector>

#include <etl/array.h>
#include <etl/vector.h>

/**
 * @brief Frame extraction from a continuous serial byte stream
 *
 * Frame envelope on the wire:
 *
 *      0x00 | 0xFF 0x01 0x00 | stuffed payload | 0x00
 *
 * The decoder never fails. Malformed spans are discarded and decoding resumes
 * from the next zero byte. The byte buffer lives outside the decoder so the caller
 * can keep appending to it between calls.
 */
namespace proto {

    static constexpr etl::array<uint8_t, 3> kFrameHeader = {0xFF, 0x01, 0x00};
    // Leading delimiter + header
    static constexpr size_t kFramePayloadOffset = 1 + kFrameHeader.size();
    static constexpr size_t kMaxFrameSize = 512;

    using ByteBuffer = std::vector<uint8_t>;
    // Leading zero, header and stuffed payload. The terminating zero is not included.
    using RawFrame = etl::vector<uint8_t, kMaxFrameSize>;

    struct FrameStats {
        uint32_t frames = 0;
        uint32_t discarded_bytes = 0;
        uint32_t header_mismatches = 0;
        uint32_t oversized_frames = 0;
    };

    class FrameDecoder {
    public:
        enum class State : uint8_t {
            SeekDelimiter = 0,
            ValidatingHeader,
            AccumulatingPayload
        };

        FrameDecoder() = default;

        /**
         * @brief Try to extract the next frame from the buffer
         *
         * Consumed and discarded bytes are removed from the front of the buffer. Every call
         * starts from SeekDelimiter and runs until it either yields a frame or needs to report
         * "no frame yet". A header mismatch reports "no frame yet" after resynchronizing, so
         * callers drain a buffer by calling until the buffer stops shrinking.
         *
         * @param buffer Accumulated stream bytes
         * @return The next frame, or std::nullopt if none is complete yet
         */
        std::optional<RawFrame> Next(ByteBuffer& buffer);

        /**
         * @brief Run a single transition of the state machine
         *
         * @param buffer Accumulated stream bytes
         * @param frame Filled when the transition emits a frame
         * @return true if the machine wants to keep going on this call
         */
        bool Step(ByteBuffer& buffer, std::optional<RawFrame>& frame);

        State GetState() const { return m_State; }
        const FrameStats& GetStats() const { return m_Stats; }
        void Reset() { m_State = State::SeekDelimiter; }

    private:
        bool SeekDelimiter(ByteBuffer& buffer);
        bool ValidateHeader(ByteBuffer& buffer);
        bool AccumulatePayload(ByteBuffer& buffer, std::optional<RawFrame>& frame);

        void Discard(ByteBuffer& buffer, size_t count);

        State m_State = State::SeekDelimiter;
        FrameStats m_Stats;
    };

    const char* ToString(FrameDecoder::State state);

}
