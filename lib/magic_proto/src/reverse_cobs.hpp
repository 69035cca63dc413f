#pragma once

#include <cstdint>
#include <cstddef>

#include <etl/span.h>
#include <etl/vector.h>

/**
 * @brief Reverse zero-compressing COBS used by the anchor firmware
 *
 * The encoder walks the payload forwards and emits its control bytes after the data
 * they describe, so the decoder has to walk the encoded buffer from its end.
 *
 * Control bytes (as seen by the decoder):
 *  - 0x01..0x7F : group of 7 bytes, bit k set means byte k of the group is zero,
 *                 clear means take a literal
 *  - 0x80..0xFE : (x & 0x7F) + 7 literals followed by a single zero
 *  - 0xFF       : 134 literals, no zero
 *
 * @note A partially filled trailing group is padded with zeros, decoded output may
 *       therefore carry up to 6 trailing zero bytes. Layout parsers ignore them.
 */
namespace proto {

    static constexpr size_t kMaxPayloadSize = 256;

    using Payload = etl::vector<uint8_t, kMaxPayloadSize>;

    enum class CobsError : uint8_t {
        OK = 0,
        CORRUPTED,
        OVERFLOW
    };

    /**
     * @brief Unstuff a reverse COBS encoded buffer
     *
     * @param encoded Stuffed bytes, no frame delimiters
     * @param decoded Output, cleared first
     * @return CobsError::OK on success
     */
    CobsError ReverseCobsDecode(etl::span<const uint8_t> encoded, Payload& decoded);

    /**
     * @brief Stuff a payload so it contains no zero byte
     */
    CobsError ReverseCobsEncode(etl::span<const uint8_t> raw, Payload& encoded);

    const char* ToString(CobsError error);

}
