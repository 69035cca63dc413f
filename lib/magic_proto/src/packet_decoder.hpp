#pragma once

#include <cstdint>

#include <etl/span.h>
#include <etl/variant.h>

#include "packets.hpp"
#include "reverse_cobs.hpp"
#include "stream_decoder.hpp"

namespace proto {

    using Packet = etl::variant<RangeReport, ImuReport, CirReport>;

    /**
     * @brief Dispatch an unstuffed payload to its record layout
     *
     * The first 3 bytes select the layout from the table of known type tags.
     *
     * @param payload Unstuffed payload starting at the type tag
     * @param packet Decoded record on success
     * @return DecodeError::OK on success
     */
    DecodeError DecodePayload(etl::span<const uint8_t> payload, Packet& packet);

    /**
     * @brief Unstuff a raw frame and dispatch its payload
     *
     * @param frame Frame as returned by FrameDecoder (leading zero and header included)
     * @param packet Decoded record on success
     * @param cobs_error Unstuffing result, for diagnostics
     */
    DecodeError DecodeFrame(const RawFrame& frame, Packet& packet, CobsError& cobs_error);

    /**
     * @brief Build a complete frame for a record, used by tests
     *
     * @return false if the record does not fit into a frame
     */
    bool EncodeFrame(const Packet& packet, RawFrame& frame);

}
