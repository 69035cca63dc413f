#include "packet_decoder.hpp"

#include <algorithm>

namespace proto {

    namespace {

        using ParseFn = DecodeError (*)(etl::span<const uint8_t>, Packet&);

        template<typename TRecord, DecodeError (*Parse)(etl::span<const uint8_t>, TRecord&)>
        DecodeError ParseInto(etl::span<const uint8_t> data, Packet& packet)
        {
            TRecord record;
            DecodeError err = Parse(data, record);
            if (err == DecodeError::OK) {
                packet = record;
            }
            return err;
        }

        struct Layout {
            TypeTag tag;
            ParseFn parse;
        };

        // New record types are added here and to the Packet variant
        const etl::array<Layout, 3> kLayouts = {{
            {kRangeTag, &ParseInto<RangeReport, &ParseRangeReport>},
            {kImuTag,   &ParseInto<ImuReport, &ParseImuReport>},
            {kCirTag,   &ParseInto<CirReport, &ParseCirReport>},
        }};

    }

    DecodeError DecodePayload(etl::span<const uint8_t> payload, Packet& packet)
    {
        if (payload.size() < kTypeTagSize) {
            return DecodeError::TOO_SHORT;
        }

        for (const auto& layout : kLayouts) {
            if (std::equal(layout.tag.begin(), layout.tag.end(), payload.begin())) {
                return layout.parse(payload, packet);
            }
        }
        return DecodeError::UNKNOWN_TYPE;
    }

    DecodeError DecodeFrame(const RawFrame& frame, Packet& packet, CobsError& cobs_error)
    {
        cobs_error = CobsError::OK;
        if (frame.size() < kFramePayloadOffset) {
            return DecodeError::MALFORMED_FRAME;
        }

        Payload payload;
        cobs_error = ReverseCobsDecode(etl::span<const uint8_t>(frame.data() + kFramePayloadOffset,
                                                                 frame.size() - kFramePayloadOffset),
                                       payload);
        if (cobs_error != CobsError::OK) {
            return DecodeError::CORRUPTED_STUFFING;
        }

        return DecodePayload(etl::span<const uint8_t>(payload.data(), payload.size()), packet);
    }

    bool EncodeFrame(const Packet& packet, RawFrame& frame)
    {
        Payload record;
        etl::visit([&record](const auto& value) { Serialize(value, record); }, packet);

        Payload stuffed;
        if (ReverseCobsEncode(etl::span<const uint8_t>(record.data(), record.size()), stuffed) != CobsError::OK) {
            return false;
        }

        if (kFramePayloadOffset + stuffed.size() > frame.capacity()) {
            return false;
        }

        frame.clear();
        frame.push_back(0x00);
        frame.insert(frame.end(), kFrameHeader.begin(), kFrameHeader.end());
        frame.insert(frame.end(), stuffed.begin(), stuffed.end());
        return true;
    }

}
