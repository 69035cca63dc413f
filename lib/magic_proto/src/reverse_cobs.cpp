#include "reverse_cobs.hpp"

#include <algorithm>

namespace proto {

    static constexpr uint8_t kGroupSize = 7;
    static constexpr uint8_t kLongRunBase = 0x80;
    static constexpr uint8_t kMaxLongRun = 134;
    static constexpr uint8_t kFullRunMarker = 0xFF;

    CobsError ReverseCobsDecode(etl::span<const uint8_t> encoded, Payload& decoded)
    {
        decoded.clear();

        // Walk backwards, the control byte trails the data it describes
        size_t pos = encoded.size();

        auto take_literal = [&](uint8_t& out) -> bool {
            if (pos == 0) {
                return false;
            }
            out = encoded[--pos];
            return true;
        };

        auto push = [&](uint8_t value) -> bool {
            if (decoded.full()) {
                return false;
            }
            decoded.push_back(value);
            return true;
        };

        while (pos > 0) {
            const uint8_t control = encoded[--pos];
            uint8_t literal = 0;

            if (control == 0x00) {
                return CobsError::CORRUPTED;
            }

            if (control < kLongRunBase) {
                for (uint8_t i = 0; i < kGroupSize; i++) {
                    if ((control & (1u << (kGroupSize - 1 - i))) == 0) {
                        if (!take_literal(literal)) return CobsError::CORRUPTED;
                        if (!push(literal)) return CobsError::OVERFLOW;
                    } else {
                        if (!push(0)) return CobsError::OVERFLOW;
                    }
                }
            } else if (control != kFullRunMarker) {
                const uint8_t count = (control & 0x7F) + kGroupSize;
                if (!push(0)) return CobsError::OVERFLOW;
                for (uint8_t i = 0; i < count; i++) {
                    if (!take_literal(literal)) return CobsError::CORRUPTED;
                    if (!push(literal)) return CobsError::OVERFLOW;
                }
            } else {
                for (uint8_t i = 0; i < kMaxLongRun; i++) {
                    if (!take_literal(literal)) return CobsError::CORRUPTED;
                    if (!push(literal)) return CobsError::OVERFLOW;
                }
            }
        }

        std::reverse(decoded.begin(), decoded.end());
        return CobsError::OK;
    }

    CobsError ReverseCobsEncode(etl::span<const uint8_t> raw, Payload& encoded)
    {
        encoded.clear();

        uint8_t run = 0;
        uint8_t zeros = 0;

        auto emit = [&](uint8_t value) -> bool {
            if (encoded.full()) {
                return false;
            }
            encoded.push_back(value);
            return true;
        };

        for (uint8_t byte : raw) {
            if (run < kGroupSize) {
                if (byte == 0) {
                    zeros |= static_cast<uint8_t>(1u << run);
                } else if (!emit(byte)) {
                    return CobsError::OVERFLOW;
                }
                run++;
                // A group without zeros keeps going as a long run
                if (run == kGroupSize && zeros != 0) {
                    if (!emit(zeros)) return CobsError::OVERFLOW;
                    run = 0;
                    zeros = 0;
                }
            } else if (byte == 0) {
                if (!emit(static_cast<uint8_t>((run - kGroupSize) | kLongRunBase))) return CobsError::OVERFLOW;
                run = 0;
                zeros = 0;
            } else {
                if (!emit(byte)) return CobsError::OVERFLOW;
                run++;
                if (run == kMaxLongRun) {
                    if (!emit(kFullRunMarker)) return CobsError::OVERFLOW;
                    run = 0;
                    zeros = 0;
                }
            }
        }

        if (run > 0 && run < kGroupSize) {
            // Pad the unfilled part of the group with zero bits
            const uint8_t control = static_cast<uint8_t>((zeros | (0xFFu << run)) & 0x7F);
            if (!emit(control)) return CobsError::OVERFLOW;
        } else if (run >= kGroupSize) {
            if (!emit(static_cast<uint8_t>((run - kGroupSize) | kLongRunBase))) return CobsError::OVERFLOW;
        }

        return CobsError::OK;
    }

    const char* ToString(CobsError error)
    {
        switch (error) {
            case CobsError::OK:         return "OK";
            case CobsError::CORRUPTED:  return "CORRUPTED";
            case CobsError::OVERFLOW:   return "OVERFLOW";
            default:                    return "UNKNOWN";
        }
    }

}
