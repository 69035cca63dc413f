#pragma once

#include <cstdint>
#include <cstddef>
#include <complex>

#include <etl/array.h>
#include <etl/span.h>

#include "reverse_cobs.hpp"

/**
 * @brief Fixed little-endian record layouts sent by the anchors
 *
 * Every record starts with a 3 byte ASCII type tag. Sizes below include it.
 *
 *  RNG : tag_addr u16 | system_ts u64 | seq_num u8 | trigger_txts u64 | ranges f64[8]
 *  IMU : tag_addr u16 | system_ts u64 | accel u32[3] | gyro u32[3]
 *  CIR : src_addr u16 | system_ts u64 | seq_num u8 | ip_poa u16 | fp_index u16 |
 *        start_index u16 | cir_size u16 | 16 x (real i24, imag i24)
 */
namespace proto {

    static constexpr size_t kTypeTagSize = 3;
    static constexpr size_t kRangeCount = 8;
    static constexpr size_t kImuAxes = 3;
    static constexpr size_t kCirSamples = 16;

    using TypeTag = etl::array<uint8_t, kTypeTagSize>;

    static constexpr TypeTag kRangeTag = {'R', 'N', 'G'};
    static constexpr TypeTag kImuTag = {'I', 'M', 'U'};
    static constexpr TypeTag kCirTag = {'C', 'I', 'R'};

    static constexpr size_t kRangeReportSize = kTypeTagSize + 2 + 8 + 1 + 8 + kRangeCount * 8;
    static constexpr size_t kImuReportSize = kTypeTagSize + 2 + 8 + kImuAxes * 4 * 2;
    static constexpr size_t kCirReportSize = kTypeTagSize + 2 + 8 + 1 + 2 * 4 + kCirSamples * 6;

    static_assert(kRangeReportSize == 86, "RNG record size");
    static_assert(kImuReportSize == 37, "IMU record size");
    static_assert(kCirReportSize == 118, "CIR record size");

    using Ranges = etl::array<double, kRangeCount>;

    struct RangeReport {
        uint16_t tag_addr = 0;
        uint64_t system_ts = 0;     // us
        uint8_t seq_num = 0;
        uint64_t trigger_txts = 0;  // Correlation key across anchors
        Ranges ranges = {};
    };

    struct ImuReport {
        uint16_t tag_addr = 0;
        uint64_t system_ts = 0;     // us
        etl::array<uint32_t, kImuAxes> accel = {};
        etl::array<uint32_t, kImuAxes> gyro = {};
    };

    // 24 bit two's complement, little endian, as sent on the wire
    using Int24 = etl::array<uint8_t, 3>;

    struct CirSample {
        Int24 real = {};
        Int24 imag = {};
    };

    struct CirReport {
        uint16_t src_addr = 0;
        uint64_t system_ts = 0;
        uint8_t seq_num = 0;
        uint16_t ip_poa = 0;
        uint16_t fp_index = 0;
        uint16_t start_index = 0;
        uint16_t cir_size = 0;
        etl::array<CirSample, kCirSamples> cir = {};
    };

    struct ConvertedCirReport {
        uint16_t src_addr = 0;
        uint64_t system_ts = 0;
        uint8_t seq_num = 0;
        uint16_t ip_poa = 0;
        uint16_t fp_index = 0;
        uint16_t start_index = 0;
        uint16_t cir_size = 0;
        etl::array<std::complex<double>, kCirSamples> cir = {};
    };

    enum class DecodeError : uint8_t {
        OK = 0,
        UNKNOWN_TYPE,
        TOO_SHORT,
        CORRUPTED_STUFFING,
        MALFORMED_FRAME
    };

    const char* ToString(DecodeError error);

    // Layout parsers. Input starts at the type tag, trailing bytes are ignored.
    DecodeError ParseRangeReport(etl::span<const uint8_t> data, RangeReport& report);
    DecodeError ParseImuReport(etl::span<const uint8_t> data, ImuReport& report);
    DecodeError ParseCirReport(etl::span<const uint8_t> data, CirReport& report);

    // Layout writers, output includes the type tag
    void Serialize(const RangeReport& report, Payload& out);
    void Serialize(const ImuReport& report, Payload& out);
    void Serialize(const CirReport& report, Payload& out);

    int32_t SignExtend24(const Int24& value);
    Int24 PackInt24(int32_t value);

    ConvertedCirReport ConvertCir(const CirReport& report);

}
