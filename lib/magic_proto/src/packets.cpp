#include "packets.hpp"

#include <algorithm>
#include <cstring>

namespace proto {

    namespace {

        // Little endian cursor over a record, bounds are checked once by the caller
        class ByteReader {
        public:
            explicit ByteReader(etl::span<const uint8_t> data) : m_Data(data) {}

            template<typename T>
            T ReadUnsigned()
            {
                T value = 0;
                for (size_t i = 0; i < sizeof(T); i++) {
                    value |= static_cast<T>(static_cast<T>(m_Data[m_Pos + i]) << (8 * i));
                }
                m_Pos += sizeof(T);
                return value;
            }

            double ReadDouble()
            {
                const uint64_t bits = ReadUnsigned<uint64_t>();
                double value;
                std::memcpy(&value, &bits, sizeof(value));
                return value;
            }

            Int24 ReadInt24()
            {
                Int24 value = {m_Data[m_Pos], m_Data[m_Pos + 1], m_Data[m_Pos + 2]};
                m_Pos += value.size();
                return value;
            }

            void Skip(size_t count) { m_Pos += count; }

        private:
            etl::span<const uint8_t> m_Data;
            size_t m_Pos = 0;
        };

        class ByteWriter {
        public:
            explicit ByteWriter(Payload& out) : m_Out(out) { m_Out.clear(); }

            template<typename T>
            void WriteUnsigned(T value)
            {
                for (size_t i = 0; i < sizeof(T); i++) {
                    m_Out.push_back(static_cast<uint8_t>(value >> (8 * i)));
                }
            }

            void WriteDouble(double value)
            {
                uint64_t bits;
                std::memcpy(&bits, &value, sizeof(bits));
                WriteUnsigned<uint64_t>(bits);
            }

            void WriteBytes(etl::span<const uint8_t> bytes)
            {
                m_Out.insert(m_Out.end(), bytes.begin(), bytes.end());
            }

        private:
            Payload& m_Out;
        };

        bool HasTag(etl::span<const uint8_t> data, const TypeTag& tag)
        {
            return data.size() >= tag.size() && std::equal(tag.begin(), tag.end(), data.begin());
        }

    }

    DecodeError ParseRangeReport(etl::span<const uint8_t> data, RangeReport& report)
    {
        if (!HasTag(data, kRangeTag)) return DecodeError::UNKNOWN_TYPE;
        if (data.size() < kRangeReportSize) return DecodeError::TOO_SHORT;

        ByteReader reader(data);
        reader.Skip(kTypeTagSize);
        report.tag_addr = reader.ReadUnsigned<uint16_t>();
        report.system_ts = reader.ReadUnsigned<uint64_t>();
        report.seq_num = reader.ReadUnsigned<uint8_t>();
        report.trigger_txts = reader.ReadUnsigned<uint64_t>();
        for (auto& range : report.ranges) {
            range = reader.ReadDouble();
        }
        return DecodeError::OK;
    }

    DecodeError ParseImuReport(etl::span<const uint8_t> data, ImuReport& report)
    {
        if (!HasTag(data, kImuTag)) return DecodeError::UNKNOWN_TYPE;
        if (data.size() < kImuReportSize) return DecodeError::TOO_SHORT;

        ByteReader reader(data);
        reader.Skip(kTypeTagSize);
        report.tag_addr = reader.ReadUnsigned<uint16_t>();
        report.system_ts = reader.ReadUnsigned<uint64_t>();
        for (auto& axis : report.accel) {
            axis = reader.ReadUnsigned<uint32_t>();
        }
        for (auto& axis : report.gyro) {
            axis = reader.ReadUnsigned<uint32_t>();
        }
        return DecodeError::OK;
    }

    DecodeError ParseCirReport(etl::span<const uint8_t> data, CirReport& report)
    {
        if (!HasTag(data, kCirTag)) return DecodeError::UNKNOWN_TYPE;
        if (data.size() < kCirReportSize) return DecodeError::TOO_SHORT;

        ByteReader reader(data);
        reader.Skip(kTypeTagSize);
        report.src_addr = reader.ReadUnsigned<uint16_t>();
        report.system_ts = reader.ReadUnsigned<uint64_t>();
        report.seq_num = reader.ReadUnsigned<uint8_t>();
        report.ip_poa = reader.ReadUnsigned<uint16_t>();
        report.fp_index = reader.ReadUnsigned<uint16_t>();
        report.start_index = reader.ReadUnsigned<uint16_t>();
        report.cir_size = reader.ReadUnsigned<uint16_t>();
        for (auto& sample : report.cir) {
            sample.real = reader.ReadInt24();
            sample.imag = reader.ReadInt24();
        }
        return DecodeError::OK;
    }

    void Serialize(const RangeReport& report, Payload& out)
    {
        ByteWriter writer(out);
        writer.WriteBytes(kRangeTag);
        writer.WriteUnsigned(report.tag_addr);
        writer.WriteUnsigned(report.system_ts);
        writer.WriteUnsigned(report.seq_num);
        writer.WriteUnsigned(report.trigger_txts);
        for (double range : report.ranges) {
            writer.WriteDouble(range);
        }
    }

    void Serialize(const ImuReport& report, Payload& out)
    {
        ByteWriter writer(out);
        writer.WriteBytes(kImuTag);
        writer.WriteUnsigned(report.tag_addr);
        writer.WriteUnsigned(report.system_ts);
        for (uint32_t axis : report.accel) {
            writer.WriteUnsigned(axis);
        }
        for (uint32_t axis : report.gyro) {
            writer.WriteUnsigned(axis);
        }
    }

    void Serialize(const CirReport& report, Payload& out)
    {
        ByteWriter writer(out);
        writer.WriteBytes(kCirTag);
        writer.WriteUnsigned(report.src_addr);
        writer.WriteUnsigned(report.system_ts);
        writer.WriteUnsigned(report.seq_num);
        writer.WriteUnsigned(report.ip_poa);
        writer.WriteUnsigned(report.fp_index);
        writer.WriteUnsigned(report.start_index);
        writer.WriteUnsigned(report.cir_size);
        for (const auto& sample : report.cir) {
            writer.WriteBytes(sample.real);
            writer.WriteBytes(sample.imag);
        }
    }

    int32_t SignExtend24(const Int24& value)
    {
        uint32_t raw = static_cast<uint32_t>(value[0])
                     | (static_cast<uint32_t>(value[1]) << 8)
                     | (static_cast<uint32_t>(value[2]) << 16);
        if (raw & 0x800000u) {
            raw |= 0xFF000000u;
        }
        return static_cast<int32_t>(raw);
    }

    Int24 PackInt24(int32_t value)
    {
        const uint32_t raw = static_cast<uint32_t>(value);
        return Int24{static_cast<uint8_t>(raw),
                     static_cast<uint8_t>(raw >> 8),
                     static_cast<uint8_t>(raw >> 16)};
    }

    ConvertedCirReport ConvertCir(const CirReport& report)
    {
        ConvertedCirReport converted;
        converted.src_addr = report.src_addr;
        converted.system_ts = report.system_ts;
        converted.seq_num = report.seq_num;
        converted.ip_poa = report.ip_poa;
        converted.fp_index = report.fp_index;
        converted.start_index = report.start_index;
        converted.cir_size = report.cir_size;

        for (size_t i = 0; i < kCirSamples; i++) {
            converted.cir[i] = std::complex<double>(SignExtend24(report.cir[i].real),
                                                    SignExtend24(report.cir[i].imag));
        }
        return converted;
    }

    const char* ToString(DecodeError error)
    {
        switch (error) {
            case DecodeError::OK:                   return "OK";
            case DecodeError::UNKNOWN_TYPE:         return "UNKNOWN_TYPE";
            case DecodeError::TOO_SHORT:            return "TOO_SHORT";
            case DecodeError::CORRUPTED_STUFFING:   return "CORRUPTED_STUFFING";
            case DecodeError::MALFORMED_FRAME:      return "MALFORMED_FRAME";
            default:                                return "UNKNOWN";
        }
    }

}
