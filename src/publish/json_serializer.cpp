#include "json_serializer.hpp"

#include <cinttypes>
#include <cmath>
#include <cstdio>

namespace publish {

    static void AppendDouble(std::string& json, double value)
    {
        if (!std::isfinite(value)) {
            json += "null";
            return;
        }
        char buffer[32];
        snprintf(buffer, sizeof(buffer), "%.17g", value);
        json += buffer;
    }

    static void AppendUnsigned(std::string& json, uint64_t value)
    {
        char buffer[24];
        snprintf(buffer, sizeof(buffer), "%" PRIu64, value);
        json += buffer;
    }

    static void AppendSigned(std::string& json, int64_t value)
    {
        char buffer[24];
        snprintf(buffer, sizeof(buffer), "%" PRId64, value);
        json += buffer;
    }

    static void AppendField(std::string& json, const char* name, uint64_t value, bool first = false)
    {
        if (!first) {
            json += ",";
        }
        json += "\"";
        json += name;
        json += "\":";
        AppendUnsigned(json, value);
    }

    static void AppendKey(std::string& json, const char* name)
    {
        json += ",\"";
        json += name;
        json += "\":";
    }

    template<typename TArray>
    static void AppendUnsignedArray(std::string& json, const TArray& values)
    {
        json += "[";
        for (size_t i = 0; i < values.size(); i++) {
            if (i > 0) json += ",";
            AppendUnsigned(json, values[i]);
        }
        json += "]";
    }

    static void AppendRangeReport(std::string& json, const proto::RangeReport& report)
    {
        json += "{";
        AppendField(json, "tag_addr", report.tag_addr, true);
        AppendField(json, "system_ts", report.system_ts);
        AppendField(json, "seq_num", report.seq_num);
        AppendField(json, "trigger_txts", report.trigger_txts);
        AppendKey(json, "ranges");
        json += "[";
        for (size_t i = 0; i < report.ranges.size(); i++) {
            if (i > 0) json += ",";
            AppendDouble(json, report.ranges[i]);
        }
        json += "]}";
    }

    std::string ToJson(const proto::RangeReport& report)
    {
        std::string json;
        AppendRangeReport(json, report);
        return json;
    }

    std::string ToJson(const stream_sync::Batch& batch)
    {
        std::string json = "[";
        for (size_t i = 0; i < batch.size(); i++) {
            if (i > 0) json += ",";
            AppendRangeReport(json, batch[i]);
        }
        json += "]";
        return json;
    }

    std::string ToJson(etl::span<const localization::PositionEstimate> points)
    {
        std::string json = "[";
        for (size_t i = 0; i < points.size(); i++) {
            const localization::PositionEstimate& estimate = points[i];
            if (i > 0) json += ",";
            json += "{";
            AppendField(json, "tag_addr", estimate.tag_addr, true);
            AppendKey(json, "point");
            json += "[";
            AppendDouble(json, estimate.point.x());
            json += ",";
            AppendDouble(json, estimate.point.y());
            json += ",";
            AppendDouble(json, estimate.point.z());
            json += "]";
            AppendKey(json, "valid");
            json += estimate.valid ? "true" : "false";
            json += "}";
        }
        json += "]";
        return json;
    }

    std::string ToJson(const proto::ImuReport& report)
    {
        std::string json = "{";
        AppendField(json, "tag_addr", report.tag_addr, true);
        AppendField(json, "system_ts", report.system_ts);
        AppendKey(json, "accel");
        AppendUnsignedArray(json, report.accel);
        AppendKey(json, "gyro");
        AppendUnsignedArray(json, report.gyro);
        json += "}";
        return json;
    }

    std::string ToJson(const proto::ConvertedCirReport& report)
    {
        std::string json = "{";
        AppendField(json, "src_addr", report.src_addr, true);
        AppendField(json, "system_ts", report.system_ts);
        AppendField(json, "seq_num", report.seq_num);
        AppendField(json, "ip_poa", report.ip_poa);
        AppendField(json, "fp_index", report.fp_index);
        AppendField(json, "start_index", report.start_index);
        AppendField(json, "cir_size", report.cir_size);
        AppendKey(json, "cir");
        json += "[";
        for (size_t i = 0; i < report.cir.size(); i++) {
            if (i > 0) json += ",";
            json += "[";
            // Samples are integral after sign extension
            AppendSigned(json, static_cast<int64_t>(report.cir[i].real()));
            json += ",";
            AppendSigned(json, static_cast<int64_t>(report.cir[i].imag()));
            json += "]";
        }
        json += "]}";
        return json;
    }

}
