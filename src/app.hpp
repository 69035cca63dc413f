#pragma once

/**
 * Pipeline driver: serial streams -> frames -> packets -> synchronizer -> solver -> publisher
 *
 */
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>

#include <etl/span.h>
#include <etl/vector.h>

#include "packet_decoder.hpp"
#include "stream_decoder.hpp"

#include "gateway/gateway_params.hpp"
#include "localization/localizer.hpp"
#include "publish/publisher_interface.hpp"
#include "serial/serial_source_interface.hpp"
#include "sync/range_synchronizer.hpp"

struct AppStats {
    uint32_t frames = 0;
    uint32_t decode_errors = 0;
    uint32_t range_reports = 0;
    uint32_t imu_reports = 0;
    uint32_t cir_reports = 0;
    uint32_t batches = 0;
    uint32_t publish_failures = 0;
    uint32_t imu_gaps = 0;
    uint32_t imu_non_monotonic = 0;
};

class App {
public:
    static constexpr int kExitOk = 0;
    static constexpr int kExitFailure = 1;
    static constexpr int kExitAllStreamsFailed = 2;

    static constexpr int kPollTimeoutMs = 100;

    /**
     * @param params Gateway configuration, copied
     * @param streams Number of anchor streams, slot index = stream index
     * @param publisher Sink for the published topics, must outlive the App
     * @throws std::invalid_argument if streams is 0 or above stream_sync::kMaxStreams
     */
    App(const GatewayParams& params, size_t streams, publish::IPublisher& publisher);

    /**
     * @brief Append raw bytes of one stream and dispatch every complete frame
     */
    void ProcessBytes(size_t stream, etl::span<const uint8_t> data);

    /**
     * @brief Dispatch one decoded packet as if it arrived on the given stream
     */
    void HandlePacket(size_t stream, const proto::Packet& packet);

    /**
     * @brief Event loop over the sources until stop is set or every source failed
     *
     * A failing source is closed off and the remaining ones keep being served.
     *
     * @param sources One source per stream, in slot order
     * @param stop Observed at least every kPollTimeoutMs
     * @return kExitOk on stop, kExitAllStreamsFailed when no source is left, kExitFailure on poll errors
     */
    int Run(etl::span<serial::ISerialSource* const> sources, const std::atomic<bool>& stop);

    const AppStats& GetStats() const { return m_Stats; }
    const stream_sync::RangeSynchronizer& GetSynchronizer() const { return m_Synchronizer; }
    const proto::FrameDecoder& GetDecoder(size_t stream) const { return m_Streams[stream].decoder; }
    bool IsStreamFailed(size_t stream) const { return m_Streams[stream].failed; }

private:
    struct StreamState {
        proto::FrameDecoder decoder;
        proto::ByteBuffer buffer;
        bool failed = false;
    };

    void DrainStream(size_t stream);
    void HandleFrame(size_t stream, const proto::RawFrame& frame);

    void HandleRange(size_t stream, const proto::RangeReport& report);
    void HandleImu(const proto::ImuReport& report);
    void HandleCir(const proto::CirReport& report);

    void PublishBatch(stream_sync::Batch& batch);
    void Publish(const char* topic, const std::string& payload);

    void FailStream(size_t stream, const char* name, const char* reason);
    size_t ActiveStreams() const;
    void LogStats() const;

    GatewayParams m_Params;
    etl::vector<StreamState, stream_sync::kMaxStreams> m_Streams;
    stream_sync::RangeSynchronizer m_Synchronizer;
    localization::Localizer m_Localizer;
    publish::IPublisher& m_Publisher;

    std::optional<uint64_t> m_LastImuTs;
    AppStats m_Stats;
};
