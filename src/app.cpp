#include "app.hpp"

#include <poll.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <type_traits>

#include "logging/logging.hpp"
#include "publish/json_serializer.hpp"

App::App(const GatewayParams& params, size_t streams, publish::IPublisher& publisher)
    : m_Params(params),
      m_Synchronizer(streams, params.syncMaxQueueDepth),
      m_Localizer(MakeAnchorTable(params), params.maxRange),
      m_Publisher(publisher)
{
    m_Streams.resize(streams);
    LOG_INFO("Pipeline for %u streams, range bias %.2f m, %u anchors",
             static_cast<unsigned>(streams), m_Params.rangeBias, static_cast<unsigned>(m_Params.anchorCount));
}

void App::ProcessBytes(size_t stream, etl::span<const uint8_t> data)
{
    if (stream >= m_Streams.size()) {
        LOG_ERROR("Bytes for unknown stream %u dropped", static_cast<unsigned>(stream));
        return;
    }

    proto::ByteBuffer& buffer = m_Streams[stream].buffer;
    buffer.insert(buffer.end(), data.begin(), data.end());
    DrainStream(stream);
}

void App::DrainStream(size_t stream)
{
    StreamState& state = m_Streams[stream];

    while (true) {
        const size_t sizeBefore = state.buffer.size();
        std::optional<proto::RawFrame> frame = state.decoder.Next(state.buffer);
        if (frame) {
            HandleFrame(stream, *frame);
        } else if (state.buffer.size() == sizeBefore) {
            // Nothing consumed, wait for more bytes
            break;
        }
    }
}

void App::HandleFrame(size_t stream, const proto::RawFrame& frame)
{
    m_Stats.frames++;
    LOG_VERBOSE("Frame of %u bytes from stream %u", static_cast<unsigned>(frame.size()), static_cast<unsigned>(stream));

    proto::Packet packet;
    proto::CobsError cobsError;
    proto::DecodeError err = proto::DecodeFrame(frame, packet, cobsError);

    switch (err) {
        case proto::DecodeError::OK:
            HandlePacket(stream, packet);
            break;
        case proto::DecodeError::CORRUPTED_STUFFING:
            m_Stats.decode_errors++;
            LOG_DEBUG("Stream %u: unstuffing failed (%s), frame dropped",
                      static_cast<unsigned>(stream), proto::ToString(cobsError));
            break;
        default:
            m_Stats.decode_errors++;
            LOG_WARN("Stream %u: %s, frame dropped", static_cast<unsigned>(stream), proto::ToString(err));
            break;
    }
}

void App::HandlePacket(size_t stream, const proto::Packet& packet)
{
    etl::visit([this, stream](const auto& record) {
        using TRecord = std::decay_t<decltype(record)>;
        if constexpr (std::is_same_v<TRecord, proto::RangeReport>) {
            HandleRange(stream, record);
        } else if constexpr (std::is_same_v<TRecord, proto::ImuReport>) {
            HandleImu(record);
        } else {
            HandleCir(record);
        }
    }, packet);
}

void App::HandleRange(size_t stream, const proto::RangeReport& report)
{
    m_Stats.range_reports++;
    LOG_DEBUG("RNG from stream %u: tag %u seq %u txts %llu", static_cast<unsigned>(stream),
              static_cast<unsigned>(report.tag_addr), static_cast<unsigned>(report.seq_num),
              static_cast<unsigned long long>(report.trigger_txts));

    if (!m_Synchronizer.Push(stream, report)) {
        return;
    }

    while (std::optional<stream_sync::Batch> batch = m_Synchronizer.TrySynchronize()) {
        PublishBatch(*batch);
    }
}

void App::PublishBatch(stream_sync::Batch& batch)
{
    m_Stats.batches++;

    for (proto::RangeReport& report : batch) {
        for (double& range : report.ranges) {
            range -= m_Params.rangeBias;
        }
    }

    Publish(publish::kRangesTopic, publish::ToJson(batch));

    etl::vector<localization::PositionEstimate, stream_sync::kMaxStreams> points;
    for (const proto::RangeReport& report : batch) {
        localization::PositionEstimate estimate = m_Localizer.Estimate(report);
        if (estimate.valid) {
            LOG_INFO("Location of tag %u: %.2f, %.2f, %.2f", static_cast<unsigned>(estimate.tag_addr),
                     estimate.point.x(), estimate.point.y(), estimate.point.z());
        } else {
            LOG_DEBUG("No estimate for tag %u", static_cast<unsigned>(estimate.tag_addr));
        }
        points.push_back(estimate);
    }

    Publish(publish::kPointsTopic,
            publish::ToJson(etl::span<const localization::PositionEstimate>(points.data(), points.size())));
}

void App::HandleImu(const proto::ImuReport& report)
{
    m_Stats.imu_reports++;

    if (m_LastImuTs) {
        if (report.system_ts >= *m_LastImuTs) {
            const uint64_t interval = report.system_ts - *m_LastImuTs;
            LOG_VERBOSE("IMU interval: %llu us", static_cast<unsigned long long>(interval));
            if (interval > m_Params.imuGapThresholdUs) {
                m_Stats.imu_gaps++;
                LOG_ERROR("IMU interval too large: %llu us", static_cast<unsigned long long>(interval));
            }
        } else {
            m_Stats.imu_non_monotonic++;
            LOG_WARN("IMU timestamp went backwards: %llu -> %llu",
                     static_cast<unsigned long long>(*m_LastImuTs),
                     static_cast<unsigned long long>(report.system_ts));
        }
    }
    m_LastImuTs = report.system_ts;

    Publish(publish::kImuTopic, publish::ToJson(report));
}

void App::HandleCir(const proto::CirReport& report)
{
    m_Stats.cir_reports++;
    Publish(publish::kCirTopic, publish::ToJson(proto::ConvertCir(report)));
}

void App::Publish(const char* topic, const std::string& payload)
{
    if (!publish::PublishText(m_Publisher, topic, payload)) {
        m_Stats.publish_failures++;
        LOG_WARN("Publishing %s failed: %s", topic, strerror(errno));
    }
}

int App::Run(etl::span<serial::ISerialSource* const> sources, const std::atomic<bool>& stop)
{
    if (sources.size() != m_Streams.size()) {
        LOG_ERROR("Expected %u sources, got %u", static_cast<unsigned>(m_Streams.size()),
                  static_cast<unsigned>(sources.size()));
        return kExitFailure;
    }

    etl::vector<pollfd, stream_sync::kMaxStreams> fds;
    etl::vector<size_t, stream_sync::kMaxStreams> fdStreams;

    while (!stop.load()) {
        if (ActiveStreams() == 0) {
            LOG_ERROR("All %u streams failed, giving up", static_cast<unsigned>(m_Streams.size()));
            LogStats();
            return kExitAllStreamsFailed;
        }

        fds.clear();
        fdStreams.clear();
        for (size_t i = 0; i < sources.size(); i++) {
            if (!m_Streams[i].failed) {
                fds.push_back(pollfd{sources[i]->GetFd(), POLLIN, 0});
                fdStreams.push_back(i);
            }
        }

        int ready = poll(fds.data(), static_cast<nfds_t>(fds.size()), kPollTimeoutMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("poll failed: %s", strerror(errno));
            return kExitFailure;
        }

        for (size_t i = 0; i < fds.size() && ready > 0; i++) {
            const short revents = fds[i].revents;
            if (revents == 0) {
                continue;
            }

            const size_t stream = fdStreams[i];
            serial::ISerialSource* source = sources[stream];

            if (revents & POLLNVAL) {
                FailStream(stream, source->GetName(), "invalid descriptor");
                continue;
            }

            // POLLHUP/POLLERR may still come with buffered data, Read() tells
            size_t bytesRead = 0;
            serial::ReadStatus status = source->Read(m_Streams[stream].buffer, bytesRead);

            switch (status) {
                case serial::ReadStatus::OK:
                    LOG_VERBOSE("Stream %u: %u bytes", static_cast<unsigned>(stream), static_cast<unsigned>(bytesRead));
                    DrainStream(stream);
                    break;
                case serial::ReadStatus::WOULD_BLOCK:
                    break;
                case serial::ReadStatus::END_OF_STREAM:
                    FailStream(stream, source->GetName(), "end of stream");
                    break;
                case serial::ReadStatus::IO_ERROR:
                default:
                    FailStream(stream, source->GetName(), strerror(errno));
                    break;
            }
        }
    }

    LOG_INFO("Stop requested");
    LogStats();
    return kExitOk;
}

void App::FailStream(size_t stream, const char* name, const char* reason)
{
    m_Streams[stream].failed = true;
    m_Streams[stream].buffer.clear();
    LOG_ERROR("Stream %u (%s) failed: %s. Running degraded with %u of %u streams, synchronization is stalled",
              static_cast<unsigned>(stream), name, reason,
              static_cast<unsigned>(ActiveStreams()), static_cast<unsigned>(m_Streams.size()));
}

size_t App::ActiveStreams() const
{
    size_t active = 0;
    for (const StreamState& state : m_Streams) {
        if (!state.failed) {
            active++;
        }
    }
    return active;
}

void App::LogStats() const
{
    const stream_sync::SyncStats& sync = m_Synchronizer.GetStats();
    LOG_INFO("frames %u, decode errors %u, RNG %u, IMU %u, CIR %u, batches %u, discarded %u, overflow %u, publish failures %u",
             m_Stats.frames, m_Stats.decode_errors, m_Stats.range_reports, m_Stats.imu_reports,
             m_Stats.cir_reports, m_Stats.batches, sync.discarded, sync.overflow_drops, m_Stats.publish_failures);
}
