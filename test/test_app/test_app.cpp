#include <gtest/gtest.h>

#include <unistd.h>

#include <atomic>
#include <cmath>
#include <cstdio>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "app.hpp"
#include "packet_decoder.hpp"
#include "serial/serial_source_interface.hpp"

class RecordingPublisher : public publish::IPublisher {
public:
    bool Publish(etl::string_view topic, etl::span<const uint8_t> payload) override {
        messages.emplace_back(std::string(topic.begin(), topic.end()),
                              std::string(payload.begin(), payload.end()));
        return accept;
    }

    size_t Count(const std::string& topic) const {
        size_t count = 0;
        for (const auto& message : messages) {
            if (message.first == topic) count++;
        }
        return count;
    }

    const std::string* Last(const std::string& topic) const {
        for (auto it = messages.rbegin(); it != messages.rend(); ++it) {
            if (it->first == topic) return &it->second;
        }
        return nullptr;
    }

    std::vector<std::pair<std::string, std::string>> messages;
    bool accept = true;
};

static size_t CountOccurrences(const std::string& text, const std::string& pattern)
{
    size_t count = 0;
    for (size_t pos = text.find(pattern); pos != std::string::npos; pos = text.find(pattern, pos + 1)) {
        count++;
    }
    return count;
}

class AppTest : public ::testing::Test {
protected:
    static constexpr double kBias = 76.8;

    GatewayParams params;
    RecordingPublisher publisher;

    // Frames back to back, each terminator opens the next frame
    static std::vector<uint8_t> Wire(const std::vector<proto::Packet>& packets) {
        std::vector<uint8_t> wire;
        for (const auto& packet : packets) {
            proto::RawFrame frame;
            EXPECT_TRUE(proto::EncodeFrame(packet, frame));
            wire.insert(wire.end(), frame.begin(), frame.end());
        }
        wire.push_back(0x00);
        return wire;
    }

    static etl::span<const uint8_t> Span(const std::vector<uint8_t>& data) {
        return etl::span<const uint8_t>(data.data(), data.size());
    }

    // Biased ranges as measured by the anchors for a tag at the given point
    static proto::RangeReport RangeReportFor(uint16_t tag, uint64_t trigger, const Eigen::Vector3d& point) {
        proto::RangeReport report;
        report.tag_addr = tag;
        report.system_ts = trigger * 10;
        report.seq_num = static_cast<uint8_t>(trigger);
        report.trigger_txts = trigger;
        for (size_t i = 0; i < proto::kRangeCount; i++) {
            const auto& anchor = localization::kDefaultAnchors[i];
            report.ranges[i] = (Eigen::Vector3d(anchor.x, anchor.y, anchor.z) - point).norm() + kBias;
        }
        return report;
    }

    static proto::Packet Imu(uint64_t ts) {
        proto::ImuReport imu;
        imu.tag_addr = 5;
        imu.system_ts = ts;
        imu.accel = {1, 2, 3};
        imu.gyro = {4, 5, 6};
        return proto::Packet(imu);
    }
};

TEST_F(AppTest, SynchronizedRangesArePublishedWithPoints)
{
    App app(params, 3, publisher);
    const Eigen::Vector3d truth(2.0, 3.0, 1.2);

    for (size_t stream = 0; stream < 3; stream++) {
        proto::RangeReport report = RangeReportFor(static_cast<uint16_t>(0x10 + stream), 100, truth);
        report.ranges[3] = std::numeric_limits<double>::quiet_NaN();
        app.ProcessBytes(stream, Span(Wire({proto::Packet(report)})));

        if (stream < 2) {
            EXPECT_TRUE(publisher.messages.empty());
        }
    }

    ASSERT_EQ(publisher.messages.size(), 2u);
    EXPECT_EQ(publisher.messages[0].first, "ranges");
    EXPECT_EQ(publisher.messages[1].first, "points");

    const std::string& ranges = publisher.messages[0].second;
    EXPECT_EQ(ranges.front(), '[');
    EXPECT_EQ(CountOccurrences(ranges, "\"trigger_txts\":100"), 3u);
    EXPECT_EQ(CountOccurrences(ranges, "null"), 3u);
    EXPECT_NE(ranges.find("{\"tag_addr\":16,\"system_ts\":1000,\"seq_num\":100,"), std::string::npos);

    const std::string& points = publisher.messages[1].second;
    EXPECT_EQ(CountOccurrences(points, "\"valid\":true"), 3u);
    EXPECT_NE(points.find("\"tag_addr\":18"), std::string::npos);

    // Bias removed before solving, otherwise the point is far off
    const size_t start = points.find("\"point\":[");
    ASSERT_NE(start, std::string::npos);
    double x = 0, y = 0, z = 0;
    ASSERT_EQ(sscanf(points.c_str() + start, "\"point\":[%lf,%lf,%lf]", &x, &y, &z), 3);
    EXPECT_NEAR(x, truth.x(), 1e-2);
    EXPECT_NEAR(y, truth.y(), 1e-2);
    EXPECT_NEAR(z, truth.z(), 1e-2);

    EXPECT_EQ(app.GetStats().range_reports, 3u);
    EXPECT_EQ(app.GetStats().batches, 1u);
    EXPECT_EQ(app.GetStats().frames, 3u);
}

TEST_F(AppTest, UnmatchedReportsAreNotPublished)
{
    App app(params, 2, publisher);
    const Eigen::Vector3d truth(2.0, 3.0, 1.2);

    app.ProcessBytes(0, Span(Wire({proto::Packet(RangeReportFor(1, 5, truth)), proto::Packet(RangeReportFor(1, 7, truth))})));
    app.ProcessBytes(1, Span(Wire({proto::Packet(RangeReportFor(1, 6, truth))})));
    EXPECT_TRUE(publisher.messages.empty());

    app.ProcessBytes(1, Span(Wire({proto::Packet(RangeReportFor(1, 7, truth))})));
    EXPECT_EQ(publisher.Count("ranges"), 1u);
    EXPECT_EQ(app.GetSynchronizer().GetStats().discarded, 2u);
}

TEST_F(AppTest, InvalidRangesGiveOriginSentinel)
{
    App app(params, 1, publisher);

    proto::RangeReport report;
    report.tag_addr = 9;
    report.trigger_txts = 1;
    report.ranges.fill(std::numeric_limits<double>::infinity());
    app.HandlePacket(0, proto::Packet(report));

    const std::string* points = publisher.Last("points");
    ASSERT_NE(points, nullptr);
    EXPECT_EQ(*points, "[{\"tag_addr\":9,\"point\":[0,0,0],\"valid\":false}]");
}

TEST_F(AppTest, ImuIsPublishedImmediately)
{
    App app(params, 2, publisher);

    app.ProcessBytes(1, Span(Wire({Imu(1000)})));

    ASSERT_EQ(publisher.messages.size(), 1u);
    EXPECT_EQ(publisher.messages[0].first, "imu");
    EXPECT_EQ(publisher.messages[0].second,
              "{\"tag_addr\":5,\"system_ts\":1000,\"accel\":[1,2,3],\"gyro\":[4,5,6]}");
}

TEST_F(AppTest, ImuGapsAndReorderingAreCounted)
{
    App app(params, 1, publisher);

    app.ProcessBytes(0, Span(Wire({Imu(1000), Imu(2000), Imu(4000), Imu(3000)})));

    EXPECT_EQ(publisher.Count("imu"), 4u);
    EXPECT_EQ(app.GetStats().imu_reports, 4u);
    EXPECT_EQ(app.GetStats().imu_gaps, 1u);
    EXPECT_EQ(app.GetStats().imu_non_monotonic, 1u);
}

TEST_F(AppTest, CirIsConvertedAndPublished)
{
    App app(params, 1, publisher);

    proto::CirReport cir;
    cir.src_addr = 2;
    cir.cir_size = 16;
    cir.cir[0].real = proto::PackInt24(-42);
    cir.cir[0].imag = proto::PackInt24(7);
    app.ProcessBytes(0, Span(Wire({proto::Packet(cir)})));

    const std::string* json = publisher.Last("cir");
    ASSERT_NE(json, nullptr);
    EXPECT_EQ(json->rfind("{\"src_addr\":2,", 0), 0u);
    EXPECT_NE(json->find("\"cir\":[[-42,7],[0,0],"), std::string::npos);
}

TEST_F(AppTest, CorruptFrameIsSkipped)
{
    App app(params, 1, publisher);

    std::vector<uint8_t> wire = {0x00, 0xFF, 0x01, 0x00, 0x02, 0x03, 0x78};
    const std::vector<uint8_t> valid = Wire({Imu(10)});
    wire.insert(wire.end(), valid.begin(), valid.end());

    app.ProcessBytes(0, Span(wire));

    EXPECT_EQ(app.GetStats().decode_errors, 1u);
    EXPECT_EQ(publisher.Count("imu"), 1u);
}

TEST_F(AppTest, ByteByByteArrival)
{
    App app(params, 1, publisher);

    const std::vector<uint8_t> wire = Wire({Imu(1), Imu(2), Imu(3)});
    for (uint8_t byte : wire) {
        app.ProcessBytes(0, etl::span<const uint8_t>(&byte, 1));
    }

    EXPECT_EQ(publisher.Count("imu"), 3u);
    EXPECT_EQ(app.GetDecoder(0).GetStats().frames, 3u);
}

TEST_F(AppTest, PublishFailuresAreNotFatal)
{
    publisher.accept = false;
    App app(params, 1, publisher);

    app.ProcessBytes(0, Span(Wire({Imu(1), Imu(2)})));

    EXPECT_EQ(app.GetStats().publish_failures, 2u);
    EXPECT_EQ(app.GetStats().imu_reports, 2u);
}

TEST_F(AppTest, RangeBiasIsConfigurable)
{
    params.rangeBias = 0.0;
    App app(params, 1, publisher);

    proto::RangeReport report;
    report.ranges.fill(1.5);
    app.HandlePacket(0, proto::Packet(report));

    const std::string* ranges = publisher.Last("ranges");
    ASSERT_NE(ranges, nullptr);
    EXPECT_NE(ranges->find("\"ranges\":[1.5,1.5,"), std::string::npos);
}

TEST_F(AppTest, RunEndsWhenEverySourceIsGone)
{
    int first[2];
    int second[2];
    ASSERT_EQ(pipe(first), 0);
    ASSERT_EQ(pipe(second), 0);

    const std::vector<uint8_t> wire = Wire({Imu(100)});
    ASSERT_EQ(write(first[1], wire.data(), wire.size()), static_cast<ssize_t>(wire.size()));
    close(first[1]);
    close(second[1]);

    serial::FdSource a(first[0], "pipe-a");
    serial::FdSource b(second[0], "pipe-b");
    serial::ISerialSource* sources[] = {&a, &b};

    App app(params, 2, publisher);
    std::atomic<bool> stop{false};
    EXPECT_EQ(app.Run(etl::span<serial::ISerialSource* const>(sources, 2), stop), App::kExitAllStreamsFailed);

    EXPECT_EQ(publisher.Count("imu"), 1u);
    EXPECT_TRUE(app.IsStreamFailed(0));
    EXPECT_TRUE(app.IsStreamFailed(1));
}

TEST_F(AppTest, RunHonorsStopFlag)
{
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    serial::FdSource source(fds[0], "pipe");
    serial::ISerialSource* sources[] = {&source};

    App app(params, 1, publisher);
    std::atomic<bool> stop{true};
    EXPECT_EQ(app.Run(etl::span<serial::ISerialSource* const>(sources, 1), stop), App::kExitOk);
    EXPECT_FALSE(app.IsStreamFailed(0));

    close(fds[1]);
}

TEST_F(AppTest, RunRejectsSourceCountMismatch)
{
    App app(params, 2, publisher);
    std::atomic<bool> stop{false};
    EXPECT_EQ(app.Run(etl::span<serial::ISerialSource* const>(), stop), App::kExitFailure);
}

TEST_F(AppTest, InvalidStreamCountThrows)
{
    EXPECT_THROW(App(params, 0, publisher), std::invalid_argument);
    EXPECT_THROW(App(params, 9, publisher), std::invalid_argument);
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
