#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <string>
#include <vector>

#include "logging/logging.hpp"
#include "logging/log_udp_backend.hpp"

#include "capture_sink.hpp"

using magicloc::log::LogLevel;
using magicloc::log::LogRecord;
using magicloc::log::Logger;

class LoggerTest : public ::testing::Test {
protected:
    CaptureSink sink;

    void SetUp() override {
        Logger::init();
        Logger::setStderrEnabled(false);
        ASSERT_TRUE(Logger::addSink(&sink));
    }

    void TearDown() override {
        Logger::removeSink(&sink);
        Logger::setStderrEnabled(true);
        Logger::setLevel(LogLevel::INFO);
    }
};

TEST_F(LoggerTest, ThresholdFiltersLevels)
{
    Logger::setLevel(LogLevel::INFO);

    LOG_DEBUG("dropped %d", 1);
    LOG_WARN("Stream %u failed: %s", 2u, "EOF");
    LOG_INFO("kept");

    ASSERT_EQ(sink.entries.size(), 2u);
    EXPECT_EQ(sink.entries[0].level, LogLevel::WARN);
    EXPECT_EQ(sink.entries[0].tag, "test_logging.cpp");
    EXPECT_EQ(sink.entries[0].message, "Stream 2 failed: EOF");
    EXPECT_EQ(sink.entries[1].level, LogLevel::INFO);
}

TEST_F(LoggerTest, VerboseAndNone)
{
    Logger::setLevel(LogLevel::VERBOSE);
    LOG_VERBOSE("raw frame");
    EXPECT_EQ(sink.entries.size(), 1u);

    Logger::setLevel(LogLevel::NONE);
    LOG_ERROR("silenced");
    EXPECT_EQ(sink.entries.size(), 1u);
    EXPECT_FALSE(Logger::isEnabled(LogLevel::NONE));
}

TEST_F(LoggerTest, VerbosityCountSelectsLevel)
{
    EXPECT_EQ(magicloc::log::logLevelFromVerbosity(0), LogLevel::INFO);
    EXPECT_EQ(magicloc::log::logLevelFromVerbosity(1), LogLevel::DEBUG);
    EXPECT_EQ(magicloc::log::logLevelFromVerbosity(2), LogLevel::VERBOSE);
    EXPECT_EQ(magicloc::log::logLevelFromVerbosity(7), LogLevel::VERBOSE);
}

TEST_F(LoggerTest, SinkRegistration)
{
    EXPECT_FALSE(Logger::addSink(&sink));
    EXPECT_FALSE(Logger::addSink(nullptr));

    Logger::removeSink(&sink);
    LOG_ERROR("nobody listens");
    EXPECT_TRUE(sink.entries.empty());

    EXPECT_TRUE(Logger::addSink(&sink));
}

TEST_F(LoggerTest, LongMessagesAreTruncated)
{
    const std::string text(2 * Logger::kMaxMessage, 'x');
    LOG_ERROR("%s", text.c_str());

    ASSERT_EQ(sink.entries.size(), 1u);
    EXPECT_EQ(sink.entries[0].message.size(), Logger::kMaxMessage - 1);
}

TEST(LoggerStartup, SinksAttachedBeforeMainSurvive)
{
    Logger::init();

    CaptureSink& early = EarlySink();
    ASSERT_FALSE(early.entries.empty());
    EXPECT_EQ(early.entries[0].level, LogLevel::WARN);
    EXPECT_EQ(early.entries[0].message, "logged before main");

#ifdef USE_LOGGING_STDERR
    // The default stderr sink must still be attached next to the early one
    const size_t attached = Logger::getSinkCount();
    EXPECT_GE(attached, 2u);
    Logger::setStderrEnabled(false);
    EXPECT_EQ(Logger::getSinkCount(), attached - 1);
    Logger::setStderrEnabled(true);
    EXPECT_EQ(Logger::getSinkCount(), attached);
#endif

    LOG_ERROR("after main");
    EXPECT_EQ(early.entries.back().message, "after main");
    Logger::removeSink(&early);
}

#ifdef USE_LOGGING_UDP

using magicloc::log::UdpLogSink;

TEST(UdpLogSink, FormatsEscapedJson)
{
    const LogRecord record{42, LogLevel::WARN, "app.cpp", "say \"hi\"\n\tC:\\dev"};
    char out[UdpLogSink::kMaxDatagram];

    const size_t len = UdpLogSink::Format(record, out, sizeof(out));
    EXPECT_EQ(std::string(out, len),
              "{\"ts\":42,\"lvl\":\"WARN\",\"tag\":\"app.cpp\",\"msg\":\"say \\\"hi\\\"\\n\\tC:\\\\dev\"}");
}

TEST(UdpLogSink, EscapesControlCharacters)
{
    const LogRecord record{3, LogLevel::ERROR, "stream_decoder.cpp", "bad\x01" "byte\x1f" "\b"};
    char out[UdpLogSink::kMaxDatagram];

    const size_t len = UdpLogSink::Format(record, out, sizeof(out));
    EXPECT_EQ(std::string(out, len),
              "{\"ts\":3,\"lvl\":\"ERROR\",\"tag\":\"stream_decoder.cpp\","
              "\"msg\":\"bad\\u0001byte\\u001f\\u0008\"}");
}

TEST(UdpLogSink, FormatReportsOverflow)
{
    const LogRecord record{1, LogLevel::INFO, "app.cpp", "message"};
    char out[16];
    EXPECT_EQ(UdpLogSink::Format(record, out, sizeof(out)), 0u);
}

TEST(UdpLogSink, RejectsInvalidAddress)
{
    UdpLogSink sink;
    EXPECT_FALSE(sink.Open("not-an-address", 3334));
    EXPECT_FALSE(sink.Open(nullptr, 3334));
    EXPECT_FALSE(sink.IsOpen());
}

TEST(UdpLogSink, SendsDatagram)
{
    int receiver = socket(AF_INET, SOCK_DGRAM, 0);
    ASSERT_GE(receiver, 0);

    sockaddr_in addr = {};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ASSERT_EQ(bind(receiver, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
    socklen_t addrLen = sizeof(addr);
    ASSERT_EQ(getsockname(receiver, reinterpret_cast<sockaddr*>(&addr), &addrLen), 0);

    UdpLogSink sink;
    ASSERT_TRUE(sink.Open("127.0.0.1", ntohs(addr.sin_port)));

    const LogRecord record{7, LogLevel::ERROR, "serial_port.cpp", "EOF on /dev/ttyACM0"};
    sink.Write(record);

    pollfd pfd = {receiver, POLLIN, 0};
    ASSERT_EQ(poll(&pfd, 1, 1000), 1);

    char received[UdpLogSink::kMaxDatagram];
    const ssize_t len = recv(receiver, received, sizeof(received), 0);
    ASSERT_GT(len, 0);
    EXPECT_EQ(std::string(received, static_cast<size_t>(len)),
              "{\"ts\":7,\"lvl\":\"ERROR\",\"tag\":\"serial_port.cpp\",\"msg\":\"EOF on /dev/ttyACM0\"}");
    EXPECT_EQ(sink.GetDropped(), 0u);

    close(receiver);
}

#endif // USE_LOGGING_UDP

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
