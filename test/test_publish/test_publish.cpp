#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

#include "publish/stream_publisher.hpp"
#include "publish/udp_publisher.hpp"

static etl::span<const uint8_t> Bytes(const std::string& text)
{
    return etl::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

TEST(StreamPublisher, OneLinePerMessage)
{
    FILE* out = tmpfile();
    ASSERT_NE(out, nullptr);

    publish::StreamPublisher publisher(out);
    EXPECT_TRUE(publish::PublishText(publisher, publish::kRangesTopic, "[]"));
    EXPECT_TRUE(publish::PublishText(publisher, publish::kImuTopic, "{\"tag_addr\":1}"));

    rewind(out);
    char line[128];
    ASSERT_NE(fgets(line, sizeof(line), out), nullptr);
    EXPECT_STREQ(line, "ranges []\n");
    ASSERT_NE(fgets(line, sizeof(line), out), nullptr);
    EXPECT_STREQ(line, "imu {\"tag_addr\":1}\n");
    fclose(out);
}

TEST(StreamPublisher, NoStreamFails)
{
    publish::StreamPublisher publisher(nullptr);
    EXPECT_FALSE(publish::PublishText(publisher, publish::kPointsTopic, "[]"));
}

class UdpPublisherTest : public ::testing::Test {
protected:
    int receiver = -1;
    uint16_t port = 0;

    void SetUp() override {
        receiver = socket(AF_INET, SOCK_DGRAM, 0);
        ASSERT_GE(receiver, 0);

        sockaddr_in addr = {};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        ASSERT_EQ(bind(receiver, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
        socklen_t len = sizeof(addr);
        ASSERT_EQ(getsockname(receiver, reinterpret_cast<sockaddr*>(&addr), &len), 0);
        port = ntohs(addr.sin_port);
    }

    void TearDown() override {
        if (receiver >= 0) {
            close(receiver);
        }
    }

    std::string Receive() {
        pollfd pfd = {receiver, POLLIN, 0};
        if (poll(&pfd, 1, 1000) != 1) {
            return std::string();
        }
        char buffer[2048];
        ssize_t len = recv(receiver, buffer, sizeof(buffer), 0);
        return len > 0 ? std::string(buffer, static_cast<size_t>(len)) : std::string();
    }
};

TEST_F(UdpPublisherTest, TopicPrefixedDatagram)
{
    publish::UdpPublisher publisher("127.0.0.1", port);

    ASSERT_TRUE(publish::PublishText(publisher, publish::kPointsTopic,
                                     "[{\"tag_addr\":3,\"point\":[1,2,3],\"valid\":true}]"));
    EXPECT_EQ(Receive(), "points [{\"tag_addr\":3,\"point\":[1,2,3],\"valid\":true}]");

    ASSERT_TRUE(publish::PublishText(publisher, publish::kCirTopic, "{}"));
    EXPECT_EQ(Receive(), "cir {}");
    EXPECT_EQ(publisher.GetSendErrors(), 0u);
}

TEST_F(UdpPublisherTest, OversizedMessageIsRejected)
{
    publish::UdpPublisher publisher("127.0.0.1", port);

    const std::string payload(70000, 'x');
    EXPECT_FALSE(publisher.Publish(etl::string_view(publish::kRangesTopic), Bytes(payload)));
    EXPECT_EQ(publisher.GetSendErrors(), 1u);
}

TEST(UdpPublisher, InvalidHostThrows)
{
    EXPECT_THROW(publish::UdpPublisher("localhost.invalid", 5555), std::runtime_error);
    EXPECT_THROW(publish::UdpPublisher("300.1.1.1", 5555), std::runtime_error);
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
