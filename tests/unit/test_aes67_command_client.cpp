#include <gtest/gtest.h>
#include <memory>
#include "control/aes67_command_client.h"
#include "mocks/mock_dante.h"

using namespace dantebridge::engine;
using dantebridge::engine::testing::MockAes67Transport;

class Aes67CommandClientTest : public ::testing::Test {
protected:
    std::shared_ptr<MockAes67Transport> transport;
    std::unique_ptr<Aes67CommandClient> client;
    StreamInfo stream;

    void SetUp() override {
        transport = std::make_shared<MockAes67Transport>();
        Aes67Tuning tuning;
        client = std::make_unique<Aes67CommandClient>("[test]", tuning, transport);

        stream.session_name = "Studio A";
        stream.session_id = 77;
        stream.origin_ip = "192.168.1.50";
        stream.multicast_addr = "239.69.85.220";
        stream.port = 5004;
        stream.codec = "L24/48000/2";
        stream.channel_count = 2;
    }
};

TEST_F(Aes67CommandClientTest, SendsToCommandPort) {
    transport->reply_with_status(1);
    const auto result = client->subscribe("192.168.1.20", 3, 2, stream);

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(transport->last_device_ip(), "192.168.1.20");
    EXPECT_EQ(transport->last_port(), 4440);
    EXPECT_EQ(transport->last_timeout_ms(), 2000);

    const auto requests = transport->requests();
    ASSERT_EQ(requests.size(), 1u);
    ASSERT_EQ(requests[0].size(), 112u);
    EXPECT_EQ(requests[0][97], 3);
    EXPECT_EQ(requests[0][102], 2);
}

TEST_F(Aes67CommandClientTest, RejectedStatusIsReported) {
    transport->reply_with_status(7);
    const auto result = client->subscribe("192.168.1.20", 1, 1, stream);
    EXPECT_EQ(result.outcome, Aes67Outcome::Rejected);
    ASSERT_TRUE(result.status.has_value());
    EXPECT_EQ(*result.status, 7);
}

TEST_F(Aes67CommandClientTest, TimeoutIsDistinctFromMismatch) {
    transport->set_status(TransportStatus::Timeout);
    auto result = client->subscribe("192.168.1.20", 1, 1, stream);
    EXPECT_EQ(result.outcome, Aes67Outcome::Timeout);
    EXPECT_FALSE(result.status.has_value());

    transport->set_reply({0x00, 0x01, 0x02});
    result = client->subscribe("192.168.1.20", 1, 1, stream);
    EXPECT_EQ(result.outcome, Aes67Outcome::MalformedResponse);
}

TEST_F(Aes67CommandClientTest, SocketErrorFromTransport) {
    transport->set_status(TransportStatus::SocketError);
    const auto result = client->subscribe("192.168.1.20", 1, 1, stream);
    EXPECT_EQ(result.outcome, Aes67Outcome::SocketError);
    EXPECT_FALSE(result.detail.empty());
}

TEST_F(Aes67CommandClientTest, InvalidStreamNeverReachesTransport) {
    stream.port.reset();
    const auto result = client->subscribe("192.168.1.20", 1, 1, stream);
    EXPECT_EQ(result.outcome, Aes67Outcome::SocketError);
    EXPECT_TRUE(transport->requests().empty());
}

TEST_F(Aes67CommandClientTest, NonPositiveTimeoutFallsBackToDefault) {
    Aes67Tuning tuning;
    tuning.response_timeout_ms = 0;
    Aes67CommandClient zero_timeout("[test]", tuning, transport);
    transport->reply_with_status(1);
    zero_timeout.subscribe("192.168.1.20", 1, 1, stream);
    EXPECT_EQ(transport->last_timeout_ms(), kDefaultAes67ResponseTimeoutMs);
}

TEST(UdpAes67TransportTest, InvalidAddressIsSocketError) {
    UdpAes67Transport transport("[test]");
    std::vector<uint8_t> response;
    std::string error;
    EXPECT_EQ(transport.exchange("not.an.address", 4440, {0x28, 0x09}, 100, response, error),
              TransportStatus::SocketError);
    EXPECT_FALSE(error.empty());
}
