/**
 * Per-channel routing and device action tests.
 * Covers source resolution, AES67 subscribe through a scripted transport and
 * argument validation on the control surface.
 */
#include "coordinator_fixture.h"

using namespace dantebridge::engine;
using namespace dantebridge::engine::testing;

class SourceSelectionTest : public CoordinatorFixture {
protected:
    void SetUp() override {
        CoordinatorFixture::SetUp();
        sap->set_streams({studio_a()});
        ASSERT_TRUE(coordinator->refresh().success);
    }

    std::shared_ptr<MockDeviceControl> amp() { return controls["amp"]; }
    std::shared_ptr<MockDeviceControl> stagebox() { return controls["stagebox"]; }
};

TEST_F(SourceSelectionTest, CurrentSourceFromDeviceState) {
    EXPECT_EQ(coordinator->current_source("Stagebox", 1), "Amp - Out L");
    EXPECT_EQ(coordinator->current_source("Amp", 1), "None");
    EXPECT_EQ(coordinator->current_source("Amp", 9), "None");
    EXPECT_EQ(coordinator->current_source("Nobody", 1), "None");
}

TEST_F(SourceSelectionTest, SelectDanteSource) {
    const ControlResult result = coordinator->select_source("Amp", 1, "Stagebox - Mic 2");
    ASSERT_TRUE(result.ok) << result.error;

    const auto calls = amp()->calls();
    ASSERT_EQ(amp()->count("add_subscription"), 1u);
    const auto& call = calls.back();
    EXPECT_EQ(call.action, "add_subscription");
    EXPECT_EQ(call.args, (std::vector<std::string>{"1", "Mic 2", "Stagebox", "2"}));
}

TEST_F(SourceSelectionTest, DuplicateTxChannelNameUsesLowestNumber) {
    DeviceControlState state = stagebox_state();
    state.tx_channels[3] = ChannelInfo{"Mic 2", 3};
    state.tx_channels[7] = ChannelInfo{"Mic 2", 7};
    stagebox()->set_state(state);
    ASSERT_TRUE(coordinator->refresh().success);

    ASSERT_TRUE(coordinator->select_source("Amp", 1, "Stagebox - Mic 2").ok);
    EXPECT_EQ(amp()->calls().back().args, (std::vector<std::string>{"1", "Mic 2", "Stagebox", "2"}));
}

TEST_F(SourceSelectionTest, SelectDanteSourceUnknownChannel) {
    EXPECT_FALSE(coordinator->select_source("Amp", 1, "Stagebox - Mic 9").ok);
    EXPECT_FALSE(coordinator->select_source("Amp", 1, "Ghost - Mic 1").ok);
    EXPECT_FALSE(coordinator->select_source("Amp", 1, "NoSeparator").ok);
    EXPECT_FALSE(coordinator->select_source("Amp", 7, "Stagebox - Mic 1").ok);
    EXPECT_EQ(amp()->count("add_subscription"), 0u);
}

TEST_F(SourceSelectionTest, SelectNoneRemovesSubscription) {
    ASSERT_TRUE(coordinator->select_source("Stagebox", 1, "None").ok);
    const auto calls = stagebox()->calls();
    EXPECT_EQ(calls.back().action, "remove_subscription");
    EXPECT_EQ(calls.back().args, (std::vector<std::string>{"1"}));
}

TEST_F(SourceSelectionTest, SelectAes67SourceRecordsSelection) {
    transport->reply_with_status(1);

    const ControlResult result = coordinator->select_source("Amp", 2, "[AES67] Studio A - Tx Right");
    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(transport->last_device_ip(), "192.168.1.20");
    EXPECT_EQ(transport->last_port(), 4440);

    const auto requests = transport->requests();
    ASSERT_EQ(requests.size(), 1u);
    ASSERT_EQ(requests[0].size(), kAes67CommandSize);
    EXPECT_EQ(requests[0][0], 0x28);
    EXPECT_EQ(requests[0][1], 0x09);
    EXPECT_EQ(requests[0][97], 2);  // rx channel
    EXPECT_EQ(requests[0][102], 2); // flow channel

    EXPECT_EQ(coordinator->current_source("Amp", 2), "[AES67] Studio A - Tx Right");
    EXPECT_EQ(coordinator->selections().size(), 1u);
}

TEST_F(SourceSelectionTest, RejectedAes67SubscribeLeavesSelectionUntouched) {
    transport->reply_with_status(0x0010);

    const ControlResult result = coordinator->select_source("Amp", 2, "[AES67] Studio A - Tx Left");
    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.error.find("rejected"), std::string::npos);
    EXPECT_EQ(coordinator->current_source("Amp", 2), "None");
}

TEST_F(SourceSelectionTest, Aes67TimeoutIsReported) {
    transport->set_status(TransportStatus::Timeout);
    const ControlResult result = coordinator->select_source("Amp", 2, "[AES67] Studio A - Tx Left");
    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.error.find("timeout"), std::string::npos);
}

TEST_F(SourceSelectionTest, UnknownAes67OptionNeverHitsTheWire) {
    EXPECT_FALSE(coordinator->select_source("Amp", 2, "[AES67] Studio B - Left").ok);
    EXPECT_TRUE(transport->requests().empty());
}

TEST_F(SourceSelectionTest, DanteSelectionClearsAes67Selection) {
    transport->reply_with_status(1);
    ASSERT_TRUE(coordinator->select_source("Amp", 2, "[AES67] Studio A - Tx Left").ok);

    ASSERT_TRUE(coordinator->select_source("Amp", 2, "Stagebox - Mic 1").ok);
    EXPECT_TRUE(coordinator->selections().empty());
}

TEST_F(SourceSelectionTest, NoneClearsAes67Selection) {
    transport->reply_with_status(1);
    ASSERT_TRUE(coordinator->select_source("Amp", 2, "[AES67] Studio A - Tx Left").ok);
    ASSERT_TRUE(coordinator->select_source("Amp", 2, "None").ok);
    EXPECT_EQ(coordinator->current_source("Amp", 2), "None");
}

TEST_F(SourceSelectionTest, SubscribeAes67RequiresKnownDevice) {
    const Aes67SubscribeResult result = coordinator->subscribe_aes67("Ghost", 1, 1, studio_a());
    EXPECT_EQ(result.outcome, Aes67Outcome::SocketError);
    EXPECT_TRUE(transport->requests().empty());
}

TEST_F(SourceSelectionTest, AddAndRemoveSubscriptionByNumber) {
    ASSERT_TRUE(coordinator->add_subscription("Stagebox", 1, "Amp", 1).ok);
    EXPECT_EQ(stagebox()->calls().back().args, (std::vector<std::string>{"1", "Out L", "Amp", "1"}));

    EXPECT_FALSE(coordinator->add_subscription("Stagebox", 1, "Amp", 5).ok);
    EXPECT_FALSE(coordinator->add_subscription("Ghost", 1, "Amp", 1).ok);

    ASSERT_TRUE(coordinator->remove_subscription("Stagebox", 1).ok);
    EXPECT_FALSE(coordinator->remove_subscription("Stagebox", 3).ok);
}

TEST_F(SourceSelectionTest, ValidatesDeviceSettings) {
    EXPECT_TRUE(coordinator->set_sample_rate("Amp", 96000).ok);
    EXPECT_FALSE(coordinator->set_sample_rate("Amp", 22050).ok);
    EXPECT_TRUE(coordinator->set_encoding("Amp", 24).ok);
    EXPECT_FALSE(coordinator->set_encoding("Amp", 20).ok);
    EXPECT_TRUE(coordinator->set_latency("Amp", 1.0).ok);
    EXPECT_FALSE(coordinator->set_latency("Amp", 0.1).ok);
    EXPECT_FALSE(coordinator->set_latency("Amp", 12.0).ok);

    EXPECT_EQ(amp()->count("set_sample_rate"), 1u);
    EXPECT_EQ(amp()->count("set_encoding"), 1u);
    EXPECT_EQ(amp()->count("set_latency"), 1u);
}

TEST_F(SourceSelectionTest, GainDirectionFollowsModel) {
    ASSERT_TRUE(coordinator->set_gain_level("Amp", 1, 3).ok);
    EXPECT_EQ(amp()->calls().back().args, (std::vector<std::string>{"1", "3", "input"}));

    EXPECT_FALSE(coordinator->set_gain_level("Amp", 1, 6).ok);
    // No model id, so no adjustable gain.
    EXPECT_FALSE(coordinator->set_gain_level("Stagebox", 1, 2).ok);
    EXPECT_EQ(stagebox()->count("set_gain_level"), 0u);
}

TEST_F(SourceSelectionTest, ControlFailureBecomesResult) {
    amp()->set_fail_actions(true);
    const ControlResult result = coordinator->identify("Amp");
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, "identify failed");
    EXPECT_TRUE(coordinator->identify("Stagebox").ok);
}

TEST_F(SourceSelectionTest, Aes67ModeToggle) {
    EXPECT_FALSE(coordinator->set_aes67_mode("Amp", true).ok);
    EXPECT_EQ(amp()->count("set_aes67"), 0u);

    amp()->set_supports_aes67(true);
    ASSERT_TRUE(coordinator->set_aes67_mode("Amp", true).ok);
    EXPECT_EQ(amp()->calls().back().args, (std::vector<std::string>{"1"}));
}
