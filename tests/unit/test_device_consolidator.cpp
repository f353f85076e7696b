#include <gtest/gtest.h>
#include "discovery/device_consolidator.h"
#include "configuration/engine_settings.h"
#include <utility>

using namespace dantebridge::engine;

namespace {

ServiceRecord make_record(const std::string& type,
                          const std::string& host,
                          const std::string& ipv4,
                          std::map<std::string, std::string> props = {}) {
    ServiceRecord record;
    record.service_type = type;
    record.instance_name = host + "." + type;
    record.server_name = host;
    record.ipv4 = ipv4;
    record.port = 4440;
    record.properties = std::move(props);
    return record;
}

} // namespace

class DeviceConsolidatorTest : public ::testing::Test {
protected:
    std::map<std::string, Device> run(const std::vector<ServiceRecord>& records) {
        return consolidate_devices(records, kServiceCmc, "[test]");
    }
};

TEST_F(DeviceConsolidatorTest, MergesServicesOfOneHost) {
    const auto devices = run({
        make_record(kServiceCmc, "switch1", "192.168.1.20", {{"id", "AA:BB:CC:DD:EE:FF"}}),
        make_record(kServiceChan, "switch1", "192.168.1.20", {{"model", "DAI2"}}),
    });

    ASSERT_EQ(devices.size(), 1u);
    const Device& device = devices.at("switch1");
    EXPECT_EQ(device.server_name, "switch1");
    EXPECT_EQ(device.mac_address, "AA:BB:CC:DD:EE:FF");
    EXPECT_EQ(device.model_id, "DAI2");
    EXPECT_EQ(device.ipv4, "192.168.1.20");
    EXPECT_EQ(device.services.size(), 2u);
}

TEST_F(DeviceConsolidatorTest, FirstAddressWins) {
    const auto devices = run({
        make_record(kServiceArc, "amp", "10.0.0.5"),
        make_record(kServiceCmc, "amp", "10.0.0.6"),
    });
    EXPECT_EQ(devices.at("amp").ipv4, "10.0.0.5");
}

TEST_F(DeviceConsolidatorTest, MacOnlyFromControlService) {
    const auto devices = run({make_record(kServiceArc, "amp", "10.0.0.5", {{"id", "11:22:33:44:55:66"}})});
    EXPECT_TRUE(devices.at("amp").mac_address.empty());
}

TEST_F(DeviceConsolidatorTest, NumericProperties) {
    const auto devices = run({make_record(kServiceChan, "amp", "10.0.0.5",
                                          {{"rate", "48000"}, {"latency_ns", "1000000"}})});
    const Device& device = devices.at("amp");
    ASSERT_TRUE(device.sample_rate.has_value());
    EXPECT_EQ(*device.sample_rate, 48000);
    ASSERT_TRUE(device.latency_ns.has_value());
    EXPECT_EQ(*device.latency_ns, 1000000);
}

TEST_F(DeviceConsolidatorTest, LastWriteWins) {
    const auto devices = run({
        make_record(kServiceArc, "amp", "10.0.0.5", {{"model", "FIRST"}, {"rate", "44100"}}),
        make_record(kServiceChan, "amp", "10.0.0.5", {{"model", "SECOND"}, {"rate", "96000"}}),
    });
    const Device& device = devices.at("amp");
    EXPECT_EQ(device.model_id, "SECOND");
    EXPECT_EQ(*device.sample_rate, 96000);
}

TEST_F(DeviceConsolidatorTest, BadIntegerOnlyAffectsItsRecord) {
    const auto devices = run({
        make_record(kServiceChan, "amp", "10.0.0.5",
                    {{"rate", "fast"}, {"latency_ns", "500"}, {"router_info", "\"Dante Via\""}}),
        make_record(kServiceCmc, "amp", "10.0.0.5", {{"id", "AA:AA:AA:AA:AA:AA"}}),
        make_record(kServiceArc, "other", "10.0.0.9", {{"rate", "48000"}}),
    });

    const Device& amp = devices.at("amp");
    EXPECT_FALSE(amp.sample_rate.has_value());
    EXPECT_FALSE(amp.latency_ns.has_value());
    EXPECT_TRUE(amp.software.empty());
    EXPECT_EQ(amp.mac_address, "AA:AA:AA:AA:AA:AA");
    EXPECT_EQ(*devices.at("other").sample_rate, 48000);
}

TEST_F(DeviceConsolidatorTest, DanteViaNeedsQuotedLiteral) {
    const auto devices = run({
        make_record(kServiceArc, "via", "10.0.0.5", {{"router_info", "\"Dante Via\""}}),
        make_record(kServiceArc, "plain", "10.0.0.6", {{"router_info", "Dante Via"}}),
    });
    EXPECT_EQ(devices.at("via").software, "Dante Via");
    EXPECT_TRUE(devices.at("plain").software.empty());
}

TEST_F(DeviceConsolidatorTest, ServerNameUsedAsGiven) {
    const auto devices = run({
        make_record(kServiceArc, "dev.local", "10.0.0.5"),
        make_record(kServiceCmc, "dev.local", "10.0.0.5", {{"id", "AA:BB:CC:DD:EE:01"}}),
        make_record(kServiceArc, "dev", "10.0.0.6"),
    });
    ASSERT_EQ(devices.size(), 2u);
    ASSERT_EQ(devices.count("dev.local"), 1u);
    EXPECT_EQ(devices.at("dev.local").server_name, "dev.local");
    EXPECT_EQ(devices.at("dev.local").mac_address, "AA:BB:CC:DD:EE:01");
    EXPECT_EQ(devices.at("dev").ipv4, "10.0.0.6");
}

TEST_F(DeviceConsolidatorTest, EmptyServerNameDropped) {
    const auto devices = run({
        make_record(kServiceArc, "", "10.0.0.5"),
        make_record(kServiceArc, "amp", "10.0.0.6"),
    });
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices.count("amp"), 1u);
}
