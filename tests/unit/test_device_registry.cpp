#include <gtest/gtest.h>
#include <memory>
#include "managers/device_registry.h"
#include "mocks/mock_dante.h"

using namespace dantebridge::engine;
using dantebridge::engine::testing::MockDeviceControl;

namespace {

RegistryEntry make_entry(const std::string& name, const std::string& ipv4) {
    RegistryEntry entry;
    entry.device.name = name;
    entry.device.ipv4 = ipv4;
    entry.control = std::make_shared<MockDeviceControl>();
    return entry;
}

} // namespace

class DeviceRegistryTest : public ::testing::Test {
protected:
    DeviceRegistry registry{"[test]", 3};
};

TEST_F(DeviceRegistryTest, InitialState) {
    EXPECT_EQ(registry.size(), 0u);
    RegistryEntry out;
    EXPECT_FALSE(registry.get("Amp", out));
}

TEST_F(DeviceRegistryTest, PassReplacesSeenEntries) {
    registry.apply_pass({{"Amp", make_entry("Amp", "10.0.0.5")}});
    registry.apply_pass({{"Amp", make_entry("Amp", "10.0.0.9")}});

    RegistryEntry out;
    ASSERT_TRUE(registry.get("Amp", out));
    EXPECT_EQ(out.device.ipv4, "10.0.0.9");
    EXPECT_EQ(out.missed_passes, 0);
    EXPECT_NE(out.control, nullptr);
}

TEST_F(DeviceRegistryTest, EvictsAfterMissLimit) {
    registry.apply_pass({{"Amp", make_entry("Amp", "10.0.0.5")}, {"Box", make_entry("Box", "10.0.0.6")}});

    EXPECT_TRUE(registry.apply_pass({{"Box", make_entry("Box", "10.0.0.6")}}).empty());
    EXPECT_TRUE(registry.apply_pass({{"Box", make_entry("Box", "10.0.0.6")}}).empty());
    RegistryEntry out;
    ASSERT_TRUE(registry.get("Amp", out));
    EXPECT_EQ(out.missed_passes, 2);

    const auto evicted = registry.apply_pass({{"Box", make_entry("Box", "10.0.0.6")}});
    ASSERT_EQ(evicted.size(), 1u);
    EXPECT_EQ(evicted[0], "Amp");
    EXPECT_FALSE(registry.contains("Amp"));
    EXPECT_TRUE(registry.contains("Box"));
}

TEST_F(DeviceRegistryTest, ReappearanceResetsMissCount) {
    registry.apply_pass({{"Amp", make_entry("Amp", "10.0.0.5")}});
    registry.apply_pass({});
    registry.apply_pass({});
    registry.apply_pass({{"Amp", make_entry("Amp", "10.0.0.5")}});
    registry.apply_pass({});
    registry.apply_pass({});
    EXPECT_TRUE(registry.contains("Amp"));
}

TEST_F(DeviceRegistryTest, NamesAndClear) {
    registry.apply_pass({{"B", make_entry("B", "")}, {"A", make_entry("A", "")}});
    EXPECT_EQ(registry.names(), (std::vector<std::string>{"A", "B"}));
    registry.clear();
    EXPECT_EQ(registry.size(), 0u);
}

TEST(DeviceRegistryLimitTest, NonPositiveLimitEvictsOnFirstMiss) {
    DeviceRegistry registry("[test]", 0);
    registry.apply_pass({{"Amp", make_entry("Amp", "10.0.0.5")}});
    EXPECT_EQ(registry.apply_pass({}).size(), 1u);
}
