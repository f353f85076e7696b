#include <gtest/gtest.h>
#include <memory>
#include "configuration/engine_settings.h"
#include "dante_constants.h"

using namespace dantebridge::engine;

TEST(EngineSettingsTest, Defaults) {
    EngineSettings settings;
    EXPECT_EQ(settings.discovery.browse_window_ms, 5000);
    EXPECT_EQ(settings.discovery.resolve_timeout_ms, 3000);
    EXPECT_EQ(settings.discovery.service_types.size(), 4u);
    EXPECT_EQ(settings.discovery.control_service_type, "_netaudio-cmc._udp.local.");
    EXPECT_EQ(settings.sap.multicast_group, "239.255.255.255");
    EXPECT_EQ(settings.sap.port, 9875);
    EXPECT_EQ(settings.sap.listen_window_ms, 10000);
    EXPECT_EQ(settings.sap.receive_buffer_bytes, 4096u);
    EXPECT_EQ(settings.aes67.command_port, 4440);
    EXPECT_EQ(settings.aes67.response_timeout_ms, 2000);
    EXPECT_EQ(settings.refresh.scan_interval_s, 30);
    EXPECT_EQ(settings.refresh.device_miss_limit, 10);
}

TEST(EngineSettingsTest, ResolversSanitizeNonPositiveValues) {
    auto settings = std::make_shared<EngineSettings>();
    settings->discovery.browse_window_ms = 0;
    settings->discovery.resolve_timeout_ms = -5;
    settings->sap.listen_window_ms = 2500;
    settings->aes67.response_timeout_ms = -1;
    settings->refresh.device_miss_limit = 0;

    EXPECT_EQ(resolve_browse_window_ms(settings), kDefaultBrowseWindowMs);
    EXPECT_EQ(resolve_resolve_timeout_ms(settings), kDefaultResolveTimeoutMs);
    EXPECT_EQ(resolve_sap_window_ms(settings), 2500);
    EXPECT_EQ(resolve_aes67_timeout_ms(settings), kDefaultAes67ResponseTimeoutMs);
    EXPECT_EQ(resolve_device_miss_limit(settings), 10);
}

TEST(EngineSettingsTest, NullSettingsUseDefaults) {
    std::shared_ptr<EngineSettings> none;
    EXPECT_EQ(resolve_browse_window_ms(none), kDefaultBrowseWindowMs);
    EXPECT_EQ(resolve_sap_window_ms(none), kDefaultSapListenWindowMs);
}

TEST(DanteConstantsTest, GainDirection) {
    EXPECT_EQ(gain_direction_for_model("DAI1"), "input");
    EXPECT_EQ(gain_direction_for_model("DAI2"), "input");
    EXPECT_EQ(gain_direction_for_model("DAO2"), "output");
    EXPECT_EQ(gain_direction_for_model("ULTIMO"), "");
}

TEST(DanteConstantsTest, LabelTables) {
    EXPECT_EQ(kSampleRateLabels.at(48000), "48 kHz");
    EXPECT_EQ(kEncodingLabels.at(24), "PCM 24-bit");
    EXPECT_EQ(kGainLabelsInput.at(1), "+24 dBu");
    EXPECT_EQ(kGainLabelsOutput.at(1), "+18 dBu");
    EXPECT_EQ(kSampleRates.size(), kSampleRateLabels.size());
}
