#ifndef DANTEBRIDGE_DANTE_CONSTANTS_H
#define DANTEBRIDGE_DANTE_CONSTANTS_H

#include <map>
#include <string>
#include <vector>

namespace dantebridge {
namespace engine {

inline const char* const kSubscriptionNone = "None";
inline const char* const kAes67OptionPrefix = "[AES67] ";
inline const char* const kSourceSeparator = " - ";

inline const std::vector<int> kSampleRates = {44100, 48000, 88200, 96000, 176400, 192000};
inline const std::map<int, std::string> kSampleRateLabels = {
    {44100, "44.1 kHz"},
    {48000, "48 kHz"},
    {88200, "88.2 kHz"},
    {96000, "96 kHz"},
    {176400, "176.4 kHz"},
    {192000, "192 kHz"},
};

inline const std::vector<int> kEncodings = {16, 24, 32};
inline const std::map<int, std::string> kEncodingLabels = {
    {16, "PCM 16-bit"},
    {24, "PCM 24-bit"},
    {32, "PCM 32-bit"},
};

inline const std::map<int, std::string> kGainLabelsInput = {
    {1, "+24 dBu"},
    {2, "+4 dBu"},
    {3, "+0 dBu"},
    {4, "0 dBV"},
    {5, "-10 dBV"},
};

inline const std::map<int, std::string> kGainLabelsOutput = {
    {1, "+18 dBu"},
    {2, "+4 dBu"},
    {3, "+0 dBu"},
    {4, "0 dBV"},
    {5, "-10 dBV"},
};

// AVIO adapters expose a writable gain level per channel.
inline const std::vector<std::string> kAvioInputModels = {"DAI1", "DAI2"};
inline const std::vector<std::string> kAvioOutputModels = {"DAO1", "DAO2"};

inline constexpr int kMinGainLevel = 1;
inline constexpr int kMaxGainLevel = 5;
inline constexpr double kMinLatencyMs = 0.15;
inline constexpr double kMaxLatencyMs = 10.0;

// A subscribe frame carries the channel count in one byte.
inline constexpr int kMaxStreamChannels = 255;
inline constexpr int kMinRtpPort = 1;
inline constexpr int kMaxRtpPort = 65535;

inline const char* const kGainDirectionInput = "input";
inline const char* const kGainDirectionOutput = "output";

/// "input" for AVIO input adapters, "output" for output adapters, empty otherwise.
inline std::string gain_direction_for_model(const std::string& model_id) {
    for (const auto& model : kAvioInputModels) {
        if (model == model_id) {
            return kGainDirectionInput;
        }
    }
    for (const auto& model : kAvioOutputModels) {
        if (model == model_id) {
            return kGainDirectionOutput;
        }
    }
    return std::string();
}

} // namespace engine
} // namespace dantebridge

#endif // DANTEBRIDGE_DANTE_CONSTANTS_H
