/**
 * @file aes67_command.h
 * @brief Encoder and acknowledgement decoder for the Dante AES67 subscribe command.
 * @details The command routes one channel of an AES67 multicast flow into a receive
 *          channel of a Dante device. The layout was recovered from controller captures
 *          and is a fixed 112-byte big-endian frame.
 */
#ifndef DANTEBRIDGE_AES67_COMMAND_H
#define DANTEBRIDGE_AES67_COMMAND_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../sap/sap_types.h"

namespace dantebridge {
namespace engine {

inline constexpr std::size_t kAes67CommandSize = 112;
inline constexpr std::size_t kAes67MinResponseSize = 10;
inline constexpr uint16_t kAes67StatusSuccess = 1;

/**
 * @enum Aes67Outcome
 * @brief Kind of result of one subscribe round trip.
 */
enum class Aes67Outcome {
    Success,           ///< Device acknowledged with status 1.
    Rejected,          ///< Well-formed acknowledgement carrying another status.
    MalformedResponse, ///< Response too short or with the wrong magic.
    Timeout,           ///< No response before the deadline.
    SocketError        ///< Command could not be built or sent.
};

const char* to_string(Aes67Outcome outcome);

/**
 * @struct Aes67SubscribeResult
 * @brief Tagged result of a subscribe attempt.
 */
struct Aes67SubscribeResult {
    Aes67Outcome outcome = Aes67Outcome::SocketError;
    std::optional<int> status;   ///< Status field when a structurally valid response arrived.
    std::string detail;

    bool ok() const { return outcome == Aes67Outcome::Success; }
};

/**
 * @brief Maps the encoding part of an rtpmap codec to the command's encoding byte.
 * @details Only L16, L24 and L32 have been observed; anything else is sent as L24.
 *          An empty codec is treated as L24.
 */
uint8_t encoding_byte_for_codec(const std::string& codec);

/**
 * @brief Builds the 112-byte subscribe frame.
 * @param rx_channel Receive channel number on the Dante device.
 * @param flow_channel 1-based channel index inside the AES67 flow.
 * @param stream Stream to subscribe to. Requires a valid IPv4 multicast address and port.
 *               A missing origin or session id leaves those fields zeroed.
 * @param sequence Request sequence number echoed by the device.
 * @param out Receives the frame on success.
 * @param error Receives a description on failure.
 */
bool encode_subscribe(uint16_t rx_channel,
                      uint8_t flow_channel,
                      const StreamInfo& stream,
                      uint16_t sequence,
                      std::vector<uint8_t>& out,
                      std::string& error);

/**
 * @brief Classifies a device acknowledgement.
 * @return Success, Rejected (with status) or MalformedResponse.
 */
Aes67SubscribeResult decode_subscribe_response(const uint8_t* data, std::size_t size);

} // namespace engine
} // namespace dantebridge

#endif // DANTEBRIDGE_AES67_COMMAND_H
