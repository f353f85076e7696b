#ifndef DANTEBRIDGE_AES67_COMMAND_CLIENT_H
#define DANTEBRIDGE_AES67_COMMAND_CLIENT_H

#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>

#include "../configuration/engine_settings.h"
#include "aes67_command.h"
#include "i_aes67_transport.h"

namespace dantebridge {
namespace engine {

/**
 * @class UdpAes67Transport
 * @brief Unicast UDP exchange with a per-call receive deadline.
 */
class UdpAes67Transport : public IAes67Transport {
public:
    explicit UdpAes67Transport(std::string logger_prefix);

    TransportStatus exchange(const std::string& device_ip,
                             int port,
                             const std::vector<uint8_t>& request,
                             long timeout_ms,
                             std::vector<uint8_t>& response,
                             std::string& error) override;

private:
    std::string logger_prefix_;
};

/**
 * @class Aes67CommandClient
 * @brief Sends AES67 subscribe commands and classifies the acknowledgement.
 * @details Every call blocks for at most the configured response timeout. Each request
 *          uses a fresh random 16-bit sequence number.
 */
class Aes67CommandClient {
public:
    /**
     * @param transport Exchange implementation; a UDP transport is created when null.
     */
    Aes67CommandClient(std::string logger_prefix,
                       Aes67Tuning tuning,
                       std::shared_ptr<IAes67Transport> transport = nullptr);

    Aes67SubscribeResult subscribe(const std::string& device_ip,
                                   uint16_t rx_channel,
                                   uint8_t flow_channel,
                                   const StreamInfo& stream);

private:
    uint16_t next_sequence();

    std::string logger_prefix_;
    Aes67Tuning tuning_;
    std::shared_ptr<IAes67Transport> transport_;
    std::mutex rng_mutex_;
    std::mt19937 rng_;
};

} // namespace engine
} // namespace dantebridge

#endif // DANTEBRIDGE_AES67_COMMAND_CLIENT_H
