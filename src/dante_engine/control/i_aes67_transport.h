#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace dantebridge {
namespace engine {

/**
 * @enum TransportStatus
 * @brief Outcome of one request/response exchange.
 */
enum class TransportStatus {
    Ok,
    Timeout,
    SocketError
};

/**
 * @class IAes67Transport
 * @brief Carries one command datagram to a device and waits for its answer.
 */
class IAes67Transport {
public:
    virtual ~IAes67Transport() = default;

    /**
     * @brief Sends a request and blocks for a single response datagram.
     * @param response Receives the response payload when the status is Ok.
     * @param error Receives a description for Timeout and SocketError.
     */
    virtual TransportStatus exchange(const std::string& device_ip,
                                     int port,
                                     const std::vector<uint8_t>& request,
                                     long timeout_ms,
                                     std::vector<uint8_t>& response,
                                     std::string& error) = 0;
};

} // namespace engine
} // namespace dantebridge
