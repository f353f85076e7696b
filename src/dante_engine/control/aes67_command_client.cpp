#include "aes67_command_client.h"

#include "../utils/cpp_logger.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

namespace dantebridge {
namespace engine {

namespace {

constexpr std::size_t kResponseBufferSize = 2048;

} // namespace

UdpAes67Transport::UdpAes67Transport(std::string logger_prefix)
    : logger_prefix_(std::move(logger_prefix)) {}

TransportStatus UdpAes67Transport::exchange(const std::string& device_ip,
                                            int port,
                                            const std::vector<uint8_t>& request,
                                            long timeout_ms,
                                            std::vector<uint8_t>& response,
                                            std::string& error) {
    struct sockaddr_in dest;
    memset(&dest, 0, sizeof(dest));
    dest.sin_family = AF_INET;
    dest.sin_port = htons(static_cast<uint16_t>(port));
    if (inet_pton(AF_INET, device_ip.c_str(), &dest.sin_addr) != 1) {
        error = "invalid device address '" + device_ip + "'";
        return TransportStatus::SocketError;
    }

    int fd = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (fd < 0) {
        error = std::string("socket: ") + strerror(errno);
        return TransportStatus::SocketError;
    }

    ssize_t sent = sendto(fd, request.data(), request.size(), 0,
                          reinterpret_cast<struct sockaddr*>(&dest), sizeof(dest));
    if (sent < 0 || static_cast<std::size_t>(sent) != request.size()) {
        error = std::string("sendto: ") + strerror(errno);
        close(fd);
        return TransportStatus::SocketError;
    }

    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN;
    pfd.revents = 0;
    int ready;
    do {
        ready = poll(&pfd, 1, static_cast<int>(timeout_ms));
    } while (ready < 0 && errno == EINTR);

    if (ready == 0) {
        close(fd);
        error = "no response within " + std::to_string(timeout_ms) + " ms";
        return TransportStatus::Timeout;
    }
    if (ready < 0) {
        error = std::string("poll: ") + strerror(errno);
        close(fd);
        return TransportStatus::SocketError;
    }

    std::vector<uint8_t> buffer(kResponseBufferSize);
    ssize_t received = recvfrom(fd, buffer.data(), buffer.size(), 0, nullptr, nullptr);
    if (received < 0) {
        error = std::string("recvfrom: ") + strerror(errno);
        close(fd);
        return TransportStatus::SocketError;
    }
    close(fd);

    buffer.resize(static_cast<std::size_t>(received));
    response = std::move(buffer);
    LOG_CPP_DEBUG("%s Received %zd byte response from %s", logger_prefix_.c_str(), received, device_ip.c_str());
    return TransportStatus::Ok;
}

Aes67CommandClient::Aes67CommandClient(std::string logger_prefix,
                                       Aes67Tuning tuning,
                                       std::shared_ptr<IAes67Transport> transport)
    : logger_prefix_(std::move(logger_prefix)),
      tuning_(std::move(tuning)),
      transport_(std::move(transport)),
      rng_(std::random_device{}()) {
    if (!transport_) {
        transport_ = std::make_shared<UdpAes67Transport>(logger_prefix_);
    }
}

uint16_t Aes67CommandClient::next_sequence() {
    std::lock_guard<std::mutex> lock(rng_mutex_);
    std::uniform_int_distribution<int> dist(0, 0xFFFF);
    return static_cast<uint16_t>(dist(rng_));
}

Aes67SubscribeResult Aes67CommandClient::subscribe(const std::string& device_ip,
                                                   uint16_t rx_channel,
                                                   uint8_t flow_channel,
                                                   const StreamInfo& stream) {
    Aes67SubscribeResult result;

    std::vector<uint8_t> request;
    std::string error;
    if (!encode_subscribe(rx_channel, flow_channel, stream, next_sequence(), request, error)) {
        LOG_CPP_ERROR("%s Cannot build subscribe command for %s: %s",
                      logger_prefix_.c_str(), device_ip.c_str(), error.c_str());
        result.outcome = Aes67Outcome::SocketError;
        result.detail = error;
        return result;
    }

    const long timeout_ms = sanitize_window_ms(tuning_.response_timeout_ms, kDefaultAes67ResponseTimeoutMs);
    std::vector<uint8_t> response;
    switch (transport_->exchange(device_ip, tuning_.command_port, request, timeout_ms, response, error)) {
        case TransportStatus::Timeout:
            LOG_CPP_WARNING("%s AES67 subscribe timeout from %s", logger_prefix_.c_str(), device_ip.c_str());
            result.outcome = Aes67Outcome::Timeout;
            result.detail = error;
            return result;
        case TransportStatus::SocketError:
            LOG_CPP_ERROR("%s AES67 subscribe to %s failed: %s",
                          logger_prefix_.c_str(), device_ip.c_str(), error.c_str());
            result.outcome = Aes67Outcome::SocketError;
            result.detail = error;
            return result;
        case TransportStatus::Ok:
            break;
    }

    result = decode_subscribe_response(response.data(), response.size());
    if (result.outcome == Aes67Outcome::Rejected) {
        LOG_CPP_WARNING("%s AES67 subscribe returned status %d for %s ch %u",
                        logger_prefix_.c_str(), *result.status, device_ip.c_str(), static_cast<unsigned>(rx_channel));
    } else if (result.outcome == Aes67Outcome::MalformedResponse) {
        LOG_CPP_WARNING("%s AES67 subscribe unexpected response from %s", logger_prefix_.c_str(), device_ip.c_str());
    } else {
        LOG_CPP_INFO("%s Subscribed %s ch %u to AES67 stream '%s' channel %u",
                     logger_prefix_.c_str(), device_ip.c_str(), static_cast<unsigned>(rx_channel),
                     stream.session_name.c_str(), static_cast<unsigned>(flow_channel));
    }
    return result;
}

} // namespace engine
} // namespace dantebridge
