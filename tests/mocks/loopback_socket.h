#pragma once
/**
 * UDP socket bound to 127.0.0.1 for exercising the real socket back ends.
 */

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

namespace dantebridge {
namespace engine {
namespace testing {

class LoopbackSocket {
public:
    LoopbackSocket() {
        fd_ = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
        if (fd_ < 0) {
            throw std::runtime_error(std::string("socket() failed: ") + strerror(errno));
        }
        struct sockaddr_in addr = loopback(0);
        if (bind(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
            close(fd_);
            throw std::runtime_error(std::string("bind() failed: ") + strerror(errno));
        }
        socklen_t len = sizeof(addr);
        getsockname(fd_, reinterpret_cast<struct sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
    }

    ~LoopbackSocket() { close(fd_); }

    LoopbackSocket(const LoopbackSocket&) = delete;
    LoopbackSocket& operator=(const LoopbackSocket&) = delete;

    int fd() const { return fd_; }
    uint16_t port() const { return port_; }

    bool send_to(uint16_t port, const std::vector<char>& payload) {
        struct sockaddr_in dest = loopback(port);
        return sendto(fd_, payload.data(), payload.size(), 0,
                      reinterpret_cast<struct sockaddr*>(&dest), sizeof(dest)) ==
               static_cast<ssize_t>(payload.size());
    }

    /// Sends to a multicast group with loopback delivery on 127.0.0.1.
    bool send_to_group(const std::string& group, uint16_t port, const std::vector<char>& payload) {
        struct in_addr iface;
        inet_pton(AF_INET, "127.0.0.1", &iface);
        setsockopt(fd_, IPPROTO_IP, IP_MULTICAST_IF, &iface, sizeof(iface));
        uint8_t loop = 1;
        setsockopt(fd_, IPPROTO_IP, IP_MULTICAST_LOOP, &loop, sizeof(loop));

        struct sockaddr_in dest;
        memset(&dest, 0, sizeof(dest));
        dest.sin_family = AF_INET;
        dest.sin_port = htons(port);
        inet_pton(AF_INET, group.c_str(), &dest.sin_addr);
        return sendto(fd_, payload.data(), payload.size(), 0,
                      reinterpret_cast<struct sockaddr*>(&dest), sizeof(dest)) ==
               static_cast<ssize_t>(payload.size());
    }

    /// Waits up to timeout_ms for one datagram; returns the sender port, or 0 on timeout.
    uint16_t receive(std::vector<uint8_t>& payload, int timeout_ms) {
        struct pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        if (poll(&pfd, 1, timeout_ms) <= 0) {
            return 0;
        }
        std::vector<uint8_t> buffer(2048);
        struct sockaddr_in from;
        socklen_t from_len = sizeof(from);
        const ssize_t n = recvfrom(fd_, buffer.data(), buffer.size(), 0,
                                   reinterpret_cast<struct sockaddr*>(&from), &from_len);
        if (n <= 0) {
            return 0;
        }
        payload.assign(buffer.begin(), buffer.begin() + n);
        return ntohs(from.sin_port);
    }

    bool reply(uint16_t port, const std::vector<uint8_t>& payload) {
        return send_to(port, std::vector<char>(payload.begin(), payload.end()));
    }

    /// A port nothing on 127.0.0.1 is bound to at the time of the call.
    static uint16_t free_port() {
        LoopbackSocket scratch;
        return scratch.port();
    }

private:
    static struct sockaddr_in loopback(uint16_t port) {
        struct sockaddr_in addr;
        memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        return addr;
    }

    int fd_ = -1;
    uint16_t port_ = 0;
};

} // namespace testing
} // namespace engine
} // namespace dantebridge
