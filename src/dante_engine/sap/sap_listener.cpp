#include "sap_listener.h"

#include "../utils/cpp_logger.h"
#include "sap_parser.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <map>

namespace dantebridge {
namespace engine {

namespace {

// Destination port of the route lookup; nothing is ever sent to it.
constexpr uint16_t kRouteLookupPort = 1;

} // namespace

SapListener::SapListener(std::string logger_prefix, SapTuning tuning)
    : logger_prefix_(std::move(logger_prefix)),
      tuning_(std::move(tuning)) {}

bool SapListener::find_bind_ip(const std::vector<std::string>& device_ips, std::string& bind_ip) {
    for (const auto& ip : device_ips) {
        if (ip.empty()) {
            continue;
        }
        struct sockaddr_in remote;
        memset(&remote, 0, sizeof(remote));
        remote.sin_family = AF_INET;
        remote.sin_port = htons(kRouteLookupPort);
        if (inet_pton(AF_INET, ip.c_str(), &remote.sin_addr) != 1) {
            LOG_CPP_DEBUG("%s Skipping unparsable device address %s", logger_prefix_.c_str(), ip.c_str());
            continue;
        }

        int fd = socket(AF_INET, SOCK_DGRAM, 0);
        if (fd < 0) {
            LOG_CPP_WARNING("%s Failed to create route lookup socket: %s", logger_prefix_.c_str(), strerror(errno));
            continue;
        }

        if (connect(fd, reinterpret_cast<struct sockaddr*>(&remote), sizeof(remote)) < 0) {
            LOG_CPP_DEBUG("%s No route to %s: %s", logger_prefix_.c_str(), ip.c_str(), strerror(errno));
            close(fd);
            continue;
        }

        struct sockaddr_in local;
        socklen_t local_len = sizeof(local);
        memset(&local, 0, sizeof(local));
        const bool have_local = getsockname(fd, reinterpret_cast<struct sockaddr*>(&local), &local_len) == 0;
        close(fd);
        if (!have_local) {
            continue;
        }

        char local_ip[INET_ADDRSTRLEN];
        if (!inet_ntop(AF_INET, &local.sin_addr, local_ip, sizeof(local_ip))) {
            continue;
        }
        bind_ip = local_ip;
        return true;
    }
    return false;
}

int SapListener::open_socket(const std::string& bind_ip) {
    int fd = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (fd < 0) {
        LOG_CPP_ERROR("%s Failed to create socket: %s", logger_prefix_.c_str(), strerror(errno));
        return -1;
    }

    int reuse = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<char*>(&reuse), sizeof(reuse)) < 0) {
        LOG_CPP_WARNING("%s Failed to set SO_REUSEADDR", logger_prefix_.c_str());
    }

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(static_cast<uint16_t>(tuning_.port));

    if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        LOG_CPP_ERROR("%s Failed to bind to port %d: %s", logger_prefix_.c_str(), tuning_.port, strerror(errno));
        close(fd);
        return -1;
    }

    struct ip_mreq mreq;
    memset(&mreq, 0, sizeof(mreq));
    if (inet_pton(AF_INET, tuning_.multicast_group.c_str(), &mreq.imr_multiaddr) != 1 ||
        inet_pton(AF_INET, bind_ip.c_str(), &mreq.imr_interface) != 1) {
        LOG_CPP_ERROR("%s Invalid multicast group %s or interface %s",
                      logger_prefix_.c_str(), tuning_.multicast_group.c_str(), bind_ip.c_str());
        close(fd);
        return -1;
    }
    if (setsockopt(fd, IPPROTO_IP, IP_ADD_MEMBERSHIP, reinterpret_cast<char*>(&mreq), sizeof(mreq)) < 0) {
        LOG_CPP_ERROR("%s Failed to join multicast group %s on %s: %s",
                      logger_prefix_.c_str(), tuning_.multicast_group.c_str(), bind_ip.c_str(), strerror(errno));
        close(fd);
        return -1;
    }

    LOG_CPP_DEBUG("%s Joined %s:%d on %s", logger_prefix_.c_str(),
                  tuning_.multicast_group.c_str(), tuning_.port, bind_ip.c_str());
    return fd;
}

std::vector<std::vector<char>> SapListener::receive_window(int fd) {
    std::vector<std::vector<char>> datagrams;
    std::vector<char> buffer(std::max<std::size_t>(tuning_.receive_buffer_bytes, 512));
    const long window_ms = sanitize_window_ms(tuning_.listen_window_ms, kDefaultSapListenWindowMs);
    const long slice_ms = sanitize_window_ms(tuning_.poll_slice_ms, 1000);
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(window_ms);

    while (true) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            break;
        }

        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        const int ready = poll(&pfd, 1, static_cast<int>(std::min<long long>(remaining, slice_ms)));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_CPP_WARNING("%s poll() error: %s", logger_prefix_.c_str(), strerror(errno));
            break;
        }
        if (ready == 0 || !(pfd.revents & POLLIN)) {
            continue;
        }

        ssize_t n_received = recvfrom(fd, buffer.data(), buffer.size(), 0, nullptr, nullptr);
        if (n_received > 0) {
            datagrams.emplace_back(buffer.begin(), buffer.begin() + n_received);
        }
    }
    return datagrams;
}

bool SapListener::listen(const std::string& bind_ip, std::vector<StreamInfo>& streams) {
    int fd = open_socket(bind_ip);
    if (fd < 0) {
        return false;
    }

    const auto datagrams = receive_window(fd);
    close(fd);

    std::map<std::string, StreamInfo> by_session;
    for (const auto& datagram : datagrams) {
        StreamInfo stream;
        if (!parse_sap_packet(datagram.data(), static_cast<int>(datagram.size()), logger_prefix_, stream)) {
            continue;
        }
        by_session[stream.session_name] = std::move(stream);
    }

    streams.clear();
    for (auto& entry : by_session) {
        streams.push_back(std::move(entry.second));
    }
    LOG_CPP_INFO("%s SAP window closed: %zu datagrams, %zu sessions",
                 logger_prefix_.c_str(), datagrams.size(), streams.size());
    return true;
}

} // namespace engine
} // namespace dantebridge
