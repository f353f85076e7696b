#pragma once

#include <string>
#include <utility>
#include <vector>

namespace dantebridge {
namespace engine {

/**
 * @struct RawServiceAnnouncement
 * @brief One browsed mDNS service instance, with whatever resolution data arrived.
 */
struct RawServiceAnnouncement {
    std::string service_type;                  ///< e.g. "_netaudio-cmc._udp.local."
    std::string instance_name;                 ///< Instance FQDN as announced.
    std::string host;                          ///< SRV target, empty if never seen.
    std::vector<std::string> ipv4_addresses;
    int port = 0;
    std::vector<std::pair<std::string, std::string>> txt; ///< Raw TXT key/value bytes.
    bool resolved = false;                     ///< SRV was received within the resolve timeout.
};

/**
 * @class IServiceBrowser
 * @brief Bounded-time browse + resolve of the configured service types.
 */
class IServiceBrowser {
public:
    virtual ~IServiceBrowser() = default;

    /**
     * @brief Runs one browse window followed by per-instance resolution.
     * @param error Set when the multicast facility itself is unavailable.
     * @return false only for that pass-level failure.
     */
    virtual bool browse(std::vector<RawServiceAnnouncement>& announcements, std::string& error) = 0;
};

} // namespace engine
} // namespace dantebridge
