#pragma once

#include <string>
#include <vector>

#include "sap_types.h"

namespace dantebridge {
namespace engine {

/**
 * @class ISapDiscovery
 * @brief Source of SAP-announced streams for one refresh pass.
 */
class ISapDiscovery {
public:
    virtual ~ISapDiscovery() = default;

    /**
     * @brief Picks the local address that routes to any of the given device addresses.
     * @return false when none of the addresses is reachable.
     */
    virtual bool find_bind_ip(const std::vector<std::string>& device_ips, std::string& bind_ip) = 0;

    /**
     * @brief Listens for one bounded window on the given interface.
     * @param streams Receives one entry per announced session name.
     * @return false if the listening socket could not be set up.
     */
    virtual bool listen(const std::string& bind_ip, std::vector<StreamInfo>& streams) = 0;
};

} // namespace engine
} // namespace dantebridge
