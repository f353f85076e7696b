#ifndef DANTEBRIDGE_SAP_LISTENER_H
#define DANTEBRIDGE_SAP_LISTENER_H

#include <string>
#include <vector>

#include "../configuration/engine_settings.h"
#include "i_sap_discovery.h"

namespace dantebridge {
namespace engine {

/**
 * @class SapListener
 * @brief Blocking, window-bounded SAP multicast listener.
 * @details Joins the SAP group on the chosen interface, buffers every datagram that
 *          arrives before the window closes and parses them afterwards.
 */
class SapListener : public ISapDiscovery {
public:
    SapListener(std::string logger_prefix, SapTuning tuning);
    ~SapListener() override = default;

    bool find_bind_ip(const std::vector<std::string>& device_ips, std::string& bind_ip) override;
    bool listen(const std::string& bind_ip, std::vector<StreamInfo>& streams) override;

private:
    int open_socket(const std::string& bind_ip);
    std::vector<std::vector<char>> receive_window(int fd);

    std::string logger_prefix_;
    SapTuning tuning_;
};

} // namespace engine
} // namespace dantebridge

#endif // DANTEBRIDGE_SAP_LISTENER_H
