#ifndef DANTEBRIDGE_AVAHI_BROWSER_H
#define DANTEBRIDGE_AVAHI_BROWSER_H

#include <string>
#include <utility>
#include <vector>

#include "../../configuration/engine_settings.h"
#include "../i_service_browser.h"

typedef struct AvahiStringList AvahiStringList;

namespace dantebridge {
namespace engine {
namespace mdns {

/// Service type as avahi expects it: "_netaudio-arc._udp.local." -> "_netaudio-arc._udp".
std::string avahi_browse_type(const std::string& service_type);

/// TXT entries in list order. A bare key maps to an empty value.
std::vector<std::pair<std::string, std::string>> decode_txt_list(AvahiStringList* txt);

/**
 * @class AvahiBrowser
 * @brief One-shot browse of the configured service types through the avahi daemon.
 * @details Opens an avahi client on a simple poll, starts one service browser per
 *          type and a resolver for every new instance seen during the browse window.
 *          The pass ends once the window has closed and every resolver has answered
 *          or outlived the resolve timeout. Unanswered instances are reported with
 *          `resolved == false`.
 */
class AvahiBrowser : public IServiceBrowser {
public:
    AvahiBrowser(std::string logger_prefix, DiscoveryTuning tuning);
    ~AvahiBrowser() override = default;

    bool browse(std::vector<RawServiceAnnouncement>& announcements, std::string& error) override;

private:
    int browse_interface() const;

    std::string logger_prefix_;
    DiscoveryTuning tuning_;
};

} // namespace mdns
} // namespace engine
} // namespace dantebridge

#endif // DANTEBRIDGE_AVAHI_BROWSER_H
