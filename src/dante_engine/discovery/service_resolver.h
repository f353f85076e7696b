#ifndef DANTEBRIDGE_SERVICE_RESOLVER_H
#define DANTEBRIDGE_SERVICE_RESOLVER_H

#include <string>
#include <vector>

#include "../dante_types.h"
#include "i_service_browser.h"

namespace dantebridge {
namespace engine {

/// Strips every trailing '.' and then one trailing ".local".
std::string normalize_server_name(const std::string& raw);

/**
 * @brief Converts a browsed announcement into a ServiceRecord.
 * @details The host comes from the SRV target when present, otherwise from the first
 *          label of the instance name. TXT bytes are decoded lossily as UTF-8.
 * @return false (logged at debug) when the instance did not resolve or has no address.
 */
bool resolve_service_record(const RawServiceAnnouncement& announcement,
                            const std::string& logger_prefix,
                            ServiceRecord& out);

/// Resolves every announcement, silently dropping the ones that fail.
std::vector<ServiceRecord> resolve_service_records(const std::vector<RawServiceAnnouncement>& announcements,
                                                   const std::string& logger_prefix);

} // namespace engine
} // namespace dantebridge

#endif // DANTEBRIDGE_SERVICE_RESOLVER_H
