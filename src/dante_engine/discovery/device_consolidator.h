#ifndef DANTEBRIDGE_DEVICE_CONSOLIDATOR_H
#define DANTEBRIDGE_DEVICE_CONSOLIDATOR_H

#include <map>
#include <string>
#include <vector>

#include "../dante_types.h"

namespace dantebridge {
namespace engine {

/**
 * @brief Groups service records by their already-normalized host and derives one Device per host.
 * @details Records are merged in input order and identity fields are last-write-wins:
 *          when two services of a host disagree on `model`, `rate` or `latency_ns`, the
 *          record merged last decides. Browse order is not stable across passes, so this
 *          precedence is not either. A record whose integer property fails to parse
 *          contributes nothing after that property.
 * @param control_service_type Service type whose `id` property carries the MAC address.
 * @return Devices keyed by the records' server_name, used as given.
 */
std::map<std::string, Device> consolidate_devices(const std::vector<ServiceRecord>& records,
                                                  const std::string& control_service_type,
                                                  const std::string& logger_prefix);

} // namespace engine
} // namespace dantebridge

#endif // DANTEBRIDGE_DEVICE_CONSOLIDATOR_H
