#ifndef DANTEBRIDGE_DEVICE_REGISTRY_H
#define DANTEBRIDGE_DEVICE_REGISTRY_H

#include "../control/device_control.h"
#include "../dante_types.h"
#include <cstddef>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace dantebridge {
namespace engine {

struct RegistryEntry {
    Device device;
    std::shared_ptr<DeviceControl> control;
    int missed_passes = 0;
};

/**
 * @class DeviceRegistry
 * @brief Live device handles keyed by display name, kept across refresh passes.
 * @details A device that drops out of discovery stays reachable for control calls until
 *          it has missed `miss_limit` consecutive passes.
 */
class DeviceRegistry {
public:
    DeviceRegistry(std::string logger_prefix, int miss_limit);

    /**
     * @brief Replaces the entries seen in this pass and ages the others.
     * @return Display names evicted by this pass.
     */
    std::vector<std::string> apply_pass(std::map<std::string, RegistryEntry> seen);

    bool get(const std::string& display_name, RegistryEntry& out) const;
    bool contains(const std::string& display_name) const;
    std::size_t size() const;
    std::vector<std::string> names() const;
    void clear();

private:
    std::string m_logger_prefix;
    int m_miss_limit;

    mutable std::shared_mutex m_mutex;
    std::map<std::string, RegistryEntry> m_entries;
};

} // namespace engine
} // namespace dantebridge

#endif // DANTEBRIDGE_DEVICE_REGISTRY_H
