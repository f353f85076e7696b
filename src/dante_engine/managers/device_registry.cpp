#include "device_registry.h"
#include "../utils/cpp_logger.h"
#include <mutex>
#include <utility>

namespace dantebridge {
namespace engine {

DeviceRegistry::DeviceRegistry(std::string logger_prefix, int miss_limit)
    : m_logger_prefix(std::move(logger_prefix)),
      m_miss_limit(miss_limit > 0 ? miss_limit : 1) {}

std::vector<std::string> DeviceRegistry::apply_pass(std::map<std::string, RegistryEntry> seen) {
    std::vector<std::string> evicted;
    // Handles released here may run host code; drop them outside the lock.
    std::vector<std::shared_ptr<DeviceControl>> released;

    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);

        for (auto it = m_entries.begin(); it != m_entries.end();) {
            if (seen.count(it->first) > 0) {
                released.push_back(std::move(it->second.control));
                it = m_entries.erase(it);
                continue;
            }
            it->second.missed_passes++;
            if (it->second.missed_passes >= m_miss_limit) {
                evicted.push_back(it->first);
                released.push_back(std::move(it->second.control));
                it = m_entries.erase(it);
                continue;
            }
            ++it;
        }

        for (auto& kv : seen) {
            kv.second.missed_passes = 0;
            m_entries[kv.first] = std::move(kv.second);
        }
    }

    for (const auto& name : evicted) {
        LOG_CPP_INFO("%s Evicted device %s after %d missed passes",
                     m_logger_prefix.c_str(), name.c_str(), m_miss_limit);
    }
    return evicted;
}

bool DeviceRegistry::get(const std::string& display_name, RegistryEntry& out) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_entries.find(display_name);
    if (it == m_entries.end()) {
        return false;
    }
    out = it->second;
    return true;
}

bool DeviceRegistry::contains(const std::string& display_name) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_entries.count(display_name) > 0;
}

std::size_t DeviceRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_entries.size();
}

std::vector<std::string> DeviceRegistry::names() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    std::vector<std::string> result;
    result.reserve(m_entries.size());
    for (const auto& kv : m_entries) {
        result.push_back(kv.first);
    }
    return result;
}

void DeviceRegistry::clear() {
    std::map<std::string, RegistryEntry> released;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        released.swap(m_entries);
    }
}

} // namespace engine
} // namespace dantebridge
