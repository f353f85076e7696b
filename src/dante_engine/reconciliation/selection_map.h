#ifndef DANTEBRIDGE_SELECTION_MAP_H
#define DANTEBRIDGE_SELECTION_MAP_H

#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <utility>

namespace dantebridge {
namespace engine {

/**
 * @class SelectionMap
 * @brief Runtime record of the AES67 source chosen for each (device, rx channel).
 * @details Lives as long as the owning coordinator. Entries are set by a successful
 *          AES67 subscribe or restored by reconciliation, and cleared when the user picks
 *          another source.
 */
class SelectionMap {
public:
    using Key = std::pair<std::string, int>;

    bool get(const std::string& device_name, int rx_channel, std::string& label) const;
    bool contains(const std::string& device_name, int rx_channel) const;

    void set(const std::string& device_name, int rx_channel, const std::string& label);

    /// Inserts only when the key is absent. Returns true when inserted.
    bool set_if_absent(const std::string& device_name, int rx_channel, const std::string& label);

    bool erase(const std::string& device_name, int rx_channel);
    void clear();

    std::size_t size() const;
    std::map<Key, std::string> entries() const;

private:
    mutable std::mutex mutex_;
    std::map<Key, std::string> selections_;
};

} // namespace engine
} // namespace dantebridge

#endif // DANTEBRIDGE_SELECTION_MAP_H
