#include "selection_map.h"

namespace dantebridge {
namespace engine {

bool SelectionMap::get(const std::string& device_name, int rx_channel, std::string& label) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = selections_.find(Key(device_name, rx_channel));
    if (it == selections_.end()) {
        return false;
    }
    label = it->second;
    return true;
}

bool SelectionMap::contains(const std::string& device_name, int rx_channel) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return selections_.count(Key(device_name, rx_channel)) > 0;
}

void SelectionMap::set(const std::string& device_name, int rx_channel, const std::string& label) {
    std::lock_guard<std::mutex> lock(mutex_);
    selections_[Key(device_name, rx_channel)] = label;
}

bool SelectionMap::set_if_absent(const std::string& device_name, int rx_channel, const std::string& label) {
    std::lock_guard<std::mutex> lock(mutex_);
    return selections_.emplace(Key(device_name, rx_channel), label).second;
}

bool SelectionMap::erase(const std::string& device_name, int rx_channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    return selections_.erase(Key(device_name, rx_channel)) > 0;
}

void SelectionMap::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    selections_.clear();
}

std::size_t SelectionMap::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return selections_.size();
}

std::map<SelectionMap::Key, std::string> SelectionMap::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return selections_;
}

} // namespace engine
} // namespace dantebridge
