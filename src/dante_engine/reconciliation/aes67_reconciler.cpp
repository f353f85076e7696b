#include "aes67_reconciler.h"

#include "../dante_constants.h"
#include "../sap/sap_parser.h"
#include "../utils/cpp_logger.h"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <utility>
#include <vector>

namespace dantebridge {
namespace engine {

namespace {

using StreamRef = std::pair<const std::string*, const StreamInfo*>;

bool parse_channel_index(const std::string& text, long& index) {
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return false;
    }
    const auto last = text.find_last_not_of(" \t");
    const std::string trimmed = text.substr(first, last - first + 1);
    char* end_ptr = nullptr;
    errno = 0;
    const long parsed = std::strtol(trimmed.c_str(), &end_ptr, 10);
    if (end_ptr == trimmed.c_str() || *end_ptr != '\0' || errno == ERANGE) {
        return false;
    }
    index = parsed;
    return true;
}

} // namespace

std::string make_aes67_option(const std::string& session_name, const std::string& channel_name) {
    return std::string(kAes67OptionPrefix) + session_name + kSourceSeparator + channel_name;
}

bool resolve_stream_channel_label(const StreamInfo& stream,
                                  const std::string& tx_channel_name,
                                  std::string& label) {
    const std::vector<std::string> names = derive_channel_names(stream);
    if (names.empty()) {
        return false;
    }

    if (std::find(names.begin(), names.end(), tx_channel_name) != names.end()) {
        label = tx_channel_name;
        return true;
    }

    long index = 0;
    if (parse_channel_index(tx_channel_name, index) && index >= 1 &&
        index <= static_cast<long>(names.size())) {
        label = names[static_cast<std::size_t>(index - 1)];
        return true;
    }

    label = names.front();
    return true;
}

std::size_t reconcile_aes67_selections(const DeviceSnapshot& devices,
                                       const std::map<std::string, StreamInfo>& streams,
                                       SelectionMap& selections,
                                       const std::string& logger_prefix) {
    std::map<std::string, StreamRef> by_origin;
    std::map<std::string, StreamRef> by_multicast;
    for (const auto& kv : streams) {
        if (!kv.second.origin_ip.empty()) {
            by_origin[kv.second.origin_ip] = StreamRef(&kv.first, &kv.second);
        }
        if (!kv.second.multicast_addr.empty()) {
            by_multicast[kv.second.multicast_addr] = StreamRef(&kv.first, &kv.second);
        }
    }

    std::size_t reconciled = 0;
    for (const auto& device_kv : devices) {
        const std::string& device_name = device_kv.first;
        const Device& device = device_kv.second;

        for (const auto& sub : device.subscriptions) {
            const StreamRef* match = nullptr;
            auto origin_it = by_origin.find(sub.tx_device_name);
            if (origin_it != by_origin.end()) {
                match = &origin_it->second;
            } else {
                auto mcast_it = by_multicast.find(sub.tx_device_name);
                if (mcast_it != by_multicast.end()) {
                    match = &mcast_it->second;
                }
            }
            if (!match) {
                continue;
            }

            int rx_number = 0;
            bool rx_found = false;
            for (const auto& ch : device.rx_channels) {
                if (ch.second.name == sub.rx_channel_name) {
                    rx_number = ch.first;
                    rx_found = true;
                    break;
                }
            }
            if (!rx_found) {
                continue;
            }

            // Runtime selections take precedence.
            if (selections.contains(device_name, rx_number)) {
                continue;
            }

            std::string channel_label;
            if (!resolve_stream_channel_label(*match->second, sub.tx_channel_name, channel_label)) {
                continue;
            }

            const std::string option = make_aes67_option(*match->first, channel_label);
            if (selections.set_if_absent(device_name, rx_number, option)) {
                ++reconciled;
                LOG_CPP_DEBUG("%s Reconciled AES67 subscription: %s ch%d -> %s",
                              logger_prefix.c_str(), device_name.c_str(), rx_number, option.c_str());
            }
        }
    }

    if (reconciled > 0) {
        LOG_CPP_WARNING("%s Reconciled %zu AES67 subscription(s) from device state",
                        logger_prefix.c_str(), reconciled);
    }
    return reconciled;
}

} // namespace engine
} // namespace dantebridge
