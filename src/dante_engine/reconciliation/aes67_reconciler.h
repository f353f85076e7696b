#ifndef DANTEBRIDGE_AES67_RECONCILER_H
#define DANTEBRIDGE_AES67_RECONCILER_H

#include <cstddef>
#include <map>
#include <string>

#include "../dante_types.h"
#include "../sap/sap_types.h"
#include "selection_map.h"

namespace dantebridge {
namespace engine {

/// Option label for one channel of an AES67 stream: "[AES67] <session> - <channel>".
std::string make_aes67_option(const std::string& session_name, const std::string& channel_name);

/**
 * @brief Picks the stream channel a device-reported subscription refers to.
 * @details Matches `tx_channel_name` against the derived channel names first, then as a
 *          1-based index, and otherwise falls back to the first channel.
 * @return false only when the stream has no channel names.
 */
bool resolve_stream_channel_label(const StreamInfo& stream,
                                  const std::string& tx_channel_name,
                                  std::string& label);

/**
 * @brief Restores AES67 selections from device subscriptions after a restart.
 * @details A subscription is restored when its `tx_device_name` equals a cached stream's
 *          origin or multicast address (origin checked first) and its `rx_channel_name`
 *          names one of the device's rx channels. Existing selections are never replaced.
 * @return Number of selections added.
 */
std::size_t reconcile_aes67_selections(const DeviceSnapshot& devices,
                                       const std::map<std::string, StreamInfo>& streams,
                                       SelectionMap& selections,
                                       const std::string& logger_prefix);

} // namespace engine
} // namespace dantebridge

#endif // DANTEBRIDGE_AES67_RECONCILER_H
