#ifndef DANTEBRIDGE_SAP_TYPES_H
#define DANTEBRIDGE_SAP_TYPES_H

#include <cstdint>
#include <optional>
#include <string>

namespace dantebridge {
namespace engine {

/**
 * One AES67 session as described by an SDP body carried in a SAP announcement.
 * Fields that the announcement did not carry stay empty / unset.
 */
struct StreamInfo {
    std::string session_name;
    std::optional<uint64_t> session_id;
    std::string origin_ip;
    std::string multicast_addr;
    std::optional<int> port;
    std::string codec;               // e.g. "L24/48000/2"
    int channel_count = 1;
    std::optional<std::string> channel_info;
};

inline bool operator==(const StreamInfo& a, const StreamInfo& b) {
    return a.session_name == b.session_name &&
           a.session_id == b.session_id &&
           a.origin_ip == b.origin_ip &&
           a.multicast_addr == b.multicast_addr &&
           a.port == b.port &&
           a.codec == b.codec &&
           a.channel_count == b.channel_count &&
           a.channel_info == b.channel_info;
}

} // namespace engine
} // namespace dantebridge

#endif // DANTEBRIDGE_SAP_TYPES_H
