#ifndef DANTEBRIDGE_STREAM_CACHE_H
#define DANTEBRIDGE_STREAM_CACHE_H

#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "sap_types.h"

namespace dantebridge {
namespace engine {

/**
 * @class StreamCache
 * @brief Process-lifetime accumulator of SAP-announced streams keyed by session name.
 * @details Entries are only inserted or overwritten; a stream missing from a listen
 *          window is never removed.
 */
class StreamCache {
public:
    StreamCache() = default;

    void upsert(const StreamInfo& stream);
    std::size_t merge(const std::vector<StreamInfo>& streams);

    bool get(const std::string& session_name, StreamInfo& out) const;
    bool contains(const std::string& session_name) const;
    std::size_t size() const;

    /// Copy of every cached stream, ordered by session name.
    std::map<std::string, StreamInfo> all_streams() const;
    std::vector<std::string> session_names() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, StreamInfo> streams_by_session_;
};

} // namespace engine
} // namespace dantebridge

#endif // DANTEBRIDGE_STREAM_CACHE_H
