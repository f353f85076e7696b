#include "stream_cache.h"

namespace dantebridge {
namespace engine {

void StreamCache::upsert(const StreamInfo& stream) {
    if (stream.session_name.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    streams_by_session_[stream.session_name] = stream;
}

std::size_t StreamCache::merge(const std::vector<StreamInfo>& streams) {
    std::size_t merged = 0;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& stream : streams) {
        if (stream.session_name.empty()) {
            continue;
        }
        streams_by_session_[stream.session_name] = stream;
        ++merged;
    }
    return merged;
}

bool StreamCache::get(const std::string& session_name, StreamInfo& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = streams_by_session_.find(session_name);
    if (it == streams_by_session_.end()) {
        return false;
    }
    out = it->second;
    return true;
}

bool StreamCache::contains(const std::string& session_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return streams_by_session_.count(session_name) > 0;
}

std::size_t StreamCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return streams_by_session_.size();
}

std::map<std::string, StreamInfo> StreamCache::all_streams() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return streams_by_session_;
}

std::vector<std::string> StreamCache::session_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(streams_by_session_.size());
    for (const auto& entry : streams_by_session_) {
        names.push_back(entry.first);
    }
    return names;
}

} // namespace engine
} // namespace dantebridge
