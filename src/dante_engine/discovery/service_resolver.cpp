#include "service_resolver.h"

#include "../sap/sap_parser.h"
#include "../utils/cpp_logger.h"

#include <utility>

namespace dantebridge {
namespace engine {

namespace {

const std::string kLocalSuffix = ".local";

} // namespace

std::string normalize_server_name(const std::string& raw) {
    std::string name = raw;
    while (!name.empty() && name.back() == '.') {
        name.pop_back();
    }
    if (name.size() >= kLocalSuffix.size() &&
        name.compare(name.size() - kLocalSuffix.size(), kLocalSuffix.size(), kLocalSuffix) == 0) {
        name.erase(name.size() - kLocalSuffix.size());
    }
    return name;
}

bool resolve_service_record(const RawServiceAnnouncement& announcement,
                            const std::string& logger_prefix,
                            ServiceRecord& out) {
    if (!announcement.resolved) {
        LOG_CPP_DEBUG("%s Could not resolve service %s", logger_prefix.c_str(), announcement.instance_name.c_str());
        return false;
    }
    if (announcement.ipv4_addresses.empty()) {
        LOG_CPP_DEBUG("%s Service %s resolved without an address", logger_prefix.c_str(), announcement.instance_name.c_str());
        return false;
    }

    ServiceRecord record;
    record.service_type = announcement.service_type;
    record.instance_name = announcement.instance_name;
    record.ipv4 = announcement.ipv4_addresses.front();
    record.port = announcement.port;

    std::string raw_host = announcement.host;
    if (raw_host.empty()) {
        raw_host = announcement.instance_name.substr(0, announcement.instance_name.find('.'));
    }
    record.server_name = normalize_server_name(raw_host);

    for (const auto& kv : announcement.txt) {
        record.properties[decode_utf8_lossy(kv.first.data(), kv.first.size())] =
            decode_utf8_lossy(kv.second.data(), kv.second.size());
    }

    out = std::move(record);
    return true;
}

std::vector<ServiceRecord> resolve_service_records(const std::vector<RawServiceAnnouncement>& announcements,
                                                   const std::string& logger_prefix) {
    std::vector<ServiceRecord> records;
    records.reserve(announcements.size());
    for (const auto& announcement : announcements) {
        ServiceRecord record;
        if (resolve_service_record(announcement, logger_prefix, record)) {
            records.push_back(std::move(record));
        }
    }
    return records;
}

} // namespace engine
} // namespace dantebridge
