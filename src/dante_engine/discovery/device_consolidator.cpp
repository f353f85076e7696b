#include "device_consolidator.h"

#include "../utils/cpp_logger.h"

#include <cerrno>
#include <cstdlib>

namespace dantebridge {
namespace engine {

namespace {

const char* const kDanteVia = "Dante Via";
const char* const kQuotedDanteVia = "\"Dante Via\"";

bool parse_integer(const std::string& value, long long& out) {
    const auto first = value.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return false;
    }
    const auto last = value.find_last_not_of(" \t");
    const std::string trimmed = value.substr(first, last - first + 1);
    char* end_ptr = nullptr;
    errno = 0;
    const long long parsed = std::strtoll(trimmed.c_str(), &end_ptr, 10);
    if (end_ptr == trimmed.c_str() || *end_ptr != '\0' || errno == ERANGE) {
        return false;
    }
    out = parsed;
    return true;
}

// Applies one record to its device. Returns false at the first property that fails
// to parse; fields applied before it are kept.
bool merge_record(Device& device, const ServiceRecord& record, const std::string& control_service_type) {
    device.services[record.instance_name] = record;

    if (device.ipv4.empty()) {
        device.ipv4 = record.ipv4;
    }

    const auto& props = record.properties;
    auto id_it = props.find("id");
    if (id_it != props.end() && record.service_type.find(control_service_type) != std::string::npos) {
        device.mac_address = id_it->second;
    }

    auto model_it = props.find("model");
    if (model_it != props.end()) {
        device.model_id = model_it->second;
    }

    auto rate_it = props.find("rate");
    if (rate_it != props.end()) {
        long long rate = 0;
        if (!parse_integer(rate_it->second, rate)) {
            return false;
        }
        device.sample_rate = static_cast<int>(rate);
    }

    auto latency_it = props.find("latency_ns");
    if (latency_it != props.end()) {
        long long latency = 0;
        if (!parse_integer(latency_it->second, latency)) {
            return false;
        }
        device.latency_ns = static_cast<int64_t>(latency);
    }

    auto router_it = props.find("router_info");
    if (router_it != props.end() && router_it->second == kQuotedDanteVia) {
        device.software = kDanteVia;
    }
    return true;
}

} // namespace

std::map<std::string, Device> consolidate_devices(const std::vector<ServiceRecord>& records,
                                                  const std::string& control_service_type,
                                                  const std::string& logger_prefix) {
    std::map<std::string, Device> devices;

    for (const auto& record : records) {
        const std::string host = record.server_name;
        if (host.empty()) {
            LOG_CPP_DEBUG("%s Dropping service %s with empty host", logger_prefix.c_str(), record.instance_name.c_str());
            continue;
        }

        auto it = devices.find(host);
        if (it == devices.end()) {
            Device device;
            device.server_name = host;
            it = devices.emplace(host, std::move(device)).first;
        }

        if (!merge_record(it->second, record, control_service_type)) {
            LOG_CPP_DEBUG("%s Malformed property in service %s for host %s",
                          logger_prefix.c_str(), record.instance_name.c_str(), host.c_str());
        }
    }

    LOG_CPP_DEBUG("%s Consolidated %zu record(s) into %zu device(s)",
                  logger_prefix.c_str(), records.size(), devices.size());
    return devices;
}

} // namespace engine
} // namespace dantebridge
