#ifndef DANTEBRIDGE_ENGINE_SETTINGS_H
#define DANTEBRIDGE_ENGINE_SETTINGS_H

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace dantebridge {
namespace engine {

inline constexpr long kDefaultBrowseWindowMs = 5000;
inline constexpr long kDefaultResolveTimeoutMs = 3000;
inline constexpr long kDefaultSapListenWindowMs = 10000;
inline constexpr long kDefaultAes67ResponseTimeoutMs = 2000;
inline constexpr int kDefaultAes67CommandPort = 4440;
inline constexpr int kDefaultSapPort = 9875;

inline const char* const kServiceArc = "_netaudio-arc._udp.local.";
inline const char* const kServiceCmc = "_netaudio-cmc._udp.local.";
inline const char* const kServiceDbc = "_netaudio-dbc._udp.local.";
inline const char* const kServiceChan = "_netaudio-chan._udp.local.";

struct DiscoveryTuning {
    long browse_window_ms = kDefaultBrowseWindowMs;
    long resolve_timeout_ms = kDefaultResolveTimeoutMs;
    long poll_slice_ms = 100;            // longest single wait on the mDNS event loop
    std::vector<std::string> service_types{kServiceArc, kServiceCmc, kServiceDbc, kServiceChan};
    std::string control_service_type = kServiceCmc;
    std::string interface_ipv4;          // empty = every interface the daemon serves
};

struct SapTuning {
    std::string multicast_group = "239.255.255.255";
    int port = kDefaultSapPort;
    long listen_window_ms = kDefaultSapListenWindowMs;
    long poll_slice_ms = 1000;
    std::size_t receive_buffer_bytes = 4096;
};

struct Aes67Tuning {
    int command_port = kDefaultAes67CommandPort;
    long response_timeout_ms = kDefaultAes67ResponseTimeoutMs;
};

struct RefreshTuning {
    long scan_interval_s = 30;           // advisory, the host owns the timer
    int device_miss_limit = 10;          // passes a device may be absent before eviction
};

class EngineSettings {
public:
    DiscoveryTuning discovery;
    SapTuning sap;
    Aes67Tuning aes67;
    RefreshTuning refresh;
};

inline long sanitize_window_ms(long configured, long fallback) {
    return configured > 0 ? configured : fallback;
}

inline long resolve_browse_window_ms(const std::shared_ptr<EngineSettings>& settings) {
    return sanitize_window_ms(settings ? settings->discovery.browse_window_ms : 0, kDefaultBrowseWindowMs);
}

inline long resolve_resolve_timeout_ms(const std::shared_ptr<EngineSettings>& settings) {
    return sanitize_window_ms(settings ? settings->discovery.resolve_timeout_ms : 0, kDefaultResolveTimeoutMs);
}

inline long resolve_sap_window_ms(const std::shared_ptr<EngineSettings>& settings) {
    return sanitize_window_ms(settings ? settings->sap.listen_window_ms : 0, kDefaultSapListenWindowMs);
}

inline long resolve_aes67_timeout_ms(const std::shared_ptr<EngineSettings>& settings) {
    return sanitize_window_ms(settings ? settings->aes67.response_timeout_ms : 0, kDefaultAes67ResponseTimeoutMs);
}

inline int resolve_device_miss_limit(const std::shared_ptr<EngineSettings>& settings) {
    const int configured = settings ? settings->refresh.device_miss_limit : 0;
    return configured > 0 ? configured : 10;
}

/**
 * @brief Binds the settings structs so the host can tune them before construction.
 * @param m The pybind11 module to which the settings will be bound.
 */
inline void bind_engine_settings(pybind11::module_ &m) {
    namespace py = pybind11;

    py::class_<DiscoveryTuning>(m, "DiscoveryTuning")
        .def(py::init<>())
        .def_readwrite("browse_window_ms", &DiscoveryTuning::browse_window_ms)
        .def_readwrite("resolve_timeout_ms", &DiscoveryTuning::resolve_timeout_ms)
        .def_readwrite("poll_slice_ms", &DiscoveryTuning::poll_slice_ms)
        .def_readwrite("service_types", &DiscoveryTuning::service_types)
        .def_readwrite("control_service_type", &DiscoveryTuning::control_service_type)
        .def_readwrite("interface_ipv4", &DiscoveryTuning::interface_ipv4);

    py::class_<SapTuning>(m, "SapTuning")
        .def(py::init<>())
        .def_readwrite("multicast_group", &SapTuning::multicast_group)
        .def_readwrite("port", &SapTuning::port)
        .def_readwrite("listen_window_ms", &SapTuning::listen_window_ms)
        .def_readwrite("poll_slice_ms", &SapTuning::poll_slice_ms)
        .def_readwrite("receive_buffer_bytes", &SapTuning::receive_buffer_bytes);

    py::class_<Aes67Tuning>(m, "Aes67Tuning")
        .def(py::init<>())
        .def_readwrite("command_port", &Aes67Tuning::command_port)
        .def_readwrite("response_timeout_ms", &Aes67Tuning::response_timeout_ms);

    py::class_<RefreshTuning>(m, "RefreshTuning")
        .def(py::init<>())
        .def_readwrite("scan_interval_s", &RefreshTuning::scan_interval_s)
        .def_readwrite("device_miss_limit", &RefreshTuning::device_miss_limit);

    py::class_<EngineSettings, std::shared_ptr<EngineSettings>>(m, "EngineSettings")
        .def(py::init<>())
        .def_readwrite("discovery", &EngineSettings::discovery)
        .def_readwrite("sap", &EngineSettings::sap)
        .def_readwrite("aes67", &EngineSettings::aes67)
        .def_readwrite("refresh", &EngineSettings::refresh);
}

} // namespace engine
} // namespace dantebridge

#endif // DANTEBRIDGE_ENGINE_SETTINGS_H
