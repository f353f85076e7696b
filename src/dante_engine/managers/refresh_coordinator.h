/**
 * @file refresh_coordinator.h
 * @brief Drives one Dante/AES67 refresh pass and serves host control requests.
 * @details A pass browses mDNS, consolidates devices, queries each device's control
 *          channel, listens for SAP announcements and reconciles AES67 selections. The
 *          published snapshot only changes when a pass succeeds.
 */
#ifndef DANTEBRIDGE_REFRESH_COORDINATOR_H
#define DANTEBRIDGE_REFRESH_COORDINATOR_H

#include "../configuration/engine_settings.h"
#include "../control/aes67_command_client.h"
#include "../control/device_control.h"
#include "../dante_types.h"
#include "../discovery/i_service_browser.h"
#include "../reconciliation/selection_map.h"
#include "../sap/i_sap_discovery.h"
#include "../sap/stream_cache.h"
#include "../utils/blocking_task_runner.h"
#include "device_registry.h"
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

namespace dantebridge {
namespace engine {

/**
 * @struct RefreshOutcome
 * @brief Result of one refresh pass.
 */
struct RefreshOutcome {
    bool success = false;
    std::string error;
    std::size_t device_count = 0;
    std::size_t new_streams = 0;
    std::size_t total_streams = 0;
    std::size_t reconciled = 0;
};

class RefreshCoordinator {
public:
    /**
     * @param settings Engine tuning; defaults are used when null.
     * @param control_factory Creates control handles for consolidated devices. Required.
     * @param browser mDNS back end; an avahi browser is created when null.
     * @param sap SAP back end; a multicast listener is created when null.
     * @param aes67_transport AES67 command transport; UDP is used when null.
     * @throws std::invalid_argument if `control_factory` is empty.
     */
    RefreshCoordinator(std::shared_ptr<EngineSettings> settings,
                       DeviceControlFactory control_factory,
                       std::shared_ptr<IServiceBrowser> browser = nullptr,
                       std::shared_ptr<ISapDiscovery> sap = nullptr,
                       std::shared_ptr<IAes67Transport> aes67_transport = nullptr);
    ~RefreshCoordinator();

    RefreshCoordinator(const RefreshCoordinator&) = delete;
    RefreshCoordinator& operator=(const RefreshCoordinator&) = delete;

    /**
     * @brief Runs one full pass. Concurrent calls are serialized.
     * @details Fails only when discovery itself cannot run; per-device and SAP failures
     *          are logged and the pass continues.
     */
    RefreshOutcome refresh();

    DeviceSnapshot snapshot() const;
    bool last_refresh_succeeded() const;

    // --- Source listings ---
    std::vector<std::string> get_all_tx_channels() const;
    std::vector<std::string> get_all_aes67_sources() const;

    /**
     * @brief Resolves "[AES67] <stream> - <channel>" to a cached stream.
     * @param flow_channel Receives the 1-based channel index inside the stream.
     */
    bool get_aes67_stream_info(const std::string& option, StreamInfo& stream, int& flow_channel) const;

    // --- Per-channel routing ---
    std::string current_source(const std::string& device_name, int rx_channel) const;
    ControlResult select_source(const std::string& device_name, int rx_channel, const std::string& option);

    // --- Device actions ---
    ControlResult add_subscription(const std::string& rx_device_name, int rx_channel,
                                   const std::string& tx_device_name, int tx_channel);
    ControlResult remove_subscription(const std::string& rx_device_name, int rx_channel);
    ControlResult identify(const std::string& device_name);
    ControlResult set_sample_rate(const std::string& device_name, int sample_rate);
    ControlResult set_encoding(const std::string& device_name, int bits);
    ControlResult set_latency(const std::string& device_name, double latency_ms);
    ControlResult set_gain_level(const std::string& device_name, int channel, int level);
    ControlResult set_aes67_mode(const std::string& device_name, bool enabled);

    /// Blocking AES67 subscribe round trip, run on a worker thread.
    Aes67SubscribeResult subscribe_aes67(const std::string& device_name, int rx_channel,
                                         int flow_channel, const StreamInfo& stream);

    // --- State access ---
    std::map<std::string, StreamInfo> streams() const { return m_stream_cache.all_streams(); }
    std::map<SelectionMap::Key, std::string> selections() const { return m_selections.entries(); }
    std::vector<std::string> registered_devices() const { return m_registry.names(); }
    const std::shared_ptr<EngineSettings>& settings() const { return m_settings; }

private:
    using ControlAction = std::function<void(DeviceControl&, const Device&)>;

    ControlResult run_control(const std::string& device_name, const std::string& action, const ControlAction& fn);
    std::map<std::string, RegistryEntry> collect_devices(const std::map<std::string, Device>& hosts,
                                                         DeviceSnapshot& result);
    void discover_streams(const DeviceSnapshot& result, RefreshOutcome& outcome);

    std::string m_logger_prefix;
    std::shared_ptr<EngineSettings> m_settings;
    DeviceControlFactory m_control_factory;
    std::shared_ptr<IServiceBrowser> m_browser;
    std::shared_ptr<ISapDiscovery> m_sap;
    Aes67CommandClient m_aes67_client;
    BlockingTaskRunner m_runner;

    StreamCache m_stream_cache;
    SelectionMap m_selections;
    DeviceRegistry m_registry;

    std::mutex m_refresh_mutex;
    mutable std::mutex m_snapshot_mutex;
    DeviceSnapshot m_snapshot;
    bool m_last_refresh_ok = false;
};

/**
 * @brief Binds the coordinator and its result types to a Python module.
 * @details The host passes a callable `control_factory(device) -> DeviceControl`. Handles
 *          it returns are kept alive by a Python reference for as long as the engine
 *          holds them. Blocking methods release the GIL.
 * @param m The pybind11 module to which the coordinator will be bound.
 */
inline void bind_refresh_coordinator(pybind11::module_ &m) {
    namespace py = pybind11;

    py::enum_<Aes67Outcome>(m, "Aes67Outcome")
        .value("SUCCESS", Aes67Outcome::Success)
        .value("REJECTED", Aes67Outcome::Rejected)
        .value("MALFORMED_RESPONSE", Aes67Outcome::MalformedResponse)
        .value("TIMEOUT", Aes67Outcome::Timeout)
        .value("SOCKET_ERROR", Aes67Outcome::SocketError);

    py::class_<Aes67SubscribeResult>(m, "Aes67SubscribeResult")
        .def(py::init<>())
        .def_readwrite("outcome", &Aes67SubscribeResult::outcome)
        .def_readwrite("status", &Aes67SubscribeResult::status)
        .def_readwrite("detail", &Aes67SubscribeResult::detail)
        .def_property_readonly("ok", &Aes67SubscribeResult::ok);

    py::class_<RefreshOutcome>(m, "RefreshOutcome")
        .def(py::init<>())
        .def_readwrite("success", &RefreshOutcome::success)
        .def_readwrite("error", &RefreshOutcome::error)
        .def_readwrite("device_count", &RefreshOutcome::device_count)
        .def_readwrite("new_streams", &RefreshOutcome::new_streams)
        .def_readwrite("total_streams", &RefreshOutcome::total_streams)
        .def_readwrite("reconciled", &RefreshOutcome::reconciled);

    py::class_<RefreshCoordinator>(m, "RefreshCoordinator")
        .def(py::init([](std::shared_ptr<EngineSettings> settings, py::function factory) {
                 std::shared_ptr<py::function> callable(
                     new py::function(std::move(factory)),
                     [](py::function* fn) {
                         py::gil_scoped_acquire gil;
                         delete fn;
                     });
                 DeviceControlFactory wrapped = [callable](const Device& device) -> std::shared_ptr<DeviceControl> {
                     py::gil_scoped_acquire gil;
                     py::object handle = (*callable)(device);
                     if (handle.is_none()) {
                         return nullptr;
                     }
                     DeviceControl* control = handle.cast<DeviceControl*>();
                     PyObject* owner = handle.release().ptr();
                     return std::shared_ptr<DeviceControl>(control, [owner](DeviceControl*) {
                         py::gil_scoped_acquire release_gil;
                         Py_DECREF(owner);
                     });
                 };
                 return std::make_unique<RefreshCoordinator>(std::move(settings), std::move(wrapped));
             }),
             py::arg("settings"), py::arg("control_factory"))
        .def("refresh", &RefreshCoordinator::refresh, py::call_guard<py::gil_scoped_release>(),
             "Runs one discovery, SAP and reconciliation pass.")
        .def("snapshot", &RefreshCoordinator::snapshot)
        .def("last_refresh_succeeded", &RefreshCoordinator::last_refresh_succeeded)
        .def("get_all_tx_channels", &RefreshCoordinator::get_all_tx_channels)
        .def("get_all_aes67_sources", &RefreshCoordinator::get_all_aes67_sources)
        .def("get_aes67_stream_info", [](const RefreshCoordinator& self, const std::string& option) -> py::object {
                 StreamInfo stream;
                 int flow_channel = 0;
                 if (!self.get_aes67_stream_info(option, stream, flow_channel)) {
                     return py::none();
                 }
                 return py::make_tuple(stream, flow_channel);
             }, py::arg("option"))
        .def("current_source", &RefreshCoordinator::current_source,
             py::arg("device_name"), py::arg("rx_channel"))
        .def("select_source", &RefreshCoordinator::select_source,
             py::arg("device_name"), py::arg("rx_channel"), py::arg("option"),
             py::call_guard<py::gil_scoped_release>())
        .def("add_subscription", &RefreshCoordinator::add_subscription,
             py::arg("rx_device"), py::arg("rx_channel"), py::arg("tx_device"), py::arg("tx_channel"),
             py::call_guard<py::gil_scoped_release>())
        .def("remove_subscription", &RefreshCoordinator::remove_subscription,
             py::arg("rx_device"), py::arg("rx_channel"), py::call_guard<py::gil_scoped_release>())
        .def("identify", &RefreshCoordinator::identify,
             py::arg("device_name"), py::call_guard<py::gil_scoped_release>())
        .def("set_sample_rate", &RefreshCoordinator::set_sample_rate,
             py::arg("device_name"), py::arg("sample_rate"), py::call_guard<py::gil_scoped_release>())
        .def("set_encoding", &RefreshCoordinator::set_encoding,
             py::arg("device_name"), py::arg("bits"), py::call_guard<py::gil_scoped_release>())
        .def("set_latency", &RefreshCoordinator::set_latency,
             py::arg("device_name"), py::arg("latency_ms"), py::call_guard<py::gil_scoped_release>())
        .def("set_gain_level", &RefreshCoordinator::set_gain_level,
             py::arg("device_name"), py::arg("channel"), py::arg("level"),
             py::call_guard<py::gil_scoped_release>())
        .def("set_aes67_mode", &RefreshCoordinator::set_aes67_mode,
             py::arg("device_name"), py::arg("enabled"), py::call_guard<py::gil_scoped_release>())
        .def("subscribe_aes67", &RefreshCoordinator::subscribe_aes67,
             py::arg("device_name"), py::arg("rx_channel"), py::arg("flow_channel"), py::arg("stream"),
             py::call_guard<py::gil_scoped_release>())
        .def("streams", &RefreshCoordinator::streams)
        .def("selections", &RefreshCoordinator::selections)
        .def("registered_devices", &RefreshCoordinator::registered_devices);
}

} // namespace engine
} // namespace dantebridge

#endif // DANTEBRIDGE_REFRESH_COORDINATOR_H
