/**
 * @file device_control.h
 * @brief Boundary to the per-device Dante control-channel client.
 * @details The engine never speaks the Dante control protocol itself. A host-supplied
 *          implementation of `DeviceControl` performs the RPCs; failures are reported by
 *          throwing and are converted to `ControlResult` at the call site.
 */
#pragma once

#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "../dante_types.h"

namespace dantebridge {
namespace engine {

/**
 * @struct ControlResult
 * @brief Outcome of one device-control call.
 */
struct ControlResult {
    bool ok = false;
    std::string error;

    static ControlResult success() { return ControlResult{true, ""}; }
    static ControlResult failure(std::string message) { return ControlResult{false, std::move(message)}; }
};

/**
 * @struct DeviceControlState
 * @brief What a device reports about itself over the control channel.
 */
struct DeviceControlState {
    std::string name;
    std::string manufacturer;
    std::string model;
    std::map<int, ChannelInfo> rx_channels;
    std::map<int, ChannelInfo> tx_channels;
    std::vector<Subscription> subscriptions;
};

/**
 * @class DeviceControl
 * @brief Control handle for one Dante device.
 * @details Every call may block on the network and may throw `std::exception` on failure.
 */
class DeviceControl {
public:
    virtual ~DeviceControl() = default;

    virtual void identify() = 0;
    virtual DeviceControlState get_controls() = 0;
    virtual void set_latency(double latency_ms) = 0;
    virtual void set_sample_rate(int sample_rate) = 0;
    virtual void set_encoding(int bits) = 0;

    /// @param direction "input" for AVIO input adapters, "output" for output adapters.
    virtual void set_gain_level(int channel, int level, const std::string& direction) = 0;

    virtual void add_subscription(const ChannelInfo& rx_channel,
                                  const ChannelInfo& tx_channel,
                                  const std::string& tx_device_name) = 0;
    virtual void remove_subscription(const ChannelInfo& rx_channel) = 0;

    /// Whether this device accepts `set_aes67`.
    virtual bool supports_aes67_mode() const { return false; }

    virtual void set_aes67(bool /*enabled*/) {
        throw std::runtime_error("AES67 mode is not supported by this device");
    }
};

/// Creates the control handle for a freshly consolidated device.
using DeviceControlFactory = std::function<std::shared_ptr<DeviceControl>(const Device&)>;

/**
 * @class PyDeviceControl
 * @brief Trampoline letting the Python control-channel client implement DeviceControl.
 */
class PyDeviceControl : public DeviceControl {
public:
    using DeviceControl::DeviceControl;

    void identify() override {
        PYBIND11_OVERRIDE_PURE(void, DeviceControl, identify, );
    }
    DeviceControlState get_controls() override {
        PYBIND11_OVERRIDE_PURE(DeviceControlState, DeviceControl, get_controls, );
    }
    void set_latency(double latency_ms) override {
        PYBIND11_OVERRIDE_PURE(void, DeviceControl, set_latency, latency_ms);
    }
    void set_sample_rate(int sample_rate) override {
        PYBIND11_OVERRIDE_PURE(void, DeviceControl, set_sample_rate, sample_rate);
    }
    void set_encoding(int bits) override {
        PYBIND11_OVERRIDE_PURE(void, DeviceControl, set_encoding, bits);
    }
    void set_gain_level(int channel, int level, const std::string& direction) override {
        PYBIND11_OVERRIDE_PURE(void, DeviceControl, set_gain_level, channel, level, direction);
    }
    void add_subscription(const ChannelInfo& rx_channel,
                          const ChannelInfo& tx_channel,
                          const std::string& tx_device_name) override {
        PYBIND11_OVERRIDE_PURE(void, DeviceControl, add_subscription, rx_channel, tx_channel, tx_device_name);
    }
    void remove_subscription(const ChannelInfo& rx_channel) override {
        PYBIND11_OVERRIDE_PURE(void, DeviceControl, remove_subscription, rx_channel);
    }
    bool supports_aes67_mode() const override {
        PYBIND11_OVERRIDE(bool, DeviceControl, supports_aes67_mode, );
    }
    void set_aes67(bool enabled) override {
        PYBIND11_OVERRIDE(void, DeviceControl, set_aes67, enabled);
    }
};

/**
 * @brief Binds the control boundary types to a Python module.
 * @param m The pybind11 module to which the types will be bound.
 */
inline void bind_device_control(pybind11::module_ &m) {
    namespace py = pybind11;

    py::class_<ControlResult>(m, "ControlResult")
        .def(py::init<>())
        .def_readwrite("ok", &ControlResult::ok)
        .def_readwrite("error", &ControlResult::error)
        .def("__bool__", [](const ControlResult& r) { return r.ok; });

    py::class_<DeviceControlState>(m, "DeviceControlState")
        .def(py::init<>())
        .def_readwrite("name", &DeviceControlState::name)
        .def_readwrite("manufacturer", &DeviceControlState::manufacturer)
        .def_readwrite("model", &DeviceControlState::model)
        .def_readwrite("rx_channels", &DeviceControlState::rx_channels)
        .def_readwrite("tx_channels", &DeviceControlState::tx_channels)
        .def_readwrite("subscriptions", &DeviceControlState::subscriptions);

    py::class_<DeviceControl, PyDeviceControl, std::shared_ptr<DeviceControl>>(m, "DeviceControl",
        "Per-device control-channel client implemented by the host")
        .def(py::init<>())
        .def("identify", &DeviceControl::identify)
        .def("get_controls", &DeviceControl::get_controls)
        .def("set_latency", &DeviceControl::set_latency, py::arg("latency_ms"))
        .def("set_sample_rate", &DeviceControl::set_sample_rate, py::arg("sample_rate"))
        .def("set_encoding", &DeviceControl::set_encoding, py::arg("bits"))
        .def("set_gain_level", &DeviceControl::set_gain_level,
             py::arg("channel"), py::arg("level"), py::arg("direction"))
        .def("add_subscription", &DeviceControl::add_subscription,
             py::arg("rx_channel"), py::arg("tx_channel"), py::arg("tx_device_name"))
        .def("remove_subscription", &DeviceControl::remove_subscription, py::arg("rx_channel"))
        .def("supports_aes67_mode", &DeviceControl::supports_aes67_mode)
        .def("set_aes67", &DeviceControl::set_aes67, py::arg("enabled"));
}

} // namespace engine
} // namespace dantebridge
