/**
 * @file dante_types.h
 * @brief Core data types shared across the Dante bridge engine.
 * @details Defines the per-pass discovery records (`ServiceRecord`), the consolidated
 *          `Device` model published to the host, and the pybind11 bindings for them.
 */
#ifndef DANTEBRIDGE_DANTE_TYPES_H
#define DANTEBRIDGE_DANTE_TYPES_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "sap/sap_types.h"

namespace dantebridge {
namespace engine {

/**
 * @struct ServiceRecord
 * @brief One resolved mDNS service instance.
 * @details Records live for a single discovery pass only.
 */
struct ServiceRecord {
    std::string service_type;
    std::string instance_name;
    std::string ipv4;
    int port = 0;
    std::string server_name;                       ///< Normalized host label (no trailing '.', no ".local").
    std::map<std::string, std::string> properties; ///< TXT properties; keys are case-sensitive.
};

/**
 * @struct ChannelInfo
 * @brief A receive or transmit channel reported by a device.
 */
struct ChannelInfo {
    std::string name;
    int number = 0;
};

/**
 * @struct Subscription
 * @brief A routing entry as reported by the device itself.
 * @details `tx_device_name` may hold a Dante device name, an AES67 stream origin IP
 *          or an AES67 multicast address.
 */
struct Subscription {
    std::string rx_channel_name;
    std::string tx_channel_name;
    std::string tx_device_name;
    std::optional<int> status_code;
};

/**
 * @struct Device
 * @brief One physical network endpoint, rebuilt on every refresh pass.
 */
struct Device {
    std::string server_name;
    std::string name;
    std::string ipv4;
    std::string mac_address;
    std::string model_id;
    std::string model;
    std::string manufacturer;
    std::string software;
    std::optional<int> sample_rate;
    std::optional<int64_t> latency_ns;
    std::map<std::string, ServiceRecord> services;
    std::map<int, ChannelInfo> rx_channels;
    std::map<int, ChannelInfo> tx_channels;
    std::vector<Subscription> subscriptions;

    /// Display name, falling back to the host label until the device reports one.
    const std::string& display_name() const {
        return name.empty() ? server_name : name;
    }

    int rx_count() const { return static_cast<int>(rx_channels.size()); }
    int tx_count() const { return static_cast<int>(tx_channels.size()); }
};

/** @brief Published snapshot: display name -> device record. */
using DeviceSnapshot = std::map<std::string, Device>;

/**
 * @brief Binds the shared data types to a Python module.
 * @param m The pybind11 module to which the types will be bound.
 */
inline void bind_dante_types(pybind11::module_ &m) {
    namespace py = pybind11;

    py::class_<ServiceRecord>(m, "ServiceRecord", "One resolved mDNS service instance")
        .def(py::init<>())
        .def_readwrite("service_type", &ServiceRecord::service_type)
        .def_readwrite("instance_name", &ServiceRecord::instance_name)
        .def_readwrite("ipv4", &ServiceRecord::ipv4)
        .def_readwrite("port", &ServiceRecord::port)
        .def_readwrite("server_name", &ServiceRecord::server_name)
        .def_readwrite("properties", &ServiceRecord::properties);

    py::class_<ChannelInfo>(m, "ChannelInfo", "A receive or transmit channel")
        .def(py::init<>())
        .def_readwrite("name", &ChannelInfo::name)
        .def_readwrite("number", &ChannelInfo::number);

    py::class_<Subscription>(m, "Subscription", "Device-reported routing entry")
        .def(py::init<>())
        .def_readwrite("rx_channel_name", &Subscription::rx_channel_name)
        .def_readwrite("tx_channel_name", &Subscription::tx_channel_name)
        .def_readwrite("tx_device_name", &Subscription::tx_device_name)
        .def_readwrite("status_code", &Subscription::status_code);

    py::class_<Device>(m, "Device", "Consolidated record for one physical Dante endpoint")
        .def(py::init<>())
        .def_readwrite("server_name", &Device::server_name)
        .def_readwrite("name", &Device::name)
        .def_readwrite("ipv4", &Device::ipv4)
        .def_readwrite("mac_address", &Device::mac_address)
        .def_readwrite("model_id", &Device::model_id)
        .def_readwrite("model", &Device::model)
        .def_readwrite("manufacturer", &Device::manufacturer)
        .def_readwrite("software", &Device::software)
        .def_readwrite("sample_rate", &Device::sample_rate)
        .def_readwrite("latency", &Device::latency_ns, "Device latency in nanoseconds")
        .def_readwrite("services", &Device::services)
        .def_readwrite("rx_channels", &Device::rx_channels)
        .def_readwrite("tx_channels", &Device::tx_channels)
        .def_readwrite("subscriptions", &Device::subscriptions)
        .def_property_readonly("rx_count", &Device::rx_count)
        .def_property_readonly("tx_count", &Device::tx_count)
        .def_property_readonly("display_name", &Device::display_name);

    py::class_<StreamInfo>(m, "StreamInfo", "AES67 session parsed from a SAP announcement")
        .def(py::init<>())
        .def_readwrite("session_name", &StreamInfo::session_name)
        .def_readwrite("session_id", &StreamInfo::session_id)
        .def_readwrite("origin_ip", &StreamInfo::origin_ip)
        .def_readwrite("multicast_addr", &StreamInfo::multicast_addr)
        .def_readwrite("port", &StreamInfo::port)
        .def_readwrite("codec", &StreamInfo::codec)
        .def_readwrite("channels", &StreamInfo::channel_count)
        .def_readwrite("channel_info", &StreamInfo::channel_info);
}

} // namespace engine
} // namespace dantebridge

#endif // DANTEBRIDGE_DANTE_TYPES_H
