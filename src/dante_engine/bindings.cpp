/**
 * @file bindings.cpp
 * @brief Defines the Python module for the Dante bridge engine.
 * @details This file uses pybind11 to create the `dante_bridge_engine` Python module.
 *          It calls the binding functions of each component in dependency order and
 *          exposes the protocol constants and label tables to the host.
 */
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "configuration/engine_settings.h"
#include "control/device_control.h"
#include "dante_constants.h"
#include "dante_types.h"
#include "managers/refresh_coordinator.h"
#include "sap/sap_parser.h"
#include "utils/cpp_logger.h"

namespace py = pybind11;
using namespace dantebridge;

PYBIND11_MODULE(dante_bridge_engine, m) {
    m.doc() = "Dante / AES67 discovery and routing engine";

    // 1. Logger has no dependencies on other bound types
    engine::logging::bind_logger(m);

    // 2. Data types and settings
    engine::bind_dante_types(m);
    engine::bind_engine_settings(m);

    // 3. Control boundary, then the coordinator that uses it
    engine::bind_device_control(m);
    engine::bind_refresh_coordinator(m);

    m.def("derive_channel_names", &engine::derive_channel_names, py::arg("stream"),
          "Ordered channel labels for an AES67 stream.");
    m.def("gain_direction_for_model", &engine::gain_direction_for_model, py::arg("model_id"));

    // --- Constants ---
    m.attr("SUBSCRIPTION_NONE") = engine::kSubscriptionNone;
    m.attr("AES67_OPTION_PREFIX") = engine::kAes67OptionPrefix;
    m.attr("SAMPLE_RATES") = engine::kSampleRates;
    m.attr("SAMPLE_RATE_LABELS") = engine::kSampleRateLabels;
    m.attr("ENCODINGS") = engine::kEncodings;
    m.attr("ENCODING_LABELS") = engine::kEncodingLabels;
    m.attr("GAIN_LABELS_INPUT") = engine::kGainLabelsInput;
    m.attr("GAIN_LABELS_OUTPUT") = engine::kGainLabelsOutput;
    m.attr("AVIO_INPUT_MODELS") = engine::kAvioInputModels;
    m.attr("AVIO_OUTPUT_MODELS") = engine::kAvioOutputModels;
    m.attr("MIN_LATENCY_MS") = engine::kMinLatencyMs;
    m.attr("MAX_LATENCY_MS") = engine::kMaxLatencyMs;
    m.attr("SERVICE_TYPES") = engine::DiscoveryTuning().service_types;
}
