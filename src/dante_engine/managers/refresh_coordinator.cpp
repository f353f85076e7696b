#include "refresh_coordinator.h"
#include "../dante_constants.h"
#include "../discovery/device_consolidator.h"
#include "../discovery/mdns/avahi_browser.h"
#include "../discovery/service_resolver.h"
#include "../reconciliation/aes67_reconciler.h"
#include "../sap/sap_listener.h"
#include "../sap/sap_parser.h"
#include "../utils/cpp_logger.h"
#include <algorithm>
#include <exception>
#include <future>
#include <stdexcept>
#include <utility>

namespace dantebridge {
namespace engine {

namespace {

std::shared_ptr<EngineSettings> settings_or_default(std::shared_ptr<EngineSettings> settings) {
    return settings ? std::move(settings) : std::make_shared<EngineSettings>();
}

DiscoveryTuning effective_discovery_tuning(const std::shared_ptr<EngineSettings>& settings) {
    DiscoveryTuning tuning = settings->discovery;
    tuning.browse_window_ms = resolve_browse_window_ms(settings);
    tuning.resolve_timeout_ms = resolve_resolve_timeout_ms(settings);
    return tuning;
}

SapTuning effective_sap_tuning(const std::shared_ptr<EngineSettings>& settings) {
    SapTuning tuning = settings->sap;
    tuning.listen_window_ms = resolve_sap_window_ms(settings);
    return tuning;
}

Aes67Tuning effective_aes67_tuning(const std::shared_ptr<EngineSettings>& settings) {
    Aes67Tuning tuning = settings->aes67;
    tuning.response_timeout_ms = resolve_aes67_timeout_ms(settings);
    return tuning;
}

void apply_control_state(Device& device, DeviceControlState state) {
    if (!state.name.empty()) {
        device.name = std::move(state.name);
    }
    if (!state.manufacturer.empty()) {
        device.manufacturer = std::move(state.manufacturer);
    }
    if (!state.model.empty()) {
        device.model = std::move(state.model);
    }
    device.rx_channels = std::move(state.rx_channels);
    device.tx_channels = std::move(state.tx_channels);
    device.subscriptions = std::move(state.subscriptions);
}

} // namespace

RefreshCoordinator::RefreshCoordinator(std::shared_ptr<EngineSettings> settings,
                                       DeviceControlFactory control_factory,
                                       std::shared_ptr<IServiceBrowser> browser,
                                       std::shared_ptr<ISapDiscovery> sap,
                                       std::shared_ptr<IAes67Transport> aes67_transport)
    : m_logger_prefix("[RefreshCoordinator]"),
      m_settings(settings_or_default(std::move(settings))),
      m_control_factory(std::move(control_factory)),
      m_browser(std::move(browser)),
      m_sap(std::move(sap)),
      m_aes67_client("[Aes67Command]", effective_aes67_tuning(m_settings), std::move(aes67_transport)),
      m_runner("dante-blocking"),
      m_registry("[DeviceRegistry]", resolve_device_miss_limit(m_settings)) {
    if (!m_control_factory) {
        throw std::invalid_argument("RefreshCoordinator requires a device control factory");
    }
    if (!m_browser) {
        m_browser = std::make_shared<mdns::AvahiBrowser>("[AvahiBrowser]", effective_discovery_tuning(m_settings));
    }
    if (!m_sap) {
        m_sap = std::make_shared<SapListener>("[SapListener]", effective_sap_tuning(m_settings));
    }
    LOG_CPP_INFO("%s Created (browse %ld ms, SAP window %ld ms, miss limit %d).",
                 m_logger_prefix.c_str(), resolve_browse_window_ms(m_settings),
                 resolve_sap_window_ms(m_settings), resolve_device_miss_limit(m_settings));
}

RefreshCoordinator::~RefreshCoordinator() {
    LOG_CPP_INFO("%s Destroyed.", m_logger_prefix.c_str());
}

RefreshOutcome RefreshCoordinator::refresh() {
    std::lock_guard<std::mutex> pass_lock(m_refresh_mutex);
    RefreshOutcome outcome;

    try {
        std::vector<RawServiceAnnouncement> announcements;
        std::string browse_error;
        auto browse_future = m_runner.submit([this, &announcements, &browse_error]() {
            return m_browser->browse(announcements, browse_error);
        });
        if (!browse_future.get()) {
            throw std::runtime_error(browse_error.empty() ? std::string("mDNS browse unavailable") : browse_error);
        }

        const std::vector<ServiceRecord> records = resolve_service_records(announcements, m_logger_prefix);
        const std::map<std::string, Device> hosts =
            consolidate_devices(records, m_settings->discovery.control_service_type, m_logger_prefix);

        DeviceSnapshot result;
        std::map<std::string, RegistryEntry> seen = collect_devices(hosts, result);
        m_registry.apply_pass(std::move(seen));
        outcome.device_count = result.size();

        discover_streams(result, outcome);

        if (m_stream_cache.size() > 0) {
            outcome.reconciled = reconcile_aes67_selections(result, m_stream_cache.all_streams(),
                                                            m_selections, m_logger_prefix);
        }

        {
            std::lock_guard<std::mutex> lock(m_snapshot_mutex);
            m_snapshot = std::move(result);
            m_last_refresh_ok = true;
        }
        outcome.success = true;
        LOG_CPP_INFO("%s Refresh complete: %zu device(s), %zu AES67 stream(s).",
                     m_logger_prefix.c_str(), outcome.device_count, outcome.total_streams);
    } catch (const std::exception& e) {
        outcome.success = false;
        outcome.error = std::string("Error communicating with Dante network: ") + e.what();
        {
            std::lock_guard<std::mutex> lock(m_snapshot_mutex);
            m_last_refresh_ok = false;
        }
        LOG_CPP_ERROR("%s %s", m_logger_prefix.c_str(), outcome.error.c_str());
    }
    return outcome;
}

std::map<std::string, RegistryEntry> RefreshCoordinator::collect_devices(const std::map<std::string, Device>& hosts,
                                                                         DeviceSnapshot& result) {
    struct PendingQuery {
        Device device;
        std::shared_ptr<DeviceControl> control;
        std::future<DeviceControlState> state;
    };

    std::vector<PendingQuery> pending;
    pending.reserve(hosts.size());

    for (const auto& kv : hosts) {
        PendingQuery query;
        query.device = kv.second;
        try {
            query.control = m_control_factory(query.device);
        } catch (const std::exception& e) {
            LOG_CPP_WARNING("%s Failed to create control handle for %s: %s",
                            m_logger_prefix.c_str(), kv.first.c_str(), e.what());
        }
        if (query.control) {
            std::shared_ptr<DeviceControl> control = query.control;
            query.state = m_runner.submit([control]() { return control->get_controls(); });
        }
        pending.push_back(std::move(query));
    }

    std::map<std::string, RegistryEntry> seen;
    for (auto& query : pending) {
        if (query.state.valid()) {
            try {
                apply_control_state(query.device, query.state.get());
            } catch (const std::exception& e) {
                LOG_CPP_WARNING("%s Failed to get controls for %s: %s",
                                m_logger_prefix.c_str(), query.device.display_name().c_str(), e.what());
            }
        }

        const std::string display_name = query.device.display_name();
        if (query.device.name.empty()) {
            query.device.name = display_name;
        }

        RegistryEntry entry;
        entry.device = query.device;
        entry.control = std::move(query.control);
        result[display_name] = std::move(query.device);
        seen[display_name] = std::move(entry);
    }
    return seen;
}

void RefreshCoordinator::discover_streams(const DeviceSnapshot& result, RefreshOutcome& outcome) {
    std::vector<std::string> device_ips;
    for (const auto& kv : result) {
        if (!kv.second.ipv4.empty()) {
            device_ips.push_back(kv.second.ipv4);
        }
    }

    std::string bind_ip;
    if (!m_sap->find_bind_ip(device_ips, bind_ip)) {
        LOG_CPP_WARNING("%s No Dante device IPs found, skipping SAP discovery", m_logger_prefix.c_str());
        outcome.total_streams = m_stream_cache.size();
        return;
    }
    LOG_CPP_DEBUG("%s SAP: bind_ip=%s from %zu devices", m_logger_prefix.c_str(), bind_ip.c_str(), result.size());

    try {
        std::vector<StreamInfo> found;
        auto listen_future = m_runner.submit([this, &bind_ip, &found]() {
            return m_sap->listen(bind_ip, found);
        });
        if (listen_future.get()) {
            outcome.new_streams = m_stream_cache.merge(found);
        } else {
            LOG_CPP_WARNING("%s SAP discovery failed on %s", m_logger_prefix.c_str(), bind_ip.c_str());
        }
    } catch (const std::exception& e) {
        LOG_CPP_WARNING("%s SAP discovery failed: %s", m_logger_prefix.c_str(), e.what());
    }

    outcome.total_streams = m_stream_cache.size();
    LOG_CPP_INFO("%s SAP: found %zu new, %zu total AES67 streams",
                 m_logger_prefix.c_str(), outcome.new_streams, outcome.total_streams);
}

DeviceSnapshot RefreshCoordinator::snapshot() const {
    std::lock_guard<std::mutex> lock(m_snapshot_mutex);
    return m_snapshot;
}

bool RefreshCoordinator::last_refresh_succeeded() const {
    std::lock_guard<std::mutex> lock(m_snapshot_mutex);
    return m_last_refresh_ok;
}

std::vector<std::string> RefreshCoordinator::get_all_tx_channels() const {
    std::vector<std::string> options;
    const DeviceSnapshot devices = snapshot();
    for (const auto& device_kv : devices) {
        for (const auto& ch : device_kv.second.tx_channels) {
            options.push_back(device_kv.first + kSourceSeparator + ch.second.name);
        }
    }
    std::sort(options.begin(), options.end());
    return options;
}

std::vector<std::string> RefreshCoordinator::get_all_aes67_sources() const {
    std::vector<std::string> options;
    for (const auto& kv : m_stream_cache.all_streams()) {
        for (const auto& channel_name : derive_channel_names(kv.second)) {
            options.push_back(make_aes67_option(kv.first, channel_name));
        }
    }
    return options;
}

bool RefreshCoordinator::get_aes67_stream_info(const std::string& option, StreamInfo& stream, int& flow_channel) const {
    const std::string prefix = kAes67OptionPrefix;
    if (option.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    const std::string rest = option.substr(prefix.size());
    const std::string separator = kSourceSeparator;
    const auto split = rest.rfind(separator);
    if (split == std::string::npos) {
        return false;
    }
    const std::string stream_name = rest.substr(0, split);
    const std::string channel_name = rest.substr(split + separator.size());

    StreamInfo found;
    if (!m_stream_cache.get(stream_name, found)) {
        return false;
    }

    const std::vector<std::string> names = derive_channel_names(found);
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (names[i] == channel_name) {
            stream = std::move(found);
            flow_channel = static_cast<int>(i + 1);
            return true;
        }
    }
    return false;
}

std::string RefreshCoordinator::current_source(const std::string& device_name, int rx_channel) const {
    std::string selected;
    if (m_selections.get(device_name, rx_channel, selected) && !selected.empty()) {
        return selected;
    }

    std::lock_guard<std::mutex> lock(m_snapshot_mutex);
    auto device_it = m_snapshot.find(device_name);
    if (device_it == m_snapshot.end()) {
        return kSubscriptionNone;
    }
    const Device& device = device_it->second;
    auto rx_it = device.rx_channels.find(rx_channel);
    if (rx_it == device.rx_channels.end()) {
        return kSubscriptionNone;
    }

    for (const auto& sub : device.subscriptions) {
        if (sub.rx_channel_name == rx_it->second.name &&
            !sub.tx_device_name.empty() && !sub.tx_channel_name.empty()) {
            return sub.tx_device_name + kSourceSeparator + sub.tx_channel_name;
        }
    }
    return kSubscriptionNone;
}

ControlResult RefreshCoordinator::select_source(const std::string& device_name, int rx_channel, const std::string& option) {
    RegistryEntry rx_entry;
    if (!m_registry.get(device_name, rx_entry)) {
        LOG_CPP_ERROR("%s Device not found: %s", m_logger_prefix.c_str(), device_name.c_str());
        return ControlResult::failure("device not found: " + device_name);
    }
    auto rx_it = rx_entry.device.rx_channels.find(rx_channel);
    if (rx_it == rx_entry.device.rx_channels.end()) {
        LOG_CPP_ERROR("%s RX channel %d not found on %s", m_logger_prefix.c_str(), rx_channel, device_name.c_str());
        return ControlResult::failure("rx channel not found: " + std::to_string(rx_channel));
    }
    const ChannelInfo rx_info = rx_it->second;

    if (option == kSubscriptionNone) {
        m_selections.erase(device_name, rx_channel);
        return run_control(device_name, "remove subscription", [rx_info](DeviceControl& control, const Device&) {
            control.remove_subscription(rx_info);
        });
    }

    if (option.compare(0, std::string(kAes67OptionPrefix).size(), kAes67OptionPrefix) == 0) {
        StreamInfo stream;
        int flow_channel = 0;
        if (!get_aes67_stream_info(option, stream, flow_channel)) {
            LOG_CPP_ERROR("%s AES67 stream not found for option: %s", m_logger_prefix.c_str(), option.c_str());
            return ControlResult::failure("AES67 stream not found: " + option);
        }

        const Aes67SubscribeResult result = subscribe_aes67(device_name, rx_channel, flow_channel, stream);
        if (!result.ok()) {
            LOG_CPP_ERROR("%s AES67 subscribe failed for %s ch %d -> %s (%s)",
                          m_logger_prefix.c_str(), device_name.c_str(), rx_channel, option.c_str(),
                          to_string(result.outcome));
            return ControlResult::failure(std::string(to_string(result.outcome)) +
                                          (result.detail.empty() ? "" : ": " + result.detail));
        }
        m_selections.set(device_name, rx_channel, option);
        LOG_CPP_INFO("%s AES67 subscribed %s ch %d -> %s (flow ch %d)",
                     m_logger_prefix.c_str(), device_name.c_str(), rx_channel, option.c_str(), flow_channel);
        return ControlResult::success();
    }

    // A Dante source replaces any AES67 selection.
    m_selections.erase(device_name, rx_channel);

    const std::string separator = kSourceSeparator;
    const auto split = option.find(separator);
    if (split == std::string::npos) {
        return ControlResult::failure("unrecognized source: " + option);
    }
    const std::string tx_device_name = option.substr(0, split);
    const std::string tx_channel_name = option.substr(split + separator.size());

    RegistryEntry tx_entry;
    if (!m_registry.get(tx_device_name, tx_entry)) {
        LOG_CPP_ERROR("%s TX device not found: %s", m_logger_prefix.c_str(), tx_device_name.c_str());
        return ControlResult::failure("tx device not found: " + tx_device_name);
    }
    const ChannelInfo* tx_info = nullptr;
    for (const auto& ch : tx_entry.device.tx_channels) {
        if (ch.second.name == tx_channel_name) {
            tx_info = &ch.second;
            break;
        }
    }
    if (!tx_info) {
        LOG_CPP_ERROR("%s TX channel %s not found on %s",
                      m_logger_prefix.c_str(), tx_channel_name.c_str(), tx_device_name.c_str());
        return ControlResult::failure("tx channel not found: " + tx_channel_name);
    }

    const ChannelInfo tx_copy = *tx_info;
    return run_control(device_name, "add subscription",
                       [rx_info, tx_copy, tx_device_name](DeviceControl& control, const Device&) {
                           control.add_subscription(rx_info, tx_copy, tx_device_name);
                       });
}

ControlResult RefreshCoordinator::add_subscription(const std::string& rx_device_name, int rx_channel,
                                                   const std::string& tx_device_name, int tx_channel) {
    RegistryEntry rx_entry;
    RegistryEntry tx_entry;
    if (!m_registry.get(rx_device_name, rx_entry) || !m_registry.get(tx_device_name, tx_entry)) {
        LOG_CPP_ERROR("%s Device not found: rx=%s tx=%s",
                      m_logger_prefix.c_str(), rx_device_name.c_str(), tx_device_name.c_str());
        return ControlResult::failure("device not found");
    }

    auto rx_it = rx_entry.device.rx_channels.find(rx_channel);
    auto tx_it = tx_entry.device.tx_channels.find(tx_channel);
    if (rx_it == rx_entry.device.rx_channels.end() || tx_it == tx_entry.device.tx_channels.end()) {
        LOG_CPP_ERROR("%s Channel not found: rx=%d tx=%d", m_logger_prefix.c_str(), rx_channel, tx_channel);
        return ControlResult::failure("channel not found");
    }

    const ChannelInfo rx_info = rx_it->second;
    const ChannelInfo tx_info = tx_it->second;
    const std::string tx_name = tx_entry.device.display_name();
    return run_control(rx_device_name, "add subscription",
                       [rx_info, tx_info, tx_name](DeviceControl& control, const Device&) {
                           control.add_subscription(rx_info, tx_info, tx_name);
                       });
}

ControlResult RefreshCoordinator::remove_subscription(const std::string& rx_device_name, int rx_channel) {
    RegistryEntry rx_entry;
    if (!m_registry.get(rx_device_name, rx_entry)) {
        LOG_CPP_ERROR("%s Device not found: %s", m_logger_prefix.c_str(), rx_device_name.c_str());
        return ControlResult::failure("device not found: " + rx_device_name);
    }
    auto rx_it = rx_entry.device.rx_channels.find(rx_channel);
    if (rx_it == rx_entry.device.rx_channels.end()) {
        LOG_CPP_ERROR("%s Channel not found: %d", m_logger_prefix.c_str(), rx_channel);
        return ControlResult::failure("channel not found: " + std::to_string(rx_channel));
    }
    const ChannelInfo rx_info = rx_it->second;
    return run_control(rx_device_name, "remove subscription", [rx_info](DeviceControl& control, const Device&) {
        control.remove_subscription(rx_info);
    });
}

ControlResult RefreshCoordinator::identify(const std::string& device_name) {
    return run_control(device_name, "identify", [](DeviceControl& control, const Device&) {
        control.identify();
    });
}

ControlResult RefreshCoordinator::set_sample_rate(const std::string& device_name, int sample_rate) {
    if (std::find(kSampleRates.begin(), kSampleRates.end(), sample_rate) == kSampleRates.end()) {
        LOG_CPP_WARNING("%s Unsupported sample rate %d for %s", m_logger_prefix.c_str(), sample_rate, device_name.c_str());
        return ControlResult::failure("unsupported sample rate: " + std::to_string(sample_rate));
    }
    return run_control(device_name, "set sample rate", [sample_rate](DeviceControl& control, const Device&) {
        control.set_sample_rate(sample_rate);
    });
}

ControlResult RefreshCoordinator::set_encoding(const std::string& device_name, int bits) {
    if (std::find(kEncodings.begin(), kEncodings.end(), bits) == kEncodings.end()) {
        LOG_CPP_WARNING("%s Unsupported encoding %d for %s", m_logger_prefix.c_str(), bits, device_name.c_str());
        return ControlResult::failure("unsupported encoding: " + std::to_string(bits));
    }
    return run_control(device_name, "set encoding", [bits](DeviceControl& control, const Device&) {
        control.set_encoding(bits);
    });
}

ControlResult RefreshCoordinator::set_latency(const std::string& device_name, double latency_ms) {
    if (latency_ms < kMinLatencyMs || latency_ms > kMaxLatencyMs) {
        LOG_CPP_WARNING("%s Latency %.3f ms out of range for %s", m_logger_prefix.c_str(), latency_ms, device_name.c_str());
        return ControlResult::failure("latency out of range");
    }
    return run_control(device_name, "set latency", [latency_ms](DeviceControl& control, const Device&) {
        control.set_latency(latency_ms);
    });
}

ControlResult RefreshCoordinator::set_gain_level(const std::string& device_name, int channel, int level) {
    if (level < kMinGainLevel || level > kMaxGainLevel) {
        LOG_CPP_WARNING("%s Gain level %d out of range for %s", m_logger_prefix.c_str(), level, device_name.c_str());
        return ControlResult::failure("gain level out of range: " + std::to_string(level));
    }
    return run_control(device_name, "set gain", [channel, level](DeviceControl& control, const Device& device) {
        const std::string direction = gain_direction_for_model(device.model_id);
        if (direction.empty()) {
            throw std::runtime_error("model '" + device.model_id + "' has no adjustable gain");
        }
        control.set_gain_level(channel, level, direction);
    });
}

ControlResult RefreshCoordinator::set_aes67_mode(const std::string& device_name, bool enabled) {
    return run_control(device_name, "set AES67 mode", [enabled](DeviceControl& control, const Device&) {
        if (!control.supports_aes67_mode()) {
            throw std::runtime_error("AES67 toggle not supported by the control client");
        }
        control.set_aes67(enabled);
    });
}

Aes67SubscribeResult RefreshCoordinator::subscribe_aes67(const std::string& device_name, int rx_channel,
                                                         int flow_channel, const StreamInfo& stream) {
    Aes67SubscribeResult result;
    RegistryEntry entry;
    if (!m_registry.get(device_name, entry) || entry.device.ipv4.empty()) {
        LOG_CPP_ERROR("%s No IP for device %s", m_logger_prefix.c_str(), device_name.c_str());
        result.outcome = Aes67Outcome::SocketError;
        result.detail = "no address for device " + device_name;
        return result;
    }
    if (rx_channel < 0 || rx_channel > 0xFFFF || flow_channel < 0 || flow_channel > 0xFF) {
        result.outcome = Aes67Outcome::SocketError;
        result.detail = "channel number out of range";
        return result;
    }

    const std::string device_ip = entry.device.ipv4;
    try {
        return m_runner.run([this, device_ip, rx_channel, flow_channel, stream]() {
            return m_aes67_client.subscribe(device_ip, static_cast<uint16_t>(rx_channel),
                                            static_cast<uint8_t>(flow_channel), stream);
        });
    } catch (const std::exception& e) {
        LOG_CPP_ERROR("%s AES67 subscribe error for %s ch %d: %s",
                      m_logger_prefix.c_str(), device_name.c_str(), rx_channel, e.what());
        result.outcome = Aes67Outcome::SocketError;
        result.detail = e.what();
        return result;
    }
}

ControlResult RefreshCoordinator::run_control(const std::string& device_name, const std::string& action,
                                              const ControlAction& fn) {
    RegistryEntry entry;
    if (!m_registry.get(device_name, entry)) {
        LOG_CPP_ERROR("%s Device not found: %s", m_logger_prefix.c_str(), device_name.c_str());
        return ControlResult::failure("device not found: " + device_name);
    }
    if (!entry.control) {
        LOG_CPP_ERROR("%s No control handle for %s", m_logger_prefix.c_str(), device_name.c_str());
        return ControlResult::failure("no control handle for " + device_name);
    }

    try {
        fn(*entry.control, entry.device);
    } catch (const std::exception& e) {
        LOG_CPP_ERROR("%s Failed to %s on %s: %s",
                      m_logger_prefix.c_str(), action.c_str(), device_name.c_str(), e.what());
        return ControlResult::failure(e.what());
    }
    return ControlResult::success();
}

} // namespace engine
} // namespace dantebridge
