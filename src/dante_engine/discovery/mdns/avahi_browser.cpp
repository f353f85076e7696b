#include "avahi_browser.h"

#include "../../utils/cpp_logger.h"
#include "../service_resolver.h"

#include <avahi-client/client.h>
#include <avahi-client/lookup.h>
#include <avahi-common/address.h>
#include <avahi-common/error.h>
#include <avahi-common/malloc.h>
#include <avahi-common/simple-watch.h>
#include <avahi-common/strlst.h>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <map>
#include <memory>

namespace dantebridge {
namespace engine {
namespace mdns {

namespace {

constexpr long kDefaultPollSliceMs = 100;

struct SimplePollDeleter {
    void operator()(AvahiSimplePoll* poll) const { avahi_simple_poll_free(poll); }
};
struct ClientDeleter {
    void operator()(AvahiClient* client) const { avahi_client_free(client); }
};
struct ServiceBrowserDeleter {
    void operator()(AvahiServiceBrowser* browser) const { avahi_service_browser_free(browser); }
};
struct ServiceResolverDeleter {
    void operator()(AvahiServiceResolver* resolver) const { avahi_service_resolver_free(resolver); }
};

using SimplePollHandle = std::unique_ptr<AvahiSimplePoll, SimplePollDeleter>;
using ClientHandle = std::unique_ptr<AvahiClient, ClientDeleter>;
using ServiceBrowserHandle = std::unique_ptr<AvahiServiceBrowser, ServiceBrowserDeleter>;
using ServiceResolverHandle = std::unique_ptr<AvahiServiceResolver, ServiceResolverDeleter>;

struct ClientStatus {
    bool failed = false;
    std::string error;
};

struct BrowsePass;

struct PendingResolve {
    BrowsePass* pass = nullptr;
    std::size_t slot = 0;
    ServiceResolverHandle resolver;
    std::chrono::steady_clock::time_point started;
    bool finished = false;
};

struct TypeBrowse {
    BrowsePass* pass = nullptr;
    std::string service_type;  // as configured, with the ".local." suffix
};

// State shared by the callbacks of one browse() call.
struct BrowsePass {
    std::string logger_prefix;
    AvahiClient* client = nullptr;
    bool accepting = true;
    bool failed = false;
    std::string error;
    std::vector<RawServiceAnnouncement> found;
    std::map<std::pair<std::string, std::string>, std::size_t> slots;  // (type, instance) -> found index
    std::vector<std::unique_ptr<PendingResolve>> resolves;
};

void append_unique(std::vector<std::string>& values, const std::string& value) {
    if (std::find(values.begin(), values.end(), value) == values.end()) {
        values.push_back(value);
    }
}

void on_client_state(AvahiClient* client, AvahiClientState state, void* userdata) {
    auto* status = static_cast<ClientStatus*>(userdata);
    if (state == AVAHI_CLIENT_FAILURE) {
        status->failed = true;
        status->error = avahi_strerror(avahi_client_errno(client));
    }
}

void on_resolved(AvahiServiceResolver*, AvahiIfIndex, AvahiProtocol, AvahiResolverEvent event,
                 const char* name, const char*, const char*, const char* host_name,
                 const AvahiAddress* address, uint16_t port, AvahiStringList* txt,
                 AvahiLookupResultFlags, void* userdata) {
    auto* pending = static_cast<PendingResolve*>(userdata);
    BrowsePass* pass = pending->pass;
    pending->finished = true;

    if (event != AVAHI_RESOLVER_FOUND) {
        LOG_CPP_DEBUG("%s Resolve failed for %s: %s", pass->logger_prefix.c_str(), name ? name : "?",
                      avahi_strerror(avahi_client_errno(pass->client)));
        return;
    }

    RawServiceAnnouncement& announcement = pass->found[pending->slot];
    announcement.resolved = true;
    announcement.host = host_name ? host_name : "";
    announcement.port = port;
    if (address && address->proto == AVAHI_PROTO_INET) {
        char text[AVAHI_ADDRESS_STR_MAX];
        avahi_address_snprint(text, sizeof(text), address);
        append_unique(announcement.ipv4_addresses, text);
    }
    announcement.txt = decode_txt_list(txt);
}

void on_browse_event(AvahiServiceBrowser*, AvahiIfIndex interface, AvahiProtocol protocol,
                     AvahiBrowserEvent event, const char* name, const char* type, const char* domain,
                     AvahiLookupResultFlags, void* userdata) {
    auto* context = static_cast<TypeBrowse*>(userdata);
    BrowsePass* pass = context->pass;

    switch (event) {
        case AVAHI_BROWSER_NEW: {
            if (!pass->accepting || !name) {
                break;
            }
            const auto key = std::make_pair(context->service_type, std::string(name));
            if (pass->slots.count(key)) {
                break;
            }

            RawServiceAnnouncement announcement;
            announcement.service_type = context->service_type;
            announcement.instance_name = std::string(name) + "." + context->service_type;
            const std::size_t slot = pass->found.size();
            pass->slots[key] = slot;
            pass->found.push_back(std::move(announcement));

            auto pending = std::make_unique<PendingResolve>();
            pending->pass = pass;
            pending->slot = slot;
            pending->started = std::chrono::steady_clock::now();
            pending->resolver.reset(avahi_service_resolver_new(pass->client, interface, protocol, name, type, domain,
                                                               AVAHI_PROTO_INET, static_cast<AvahiLookupFlags>(0),
                                                               on_resolved, pending.get()));
            if (!pending->resolver) {
                LOG_CPP_WARNING("%s Could not start resolver for %s: %s", pass->logger_prefix.c_str(), name,
                                avahi_strerror(avahi_client_errno(pass->client)));
                break;
            }
            pass->resolves.push_back(std::move(pending));
            break;
        }
        case AVAHI_BROWSER_FAILURE:
            pass->failed = true;
            pass->error = std::string("service browser for ") + context->service_type + " failed: " +
                          avahi_strerror(avahi_client_errno(pass->client));
            break;
        case AVAHI_BROWSER_REMOVE:
        case AVAHI_BROWSER_ALL_FOR_NOW:
        case AVAHI_BROWSER_CACHE_EXHAUSTED:
            break;
    }
}

// Frees resolvers that answered or ran past the resolve timeout.
void reap_resolvers(BrowsePass& pass, std::chrono::steady_clock::time_point now, long resolve_ms) {
    auto& resolves = pass.resolves;
    resolves.erase(std::remove_if(resolves.begin(), resolves.end(),
                                  [&](const std::unique_ptr<PendingResolve>& pending) {
                                      if (pending->finished) {
                                          return true;
                                      }
                                      if (now - pending->started >= std::chrono::milliseconds(resolve_ms)) {
                                          LOG_CPP_DEBUG("%s Resolve timed out for %s", pass.logger_prefix.c_str(),
                                                        pass.found[pending->slot].instance_name.c_str());
                                          return true;
                                      }
                                      return false;
                                  }),
                   resolves.end());
}

} // namespace

std::string avahi_browse_type(const std::string& service_type) {
    return normalize_server_name(service_type);
}

std::vector<std::pair<std::string, std::string>> decode_txt_list(AvahiStringList* txt) {
    std::vector<std::pair<std::string, std::string>> entries;
    for (AvahiStringList* item = txt; item; item = avahi_string_list_get_next(item)) {
        char* key = nullptr;
        char* value = nullptr;
        size_t size = 0;
        if (avahi_string_list_get_pair(item, &key, &value, &size) != 0) {
            continue;
        }
        entries.emplace_back(key ? std::string(key) : std::string(),
                             value ? std::string(value, size) : std::string());
        avahi_free(key);
        avahi_free(value);
    }
    return entries;
}

AvahiBrowser::AvahiBrowser(std::string logger_prefix, DiscoveryTuning tuning)
    : logger_prefix_(std::move(logger_prefix)),
      tuning_(std::move(tuning)) {}

int AvahiBrowser::browse_interface() const {
    if (tuning_.interface_ipv4.empty()) {
        return AVAHI_IF_UNSPEC;
    }

    in_addr wanted;
    if (inet_pton(AF_INET, tuning_.interface_ipv4.c_str(), &wanted) != 1) {
        LOG_CPP_WARNING("%s Ignoring invalid interface address %s", logger_prefix_.c_str(),
                        tuning_.interface_ipv4.c_str());
        return AVAHI_IF_UNSPEC;
    }

    struct ifaddrs* ifas = nullptr;
    if (getifaddrs(&ifas) != 0) {
        LOG_CPP_WARNING("%s getifaddrs() failed: %s", logger_prefix_.c_str(), strerror(errno));
        return AVAHI_IF_UNSPEC;
    }
    int index = AVAHI_IF_UNSPEC;
    for (auto* it = ifas; it; it = it->ifa_next) {
        if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if (reinterpret_cast<struct sockaddr_in*>(it->ifa_addr)->sin_addr.s_addr == wanted.s_addr) {
            const unsigned int found = if_nametoindex(it->ifa_name);
            if (found != 0) {
                index = static_cast<int>(found);
            }
            break;
        }
    }
    freeifaddrs(ifas);

    if (index == AVAHI_IF_UNSPEC) {
        LOG_CPP_WARNING("%s No interface carries %s, browsing all interfaces", logger_prefix_.c_str(),
                        tuning_.interface_ipv4.c_str());
    }
    return index;
}

bool AvahiBrowser::browse(std::vector<RawServiceAnnouncement>& announcements, std::string& error) {
    announcements.clear();

    // Declaration order matters: browsers and resolvers must go before the client.
    ClientStatus status;
    SimplePollHandle poll(avahi_simple_poll_new());
    if (!poll) {
        error = "could not create the avahi event loop";
        LOG_CPP_ERROR("%s mDNS browse unavailable: %s", logger_prefix_.c_str(), error.c_str());
        return false;
    }

    int client_error = 0;
    ClientHandle client(avahi_client_new(avahi_simple_poll_get(poll.get()), static_cast<AvahiClientFlags>(0),
                                         on_client_state, &status, &client_error));
    if (!client) {
        error = std::string("avahi client unavailable: ") + avahi_strerror(client_error);
        LOG_CPP_ERROR("%s mDNS browse unavailable: %s", logger_prefix_.c_str(), error.c_str());
        return false;
    }

    BrowsePass pass;
    pass.logger_prefix = logger_prefix_;
    pass.client = client.get();

    const int iface = browse_interface();
    std::vector<std::unique_ptr<TypeBrowse>> contexts;
    std::vector<ServiceBrowserHandle> browsers;
    for (const auto& service_type : tuning_.service_types) {
        auto context = std::make_unique<TypeBrowse>();
        context->pass = &pass;
        context->service_type = service_type;

        const std::string avahi_type = avahi_browse_type(service_type);
        ServiceBrowserHandle browser(avahi_service_browser_new(client.get(), iface, AVAHI_PROTO_INET,
                                                               avahi_type.c_str(), nullptr,
                                                               static_cast<AvahiLookupFlags>(0),
                                                               on_browse_event, context.get()));
        if (!browser) {
            error = "could not browse " + avahi_type + ": " + avahi_strerror(avahi_client_errno(client.get()));
            LOG_CPP_ERROR("%s mDNS browse unavailable: %s", logger_prefix_.c_str(), error.c_str());
            return false;
        }
        contexts.push_back(std::move(context));
        browsers.push_back(std::move(browser));
    }

    const long window_ms = sanitize_window_ms(tuning_.browse_window_ms, kDefaultBrowseWindowMs);
    const long resolve_ms = sanitize_window_ms(tuning_.resolve_timeout_ms, kDefaultResolveTimeoutMs);
    const long slice_ms = sanitize_window_ms(tuning_.poll_slice_ms, kDefaultPollSliceMs);
    const auto window_end = std::chrono::steady_clock::now() + std::chrono::milliseconds(window_ms);

    while (!status.failed && !pass.failed) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= window_end) {
            pass.accepting = false;
        }
        reap_resolvers(pass, now, resolve_ms);
        if (!pass.accepting && pass.resolves.empty()) {
            break;
        }

        long wait_ms = slice_ms;
        if (pass.accepting) {
            const long remaining = static_cast<long>(
                std::chrono::duration_cast<std::chrono::milliseconds>(window_end - now).count());
            wait_ms = std::min(wait_ms, std::max(remaining, 0L));
        }
        const int rc = avahi_simple_poll_iterate(poll.get(), static_cast<int>(wait_ms));
        if (rc < 0 && errno == EINTR) {
            continue;
        }
        if (rc != 0) {
            pass.failed = true;
            pass.error = "avahi event loop stopped";
        }
    }

    if (status.failed || pass.failed) {
        error = status.failed ? "avahi client failed: " + status.error : pass.error;
        LOG_CPP_ERROR("%s mDNS browse unavailable: %s", logger_prefix_.c_str(), error.c_str());
        return false;
    }

    announcements = std::move(pass.found);
    LOG_CPP_DEBUG("%s Browse found %zu service instance(s)", logger_prefix_.c_str(), announcements.size());
    return true;
}

} // namespace mdns
} // namespace engine
} // namespace dantebridge
