/**
 * @file MdnsBrowser.cpp
 * @brief DNS-SD browse and resolve through avahi-client
 */

#include "MdnsBrowser.h"
#include "LogLevel.h"

#include <avahi-client/client.h>
#include <avahi-client/lookup.h>
#include <avahi-common/address.h>
#include <avahi-common/error.h>
#include <avahi-common/malloc.h>
#include <avahi-common/simple-watch.h>

#include <algorithm>
#include <cctype>

namespace {

using Clock = std::chrono::steady_clock;

constexpr int POLL_SLICE_MS = 100;

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Shared with the Avahi callbacks of one browse() call
struct BrowseState {
    std::string serviceType;
    AvahiServiceBrowser* browser = nullptr;
    std::vector<ResolvedService> resolved;
    bool failed = false;
};

void onResolved(AvahiServiceResolver* r, AvahiIfIndex, AvahiProtocol,
                AvahiResolverEvent event, const char* name, const char*, const char*,
                const char* hostName, const AvahiAddress* address, uint16_t port,
                AvahiStringList* txt, AvahiLookupResultFlags, void* userdata) {
    auto* state = static_cast<BrowseState*>(userdata);

    if (event == AVAHI_RESOLVER_FOUND && address) {
        char addr[AVAHI_ADDRESS_STR_MAX];
        avahi_address_snprint(addr, sizeof(addr), address);

        ResolvedService svc;
        svc.name = name ? name : "";
        svc.hostName = hostName ? hostName : "";
        svc.address = addr;
        svc.port = port;
        svc.txt = MdnsBrowser::txtRecords(txt);
        LOG_DEBUG("[mDNS] Resolved '" << svc.name << "' at " << svc.address << ":" << port);
        state->resolved.push_back(std::move(svc));
    } else {
        LOG_DEBUG("[mDNS] Resolve of '" << (name ? name : "?") << "' failed: "
                  << avahi_strerror(avahi_client_errno(avahi_service_resolver_get_client(r))));
    }
    avahi_service_resolver_free(r);
}

void onBrowse(AvahiServiceBrowser* b, AvahiIfIndex interface, AvahiProtocol protocol,
              AvahiBrowserEvent event, const char* name, const char* type,
              const char* domain, AvahiLookupResultFlags, void* userdata) {
    auto* state = static_cast<BrowseState*>(userdata);
    AvahiClient* client = avahi_service_browser_get_client(b);

    switch (event) {
        case AVAHI_BROWSER_NEW:
            // IPv4 addresses only: the media URL is built from an IPv4 local address
            if (!avahi_service_resolver_new(client, interface, protocol, name, type, domain,
                                            AVAHI_PROTO_INET, static_cast<AvahiLookupFlags>(0),
                                            onResolved, state)) {
                LOG_WARN("[mDNS] Cannot resolve '" << name << "': "
                         << avahi_strerror(avahi_client_errno(client)));
            }
            break;
        case AVAHI_BROWSER_REMOVE:
            LOG_DEBUG("[mDNS] '" << name << "' went away");
            break;
        case AVAHI_BROWSER_FAILURE:
            LOG_ERROR("[mDNS] Browser failure: " << avahi_strerror(avahi_client_errno(client)));
            state->failed = true;
            break;
        case AVAHI_BROWSER_ALL_FOR_NOW:
        case AVAHI_BROWSER_CACHE_EXHAUSTED:
            break;
    }
}

void onClientEvent(AvahiClient* c, AvahiClientState clientState, void* userdata) {
    auto* state = static_cast<BrowseState*>(userdata);

    switch (clientState) {
        case AVAHI_CLIENT_S_RUNNING:
            if (!state->browser) {
                state->browser = avahi_service_browser_new(
                    c, AVAHI_IF_UNSPEC, AVAHI_PROTO_UNSPEC, state->serviceType.c_str(),
                    nullptr, static_cast<AvahiLookupFlags>(0), onBrowse, state);
                if (!state->browser) {
                    LOG_ERROR("[mDNS] Cannot browse " << state->serviceType << ": "
                              << avahi_strerror(avahi_client_errno(c)));
                    state->failed = true;
                }
            }
            break;
        case AVAHI_CLIENT_CONNECTING:
            LOG_DEBUG("[mDNS] Waiting for avahi-daemon");
            break;
        case AVAHI_CLIENT_FAILURE:
            LOG_ERROR("[mDNS] Avahi client failure: " << avahi_strerror(avahi_client_errno(c)));
            state->failed = true;
            break;
        default:
            break;
    }
}

} // namespace

// ============================================
// Constructor / Destructor
// ============================================

MdnsBrowser::MdnsBrowser(std::string serviceType)
    : m_serviceType(std::move(serviceType))
{
}

MdnsBrowser::~MdnsBrowser() {
    stopDiscovery();
}

// ============================================
// Browse
// ============================================

std::vector<CastInfo> MdnsBrowser::browse(std::chrono::milliseconds timeout) {
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_browsing = true;
    }

    BrowseState state;
    state.serviceType = m_serviceType;

    AvahiSimplePoll* poll = avahi_simple_poll_new();
    AvahiClient* client = nullptr;
    if (!poll) {
        LOG_ERROR("[mDNS] Cannot create Avahi poll object");
    } else {
        int error = 0;
        client = avahi_client_new(avahi_simple_poll_get(poll), AVAHI_CLIENT_NO_FAIL,
                                  onClientEvent, &state, &error);
        if (!client) {
            LOG_ERROR("[mDNS] Avahi client error: " << avahi_strerror(error));
        }
    }

    if (client) {
        LOG_DEBUG("[mDNS] Browsing " << m_serviceType << " for " << timeout.count() << " ms");
        const auto deadline = Clock::now() + timeout;

        while (!state.failed && !m_stop.load(std::memory_order_acquire)) {
            auto now = Clock::now();
            if (now >= deadline) break;

            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            int waitMs = static_cast<int>(std::min<long long>(remaining.count(), POLL_SLICE_MS));

            int ret = avahi_simple_poll_iterate(poll, waitMs);
            if (ret < 0) {
                LOG_ERROR("[mDNS] Avahi poll failed");
                break;
            }
            if (ret > 0) break;     // quit requested
        }
    }

    // Frees the browser and any resolver still pending
    if (client) avahi_client_free(client);
    if (poll) avahi_simple_poll_free(poll);

    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_browsing = false;
        m_stop.store(false, std::memory_order_release);
    }

    std::vector<CastInfo> found = devices(state.resolved);
    LOG_DEBUG("[mDNS] " << found.size() << " device(s) from "
              << state.resolved.size() << " resolved instance(s)");
    return found;
}

void MdnsBrowser::stopDiscovery() {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    if (m_browsing) {
        m_stop.store(true, std::memory_order_release);
    }
}

bool MdnsBrowser::browsing() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_browsing;
}

bool MdnsBrowser::stopPending() const {
    return m_stop.load(std::memory_order_acquire);
}

// ============================================
// Record Helpers
// ============================================

std::map<std::string, std::string> MdnsBrowser::txtRecords(AvahiStringList* txt) {
    std::map<std::string, std::string> out;
    for (AvahiStringList* l = txt; l; l = avahi_string_list_get_next(l)) {
        char* key = nullptr;
        char* value = nullptr;
        if (avahi_string_list_get_pair(l, &key, &value, nullptr) < 0) continue;
        if (key && *key) {
            out[toLower(key)] = value ? value : "";
        }
        avahi_free(key);
        avahi_free(value);
    }
    return out;
}

std::vector<CastInfo> MdnsBrowser::devices(const std::vector<ResolvedService>& services) {
    std::vector<CastInfo> out;

    for (const auto& svc : services) {
        auto id = svc.txt.find("id");
        if (id == svc.txt.end() || id->second.empty()) continue;
        if (svc.address.empty()) continue;

        CastInfo info;
        info.uuid = formatUuid(id->second);

        auto fn = svc.txt.find("fn");
        info.friendlyName = (fn != svc.txt.end() && !fn->second.empty()) ? fn->second : svc.name;

        auto md = svc.txt.find("md");
        if (md != svc.txt.end()) info.model = md->second;

        info.host = svc.address;
        info.port = svc.port ? svc.port : CAST_DEFAULT_PORT;

        // One instance is reported once per interface and protocol
        bool duplicate = std::any_of(out.begin(), out.end(),
                                     [&](const CastInfo& c) { return c.uuid == info.uuid; });
        if (!duplicate) out.push_back(std::move(info));
    }
    return out;
}

std::string MdnsBrowser::formatUuid(const std::string& id) {
    if (id.size() != 32 ||
        !std::all_of(id.begin(), id.end(), [](unsigned char c) { return std::isxdigit(c); })) {
        return id;
    }
    std::string hex = toLower(id);
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}
