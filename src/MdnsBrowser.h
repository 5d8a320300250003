/**
 * @file MdnsBrowser.h
 * @brief Cast device browser on the Avahi client API
 *
 * Browses _googlecast._tcp through the local avahi-daemon and resolves
 * every instance it announces. The TXT "id" is the stable uuid; "fn" is
 * the friendly name and "md" the model.
 */

#ifndef CASTSPEAK_MDNS_BROWSER_H
#define CASTSPEAK_MDNS_BROWSER_H

#include "CastSession.h"

#include <avahi-common/strlst.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

constexpr const char* CAST_SERVICE_TYPE = "_googlecast._tcp";
constexpr uint16_t CAST_DEFAULT_PORT = 8009;

/**
 * @brief One resolved service instance, as Avahi reports it
 */
struct ResolvedService {
    std::string name;           // instance name
    std::string hostName;       // e.g. "Kitchen-speaker.local"
    std::string address;        // IPv4 text form
    uint16_t port = 0;
    std::map<std::string, std::string> txt;
};

class MdnsBrowser : public CastBrowser {
public:
    explicit MdnsBrowser(std::string serviceType = CAST_SERVICE_TYPE);
    ~MdnsBrowser() override;

    MdnsBrowser(const MdnsBrowser&) = delete;
    MdnsBrowser& operator=(const MdnsBrowser&) = delete;

    /**
     * @brief Browse and resolve until the timeout or stopDiscovery()
     *
     * If avahi-daemon is not running yet, waits for it within the same
     * timeout. Client failures are logged; whatever was resolved so far
     * is returned.
     */
    std::vector<CastInfo> browse(std::chrono::milliseconds timeout) override;

    /**
     * @brief End the running browse at its next poll slice
     *
     * A request made while no browse is running is dropped, so the
     * after-browse cleanup call never cuts a later browse short.
     */
    void stopDiscovery() override;

    bool browsing() const;
    bool stopPending() const;

    // ============================================
    // Record helpers (exposed for tests)
    // ============================================

    // key=value TXT entries; keys lowercased, entries without a key skipped
    static std::map<std::string, std::string> txtRecords(AvahiStringList* txt);

    // Cast devices from resolved instances: need a TXT "id", deduped by uuid
    static std::vector<CastInfo> devices(const std::vector<ResolvedService>& services);

    // 32 hex digits -> 8-4-4-4-12 lowercase; anything else unchanged
    static std::string formatUuid(const std::string& id);

private:
    std::string m_serviceType;

    mutable std::mutex m_stateMutex;
    bool m_browsing = false;
    std::atomic<bool> m_stop{false};
};

#endif // CASTSPEAK_MDNS_BROWSER_H
