/**
 * @file ConnectionManager.h
 * @brief Owner of the single live cast connection
 *
 * Keeps at most one control session open (to the most recently used
 * device) so back-to-back playbacks skip discovery and session setup.
 * Invariant: a device id is recorded if and only if a session handle is
 * held. Every operation runs under one mutex.
 */

#ifndef CASTSPEAK_CONNECTION_MANAGER_H
#define CASTSPEAK_CONNECTION_MANAGER_H

#include "CastSession.h"
#include "Device.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

struct ConnectionTimings {
    std::chrono::milliseconds readyTimeout{10000};   // session-ready wait
    std::chrono::milliseconds stabilizeDelay{1000};  // after ready, before use
};

class ConnectionManager {
public:
    /**
     * @param browser Device browser used for id lookup
     * @param factory Session factory, may be null if no cast transport is
     *                available (connect() then always fails)
     */
    ConnectionManager(CastBrowser& browser, CastSessionFactory* factory,
                      ConnectionTimings timings = ConnectionTimings());
    ~ConnectionManager();

    // Non-copyable
    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Connect to a cast device
     *
     * No-op success if already connected to the same device id. A
     * connection to a different device is released first. On any failure
     * the manager is left with no connection at all.
     *
     * @param timeout Browse time allowed for finding the device
     */
    bool connect(const Device& device, std::chrono::milliseconds timeout);

    // Idempotent; always ends in the no-connection state
    void disconnect();

    // Live probe of the held session (probe errors count as disconnected)
    bool isConnected();

    // Session handle if isConnected(), null otherwise
    std::shared_ptr<CastSession> active();

    // Session handle only if live and owned by deviceId
    std::shared_ptr<CastSession> activeFor(const std::string& deviceId);

    // Id of the device the held handle belongs to (empty if none)
    std::string activeDeviceId() const;

    // False when built without a session factory: connect() always fails
    bool hasTransport() const { return m_factory != nullptr; }

private:
    CastBrowser& m_browser;
    CastSessionFactory* m_factory;
    ConnectionTimings m_timings;

    std::mutex m_connectMutex;          // serializes connect()
    mutable std::mutex m_mutex;         // guards the state below
    std::shared_ptr<CastSession> m_session;
    std::string m_deviceId;
    bool m_connected = false;
    bool m_browsing = false;
    uint64_t m_generation = 0;          // bumped by every disconnect

    void disconnectLocked();
    void abandonConnect(std::unique_ptr<CastSession> session);
    bool isConnectedLocked();
};

#endif // CASTSPEAK_CONNECTION_MANAGER_H
