/**
 * @file SpeakerService.h
 * @brief Public entry point: play, connect and discover off the caller's thread
 *
 * Owns the connection manager, playback controller, local player and the
 * worker pool. Every blocking operation runs on the pool and is reported
 * through a future. Networked playback and connect hold one service mutex,
 * so at most one operation touching the shared cast connection runs at a
 * time.
 */

#ifndef CASTSPEAK_SPEAKER_SERVICE_H
#define CASTSPEAK_SPEAKER_SERVICE_H

#include "CastSession.h"
#include "ConnectionManager.h"
#include "Device.h"
#include "DeviceDiscovery.h"
#include "LocalPlayer.h"
#include "PlaybackController.h"
#include "WorkerPool.h"

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <string>
#include <vector>

struct ServiceOptions {
    bool withLocal = true;                      // list the local device
    std::vector<std::string> localPlayer;       // empty = LocalPlayer default
    PlaybackTimings playback;
    ConnectionTimings connection;
    size_t workers = 2;
};

class SpeakerService {
public:
    /**
     * @param connectBrowser   Browser used to look devices up on connect
     * @param discoveryBrowser Browser used for listing (may be the same
     *                         object if calls never overlap)
     * @param factory          Cast session factory, may be null
     */
    SpeakerService(CastBrowser& connectBrowser, CastBrowser& discoveryBrowser,
                   CastSessionFactory* factory, ServiceOptions options = ServiceOptions());
    ~SpeakerService();

    SpeakerService(const SpeakerService&) = delete;
    SpeakerService& operator=(const SpeakerService&) = delete;

    /**
     * @brief Play a file on a device
     * @return Future resolving to true on success (never an exception)
     * @throws std::runtime_error after shutdown()
     */
    std::future<bool> play(const Device& device, const std::string& path);

    /**
     * @brief Establish (or confirm) the cast connection to a device
     *
     * Resolves true without reconnecting when the live connection already
     * belongs to this device. The local device cannot be connected.
     */
    std::future<bool> connect(const Device& device);

    std::future<std::vector<Device>> discover(std::chrono::milliseconds timeout);

    bool isConnectedTo(const std::string& deviceId);

    // Finish queued work, then drop the connection (idempotent)
    void shutdown();

    ConnectionManager& connections() { return m_connections; }

private:
    ServiceOptions m_options;
    ConnectionManager m_connections;
    PlaybackController m_controller;
    LocalPlayer m_localPlayer;
    DeviceDiscovery m_discovery;

    std::mutex m_opMutex;
    std::atomic<bool> m_shutdown{false};

    // Last: workers stop before the members they use are destroyed
    WorkerPool m_pool;

    bool playBlocking(const Device& device, const std::string& path);
    bool connectBlocking(const Device& device);
};

#endif // CASTSPEAK_SPEAKER_SERVICE_H
