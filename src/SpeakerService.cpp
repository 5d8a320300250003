/**
 * @file SpeakerService.cpp
 * @brief Speaker service implementation
 */

#include "SpeakerService.h"
#include "LogLevel.h"
#include "PlaybackBackend.h"
#include "ScopedPaths.h"

#include <exception>

SpeakerService::SpeakerService(CastBrowser& connectBrowser, CastBrowser& discoveryBrowser,
                               CastSessionFactory* factory, ServiceOptions options)
    : m_options(std::move(options))
    , m_connections(connectBrowser, factory, m_options.connection)
    , m_controller(m_connections, m_options.playback)
    , m_localPlayer(m_options.localPlayer)
    , m_discovery(discoveryBrowser, m_options.withLocal)
    , m_pool(m_options.workers)
{
}

SpeakerService::~SpeakerService() {
    shutdown();
}

// ============================================
// Asynchronous API
// ============================================

std::future<bool> SpeakerService::play(const Device& device, const std::string& path) {
    // Resolved now: a cast play in flight may have moved the working directory
    std::string resolved = ScopedWorkingDirectory::absoluteFromCaller(path);
    return m_pool.submit([this, device, path = std::move(resolved)]() {
        return playBlocking(device, path);
    });
}

std::future<bool> SpeakerService::connect(const Device& device) {
    return m_pool.submit([this, device]() {
        return connectBlocking(device);
    });
}

std::future<std::vector<Device>> SpeakerService::discover(std::chrono::milliseconds timeout) {
    return m_pool.submit([this, timeout]() {
        return m_discovery.discover(timeout);
    });
}

bool SpeakerService::isConnectedTo(const std::string& deviceId) {
    return m_connections.activeFor(deviceId) != nullptr;
}

void SpeakerService::shutdown() {
    if (m_shutdown.exchange(true)) {
        return;
    }
    m_pool.shutdown();
    m_connections.disconnect();
}

// ============================================
// Worker-side operations
// ============================================

bool SpeakerService::playBlocking(const Device& device, const std::string& path) {
    try {
        std::unique_ptr<PlaybackBackend> backend =
            PlaybackBackend::create(device, m_controller, m_localPlayer);
        if (!backend) {
            LOG_ERROR("No playback backend for " << deviceTypeName(device.type));
            return false;
        }

        if (backend->usesConnection()) {
            std::lock_guard<std::mutex> lock(m_opMutex);
            return backend->play(path);
        }
        return backend->play(path);
    } catch (const std::exception& e) {
        LOG_ERROR("Playback on " << device.name << " failed: " << e.what());
        return false;
    }
}

bool SpeakerService::connectBlocking(const Device& device) {
    if (!device.isNetworked()) {
        LOG_ERROR(device.name << " is played locally and has no connection");
        return false;
    }

    std::lock_guard<std::mutex> lock(m_opMutex);
    if (m_connections.activeFor(device.id)) {
        LOG_INFO("Already connected to " << device.name);
        return true;
    }
    return m_connections.connect(device, m_options.playback.connectTimeout);
}
