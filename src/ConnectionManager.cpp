/**
 * @file ConnectionManager.cpp
 * @brief Cast connection lifecycle
 */

#include "ConnectionManager.h"
#include "LogLevel.h"

#include <exception>
#include <thread>

// ============================================
// Constructor / Destructor
// ============================================

ConnectionManager::ConnectionManager(CastBrowser& browser, CastSessionFactory* factory,
                                     ConnectionTimings timings)
    : m_browser(browser)
    , m_factory(factory)
    , m_timings(timings)
{
}

ConnectionManager::~ConnectionManager() {
    std::lock_guard<std::mutex> lock(m_mutex);
    disconnectLocked();
}

// ============================================
// Connection Management
// ============================================

bool ConnectionManager::connect(const Device& device, std::chrono::milliseconds timeout) {
    if (!device.isNetworked()) {
        LOG_ERROR("[Cast] " << device.name << " is not a cast device");
        return false;
    }

    // One connect at a time; m_mutex is only held while state changes, so
    // queries never wait for a browse or the ready wait
    std::lock_guard<std::mutex> connectLock(m_connectMutex);

    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_session && m_connected && m_deviceId == device.id) {
            LOG_DEBUG("[Cast] Already connected to " << device.name);
            return true;
        }

        // Release the previous device before looking for the new one
        if (!m_deviceId.empty() || m_session) {
            disconnectLocked();
        }
        m_browsing = true;
        generation = m_generation;
    }

    std::unique_ptr<CastSession> opened;
    try {
        LOG_INFO("Connecting to " << device.name << "...");

        std::vector<CastInfo> found = m_browser.browse(timeout);

        const CastInfo* match = nullptr;
        for (const auto& info : found) {
            if (info.uuid == device.id) {
                match = &info;
                break;
            }
        }

        if (!match) {
            LOG_ERROR("[Cast] Device not found: " << device.name
                      << " (" << found.size() << " device(s) seen)");
            abandonConnect(nullptr);
            return false;
        }

        if (!m_factory) {
            LOG_ERROR("[Cast] No cast session transport available");
            abandonConnect(nullptr);
            return false;
        }

        opened = m_factory->open(*match);
        if (!opened) {
            LOG_ERROR("[Cast] Could not open a session to " << match->host);
            abandonConnect(nullptr);
            return false;
        }

        if (!opened->wait(m_timings.readyTimeout)) {
            LOG_ERROR("[Cast] " << device.name << " not ready after "
                      << m_timings.readyTimeout.count() << " ms");
            abandonConnect(std::move(opened));
            return false;
        }

        // Give the receiver a moment before the first command
        std::this_thread::sleep_for(m_timings.stabilizeDelay);

        // Keep the session, drop the browse
        m_browser.stopDiscovery();

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_browsing = false;
            if (m_generation == generation) {
                m_session = std::move(opened);
                m_deviceId = device.id;
                m_connected = true;
            }
        }
        if (opened) {
            LOG_WARN("[Cast] Disconnected while connecting to " << device.name);
            abandonConnect(std::move(opened));
            return false;
        }

        LOG_INFO("Connected to " << match->friendlyName << " (" << match->host << ")");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("[Cast] Connection failed: " << e.what());
        abandonConnect(std::move(opened));
        return false;
    }
}

void ConnectionManager::abandonConnect(std::unique_ptr<CastSession> session) {
    if (session) {
        try {
            session->disconnect();
        } catch (const std::exception& e) {
            LOG_WARN("[Cast] Session disconnect failed: " << e.what());
        }
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    disconnectLocked();
}

void ConnectionManager::disconnect() {
    std::lock_guard<std::mutex> lock(m_mutex);
    disconnectLocked();
}

void ConnectionManager::disconnectLocked() {
    bool hadConnection = static_cast<bool>(m_session);
    m_generation++;

    if (m_browsing) {
        try {
            m_browser.stopDiscovery();
        } catch (const std::exception& e) {
            LOG_WARN("[Cast] stopDiscovery failed: " << e.what());
        }
        m_browsing = false;
    }

    if (m_session) {
        try {
            m_session->disconnect();
        } catch (const std::exception& e) {
            LOG_WARN("[Cast] Session disconnect failed: " << e.what());
        }
    }

    m_session.reset();
    m_connected = false;
    m_deviceId.clear();

    if (hadConnection) {
        LOG_INFO("Disconnected");
    }
}

bool ConnectionManager::isConnected() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return isConnectedLocked();
}

bool ConnectionManager::isConnectedLocked() {
    if (!m_session || !m_connected) {
        return false;
    }
    try {
        bool alive = m_session->isSocketConnected();
        if (!alive) {
            LOG_DEBUG("[Cast] Control socket to " << m_deviceId << " is down");
            m_connected = false;
        }
        return alive;
    } catch (const std::exception& e) {
        LOG_DEBUG("[Cast] Liveness probe failed: " << e.what());
        m_connected = false;
        return false;
    }
}

std::shared_ptr<CastSession> ConnectionManager::active() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return isConnectedLocked() ? m_session : nullptr;
}

std::shared_ptr<CastSession> ConnectionManager::activeFor(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_deviceId != deviceId) return nullptr;
    return isConnectedLocked() ? m_session : nullptr;
}

std::string ConnectionManager::activeDeviceId() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_deviceId;
}
