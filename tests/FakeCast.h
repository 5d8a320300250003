/**
 * @file FakeCast.h
 * @brief Scriptable in-memory cast client for tests
 */

#ifndef CASTSPEAK_TESTS_FAKE_CAST_H
#define CASTSPEAK_TESTS_FAKE_CAST_H

#include "CastSession.h"
#include "Device.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

// Ordered record of calls across all fakes ("browse", "stop", "open:<uuid>", ...)
class EventLog {
public:
    void add(const std::string& event) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_events.push_back(event);
    }

    std::vector<std::string> events() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_events;
    }

    // Index of the first occurrence, -1 if absent
    int indexOf(const std::string& event) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = std::find(m_events.begin(), m_events.end(), event);
        return it == m_events.end() ? -1 : static_cast<int>(it - m_events.begin());
    }

    size_t count(const std::string& event) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return static_cast<size_t>(std::count(m_events.begin(), m_events.end(), event));
    }

private:
    mutable std::mutex m_mutex;
    std::vector<std::string> m_events;
};

inline MediaStatus status(PlayerState state, IdleReason reason = IdleReason::NONE) {
    MediaStatus s;
    s.playerState = state;
    s.idleReason = reason;
    return s;
}

// Behaviour shared by every session the factory opens
struct FakeScript {
    bool waitResult = true;
    bool activeResult = true;
    bool throwOnActive = false;
    bool throwOnPlay = false;
    // Status sequence; the last entry repeats. Empty = no status yet.
    std::vector<std::optional<MediaStatus>> statuses;
    // Called from playMedia() with the URL
    std::function<void(const std::string&)> onPlay;
};

class FakeMediaController : public MediaController {
public:
    explicit FakeMediaController(const FakeScript& script) : m_script(script) {}

    void playMedia(const std::string& url, const std::string& contentType) override {
        if (m_script.throwOnPlay) throw std::runtime_error("play rejected");
        playCount++;
        lastUrl = url;
        lastContentType = contentType;
        if (m_script.onPlay) m_script.onPlay(url);
    }

    std::optional<MediaStatus> status() const override {
        statusReads++;
        if (m_script.statuses.empty()) return std::nullopt;
        size_t i = std::min(m_next, m_script.statuses.size() - 1);
        m_next++;
        return m_script.statuses[i];
    }

    bool blockUntilActive(std::chrono::milliseconds) override {
        if (m_script.throwOnActive) throw std::runtime_error("activation wait failed");
        return m_script.activeResult;
    }

    int playCount = 0;
    std::string lastUrl;
    std::string lastContentType;
    mutable int statusReads = 0;

private:
    const FakeScript& m_script;
    mutable size_t m_next = 0;
};

class FakeSession : public CastSession {
public:
    FakeSession(CastInfo info, const FakeScript& script, EventLog& log)
        : m_info(std::move(info)), m_script(script), m_log(log), m_media(script) {}

    const CastInfo& info() const override { return m_info; }

    bool wait(std::chrono::milliseconds) override {
        m_log.add("wait:" + m_info.uuid);
        return m_script.waitResult;
    }

    bool isSocketConnected() const override {
        if (throwOnProbe) throw std::runtime_error("socket probe failed");
        return alive;
    }

    MediaController& mediaController() override { return m_media; }

    void disconnect() override {
        m_log.add("disconnect:" + m_info.uuid);
        alive = false;
    }

    FakeMediaController& media() { return m_media; }

    std::atomic<bool> alive{true};
    std::atomic<bool> throwOnProbe{false};

private:
    CastInfo m_info;
    const FakeScript& m_script;
    EventLog& m_log;
    FakeMediaController m_media;
};

class FakeBrowser : public CastBrowser {
public:
    explicit FakeBrowser(EventLog& log) : m_log(log) {}

    std::vector<CastInfo> browse(std::chrono::milliseconds) override {
        m_log.add("browse");
        browseCount++;
        if (browseDelay.count() > 0) std::this_thread::sleep_for(browseDelay);
        if (throwOnBrowse) throw std::runtime_error("network down");
        return devices;
    }

    void stopDiscovery() override {
        m_log.add("stop");
        stopCount++;
    }

    std::vector<CastInfo> devices;
    bool throwOnBrowse = false;
    std::chrono::milliseconds browseDelay{0};
    std::atomic<int> browseCount{0};
    std::atomic<int> stopCount{0};

private:
    EventLog& m_log;
};

class FakeFactory : public CastSessionFactory {
public:
    FakeFactory(const FakeScript& script, EventLog& log) : m_script(script), m_log(log) {}

    std::unique_ptr<CastSession> open(const CastInfo& info) override {
        m_log.add("open:" + info.uuid);
        openCount++;
        if (failOpen) return nullptr;
        auto session = std::make_unique<FakeSession>(info, m_script, m_log);
        last = session.get();
        return session;
    }

    std::atomic<int> openCount{0};
    bool failOpen = false;
    FakeSession* last = nullptr;    // owned by the connection manager

private:
    const FakeScript& m_script;
    EventLog& m_log;
};

inline CastInfo castInfo(const std::string& uuid, const std::string& name,
                         const std::string& host = "127.0.0.1") {
    CastInfo info;
    info.uuid = uuid;
    info.friendlyName = name;
    info.host = host;
    return info;
}

inline Device castDevice(const std::string& id, const std::string& name,
                         const std::string& address = "127.0.0.1") {
    Device d;
    d.id = id;
    d.name = name;
    d.address = address;
    d.type = DeviceType::GoogleCast;
    return d;
}

#endif // CASTSPEAK_TESTS_FAKE_CAST_H
