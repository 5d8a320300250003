/**
 * @file CastSession.h
 * @brief Abstract cast protocol client interface
 *
 * castspeak does not speak the cast wire protocol itself. A protocol
 * client plugs in behind these interfaces: a browser that finds devices,
 * a factory that opens a control session for one of them, and the media
 * controller of that session, whose status is observed by polling.
 *
 * Any method may throw std::exception; callers treat that as failure.
 */

#ifndef CASTSPEAK_CAST_SESSION_H
#define CASTSPEAK_CAST_SESSION_H

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// ============================================
// Media status (poll observation)
// ============================================

enum class PlayerState { UNKNOWN, IDLE, BUFFERING, PLAYING, PAUSED };

enum class IdleReason { NONE, FINISHED, INTERRUPTED, CANCELLED, ERROR };

struct MediaStatus {
    PlayerState playerState = PlayerState::UNKNOWN;
    IdleReason idleReason = IdleReason::NONE;

    bool isIdle() const { return playerState == PlayerState::IDLE; }
    bool isFinished() const {
        return playerState == PlayerState::IDLE && idleReason == IdleReason::FINISHED;
    }
    // IDLE with a reason that signals a genuine playback failure
    bool isError() const {
        return playerState == PlayerState::IDLE &&
               idleReason != IdleReason::NONE &&
               idleReason != IdleReason::FINISHED &&
               idleReason != IdleReason::INTERRUPTED;
    }
};

// Wire names as reported by receivers ("PLAYING", "FINISHED", ...)
PlayerState parsePlayerState(const std::string& name);
IdleReason parseIdleReason(const std::string& name);
const char* playerStateName(PlayerState state);
const char* idleReasonName(IdleReason reason);

// ============================================
// Discovery record
// ============================================

struct CastInfo {
    std::string uuid;           // stable across restarts
    std::string friendlyName;
    std::string host;
    uint16_t port = 8009;
    std::string model;
};

// ============================================
// Interfaces
// ============================================

class MediaController {
public:
    virtual ~MediaController() = default;

    /**
     * @brief Ask the receiver to load and play a URL
     */
    virtual void playMedia(const std::string& url, const std::string& contentType) = 0;

    /**
     * @brief Last media status received, absent if none arrived yet
     */
    virtual std::optional<MediaStatus> status() const = 0;

    /**
     * @brief Wait for the player to leave its pre-activation state
     * @return false on timeout (implementations may throw instead)
     */
    virtual bool blockUntilActive(std::chrono::milliseconds timeout) = 0;
};

class CastSession {
public:
    virtual ~CastSession() = default;

    CastSession() = default;
    CastSession(const CastSession&) = delete;
    CastSession& operator=(const CastSession&) = delete;

    virtual const CastInfo& info() const = 0;

    /**
     * @brief Start the session and wait until it is ready
     * @return false if not ready within timeout
     */
    virtual bool wait(std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Live probe of the control socket
     */
    virtual bool isSocketConnected() const = 0;

    virtual MediaController& mediaController() = 0;

    virtual void disconnect() = 0;
};

class CastBrowser {
public:
    virtual ~CastBrowser() = default;

    /**
     * @brief Browse the network for cast devices
     * @return Every device seen within timeout
     */
    virtual std::vector<CastInfo> browse(std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Release browse resources (idempotent)
     */
    virtual void stopDiscovery() = 0;
};

class CastSessionFactory {
public:
    virtual ~CastSessionFactory() = default;

    /**
     * @brief Create an unstarted control session for a discovered device
     */
    virtual std::unique_ptr<CastSession> open(const CastInfo& info) = 0;
};

#endif // CASTSPEAK_CAST_SESSION_H
