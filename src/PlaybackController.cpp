/**
 * @file PlaybackController.cpp
 * @brief Cast playback state machine implementation
 *
 * Sequence per call:
 *   precondition -> connection -> media server -> play ->
 *   early-finish check -> activation wait -> classification -> poll loop
 * Every branch returns a PlayOutcome; the MediaServer is scoped to run()
 * so it is torn down on every return and on exceptions.
 */

#include "PlaybackController.h"
#include "LocalAddress.h"
#include "LogLevel.h"
#include "MediaServer.h"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <thread>

namespace {

using Clock = std::chrono::steady_clock;

long long elapsedMs(Clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - since).count();
}

// Current media status; absent or unreadable status reads as UNKNOWN
MediaStatus observe(const MediaController& media) {
    try {
        std::optional<MediaStatus> status = media.status();
        if (status) return *status;
    } catch (const std::exception& e) {
        LOG_DEBUG("[Cast] Status read failed: " << e.what());
    }
    return MediaStatus{};
}

void logStatus(const char* label, const MediaStatus& st) {
    LOG_INFO(label << ": " << playerStateName(st.playerState)
             << ", idle_reason: " << idleReasonName(st.idleReason));
}

} // namespace

const char* playOutcomeName(PlayOutcome outcome) {
    switch (outcome) {
        case PlayOutcome::SUCCESS:               return "success";
        case PlayOutcome::PRECONDITION_FAILURE:  return "precondition failure";
        case PlayOutcome::CONNECTION_FAILURE:    return "connection failure";
        case PlayOutcome::MEDIA_SERVER_FAILURE:  return "media server failure";
        case PlayOutcome::ACTIVATION_TIMEOUT:    return "activation timeout";
        case PlayOutcome::DEVICE_REPORTED_ERROR: return "device reported error";
        case PlayOutcome::OVERALL_TIMEOUT:       return "overall timeout";
        case PlayOutcome::INTERNAL_ERROR:        return "internal error";
    }
    return "unknown";
}

// ============================================
// Constructor
// ============================================

PlaybackController::PlaybackController(ConnectionManager& connections, PlaybackTimings timings)
    : m_connections(connections)
    , m_timings(timings)
{
}

std::chrono::milliseconds PlaybackController::pollBudgetFor(const AudioInfo& audio,
                                                            const PlaybackTimings& timings) {
    if (audio.durationMs == 0) return timings.pollTimeout;
    std::chrono::milliseconds needed =
        std::chrono::milliseconds(audio.durationMs) + timings.durationMargin;
    return std::max(needed, timings.pollTimeout);
}

// ============================================
// Entry Points
// ============================================

bool PlaybackController::playNetworked(const Device& device, const std::string& path) {
    return play(device, path) == PlayOutcome::SUCCESS;
}

PlayOutcome PlaybackController::play(const Device& device, const std::string& path) {
    Session session;
    session.audioPath = path;
    session.startedAt = Clock::now();

    PlayOutcome outcome;
    try {
        outcome = run(device, session);
    } catch (const std::exception& e) {
        outcome = PlayOutcome::INTERNAL_ERROR;
        session.reason = e.what();
    }

    if (outcome == PlayOutcome::SUCCESS) {
        LOG_INFO("Playback finished successfully on " << device.name << " ("
                 << session.reason << ", " << elapsedMs(session.startedAt) << " ms)");
    } else {
        LOG_ERROR("Playback failed on " << device.name << ": "
                  << playOutcomeName(outcome) << " - " << session.reason);
    }
    return outcome;
}

// ============================================
// State Machine
// ============================================

PlayOutcome PlaybackController::run(const Device& device, Session& session) {
    namespace fs = std::filesystem;

    // Precondition: the file must exist and carry real audio
    AudioInfo audio = m_prober(session.audioPath);
    if (!audio.exists) {
        session.reason = "audio file not found: " + session.audioPath;
        return PlayOutcome::PRECONDITION_FAILURE;
    }
    if (audio.sizeBytes < m_timings.minFileBytes) {
        session.reason = "audio file too small: " + std::to_string(audio.sizeBytes) + " bytes";
        return PlayOutcome::PRECONDITION_FAILURE;
    }

    fs::path file = fs::absolute(session.audioPath);
    std::string filename = file.filename().string();
    LOG_INFO("Audio file: " << filename << " (" << audio.sizeBytes << " bytes)");

    session.pollBudget = pollBudgetFor(audio, m_timings);
    if (session.pollBudget > m_timings.pollTimeout) {
        LOG_DEBUG("[Cast] Poll budget raised to " << session.pollBudget.count()
                  << " ms for a " << audio.durationMs << " ms clip");
    }

    // Connection: reuse the cached session when it belongs to this device
    std::shared_ptr<CastSession> cast = m_connections.activeFor(device.id);
    if (cast) {
        LOG_INFO("Using cached connection");
        session.usedCachedConnection = true;
    } else {
        if (!m_connections.connect(device, m_timings.connectTimeout)) {
            session.reason = "failed to connect to " + device.name;
            return PlayOutcome::CONNECTION_FAILURE;
        }
        cast = m_connections.activeFor(device.id);
        if (!cast) {
            session.reason = "no live session after connect";
            return PlayOutcome::CONNECTION_FAILURE;
        }
    }

    // Stage the media: scoped, stopped on every path out of this function
    MediaServer server;
    session.serverPort = server.start(file.parent_path().string());
    if (session.serverPort == 0) {
        session.reason = "could not start media server for " + file.parent_path().string();
        return PlayOutcome::MEDIA_SERVER_FAILURE;
    }

    std::string localIp = resolveLocalAddress(device.address ? *device.address
                                                             : cast->info().host);
    std::string url = "http://" + localIp + ":" + std::to_string(session.serverPort) +
                      "/" + MediaServer::encodePathSegment(filename);
    LOG_INFO("Serving audio at " << url);

    MediaController& media = cast->mediaController();

    // A freshly woken receiver drops commands sent too early
    if (!session.usedCachedConnection) {
        std::this_thread::sleep_for(m_timings.freshSettleDelay);
    }

    LOG_INFO("Sending play command...");
    media.playMedia(url, CONTENT_TYPE);

    if (!session.usedCachedConnection) {
        std::this_thread::sleep_for(m_timings.freshSettleDelay);
    }
    std::this_thread::sleep_for(m_timings.acceptDelay);

    PlayOutcome outcome = awaitCompletion(media, session);

    server.stop();
    return outcome;
}

PlayOutcome PlaybackController::awaitCompletion(MediaController& media, Session& session) {
    // Very short clips can finish before any PLAYING is ever observed
    MediaStatus st = observe(media);
    logStatus("Initial state", st);
    if (st.isFinished()) {
        session.reason = "completed before first poll (very short clip)";
        return PlayOutcome::SUCCESS;
    }
    if (st.isError()) {
        session.reason = std::string("device reported ") + idleReasonName(st.idleReason);
        return PlayOutcome::DEVICE_REPORTED_ERROR;
    }

    // Wait for activation; never re-send the play command
    try {
        session.activated = media.blockUntilActive(m_timings.activationTimeout);
    } catch (const std::exception& e) {
        LOG_WARN("[Cast] Activation wait failed: " << e.what());
        session.activated = false;
    }

    if (!session.activated) {
        st = observe(media);
        if (st.isFinished()) {
            session.reason = "completed during activation wait";
            return PlayOutcome::SUCCESS;
        }
        LOG_WARN("[Cast] Player not active after "
                 << m_timings.activationTimeout.count() << " ms, polling anyway");
    }

    st = observe(media);
    logStatus("Player state", st);
    if (st.isFinished()) {
        session.reason = "completed quickly (short clip)";
        return PlayOutcome::SUCCESS;
    }
    if (st.isError()) {
        session.reason = std::string("device reported ") + idleReasonName(st.idleReason);
        return PlayOutcome::DEVICE_REPORTED_ERROR;
    }

    // Poll until a terminal state or the budget runs out
    Clock::time_point pollStart = Clock::now();
    while (true) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            Clock::now() - pollStart);
        if (elapsed >= session.pollBudget) break;

        st = observe(media);

        if (st.playerState == PlayerState::PLAYING) {
            if (!session.observedPlayed) {
                LOG_DEBUG("[Cast] Playing (" << elapsed.count() << " ms into poll)");
            }
            session.observedPlayed = true;
        } else if (st.isIdle()) {
            if (session.observedPlayed || st.isFinished()) {
                session.reason = "played to the end";
                return PlayOutcome::SUCCESS;
            }
            if (st.isError()) {
                session.reason = std::string("device reported ") + idleReasonName(st.idleReason);
                return PlayOutcome::DEVICE_REPORTED_ERROR;
            }
            // Ambiguous: a clip that ended between polls and a receiver that
            // silently never started look the same here. Assume the former.
            if (elapsed > m_timings.shortClipGrace) {
                session.reason = "idle without PLAYING for " + std::to_string(elapsed.count()) +
                                 " ms, short clip likely finished";
                return PlayOutcome::SUCCESS;
            }
        }

        std::this_thread::sleep_for(m_timings.pollInterval);
    }

    if (!session.activated && !session.observedPlayed) {
        session.reason = "device never became active within " +
                         std::to_string(session.pollBudget.count()) + " ms";
        return PlayOutcome::ACTIVATION_TIMEOUT;
    }
    session.reason = "no terminal state within " +
                     std::to_string(session.pollBudget.count()) + " ms (last state " +
                     playerStateName(st.playerState) + ")";
    return PlayOutcome::OVERALL_TIMEOUT;
}
