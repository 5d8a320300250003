/**
 * @file PlaybackController.h
 * @brief Cast playback state machine
 *
 * Drives one clip on a cast device from start to a terminal state. The
 * receiver never pushes "done": everything is inferred by polling the
 * media status, which may be stale, briefly absent, or jump straight to
 * IDLE/FINISHED for clips shorter than the first poll.
 */

#ifndef CASTSPEAK_PLAYBACK_CONTROLLER_H
#define CASTSPEAK_PLAYBACK_CONTROLLER_H

#include "AudioProbe.h"
#include "ConnectionManager.h"
#include "Device.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

struct PlaybackTimings {
    uint64_t minFileBytes = 100;                          // smaller = corrupt/empty
    std::chrono::milliseconds connectTimeout{15000};      // device lookup
    std::chrono::milliseconds freshSettleDelay{1000};     // before/after play on a new connection
    std::chrono::milliseconds acceptDelay{500};           // play -> first status read
    std::chrono::milliseconds activationTimeout{10000};   // wait to leave pre-activation
    std::chrono::milliseconds pollInterval{300};
    std::chrono::milliseconds pollTimeout{60000};         // overall budget for a terminal state
    std::chrono::milliseconds shortClipGrace{5000};       // IDLE without PLAYING => assume done
    std::chrono::milliseconds durationMargin{15000};      // added to a probed clip length
};

enum class PlayOutcome {
    SUCCESS,
    PRECONDITION_FAILURE,
    CONNECTION_FAILURE,
    MEDIA_SERVER_FAILURE,
    ACTIVATION_TIMEOUT,
    DEVICE_REPORTED_ERROR,
    OVERALL_TIMEOUT,
    INTERNAL_ERROR
};

const char* playOutcomeName(PlayOutcome outcome);

class PlaybackController {
public:
    static constexpr const char* CONTENT_TYPE = "audio/mpeg";

    explicit PlaybackController(ConnectionManager& connections,
                                PlaybackTimings timings = PlaybackTimings());

    // Non-copyable
    PlaybackController(const PlaybackController&) = delete;
    PlaybackController& operator=(const PlaybackController&) = delete;

    /**
     * @brief Play a file on a cast device and wait for the outcome
     *
     * Never throws. The media server is stopped and the working directory
     * restored before returning, whatever the outcome.
     *
     * @return true if playback completed
     */
    bool playNetworked(const Device& device, const std::string& path);

    /**
     * @brief Same as playNetworked() with the detailed outcome
     */
    PlayOutcome play(const Device& device, const std::string& path);

    const PlaybackTimings& timings() const { return m_timings; }

    // Replaces probeAudio() for the precondition and the poll budget
    using AudioProber = std::function<AudioInfo(const std::string&)>;
    void setAudioProber(AudioProber prober) { m_prober = std::move(prober); }

    // pollTimeout, raised to duration + durationMargin for a long probed clip
    static std::chrono::milliseconds pollBudgetFor(const AudioInfo& audio,
                                                   const PlaybackTimings& timings);

private:
    // Per-call state
    struct Session {
        std::string audioPath;
        uint16_t serverPort = 0;
        bool usedCachedConnection = false;
        std::chrono::steady_clock::time_point startedAt;
        bool observedPlayed = false;
        bool activated = false;
        std::chrono::milliseconds pollBudget{0};
        std::string reason;
    };

    ConnectionManager& m_connections;
    PlaybackTimings m_timings;
    AudioProber m_prober = probeAudio;

    PlayOutcome run(const Device& device, Session& session);
    PlayOutcome awaitCompletion(MediaController& media, Session& session);
};

#endif // CASTSPEAK_PLAYBACK_CONTROLLER_H
