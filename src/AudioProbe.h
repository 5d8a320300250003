/**
 * @file AudioProbe.h
 * @brief Audio file inspection before playback
 *
 * Reads the size of a media file and, when built with ENABLE_MP3, scans
 * MPEG audio with libmpg123 for its format and exact duration. The
 * duration only tunes how long a cast playback is polled; a file the
 * probe cannot parse is still playable.
 */

#ifndef CASTSPEAK_AUDIO_PROBE_H
#define CASTSPEAK_AUDIO_PROBE_H

#include <cstdint>
#include <string>

struct AudioInfo {
    bool exists = false;
    uint64_t sizeBytes = 0;

    bool decoded = false;           // MPEG stream recognized by the probe
    uint32_t sampleRate = 0;
    uint32_t channels = 0;
    uint64_t durationMs = 0;        // 0 if unknown
};

AudioInfo probeAudio(const std::string& path);

#endif // CASTSPEAK_AUDIO_PROBE_H
