/**
 * @file AudioProbe.cpp
 * @brief Audio file inspection using libmpg123
 *
 * mpg123_scan() walks every frame so VBR files without a Xing/Info
 * header still report an exact length. Clips we cast are short, the
 * scan costs milliseconds.
 */

#include "AudioProbe.h"
#include "LogLevel.h"

#include <sys/stat.h>

#ifdef ENABLE_MP3
#include <mpg123.h>
#include <mutex>
#endif

#ifdef ENABLE_MP3
namespace {

std::once_flag s_initFlag;

void probeMpeg(const std::string& path, AudioInfo& info) {
    // Global mpg123 init (thread-safe, once)
    std::call_once(s_initFlag, [] {
        mpg123_init();
    });

    int err = MPG123_OK;
    mpg123_handle* handle = mpg123_new(nullptr, &err);
    if (!handle) {
        LOG_DEBUG("[MP3] Failed to create probe handle: " << mpg123_plain_strerror(err));
        return;
    }

    // Quiet: garbage in non-MP3 files is expected here
    mpg123_param(handle, MPG123_ADD_FLAGS, MPG123_QUIET, 0.0);

    if (mpg123_open(handle, path.c_str()) != MPG123_OK) {
        LOG_DEBUG("[MP3] Cannot open " << path << ": " << mpg123_strerror(handle));
        mpg123_delete(handle);
        return;
    }

    long rate = 0;
    int channels = 0;
    int encoding = 0;
    if (mpg123_getformat(handle, &rate, &channels, &encoding) == MPG123_OK && rate > 0) {
        info.sampleRate = static_cast<uint32_t>(rate);
        info.channels = static_cast<uint32_t>(channels);

        if (mpg123_scan(handle) == MPG123_OK) {
            off_t samples = mpg123_length(handle);
            if (samples > 0) {
                info.durationMs = static_cast<uint64_t>(samples) * 1000 / static_cast<uint64_t>(rate);
            }
        }
        info.decoded = true;
    } else {
        LOG_DEBUG("[MP3] " << path << " is not MPEG audio");
    }

    mpg123_close(handle);
    mpg123_delete(handle);
}

} // namespace
#endif

AudioInfo probeAudio(const std::string& path) {
    AudioInfo info;

    struct stat st{};
    if (stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        return info;
    }
    info.exists = true;
    info.sizeBytes = static_cast<uint64_t>(st.st_size);

#ifdef ENABLE_MP3
    probeMpeg(path, info);
    if (info.decoded) {
        LOG_DEBUG("[MP3] " << path << ": " << info.sampleRate << " Hz, "
                  << info.channels << " ch, " << info.durationMs << " ms");
    }
#endif

    return info;
}
