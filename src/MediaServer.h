/**
 * @file MediaServer.h
 * @brief Ephemeral HTTP file server for cast receivers
 *
 * Serves the files of one directory on an OS-assigned port so a cast
 * device can pull the media it was told to play. Lives for a single
 * playback call: start() chdirs into the serve root and spawns the
 * accept thread, stop() joins it and restores the working directory.
 */

#ifndef CASTSPEAK_MEDIA_SERVER_H
#define CASTSPEAK_MEDIA_SERVER_H

#include "ScopedPaths.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

class MediaServer {
public:
    MediaServer();
    ~MediaServer();

    // Non-copyable
    MediaServer(const MediaServer&) = delete;
    MediaServer& operator=(const MediaServer&) = delete;

    /**
     * @brief Start serving a directory
     * @return Bound port, or 0 on failure (nothing left running)
     */
    uint16_t start(const std::string& directory);

    // Idempotent, safe without start(); never throws
    void stop();

    bool isRunning() const { return m_running.load(std::memory_order_acquire); }
    uint16_t port() const { return m_port; }
    uint64_t requestsServed() const { return m_requests.load(std::memory_order_relaxed); }

    // Percent-encode a file name for use as a URL path segment
    static std::string encodePathSegment(const std::string& name);
    // Decode %XX escapes; false on malformed escapes
    static bool decodePath(const std::string& in, std::string& out);
    static const char* contentTypeFor(const std::string& path);

    enum class RangeResult { NONE, OK, UNSATISFIABLE };

    /**
     * @brief Parse a "Range: bytes=..." value against a file size
     * @param first,last Inclusive byte range (valid when OK)
     */
    static RangeResult parseRange(const std::string& value, uint64_t fileSize,
                                  uint64_t& first, uint64_t& last);

private:
    int m_listenSocket = -1;
    uint16_t m_port = 0;
    std::string m_root;

    std::thread m_thread;
    std::atomic<bool> m_running{false};
    std::atomic<uint64_t> m_requests{0};

    std::unique_ptr<ScopedWorkingDirectory> m_workDir;

    void acceptLoop();
    void handleClient(int fd);

    bool readRequestHead(int fd, std::string& head);
    bool resolvePath(const std::string& target, std::string& fsPath) const;
    void sendFile(int fd, const std::string& fsPath, bool headOnly,
                  const std::string& rangeValue);
    void sendStatus(int fd, int status, const char* reason);

    static bool sendAll(int fd, const void* buf, size_t len);
    void closeListener();
};

#endif // CASTSPEAK_MEDIA_SERVER_H
