/**
 * @file MediaServer.cpp
 * @brief Ephemeral HTTP file server implementation
 *
 * One accept thread, clients served one at a time with socket timeouts.
 * A cast receiver opens at most a couple of connections per clip
 * (probe + ranged fetch), so there is nothing to gain from a pool here.
 */

#include "MediaServer.h"
#include "LogLevel.h"

#include <sys/socket.h>
#include <sys/stat.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <system_error>
#include <vector>

namespace {

constexpr int ACCEPT_POLL_MS = 200;
constexpr int CLIENT_RECV_TIMEOUT_S = 5;
constexpr int CLIENT_SEND_TIMEOUT_S = 10;
constexpr size_t MAX_REQUEST_HEAD = 16384;
constexpr size_t SEND_CHUNK = 64 * 1024;

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Value of a header (case-insensitive name), empty if absent
std::string headerValue(const std::string& head, const std::string& name) {
    std::string lower = toLower(head);
    std::string key = "\r\n" + toLower(name) + ":";
    size_t pos = lower.find(key);
    if (pos == std::string::npos) return "";

    size_t start = pos + key.size();
    while (start < head.size() && (head[start] == ' ' || head[start] == '\t')) {
        start++;
    }
    size_t end = head.find("\r\n", start);
    if (end == std::string::npos) end = head.size();
    return head.substr(start, end - start);
}

} // namespace

// ============================================
// Constructor / Destructor
// ============================================

MediaServer::MediaServer() = default;

MediaServer::~MediaServer() {
    stop();
}

// ============================================
// Lifecycle
// ============================================

uint16_t MediaServer::start(const std::string& directory) {
    if (m_running.load(std::memory_order_acquire)) {
        LOG_WARN("[HTTP] Server already running on port " << m_port);
        return m_port;
    }

    std::error_code ec;
    std::filesystem::path root = std::filesystem::canonical(directory, ec);
    if (ec || !std::filesystem::is_directory(root, ec)) {
        LOG_ERROR("[HTTP] Not a directory: " << directory);
        return 0;
    }
    m_root = root.string();

    m_workDir = std::make_unique<ScopedWorkingDirectory>(m_root);
    if (!m_workDir->ok()) {
        m_workDir.reset();
        return 0;
    }

    m_listenSocket = socket(AF_INET, SOCK_STREAM, 0);
    if (m_listenSocket < 0) {
        LOG_ERROR("[HTTP] Failed to create socket: " << strerror(errno));
        m_workDir.reset();
        return 0;
    }

    int flag = 1;
    setsockopt(m_listenSocket, SOL_SOCKET, SO_REUSEADDR, &flag, sizeof(flag));

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = 0;  // OS-assigned

    if (bind(m_listenSocket, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        LOG_ERROR("[HTTP] bind() failed: " << strerror(errno));
        closeListener();
        m_workDir.reset();
        return 0;
    }

    if (listen(m_listenSocket, 8) < 0) {
        LOG_ERROR("[HTTP] listen() failed: " << strerror(errno));
        closeListener();
        m_workDir.reset();
        return 0;
    }

    struct sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (getsockname(m_listenSocket, reinterpret_cast<struct sockaddr*>(&bound), &len) < 0) {
        LOG_ERROR("[HTTP] getsockname() failed: " << strerror(errno));
        closeListener();
        m_workDir.reset();
        return 0;
    }
    m_port = ntohs(bound.sin_port);

    m_running.store(true, std::memory_order_release);
    try {
        m_thread = std::thread(&MediaServer::acceptLoop, this);
    } catch (const std::system_error& e) {
        LOG_ERROR("[HTTP] Failed to start server thread: " << e.what());
        m_running.store(false, std::memory_order_release);
        closeListener();
        m_workDir.reset();
        m_port = 0;
        return 0;
    }

    LOG_DEBUG("[HTTP] Serving " << m_root << " on port " << m_port);
    return m_port;
}

void MediaServer::stop() {
    bool wasRunning = m_running.exchange(false, std::memory_order_acq_rel);

    if (m_listenSocket >= 0) {
        // Unblocks poll()/accept() in the server thread
        shutdown(m_listenSocket, SHUT_RDWR);
    }

    if (m_thread.joinable()) {
        try {
            m_thread.join();
        } catch (const std::system_error& e) {
            LOG_WARN("[HTTP] Failed to join server thread: " << e.what());
        }
    }

    closeListener();

    if (m_workDir) {
        m_workDir->restore();
        m_workDir.reset();
    }

    if (wasRunning) {
        LOG_DEBUG("[HTTP] Server on port " << m_port << " stopped ("
                  << m_requests.load(std::memory_order_relaxed) << " requests)");
    }
}

void MediaServer::closeListener() {
    if (m_listenSocket >= 0) {
        close(m_listenSocket);
        m_listenSocket = -1;
    }
}

// ============================================
// Accept Loop
// ============================================

void MediaServer::acceptLoop() {
    while (m_running.load(std::memory_order_acquire)) {
        struct pollfd pfd;
        pfd.fd = m_listenSocket;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = poll(&pfd, 1, ACCEPT_POLL_MS);
        if (ready < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("[HTTP] poll() failed: " << strerror(errno));
            break;
        }
        if (ready == 0) continue;
        if (!m_running.load(std::memory_order_acquire)) break;
        if (pfd.revents & (POLLERR | POLLNVAL)) break;

        struct sockaddr_in peer{};
        socklen_t plen = sizeof(peer);
        int client = accept(m_listenSocket, reinterpret_cast<struct sockaddr*>(&peer), &plen);
        if (client < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == ECONNABORTED) continue;
            if (m_running.load(std::memory_order_acquire)) {
                LOG_WARN("[HTTP] accept() failed: " << strerror(errno));
            }
            break;
        }

        struct timeval rcv{CLIENT_RECV_TIMEOUT_S, 0};
        struct timeval snd{CLIENT_SEND_TIMEOUT_S, 0};
        setsockopt(client, SOL_SOCKET, SO_RCVTIMEO, &rcv, sizeof(rcv));
        setsockopt(client, SOL_SOCKET, SO_SNDTIMEO, &snd, sizeof(snd));

        char ip[INET_ADDRSTRLEN] = {};
        inet_ntop(AF_INET, &peer.sin_addr, ip, sizeof(ip));
        LOG_DEBUG("[HTTP] Client " << ip << ":" << ntohs(peer.sin_port));

        handleClient(client);

        shutdown(client, SHUT_RDWR);
        close(client);
    }
}

// ============================================
// Request Handling
// ============================================

void MediaServer::handleClient(int fd) {
    std::string head;
    if (!readRequestHead(fd, head)) {
        return;
    }
    m_requests.fetch_add(1, std::memory_order_relaxed);

    // Request line: METHOD SP TARGET SP VERSION
    size_t lineEnd = head.find("\r\n");
    std::string requestLine = head.substr(0, lineEnd);
    std::istringstream rl(requestLine);
    std::string method, target, version;
    rl >> method >> target >> version;

    if (method.empty() || target.empty()) {
        sendStatus(fd, 400, "Bad Request");
        return;
    }

    LOG_DEBUG("[HTTP] " << requestLine);

    if (method != "GET" && method != "HEAD") {
        sendStatus(fd, 405, "Method Not Allowed");
        return;
    }

    std::string fsPath;
    if (!resolvePath(target, fsPath)) {
        sendStatus(fd, 404, "Not Found");
        return;
    }

    sendFile(fd, fsPath, method == "HEAD", headerValue(head, "Range"));
}

bool MediaServer::readRequestHead(int fd, std::string& head) {
    char buf[1024];
    head.clear();

    while (head.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) {
            if (n < 0 && errno == EINTR) continue;
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                LOG_DEBUG("[HTTP] Client timed out before sending a request");
            }
            return false;
        }
        head.append(buf, static_cast<size_t>(n));

        if (head.size() > MAX_REQUEST_HEAD) {
            LOG_WARN("[HTTP] Request headers too large (>16KB)");
            sendStatus(fd, 431, "Request Header Fields Too Large");
            return false;
        }
    }
    return true;
}

bool MediaServer::resolvePath(const std::string& target, std::string& fsPath) const {
    std::string rawPath = target.substr(0, target.find_first_of("?#"));
    std::string path;
    if (!decodePath(rawPath, path) || path.empty() || path[0] != '/') {
        return false;
    }

    // Rebuild from segments, refusing to leave the serve root
    std::string relative;
    size_t pos = 1;
    while (pos <= path.size()) {
        size_t next = path.find('/', pos);
        if (next == std::string::npos) next = path.size();
        std::string segment = path.substr(pos, next - pos);
        pos = next + 1;

        if (segment.empty() || segment == ".") continue;
        if (segment == ".." || segment.find('\0') != std::string::npos) {
            LOG_WARN("[HTTP] Rejected path: " << target);
            return false;
        }
        if (!relative.empty()) relative += '/';
        relative += segment;
    }
    if (relative.empty()) return false;

    fsPath = m_root + "/" + relative;

    struct stat st{};
    if (stat(fsPath.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        LOG_DEBUG("[HTTP] Not found: " << fsPath);
        return false;
    }
    return true;
}

void MediaServer::sendFile(int fd, const std::string& fsPath, bool headOnly,
                           const std::string& rangeValue) {
    int file = open(fsPath.c_str(), O_RDONLY | O_CLOEXEC);
    if (file < 0) {
        LOG_WARN("[HTTP] Cannot open " << fsPath << ": " << strerror(errno));
        sendStatus(fd, 404, "Not Found");
        return;
    }

    struct stat st{};
    if (fstat(file, &st) != 0) {
        LOG_WARN("[HTTP] fstat failed for " << fsPath << ": " << strerror(errno));
        close(file);
        sendStatus(fd, 500, "Internal Server Error");
        return;
    }
    uint64_t fileSize = static_cast<uint64_t>(st.st_size);

    uint64_t first = 0;
    uint64_t last = fileSize > 0 ? fileSize - 1 : 0;
    RangeResult range = parseRange(rangeValue, fileSize, first, last);

    if (range == RangeResult::UNSATISFIABLE) {
        std::ostringstream resp;
        resp << "HTTP/1.1 416 Range Not Satisfiable\r\n"
             << "Content-Range: bytes */" << fileSize << "\r\n"
             << "Content-Length: 0\r\n"
             << "Connection: close\r\n\r\n";
        std::string s = resp.str();
        sendAll(fd, s.data(), s.size());
        close(file);
        return;
    }

    uint64_t length = fileSize == 0 ? 0 : last - first + 1;

    std::ostringstream resp;
    if (range == RangeResult::OK) {
        resp << "HTTP/1.1 206 Partial Content\r\n"
             << "Content-Range: bytes " << first << "-" << last << "/" << fileSize << "\r\n";
    } else {
        resp << "HTTP/1.1 200 OK\r\n";
    }
    resp << "Content-Type: " << contentTypeFor(fsPath) << "\r\n"
         << "Content-Length: " << length << "\r\n"
         << "Accept-Ranges: bytes\r\n"
         << "Access-Control-Allow-Origin: *\r\n"
         << "Connection: close\r\n\r\n";

    std::string header = resp.str();
    if (!sendAll(fd, header.data(), header.size()) || headOnly || length == 0) {
        close(file);
        return;
    }

    std::vector<uint8_t> buf(SEND_CHUNK);
    uint64_t offset = first;
    uint64_t remaining = length;
    while (remaining > 0 && m_running.load(std::memory_order_acquire)) {
        size_t toRead = static_cast<size_t>(std::min<uint64_t>(remaining, buf.size()));
        ssize_t n = pread(file, buf.data(), toRead, static_cast<off_t>(offset));
        if (n <= 0) {
            if (n < 0 && errno == EINTR) continue;
            LOG_WARN("[HTTP] Read error on " << fsPath);
            break;
        }
        if (!sendAll(fd, buf.data(), static_cast<size_t>(n))) {
            LOG_DEBUG("[HTTP] Client closed connection after "
                      << (offset - first) << " bytes");
            break;
        }
        offset += static_cast<uint64_t>(n);
        remaining -= static_cast<uint64_t>(n);
    }

    close(file);
    LOG_DEBUG("[HTTP] Sent " << (offset - first) << "/" << length << " bytes of " << fsPath);
}

void MediaServer::sendStatus(int fd, int status, const char* reason) {
    std::ostringstream resp;
    resp << "HTTP/1.1 " << status << " " << reason << "\r\n"
         << "Content-Type: text/plain\r\n"
         << "Content-Length: " << std::strlen(reason) << "\r\n"
         << "Connection: close\r\n\r\n"
         << reason;
    std::string s = resp.str();
    sendAll(fd, s.data(), s.size());
}

bool MediaServer::sendAll(int fd, const void* buf, size_t len) {
    const uint8_t* ptr = static_cast<const uint8_t*>(buf);
    size_t remaining = len;

    while (remaining > 0) {
        ssize_t n = send(fd, ptr, remaining, MSG_NOSIGNAL);
        if (n <= 0) {
            if (n < 0 && errno == EINTR) continue;
            return false;
        }
        ptr += n;
        remaining -= static_cast<size_t>(n);
    }
    return true;
}

// ============================================
// Helpers
// ============================================

std::string MediaServer::encodePathSegment(const std::string& name) {
    static const char* HEX = "0123456789ABCDEF";
    std::string out;
    out.reserve(name.size());
    for (unsigned char c : name) {
        if (std::isalnum(c) || c == '.' || c == '-' || c == '_' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += HEX[(c >> 4) & 0xF];
            out += HEX[c & 0xF];
        }
    }
    return out;
}

bool MediaServer::decodePath(const std::string& in, std::string& out) {
    out.clear();
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); i++) {
        if (in[i] != '%') {
            out += in[i];
            continue;
        }
        if (i + 2 >= in.size()) return false;
        int hi = hexValue(in[i + 1]);
        int lo = hexValue(in[i + 2]);
        if (hi < 0 || lo < 0) return false;
        out += static_cast<char>((hi << 4) | lo);
        i += 2;
    }
    return true;
}

const char* MediaServer::contentTypeFor(const std::string& path) {
    std::string ext = toLower(std::filesystem::path(path).extension().string());
    if (ext == ".mp3") return "audio/mpeg";
    if (ext == ".wav") return "audio/wav";
    if (ext == ".ogg" || ext == ".oga" || ext == ".opus") return "audio/ogg";
    if (ext == ".m4a" || ext == ".mp4") return "audio/mp4";
    if (ext == ".aac") return "audio/aac";
    if (ext == ".flac") return "audio/flac";
    return "application/octet-stream";
}

MediaServer::RangeResult MediaServer::parseRange(const std::string& value, uint64_t fileSize,
                                                 uint64_t& first, uint64_t& last) {
    if (value.empty()) return RangeResult::NONE;

    std::string v = toLower(value);
    if (v.compare(0, 6, "bytes=") != 0) return RangeResult::NONE;
    std::string range = v.substr(6);

    // Multiple ranges are not supported: serve the whole file instead
    if (range.find(',') != std::string::npos) return RangeResult::NONE;

    size_t dash = range.find('-');
    if (dash == std::string::npos) return RangeResult::NONE;

    std::string startStr = range.substr(0, dash);
    std::string endStr = range.substr(dash + 1);
    auto allDigits = [](const std::string& s) {
        // 19 digits always fit in uint64_t
        return !s.empty() && s.size() <= 19 && std::all_of(s.begin(), s.end(),
                                         [](unsigned char c) { return std::isdigit(c); });
    };

    if (fileSize == 0) return RangeResult::UNSATISFIABLE;

    if (startStr.empty()) {
        // Suffix range: last N bytes
        if (!allDigits(endStr)) return RangeResult::NONE;
        uint64_t n = std::stoull(endStr);
        if (n == 0) return RangeResult::UNSATISFIABLE;
        first = n >= fileSize ? 0 : fileSize - n;
        last = fileSize - 1;
        return RangeResult::OK;
    }

    if (!allDigits(startStr)) return RangeResult::NONE;
    first = std::stoull(startStr);
    if (endStr.empty()) {
        last = fileSize - 1;
    } else {
        if (!allDigits(endStr)) return RangeResult::NONE;
        last = std::min<uint64_t>(std::stoull(endStr), fileSize - 1);
    }

    if (first >= fileSize || first > last) return RangeResult::UNSATISFIABLE;
    return RangeResult::OK;
}
