/**
 * @file TestUtil.h
 * @brief Socket and file helpers shared by the tests
 */

#ifndef CASTSPEAK_TESTS_TEST_UTIL_H
#define CASTSPEAK_TESTS_TEST_UTIL_H

#include <cstdint>
#include <fstream>
#include <string>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

// Write size bytes of a repeating pattern
inline void writeFile(const std::string& path, size_t size, char fill = 'x') {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    for (size_t i = 0; i < size; i++) {
        out.put(static_cast<char>(fill + (i % 7)));
    }
}

inline int connectLoopback(uint16_t port) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return -1;

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if (connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd);
        return -1;
    }

    struct timeval tv{};
    tv.tv_sec = 5;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    return fd;
}

inline bool canConnect(uint16_t port) {
    int fd = connectLoopback(port);
    if (fd < 0) return false;
    ::close(fd);
    return true;
}

// Send a raw request and read until the server closes
inline std::string httpExchange(uint16_t port, const std::string& request) {
    int fd = connectLoopback(port);
    if (fd < 0) return "";

    size_t sent = 0;
    while (sent < request.size()) {
        ssize_t n = send(fd, request.data() + sent, request.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) break;
        sent += static_cast<size_t>(n);
    }

    std::string response;
    char buf[4096];
    while (true) {
        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) break;
        response.append(buf, static_cast<size_t>(n));
    }
    ::close(fd);
    return response;
}

inline std::string httpGet(uint16_t port, const std::string& target,
                           const std::string& extraHeaders = "") {
    return httpExchange(port, "GET " + target + " HTTP/1.1\r\nHost: localhost\r\n" +
                                  extraHeaders + "\r\n");
}

inline std::string bodyOf(const std::string& response) {
    size_t pos = response.find("\r\n\r\n");
    return pos == std::string::npos ? "" : response.substr(pos + 4);
}

#endif // CASTSPEAK_TESTS_TEST_UTIL_H
