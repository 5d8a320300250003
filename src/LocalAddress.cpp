/**
 * @file LocalAddress.cpp
 * @brief Local IPv4 address resolution
 */

#include "LocalAddress.h"
#include "LogLevel.h"

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <net/if.h>
#include <ifaddrs.h>

#include <cerrno>
#include <cstring>

namespace {

constexpr const char* DEFAULT_ROUTE_PROBE = "8.8.8.8";
constexpr uint16_t PROBE_PORT = 80;

// Source address the kernel picks for a route toward target, or empty
std::string routeSourceAddress(const std::string& target) {
    struct sockaddr_in dest{};
    dest.sin_family = AF_INET;
    dest.sin_port = htons(PROBE_PORT);
    if (inet_pton(AF_INET, target.c_str(), &dest.sin_addr) != 1) {
        return "";
    }

    int sock = socket(AF_INET, SOCK_DGRAM, 0);
    if (sock < 0) {
        LOG_DEBUG("[Net] socket() failed: " << strerror(errno));
        return "";
    }

    std::string result;
    if (::connect(sock, reinterpret_cast<struct sockaddr*>(&dest), sizeof(dest)) == 0) {
        struct sockaddr_in local{};
        socklen_t len = sizeof(local);
        if (getsockname(sock, reinterpret_cast<struct sockaddr*>(&local), &len) == 0 &&
            local.sin_addr.s_addr != htonl(INADDR_ANY)) {
            char buf[INET_ADDRSTRLEN] = {};
            if (inet_ntop(AF_INET, &local.sin_addr, buf, sizeof(buf))) {
                result = buf;
            }
        }
    } else {
        LOG_DEBUG("[Net] No route toward " << target << ": " << strerror(errno));
    }

    ::close(sock);
    return result;
}

std::string firstInterfaceAddress() {
    struct ifaddrs* ifList = nullptr;
    if (getifaddrs(&ifList) != 0) {
        LOG_DEBUG("[Net] getifaddrs() failed: " << strerror(errno));
        return "";
    }

    std::string result;
    for (struct ifaddrs* ifa = ifList; ifa; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) continue;
        if (!(ifa->ifa_flags & IFF_UP) || (ifa->ifa_flags & IFF_LOOPBACK)) continue;

        auto* sin = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr);
        char buf[INET_ADDRSTRLEN] = {};
        if (inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) {
            result = buf;
            LOG_DEBUG("[Net] Using interface " << ifa->ifa_name << " (" << result << ")");
            break;
        }
    }

    freeifaddrs(ifList);
    return result;
}

} // namespace

std::string resolveLocalAddress(const std::string& peerHint) {
    std::string ip;

    if (!peerHint.empty()) {
        ip = routeSourceAddress(peerHint);
        if (!ip.empty()) return ip;
    }

    ip = routeSourceAddress(DEFAULT_ROUTE_PROBE);
    if (!ip.empty()) return ip;

    ip = firstInterfaceAddress();
    if (!ip.empty()) return ip;

    LOG_WARN("[Net] No LAN address found, falling back to loopback");
    return "127.0.0.1";
}
