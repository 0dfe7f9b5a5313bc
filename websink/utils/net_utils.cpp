/*
 * Network Utilities Implementation
 */

#include "net_utils.h"
#include <sys/socket.h>
#include <sys/types.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <net/if.h>
#include <ifaddrs.h>
#include <unistd.h>
#include <cstring>

namespace net_utils {

// Try to bind port on all interfaces; returns the bound port or -1
static int try_bind_port(int port) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return -1;
    }

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(static_cast<uint16_t>(port));

    int result = -1;
    if (bind(fd, (struct sockaddr*)&addr, sizeof(addr)) == 0) {
        socklen_t len = sizeof(addr);
        if (getsockname(fd, (struct sockaddr*)&addr, &len) == 0) {
            result = ntohs(addr.sin_port);
        }
    }

    close(fd);
    return result;
}

int find_available_port(int start_port) {
    if (start_port == 0) {
        return try_bind_port(0);
    }

    int end_port = start_port + PORT_SEARCH_RANGE;
    if (end_port > 65536) {
        end_port = 65536;
    }

    for (int port = start_port; port < end_port; port++) {
        if (try_bind_port(port) == port) {
            return port;
        }
    }
    return -1;
}

std::string external_ip() {
    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) < 0) {
        return "localhost";
    }

    std::string result = "localhost";
    for (struct ifaddrs* ifa = ifaddr; ifa; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) continue;
        if (!(ifa->ifa_flags & IFF_UP)) continue;
        if (ifa->ifa_flags & IFF_LOOPBACK) continue;

        char buf[INET_ADDRSTRLEN];
        auto* sin = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr);
        if (inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) {
            result = buf;
            break;
        }
    }

    freeifaddrs(ifaddr);
    return result;
}

std::string host_name() {
    char buf[256];
    if (gethostname(buf, sizeof(buf)) != 0) {
        return "localhost";
    }
    buf[sizeof(buf) - 1] = '\0';
    return buf;
}

} // namespace net_utils
