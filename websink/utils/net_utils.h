/*
 * Network Utilities
 *
 * Port probing and local address lookup used when the signaling server
 * starts.
 */

#ifndef NET_UTILS_H
#define NET_UTILS_H

#include <string>

namespace net_utils {

// Number of consecutive ports tried by find_available_port()
constexpr int PORT_SEARCH_RANGE = 100;

/**
 * Find a TCP port that can be bound
 * @param start_port First port to try; 0 lets the kernel pick one
 * @return Free port, or -1 if none of start_port..start_port+99 is free
 */
int find_available_port(int start_port);

// First non-loopback IPv4 address of an interface that is up, or "localhost"
std::string external_ip();

// Host name, or "localhost" if it cannot be determined
std::string host_name();

} // namespace net_utils

#endif // NET_UTILS_H
