#pragma once

// Cross-platform TCP dialing for the SSH transport.

#include <string>
#include <core/types.hpp>

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <winsock2.h>
#  include <ws2tcpip.h>
   using socket_t = SOCKET;
#  define REMOTEFS_INVALID_SOCKET INVALID_SOCKET
#else
   using socket_t = int;
#  define REMOTEFS_INVALID_SOCKET (-1)
#endif

namespace platform {

// Resolve `host` (IPv4, IPv6 or name) and connect to the first address that
// answers within `timeout_secs`. The returned socket is non-blocking, as
// libssh2 expects when the session runs in non-blocking mode.
Result<socket_t> tcp_connect(const std::string& host, int port, int timeout_secs);

// SO_KEEPALIVE plus, where supported, the idle time before the first probe.
void enable_keepalive(socket_t sock, int idle_secs);

void close_socket(socket_t sock);

} // namespace platform
