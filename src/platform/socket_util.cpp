#include "socket_util.hpp"
#include <fmt/format.h>
#include <cstring>

#ifdef _WIN32
#  include <winsock2.h>
#  include <ws2tcpip.h>
#else
#  include <sys/socket.h>
#  include <netinet/in.h>
#  include <netinet/tcp.h>
#  include <netdb.h>
#  include <fcntl.h>
#  include <poll.h>
#  include <unistd.h>
#  include <cerrno>
#endif

namespace platform {

namespace {

void init_networking() {
#ifdef _WIN32
    static bool initialized = false;
    if (!initialized) {
        WSADATA wsa;
        WSAStartup(MAKEWORD(2, 2), &wsa);
        initialized = true;
    }
#endif
}

void set_nonblocking(socket_t sock) {
#ifdef _WIN32
    u_long mode = 1;
    ioctlsocket(sock, FIONBIO, &mode);
#else
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
#endif
}

bool connect_in_progress() {
#ifdef _WIN32
    return WSAGetLastError() == WSAEWOULDBLOCK;
#else
    return errno == EINPROGRESS;
#endif
}

std::string last_socket_error() {
#ifdef _WIN32
    return fmt::format("winsock error {}", WSAGetLastError());
#else
    return std::strerror(errno);
#endif
}

// Wait for a non-blocking connect to finish. Empty string on success.
std::string await_connect(socket_t sock, int timeout_ms) {
#ifdef _WIN32
    WSAPOLLFD pfd;
    pfd.fd = sock;
    pfd.events = POLLOUT;
    pfd.revents = 0;
    int ret = WSAPoll(&pfd, 1, timeout_ms);
#else
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = POLLOUT;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
#endif
    if (ret <= 0) return "Connection timed out";

    int sock_err = 0;
    socklen_t err_len = sizeof(sock_err);
    getsockopt(sock, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&sock_err), &err_len);
    if (sock_err != 0) return std::strerror(sock_err);
    return "";
}

} // namespace

Result<socket_t> tcp_connect(const std::string& host, int port, int timeout_secs) {
    init_networking();

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* addrs = nullptr;
    std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &addrs);
    if (rc != 0 || !addrs) {
        return Result<socket_t>::Err(Error::transport("Failed to resolve host: " + host));
    }

    std::string reason = "no usable address";
    socket_t sock = REMOTEFS_INVALID_SOCKET;

    for (struct addrinfo* ai = addrs; ai; ai = ai->ai_next) {
        sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock == REMOTEFS_INVALID_SOCKET) {
            reason = last_socket_error();
            continue;
        }
        set_nonblocking(sock);

        int ret = connect(sock, ai->ai_addr, static_cast<socklen_t>(ai->ai_addrlen));
        if (ret == 0) break;

        if (!connect_in_progress()) {
            reason = last_socket_error();
        } else {
            reason = await_connect(sock, timeout_secs * 1000);
            if (reason.empty()) break;
        }

        close_socket(sock);
        sock = REMOTEFS_INVALID_SOCKET;
    }
    freeaddrinfo(addrs);

    if (sock == REMOTEFS_INVALID_SOCKET) {
        return Result<socket_t>::Err(Error::transport(
            fmt::format("couldn't establish a connection to {}:{}: {}", host, port, reason)));
    }
    return Result<socket_t>::Ok(sock);
}

void enable_keepalive(socket_t sock, int idle_secs) {
    int on = 1;
    setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, reinterpret_cast<const char*>(&on), sizeof(on));
#ifdef TCP_KEEPIDLE
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPIDLE, reinterpret_cast<const char*>(&idle_secs),
               sizeof(idle_secs));
#else
    (void)idle_secs;
#endif
}

void close_socket(socket_t sock) {
#ifdef _WIN32
    closesocket(sock);
#else
    close(sock);
#endif
}

} // namespace platform
