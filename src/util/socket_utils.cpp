#include "util/socket_utils.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace hmmdc {

// close() without clobbering the errno of the failure being reported
static void close_keep_errno(int fd) {
    int saved = errno;
    ::close(fd);
    errno = saved;
}

bool parse_host_port(const std::string& addr, std::string& host, uint16_t& port) {
    auto colon = addr.rfind(':');
    if (colon == std::string::npos) return false;

    host = addr.substr(0, colon);
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    std::string port_str = addr.substr(colon + 1);
    if (port_str.empty()) return false;

    char* end = nullptr;
    long val = std::strtol(port_str.c_str(), &end, 10);
    if (*end != '\0' || val <= 0 || val > 65535) return false;
    port = static_cast<uint16_t>(val);
    return true;
}

int unix_listen(const std::string& path, int backlog) {
    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (path.size() >= sizeof(addr.sun_path)) {
        errno = ENAMETOOLONG;
        return -1;
    }
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) return -1;

    // Remove existing socket file
    ::unlink(path.c_str());

    if (::bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0 ||
        ::listen(fd, backlog) < 0) {
        close_keep_errno(fd);
        return -1;
    }
    return fd;
}

int tcp_listen_loopback(uint16_t port, int backlog) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return -1;

    int opt = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sin_family = AF_INET;
    sa.sin_port = htons(port);
    sa.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    if (::bind(fd, reinterpret_cast<struct sockaddr*>(&sa), sizeof(sa)) < 0 ||
        ::listen(fd, backlog) < 0) {
        close_keep_errno(fd);
        return -1;
    }
    return fd;
}

uint16_t bound_port(int listen_fd) {
    struct sockaddr_in sa;
    socklen_t len = sizeof(sa);
    if (::getsockname(listen_fd, reinterpret_cast<struct sockaddr*>(&sa), &len) < 0) {
        return 0;
    }
    return ntohs(sa.sin_port);
}

int accept_connection(int listen_fd) {
    int fd;
    do {
        fd = ::accept(listen_fd, nullptr, nullptr);
    } while (fd < 0 && errno == EINTR);
    return fd;
}

int unix_connect(const std::string& path) {
    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (path.size() >= sizeof(addr.sun_path)) {
        errno = ENAMETOOLONG;
        return -1;
    }
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) return -1;

    if (::connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        close_keep_errno(fd);
        return -1;
    }
    return fd;
}

int tcp_connect(const std::string& host, uint16_t port) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char port_str[8];
    std::snprintf(port_str, sizeof(port_str), "%u", static_cast<unsigned>(port));

    struct addrinfo* res = nullptr;
    const char* node = host.empty() ? "127.0.0.1" : host.c_str();
    int rc = ::getaddrinfo(node, port_str, &hints, &res);
    if (rc != 0) {
        errno = (rc == EAI_SYSTEM) ? errno : EHOSTUNREACH;
        return -1;
    }

    int fd = -1;
    for (struct addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) continue;
        int r;
        do {
            r = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        } while (r < 0 && errno == EINTR);
        if (r == 0) break;
        close_keep_errno(fd);
        fd = -1;
    }
    ::freeaddrinfo(res);
    return fd;
}

void shutdown_socket(int fd) {
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
    }
}

void close_fd(int fd) {
    if (fd >= 0) {
        int ret;
        do {
            ret = ::close(fd);
        } while (ret < 0 && errno == EINTR);
    }
}

} // namespace hmmdc
