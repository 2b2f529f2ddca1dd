#include "protocol/frame.hpp"

#include <cerrno>
#include <sys/socket.h>
#include <unistd.h>

namespace hmmdc {

IoStatus write_all(int fd, const void* data, size_t n) {
    const uint8_t* p = static_cast<const uint8_t*>(data);
    size_t remaining = n;
    bool is_socket = true;
    while (remaining > 0) {
        ssize_t w = is_socket ? ::send(fd, p, remaining, MSG_NOSIGNAL)
                              : ::write(fd, p, remaining);
        if (w < 0) {
            if (errno == EINTR) continue;
            if (errno == ENOTSOCK && is_socket) {
                is_socket = false;
                continue;
            }
            return IoStatus::kError;
        }
        if (w == 0) return IoStatus::kError;
        p += w;
        remaining -= static_cast<size_t>(w);
    }
    return IoStatus::kOk;
}

IoStatus read_all(int fd, void* data, size_t n, size_t& got) {
    uint8_t* p = static_cast<uint8_t*>(data);
    got = 0;
    while (got < n) {
        ssize_t r = ::read(fd, p + got, n - got);
        if (r < 0) {
            if (errno == EINTR) continue;
            return IoStatus::kError;
        }
        if (r == 0) return IoStatus::kEof;
        got += static_cast<size_t>(r);
    }
    return IoStatus::kOk;
}

} // namespace hmmdc
