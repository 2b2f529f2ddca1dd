#include "hmmdclient/transport.hpp"

#include <cerrno>
#include <cstring>

#include "util/socket_utils.hpp"

namespace hmmdc {

Transport::~Transport() {
    close();
}

bool Transport::connect_tcp(const std::string& host, uint16_t port, std::string& error_msg) {
    close();
    int fd = tcp_connect(host, port);
    if (fd < 0) {
        last_errno_ = errno;
        error_msg = "cannot connect to " + host + ":" + std::to_string(port) +
                    ": " + std::strerror(last_errno_);
        return false;
    }
    adopt(fd);
    return true;
}

bool Transport::connect_unix(const std::string& path, std::string& error_msg) {
    close();
    int fd = unix_connect(path);
    if (fd < 0) {
        last_errno_ = errno;
        error_msg = "cannot connect to UNIX socket " + path + ": " +
                    std::strerror(last_errno_);
        return false;
    }
    adopt(fd);
    return true;
}

void Transport::adopt(int fd) {
    close();
    std::lock_guard<std::mutex> lock(lifecycle_mu_);
    cancelled_ = false;
    fd_ = fd;
}

IoStatus Transport::send_all(const void* data, size_t n) {
    send_calls_++;
    int fd = fd_.load();
    if (fd < 0) {
        last_errno_ = EBADF;
        return IoStatus::kError;
    }
    IoStatus st = write_all(fd, data, n);
    if (st == IoStatus::kOk) {
        bytes_sent_ += n;
    } else {
        last_errno_ = errno;
    }
    return st;
}

IoStatus Transport::receive_exact(size_t n, std::vector<uint8_t>& buf) {
    int fd = fd_.load();
    if (fd < 0) {
        last_errno_ = EBADF;
        buf.clear();
        return IoStatus::kError;
    }
    buf.resize(n);
    size_t got = 0;
    IoStatus st = read_all(fd, buf.data(), n, got);
    bytes_received_ += got;
    if (st != IoStatus::kOk) {
        last_errno_ = (st == IoStatus::kError) ? errno : 0;
        buf.clear();
    }
    return st;
}

void Transport::interrupt() {
    std::lock_guard<std::mutex> lock(lifecycle_mu_);
    int fd = fd_.load();
    if (fd >= 0) {
        cancelled_ = true;
        shutdown_socket(fd);
    }
}

// A read blocked in another thread does not return when the descriptor
// is closed under it; shut the socket down first.
void Transport::close() {
    std::lock_guard<std::mutex> lock(lifecycle_mu_);
    int fd = fd_.exchange(-1);
    if (fd < 0) return;
    cancelled_ = true;
    shutdown_socket(fd);
    close_fd(fd);
}

} // namespace hmmdc
