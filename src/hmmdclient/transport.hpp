#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "protocol/frame.hpp"

namespace hmmdc {

// Owner of one connected stream socket. Reads and writes transfer
// exact lengths; the descriptor is closed on destruction.
//
// interrupt() may be called from another thread while a read or write
// is blocked; that call then fails and cancelled() becomes true.
class Transport {
public:
    Transport() = default;
    ~Transport();

    Transport(const Transport&) = delete;
    Transport& operator=(const Transport&) = delete;

    // Connect to a TCP endpoint or UNIX socket. On failure returns false,
    // sets error_msg, and the transport stays closed.
    bool connect_tcp(const std::string& host, uint16_t port, std::string& error_msg);
    bool connect_unix(const std::string& path, std::string& error_msg);

    // Take ownership of an already connected descriptor.
    void adopt(int fd);

    bool is_open() const { return fd_.load() >= 0; }

    // Write the whole buffer. kError on a broken connection.
    IoStatus send_all(const void* data, size_t n);

    // Read exactly n bytes into buf (resized to n). Never yields a short
    // buffer: on kEof/kError buf is cleared.
    IoStatus receive_exact(size_t n, std::vector<uint8_t>& buf);

    // Shut the socket down so blocked I/O returns. Thread-safe.
    void interrupt();
    bool cancelled() const { return cancelled_.load(); }

    // Shut the socket down and release the descriptor. Idempotent.
    // Like interrupt(), makes a call blocked in another thread fail.
    void close();

    // errno of the last failed operation
    int last_errno() const { return last_errno_; }

    // Counters since construction
    size_t send_calls() const { return send_calls_; }
    uint64_t bytes_sent() const { return bytes_sent_; }
    uint64_t bytes_received() const { return bytes_received_; }

private:
    std::atomic<int> fd_{-1};
    std::atomic<bool> cancelled_{false};
    std::mutex lifecycle_mu_;  // serializes interrupt() against close()
    int last_errno_ = 0;
    size_t send_calls_ = 0;
    uint64_t bytes_sent_ = 0;
    uint64_t bytes_received_ = 0;
};

} // namespace hmmdc
