#pragma once

#include <cstddef>
#include <cstdint>

namespace hmmdc {

// Outcome of a blocking exact-length transfer.
enum class IoStatus : uint8_t {
    kOk    = 0,
    kEof   = 1,  // peer closed before the requested length arrived
    kError = 2,  // read/write failed; errno holds the cause
};

// Write exactly n bytes to fd, retrying partial writes and EINTR.
// Uses send(MSG_NOSIGNAL) on sockets so a broken pipe is reported as
// kError instead of raising SIGPIPE.
IoStatus write_all(int fd, const void* data, size_t n);

// Read exactly n bytes from fd, looping over short reads.
// got receives the number of bytes delivered before any failure.
IoStatus read_all(int fd, void* data, size_t n, size_t& got);

} // namespace hmmdc
