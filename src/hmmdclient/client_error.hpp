#pragma once

#include <cstdint>
#include <string>

namespace hmmdc {

enum class ClientErrorKind : uint8_t {
    kNone          = 0,
    kValidation    = 1,  // bad caller input; nothing was sent
    kConnection    = 2,  // could not connect
    kTransport     = 3,  // I/O failure or cancellation mid-exchange
    kUnexpectedEof = 4,  // peer closed before a complete record arrived
    kProtocol      = 5,  // malformed status header or payload
    kServer        = 6,  // daemon reported a failure status
};

const char* client_error_kind_name(ClientErrorKind kind);

struct ClientError {
    ClientErrorKind kind = ClientErrorKind::kNone;
    uint32_t server_status = 0;  // daemon status code (kServer only)
    std::string message;

    bool ok() const { return kind == ClientErrorKind::kNone; }

    void set(ClientErrorKind k, std::string msg, uint32_t status = 0) {
        kind = k;
        message = std::move(msg);
        server_status = status;
    }

    void reset() {
        kind = ClientErrorKind::kNone;
        server_status = 0;
        message.clear();
    }

    // "<kind>: <message>", with the status name for server errors
    std::string describe() const;
};

} // namespace hmmdc
