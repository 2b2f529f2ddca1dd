#include "hmmdclient/client_error.hpp"

#include "protocol/messages.hpp"

namespace hmmdc {

const char* client_error_kind_name(ClientErrorKind kind) {
    switch (kind) {
        case ClientErrorKind::kNone:          return "ok";
        case ClientErrorKind::kValidation:    return "validation error";
        case ClientErrorKind::kConnection:    return "connection error";
        case ClientErrorKind::kTransport:     return "transport error";
        case ClientErrorKind::kUnexpectedEof: return "unexpected end of stream";
        case ClientErrorKind::kProtocol:      return "protocol error";
        case ClientErrorKind::kServer:        return "server error";
    }
    return "unknown error";
}

std::string ClientError::describe() const {
    std::string s = client_error_kind_name(kind);
    if (kind == ClientErrorKind::kServer) {
        s += " ";
        s += std::to_string(server_status);
        s += " (";
        s += status_name(server_status);
        s += ")";
    }
    if (!message.empty()) {
        s += ": ";
        s += message;
    }
    return s;
}

} // namespace hmmdc
