#include "hmmdclient/socket_client.hpp"

#include <algorithm>
#include <cstring>
#include <utility>

#include "protocol/byte_io.hpp"
#include "protocol/messages.hpp"
#include "protocol/serializer.hpp"
#include "protocol/wire_schema.hpp"
#include "util/socket_utils.hpp"
#include "util/utf8.hpp"

namespace hmmdc {

std::string Endpoint::describe() const {
    if (is_unix()) return "unix:" + socket_path;
    if (host.find(':') != std::string::npos) {
        return "[" + host + "]:" + std::to_string(port);
    }
    return host + ":" + std::to_string(port);
}

const char* session_state_name(SessionState s) {
    switch (s) {
        case SessionState::kDisconnected:    return "disconnected";
        case SessionState::kConnected:       return "connected";
        case SessionState::kAwaitingStatus:  return "awaiting status";
        case SessionState::kAwaitingPayload: return "awaiting payload";
        case SessionState::kIdle:            return "idle";
        case SessionState::kClosed:          return "closed";
    }
    return "unknown";
}

Client::Client(Endpoint endpoint, const Logger& logger)
    : endpoint_(std::move(endpoint)), logger_(logger) {}

Client::~Client() {
    close();
}

void Client::set_state(SessionState s) {
    SessionState cur = state_.load();
    while (cur != SessionState::kClosed && !state_.compare_exchange_weak(cur, s)) {
    }
}

bool Client::connect(ClientError& err) {
    err.reset();
    if (state_ == SessionState::kClosed) {
        err.set(ClientErrorKind::kConnection, "session is closed");
        return false;
    }
    if (state_ != SessionState::kDisconnected) return true;

    std::string msg;
    bool ok = endpoint_.is_unix()
        ? transport_.connect_unix(endpoint_.socket_path, msg)
        : transport_.connect_tcp(endpoint_.host, endpoint_.port, msg);
    if (!ok) {
        err.set(ClientErrorKind::kConnection, msg);
        set_state(SessionState::kDisconnected);
        return false;
    }
    logger_.debug("Connected to %s", endpoint_.describe().c_str());
    set_state(SessionState::kConnected);
    return true;
}

void Client::attach(int fd) {
    if (state_.load() == SessionState::kClosed) {
        logger_.warn("Session is closed; not attaching descriptor %d", fd);
        close_fd(fd);
        return;
    }
    transport_.adopt(fd);
    set_state(SessionState::kConnected);
}

void Client::close() {
    if (state_.load() == SessionState::kClosed) return;
    transport_.close();
    state_.store(SessionState::kClosed);
}

void Client::cancel() {
    transport_.interrupt();
}

bool Client::search_sequence(const SequenceQuery& query, uint32_t db,
                             const SeqdbRanges& ranges, const PipelineOptions& options,
                             TopHits& out, ClientError& err) {
    return run(SearchMode::kSearch, query, db, ranges, options, out, err);
}

bool Client::search_alignment(const AlignmentQuery& query, uint32_t db,
                              const SeqdbRanges& ranges, const PipelineOptions& options,
                              TopHits& out, ClientError& err) {
    return run(SearchMode::kSearch, query, db, ranges, options, out, err);
}

bool Client::search_model(const ProfileQuery& query, uint32_t db,
                          const SeqdbRanges& ranges, const PipelineOptions& options,
                          TopHits& out, ClientError& err) {
    return run(SearchMode::kSearch, query, db, ranges, options, out, err);
}

bool Client::scan_sequence(const SequenceQuery& query, uint32_t db,
                           const PipelineOptions& options,
                           TopHits& out, ClientError& err) {
    return run(SearchMode::kScan, query, db, std::nullopt, options, out, err);
}

bool Client::fail_exchange(ClientErrorKind kind, std::string msg, ClientError& err) {
    if (transport_.cancelled()) {
        kind = ClientErrorKind::kTransport;
        msg = "operation cancelled";
    }
    err.set(kind, std::move(msg));
    // The stream position is unknown; the connection cannot be reused.
    transport_.close();
    set_state(SessionState::kDisconnected);
    return false;
}

bool Client::fail_io(IoStatus st, const char* what, ClientError& err) {
    if (st == IoStatus::kEof) {
        return fail_exchange(ClientErrorKind::kUnexpectedEof,
                             std::string("connection closed while ") + what, err);
    }
    return fail_exchange(ClientErrorKind::kTransport,
                         std::string("I/O error while ") + what + ": " +
                             std::strerror(transport_.last_errno()),
                         err);
}

bool Client::run(SearchMode mode, const Query& query, uint32_t db,
                 const SeqdbRanges& ranges, const PipelineOptions& options,
                 TopHits& out, ClientError& err) {
    err.reset();

    // Validation, before any I/O.
    std::string msg;
    if (ranges.has_value()) {
        if (ranges->empty()) {
            err.set(ClientErrorKind::kValidation, "seqdb ranges must not be empty");
            return false;
        }
        for (const auto& range : *ranges) {
            if (!validate_range(range, msg)) {
                err.set(ClientErrorKind::kValidation, msg);
                return false;
            }
        }
    }
    if (!query.validate(msg)) {
        err.set(ClientErrorKind::kValidation, msg);
        return false;
    }
    PipelineConfig config;
    if (!build_pipeline_config(options, config, msg)) {
        err.set(ClientErrorKind::kValidation, msg);
        return false;
    }
    SessionState cur = state_.load();
    if (cur != SessionState::kConnected && cur != SessionState::kIdle) {
        err.set(ClientErrorKind::kConnection,
                std::string("session is ") + session_state_name(cur));
        return false;
    }

    // Request: command line, query body, terminator.
    std::string request = encode_request_line(
        mode, db, ranges.has_value() ? &*ranges : nullptr, render_options(config));
    query.serialize(request);
    request.append(REQUEST_TERMINATOR, REQUEST_TERMINATOR_SIZE);

    logger_.debug("%s %s against db %u on %s", search_mode_name(mode),
                  query.name().c_str(), db, endpoint_.describe().c_str());

    IoStatus st = transport_.send_all(request.data(), request.size());
    if (st != IoStatus::kOk) return fail_io(st, "sending request", err);
    set_state(SessionState::kAwaitingStatus);

    std::vector<uint8_t> buf;
    st = transport_.receive_exact(STATUS_HEADER_SIZE, buf);
    if (st != IoStatus::kOk) return fail_io(st, "reading status", err);

    SearchStatus status;
    if (!decode_status_header(buf.data(), buf.size(), status, msg)) {
        return fail_exchange(ClientErrorKind::kProtocol, msg, err);
    }
    set_state(SessionState::kAwaitingPayload);

    if (status.status != static_cast<uint32_t>(StatusCode::kOk)) {
        if (status.msg_size > MAX_ERROR_MESSAGE_SIZE) {
            return fail_exchange(ClientErrorKind::kProtocol,
                                 "error message of " + std::to_string(status.msg_size) +
                                     " bytes exceeds limit",
                                 err);
        }
        st = transport_.receive_exact(static_cast<size_t>(status.msg_size), buf);
        if (st != IoStatus::kOk) return fail_io(st, "reading error message", err);

        err.set(ClientErrorKind::kServer, sanitize_utf8(buf.data(), buf.size()),
                status.status);
        logger_.debug("Daemon reported %s", status_name(status.status));
        set_state(SessionState::kIdle);
        return false;
    }

    if (status.msg_size > MAX_PAYLOAD_SIZE) {
        return fail_exchange(ClientErrorKind::kProtocol,
                             "payload of " + std::to_string(status.msg_size) +
                                 " bytes exceeds limit",
                             err);
    }
    st = transport_.receive_exact(static_cast<size_t>(status.msg_size), buf);
    if (st != IoStatus::kOk) return fail_io(st, "reading results", err);

    SearchStats stats;
    std::vector<Hit> hits;
    DecodeReport report;
    if (!decode_payload(buf, stats, hits, report, msg)) {
        return fail_exchange(ClientErrorKind::kProtocol, msg, err);
    }

    Alphabet alphabet = query.alphabet();
    if (alphabet == Alphabet::kUnknown) alphabet = Alphabet::kAmino;

    TopHits result(mode, config, alphabet);
    result.set_query_name(query.name());
    result.set_stats(stats);
    result.reserve(hits.size());
    for (auto& h : hits) {
        result.append(std::move(h));
    }
    result.mark_sorted(SortBy::kKey);

    out = std::move(result);
    report_ = report;
    set_state(SessionState::kIdle);
    logger_.debug("%s: %lu hits (%lu reported, %lu included)", query.name().c_str(),
                  static_cast<unsigned long>(out.size()),
                  static_cast<unsigned long>(out.nreported()),
                  static_cast<unsigned long>(out.nincluded()));
    return true;
}

bool Client::decode_payload(const std::vector<uint8_t>& payload, SearchStats& stats,
                            std::vector<Hit>& hits, DecodeReport& report,
                            std::string& error_msg) const {
    ByteReader r(payload.data(), payload.size());
    if (!decode_search_stats(r, stats, error_msg)) return false;

    const size_t region_start = r.pos();
    hits.clear();
    hits.reserve(static_cast<size_t>(
        std::min<uint64_t>(stats.nhits, r.remaining() / HIT_FIXED_SIZE)));

    // The cursor, not the offset table, decides where each record starts.
    for (uint64_t i = 0; i < stats.nhits; i++) {
        uint64_t offset = r.pos() - region_start;
        if (offset != stats.hit_offsets[i]) {
            report.offset_mismatches++;
            logger_.warn("Hit %lu starts at offset %lu, offset table says %lu",
                         static_cast<unsigned long>(i),
                         static_cast<unsigned long>(offset),
                         static_cast<unsigned long>(stats.hit_offsets[i]));
        }
        Hit h;
        if (!decode_hit(r, h, error_msg)) {
            error_msg = "hit " + std::to_string(i) + ": " + error_msg;
            return false;
        }
        hits.push_back(std::move(h));
    }

    if (hits.size() != stats.nhits) {
        error_msg = "decoded " + std::to_string(hits.size()) + " hits, expected " +
                    std::to_string(stats.nhits);
        return false;
    }

    report.nhits = stats.nhits;
    report.trailing_bytes = r.remaining();
    if (report.trailing_bytes > 0) {
        logger_.warn("%lu unused bytes after the last hit",
                     static_cast<unsigned long>(report.trailing_bytes));
    }
    return true;
}

ScopedSession::ScopedSession(Endpoint endpoint, const Logger& logger)
    : client_(std::move(endpoint), logger) {
    connected_ = client_.connect(error_);
}

ScopedSession::~ScopedSession() {
    client_.close();
}

} // namespace hmmdc
