#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/types.hpp"
#include "hmmdclient/client_error.hpp"
#include "hmmdclient/transport.hpp"
#include "pipeline/pipeline_config.hpp"
#include "query/query.hpp"
#include "result/seqdb_range.hpp"
#include "result/top_hits.hpp"
#include "util/logger.hpp"

namespace hmmdc {

// Where the daemon listens: a TCP host:port, or a UNIX socket path when
// socket_path is non-empty.
struct Endpoint {
    std::string host = DEFAULT_HOST;
    uint16_t port = DEFAULT_PORT;
    std::string socket_path;

    bool is_unix() const { return !socket_path.empty(); }
    std::string describe() const;
};

enum class SessionState : uint8_t {
    kDisconnected    = 0,
    kConnected       = 1,
    kAwaitingStatus  = 2,
    kAwaitingPayload = 3,
    kIdle            = 4,
    kClosed          = 5,
};

const char* session_state_name(SessionState s);

// Integrity findings of the last successful call.
struct DecodeReport {
    uint64_t nhits = 0;
    size_t offset_mismatches = 0;
    size_t trailing_bytes = 0;
};

using SeqdbRanges = std::optional<std::vector<SeqdbRange>>;

// One connection to an hmmpgmd-style daemon. Calls are strictly
// sequential; open several clients for concurrent queries.
//
// Every search/scan call either fills `out` completely and returns true,
// or returns false with err set and leaves `out` untouched.
class Client {
public:
    Client(Endpoint endpoint, const Logger& logger);
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // Disconnected -> Connected. A no-op when already connected; fails
    // once the client is Closed.
    bool connect(ClientError& err);

    // Use an already connected descriptor; the client takes ownership.
    // A Closed client closes fd and stays Closed.
    void attach(int fd);

    // Release the connection. Idempotent; the client is then Closed.
    // May be called from another thread: a call blocked there fails
    // with kTransport.
    void close();

    // Abort a call blocked in another thread. That call fails with
    // kTransport.
    void cancel();

    // Search a sequence database (--seqdb). ranges, when given, must be
    // a non-empty list of valid ranges.
    bool search_sequence(const SequenceQuery& query, uint32_t db,
                         const SeqdbRanges& ranges, const PipelineOptions& options,
                         TopHits& out, ClientError& err);
    bool search_alignment(const AlignmentQuery& query, uint32_t db,
                          const SeqdbRanges& ranges, const PipelineOptions& options,
                          TopHits& out, ClientError& err);
    bool search_model(const ProfileQuery& query, uint32_t db,
                      const SeqdbRanges& ranges, const PipelineOptions& options,
                      TopHits& out, ClientError& err);

    // Scan a sequence against a profile database (--hmmdb).
    bool scan_sequence(const SequenceQuery& query, uint32_t db,
                       const PipelineOptions& options,
                       TopHits& out, ClientError& err);

    SessionState state() const { return state_.load(); }
    const Endpoint& endpoint() const { return endpoint_; }
    const DecodeReport& last_report() const { return report_; }
    const Transport& transport() const { return transport_; }

private:
    bool run(SearchMode mode, const Query& query, uint32_t db,
             const SeqdbRanges& ranges, const PipelineOptions& options,
             TopHits& out, ClientError& err);

    // Fail the current exchange: sets err, drops the connection and
    // returns false.
    bool fail_exchange(ClientErrorKind kind, std::string msg, ClientError& err);
    bool fail_io(IoStatus st, const char* what, ClientError& err);

    // Move to s unless the client has been closed.
    void set_state(SessionState s);

    bool decode_payload(const std::vector<uint8_t>& payload, SearchStats& stats,
                        std::vector<Hit>& hits, DecodeReport& report,
                        std::string& error_msg) const;

    Endpoint endpoint_;
    const Logger& logger_;
    Transport transport_;
    std::atomic<SessionState> state_{SessionState::kDisconnected};
    DecodeReport report_;
};

// Connects on construction and closes on destruction.
class ScopedSession {
public:
    ScopedSession(Endpoint endpoint, const Logger& logger);
    ~ScopedSession();

    ScopedSession(const ScopedSession&) = delete;
    ScopedSession& operator=(const ScopedSession&) = delete;

    bool ok() const { return connected_; }
    const ClientError& error() const { return error_; }
    Client& client() { return client_; }
    Client* operator->() { return &client_; }

private:
    Client client_;
    ClientError error_;
    bool connected_ = false;
};

} // namespace hmmdc
