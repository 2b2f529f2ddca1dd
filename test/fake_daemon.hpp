#pragma once

// In-process stand-in for the search daemon: answers each request read
// from one connection with the next scripted step.

#include "protocol/frame.hpp"
#include "protocol/messages.hpp"
#include "protocol/serializer.hpp"
#include "result/hit.hpp"
#include "util/socket_utils.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <sys/socket.h>
#include <unistd.h>

namespace fake_daemon {

using namespace hmmdc;

struct Step {
    std::vector<uint8_t> reply;
    std::vector<size_t> fragments;  // write the reply in chunks of these sizes first
    bool hang_up = false;           // close the connection after the reply
    bool stall = false;             // send nothing; wait for the client to go away
};

inline std::vector<uint8_t> ok_reply(const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> out;
    encode_status_header({static_cast<uint32_t>(StatusCode::kOk), payload.size()}, out);
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

inline std::vector<uint8_t> ok_reply(const SearchStats& stats, const std::vector<Hit>& hits) {
    return ok_reply(encode_search_payload(stats, hits));
}

inline std::vector<uint8_t> error_reply(uint32_t code, const std::string& msg) {
    std::vector<uint8_t> out;
    encode_status_header({code, msg.size()}, out);
    out.insert(out.end(), msg.begin(), msg.end());
    return out;
}

// A reported and included hit with ndom domains of ten alignment columns.
inline Hit sample_hit(uint64_t seqidx, float score, double lnP, uint32_t ndom = 1) {
    Hit h;
    h.seqidx = seqidx;
    h.name = "seq" + std::to_string(seqidx);
    h.sortkey = score;
    h.score = score;
    h.pre_score = score + 0.5f;
    h.sum_score = score;
    h.lnP = lnP;
    h.pre_lnP = lnP;
    h.sum_lnP = lnP;
    h.nexpected = 1.0f;
    h.nregions = 1;
    h.nenvelopes = ndom;
    h.flags = kHitReported | kHitIncluded;
    h.nreported = ndom;
    h.nincluded = ndom;
    for (uint32_t i = 0; i < ndom; i++) {
        Domain d;
        d.env_from = 1 + 20 * i;
        d.env_to = d.env_from + 11;
        d.ali_from = d.env_from + 1;
        d.ali_to = d.env_to - 1;
        d.envelope_score = score;
        d.bias = 0.25f;
        d.oasc = 9.0f;
        d.score = score - static_cast<float>(i);
        d.lnP = lnP;
        d.reported = true;
        d.included = true;
        d.scores_per_pos = {0.5f, 1.0f, 1.5f};

        Alignment& a = d.alignment;
        a.length = 10;
        a.hmm_from = 1;
        a.hmm_to = 10;
        a.hmm_length = 50;
        a.target_from = d.ali_from;
        a.target_to = d.ali_to;
        a.target_length = 300;
        a.hmm_name = "PF00001";
        a.target_name = h.name;
        a.hmm_sequence = "acdefghikl";
        a.identity_sequence = "ACDEF+HIKL";
        a.target_sequence = "ACDEFWHIKL";
        a.pp_line = "9999988999";
        h.domains.push_back(std::move(d));
    }
    return h;
}

inline SearchStats sample_stats(uint64_t nseqs = 1000) {
    SearchStats s;
    s.elapsed = 0.5;
    s.user = 0.4;
    s.sys = 0.1;
    s.Z = static_cast<double>(nseqs);
    s.domZ = 3.0;
    s.nmodels = 1;
    s.nnodes = 50;
    s.nseqs = nseqs;
    s.nres = nseqs * 300;
    s.n_past_msv = nseqs / 10;
    s.n_past_bias = nseqs / 20;
    s.n_past_vit = nseqs / 50;
    s.n_past_fwd = nseqs / 100;
    return s;
}

class FakeDaemon {
public:
    explicit FakeDaemon(std::vector<Step> steps) : steps_(std::move(steps)) {}

    ~FakeDaemon() {
        join();
        close_fd(listen_fd_);
    }

    FakeDaemon(const FakeDaemon&) = delete;
    FakeDaemon& operator=(const FakeDaemon&) = delete;

    // Serve over a socketpair. Returns the client end, -1 on error.
    int start_socketpair() {
        int fds[2];
        if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) return -1;
        int server_fd = fds[1];
        thread_ = std::thread([this, server_fd] { serve(server_fd); });
        return fds[0];
    }

    // Serve the first connection accepted on a loopback port.
    // Returns the port, 0 on error.
    uint16_t start_tcp() {
        listen_fd_ = tcp_listen_loopback(0);
        if (listen_fd_ < 0) return 0;
        uint16_t port = bound_port(listen_fd_);
        thread_ = std::thread([this] {
            int fd = accept_connection(listen_fd_);
            if (fd >= 0) serve(fd);
        });
        return port;
    }

    // Serve the first connection accepted on a UNIX domain socket.
    bool start_unix(const std::string& path) {
        listen_fd_ = unix_listen(path);
        if (listen_fd_ < 0) return false;
        thread_ = std::thread([this] {
            int fd = accept_connection(listen_fd_);
            if (fd >= 0) serve(fd);
        });
        return true;
    }

    void join() {
        if (thread_.joinable()) thread_.join();
    }

    // Requests received, terminator included. Read after join().
    const std::vector<std::string>& requests() const { return requests_; }

private:
    // Read up to and including the "\n//" terminator. False on EOF.
    static bool read_request(int fd, std::string& req) {
        req.clear();
        char c;
        for (;;) {
            ssize_t n = ::read(fd, &c, 1);
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) return false;
            req.push_back(c);
            if (req.size() >= 3 && req.compare(req.size() - 3, 3, "\n//") == 0) {
                return true;
            }
        }
    }

    static void wait_for_close(int fd) {
        char c;
        for (;;) {
            ssize_t n = ::read(fd, &c, 1);
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) return;
        }
    }

    void serve(int fd) {
        for (const auto& step : steps_) {
            std::string req;
            if (!read_request(fd, req)) break;
            requests_.push_back(req);

            if (step.stall) {
                wait_for_close(fd);
                break;
            }

            const std::vector<uint8_t>& reply = step.reply;
            size_t pos = 0;
            bool ok = true;
            for (size_t n : step.fragments) {
                n = std::min(n, reply.size() - pos);
                if (write_all(fd, reply.data() + pos, n) != IoStatus::kOk) {
                    ok = false;
                    break;
                }
                pos += n;
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
            }
            if (ok && pos < reply.size()) {
                ok = write_all(fd, reply.data() + pos, reply.size() - pos) == IoStatus::kOk;
            }
            if (!ok || step.hang_up) break;
        }
        close_fd(fd);
    }

    std::vector<Step> steps_;
    std::vector<std::string> requests_;
    std::thread thread_;
    int listen_fd_ = -1;
};

} // namespace fake_daemon
