#pragma once

#include <cstdint>
#include <string>

namespace hmmdc {

// All functions return -1 on error with errno describing the failure.

// Create a UNIX domain socket, bind, and listen.
// Returns listening fd on success, -1 on error.
// Removes existing socket file if present.
int unix_listen(const std::string& path, int backlog = 16);

// Create a TCP socket bound to the loopback interface and listen.
// port 0 picks an ephemeral port; see bound_port().
int tcp_listen_loopback(uint16_t port, int backlog = 16);

// Port a listening TCP socket is bound to, 0 on error.
uint16_t bound_port(int listen_fd);

// Accept a connection from a listening socket.
// Returns connected fd on success, -1 on error.
int accept_connection(int listen_fd);

// Connect to a UNIX domain socket.
int unix_connect(const std::string& path);

// Connect to a TCP endpoint. host may be a name or a numeric
// IPv4/IPv6 address; every resolved address is tried in turn.
int tcp_connect(const std::string& host, uint16_t port);

// Shut both directions of a connected socket down without closing it.
// A thread blocked in read() on the socket wakes up with EOF.
void shutdown_socket(int fd);

// Close a file descriptor safely (ignoring EINTR).
void close_fd(int fd);

// Parse "host:port" (or "[v6addr]:port"). Returns false on invalid format.
bool parse_host_port(const std::string& addr, std::string& host, uint16_t& port);

} // namespace hmmdc
