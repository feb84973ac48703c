#pragma once

// Socket helpers for the SSH handshake probe.

#include <poll.h>
#include <string>
#include <core/types.hpp>

using socket_t = int;
#define REMORA_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

// Resolve host and open a non-blocking TCP connection, giving up after
// timeout_ms. Errors carry the system's wording ("Connection refused",
// "No route to host", ...) so they classify like ssh's own messages.
Result<socket_t> tcp_connect(const std::string& host, int port, int timeout_ms);

} // namespace platform
