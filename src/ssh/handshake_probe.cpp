#include "handshake_probe.hpp"
#include <core/utils.hpp>
#include <managers/job_log.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <chrono>

namespace {

// Owns the socket and libssh2 session for one probe.
struct ProbeConnection {
    socket_t sock = REMORA_INVALID_SOCKET;
    LIBSSH2_SESSION* session = nullptr;

    ~ProbeConnection() {
        if (session) {
            libssh2_session_disconnect(session, "probe done");
            libssh2_session_free(session);
        }
        if (sock != REMORA_INVALID_SOCKET) platform::close_socket(sock);
    }
};

using Clock = std::chrono::steady_clock;

bool expired(Clock::time_point deadline) {
    return Clock::now() >= deadline;
}

std::string fingerprint_sha256(LIBSSH2_SESSION* session) {
    const char* hash = libssh2_hostkey_hash(session, LIBSSH2_HOSTKEY_HASH_SHA256);
    if (!hash) return "";
    std::string b64 = base64_encode(std::string(hash, 32));
    while (!b64.empty() && b64.back() == '=') b64.pop_back();
    return "SHA256:" + b64;
}

} // namespace

HandshakeReport probe_handshake(const std::string& host, int port, const std::string& user,
                                int timeout_secs) {
    HandshakeReport report;
    auto deadline = Clock::now() + std::chrono::seconds(timeout_secs);

    if (libssh2_init(0) != 0) {
        report.error = "Failed to initialize libssh2";
        return report;
    }

    ProbeConnection conn;
    auto sock = platform::tcp_connect(host, port, timeout_secs * 1000);
    if (sock.is_err()) {
        report.error = sock.error;
        remora_log(fmt::format("probe {}:{} tcp: {}", host, port, report.error));
        return report;
    }
    conn.sock = sock.value;
    report.tcp_ok = true;

    conn.session = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!conn.session) {
        report.error = "Failed to create SSH session";
        return report;
    }
    libssh2_session_set_blocking(conn.session, 0);

    int rc;
    while ((rc = libssh2_session_handshake(conn.session, conn.sock)) == LIBSSH2_ERROR_EAGAIN) {
        if (expired(deadline)) {
            report.error = "SSH handshake timed out";
            return report;
        }
        platform::poll_socket(conn.sock, POLLIN, 100);
    }
    if (rc != 0) {
        char* msg = nullptr;
        libssh2_session_last_error(conn.session, &msg, nullptr, 0);
        report.error = fmt::format("SSH handshake failed: {}", msg ? msg : "unknown error");
        return report;
    }
    report.handshake_ok = true;

    if (const char* banner = libssh2_session_banner_get(conn.session)) {
        report.banner = banner;
    }
    report.fingerprint = fingerprint_sha256(conn.session);

    // Ask which methods the server offers; "none" auth may also just succeed.
    char* methods = nullptr;
    while (true) {
        methods = libssh2_userauth_list(conn.session, user.c_str(),
                                        static_cast<unsigned int>(user.size()));
        if (methods) break;
        if (libssh2_userauth_authenticated(conn.session)) {
            report.auth_methods = "none";
            break;
        }
        if (libssh2_session_last_errno(conn.session) != LIBSSH2_ERROR_EAGAIN) {
            report.error = "Could not list authentication methods";
            break;
        }
        if (expired(deadline)) {
            report.error = "Authentication method query timed out";
            break;
        }
        platform::poll_socket(conn.sock, POLLIN, 100);
    }
    if (methods) report.auth_methods = methods;

    remora_log(fmt::format("probe {}:{} banner='{}' key={} auth={}", host, port,
                           report.banner, report.fingerprint, report.auth_methods));
    return report;
}
