#pragma once

#include <string>

// What a bare SSH handshake against a host revealed, without logging in.
struct HandshakeReport {
    bool tcp_ok = false;
    bool handshake_ok = false;
    std::string banner;           // server identification string
    std::string fingerprint;      // "SHA256:<base64>" of the host key
    std::string auth_methods;     // comma list offered for the user
    std::string error;            // first failure, empty when everything worked
};

// TCP connect (bounded by timeout_secs), key exchange via libssh2, host-key
// fingerprint and the authentication methods the server offers for user.
HandshakeReport probe_handshake(const std::string& host, int port, const std::string& user,
                                int timeout_secs);
