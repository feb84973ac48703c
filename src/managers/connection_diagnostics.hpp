#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <ssh/handshake_probe.hpp>
#include <ssh/remote_shell.hpp>

namespace fs = std::filesystem;

enum class FailureKind {
    None,
    Timeout,
    PermissionDenied,
    NoRoute,
    ConnectionRefused,
    HostKeyMismatch,
    NetworkUnreachable,
    HostUnresolved,
    Unknown,
};

const char* to_string(FailureKind kind);

struct ConnectionReport {
    bool ok = false;
    int exit_code = -1;
    std::string output;                          // ssh stdout + stderr
    FailureKind kind = FailureKind::None;
    std::vector<std::string> hints;
    std::optional<HandshakeReport> handshake;
    std::optional<std::string> remote_probe;     // output of the remote probe, if run
    std::optional<fs::path> log_path;            // saved diagnostic log
};

// Turns a failed ssh invocation into a failure class, remediation hints and
// a saved diagnostic log.
class ConnectionDiagnostics {
public:
    using HandshakeProbe = std::function<HandshakeReport(const std::string& host, int port,
                                                         const std::string& user,
                                                         int timeout_secs)>;

    // shell should carry a ConnectTimeout. probe defaults to probe_handshake().
    ConnectionDiagnostics(RemoteShell& shell, fs::path log_dir, bool remote_probe,
                          int connect_timeout, HandshakeProbe probe = nullptr,
                          StatusCallback callback = nullptr);

    // Match ssh's error wording, case-insensitive.
    static FailureKind classify(const std::string& output);

    static std::vector<std::string> hints_for(FailureKind kind, const RemoteTarget& target);

    // Failures below authentication: worth probing the network path.
    static bool is_network_class(FailureKind kind);

    // Run test_command over ssh. On failure: classify, hint, probe, save log.
    ConnectionReport test_connection(const RemoteTarget& target, const std::string& test_command);

    // Analyse a failure that already happened (any remote command).
    ConnectionReport diagnose(const RemoteTarget& target, const SSHResult& failure);

    static std::string remote_probe_command();

private:
    RemoteShell& shell_;
    fs::path log_dir_;
    bool remote_probe_;
    int connect_timeout_;
    HandshakeProbe probe_;
    StatusCallback callback_;

    // <log_dir>/<stamp>_<host>.log
    fs::path save_log(const RemoteTarget& target, const ConnectionReport& report);
    void status(const std::string& msg) const {
        if (callback_) callback_(msg);
    }
};
