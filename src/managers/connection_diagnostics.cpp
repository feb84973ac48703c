#include "connection_diagnostics.hpp"
#include "job_log.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <stdexcept>

const char* to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::None:               return "none";
        case FailureKind::Timeout:            return "timeout";
        case FailureKind::PermissionDenied:   return "permission denied";
        case FailureKind::NoRoute:            return "no route to host";
        case FailureKind::ConnectionRefused:  return "connection refused";
        case FailureKind::HostKeyMismatch:    return "host key mismatch";
        case FailureKind::NetworkUnreachable: return "network unreachable";
        case FailureKind::HostUnresolved:     return "host not resolved";
        case FailureKind::Unknown:            return "unknown";
    }
    return "unknown";
}

ConnectionDiagnostics::ConnectionDiagnostics(RemoteShell& shell, fs::path log_dir,
                                             bool remote_probe, int connect_timeout,
                                             HandshakeProbe probe, StatusCallback callback)
    : shell_(shell), log_dir_(std::move(log_dir)), remote_probe_(remote_probe),
      connect_timeout_(connect_timeout), probe_(std::move(probe)),
      callback_(std::move(callback)) {
    if (!probe_) probe_ = probe_handshake;
}

// ── Classification ───────────────────────────────────────────

FailureKind ConnectionDiagnostics::classify(const std::string& output) {
    // Most specific first: a host-key failure also mentions "verification failed",
    // a refused banner exchange can also say "timed out".
    static const std::vector<std::pair<const char*, FailureKind>> phrases = {
        {"remote host identification has changed", FailureKind::HostKeyMismatch},
        {"host key verification failed",           FailureKind::HostKeyMismatch},
        {"permission denied",                      FailureKind::PermissionDenied},
        {"connection refused",                     FailureKind::ConnectionRefused},
        {"no route to host",                       FailureKind::NoRoute},
        {"network is unreachable",                 FailureKind::NetworkUnreachable},
        {"could not resolve hostname",             FailureKind::HostUnresolved},
        {"name or service not known",              FailureKind::HostUnresolved},
        {"timed out",                              FailureKind::Timeout},
        {"timeout",                                FailureKind::Timeout},
    };
    for (const auto& [phrase, kind] : phrases) {
        if (contains_ci(output, phrase)) return kind;
    }
    return FailureKind::Unknown;
}

bool ConnectionDiagnostics::is_network_class(FailureKind kind) {
    switch (kind) {
        case FailureKind::Timeout:
        case FailureKind::NoRoute:
        case FailureKind::ConnectionRefused:
        case FailureKind::NetworkUnreachable:
        case FailureKind::HostUnresolved:
            return true;
        default:
            return false;
    }
}

std::vector<std::string> ConnectionDiagnostics::hints_for(FailureKind kind,
                                                          const RemoteTarget& target) {
    int port = target.port.value_or(22);
    switch (kind) {
        case FailureKind::None:
            return {};
        case FailureKind::Timeout:
            return {
                fmt::format("Check that the instance is running and {} is its current address", target.host),
                fmt::format("Make sure the firewall or security group allows inbound TCP {}", port),
                "Raise ssh.connect_timeout if the link is slow",
            };
        case FailureKind::PermissionDenied:
            return {
                fmt::format("Check that ssh.user ({}) is the login user for this image", target.user),
                "Check that ssh.keyfile is the private key whose public half is in ~/.ssh/authorized_keys on the host",
                "The key file must not be readable by others: chmod 600 <keyfile>",
            };
        case FailureKind::NoRoute:
            return {
                fmt::format("No route to {}: verify the address, VPN and local routing", target.host),
                "The instance may still be booting or may have been destroyed",
            };
        case FailureKind::ConnectionRefused:
            return {
                fmt::format("Nothing listens on port {}: check sshd with 'systemctl status ssh' from the provider console", port),
                "Verify ssh.port matches the Port line in /etc/ssh/sshd_config",
            };
        case FailureKind::HostKeyMismatch:
            return {
                "The host key changed, usually because the instance was rebuilt or the IP reused",
                fmt::format("Remove the stale entry: ssh-keygen -R {}", target.host),
            };
        case FailureKind::NetworkUnreachable:
            return {
                "The local network cannot reach the host: check your connection",
                "An IPv6-only address needs a working IPv6 route",
            };
        case FailureKind::HostUnresolved:
            return {
                fmt::format("'{}' does not resolve: check ssh.host for typos", target.host),
                "Use the instance's IP address if DNS is not set up",
            };
        case FailureKind::Unknown:
            return {
                fmt::format("Re-run by hand for details: ssh -vvv {}", target.destination()),
            };
    }
    return {};
}

std::string ConnectionDiagnostics::remote_probe_command() {
    return "bash -lc " + shell_quote(
        "echo '== sshd status'; systemctl is-active ssh || systemctl is-active sshd || echo 'sshd not running'; "
        "echo '== listening'; sudo -n ss -tlnp 2>/dev/null | grep sshd || echo 'no sshd listener found'; "
        "echo '== firewall'; sudo -n ufw status 2>/dev/null || echo 'ufw not available'; "
        "echo '== sshd_config'; sudo -n grep -E '^(Port|PermitRootLogin|PasswordAuthentication)' /etc/ssh/sshd_config || echo 'sshd_config unreadable'; "
        "echo '== public ip'; curl -s --max-time 5 ifconfig.me || echo 'public IP unknown'");
}

// ── Connection test ──────────────────────────────────────────

ConnectionReport ConnectionDiagnostics::test_connection(const RemoteTarget& target,
                                                        const std::string& test_command) {
    require_target(target);
    if (test_command.empty()) throw std::invalid_argument("test command is empty");

    status(fmt::format("Testing {} (port {})", target.destination(), target.port.value_or(22)));
    auto r = shell_.run(target, "bash -lc " + shell_quote(test_command));
    if (r.success()) {
        ConnectionReport report;
        report.ok = true;
        report.exit_code = 0;
        report.output = r.combined();
        return report;
    }
    return diagnose(target, r);
}

ConnectionReport ConnectionDiagnostics::diagnose(const RemoteTarget& target,
                                                 const SSHResult& failure) {
    ConnectionReport report;
    report.ok = false;
    report.exit_code = failure.exit_code;
    report.output = failure.combined();
    report.kind = classify(report.output);
    report.hints = hints_for(report.kind, target);
    remora_log(fmt::format("connection to {} failed exit={} kind={}",
                           target.host, failure.exit_code, to_string(report.kind)));

    status("Probing SSH handshake");
    report.handshake = probe_(target.host, target.port.value_or(22), target.user,
                              std::min(connect_timeout_, PROBE_CONNECT_TIMEOUT_SECS));

    if (is_network_class(report.kind) && remote_probe_) {
        status("Running remote diagnostic probe");
        auto probe = shell_.run(target, remote_probe_command());
        report.remote_probe = probe.success()
            ? probe.stdout_data
            : fmt::format("probe failed (exit {}): {}", probe.exit_code, probe.combined());
    }

    try {
        report.log_path = save_log(target, report);
    } catch (const std::exception& e) {
        remora_log(std::string("could not save diagnostic log: ") + e.what());
        status(std::string("Could not save diagnostic log: ") + e.what());
    }
    return report;
}

fs::path ConnectionDiagnostics::save_log(const RemoteTarget& target,
                                         const ConnectionReport& report) {
    fs::create_directories(log_dir_);
    fs::path path = log_dir_ / fmt::format("{}_{}.log", now_stamp(), sanitize_host(target.host));

    std::ofstream out(path);
    if (!out) throw std::runtime_error("cannot write " + path.string());

    out << "time:        " << now_iso() << "\n";
    out << "target:      " << target.destination() << ":" << target.port.value_or(22) << "\n";
    out << "exit code:   " << report.exit_code << "\n";
    out << "class:       " << to_string(report.kind) << "\n";
    out << "\n== ssh output\n" << report.output << "\n";

    out << "\n== hints\n";
    for (const auto& h : report.hints) out << "- " << h << "\n";

    if (report.handshake) {
        const auto& hs = *report.handshake;
        out << "\n== handshake probe\n";
        out << "tcp:         " << (hs.tcp_ok ? "ok" : "failed") << "\n";
        out << "handshake:   " << (hs.handshake_ok ? "ok" : "failed") << "\n";
        if (!hs.banner.empty()) out << "banner:      " << hs.banner << "\n";
        if (!hs.fingerprint.empty()) out << "host key:    " << hs.fingerprint << "\n";
        if (!hs.auth_methods.empty()) out << "auth:        " << hs.auth_methods << "\n";
        if (!hs.error.empty()) out << "error:       " << hs.error << "\n";
    }
    if (report.remote_probe) {
        out << "\n== remote probe\n" << *report.remote_probe << "\n";
    }
    return path;
}
