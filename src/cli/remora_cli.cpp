#include "remora_cli.hpp"
#include "preflight.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <managers/job_log.hpp>
#include <managers/log_mirror.hpp>
#include <managers/remote_maintenance.hpp>
#include <managers/session_manager.hpp>
#include <managers/transfer_engine.hpp>
#include <platform/terminal.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <iostream>

// ssh exits 255 when the connection itself failed
static constexpr int SSH_CONNECTION_FAILED = 255;

RemoraCLI::RemoraCLI(Config config)
    : config_(std::move(config)) {
}

StatusCallback RemoraCLI::printer() const {
    return [](const std::string& msg) { std::cout << theme::step(msg) << std::flush; };
}

bool RemoraCLI::preflight_target() {
    auto issues = check_local_tools();
    auto target_issues = check_target(config_);
    issues.insert(issues.end(), target_issues.begin(), target_issues.end());
    return report_preflight(issues);
}

ConnectionDiagnostics RemoraCLI::make_diagnostics(SshRemoteShell& diag_shell) const {
    return ConnectionDiagnostics(diag_shell, config_.diagnostics().log_dir,
                                 config_.diagnostics().remote_probe,
                                 config_.ssh().connect_timeout, nullptr, printer());
}

void RemoraCLI::print_report(const ConnectionReport& report) const {
    std::cout << theme::fail(fmt::format("Connection failed (exit {}): {}",
                                         report.exit_code, to_string(report.kind)));
    for (const auto& line : split_lines(report.output)) {
        if (!line.empty()) std::cout << theme::log(line);
    }
    for (const auto& hint : report.hints) {
        std::cout << theme::info(hint);
    }
    if (report.handshake) {
        const auto& hs = *report.handshake;
        if (hs.handshake_ok) {
            std::cout << theme::kv("Server", hs.banner);
            std::cout << theme::kv("Host key", hs.fingerprint);
            std::cout << theme::kv("Auth", hs.auth_methods);
        } else {
            std::cout << theme::kv("Probe", hs.error);
        }
    }
    if (report.log_path) {
        std::cout << theme::step("Diagnostic log: " + report.log_path->string());
    }
}

void RemoraCLI::explain_connection_failure(const RemoteTarget& target) {
    SshRemoteShell diag_shell(config_.ssh().connect_timeout);
    auto diag = make_diagnostics(diag_shell);
    auto report = diag.test_connection(target, config_.ssh().test_command);
    if (!report.ok) print_report(report);
}

// ── Connection ───────────────────────────────────────────────

int RemoraCLI::run_test() {
    if (!preflight_target()) return 1;
    auto target = config_.target();

    std::cout << theme::section("Connection test");
    std::cout << theme::kv("Target", target.destination());
    if (target.key_path) std::cout << theme::kv("Key", *target.key_path);
    std::cout << theme::kv("Command", config_.ssh().test_command) << "\n";

    SshRemoteShell diag_shell(config_.ssh().connect_timeout);
    auto diag = make_diagnostics(diag_shell);
    auto report = diag.test_connection(target, config_.ssh().test_command);
    if (!report.ok) {
        print_report(report);
        return 1;
    }
    for (const auto& line : split_lines(report.output)) {
        std::cout << theme::log(line);
    }
    std::cout << theme::ok("SSH connection works");
    return 0;
}

int RemoraCLI::run_diagnose() {
    int rc = run_test();
    if (rc != 0) return rc;
    auto target = config_.target();
    std::cout << theme::section("Diagnostics");

    auto hs = probe_handshake(target.host, target.port.value_or(22), target.user,
                              std::min(config_.ssh().connect_timeout, PROBE_CONNECT_TIMEOUT_SECS));
    std::cout << theme::kv("Server", hs.banner);
    std::cout << theme::kv("Host key", hs.fingerprint);
    std::cout << theme::kv("Auth", hs.auth_methods);
    if (!hs.error.empty()) std::cout << theme::info(hs.error);

    RemoteMaintenance maint(shell_);
    for (const char* tool : {"tmux", "rsync", "bash"}) {
        bool present = maint.remote_has_command(target, tool);
        std::cout << (present ? theme::ok(std::string(tool) + " available")
                              : theme::fail(std::string(tool) + " missing on remote"));
    }
    return 0;
}

// ── Session ──────────────────────────────────────────────────

int RemoraCLI::run_launch(const std::vector<std::string>& command_override) {
    JobSpec spec;
    spec.session = config_.remote().tmux_session;
    spec.command = config_.job().command;
    if (!command_override.empty()) {
        spec.command.clear();
        for (const auto& part : command_override) {
            if (!spec.command.empty()) spec.command += " ";
            spec.command += part;
        }
    }
    spec.workdir = config_.remote().project_dir;
    spec.log_path = config_.remote().log_file;
    spec.env = config_.job().env;

    if (!preflight_target()) return 1;
    auto job_issues = check_job(config_);
    if (!command_override.empty()) {
        job_issues.erase(std::remove_if(job_issues.begin(), job_issues.end(),
                                        [](const PreflightIssue& i) {
                                            return i.message.rfind("No job command", 0) == 0;
                                        }),
                         job_issues.end());
    }
    if (!report_preflight(job_issues)) return 1;

    auto target = config_.target();
    std::cout << theme::section("Launch");
    SessionManager sessions(shell_, printer());
    int rc = sessions.launch_job(target, spec);
    if (rc != 0) {
        std::cout << theme::fail(fmt::format("Launch failed (exit {})", rc));
        if (rc == SSH_CONNECTION_FAILED) explain_connection_failure(target);
        return 1;
    }
    std::cout << theme::ok(fmt::format("Job running in tmux session '{}'", spec.session));
    std::cout << theme::step("Follow it with: remora tail");
    return 0;
}

int RemoraCLI::run_status() {
    if (!preflight_target()) return 1;
    auto target = config_.target();
    const auto& session = config_.remote().tmux_session;

    SessionManager sessions(shell_);
    auto state = sessions.session_state(target, session);

    std::cout << theme::section("Status");
    std::cout << theme::kv("Host", target.destination());
    std::cout << theme::kv("Session", session);
    std::cout << theme::kv("State", to_string(state));
    if (!config_.remote().log_file.empty()) {
        std::cout << theme::kv("Log", config_.remote().log_file);
        auto code = sessions.job_exit_code(target, config_.remote().log_file);
        if (code) {
            std::cout << theme::kv("Last exit", std::to_string(*code));
        } else if (state == SessionState::Running) {
            std::cout << theme::kv("Last exit", "(still running)");
        }
    }
    std::cout << "\n";
    return 0;
}

int RemoraCLI::run_stop() {
    if (!preflight_target()) return 1;
    auto target = config_.target();
    const auto& session = config_.remote().tmux_session;

    SessionManager sessions(shell_);
    int rc = sessions.stop_session(target, session);
    if (rc == 0) {
        std::cout << theme::ok("Stopped session " + session);
    } else if (rc == SSH_CONNECTION_FAILED) {
        std::cout << theme::fail("Could not reach " + target.host);
        explain_connection_failure(target);
        return 1;
    } else {
        std::cout << theme::info("No session named " + session + " is running");
    }
    return 0;
}

// ── Logs ─────────────────────────────────────────────────────

int RemoraCLI::run_tail(bool mirror) {
    if (!preflight_target()) return 1;
    if (config_.remote().log_file.empty()) {
        std::cout << theme::fail("remote.log_file not set");
        return 1;
    }
    auto target = config_.target();
    const auto& logging = config_.logging();

    MirrorOptions options;
    options.local_root = logging.local_root;
    options.filename = logging.filename;
    options.interval_secs = logging.mirror_interval_sec;
    options.mirror = mirror && logging.mirror_on_view;
    options.label = config_.instance().label;
    options.id = config_.instance().id;

    auto rsync = make_primary_transporter(config_.transfer().rsync_path);

    std::cout << theme::section("Log");
    platform::InterruptGuard guard;
    LogMirror viewer(shell_, rsync.get(), printer(), [] { return platform::interrupt_requested(); });
    int rc = viewer.run(target, config_.remote().log_file, options);

    std::cout << "\n" << theme::kv("Saved", viewer.tail_file().string());
    if (rc == 0) {
        std::cout << theme::ok("Log view finished");
        return 0;
    }
    std::cout << theme::fail(fmt::format("Log view ended with exit {}", rc));
    if (rc == SSH_CONNECTION_FAILED) explain_connection_failure(target);
    return 1;
}

// ── Transfers ────────────────────────────────────────────────

int RemoraCLI::run_upload(const std::string& local_override) {
    if (!preflight_target()) return 1;
    fs::path local = local_override.empty() ? config_.transfer().upload_local_dir
                                            : expand_user(local_override);
    auto issues = check_upload(config_);
    if (!local_override.empty()) {
        issues.erase(std::remove_if(issues.begin(), issues.end(),
                                    [](const PreflightIssue& i) {
                                        return i.message.rfind("transfer.upload_local_dir", 0) == 0 ||
                                               i.message.rfind("Upload directory", 0) == 0;
                                    }),
                     issues.end());
    }
    if (!report_preflight(issues)) return 1;

    auto target = config_.target();
    std::vector<std::string> extra;
    if (!config_.remote().outputs_dir.empty()) extra.push_back(config_.remote().outputs_dir);

    std::cout << theme::section("Upload");
    TransferEngine engine(shell_, make_primary_transporter(config_.transfer().rsync_path),
                          std::make_unique<ScpTransporter>(), nullptr, printer());
    try {
        engine.upload_tree(target, local, config_.remote().inputs_dir, extra);
    } catch (const TransferError& e) {
        std::cout << theme::fail(e.what());
        if (e.exit_code() == SSH_CONNECTION_FAILED) explain_connection_failure(target);
        return 1;
    }
    std::cout << theme::ok(fmt::format("Uploaded {} to {}:{}", local.string(), target.host,
                                       config_.remote().inputs_dir));
    return 0;
}

int RemoraCLI::run_fetch(const std::string& glob_override) {
    if (!preflight_target()) return 1;
    if (!report_preflight(check_outputs(config_))) return 1;
    auto target = config_.target();
    const auto& transfer = config_.transfer();

    DownloadOptions options;
    options.filter = glob_override.empty() ? transfer.download_glob : glob_override;
    options.verify_manifest = transfer.verify_manifest;
    options.manifest_name = transfer.manifest_name;
    options.max_retries = transfer.retries;
    options.backoff_base = transfer.retry_backoff_sec;

    auto local = make_local_results_dir(transfer.results_root, config_.instance().label,
                                        config_.instance().id);

    std::cout << theme::section("Fetch");
    TransferEngine engine(shell_, make_primary_transporter(transfer.rsync_path),
                          std::make_unique<ScpTransporter>(), nullptr, printer());
    TransferResult result;
    try {
        result = engine.download_tree(target, config_.remote().outputs_dir, local, options);
    } catch (const TransferError& e) {
        std::cout << theme::fail(e.what());
        if (e.exit_code() == SSH_CONNECTION_FAILED) explain_connection_failure(target);
        return 1;
    }

    std::cout << theme::kv("Saved", local.string());
    if (result.manifest) std::cout << theme::kv("Manifest", result.manifest->string());
    if (options.verify_manifest) {
        std::cout << theme::kv("Checked", std::to_string(result.checked));
        for (const auto& m : result.missing) std::cout << theme::fail("missing " + m);
        for (const auto& m : result.size_mismatch) {
            std::cout << theme::fail(fmt::format("size mismatch {} (expected {}, got {})",
                                                 m.path, m.expected, m.actual));
        }
        if (result.parse_errors > 0) {
            std::cout << theme::fail(fmt::format("{} unreadable manifest line(s)", result.parse_errors));
        }
        if (!result.manifest_found) std::cout << theme::fail("Manifest not available");
    }
    if (!result.success) {
        std::cout << theme::fail("Results incomplete; remote files left untouched");
        return 1;
    }
    std::cout << theme::ok("Results fetched");

    const auto& cleanup = config_.cleanup();
    RemoteMaintenance maint(shell_, printer());
    if (cleanup.rotate_remote_logs && !config_.remote().log_file.empty()) {
        auto r = maint.rotate_remote_log(target, config_.remote().log_file, cleanup.keep_log_backups);
        if (r.is_err()) std::cout << theme::warn(r.error);
    }
    if (cleanup.remove_remote_outputs) {
        auto r = maint.cleanup_remote_outputs(target, config_.remote().outputs_dir, false);
        if (r.is_err()) {
            std::cout << theme::warn(r.error);
        } else {
            std::cout << theme::ok(fmt::format("Removed {} remote output entr{}", r.value.size(),
                                               r.value.size() == 1 ? "y" : "ies"));
        }
    }
    return 0;
}

// ── Maintenance ──────────────────────────────────────────────

int RemoraCLI::run_cleanup(bool dry_run) {
    if (!preflight_target()) return 1;
    if (!report_preflight(check_outputs(config_))) return 1;
    auto target = config_.target();
    const auto& dir = config_.remote().outputs_dir;

    std::cout << theme::section(dry_run ? "Cleanup (dry run)" : "Cleanup");
    RemoteMaintenance maint(shell_, printer());
    auto r = maint.cleanup_remote_outputs(target, dir, dry_run);
    if (r.is_err()) {
        std::cout << theme::fail(r.error);
        return 1;
    }
    for (const auto& path : r.value) {
        std::cout << theme::log((dry_run ? "would remove " : "removed ") + path);
    }
    std::cout << theme::ok(fmt::format("{} entr{} under {}", r.value.size(),
                                       r.value.size() == 1 ? "y" : "ies", dir));
    return 0;
}

int RemoraCLI::run_ensure_rsync() {
    if (!preflight_target()) return 1;
    auto target = config_.target();
    std::cout << theme::section("rsync");
    RemoteMaintenance maint(shell_, printer());
    if (!maint.ensure_remote_rsync(target)) {
        std::cout << theme::fail("rsync is not available on " + target.host);
        return 1;
    }
    std::cout << theme::ok("rsync ready on " + target.host);
    return 0;
}
