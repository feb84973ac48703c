#pragma once

#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>
#include <managers/connection_diagnostics.hpp>
#include <ssh/remote_shell.hpp>

// One method per `remora <command>`; each returns the process exit code.
class RemoraCLI {
public:
    explicit RemoraCLI(Config config);

    int run_test();
    int run_diagnose();
    int run_launch(const std::vector<std::string>& command_override);
    int run_status();
    int run_stop();
    int run_tail(bool mirror);
    int run_upload(const std::string& local_override);
    int run_fetch(const std::string& glob_override);
    int run_cleanup(bool dry_run);
    int run_ensure_rsync();

private:
    Config config_;
    SshRemoteShell shell_;

    bool preflight_target();
    StatusCallback printer() const;
    ConnectionDiagnostics make_diagnostics(SshRemoteShell& diag_shell) const;

    // Re-test the connection after a command failed with ssh's 255 and
    // print what was found.
    void explain_connection_failure(const RemoteTarget& target);
    void print_report(const ConnectionReport& report) const;
};
