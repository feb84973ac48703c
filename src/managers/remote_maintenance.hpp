#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <ssh/remote_shell.hpp>

// Housekeeping on the remote host around a job: tooling, log rotation,
// output cleanup.
class RemoteMaintenance {
public:
    explicit RemoteMaintenance(RemoteShell& shell, StatusCallback callback = nullptr);

    // command -v <cmd>
    bool remote_has_command(const RemoteTarget& target, const std::string& cmd);

    // Report the remote rsync version, installing it with the first package
    // manager that works (apt, apt-get, yum, dnf, pacman, apk; via sudo) when
    // missing. False once every available manager has been tried.
    bool ensure_remote_rsync(const RemoteTarget& target);

    // log -> log.1, log.N -> log.N+1, dropping anything beyond log.<keep>.
    // A missing log is not an error.
    Result<void> rotate_remote_log(const RemoteTarget& target, const std::string& log_path,
                                   int keep);

    // Delete (or with dry_run only list) the immediate children of
    // outputs_dir. The directory itself stays. Returns the affected paths.
    Result<std::vector<std::string>> cleanup_remote_outputs(const RemoteTarget& target,
                                                            const std::string& outputs_dir,
                                                            bool dry_run);

    static std::string rotate_command(const std::string& log_path, int keep);
    static std::string cleanup_command(const std::string& outputs_dir, bool dry_run);

    // Package managers tried in order, with their install commands.
    static const std::vector<std::pair<std::string, std::string>>& install_sequences();

private:
    RemoteShell& shell_;
    StatusCallback callback_;

    std::string remote_rsync_version(const RemoteTarget& target);
    void status(const std::string& msg) const {
        if (callback_) callback_(msg);
    }
};

// <root>/<label, else id, else "instance">/<YYYYmmdd-HHMMSS>, created.
std::filesystem::path make_local_results_dir(const std::filesystem::path& root,
                                             const std::string& label,
                                             const std::string& id);
