#include "remote_maintenance.hpp"
#include "job_log.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <stdexcept>

RemoteMaintenance::RemoteMaintenance(RemoteShell& shell, StatusCallback callback)
    : shell_(shell), callback_(std::move(callback)) {
}

bool RemoteMaintenance::remote_has_command(const RemoteTarget& target, const std::string& cmd) {
    if (cmd.empty()) throw std::invalid_argument("command name is empty");
    return shell_.run(target, "command -v " + shell_quote(cmd)).success();
}

// ── rsync ────────────────────────────────────────────────────

const std::vector<std::pair<std::string, std::string>>& RemoteMaintenance::install_sequences() {
    static const std::vector<std::pair<std::string, std::string>> seqs = {
        {"apt",     "sudo apt update -y && sudo apt install -y rsync"},
        {"apt-get", "sudo apt-get update -y && sudo apt-get install -y rsync"},
        {"yum",     "sudo yum install -y rsync"},
        {"dnf",     "sudo dnf install -y rsync"},
        {"pacman",  "sudo pacman -Sy --noconfirm rsync"},
        {"apk",     "sudo apk add rsync"},
    };
    return seqs;
}

std::string RemoteMaintenance::remote_rsync_version(const RemoteTarget& target) {
    auto r = shell_.run(target, "rsync --version");
    auto lines = split_lines(r.stdout_data);
    if (r.success() && !lines.empty() && !lines[0].empty()) return lines[0];
    return "rsync";
}

bool RemoteMaintenance::ensure_remote_rsync(const RemoteTarget& target) {
    require_target(target);
    status("Checking for rsync on " + target.host);
    if (remote_has_command(target, "rsync")) {
        status("rsync present: " + remote_rsync_version(target));
        return true;
    }

    status("rsync missing on " + target.host + ", trying to install it");
    for (const auto& [manager, install] : install_sequences()) {
        if (!remote_has_command(target, manager)) continue;

        status(fmt::format("Installing rsync with {}", manager));
        auto r = shell_.run(target, "bash -lc " + shell_quote(install));
        if (r.failed()) {
            status(fmt::format("{} install failed (exit {})", manager, r.exit_code));
            continue;
        }
        if (remote_has_command(target, "rsync")) {
            status("rsync installed: " + remote_rsync_version(target));
            return true;
        }
        status(fmt::format("rsync still missing after {}, trying the next manager", manager));
    }

    status("Could not install rsync automatically; install it on the host by hand and retry");
    return false;
}

// ── Log rotation ─────────────────────────────────────────────

std::string RemoteMaintenance::rotate_command(const std::string& log_path, int keep) {
    std::string script = fmt::format(
        "log={log}; "
        "[ -f \"$log\" ] || exit 0; "
        "rm -f \"$log.{keep}\"; "
        "i={last}; "
        "while [ \"$i\" -ge 1 ]; do "
        "if [ -f \"$log.$i\" ]; then mv -f \"$log.$i\" \"$log.$((i+1))\"; fi; "
        "i=$((i-1)); "
        "done; "
        "mv -f \"$log\" \"$log.1\"",
        fmt::arg("log", shell_quote_path(log_path)),
        fmt::arg("keep", keep),
        fmt::arg("last", keep - 1));
    return "sh -c " + shell_quote(script);
}

Result<void> RemoteMaintenance::rotate_remote_log(const RemoteTarget& target,
                                                  const std::string& log_path, int keep) {
    if (log_path.empty()) throw std::invalid_argument("log path is empty");
    if (keep < 1) throw std::invalid_argument("keep_log_backups must be >= 1");

    auto r = shell_.run(target, rotate_command(log_path, keep));
    if (r.failed()) {
        std::string err = r.get_output();
        trim(err);
        return Result<void>::Err(fmt::format("log rotation failed (exit {}): {}",
                                             r.exit_code, err));
    }
    status(fmt::format("Rotated {} (keeping {})", log_path, keep));
    return Result<void>::Ok();
}

// ── Output cleanup ───────────────────────────────────────────

std::string RemoteMaintenance::cleanup_command(const std::string& outputs_dir, bool dry_run) {
    std::string dir = shell_quote_path(outputs_dir);
    std::string find = fmt::format("find {} -mindepth 1 -maxdepth 1 -print", dir);
    if (!dry_run) find += " -exec rm -rf -- {} +";
    return fmt::format("if [ -d {} ]; then {}; fi", dir, find);
}

Result<std::vector<std::string>> RemoteMaintenance::cleanup_remote_outputs(
        const RemoteTarget& target, const std::string& outputs_dir, bool dry_run) {
    std::string trimmed = outputs_dir;
    trim(trimmed);
    while (trimmed.size() > 1 && trimmed.back() == '/') trimmed.pop_back();
    if (trimmed.empty() || trimmed == "/" || trimmed == "~" || trimmed == "." || trimmed == "..") {
        throw std::invalid_argument("refusing to clean '" + outputs_dir + "'");
    }

    auto r = shell_.run(target, cleanup_command(trimmed, dry_run));
    if (r.failed()) {
        std::string err = r.get_output();
        trim(err);
        return Result<std::vector<std::string>>::Err(
            fmt::format("cleanup of {} failed (exit {}): {}", trimmed, r.exit_code, err));
    }

    std::vector<std::string> paths;
    for (auto& line : split_lines(r.stdout_data)) {
        if (!line.empty()) paths.push_back(line);
    }
    remora_log(fmt::format("cleanup {} dry_run={} entries={}", trimmed, dry_run, paths.size()));
    return Result<std::vector<std::string>>::Ok(paths);
}

std::filesystem::path make_local_results_dir(const std::filesystem::path& root,
                                             const std::string& label,
                                             const std::string& id) {
    std::string name = !label.empty() ? label : (!id.empty() ? id : "instance");
    return make_stamped_dir(root, label_dir_name(name));
}
