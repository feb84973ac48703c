#include "transporter.hpp"
#include "job_log.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include <ssh/remote_shell.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <unistd.h>

// ── helpers ──────────────────────────────────────────────────

static std::string join_args(const std::string& program, const std::vector<std::string>& args) {
    std::string out = program;
    for (const auto& a : args) out += " " + shell_quote(a);
    return out;
}

// Captured run; non-zero exit becomes a TransferError carrying stderr.
static void run_tool(const std::string& program, const std::vector<std::string>& args,
                     const std::string& what) {
    auto out = platform::run_capture(program, args);
    remora_log_cmd(what, join_args(program, args),
                   SSHResult{out.exit_code, out.out, out.err});
    if (out.exit_code != 0) {
        std::string detail = out.err.empty() ? out.out : out.err;
        trim(detail);
        if (out.exit_code == EXIT_EXEC_FAILED && detail.empty()) {
            detail = "failed to execute " + program;
        }
        throw TransferError(fmt::format("{} failed (exit {}){}{}", what, out.exit_code,
                                        detail.empty() ? "" : ": ", detail),
                            out.exit_code);
    }
}

// Output goes straight to the terminal (progress bars).
static void run_tool_visible(const std::string& program, const std::vector<std::string>& args,
                             const std::string& what) {
    remora_log(fmt::format("{} CMD: {}", what, join_args(program, args)));
    int rc = platform::run_inherit(program, args);
    if (rc != 0) {
        throw TransferError(fmt::format("{} failed (exit {})", what, rc), rc);
    }
}

static std::string with_trailing_slash(std::string path) {
    if (path.empty() || path.back() != '/') path += '/';
    return path;
}

// ── RsyncTransporter ─────────────────────────────────────────

RsyncTransporter::RsyncTransporter(fs::path rsync_program)
    : program_(std::move(rsync_program)) {
}

std::vector<std::string> RsyncTransporter::upload_args(const RemoteTarget& target,
                                                       const fs::path& local_dir,
                                                       const std::string& remote_dir) const {
    return {"-az", "--partial", "-e", ssh_rsh_command(target),
            with_trailing_slash(local_dir.string()),
            remote_spec(target, with_trailing_slash(remote_dir))};
}

std::vector<std::string> RsyncTransporter::download_args(const RemoteTarget& target,
                                                         const std::string& remote_dir,
                                                         const fs::path& local_dir,
                                                         const std::string& filter) const {
    std::vector<std::string> args = {"-az", "--partial", "-e", ssh_rsh_command(target)};
    if (!filter.empty()) {
        // Descend everywhere, keep matches, drop the rest and any directory left empty
        args.push_back("--include=*/");
        args.push_back("--include=" + filter);
        args.push_back("--exclude=*");
        args.push_back("--prune-empty-dirs");
    }
    args.push_back(remote_spec(target, with_trailing_slash(remote_dir)));
    args.push_back(with_trailing_slash(local_dir.string()));
    return args;
}

std::vector<std::string> RsyncTransporter::file_args(const RemoteTarget& target,
                                                     const std::string& remote_path,
                                                     const fs::path& local_path,
                                                     bool quiet) const {
    std::vector<std::string> args;
    if (quiet) {
        args = {"-az"};
    } else {
        args = {"-avz", "--progress"};
    }
    args.push_back("-e");
    args.push_back(ssh_rsh_command(target));
    args.push_back(remote_spec(target, remote_path));
    args.push_back(local_path.string());
    return args;
}

void RsyncTransporter::upload_contents(const RemoteTarget& target, const fs::path& local_dir,
                                       const std::string& remote_dir) {
    run_tool(program_.string(), upload_args(target, local_dir, remote_dir), "rsync upload");
}

void RsyncTransporter::download_tree(const RemoteTarget& target, const std::string& remote_dir,
                                     const fs::path& local_dir, const std::string& filter) {
    fs::create_directories(local_dir);
    run_tool(program_.string(), download_args(target, remote_dir, local_dir, filter),
             "rsync download");
}

void RsyncTransporter::download_file(const RemoteTarget& target, const std::string& remote_path,
                                     const fs::path& local_path, bool quiet) {
    if (local_path.has_parent_path()) fs::create_directories(local_path.parent_path());
    auto args = file_args(target, remote_path, local_path, quiet);
    if (quiet) {
        run_tool(program_.string(), args, "rsync file");
    } else {
        run_tool_visible(program_.string(), args, "rsync file");
    }
}

// ── ScpTransporter ───────────────────────────────────────────

ScpTransporter::ScpTransporter(std::string scp_program)
    : program_(std::move(scp_program)) {
}

std::vector<std::string> ScpTransporter::item_upload_args(const RemoteTarget& target,
                                                          const fs::path& item,
                                                          const std::string& remote_dir) const {
    auto args = scp_option_args(target);
    args.push_back("-r");
    args.push_back("-p");
    args.push_back(item.string());
    args.push_back(remote_spec(target, with_trailing_slash(remote_dir)));
    return args;
}

std::vector<std::string> ScpTransporter::tree_download_args(const RemoteTarget& target,
                                                            const std::string& remote_dir,
                                                            const fs::path& staging) const {
    auto args = scp_option_args(target);
    args.push_back("-r");
    args.push_back("-p");
    std::string src = remote_dir;
    while (src.size() > 1 && src.back() == '/') src.pop_back();
    args.push_back(remote_spec(target, src));
    args.push_back(staging.string());
    return args;
}

void ScpTransporter::upload_contents(const RemoteTarget& target, const fs::path& local_dir,
                                     const std::string& remote_dir) {
    std::vector<fs::path> items;
    for (const auto& entry : fs::directory_iterator(local_dir)) {
        items.push_back(entry.path());
    }
    std::sort(items.begin(), items.end());

    for (const auto& item : items) {
        run_tool(program_, item_upload_args(target, item, remote_dir),
                 "scp upload " + item.filename().string());
    }
}

void ScpTransporter::download_tree(const RemoteTarget& target, const std::string& remote_dir,
                                   const fs::path& local_dir, const std::string& /*filter*/) {
    fs::create_directories(local_dir);
    fs::path staging = local_dir / fmt::format(".remora_staging_{}", getpid());
    fs::remove_all(staging);

    try {
        run_tool(program_, tree_download_args(target, remote_dir, staging), "scp download");
    } catch (const TransferError&) {
        std::error_code ec;
        fs::remove_all(staging, ec);
        throw;
    }
    merge_tree(staging, local_dir);
}

void ScpTransporter::download_file(const RemoteTarget& target, const std::string& remote_path,
                                   const fs::path& local_path, bool quiet) {
    if (local_path.has_parent_path()) fs::create_directories(local_path.parent_path());
    auto args = scp_option_args(target);
    if (quiet) args.push_back("-q");
    args.push_back("-p");
    args.push_back(remote_spec(target, remote_path));
    args.push_back(local_path.string());
    if (quiet) {
        run_tool(program_, args, "scp file");
    } else {
        run_tool_visible(program_, args, "scp file");
    }
}

// ── Probe / helpers ──────────────────────────────────────────

std::optional<fs::path> find_local_rsync(const std::string& override_path) {
    if (auto on_path = platform::find_executable("rsync")) return on_path;
    if (!override_path.empty() && platform::is_executable(expand_user(override_path))) {
        return expand_user(override_path);
    }
    std::string env = platform::env_or_empty("RSYNC_PATH");
    if (!env.empty() && platform::is_executable(expand_user(env))) {
        return expand_user(env);
    }
    return std::nullopt;
}

std::unique_ptr<Transporter> make_primary_transporter(const std::string& override_path) {
    auto rsync = find_local_rsync(override_path);
    if (!rsync) {
        remora_log("rsync not found locally; transfers use scp");
        return nullptr;
    }
    remora_log("rsync: " + rsync->string());
    return std::make_unique<RsyncTransporter>(*rsync);
}

void merge_tree(const fs::path& src, const fs::path& dst) {
    fs::create_directories(dst);
    std::vector<fs::path> entries;
    for (const auto& entry : fs::directory_iterator(src)) {
        entries.push_back(entry.path());
    }
    for (const auto& path : entries) {
        fs::path target = dst / path.filename();
        if (fs::is_directory(fs::symlink_status(path)) && fs::is_directory(target)) {
            merge_tree(path, target);
            continue;
        }
        if (fs::exists(fs::symlink_status(target))) fs::remove_all(target);
        fs::rename(path, target);
    }
    fs::remove_all(src);
}
