#include "remote_shell.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <managers/job_log.hpp>
#include <fmt/format.h>
#include <cerrno>
#include <stdexcept>
#include <system_error>

// ── Argument builders ────────────────────────────────────────

static void append_common_options(std::vector<std::string>& args) {
    for (const char* opt : {SSH_OPT_BATCH, SSH_OPT_HOSTKEY, SSH_OPT_KNOWN_HOSTS,
                            SSH_OPT_LOGLEVEL}) {
        args.push_back("-o");
        args.push_back(opt);
    }
}

void require_target(const RemoteTarget& target) {
    if (target.host.empty()) throw std::invalid_argument("remote host is empty");
    if (target.user.empty()) throw std::invalid_argument("remote user is empty");
}

std::vector<std::string> ssh_args(const RemoteTarget& target,
                                  std::optional<int> connect_timeout) {
    std::vector<std::string> args;
    append_common_options(args);
    if (connect_timeout) {
        args.push_back("-o");
        args.push_back(fmt::format("ConnectTimeout={}", *connect_timeout));
    }
    if (target.key_path && !target.key_path->empty()) {
        args.push_back("-i");
        args.push_back(*target.key_path);
    }
    if (target.port) {
        args.push_back("-p");
        args.push_back(std::to_string(*target.port));
    }
    args.push_back(target.destination());
    return args;
}

std::string ssh_rsh_command(const RemoteTarget& target) {
    std::string cmd = "ssh";
    for (const char* opt : {SSH_OPT_BATCH, SSH_OPT_HOSTKEY, SSH_OPT_KNOWN_HOSTS,
                            SSH_OPT_LOGLEVEL}) {
        cmd += fmt::format(" -o {}", opt);
    }
    if (target.key_path && !target.key_path->empty()) {
        cmd += " -i " + shell_quote(*target.key_path);
    }
    if (target.port) {
        cmd += fmt::format(" -p {}", *target.port);
    }
    return cmd;
}

std::vector<std::string> scp_option_args(const RemoteTarget& target) {
    std::vector<std::string> args;
    append_common_options(args);
    if (target.key_path && !target.key_path->empty()) {
        args.push_back("-i");
        args.push_back(*target.key_path);
    }
    if (target.port) {
        args.push_back("-P");
        args.push_back(std::to_string(*target.port));
    }
    return args;
}

std::string remote_spec(const RemoteTarget& target, const std::string& path) {
    return target.destination() + ":" + path;
}

// ── SshRemoteShell ───────────────────────────────────────────

SshRemoteShell::SshRemoteShell(std::optional<int> connect_timeout, std::string ssh_program)
    : connect_timeout_(connect_timeout), ssh_program_(std::move(ssh_program)) {
}

SSHResult SshRemoteShell::exec(const RemoteTarget& target, const std::string& command,
                               const std::string& display) {
    require_target(target);
    auto args = ssh_args(target, connect_timeout_);
    args.push_back(command);

    auto out = platform::run_capture(ssh_program_, args);
    SSHResult r{out.exit_code, std::move(out.out), std::move(out.err)};
    if (r.exit_code == EXIT_EXEC_FAILED && r.stdout_data.empty() && r.stderr_data.empty()) {
        r.stderr_data = "failed to execute " + ssh_program_;
    }
    remora_log_cmd("ssh " + target.destination(), display, r);
    return r;
}

std::unique_ptr<RemoteStream> SshRemoteShell::follow(const RemoteTarget& target,
                                                     const std::string& command) {
    require_target(target);
    auto args = ssh_args(target, connect_timeout_);
    args.push_back(command);

    remora_log(fmt::format("follow {} CMD: {}", target.destination(), command));
    auto proc = platform::spawn_piped(ssh_program_, args);
    if (!proc.valid()) {
        throw std::system_error(errno, std::generic_category(),
                                "failed to start " + ssh_program_);
    }
    return std::make_unique<ProcessStream>(std::move(proc));
}

RemoteStream::Read ProcessStream::read_line(std::string& line, int timeout_ms) {
    switch (proc_.read_line(line, timeout_ms)) {
        case platform::ProcessHandle::ReadStatus::Line:    return Read::Line;
        case platform::ProcessHandle::ReadStatus::Timeout: return Read::Timeout;
        case platform::ProcessHandle::ReadStatus::Closed:  return Read::Closed;
    }
    return Read::Closed;
}
