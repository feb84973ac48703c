#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <platform/process.hpp>

// Lines streamed back from a long-running remote command (tail -F).
class RemoteStream {
public:
    enum class Read { Line, Timeout, Closed };

    virtual ~RemoteStream() = default;

    // Next output line, waiting at most timeout_ms.
    virtual Read read_line(std::string& line, int timeout_ms) = 0;

    // Deliver SIGINT, as Ctrl-C on a terminal would.
    virtual void interrupt() = 0;

    // Exit code once finished; -1 if still running after timeout_ms.
    virtual int wait(int timeout_ms = -1) = 0;

    virtual void terminate() = 0;
};

// Runs commands on a RemoteTarget. The only way the core reaches a remote
// host; tests substitute a scripted fake.
class RemoteShell {
public:
    virtual ~RemoteShell() = default;

    SSHResult run(const RemoteTarget& target, const std::string& command) {
        return exec(target, command, command);
    }

    // display is what gets logged in place of command (secrets masked).
    SSHResult run_redacted(const RemoteTarget& target, const std::string& command,
                           const std::string& display) {
        return exec(target, command, display);
    }

    virtual std::unique_ptr<RemoteStream> follow(const RemoteTarget& target,
                                                 const std::string& command) = 0;

protected:
    virtual SSHResult exec(const RemoteTarget& target, const std::string& command,
                           const std::string& display) = 0;
};

// ── ssh(1) implementation ────────────────────────────────────

class SshRemoteShell : public RemoteShell {
public:
    // connect_timeout adds -o ConnectTimeout=N (diagnostics only).
    explicit SshRemoteShell(std::optional<int> connect_timeout = std::nullopt,
                            std::string ssh_program = "ssh");

    std::unique_ptr<RemoteStream> follow(const RemoteTarget& target,
                                         const std::string& command) override;

protected:
    SSHResult exec(const RemoteTarget& target, const std::string& command,
                   const std::string& display) override;

private:
    std::optional<int> connect_timeout_;
    std::string ssh_program_;
};

// RemoteStream over a spawn_piped() ssh process.
class ProcessStream : public RemoteStream {
public:
    explicit ProcessStream(platform::ProcessHandle proc) : proc_(std::move(proc)) {}

    Read read_line(std::string& line, int timeout_ms) override;
    void interrupt() override { proc_.interrupt(); }
    int wait(int timeout_ms = -1) override { return proc_.wait(timeout_ms); }
    void terminate() override { proc_.terminate(); }

private:
    platform::ProcessHandle proc_;
};

// ── Argument builders (shared with rsync/scp) ───────────────

// -o options, -i key, -p port, then user@host.
std::vector<std::string> ssh_args(const RemoteTarget& target,
                                  std::optional<int> connect_timeout = std::nullopt);

// ssh invocation as one string, for rsync -e.
std::string ssh_rsh_command(const RemoteTarget& target);

// -o options, -i key, -P port (no destination).
std::vector<std::string> scp_option_args(const RemoteTarget& target);

// user@host:path
std::string remote_spec(const RemoteTarget& target, const std::string& path);

// Throws std::invalid_argument when host or user is empty.
void require_target(const RemoteTarget& target);
