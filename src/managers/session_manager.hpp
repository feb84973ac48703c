#pragma once

#include <map>
#include <optional>
#include <string>
#include <core/types.hpp>
#include <ssh/remote_shell.hpp>

// Starts, inspects and stops the single tmux session a job runs in.
//
// Log protocol: the session appends to JobSpec::log_path
//   [START] <date -Is> session=<name> cmd=<redacted command>
//   <job stdout+stderr>
//   [END] <date -Is> exit_code=<n>
// where n is ${PIPESTATUS[0]}, the status of the job itself rather than of
// the tee that feeds the log.
class SessionManager {
public:
    explicit SessionManager(RemoteShell& shell, StatusCallback callback = nullptr);

    // tmux has-session -t =<name> (exact match, no prefix lookup)
    bool has_session(const RemoteTarget& target, const std::string& name);

    // Exit status of tmux kill-session; non-zero usually means "no such session".
    int stop_session(const RemoteTarget& target, const std::string& name);

    SessionState session_state(const RemoteTarget& target, const std::string& name);

    // Stop a same-named session, create the log directory, start the job
    // detached. Returns the exit status of the session creation (or of the
    // step that aborted the launch), never the job's own status.
    // Throws std::invalid_argument for an incomplete JobSpec or target.
    int launch_job(const RemoteTarget& target, const JobSpec& spec);

    // Status from the last [END] line of the remote log; nullopt while the
    // most recent run has not finished or the log is unreadable.
    std::optional<int> job_exit_code(const RemoteTarget& target, const std::string& log_path);

    // ── Command construction (no I/O) ──

    static void validate(const JobSpec& spec);

    // Env keys containing token/secret/key, case-insensitive.
    static bool is_sensitive_key(const std::string& key);

    // "K1='v1' K2='v2' " with empty values dropped; sensitive values shown
    // as *** when redact is set.
    static std::string env_prefix(const std::map<std::string, std::string>& env, bool redact);

    // cd <workdir> && { ...START...; job | tee; ...END...; exit $exit_code; }
    static std::string build_job_body(const JobSpec& spec, bool redact);

    // tmux new-session -d -s <name> 'bash -lc <body>'
    static std::string build_launch_command(const JobSpec& spec, bool redact);

    static std::string build_mkdir_command(const JobSpec& spec);

private:
    RemoteShell& shell_;
    StatusCallback callback_;

    void status(const std::string& msg) const {
        if (callback_) callback_(msg);
    }
};

// Parse the exit code from log text: the value on the last [END] line,
// provided no [START] line follows it.
std::optional<int> parse_exit_code(const std::string& log_text);
