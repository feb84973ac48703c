#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <filesystem>
#include <cstdint>
#include <stdexcept>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// SSH command execution result
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }

    // stdout followed by stderr, for failure classification
    std::string combined() const {
        if (stderr_data.empty()) return stdout_data;
        if (stdout_data.empty()) return stderr_data;
        return stdout_data + "\n" + stderr_data;
    }
};

// Remote host a single operation is aimed at. Built once from config and
// passed into every core call; nothing in the core remembers it.
struct RemoteTarget {
    std::string host;
    std::string user;
    std::optional<std::string> key_path;
    std::optional<int> port;

    // user@host (or bare host when user is empty)
    std::string destination() const {
        return user.empty() ? host : user + "@" + host;
    }
};

// One launch request for the remote job session.
struct JobSpec {
    std::string session;                       // tmux session name
    std::string command;                       // shell command run inside the session
    std::string workdir;                       // remote directory to cd into first
    std::string log_path;                      // remote log file (appended to)
    std::map<std::string, std::string> env;    // inline KEY=value assignments
};

enum class SessionState {
    Absent,
    Running,
    Stopped,
};

inline const char* to_string(SessionState s) {
    switch (s) {
        case SessionState::Absent:  return "absent";
        case SessionState::Running: return "running";
        case SessionState::Stopped: return "stopped";
    }
    return "unknown";
}

struct ManifestEntry {
    int64_t size = 0;
    std::string path;       // relative to the manifest root
};

struct SizeMismatch {
    std::string path;
    int64_t expected = 0;
    int64_t actual = 0;
};

// Outcome of a download + manifest check.
struct TransferResult {
    bool success = false;
    int checked = 0;
    int parse_errors = 0;
    bool manifest_found = false;
    std::vector<std::string> missing;
    std::vector<SizeMismatch> size_mismatch;
    std::filesystem::path local_dir;
    std::optional<std::filesystem::path> manifest;
};

// A transfer tool (rsync/scp) exited non-zero or could not be started.
// Retried by RetryPolicy, surfaced once attempts are exhausted.
class TransferError : public std::runtime_error {
public:
    TransferError(const std::string& what, int exit_code)
        : std::runtime_error(what), exit_code_(exit_code) {}

    int exit_code() const { return exit_code_; }

private:
    int exit_code_;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
