#include "session_manager.hpp"
#include "job_log.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <cctype>
#include <climits>
#include <stdexcept>

static bool is_valid_env_key(const std::string& key) {
    if (key.empty()) return false;
    if (!(std::isalpha(static_cast<unsigned char>(key[0])) || key[0] == '_')) return false;
    for (char c : key) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_')) return false;
    }
    return true;
}

// tmux rejects '.' and ':' in names; keep to a set that needs no quoting.
static bool is_valid_session_name(const std::string& name) {
    if (name.empty()) return false;
    for (char c : name) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-')) return false;
    }
    return true;
}

static std::string parent_dir(const std::string& path) {
    auto slash = path.rfind('/');
    if (slash == std::string::npos) return ".";
    if (slash == 0) return "/";
    return path.substr(0, slash);
}

SessionManager::SessionManager(RemoteShell& shell, StatusCallback callback)
    : shell_(shell), callback_(std::move(callback)) {
}

// ── Command construction ─────────────────────────────────────

void SessionManager::validate(const JobSpec& spec) {
    if (spec.session.empty()) throw std::invalid_argument("session name is empty");
    if (!is_valid_session_name(spec.session)) {
        throw std::invalid_argument("session name '" + spec.session +
                                    "' may only contain letters, digits, '_' and '-'");
    }
    if (spec.command.empty()) throw std::invalid_argument("job command is empty");
    if (spec.workdir.empty()) throw std::invalid_argument("working directory is empty");
    if (spec.log_path.empty()) throw std::invalid_argument("log path is empty");
    for (const auto& [key, value] : spec.env) {
        if (!is_valid_env_key(key)) {
            throw std::invalid_argument("invalid environment variable name '" + key + "'");
        }
    }
}

bool SessionManager::is_sensitive_key(const std::string& key) {
    std::string lower = to_lower(key);
    return lower.find("token") != std::string::npos ||
           lower.find("secret") != std::string::npos ||
           lower.find("key") != std::string::npos;
}

std::string SessionManager::env_prefix(const std::map<std::string, std::string>& env,
                                       bool redact) {
    std::string out;
    for (const auto& [key, value] : env) {
        if (value.empty()) continue;
        bool mask = redact && is_sensitive_key(key);
        out += key + "=" + (mask ? std::string(REDACTED_VALUE) : shell_quote(value)) + " ";
    }
    return out;
}

std::string SessionManager::build_job_body(const JobSpec& spec, bool redact) {
    std::string log = shell_quote_path(spec.log_path);
    // START always records the masked form, whatever ends up executing
    std::string shown = env_prefix(spec.env, true) + spec.command;

    return fmt::format(
        "cd {workdir} && {{ "
        "echo \"{start} $(date -Is) session={session} cmd=\"{shown} | tee -a {log}; "
        "{{ {env}{command}; }} 2>&1 | tee -a {log}; "
        "exit_code=${{PIPESTATUS[0]}}; "
        "echo \"{end} $(date -Is) exit_code=${{exit_code}}\" | tee -a {log}; "
        "exit $exit_code; }}",
        fmt::arg("workdir", shell_quote_path(spec.workdir)),
        fmt::arg("start", LOG_START_MARKER),
        fmt::arg("session", spec.session),
        fmt::arg("shown", shell_quote(shown)),
        fmt::arg("log", log),
        fmt::arg("env", env_prefix(spec.env, redact)),
        fmt::arg("command", spec.command),
        fmt::arg("end", LOG_END_MARKER));
}

std::string SessionManager::build_launch_command(const JobSpec& spec, bool redact) {
    std::string inner = "bash -lc " + shell_quote(build_job_body(spec, redact));
    return fmt::format("tmux new-session -d -s {} {}", spec.session, shell_quote(inner));
}

std::string SessionManager::build_mkdir_command(const JobSpec& spec) {
    std::string dir = parent_dir(spec.log_path);
    std::string mkdir = "mkdir -p " + shell_quote_path(dir);
    bool relative = spec.log_path[0] != '/' && spec.log_path[0] != '~';
    if (relative) mkdir = "cd " + shell_quote_path(spec.workdir) + " && " + mkdir;
    return "bash -lc " + shell_quote(mkdir);
}

// ── Remote operations ────────────────────────────────────────

bool SessionManager::has_session(const RemoteTarget& target, const std::string& name) {
    if (name.empty()) throw std::invalid_argument("session name is empty");
    auto r = shell_.run(target, "tmux has-session -t " + shell_quote("=" + name));
    return r.success();
}

int SessionManager::stop_session(const RemoteTarget& target, const std::string& name) {
    if (name.empty()) throw std::invalid_argument("session name is empty");
    auto r = shell_.run(target, "tmux kill-session -t " + shell_quote("=" + name));
    if (r.success()) {
        status("Stopped session " + name);
    } else {
        remora_log(fmt::format("kill-session {} exit={}", name, r.exit_code));
    }
    return r.exit_code;
}

SessionState SessionManager::session_state(const RemoteTarget& target, const std::string& name) {
    return has_session(target, name) ? SessionState::Running : SessionState::Absent;
}

int SessionManager::launch_job(const RemoteTarget& target, const JobSpec& spec) {
    require_target(target);
    validate(spec);

    if (has_session(target, spec.session)) {
        status("Session " + spec.session + " is running, stopping it first");
        int rc = stop_session(target, spec.session);
        if (rc != 0) {
            remora_log(fmt::format("launch {} aborted: stop failed exit={}", spec.session, rc));
            return rc;
        }
    }

    auto mk = shell_.run(target, build_mkdir_command(spec));
    if (mk.failed()) {
        remora_log(fmt::format("launch {} aborted: log dir exit={}", spec.session, mk.exit_code));
        status("Could not create log directory for " + spec.log_path);
        return mk.exit_code;
    }

    std::string display = build_launch_command(spec, true);
    status("Starting: " + env_prefix(spec.env, true) + spec.command);
    auto r = shell_.run_redacted(target, build_launch_command(spec, false), display);
    if (r.success()) {
        status(fmt::format("Session {} started, logging to {}", spec.session, spec.log_path));
    }
    return r.exit_code;
}

std::optional<int> SessionManager::job_exit_code(const RemoteTarget& target,
                                                 const std::string& log_path) {
    if (log_path.empty()) throw std::invalid_argument("log path is empty");
    auto r = shell_.run(target, "tail -n 200 " + shell_quote_path(log_path));
    if (r.failed()) return std::nullopt;
    return parse_exit_code(r.stdout_data);
}

std::optional<int> parse_exit_code(const std::string& log_text) {
    std::optional<int> code;
    for (const auto& line : split_lines(log_text)) {
        if (line.rfind(LOG_START_MARKER, 0) == 0) {
            code.reset();
            continue;
        }
        if (line.rfind(LOG_END_MARKER, 0) != 0) continue;

        auto pos = line.find("exit_code=");
        if (pos == std::string::npos) continue;
        std::string value = line.substr(pos + 10);
        trim(value);
        int parsed = safe_stoi(value, INT_MIN);
        if (parsed == INT_MIN) continue;
        code = parsed;
    }
    return code;
}
