#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

static const char* DEFAULT_TEST_COMMAND = "echo 'SSH OK'; whoami; hostname; uptime";

// ── Helpers ───────────────────────────────────────────────────

static std::string scalar_or(const YAML::Node& node, const std::string& fallback) {
    if (!node || !node.IsScalar()) return fallback;
    std::string v = node.as<std::string>(fallback);
    trim(v);
    return v;
}

// Non-numeric values fall back to the default instead of failing the load.
static int int_or(const YAML::Node& node, int fallback, int min_value) {
    if (!node || !node.IsScalar()) return fallback;
    int v = node.as<int>(fallback);
    return v < min_value ? fallback : v;
}

static bool bool_or(const YAML::Node& node, bool fallback) {
    if (!node || !node.IsScalar()) return fallback;
    return node.as<bool>(fallback);
}

static std::string strip_trailing_slash(std::string path) {
    while (path.size() > 1 && path.back() == '/') path.pop_back();
    return path;
}

// Overlay project keys on top of global keys, one level of sections deep.
static YAML::Node merge_sections(const YAML::Node& base, const YAML::Node& overlay) {
    YAML::Node merged = YAML::Clone(base);
    if (!merged || !merged.IsMap()) merged = YAML::Node(YAML::NodeType::Map);
    if (!overlay || !overlay.IsMap()) return merged;

    for (const auto& section : overlay) {
        std::string name = section.first.as<std::string>();
        if (section.second.IsMap() && merged[name] && merged[name].IsMap()) {
            for (const auto& kv : section.second) {
                merged[name][kv.first.as<std::string>()] = YAML::Clone(kv.second);
            }
        } else {
            merged[name] = YAML::Clone(section.second);
        }
    }
    return merged;
}

// ── Section parsers ───────────────────────────────────────────

static SSHConfig parse_ssh_config(const YAML::Node& node) {
    SSHConfig ssh;
    ssh.host = scalar_or(node["host"], "");
    ssh.user = scalar_or(node["user"], "");
    std::string key = scalar_or(node["keyfile"], "");
    if (!key.empty()) ssh.keyfile = expand_user(key).string();
    if (node["port"]) {
        int port = int_or(node["port"], 0, 1);
        if (port > 0 && port <= 65535) ssh.port = port;
    }
    ssh.test_command = scalar_or(node["test_command"], DEFAULT_TEST_COMMAND);
    if (ssh.test_command.empty()) ssh.test_command = DEFAULT_TEST_COMMAND;
    ssh.connect_timeout = int_or(node["connect_timeout"], DIAG_CONNECT_TIMEOUT_SECS, 1);
    return ssh;
}

static InstanceConfig parse_instance_config(const YAML::Node& node) {
    InstanceConfig inst;
    inst.label = scalar_or(node["label"], "");
    inst.id = scalar_or(node["id"], "");
    return inst;
}

static RemoteConfig parse_remote_config(const YAML::Node& node) {
    RemoteConfig remote;
    remote.project_dir = strip_trailing_slash(scalar_or(node["project_dir"], ""));
    remote.inputs_dir = strip_trailing_slash(scalar_or(node["inputs_dir"], ""));
    remote.outputs_dir = strip_trailing_slash(scalar_or(node["outputs_dir"], ""));
    remote.log_file = scalar_or(node["log_file"], "");
    remote.tmux_session = scalar_or(node["tmux_session"], DEFAULT_SESSION_NAME);

    // Directories not given explicitly live under the project directory
    if (!remote.project_dir.empty()) {
        if (remote.inputs_dir.empty()) remote.inputs_dir = remote.project_dir + "/inputs";
        if (remote.outputs_dir.empty()) remote.outputs_dir = remote.project_dir + "/outputs";
        if (remote.log_file.empty())
            remote.log_file = remote.project_dir + "/logs/" + DEFAULT_LOG_FILENAME;
    }
    return remote;
}

static JobConfig parse_job_config(const YAML::Node& node) {
    JobConfig job;
    job.command = scalar_or(node["command"], "");
    if (node["env"] && node["env"].IsMap()) {
        for (const auto& kv : node["env"]) {
            job.env[kv.first.as<std::string>()] = kv.second.as<std::string>("");
        }
    }
    return job;
}

static TransferConfig parse_transfer_config(const YAML::Node& node) {
    TransferConfig t;
    std::string upload = scalar_or(node["upload_local_dir"], "");
    if (!upload.empty()) t.upload_local_dir = expand_user(upload);
    t.results_root = expand_user(scalar_or(node["results_root"], "./results"));
    t.download_glob = scalar_or(node["download_glob"], "");
    t.retries = int_or(node["retries"], DEFAULT_TRANSFER_RETRIES, 0);
    t.retry_backoff_sec = int_or(node["retry_backoff_sec"], DEFAULT_RETRY_BACKOFF_SECS, 0);
    t.verify_manifest = bool_or(node["verify_manifest"], true);
    t.manifest_name = scalar_or(node["manifest_name"], DEFAULT_MANIFEST_NAME);
    if (t.manifest_name.empty() || t.manifest_name.find('/') != std::string::npos)
        t.manifest_name = DEFAULT_MANIFEST_NAME;
    std::string rsync = scalar_or(node["rsync_path"], "");
    if (!rsync.empty()) t.rsync_path = expand_user(rsync).string();
    return t;
}

static LoggingConfig parse_logging_config(const YAML::Node& node) {
    LoggingConfig l;
    l.mirror_on_view = bool_or(node["mirror_on_view"], true);
    l.local_root = expand_user(scalar_or(node["local_root"], "./logs"));
    l.filename = scalar_or(node["filename"], DEFAULT_LOG_FILENAME);
    if (l.filename.empty()) l.filename = DEFAULT_LOG_FILENAME;
    l.mirror_interval_sec = int_or(node["mirror_interval_sec"], DEFAULT_MIRROR_INTERVAL_SECS, 1);
    return l;
}

static CleanupConfig parse_cleanup_config(const YAML::Node& node) {
    CleanupConfig c;
    c.rotate_remote_logs = bool_or(node["rotate_remote_logs"], false);
    c.keep_log_backups = int_or(node["keep_log_backups"], DEFAULT_KEEP_LOG_BACKUPS, 1);
    c.remove_remote_outputs = bool_or(node["remove_remote_outputs"], false);
    return c;
}

static DiagnosticsConfig parse_diagnostics_config(const YAML::Node& node) {
    DiagnosticsConfig d;
    d.remote_probe = bool_or(node["remote_probe"], false);
    std::string dir = scalar_or(node["log_dir"], "");
    d.log_dir = dir.empty() ? get_global_config_dir() / "diagnostics" : expand_user(dir);
    return d;
}

// ── Paths ─────────────────────────────────────────────────────

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

bool project_config_exists(const fs::path& dir) {
    return fs::exists(get_project_config_path(dir));
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".remora";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

fs::path get_project_config_path(const fs::path& dir) {
    return dir / "remora.yaml";
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err("Failed to create " + config_path.parent_path().string() +
                                 ": " + ec.message());
    }

    const char* default_config = R"(# remora configuration
# Project-level overrides go in ./remora.yaml

ssh:
  host: ""                      # or REMORA_HOST
  user: "root"                  # or REMORA_USER
  keyfile: "~/.ssh/id_ed25519"  # or REMORA_KEYFILE
  # port: 22
  connect_timeout: 10

instance:
  label: ""
  id: ""

remote:
  project_dir: "/root/remora_job"
  # inputs_dir / outputs_dir / log_file default to <project_dir>/inputs,
  # <project_dir>/outputs and <project_dir>/logs/run.log
  tmux_session: "remora"

job:
  command: ""
  env: {}

transfer:
  upload_local_dir: ""
  results_root: "./results"
  download_glob: ""
  retries: 3
  retry_backoff_sec: 3
  verify_manifest: true
  manifest_name: "_manifest.txt"

logging:
  mirror_on_view: true
  local_root: "./logs"
  filename: "run.log"
  mirror_interval_sec: 3

cleanup:
  rotate_remote_logs: false
  keep_log_backups: 5
  remove_remote_outputs: false

diagnostics:
  remote_probe: false
)";

    try {
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

// ── Config ────────────────────────────────────────────────────

Config::Config()
    : ssh_(parse_ssh_config(YAML::Node())),
      remote_(parse_remote_config(YAML::Node())),
      transfer_(parse_transfer_config(YAML::Node())),
      logging_(parse_logging_config(YAML::Node())),
      cleanup_(parse_cleanup_config(YAML::Node())),
      diagnostics_(parse_diagnostics_config(YAML::Node())) {
}

class ConfigBuilder {
public:
    static Result<Config> build(const YAML::Node& root, const fs::path& source) {
        if (root && !root.IsNull() && !root.IsMap()) {
            return Result<Config>::Err("Config root must be a mapping");
        }
        auto section = [&](const char* name) {
            return (root && root.IsMap() && root[name]) ? root[name] : YAML::Node();
        };

        Config config;
        config.ssh_ = parse_ssh_config(section("ssh"));
        config.instance_ = parse_instance_config(section("instance"));
        config.remote_ = parse_remote_config(section("remote"));
        config.job_ = parse_job_config(section("job"));
        config.transfer_ = parse_transfer_config(section("transfer"));
        config.logging_ = parse_logging_config(section("logging"));
        config.cleanup_ = parse_cleanup_config(section("cleanup"));
        config.diagnostics_ = parse_diagnostics_config(section("diagnostics"));
        config.source_ = source;
        return Result<Config>::Ok(config);
    }
};

Result<Config> Config::from_yaml(const std::string& text) {
    try {
        return ConfigBuilder::build(YAML::Load(text), fs::path());
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }
    try {
        auto result = ConfigBuilder::build(YAML::LoadFile(path.string()), path);
        if (result.is_ok()) result.value.apply_env_overrides();
        return result;
    } catch (const std::exception& e) {
        return Result<Config>::Err("Failed to parse " + path.string() + ": " + e.what());
    }
}

Result<Config> Config::load(const fs::path& project_dir) {
    bool have_global = global_config_exists();
    bool have_project = project_config_exists(project_dir);
    if (!have_global && !have_project) {
        return Result<Config>::Err("Config not found at " + get_global_config_path().string());
    }

    try {
        YAML::Node global = have_global
            ? YAML::LoadFile(get_global_config_path().string()) : YAML::Node();
        YAML::Node project = have_project
            ? YAML::LoadFile(get_project_config_path(project_dir).string()) : YAML::Node();

        fs::path source = have_project ? get_project_config_path(project_dir)
                                       : get_global_config_path();
        auto result = ConfigBuilder::build(merge_sections(global, project), source);
        if (result.is_ok()) result.value.apply_env_overrides();
        return result;
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

void Config::apply_env_overrides() {
    std::string host = platform::env_or_empty("REMORA_HOST");
    if (!host.empty()) ssh_.host = host;
    std::string user = platform::env_or_empty("REMORA_USER");
    if (!user.empty()) ssh_.user = user;
    std::string key = platform::env_or_empty("REMORA_KEYFILE");
    if (!key.empty()) ssh_.keyfile = expand_user(key).string();
}

RemoteTarget Config::target() const {
    if (ssh_.host.empty()) {
        throw std::invalid_argument("ssh.host is not set (config, REMORA_HOST or --host)");
    }
    if (ssh_.user.empty()) {
        throw std::invalid_argument("ssh.user is not set (config or REMORA_USER)");
    }
    RemoteTarget t;
    t.host = ssh_.host;
    t.user = ssh_.user;
    if (!ssh_.keyfile.empty()) t.key_path = ssh_.keyfile;
    t.port = ssh_.port;
    return t;
}
