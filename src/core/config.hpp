#pragma once

#include <string>
#include <map>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

struct SSHConfig {
    std::string host;
    std::string user;
    std::string keyfile;              // expanded; empty means ssh's default identity
    std::optional<int> port;
    std::string test_command;
    int connect_timeout = 10;
};

struct InstanceConfig {
    std::string label;
    std::string id;
};

struct RemoteConfig {
    std::string project_dir;
    std::string inputs_dir;
    std::string outputs_dir;
    std::string log_file;
    std::string tmux_session;
};

struct JobConfig {
    std::string command;
    std::map<std::string, std::string> env;
};

struct TransferConfig {
    fs::path upload_local_dir;
    fs::path results_root;
    std::string download_glob;        // empty means no filter
    int retries = 3;
    int retry_backoff_sec = 3;
    bool verify_manifest = true;
    std::string manifest_name;
    std::string rsync_path;           // explicit rsync location, checked after PATH
};

struct LoggingConfig {
    bool mirror_on_view = true;
    fs::path local_root;
    std::string filename;
    int mirror_interval_sec = 3;
};

struct CleanupConfig {
    bool rotate_remote_logs = false;
    int keep_log_backups = 5;
    bool remove_remote_outputs = false;
};

struct DiagnosticsConfig {
    bool remote_probe = false;
    fs::path log_dir;
};

class Config {
public:
    // Load ~/.remora/config.yaml, overridden by ./remora.yaml when present.
    static Result<Config> load(const fs::path& project_dir = fs::current_path());

    // Load a single explicit file (--config).
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text. Used by both loaders and by tests.
    static Result<Config> from_yaml(const std::string& text);

    // REMORA_HOST / REMORA_USER / REMORA_KEYFILE
    void apply_env_overrides();

    // Build the target every core call takes; throws std::invalid_argument
    // when host or user is missing.
    RemoteTarget target() const;

    const SSHConfig& ssh() const { return ssh_; }
    const InstanceConfig& instance() const { return instance_; }
    const RemoteConfig& remote() const { return remote_; }
    const JobConfig& job() const { return job_; }
    const TransferConfig& transfer() const { return transfer_; }
    const LoggingConfig& logging() const { return logging_; }
    const CleanupConfig& cleanup() const { return cleanup_; }
    const DiagnosticsConfig& diagnostics() const { return diagnostics_; }
    const fs::path& source() const { return source_; }

    void set_host(const std::string& host) { ssh_.host = host; }

    Config();

private:
    SSHConfig ssh_;
    InstanceConfig instance_;
    RemoteConfig remote_;
    JobConfig job_;
    TransferConfig transfer_;
    LoggingConfig logging_;
    CleanupConfig cleanup_;
    DiagnosticsConfig diagnostics_;
    fs::path source_;

    friend class ConfigBuilder;
};

bool global_config_exists();
bool project_config_exists(const fs::path& dir = fs::current_path());

fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_project_config_path(const fs::path& dir = fs::current_path());

// Write a commented starter config unless one already exists.
Result<void> create_default_global_config();
