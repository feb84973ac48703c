#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <core/constants.hpp>
#include <core/types.hpp>
#include <ssh/remote_shell.hpp>
#include "retry_policy.hpp"
#include "transporter.hpp"

namespace fs = std::filesystem;

struct DownloadOptions {
    std::string filter;                                 // glob; empty = everything
    bool verify_manifest = true;
    std::string manifest_name = DEFAULT_MANIFEST_NAME;
    int max_retries = DEFAULT_TRANSFER_RETRIES;
    int backoff_base = DEFAULT_RETRY_BACKOFF_SECS;
};

// Moves directory trees between the local machine and a RemoteTarget.
// The primary transporter (rsync) is optional; without it everything goes
// through the fallback (scp) and the operator is warned once per call.
class TransferEngine {
public:
    TransferEngine(RemoteShell& shell,
                   std::unique_ptr<Transporter> primary,
                   std::unique_ptr<Transporter> fallback,
                   Sleeper sleeper = nullptr,
                   StatusCallback callback = nullptr);

    bool primary_available() const { return primary_ != nullptr; }

    // Copy the contents of local_dir into remote_dir, creating remote_dir and
    // every extra_remote_dirs entry first. An empty local_dir is a no-op.
    void upload_tree(const RemoteTarget& target, const fs::path& local_dir,
                     const std::string& remote_dir,
                     const std::vector<std::string>& extra_remote_dirs = {});

    // Manifest (when enabled), tree download with retry, fallback-mode
    // filter sweep, then manifest verification. Transfer failures that
    // survive every retry propagate; verification problems are reported in
    // the returned TransferResult.
    TransferResult download_tree(const RemoteTarget& target, const std::string& remote_dir,
                                 const fs::path& local_dir, const DownloadOptions& options);

    // max_retries + 1 attempts with base * 2^(attempt-1) second pauses.
    // Returns the transporter that did the copy.
    Transporter& download_with_retry(const RemoteTarget& target, const std::string& remote_dir,
                                     const fs::path& local_dir, const std::string& filter,
                                     int max_retries, int backoff_base);

    // Write <remote_dir>/<manifest_name> on the remote host.
    bool generate_remote_manifest(const RemoteTarget& target, const std::string& remote_dir,
                                  const std::string& manifest_name, const std::string& filter);

private:
    RemoteShell& shell_;
    std::unique_ptr<Transporter> primary_;
    std::unique_ptr<Transporter> fallback_;
    Sleeper sleeper_;
    StatusCallback callback_;
    bool degraded_warned_ = false;

    Transporter& active();
    void begin_call() { degraded_warned_ = false; }
    void warn_degraded();
    void status(const std::string& msg) const {
        if (callback_) callback_(msg);
    }
    Transporter& download_attempts(const RemoteTarget& target, const std::string& remote_dir,
                                   const fs::path& local_dir, const std::string& filter,
                                   RetryPolicy& policy);
};
