#include "transfer_engine.hpp"
#include "glob_filter.hpp"
#include "job_log.hpp"
#include "manifest.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <stdexcept>

TransferEngine::TransferEngine(RemoteShell& shell,
                               std::unique_ptr<Transporter> primary,
                               std::unique_ptr<Transporter> fallback,
                               Sleeper sleeper,
                               StatusCallback callback)
    : shell_(shell), primary_(std::move(primary)), fallback_(std::move(fallback)),
      sleeper_(std::move(sleeper)), callback_(std::move(callback)) {
    if (!fallback_) throw std::invalid_argument("fallback transporter is required");
}

Transporter& TransferEngine::active() {
    if (primary_) return *primary_;
    warn_degraded();
    return *fallback_;
}

void TransferEngine::warn_degraded() {
    if (degraded_warned_) return;
    degraded_warned_ = true;
    remora_log("rsync unavailable, degraded to " + fallback_->name());
    status(fmt::format("rsync not available locally, using {} (no resume, no remote filtering)",
                       fallback_->name()));
}

// ── Upload ───────────────────────────────────────────────────

void TransferEngine::upload_tree(const RemoteTarget& target, const fs::path& local_dir,
                                 const std::string& remote_dir,
                                 const std::vector<std::string>& extra_remote_dirs) {
    begin_call();
    require_target(target);
    if (local_dir.empty() || !fs::exists(local_dir)) {
        throw std::invalid_argument("local directory does not exist: " + local_dir.string());
    }
    if (!fs::is_directory(local_dir)) {
        throw std::invalid_argument("not a directory: " + local_dir.string());
    }
    if (remote_dir.empty()) throw std::invalid_argument("remote directory is empty");
    for (const auto& d : extra_remote_dirs) {
        if (d.empty()) throw std::invalid_argument("remote directory is empty");
    }

    std::string mkdir = "mkdir -p " + shell_quote_path(remote_dir);
    for (const auto& d : extra_remote_dirs) mkdir += " " + shell_quote_path(d);
    auto mk = shell_.run(target, mkdir);
    if (mk.failed()) {
        std::string err = mk.get_output();
        trim(err);
        throw TransferError(fmt::format("mkdir on {} failed (exit {}): {}",
                                        target.host, mk.exit_code, err),
                            mk.exit_code);
    }

    if (fs::is_empty(local_dir)) {
        status("Nothing to upload in " + local_dir.string());
        return;
    }

    if (primary_) {
        try {
            status(fmt::format("Uploading {} -> {}:{} ({})", local_dir.string(), target.host,
                               remote_dir, primary_->name()));
            primary_->upload_contents(target, local_dir, remote_dir);
            return;
        } catch (const TransferError& e) {
            remora_log(std::string("primary upload failed: ") + e.what());
            status(fmt::format("{} upload failed ({}), retrying item by item with {}",
                               primary_->name(), e.what(), fallback_->name()));
        }
    } else {
        warn_degraded();
        status(fmt::format("Uploading {} -> {}:{} ({})", local_dir.string(), target.host,
                           remote_dir, fallback_->name()));
    }
    fallback_->upload_contents(target, local_dir, remote_dir);
}

// ── Download ─────────────────────────────────────────────────

bool TransferEngine::generate_remote_manifest(const RemoteTarget& target,
                                              const std::string& remote_dir,
                                              const std::string& manifest_name,
                                              const std::string& filter) {
    auto r = shell_.run(target, remote_manifest_command(remote_dir, manifest_name, filter));
    if (r.failed()) {
        std::string err = r.get_output();
        trim(err);
        status(fmt::format("Could not generate manifest in {} (exit {}): {}",
                           remote_dir, r.exit_code, err));
        return false;
    }
    return true;
}

Transporter& TransferEngine::download_attempts(const RemoteTarget& target,
                                               const std::string& remote_dir,
                                               const fs::path& local_dir,
                                               const std::string& filter,
                                               RetryPolicy& policy) {
    return policy.run([&]() -> Transporter& {
        Transporter& t = active();
        t.download_tree(target, remote_dir, local_dir, filter);
        return t;
    }, "download " + remote_dir);
}

Transporter& TransferEngine::download_with_retry(const RemoteTarget& target,
                                                 const std::string& remote_dir,
                                                 const fs::path& local_dir,
                                                 const std::string& filter,
                                                 int max_retries, int backoff_base) {
    begin_call();
    require_target(target);
    if (remote_dir.empty()) throw std::invalid_argument("remote directory is empty");
    RetryPolicy policy(max_retries, backoff_base, sleeper_);
    policy.set_status_callback(callback_);
    return download_attempts(target, remote_dir, local_dir, filter, policy);
}

TransferResult TransferEngine::download_tree(const RemoteTarget& target,
                                             const std::string& remote_dir,
                                             const fs::path& local_dir,
                                             const DownloadOptions& options) {
    begin_call();
    require_target(target);
    if (remote_dir.empty()) throw std::invalid_argument("remote directory is empty");
    if (local_dir.empty()) throw std::invalid_argument("local directory is empty");
    if (options.verify_manifest &&
        (options.manifest_name.empty() || options.manifest_name.find('/') != std::string::npos)) {
        throw std::invalid_argument("invalid manifest name '" + options.manifest_name + "'");
    }

    std::unique_ptr<GlobFilter> filter;
    if (!options.filter.empty()) filter = std::make_unique<GlobFilter>(options.filter);

    RetryPolicy policy(options.max_retries, options.backoff_base, sleeper_);
    policy.set_status_callback(callback_);
    fs::create_directories(local_dir);

    fs::path manifest_local = local_dir / options.manifest_name;
    if (options.verify_manifest) {
        status("Generating remote manifest");
        if (generate_remote_manifest(target, remote_dir, options.manifest_name, options.filter)) {
            std::string remote_manifest = remote_dir;
            if (remote_manifest.back() != '/') remote_manifest += '/';
            remote_manifest += options.manifest_name;
            policy.run([&]() {
                active().download_file(target, remote_manifest, manifest_local, true);
            }, "manifest download");
        }
    }

    status(fmt::format("Downloading {}:{} -> {}{}", target.host, remote_dir, local_dir.string(),
                       options.filter.empty() ? "" : " (filter " + options.filter + ")"));
    Transporter& used = download_attempts(target, remote_dir, local_dir, options.filter, policy);

    if (filter && !used.supports_filter()) {
        std::vector<std::string> keep;
        if (options.verify_manifest) keep.push_back(options.manifest_name);
        int removed = sweep_unmatched(local_dir, *filter, keep);
        if (removed > 0) {
            status(fmt::format("Removed {} file(s) not matching {}", removed, options.filter));
        }
    }

    if (!options.verify_manifest) {
        TransferResult result;
        result.success = true;
        result.local_dir = local_dir;
        return result;
    }

    auto result = verify_against_manifest(local_dir, manifest_local);
    if (!result.manifest_found) {
        status("Manifest missing, download could not be verified");
    }
    return result;
}
