#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>

namespace fs = std::filesystem;

// One way of moving bytes between the local machine and a RemoteTarget.
// Every operation throws TransferError when the tool fails, and
// std::filesystem::filesystem_error on local I/O problems.
class Transporter {
public:
    virtual ~Transporter() = default;

    virtual std::string name() const = 0;

    // True when download_tree() applies a glob filter on the remote side.
    virtual bool supports_filter() const = 0;

    // Copy the contents of local_dir (not the directory itself) into the
    // existing remote_dir.
    virtual void upload_contents(const RemoteTarget& target, const fs::path& local_dir,
                                 const std::string& remote_dir) = 0;

    // Copy the contents of remote_dir into local_dir. filter is a glob; empty
    // means everything. Ignored unless supports_filter().
    virtual void download_tree(const RemoteTarget& target, const std::string& remote_dir,
                               const fs::path& local_dir, const std::string& filter) = 0;

    // Copy a single remote file to local_path. quiet suppresses progress output.
    virtual void download_file(const RemoteTarget& target, const std::string& remote_path,
                               const fs::path& local_path, bool quiet) = 0;
};

// ── rsync: resumable, filterable ─────────────────────────────

class RsyncTransporter : public Transporter {
public:
    explicit RsyncTransporter(fs::path rsync_program);

    std::string name() const override { return "rsync"; }
    bool supports_filter() const override { return true; }

    void upload_contents(const RemoteTarget& target, const fs::path& local_dir,
                         const std::string& remote_dir) override;
    void download_tree(const RemoteTarget& target, const std::string& remote_dir,
                       const fs::path& local_dir, const std::string& filter) override;
    void download_file(const RemoteTarget& target, const std::string& remote_path,
                       const fs::path& local_path, bool quiet) override;

    std::vector<std::string> upload_args(const RemoteTarget& target, const fs::path& local_dir,
                                         const std::string& remote_dir) const;
    std::vector<std::string> download_args(const RemoteTarget& target,
                                           const std::string& remote_dir,
                                           const fs::path& local_dir,
                                           const std::string& filter) const;
    std::vector<std::string> file_args(const RemoteTarget& target, const std::string& remote_path,
                                       const fs::path& local_path, bool quiet) const;

private:
    fs::path program_;
};

// ── scp: universally available fallback ──────────────────────

class ScpTransporter : public Transporter {
public:
    explicit ScpTransporter(std::string scp_program = "scp");

    std::string name() const override { return "scp"; }
    bool supports_filter() const override { return false; }

    // One scp per immediate child of local_dir.
    void upload_contents(const RemoteTarget& target, const fs::path& local_dir,
                         const std::string& remote_dir) override;

    // Full recursive copy into a fresh staging directory inside local_dir,
    // then merged over local_dir. scp's "copy into vs copy as" ambiguity
    // never applies to a destination that does not exist yet.
    void download_tree(const RemoteTarget& target, const std::string& remote_dir,
                       const fs::path& local_dir, const std::string& filter) override;
    void download_file(const RemoteTarget& target, const std::string& remote_path,
                       const fs::path& local_path, bool quiet) override;

    std::vector<std::string> item_upload_args(const RemoteTarget& target, const fs::path& item,
                                              const std::string& remote_dir) const;
    std::vector<std::string> tree_download_args(const RemoteTarget& target,
                                                const std::string& remote_dir,
                                                const fs::path& staging) const;

private:
    std::string program_;
};

// ── Capability probe ─────────────────────────────────────────

// rsync on PATH, else override_path (transfer.rsync_path), else $RSYNC_PATH.
std::optional<fs::path> find_local_rsync(const std::string& override_path = "");

// RsyncTransporter when rsync is available locally, otherwise nullptr.
std::unique_ptr<Transporter> make_primary_transporter(const std::string& override_path = "");

// Move every entry of src into dst (directories merged, files replaced),
// then remove src.
void merge_tree(const fs::path& src, const fs::path& dst);
