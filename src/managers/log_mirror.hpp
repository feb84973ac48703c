#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include <ssh/remote_shell.hpp>
#include "transporter.hpp"

namespace fs = std::filesystem;

// Background task that calls a sync function every interval until stopped.
// A failed sync is reported through warn and the loop keeps going. stop()
// wakes the timed wait immediately; no further cycle starts after it.
class MirrorWorker {
public:
    using SyncFn = std::function<void()>;

    MirrorWorker(SyncFn sync, std::chrono::milliseconds interval, StatusCallback warn);
    ~MirrorWorker();

    MirrorWorker(const MirrorWorker&) = delete;
    MirrorWorker& operator=(const MirrorWorker&) = delete;

    void start();
    void stop();

    // Block until the task has returned. Safe to call more than once.
    void wait();

    int cycles() const { return cycles_.load(); }

private:
    SyncFn sync_;
    std::chrono::milliseconds interval_;
    StatusCallback warn_;

    std::future<void> future_;
    std::mutex mu_;
    std::condition_variable cv_;
    bool stop_ = false;
    std::atomic<int> cycles_{0};

    void loop();
};

struct MirrorOptions {
    fs::path local_root;
    std::string filename = "run.log";
    int interval_secs = 3;
    bool mirror = true;              // false: tail only
    std::string label;               // directory name preference: label, id, host
    std::string id;
};

// Live view of the remote job log with a local copy kept in step.
//
//   <root>/<label|id|host>/<stamp>/<filename>       lines seen by the tail
//   <root>/<label|id|host>/<stamp>/mirror/<log>     replica kept by rsync
//
// The tail file is written only by the foreground loop, the replica only
// by rsync (initial, periodic, final sync).
class LogMirror {
public:
    using InterruptCheck = std::function<bool()>;
    using LineSink = std::function<void(const std::string&)>;

    // rsync may be null; mirroring is then skipped.
    LogMirror(RemoteShell& shell, Transporter* rsync,
              StatusCallback callback = nullptr,
              InterruptCheck interrupted = nullptr,
              LineSink console = nullptr);

    // Blocks until the tail ends or the operator interrupts. Returns the
    // follow process's exit code with 130 (Ctrl-C) normalized to 0.
    int run(const RemoteTarget& target, const std::string& remote_log,
            const MirrorOptions& options);

    const fs::path& session_dir() const { return session_dir_; }
    const fs::path& tail_file() const { return tail_file_; }
    const fs::path& replica_file() const { return replica_file_; }
    int mirror_cycles() const { return mirror_cycles_; }

    static std::string tail_command(const std::string& remote_log);

    // Directory name for the run: label, else id, else host with separators dashed.
    static std::string run_name(const MirrorOptions& options, const RemoteTarget& target);

private:
    RemoteShell& shell_;
    Transporter* rsync_;
    StatusCallback callback_;
    InterruptCheck interrupted_;
    LineSink console_;

    fs::path session_dir_;
    fs::path tail_file_;
    fs::path replica_file_;
    int mirror_cycles_ = 0;

    bool remote_has_rsync(const RemoteTarget& target);
    void status(const std::string& msg) const {
        if (callback_) callback_(msg);
    }
};
