#include "log_mirror.hpp"
#include "job_log.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <fstream>
#include <iostream>
#include <stdexcept>

// ── MirrorWorker ─────────────────────────────────────────────

MirrorWorker::MirrorWorker(SyncFn sync, std::chrono::milliseconds interval, StatusCallback warn)
    : sync_(std::move(sync)), interval_(interval), warn_(std::move(warn)) {
    if (interval_.count() <= 0) throw std::invalid_argument("mirror interval must be positive");
}

MirrorWorker::~MirrorWorker() {
    stop();
    if (future_.valid()) future_.wait();
}

void MirrorWorker::start() {
    if (future_.valid()) return;
    {
        std::lock_guard<std::mutex> lock(mu_);
        stop_ = false;
    }
    future_ = std::async(std::launch::async, [this] { loop(); });
}

void MirrorWorker::stop() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        stop_ = true;
    }
    cv_.notify_all();
}

void MirrorWorker::wait() {
    if (future_.valid()) future_.get();
}

void MirrorWorker::loop() {
    std::unique_lock<std::mutex> lock(mu_);
    while (true) {
        if (cv_.wait_for(lock, interval_, [this] { return stop_; })) break;

        lock.unlock();
        try {
            sync_();
        } catch (const std::exception& e) {
            remora_log(std::string("mirror sync failed: ") + e.what());
            if (warn_) warn_(std::string("Log mirror sync failed: ") + e.what());
        }
        cycles_.fetch_add(1);
        lock.lock();
    }
}

// ── LogMirror ────────────────────────────────────────────────

LogMirror::LogMirror(RemoteShell& shell, Transporter* rsync, StatusCallback callback,
                     InterruptCheck interrupted, LineSink console)
    : shell_(shell), rsync_(rsync), callback_(std::move(callback)),
      interrupted_(std::move(interrupted)), console_(std::move(console)) {
    if (!interrupted_) interrupted_ = [] { return false; };
    if (!console_) console_ = [](const std::string& line) { std::cout << line << std::endl; };
}

std::string LogMirror::tail_command(const std::string& remote_log) {
    return "tail -n +1 -F " + shell_quote_path(remote_log);
}

std::string LogMirror::run_name(const MirrorOptions& options, const RemoteTarget& target) {
    if (!options.label.empty()) return label_dir_name(options.label);
    if (!options.id.empty()) return label_dir_name(options.id);
    return sanitize_host(target.host);
}

bool LogMirror::remote_has_rsync(const RemoteTarget& target) {
    auto r = shell_.run(target, "command -v rsync");
    return r.success();
}

int LogMirror::run(const RemoteTarget& target, const std::string& remote_log,
                   const MirrorOptions& options) {
    require_target(target);
    if (remote_log.empty()) throw std::invalid_argument("remote log path is empty");
    if (options.filename.empty()) throw std::invalid_argument("local log filename is empty");
    if (options.interval_secs <= 0) throw std::invalid_argument("mirror interval must be positive");

    session_dir_ = make_stamped_dir(options.local_root, run_name(options, target));
    tail_file_ = session_dir_ / options.filename;
    std::string log_base = fs::path(remote_log).filename().string();
    if (log_base.empty()) log_base = options.filename;
    replica_file_ = session_dir_ / MIRROR_SUBDIR / log_base;
    mirror_cycles_ = 0;

    bool mirroring = options.mirror;
    if (mirroring && !rsync_) {
        status("rsync not available locally, showing the log without mirroring");
        mirroring = false;
    } else if (mirroring && !remote_has_rsync(target)) {
        status("rsync not found on " + target.host + ", showing the log without mirroring");
        mirroring = false;
    }

    auto sync = [&](bool quiet) {
        rsync_->download_file(target, remote_log, replica_file_, quiet);
    };

    if (mirroring) {
        status("Initial sync of " + remote_log);
        try {
            sync(false);
        } catch (const TransferError& e) {
            status(std::string("Initial log sync failed: ") + e.what());
        }
    }

    std::ofstream out(tail_file_, std::ios::app);
    if (!out) {
        throw std::runtime_error("cannot write " + tail_file_.string());
    }

    MirrorWorker worker([&] { sync(true); },
                        std::chrono::seconds(options.interval_secs),
                        callback_);
    if (mirroring) worker.start();

    status(fmt::format("Following {}:{} (Ctrl-C to stop)", target.host, remote_log));
    std::unique_ptr<RemoteStream> stream;
    try {
        stream = shell_.follow(target, tail_command(remote_log));
    } catch (const std::exception&) {
        worker.stop();
        worker.wait();
        throw;
    }

    bool interrupted = false;
    std::string line;
    while (true) {
        if (interrupted_()) {
            interrupted = true;
            break;
        }
        auto rs = stream->read_line(line, FOLLOW_POLL_MS);
        if (rs == RemoteStream::Read::Closed) break;
        if (rs == RemoteStream::Read::Timeout) continue;
        console_(line);
        out << line << "\n";
        out.flush();
    }

    int rc;
    if (interrupted) {
        status("Stopping log view");
        stream->interrupt();
        rc = stream->wait(SIGINT_GRACE_MS);
        if (rc < 0) {
            stream->terminate();
            rc = stream->wait();
        }
    } else {
        rc = stream->wait();
    }

    worker.stop();
    worker.wait();
    mirror_cycles_ = worker.cycles();

    if (mirroring) {
        try {
            sync(true);
            status("Log mirrored to " + replica_file_.string());
        } catch (const TransferError& e) {
            status(std::string("Final log sync failed: ") + e.what());
        }
    }

    remora_log(fmt::format("log view {} ended rc={} interrupted={} cycles={}",
                           remote_log, rc, interrupted, mirror_cycles_));
    // ssh exits 255 ("Killed by signal 2.") when it is in its client loop,
    // so an operator stop counts as success whatever the follow process says.
    if (interrupted || rc == EXIT_INTERRUPTED) rc = 0;
    return rc;
}
