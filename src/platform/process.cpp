#include "process.hpp"
#include "platform.hpp"
#include <core/constants.hpp>

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>

namespace platform {

// ── helpers ──────────────────────────────────────────────────

int decode_wait_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

namespace {

// argv is built before fork() so the child only calls async-signal-safe functions.
std::vector<const char*> build_argv(const std::string& program,
                                    const std::vector<std::string>& args) {
    std::vector<const char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);
    return argv;
}

void redirect_stdin_to_null() {
    int fd = open("/dev/null", O_RDONLY);
    if (fd >= 0) {
        dup2(fd, STDIN_FILENO);
        if (fd != STDIN_FILENO) close(fd);
    }
}

void redirect_to_null(int target_fd) {
    int fd = open("/dev/null", O_WRONLY);
    if (fd >= 0) {
        dup2(fd, target_fd);
        close(fd);
    }
}

int waitpid_retry(pid_t pid, int* status, int options) {
    pid_t ret;
    do {
        ret = waitpid(pid, status, options);
    } while (ret < 0 && errno == EINTR);
    return ret;
}

} // namespace

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    close_pipe();
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : pid_(other.pid_), out_fd_(other.out_fd_), reaped_(other.reaped_),
      exit_code_(other.exit_code_), eof_(other.eof_),
      pending_(std::move(other.pending_)) {
    other.pid_ = -1;
    other.out_fd_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        close_pipe();
        pid_ = other.pid_;
        out_fd_ = other.out_fd_;
        reaped_ = other.reaped_;
        exit_code_ = other.exit_code_;
        eof_ = other.eof_;
        pending_ = std::move(other.pending_);
        other.pid_ = -1;
        other.out_fd_ = -1;
    }
    return *this;
}

void ProcessHandle::close_pipe() {
    if (out_fd_ >= 0) {
        close(out_fd_);
        out_fd_ = -1;
    }
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

bool ProcessHandle::running() {
    if (pid_ <= 0 || reaped_) return false;
    int status;
    pid_t ret = waitpid_retry(pid_, &status, WNOHANG);
    if (ret == pid_) {
        reaped_ = true;
        exit_code_ = decode_wait_status(status);
        return false;
    }
    return ret == 0;  // 0 means still running
}

int ProcessHandle::wait(int timeout_ms) {
    if (pid_ <= 0) return -1;
    if (reaped_) return exit_code_;

    if (timeout_ms < 0) {
        int status;
        if (waitpid_retry(pid_, &status, 0) != pid_) return -1;
        reaped_ = true;
        exit_code_ = decode_wait_status(status);
        return exit_code_;
    }
    // Poll with timeout
    int elapsed = 0;
    while (elapsed < timeout_ms) {
        if (!running()) return exit_code_;
        sleep_ms(50);
        elapsed += 50;
    }
    return running() ? -1 : exit_code_;
}

void ProcessHandle::interrupt() {
    if (pid_ <= 0 || reaped_) return;
    kill(pid_, SIGINT);
}

void ProcessHandle::terminate() {
    if (pid_ <= 0 || reaped_) return;
    kill(pid_, SIGTERM);
    // Wait up to 2s for graceful exit
    if (wait(2000) >= 0) return;
    kill(pid_, SIGKILL);
    wait();
}

bool ProcessHandle::take_line(std::string& line) {
    auto nl = pending_.find('\n');
    if (nl == std::string::npos) return false;
    line = pending_.substr(0, nl);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    pending_.erase(0, nl + 1);
    return true;
}

ProcessHandle::ReadStatus ProcessHandle::read_line(std::string& line, int timeout_ms) {
    if (take_line(line)) return ReadStatus::Line;

    if (eof_ || out_fd_ < 0) {
        if (!pending_.empty()) {
            line.swap(pending_);
            pending_.clear();
            return ReadStatus::Line;
        }
        return ReadStatus::Closed;
    }

    struct pollfd pfd = {out_fd_, POLLIN, 0};
    int pr = poll(&pfd, 1, timeout_ms);
    if (pr < 0) {
        // EINTR: the caller's SIGINT handler ran; let it look at its flag
        return ReadStatus::Timeout;
    }
    if (pr == 0) return ReadStatus::Timeout;

    char buf[PROC_READ_BUF_SIZE];
    ssize_t n = read(out_fd_, buf, sizeof(buf));
    if (n > 0) {
        pending_.append(buf, static_cast<size_t>(n));
    } else if (n == 0 || errno != EINTR) {
        eof_ = true;
        close_pipe();
    }
    return read_line(line, 0);
}

// ── spawn ────────────────────────────────────────────────────

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::string& stderr_log) {
    ProcessHandle handle;
    auto argv = build_argv(program, args);

    pid_t pid = fork();
    if (pid < 0) return handle;  // fork failed

    if (pid == 0) {
        redirect_stdin_to_null();

        if (!stderr_log.empty()) {
            int fd = open(stderr_log.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
            if (fd >= 0) {
                dup2(fd, STDERR_FILENO);
                close(fd);
            }
        }

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(EXIT_EXEC_FAILED);
    }

    handle.pid_ = pid;
    return handle;
}

// Both ends close on exec, so a fork on another thread (the mirror worker
// starting rsync) cannot inherit them. dup2 in the child clears the flag on
// the stdio copies.
bool open_cloexec_pipe(int fds[2]) {
    return pipe2(fds, O_CLOEXEC) == 0;
}

ProcessHandle spawn_piped(const std::string& program,
                          const std::vector<std::string>& args) {
    ProcessHandle handle;
    auto argv = build_argv(program, args);

    int fds[2];
    if (!open_cloexec_pipe(fds)) return handle;

    pid_t pid = fork();
    if (pid < 0) {
        close(fds[0]);
        close(fds[1]);
        return handle;
    }

    if (pid == 0) {
        setpgid(0, 0);
        redirect_stdin_to_null();
        close(fds[0]);
        dup2(fds[1], STDOUT_FILENO);
        dup2(fds[1], STDERR_FILENO);
        close(fds[1]);

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(EXIT_EXEC_FAILED);
    }

    close(fds[1]);
    handle.pid_ = pid;
    handle.out_fd_ = fds[0];
    return handle;
}

ProcessOutput run_capture(const std::string& program,
                          const std::vector<std::string>& args) {
    ProcessOutput result;
    auto argv = build_argv(program, args);

    int out_pipe[2];
    int err_pipe[2];
    if (!open_cloexec_pipe(out_pipe)) {
        result.err = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }
    if (!open_cloexec_pipe(err_pipe)) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        result.err = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) close(fd);
        result.err = std::string("fork failed: ") + std::strerror(errno);
        return result;
    }

    if (pid == 0) {
        redirect_stdin_to_null();
        close(out_pipe[0]);
        close(err_pipe[0]);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[1]);
        close(err_pipe[1]);

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(EXIT_EXEC_FAILED);
    }

    close(out_pipe[1]);
    close(err_pipe[1]);

    struct pollfd pfds[2] = {
        {out_pipe[0], POLLIN, 0},
        {err_pipe[0], POLLIN, 0},
    };
    std::string* sinks[2] = {&result.out, &result.err};
    int open_fds = 2;
    char buf[PROC_READ_BUF_SIZE];

    while (open_fds > 0) {
        int pr = poll(pfds, 2, -1);
        if (pr < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (pfds[i].fd < 0 || pfds[i].revents == 0) continue;
            ssize_t n = read(pfds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close(pfds[i].fd);
                pfds[i].fd = -1;
                --open_fds;
            }
        }
    }
    for (auto& p : pfds) {
        if (p.fd >= 0) close(p.fd);
    }

    int status = 0;
    if (waitpid_retry(pid, &status, 0) == pid) {
        result.exit_code = decode_wait_status(status);
    }
    return result;
}

int run_inherit(const std::string& program,
                const std::vector<std::string>& args,
                bool quiet) {
    auto argv = build_argv(program, args);

    pid_t pid = fork();
    if (pid < 0) return -1;

    if (pid == 0) {
        redirect_stdin_to_null();
        if (quiet) {
            redirect_to_null(STDOUT_FILENO);
            redirect_to_null(STDERR_FILENO);
        }
        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(EXIT_EXEC_FAILED);
    }

    int status = 0;
    if (waitpid_retry(pid, &status, 0) != pid) return -1;
    return decode_wait_status(status);
}

} // namespace platform
