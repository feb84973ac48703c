#pragma once

#include <string>
#include <vector>

namespace platform {

// Captured result of a finished child process.
struct ProcessOutput {
    int exit_code = -1;     // exit status, 128+N when killed by signal N
    std::string out;
    std::string err;
};

// Opaque handle to a spawned child process.
class ProcessHandle {
public:
    enum class ReadStatus { Line, Timeout, Closed };

    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // True if the process is still running. Reaps (and remembers the exit
    // code of) a child that has already exited.
    bool running();

    // Wait for the process to exit. Returns exit code.
    // timeout_ms = -1 means indefinite wait. Returns -1 on timeout.
    int wait(int timeout_ms = -1);

    // Send SIGINT, the same signal a terminal Ctrl-C would deliver.
    void interrupt();

    // Terminate the process (SIGTERM, then SIGKILL after 2s).
    void terminate();

    // Read one line (without the trailing newline) from the output pipe of a
    // process started with spawn_piped(). A final unterminated line is
    // returned before Closed.
    ReadStatus read_line(std::string& line, int timeout_ms);

    int native_handle() const { return pid_; }

private:
    int pid_ = -1;
    int out_fd_ = -1;
    bool reaped_ = false;
    int exit_code_ = -1;
    bool eof_ = false;
    std::string pending_;

    void close_pipe();
    bool take_line(std::string& line);

    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               const std::string& stderr_log);
    friend ProcessHandle spawn_piped(const std::string& program,
                                     const std::vector<std::string>& args);
};

// Spawn a child process.
// stderr_log: if non-empty, redirect child's stderr to this file (append mode).
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::string& stderr_log = "");

// pipe2() with O_CLOEXEC on both ends. False when the pipe could not be made.
bool open_cloexec_pipe(int fds[2]);

// Spawn a child with stdout and stderr merged into a pipe readable through
// ProcessHandle::read_line(). The child gets its own process group so a
// terminal Ctrl-C reaches only the parent, which forwards it via interrupt().
ProcessHandle spawn_piped(const std::string& program,
                          const std::vector<std::string>& args);

// Run to completion, capturing stdout and stderr separately.
ProcessOutput run_capture(const std::string& program,
                          const std::vector<std::string>& args);

// Run to completion with stdout/stderr inherited from this process.
// quiet = true sends both to /dev/null instead.
int run_inherit(const std::string& program,
                const std::vector<std::string>& args,
                bool quiet = false);

// Decode a waitpid() status into a shell-style exit code.
int decode_wait_status(int status);

} // namespace platform
