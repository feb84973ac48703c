#pragma once

#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <managers/transporter.hpp>
#include <ssh/remote_shell.hpp>

namespace fs = std::filesystem;

inline RemoteTarget test_target() {
    RemoteTarget t;
    t.host = "10.0.0.5";
    t.user = "ubuntu";
    return t;
}

inline void write_text(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream(path, std::ios::binary) << content;
}

inline std::string read_text(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// ── Scripted remote stream ───────────────────────────────────

struct StreamState {
    std::vector<std::string> lines;
    size_t next = 0;
    bool hold_open = false;     // after the lines: Timeout instead of Closed
    int exit_code = 0;
    int interrupt_exit_code = 130;
    bool ignores_interrupt = false;   // bounded waits time out until terminate()
    bool interrupted = false;
    bool terminated = false;
};

class FakeStream : public RemoteStream {
public:
    explicit FakeStream(std::shared_ptr<StreamState> state) : state_(std::move(state)) {}

    Read read_line(std::string& line, int) override {
        if (state_->next < state_->lines.size()) {
            line = state_->lines[state_->next++];
            return Read::Line;
        }
        if (state_->hold_open && !state_->interrupted) return Read::Timeout;
        return Read::Closed;
    }

    void interrupt() override {
        state_->interrupted = true;
        if (!state_->ignores_interrupt) state_->exit_code = state_->interrupt_exit_code;
    }

    int wait(int timeout_ms) override {
        if (state_->ignores_interrupt && !state_->terminated && timeout_ms >= 0) return -1;
        return state_->exit_code;
    }

    void terminate() override {
        state_->terminated = true;
        state_->exit_code = 255;
    }

private:
    std::shared_ptr<StreamState> state_;
};

// ── Scripted remote shell ────────────────────────────────────

// The first rule whose needle occurs in the command decides the result;
// unmatched commands succeed with no output.
class FakeShell : public RemoteShell {
public:
    struct Call {
        std::string command;
        std::string display;
    };

    std::vector<Call> calls;
    std::vector<std::string> followed;
    std::shared_ptr<StreamState> stream = std::make_shared<StreamState>();

    void on(const std::string& needle, int exit_code,
            const std::string& out = "", const std::string& err = "") {
        rules_.push_back({needle, SSHResult{exit_code, out, err}});
    }

    int count(const std::string& needle) const {
        int n = 0;
        for (const auto& c : calls) {
            if (c.command.find(needle) != std::string::npos) ++n;
        }
        return n;
    }

    // Index of the first call containing needle, -1 when absent.
    int index_of(const std::string& needle) const {
        for (size_t i = 0; i < calls.size(); ++i) {
            if (calls[i].command.find(needle) != std::string::npos) return static_cast<int>(i);
        }
        return -1;
    }

    std::unique_ptr<RemoteStream> follow(const RemoteTarget&, const std::string& command) override {
        followed.push_back(command);
        return std::make_unique<FakeStream>(stream);
    }

protected:
    SSHResult exec(const RemoteTarget&, const std::string& command,
                   const std::string& display) override {
        calls.push_back({command, display});
        for (const auto& [needle, result] : rules_) {
            if (command.find(needle) != std::string::npos) return result;
        }
        return SSHResult{0, "", ""};
    }

private:
    std::vector<std::pair<std::string, SSHResult>> rules_;
};

// ── In-memory transporter ────────────────────────────────────

// remote_files maps paths relative to the downloaded directory to contents;
// single files are looked up by their full remote path in remote_singles.
class FakeTransporter : public Transporter {
public:
    FakeTransporter(std::string name, bool filters) : name_(std::move(name)), filters_(filters) {}

    std::map<std::string, std::string> remote_files;
    std::map<std::string, std::string> remote_singles;
    int tree_failures = 0;          // download_tree throws this many times first
    bool upload_fails = false;
    int tree_calls = 0;
    int file_calls = 0;
    int upload_calls = 0;
    std::vector<bool> quiet_flags;

    std::string name() const override { return name_; }
    bool supports_filter() const override { return filters_; }

    void upload_contents(const RemoteTarget&, const fs::path&, const std::string&) override {
        ++upload_calls;
        if (upload_fails) throw TransferError(name_ + " upload failed", 12);
    }

    void download_tree(const RemoteTarget&, const std::string&, const fs::path& local_dir,
                       const std::string&) override {
        ++tree_calls;
        if (tree_failures > 0) {
            --tree_failures;
            throw TransferError(name_ + " exited with code 23", 23);
        }
        for (const auto& [rel, content] : remote_files) write_text(local_dir / rel, content);
    }

    void download_file(const RemoteTarget&, const std::string& remote_path,
                       const fs::path& local_path, bool quiet) override {
        ++file_calls;
        quiet_flags.push_back(quiet);
        auto it = remote_singles.find(remote_path);
        if (it == remote_singles.end()) {
            throw TransferError(remote_path + ": No such file or directory", 23);
        }
        write_text(local_path, it->second);
    }

private:
    std::string name_;
    bool filters_;
};
