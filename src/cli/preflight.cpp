#include "preflight.hpp"
#include "theme.hpp"
#include <managers/transporter.hpp>
#include <platform/platform.hpp>
#include <filesystem>
#include <iostream>
#include <sys/stat.h>
#include <fmt/format.h>

namespace fs = std::filesystem;

std::vector<PreflightIssue> check_local_tools() {
    std::vector<PreflightIssue> issues;
    if (!platform::find_executable("ssh")) {
        issues.push_back({"ssh not found on PATH", "Install the OpenSSH client"});
    }
    if (!platform::find_executable("scp")) {
        issues.push_back({"scp not found on PATH", "Install the OpenSSH client"});
    }
    return issues;
}

std::vector<PreflightIssue> check_target(const Config& config) {
    std::vector<PreflightIssue> issues;
    const auto& ssh = config.ssh();

    if (ssh.host.empty()) {
        issues.push_back({"Remote host not configured",
                          "Set ssh.host, export REMORA_HOST or pass --host"});
    }
    if (ssh.user.empty()) {
        issues.push_back({"Remote user not configured", "Set ssh.user or export REMORA_USER"});
    }
    if (!ssh.keyfile.empty()) {
        struct stat st;
        if (stat(ssh.keyfile.c_str(), &st) != 0) {
            issues.push_back({"Key file not found: " + ssh.keyfile, "Fix ssh.keyfile"});
        } else if (st.st_mode & (S_IRWXG | S_IRWXO)) {
            issues.push_back({"Key file is accessible by other users; ssh will refuse it",
                              "chmod 600 " + ssh.keyfile});
        }
    }
    return issues;
}

std::vector<PreflightIssue> check_job(const Config& config) {
    std::vector<PreflightIssue> issues;
    if (config.job().command.empty()) {
        issues.push_back({"No job command configured", "Set job.command or pass it after 'launch --'"});
    }
    if (config.remote().project_dir.empty()) {
        issues.push_back({"remote.project_dir not set", "Set the directory the job runs in"});
    }
    if (config.remote().log_file.empty()) {
        issues.push_back({"remote.log_file not set", "Set remote.log_file or remote.project_dir"});
    }
    return issues;
}

std::vector<PreflightIssue> check_upload(const Config& config) {
    std::vector<PreflightIssue> issues;
    const auto& dir = config.transfer().upload_local_dir;
    if (dir.empty()) {
        issues.push_back({"transfer.upload_local_dir not set", "Set it or pass a directory to 'upload'"});
    } else if (!fs::is_directory(dir)) {
        issues.push_back({"Upload directory not found: " + dir.string(), "Fix transfer.upload_local_dir"});
    }
    if (config.remote().inputs_dir.empty()) {
        issues.push_back({"remote.inputs_dir not set", "Set remote.inputs_dir or remote.project_dir"});
    }
    if (!find_local_rsync(config.transfer().rsync_path)) {
        issues.push_back({"rsync not found locally, uploads will use scp",
                          "Install rsync or set transfer.rsync_path", true});
    }
    return issues;
}

std::vector<PreflightIssue> check_outputs(const Config& config) {
    std::vector<PreflightIssue> issues;
    if (config.remote().outputs_dir.empty()) {
        issues.push_back({"remote.outputs_dir not set", "Set remote.outputs_dir or remote.project_dir"});
    }
    return issues;
}

bool report_preflight(const std::vector<PreflightIssue>& issues) {
    bool ok = true;
    for (const auto& issue : issues) {
        if (issue.is_hint) {
            std::cout << theme::info(issue.message);
        } else {
            std::cout << theme::fail(issue.message);
            ok = false;
        }
        if (!issue.fix.empty()) std::cout << theme::step(issue.fix);
    }
    return ok;
}
