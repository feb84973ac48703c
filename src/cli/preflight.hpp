#pragma once

#include <string>
#include <vector>
#include <core/config.hpp>

struct PreflightIssue {
    std::string message;
    std::string fix;
    bool is_hint = false;  // true = friendly nudge, false = error
};

// Individual checks, combined by each command as it needs them.
std::vector<PreflightIssue> check_local_tools();
std::vector<PreflightIssue> check_target(const Config& config);
std::vector<PreflightIssue> check_job(const Config& config);
std::vector<PreflightIssue> check_upload(const Config& config);
std::vector<PreflightIssue> check_outputs(const Config& config);

// Print issues; true when none of them is an error.
bool report_preflight(const std::vector<PreflightIssue>& issues);
