#include "manifest.hpp"
#include "glob_filter.hpp"
#include "job_log.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <fstream>

std::optional<ManifestEntry> parse_manifest_line(const std::string& line) {
    auto tab = line.find('\t');
    if (tab == std::string::npos || tab == 0) return std::nullopt;

    std::string size_str = line.substr(0, tab);
    if (!std::all_of(size_str.begin(), size_str.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }

    ManifestEntry entry;
    entry.path = line.substr(tab + 1);
    if (!entry.path.empty() && entry.path.back() == '\r') entry.path.pop_back();
    if (entry.path.empty()) return std::nullopt;

    try {
        entry.size = std::stoll(size_str);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
    return entry;
}

std::string format_manifest(const std::vector<ManifestEntry>& entries) {
    std::string out;
    for (const auto& e : entries) {
        out += fmt::format("{}\t{}\n", e.size, e.path);
    }
    return out;
}

std::vector<ManifestEntry> scan_manifest(const fs::path& root,
                                         const std::vector<std::string>& exclude) {
    std::vector<ManifestEntry> entries;
    if (!fs::is_directory(root)) return entries;

    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        if (!entry.is_regular_file()) continue;
        std::string rel = fs::relative(entry.path(), root).generic_string();
        if (std::find(exclude.begin(), exclude.end(), rel) != exclude.end()) continue;
        entries.push_back({static_cast<int64_t>(entry.file_size()), rel});
    }
    std::sort(entries.begin(), entries.end(),
              [](const ManifestEntry& a, const ManifestEntry& b) { return a.path < b.path; });
    return entries;
}

std::string remote_manifest_command(const std::string& remote_dir,
                                    const std::string& manifest_name,
                                    const std::string& filter) {
    // The path test reuses the local glob translation so '*' stays inside one
    // component, the same as the rsync rules and the fallback sweep.
    std::string find_cmd = "find .";
    if (filter.empty()) {
        find_cmd += " -type f";
    } else {
        std::string path_test = "-regex " + shell_quote("^\\./" + GlobFilter::glob_to_regex(filter) + "$");
        if (filter.find('/') == std::string::npos) {
            path_test = fmt::format("\\( -name {} -o {} \\)", shell_quote(filter), path_test);
        }
        find_cmd += " -regextype posix-extended -type f " + path_test;
    }
    find_cmd += " ! -path " + shell_quote("./" + manifest_name);
    find_cmd += " -printf '%s\\t%P\\n'";

    return fmt::format("cd {} && {} | LC_ALL=C sort -t \"$(printf '\\t')\" -k2,2 > {}",
                       shell_quote_path(remote_dir), find_cmd, shell_quote(manifest_name));
}

TransferResult verify_against_manifest(const fs::path& local_dir,
                                       const fs::path& manifest_path) {
    TransferResult result;
    result.local_dir = local_dir;

    std::ifstream in(manifest_path);
    if (!in) {
        remora_log("manifest not found: " + manifest_path.string());
        return result;
    }
    result.manifest_found = true;
    result.manifest = manifest_path;

    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        std::string stripped = line;
        trim(stripped);
        if (stripped.empty()) continue;

        auto entry = parse_manifest_line(line);
        if (!entry) {
            ++result.parse_errors;
            remora_log(fmt::format("manifest line {} unparsable: {}", line_no, line));
            continue;
        }
        ++result.checked;

        fs::path local = local_dir / fs::path(entry->path);
        std::error_code ec;
        if (!fs::is_regular_file(local, ec)) {
            result.missing.push_back(entry->path);
            continue;
        }
        auto actual = static_cast<int64_t>(fs::file_size(local, ec));
        if (ec) {
            result.missing.push_back(entry->path);
        } else if (actual != entry->size) {
            result.size_mismatch.push_back({entry->path, entry->size, actual});
        }
    }

    result.success = result.parse_errors == 0 && result.missing.empty() &&
                     result.size_mismatch.empty();
    remora_log(fmt::format("manifest check {}: checked={} missing={} mismatched={} bad_lines={}",
                           manifest_path.string(), result.checked, result.missing.size(),
                           result.size_mismatch.size(), result.parse_errors));
    return result;
}
