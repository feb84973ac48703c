#include "glob_filter.hpp"
#include "job_log.hpp"
#include <algorithm>
#include <stdexcept>
#include <fmt/format.h>

GlobFilter::GlobFilter(const std::string& pattern) : pattern_(pattern) {
    if (pattern.empty()) throw std::invalid_argument("glob pattern is empty");
    try {
        re_ = std::regex(glob_to_regex(pattern));
    } catch (const std::regex_error& e) {
        throw std::invalid_argument("invalid glob '" + pattern + "': " + e.what());
    }
}

bool GlobFilter::matches(const std::string& rel_path) const {
    std::string path = rel_path;
    std::replace(path.begin(), path.end(), '\\', '/');
    while (path.rfind("./", 0) == 0) path.erase(0, 2);

    if (std::regex_match(path, re_)) return true;
    auto slash = path.rfind('/');
    if (slash == std::string::npos) return false;
    return std::regex_match(path.substr(slash + 1), re_);
}

std::string GlobFilter::glob_to_regex(const std::string& glob) {
    std::string regex;
    bool escape = false;
    bool in_class = false;

    for (size_t i = 0; i < glob.length(); ++i) {
        char c = glob[i];

        if (escape) {
            if (std::string(".^$|()[]{}*+?\\/").find(c) != std::string::npos) regex += '\\';
            regex += c;
            escape = false;
        } else if (in_class) {
            if (c == ']') in_class = false;
            if (c == '\\') regex += '\\';
            regex += c;
        } else if (c == '\\') {
            escape = true;
        } else if (c == '*') {
            if (i + 1 < glob.length() && glob[i + 1] == '*') {
                regex += ".*";
                i++;
            } else {
                regex += "[^/]*";
            }
        } else if (c == '?') {
            regex += "[^/]";
        } else if (c == '[') {
            in_class = true;
            regex += '[';
            if (i + 1 < glob.length() && glob[i + 1] == '!') {
                regex += '^';
                i++;
            }
        } else if (std::string(".^$|(){}+").find(c) != std::string::npos) {
            regex += '\\';
            regex += c;
        } else {
            regex += c;
        }
    }
    if (escape) regex += "\\\\";

    return regex;
}

int sweep_unmatched(const fs::path& root, const GlobFilter& filter,
                    const std::vector<std::string>& keep) {
    if (!fs::is_directory(root)) return 0;

    std::vector<fs::path> doomed;
    std::vector<fs::path> dirs;
    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        if (entry.is_directory() && !entry.is_symlink()) {
            dirs.push_back(entry.path());
            continue;
        }
        std::string rel = fs::relative(entry.path(), root).generic_string();
        if (std::find(keep.begin(), keep.end(), rel) != keep.end()) continue;
        if (!filter.matches(rel)) doomed.push_back(entry.path());
    }

    for (const auto& p : doomed) {
        fs::remove(p);
    }

    // Deepest first so parents see their children gone
    std::sort(dirs.begin(), dirs.end(), [](const fs::path& a, const fs::path& b) {
        return a.string().size() > b.string().size();
    });
    for (const auto& d : dirs) {
        if (fs::is_empty(d)) fs::remove(d);
    }

    if (!doomed.empty()) {
        remora_log(fmt::format("filter '{}' removed {} file(s) under {}",
                               filter.pattern(), doomed.size(), root.string()));
    }
    return static_cast<int>(doomed.size());
}
