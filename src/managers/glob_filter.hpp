#pragma once

#include <string>
#include <vector>
#include <regex>
#include <filesystem>

namespace fs = std::filesystem;

// Shell-style glob applied to paths relative to a transfer root.
// '*' and '?' stay inside one path component, '**' crosses them, '[...]'
// is a character class. A path matches when either its full relative path
// or its basename matches the whole pattern.
class GlobFilter {
public:
    explicit GlobFilter(const std::string& pattern);

    bool matches(const std::string& rel_path) const;
    const std::string& pattern() const { return pattern_; }

    static std::string glob_to_regex(const std::string& glob);

private:
    std::string pattern_;
    std::regex re_;
};

// Delete every regular file under root that the filter rejects, except the
// relative paths in keep. Directories left empty afterwards are removed;
// root itself never is. Returns the number of files removed.
int sweep_unmatched(const fs::path& root, const GlobFilter& filter,
                    const std::vector<std::string>& keep);
