#pragma once

#include <string>
#include <vector>
#include <filesystem>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Compact local timestamp for directory names: YYYYmmdd-HHMMSS.
std::string now_stamp();

// Create (if absent) and return <root>/<name>/<now_stamp()>.
std::filesystem::path make_stamped_dir(const std::filesystem::path& root, const std::string& name);

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Quote a string for a POSIX shell: 'abc' with embedded ' as '"'"'.
// Plain words made of [A-Za-z0-9_@%+=:,./-] are returned unquoted.
std::string shell_quote(const std::string& s);

// shell_quote() for a remote path, leaving a leading "~/" unquoted so the
// remote shell still expands it.
std::string shell_quote_path(const std::string& path);

// Expand a leading ~ to the home directory.
std::filesystem::path expand_user(const std::string& path);

// Host name usable as a directory name ("10.0.0.1" -> "10-0-0-1").
std::string sanitize_host(const std::string& host);

// Label or id kept as written, except that path separators become '-' and
// "." or ".." cannot name the parent directory.
std::string label_dir_name(const std::string& label);

std::string to_lower(std::string s);

// Case-insensitive substring test.
bool contains_ci(const std::string& haystack, const std::string& needle);

// Split on '\n', dropping a trailing '\r' from each line. Empty lines are kept
// except for the one after a final newline.
std::vector<std::string> split_lines(const std::string& text);

std::string base64_encode(const std::string& input);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
