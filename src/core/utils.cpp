#include "utils.hpp"
#include <platform/platform.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <stdexcept>

std::string now_iso() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

std::string now_stamp() {
    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d-%H%M%S", &tm_buf);
    return std::string(buf);
}

std::filesystem::path make_stamped_dir(const std::filesystem::path& root,
                                       const std::string& name) {
    auto dir = root / name / now_stamp();
    std::filesystem::create_directories(dir);
    return dir;
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        size_t pos = 0;
        int v = std::stoi(s, &pos);
        return pos == s.size() ? v : fallback;
    } catch (const std::exception&) {
        return fallback;
    }
}

static bool is_safe_shell_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) ||
           c == '_' || c == '@' || c == '%' || c == '+' || c == '=' ||
           c == ':' || c == ',' || c == '.' || c == '/' || c == '-';
}

std::string shell_quote(const std::string& s) {
    if (s.empty()) return "''";
    if (std::all_of(s.begin(), s.end(), is_safe_shell_char)) return s;

    std::string out = "'";
    for (char c : s) {
        if (c == '\'') {
            out += "'\"'\"'";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

std::string shell_quote_path(const std::string& path) {
    if (path == "~") return path;
    if (path.rfind("~/", 0) == 0) {
        std::string rest = path.substr(2);
        return rest.empty() ? std::string("~/") : "~/" + shell_quote(rest);
    }
    return shell_quote(path);
}

std::filesystem::path expand_user(const std::string& path) {
    if (path.empty() || path[0] != '~') return std::filesystem::path(path);
    if (path.size() == 1) return platform::home_dir();
    if (path[1] == '/') return platform::home_dir() / path.substr(2);
    return std::filesystem::path(path);  // ~otheruser is left alone
}

std::string sanitize_host(const std::string& host) {
    std::string out = host;
    std::replace(out.begin(), out.end(), '.', '-');
    std::replace(out.begin(), out.end(), ':', '-');
    std::replace(out.begin(), out.end(), '/', '-');
    return out;
}

std::string label_dir_name(const std::string& label) {
    std::string out = label;
    std::replace(out.begin(), out.end(), '/', '-');
    std::replace(out.begin(), out.end(), '\\', '-');
    if (out == "." || out == "..") out = sanitize_host(out);
    return out;
}

std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

bool contains_ci(const std::string& haystack, const std::string& needle) {
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        size_t end = (nl == std::string::npos) ? text.size() : nl;
        std::string line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
        if (nl == std::string::npos) break;
        start = nl + 1;
    }
    return lines;
}

static const char B64_CHARS[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64_encode(const std::string& input) {
    std::string out;
    out.reserve(((input.size() + 2) / 3) * 4);
    const auto* data = reinterpret_cast<const unsigned char*>(input.data());
    size_t len = input.size();
    for (size_t i = 0; i < len; i += 3) {
        unsigned val = data[i] << 16;
        if (i + 1 < len) val |= data[i + 1] << 8;
        if (i + 2 < len) val |= data[i + 2];
        out += B64_CHARS[(val >> 18) & 0x3F];
        out += B64_CHARS[(val >> 12) & 0x3F];
        out += (i + 1 < len) ? B64_CHARS[(val >> 6) & 0x3F] : '=';
        out += (i + 2 < len) ? B64_CHARS[val & 0x3F] : '=';
    }
    return out;
}
