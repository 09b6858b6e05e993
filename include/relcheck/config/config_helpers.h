#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>
#include <relcheck/core/types.h>

namespace relcheck::config {

/// section -> key -> raw value
using TomlTable = std::map<std::string, std::map<std::string, std::string>>;

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::filesystem::path(home) / path.substr(path.size() > 1 ? 2 : 1);
        }
    }
    return path;
}

// Terminal sanitization
inline std::string sanitize_for_terminal(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (unsigned char c : in) {
        if (c >= 0x20 && c <= 0x7E) {
            out.push_back(static_cast<char>(c));
        } else if (c == '\n' || c == '\r' || c == '\t' || c >= 0x80) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('?');
        }
    }
    return out;
}

/**
 * Split a comma list or a TOML inline array (["a", "b"]) into trimmed, unquoted items.
 * Empty items are dropped.
 */
std::vector<std::string> parse_list(const std::string& raw);

/// Parse "true"/"false"/"1"/"0"/"yes"/"no" (case-insensitive).
Result<bool> parse_bool(std::string_view raw);

Result<long long> parse_int(std::string_view raw);

Result<double> parse_double(std::string_view raw);

/**
 * @brief Parse a flat TOML file into section/key/value strings.
 *
 * Supports [section] headers, key = value pairs, quoted strings, inline comments
 * outside quotes and single-line inline arrays (kept verbatim for parse_list).
 * Keys written as "section.key" at top level are filed under their section.
 */
Result<TomlTable> parseTomlFile(const std::filesystem::path& path);

/// Same grammar as parseTomlFile, from an in-memory document.
Result<TomlTable> parseTomlString(std::string_view content);

/// Standard config path: $XDG_CONFIG_HOME/relcheck/config.toml or ~/.config/relcheck/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace relcheck::config
