#include <relcheck/config/config_helpers.h>

#include <charconv>
#include <cmath>
#include <fstream>
#include <sstream>

namespace relcheck::config {

namespace {

// Strip a trailing # comment that is not inside a quoted string.
std::string strip_inline_comment(const std::string& v) {
    char quote = 0;
    for (size_t i = 0; i < v.size(); ++i) {
        char c = v[i];
        if (quote) {
            if (c == '\\' && quote == '"' && i + 1 < v.size()) {
                ++i;
                continue;
            }
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return v.substr(0, i);
        }
    }
    return v;
}

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

} // namespace

std::vector<std::string> parse_list(const std::string& raw) {
    std::string s = raw;
    trim(s);
    if (s.size() >= 2 && s.front() == '[' && s.back() == ']') {
        s = s.substr(1, s.size() - 2);
    }

    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string tok;
    while (std::getline(ss, tok, ',')) {
        tok = unquote(tok);
        if (!tok.empty())
            out.push_back(tok);
    }
    return out;
}

Result<bool> parse_bool(std::string_view raw) {
    std::string v(raw);
    trim(v);
    v = to_lower(v);
    if (v == "true" || v == "1" || v == "yes" || v == "on")
        return true;
    if (v == "false" || v == "0" || v == "no" || v == "off")
        return false;
    return Error{ErrorCode::InvalidArgument, "Not a boolean: '" + std::string(raw) + "'"};
}

Result<long long> parse_int(std::string_view raw) {
    std::string v(raw);
    trim(v);
    long long out = 0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
    if (ec != std::errc() || ptr != v.data() + v.size() || v.empty()) {
        return Error{ErrorCode::InvalidArgument, "Not an integer: '" + std::string(raw) + "'"};
    }
    return out;
}

Result<double> parse_double(std::string_view raw) {
    std::string v(raw);
    trim(v);
    if (v.empty()) {
        return Error{ErrorCode::InvalidArgument, "Not a number: ''"};
    }
    try {
        size_t used = 0;
        double d = std::stod(v, &used);
        if (used != v.size() || !std::isfinite(d)) {
            return Error{ErrorCode::InvalidArgument, "Not a number: '" + std::string(raw) + "'"};
        }
        return d;
    } catch (const std::exception&) {
        return Error{ErrorCode::InvalidArgument, "Not a number: '" + std::string(raw) + "'"};
    }
}

Result<TomlTable> parseTomlString(std::string_view content) {
    TomlTable config;
    std::istringstream in{std::string(content)};
    std::string line;
    std::string currentSection;
    size_t lineNo = 0;

    while (std::getline(in, line)) {
        ++lineNo;
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#')
            continue;

        // Check for section headers
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                return Error{ErrorCode::ConfigurationError,
                             "Unterminated section header at line " + std::to_string(lineNo)};
            }
            currentSection = line.substr(1, end - 1);
            trim(currentSection);
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            return Error{ErrorCode::ConfigurationError,
                         "Expected key = value at line " + std::to_string(lineNo)};
        }

        std::string key = line.substr(0, eq);
        std::string value = strip_inline_comment(line.substr(eq + 1));
        trim(key);
        trim(value);
        key = unquote(key);

        std::string section = currentSection;
        if (section.empty()) {
            // Support both "backend.url = ..." and "[backend] url = ..."
            auto dot = key.find('.');
            if (dot != std::string::npos) {
                section = key.substr(0, dot);
                key = key.substr(dot + 1);
            }
        }

        if (!value.empty() && value.front() != '[') {
            value = unquote(value);
        }
        config[section][key] = value;
    }

    return config;
}

Result<TomlTable> parseTomlFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Error{ErrorCode::FileNotFound, "Cannot open config file: " + path.string()};
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    auto parsed = parseTomlString(oss.str());
    if (!parsed) {
        return Error{parsed.error().code, path.string() + ": " + parsed.error().message};
    }
    return parsed;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv && *homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("relcheck.toml");
    }

    return configHome / "relcheck" / "config.toml";
}

} // namespace relcheck::config
