#include <partstream/config/config_helpers.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <system_error>

namespace partstream::config {

namespace {

std::string_view strip(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos)
        return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string dequote(std::string_view s) {
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
        s = s.substr(1, s.size() - 2);
    }
    return std::string(s);
}

} // namespace

std::filesystem::path expand_tilde(std::string_view path) {
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        if (const char* home = std::getenv("HOME"); home && *home) {
            return std::filesystem::path(home) / std::string(path.substr(2));
        }
    }
    return std::filesystem::path(std::string(path));
}

std::string parse_config_value(const std::filesystem::path& config_path, std::string_view section,
                               std::string_view key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    const std::string dotted = std::string(section) + "." + std::string(key);
    std::string current;
    std::string raw;
    while (std::getline(file, raw)) {
        std::string_view line = strip(raw);
        if (line.empty() || line.front() == '#') {
            continue;
        }
        if (line.front() == '[') {
            current = std::string(strip(line.substr(1, line.find(']') - 1)));
            continue;
        }

        const auto eq = line.find('=');
        if (eq == std::string_view::npos) {
            continue;
        }
        const std::string_view name = strip(line.substr(0, eq));
        std::string_view value = line.substr(eq + 1);
        if (auto hash = value.find('#'); hash != std::string_view::npos) {
            value = value.substr(0, hash);
        }

        if ((current == section && name == key) || name == dotted) {
            return dequote(strip(value));
        }
    }
    return "";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("PARTSTREAM_CONFIG"); env && *env) {
        return expand_tilde(env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "partstream" / "config.toml";
    }

    return configHome / "partstream" / "config.toml";
}

Result<std::int64_t> parse_size(std::string_view text, std::string_view what) {
    std::string s(strip(text));
    std::int64_t multiplier = 1;
    if (!s.empty()) {
        switch (std::toupper(static_cast<unsigned char>(s.back()))) {
            case 'K':
                multiplier = 1024;
                break;
            case 'M':
                multiplier = 1024 * 1024;
                break;
            case 'G':
                multiplier = 1024ll * 1024ll * 1024ll;
                break;
            default:
                break;
        }
        if (multiplier != 1) {
            s.pop_back();
        }
    }

    std::int64_t value = 0;
    auto res = std::from_chars(s.data(), s.data() + s.size(), value);
    if (s.empty() || res.ec != std::errc() || res.ptr != s.data() + s.size()) {
        return Error{ErrorCode::InvalidConfiguration,
                     std::string(what) + " must be a number, got '" + std::string(text) + "'"};
    }
    if (value < 1) {
        return Error{ErrorCode::InvalidConfiguration,
                     std::string(what) + " must be a positive number"};
    }
    if (value > std::numeric_limits<std::int64_t>::max() / multiplier) {
        return Error{ErrorCode::InvalidConfiguration, std::string(what) + " is too large"};
    }
    return value * multiplier;
}

Result<int> parse_positive_int(std::string_view text, std::string_view what) {
    std::string s(strip(text));
    int value = 0;
    auto res = std::from_chars(s.data(), s.data() + s.size(), value);
    if (s.empty() || res.ec != std::errc() || res.ptr != s.data() + s.size()) {
        return Error{ErrorCode::InvalidConfiguration,
                     std::string(what) + " must be an integer, got '" + std::string(text) + "'"};
    }
    if (value < 1) {
        return Error{ErrorCode::InvalidConfiguration,
                     std::string(what) + " must be a positive number"};
    }
    return value;
}

Result<bool> parse_bool(std::string_view text, std::string_view what) {
    std::string s(strip(text));
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "true" || s == "1" || s == "yes" || s == "on")
        return true;
    if (s == "false" || s == "0" || s == "no" || s == "off")
        return false;
    return Error{ErrorCode::InvalidConfiguration,
                 std::string(what) + " must be true or false, got '" + std::string(text) + "'"};
}

} // namespace partstream::config
