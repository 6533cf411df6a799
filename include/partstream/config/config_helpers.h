#pragma once

#include <partstream/core/types.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace partstream::config {

/// "~/x" -> "$HOME/x"; anything else is returned unchanged.
std::filesystem::path expand_tilde(std::string_view path);

/**
 * Read one value from a TOML-style config file. Accepts both "[section]\nkey = value" and
 * "section.key = value"; strips quotes and trailing "# comments". Returns "" when the file
 * or the key is absent.
 */
std::string parse_config_value(const std::filesystem::path& config_path, std::string_view section,
                               std::string_view key);

/// Config file location: override, else $PARTSTREAM_CONFIG, else XDG/HOME default.
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Parse a positive byte size with an optional binary suffix: "5242880", "512K", "5M", "1G".
/// `what` names the setting in the error message.
Result<std::int64_t> parse_size(std::string_view text, std::string_view what);

/// Parse a positive integer. `what` names the setting in the error message.
Result<int> parse_positive_int(std::string_view text, std::string_view what);

/// Parse "true"/"false"/"1"/"0"/"yes"/"no"/"on"/"off".
Result<bool> parse_bool(std::string_view text, std::string_view what);

} // namespace partstream::config
