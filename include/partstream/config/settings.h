#pragma once

#include <partstream/core/types.h>
#include <partstream/downloader/downloader.hpp>
#include <partstream/storage/storage_config.h>

#include <cstdint>
#include <filesystem>
#include <optional>

namespace partstream::config {

/**
 * Effective configuration for one partstream process.
 *
 * Sources, lowest to highest precedence: built-in defaults, config file
 * ([downloader] and [s3] sections), environment. Command-line flags are applied by the caller.
 */
struct Settings {
    downloader::DownloaderConfig downloader;
    storage::S3ClientConfig s3;
    std::filesystem::path sourcePath; // empty when no config file was read
};

/**
 * Load settings from configPath (missing file = defaults) and apply environment overrides.
 * A malformed numeric or boolean value fails with InvalidConfiguration naming the key.
 */
Result<Settings> loadSettings(const std::filesystem::path& configPath);

} // namespace partstream::config
