#include <partstream/config/config_helpers.h>
#include <partstream/config/settings.h>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <string>

namespace partstream::config {

namespace {

std::string env_or_empty(const char* name) {
    if (const char* v = std::getenv(name); v && *v) {
        return v;
    }
    return {};
}

Result<void> apply_file(const std::filesystem::path& path, Settings& out) {
    auto& dl = out.downloader;
    auto& s3 = out.s3;

    if (auto v = parse_config_value(path, "downloader", "part_size"); !v.empty()) {
        auto parsed = parse_size(v, "downloader.part_size");
        if (!parsed)
            return parsed.error();
        dl.partSizeBytes = parsed.value();
    }
    if (auto v = parse_config_value(path, "downloader", "concurrency"); !v.empty()) {
        auto parsed = parse_positive_int(v, "downloader.concurrency");
        if (!parsed)
            return parsed.error();
        dl.concurrency = parsed.value();
    }
    if (auto v = parse_config_value(path, "downloader", "high_water_mark"); !v.empty()) {
        auto parsed = parse_size(v, "downloader.high_water_mark");
        if (!parsed)
            return parsed.error();
        dl.highWaterMarkBytes = static_cast<std::size_t>(parsed.value());
    }

    if (auto v = parse_config_value(path, "s3", "endpoint"); !v.empty())
        s3.endpoint = v;
    if (auto v = parse_config_value(path, "s3", "region"); !v.empty())
        s3.region = v;
    if (auto v = parse_config_value(path, "s3", "access_key"); !v.empty())
        s3.accessKey = v;
    if (auto v = parse_config_value(path, "s3", "secret_key"); !v.empty())
        s3.secretKey = v;
    if (auto v = parse_config_value(path, "s3", "session_token"); !v.empty())
        s3.sessionToken = v;
    if (auto v = parse_config_value(path, "s3", "ca_path"); !v.empty())
        s3.caPath = expand_tilde(v).string();
    if (auto v = parse_config_value(path, "s3", "use_path_style"); !v.empty()) {
        auto parsed = parse_bool(v, "s3.use_path_style");
        if (!parsed)
            return parsed.error();
        s3.usePathStyle = parsed.value();
    }
    if (auto v = parse_config_value(path, "s3", "tls_insecure"); !v.empty()) {
        auto parsed = parse_bool(v, "s3.tls_insecure");
        if (!parsed)
            return parsed.error();
        s3.tlsInsecure = parsed.value();
    }
    if (auto v = parse_config_value(path, "s3", "request_timeout"); !v.empty()) {
        auto parsed = parse_positive_int(v, "s3.request_timeout");
        if (!parsed)
            return parsed.error();
        s3.requestTimeout = static_cast<std::size_t>(parsed.value());
    }
    if (auto v = parse_config_value(path, "s3", "io_threads"); !v.empty()) {
        auto parsed = parse_positive_int(v, "s3.io_threads");
        if (!parsed)
            return parsed.error();
        s3.ioThreads = static_cast<std::size_t>(parsed.value());
    }
    return {};
}

Result<void> apply_env(Settings& out) {
    if (auto v = env_or_empty("PARTSTREAM_PART_SIZE"); !v.empty()) {
        auto parsed = parse_size(v, "PARTSTREAM_PART_SIZE");
        if (!parsed)
            return parsed.error();
        out.downloader.partSizeBytes = parsed.value();
    }
    if (auto v = env_or_empty("PARTSTREAM_CONCURRENCY"); !v.empty()) {
        auto parsed = parse_positive_int(v, "PARTSTREAM_CONCURRENCY");
        if (!parsed)
            return parsed.error();
        out.downloader.concurrency = parsed.value();
    }
    if (auto v = env_or_empty("PARTSTREAM_S3_ENDPOINT"); !v.empty())
        out.s3.endpoint = v;
    if (auto v = env_or_empty("AWS_REGION"); !v.empty())
        out.s3.region = v;
    if (auto v = env_or_empty("AWS_ACCESS_KEY_ID"); !v.empty())
        out.s3.accessKey = v;
    if (auto v = env_or_empty("AWS_SECRET_ACCESS_KEY"); !v.empty())
        out.s3.secretKey = v;
    if (auto v = env_or_empty("AWS_SESSION_TOKEN"); !v.empty())
        out.s3.sessionToken = v;
    return {};
}

} // namespace

Result<Settings> loadSettings(const std::filesystem::path& configPath) {
    Settings settings;

    std::error_code ec;
    if (!configPath.empty() && std::filesystem::exists(configPath, ec)) {
        if (auto r = apply_file(configPath, settings); !r) {
            return r.error();
        }
        settings.sourcePath = configPath;
        spdlog::debug("[config] loaded {}", configPath.string());
    } else {
        spdlog::debug("[config] no config file at {}, using defaults", configPath.string());
    }

    if (auto r = apply_env(settings); !r) {
        return r.error();
    }
    return settings;
}

} // namespace partstream::config
