/*
 * partstream CLI
 *
 * `partstream get s3://bucket/key` streams one object (or a byte range, or one stored part)
 * to a file or stdout through the part pipeline.
 * - Defaults come from config.toml ([downloader], [s3]) and the environment; flags win.
 * - --json prints a machine-readable result to stderr.
 */

#include <partstream/config/config_helpers.h>
#include <partstream/config/settings.h>
#include <partstream/downloader/download_orchestrator.hpp>
#include <partstream/storage/s3_fetch_client.h>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include <chrono>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

using json = nlohmann::json;
using namespace partstream;

namespace {

struct GetOpts {
    std::string url;
    std::string output; // empty or "-" = stdout
    std::optional<std::string> range;
    std::optional<int> partNumber;
    std::optional<std::string> partSize;
    std::optional<int> concurrency;
    std::optional<std::string> endpoint;
    std::optional<std::string> region;
    bool pathStyle{false};
    bool emitJson{false};
    bool progress{false};
};

struct GetOutcome {
    std::uint64_t bytes{0};
    std::optional<downloader::StreamMetadata> metadata;
    std::optional<Error> error;
};

std::optional<spdlog::level::level_enum> parseLevel(std::string v) {
    for (auto& c : v)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

Result<downloader::ObjectLocation> parseS3Url(const std::string& url) {
    // Expect s3://bucket/key
    if (url.rfind("s3://", 0) != 0) {
        return Error{ErrorCode::InvalidArgument, "URL must start with s3://"};
    }
    std::string rest = url.substr(5);
    auto slash = rest.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 == rest.size()) {
        return Error{ErrorCode::InvalidArgument, "Expected s3://<bucket>/<key>, got " + url};
    }
    return downloader::ObjectLocation{rest.substr(0, slash), rest.substr(slash + 1)};
}

boost::asio::awaitable<GetOutcome> runGet(downloader::DownloadOrchestrator& orchestrator,
                                          downloader::DownloadRequest request,
                                          std::ostream& out) {
    GetOutcome outcome;
    auto stream = co_await orchestrator.getObjectStream(std::move(request));
    if (!stream) {
        outcome.error = stream.error();
        co_return outcome;
    }
    auto sink = stream.value();
    outcome.metadata = sink->metadata();

    for (;;) {
        auto next = co_await sink->read();
        if (!next) {
            outcome.error = next.error();
            break;
        }
        auto& chunk = next.value();
        if (!chunk)
            break;
        out.write(reinterpret_cast<const char*>(chunk->data()),
                  static_cast<std::streamsize>(chunk->size()));
        if (!out) {
            outcome.error = Error{ErrorCode::IoError, "write to output failed"};
            // Stop the producer too; it would otherwise wait for a drain that never comes.
            sink->fail(*outcome.error);
            break;
        }
        outcome.bytes += chunk->size();
    }
    out.flush();
    co_return outcome;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_default_logger(spdlog::stderr_color_mt("partstream"));
    spdlog::set_level(spdlog::level::warn);

    CLI::App app{"partstream - parallel ranged object downloads", "partstream"};
    app.require_subcommand(1);

    std::string configPath;
    bool verbose = false;
    app.add_option("--config", configPath, "Path to config.toml");
    app.add_flag("-v,--verbose", verbose, "Enable debug logging");

    GetOpts opts;
    auto* get = app.add_subcommand("get", "Stream an object to a file or stdout");
    get->add_option("url", opts.url, "Object URL (s3://bucket/key)")->required();
    get->add_option("-o,--output", opts.output, "Output file (default: stdout)");
    get->add_option("--range", opts.range, "Byte range: bytes=<start>-<end>");
    get->add_option("--part", opts.partNumber, "Stored part number (multipart uploads)");
    get->add_option("--part-size", opts.partSize, "Part size in bytes (K/M/G suffixes allowed)");
    get->add_option("--concurrency", opts.concurrency, "Parts fetched in parallel");
    get->add_option("--endpoint", opts.endpoint, "S3 endpoint host[:port]");
    get->add_option("--region", opts.region, "S3 region");
    get->add_flag("--path-style", opts.pathStyle, "Use path-style addressing");
    get->add_flag("--json", opts.emitJson, "Print a JSON result to stderr");
    get->add_flag("--progress", opts.progress, "Log progress after each part");

    CLI11_PARSE(app, argc, argv);

    if (const char* envLvl = std::getenv("PARTSTREAM_LOG_LEVEL"); envLvl && *envLvl) {
        if (auto lvl = parseLevel(envLvl)) {
            spdlog::set_level(*lvl);
        }
    } else if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    }

    auto fail = [&](const Error& err) {
        std::cerr << "partstream: " << err.message << " (" << errorToString(err.code) << ")"
                  << std::endl;
        return 1;
    };

    auto settings = config::loadSettings(config::get_config_path(configPath));
    if (!settings)
        return fail(settings.error());
    auto cfg = std::move(settings).value();

    if (opts.partSize) {
        auto parsed = config::parse_size(*opts.partSize, "--part-size");
        if (!parsed)
            return fail(parsed.error());
        cfg.downloader.partSizeBytes = parsed.value();
    }
    if (opts.concurrency)
        cfg.downloader.concurrency = *opts.concurrency;
    if (opts.endpoint)
        cfg.s3.endpoint = *opts.endpoint;
    if (opts.region)
        cfg.s3.region = *opts.region;
    if (opts.pathStyle)
        cfg.s3.usePathStyle = true;
    if (opts.progress) {
        cfg.downloader.onProgress = [](const downloader::ProgressEvent& ev) {
            spdlog::info("{}/{}: part {}/{} ({} of {} bytes)", ev.bucket, ev.key,
                         ev.partsDelivered, ev.totalParts, ev.deliveredBytes, ev.totalBytes);
        };
        if (spdlog::get_level() > spdlog::level::info)
            spdlog::set_level(spdlog::level::info);
    }

    auto location = parseS3Url(opts.url);
    if (!location)
        return fail(location.error());

    auto client = std::make_shared<storage::S3FetchClient>(cfg.s3);
    auto orchestrator = downloader::DownloadOrchestrator::create(client, cfg.downloader);
    if (!orchestrator)
        return fail(orchestrator.error());

    downloader::DownloadRequest request;
    request.location = location.value();
    request.range = opts.range;
    request.partNumber = opts.partNumber;

    std::ofstream file;
    std::ostream* out = &std::cout;
    if (!opts.output.empty() && opts.output != "-") {
        file.open(opts.output, std::ios::binary | std::ios::trunc);
        if (!file)
            return fail(Error{ErrorCode::IoError, "cannot open " + opts.output});
        out = &file;
    }

    const auto started = std::chrono::steady_clock::now();
    boost::asio::io_context io;
    std::optional<GetOutcome> outcome;
    std::exception_ptr failure;
    boost::asio::co_spawn(io, runGet(*orchestrator.value(), request, *out),
                          [&](std::exception_ptr e, GetOutcome r) {
                              failure = e;
                              outcome = std::move(r);
                          });
    io.run();

    if (failure) {
        try {
            std::rethrow_exception(failure);
        } catch (const std::exception& e) {
            return fail(Error{ErrorCode::InternalError, e.what()});
        }
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (opts.emitJson) {
        json result = {
            {"type", "result"},
            {"bucket", request.location.bucket},
            {"key", request.location.key},
            {"bytes", outcome->bytes},
            {"content_type", nullptr},
            {"content_length", nullptr},
            {"elapsed_ms", elapsed.count()},
            {"success", !outcome->error.has_value()},
        };
        if (outcome->metadata) {
            if (outcome->metadata->mimeType)
                result["content_type"] = *outcome->metadata->mimeType;
            result["content_length"] = outcome->metadata->contentLength;
        }
        if (outcome->error) {
            result["error"] = {{"code", errorToString(outcome->error->code)},
                               {"message", outcome->error->message}};
        }
        std::cerr << result.dump(2) << std::endl;
    }

    if (outcome->error)
        return fail(*outcome->error);

    spdlog::info("{}/{}: {} bytes in {} ms", request.location.bucket, request.location.key,
                 outcome->bytes, elapsed.count());
    return 0;
}
