/*
 * partstream/src/downloader/download_orchestrator.cpp
 *
 * Bootstrap + hand-off:
 * - Resolve the request into one bootstrap fetch (client range head, first part, or a store part)
 * - Learn total length and MIME type from the bootstrap response, set sink metadata once
 * - Write the bootstrap payload, then either end the sink or spawn the part pipeline detached
 *
 * Any failure before the sink is handed back is returned as an error Result. Failures after
 * that point are reported on the sink by the pipeline.
 */

#include <partstream/downloader/download_orchestrator.hpp>
#include <partstream/downloader/part_pipeline.hpp>
#include <partstream/downloader/range_math.hpp>

#include <spdlog/spdlog.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/this_coro.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <utility>

namespace partstream::downloader {

Result<void> validateRequest(const DownloadRequest& request) {
    if (request.location.bucket.empty() || request.location.key.empty()) {
        return Error{ErrorCode::InvalidArgument,
                     "expected a request with a bucket and a key, optionally a Range "
                     "(bytes=<start>-<end>) or a PartNumber"};
    }
    if (request.range && request.partNumber) {
        return Error{ErrorCode::InvalidArgument, "Range and PartNumber are mutually exclusive"};
    }
    if (request.partNumber && *request.partNumber < 1) {
        return Error{ErrorCode::InvalidArgument,
                     "PartNumber must be a positive integer, got " +
                         std::to_string(*request.partNumber)};
    }
    return {};
}

Result<std::unique_ptr<DownloadOrchestrator>>
DownloadOrchestrator::create(std::shared_ptr<IFetchClient> client, DownloaderConfig config) {
    if (!client) {
        return Error{ErrorCode::InvalidConfiguration, "Fetch client must be provided"};
    }
    if (config.partSizeBytes && *config.partSizeBytes < 1) {
        return Error{ErrorCode::InvalidConfiguration,
                     "Maximum part size must be a positive number"};
    }
    if (config.concurrency && *config.concurrency < 1) {
        return Error{ErrorCode::InvalidConfiguration,
                     "Maximum concurrency must be a positive number"};
    }
    const auto partSize =
        static_cast<std::uint64_t>(config.partSizeBytes.value_or(kDefaultPartSizeBytes));
    const auto concurrency = static_cast<std::size_t>(config.concurrency.value_or(kDefaultConcurrency));

    std::unique_ptr<DownloadOrchestrator> orchestrator(
        new DownloadOrchestrator(std::move(client), partSize, concurrency,
                                 config.highWaterMarkBytes, std::move(config.onProgress)));
    return orchestrator;
}

DownloadOrchestrator::DownloadOrchestrator(std::shared_ptr<IFetchClient> client,
                                           std::uint64_t partSize, std::size_t concurrency,
                                           std::size_t highWaterMark, ProgressCallback onProgress)
    : client_(std::move(client)), partSize_(partSize), concurrency_(concurrency),
      highWaterMark_(highWaterMark), onProgress_(std::move(onProgress)) {}

boost::asio::awaitable<Result<std::shared_ptr<StreamSink>>>
DownloadOrchestrator::getObjectStream(DownloadRequest request) {
    auto executor = co_await boost::asio::this_coro::executor;
    auto sink = std::make_shared<StreamSink>(executor, highWaterMark_);
    auto started = co_await streamInto(std::move(request), sink);
    if (!started) {
        co_return started.error();
    }
    co_return sink;
}

boost::asio::awaitable<Result<std::shared_ptr<IOutputSink>>>
DownloadOrchestrator::streamInto(DownloadRequest request, std::shared_ptr<IOutputSink> sink) {
    if (!sink) {
        co_return Error{ErrorCode::InvalidArgument, "Output sink must be provided"};
    }
    if (auto valid = validateRequest(request); !valid) {
        co_return valid.error();
    }

    const auto& location = request.location;
    std::optional<std::uint64_t> contentLength;
    std::uint64_t byteOffset = 0;

    FetchRequest bootstrap;
    bootstrap.location = location;

    if (request.range) {
        auto info = parseRange(*request.range);
        if (!info) {
            co_return info.error();
        }
        contentLength = info.value().length;
        byteOffset = info.value().startByte;
        if (*contentLength == 0) {
            // Nothing to fetch: an empty stream with the requested length.
            spdlog::debug("[DownloadOrchestrator] {}/{}: empty range {}", location.bucket,
                          location.key, *request.range);
            if (auto meta = sink->setMetadata(StreamMetadata{std::nullopt, 0}); !meta) {
                co_return meta.error();
            }
            sink->end();
            co_return sink;
        }
        bootstrap.range = formatRange(computeRange(0, *contentLength, partSize_, byteOffset));
    } else if (!request.partNumber) {
        bootstrap.range = formatRange(PartRange{0, partSize_ - 1, partSize_});
    } else {
        bootstrap.partNumber = request.partNumber;
    }

    spdlog::debug("[DownloadOrchestrator] {}/{}: bootstrap fetch {}", location.bucket,
                  location.key,
                  bootstrap.range ? *bootstrap.range
                                  : "partNumber=" + std::to_string(*bootstrap.partNumber));

    auto response = co_await fetchGuarded(*client_, bootstrap);
    if (!response) {
        spdlog::warn("[DownloadOrchestrator] {}/{}: bootstrap fetch failed: {}", location.bucket,
                     location.key, response.error().message);
        co_return response.error();
    }
    auto& first = response.value();

    // No Content-Range on a whole-object request: the store ignored the range and sent it all.
    const bool wholeObject = !contentLength && !first.contentRange;

    if (!contentLength) {
        if (first.contentRange) {
            auto total = parseContentRangeTotal(*first.contentRange);
            if (!total) {
                co_return total.error();
            }
            contentLength = total.value();
        } else {
            // Whole-object response: the body is the object.
            contentLength = static_cast<std::uint64_t>(first.body.size());
        }
    }

    if (auto meta = sink->setMetadata(StreamMetadata{first.contentType, *contentLength}); !meta) {
        co_return meta.error();
    }

    const auto bootstrapBytes = static_cast<std::uint64_t>(first.body.size());
    const auto totalParts =
        (request.partNumber || wholeObject) ? 1 : partCount(*contentLength, partSize_);
    sink->write(std::move(first.body));

    if (onProgress_) {
        ProgressEvent ev;
        ev.bucket = location.bucket;
        ev.key = location.key;
        ev.deliveredBytes = bootstrapBytes;
        ev.totalBytes = *contentLength;
        ev.partsDelivered = 1;
        ev.totalParts = totalParts;
        onProgress_(ev);
    }

    if (*contentLength > partSize_ && !request.partNumber && !wholeObject) {
        PipelineState state;
        state.partSize = partSize_;
        state.concurrency = concurrency_;
        state.totalLength = *contentLength;
        state.offsetBias = byteOffset;
        state.nextPartIndex = 1;

        spdlog::info("[DownloadOrchestrator] {}/{}: {} bytes in {} parts, streaming in background",
                     location.bucket, location.key, *contentLength, totalParts);

        auto pipeline = std::make_shared<PartPipeline>(client_, location, sink, std::move(state),
                                                       onProgress_, bootstrapBytes);
        auto executor = co_await boost::asio::this_coro::executor;
        boost::asio::co_spawn(
            executor, [pipeline]() -> boost::asio::awaitable<void> { co_await pipeline->run(); },
            boost::asio::detached);
    } else {
        spdlog::info("[DownloadOrchestrator] {}/{}: {} bytes in a single fetch", location.bucket,
                     location.key, bootstrapBytes);
        sink->end();
    }

    co_return sink;
}

} // namespace partstream::downloader
