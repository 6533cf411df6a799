#pragma once

#include <partstream/downloader/downloader.hpp>
#include <partstream/downloader/stream_sink.hpp>

#include <boost/asio/awaitable.hpp>

#include <cstdint>
#include <memory>

namespace partstream::downloader {

/**
 * Turns a DownloadRequest into a single ordered byte stream.
 *
 * getObjectStream() performs the bootstrap fetch (first part, client range head, or the
 * requested store part), sets the sink metadata from it and writes its payload. When more
 * data remains, the part pipeline is spawned on the caller's executor and the sink is
 * returned without waiting for it.
 *
 * The orchestrator holds no per-download state; concurrent calls are independent.
 */
class DownloadOrchestrator {
public:
    /**
     * Validate options and build an orchestrator. Missing client, non-positive part size or
     * non-positive concurrency fail with InvalidConfiguration.
     */
    static Result<std::unique_ptr<DownloadOrchestrator>>
    create(std::shared_ptr<IFetchClient> client, DownloaderConfig config = {});

    /**
     * Stream into a fresh StreamSink bound to the calling coroutine's executor.
     */
    boost::asio::awaitable<Result<std::shared_ptr<StreamSink>>>
    getObjectStream(DownloadRequest request);

    /**
     * Stream into a caller-provided sink. The sink is returned on success; on a bootstrap
     * failure the error is returned and the sink must be discarded.
     */
    boost::asio::awaitable<Result<std::shared_ptr<IOutputSink>>>
    streamInto(DownloadRequest request, std::shared_ptr<IOutputSink> sink);

    [[nodiscard]] std::uint64_t partSize() const noexcept { return partSize_; }
    [[nodiscard]] std::size_t concurrency() const noexcept { return concurrency_; }
    [[nodiscard]] std::size_t highWaterMark() const noexcept { return highWaterMark_; }

private:
    DownloadOrchestrator(std::shared_ptr<IFetchClient> client, std::uint64_t partSize,
                         std::size_t concurrency, std::size_t highWaterMark,
                         ProgressCallback onProgress);

    std::shared_ptr<IFetchClient> client_;
    std::uint64_t partSize_;
    std::size_t concurrency_;
    std::size_t highWaterMark_;
    ProgressCallback onProgress_;
};

/**
 * Validate a request before any fetch: bucket and key present, range and part number not
 * both set, part number positive. InvalidArgument otherwise.
 */
Result<void> validateRequest(const DownloadRequest& request);

} // namespace partstream::downloader
