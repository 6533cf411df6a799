#include <partstream/downloader/part_pipeline.hpp>
#include <partstream/downloader/range_math.hpp>

#include <spdlog/spdlog.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/this_coro.hpp>

#include <exception>
#include <utility>

namespace partstream::downloader {

namespace {

// Parameters are taken by value so they live in the coroutine frame for the whole fetch.
boost::asio::awaitable<void> runPartFetch(std::shared_ptr<IFetchClient> client,
                                          FetchRequest request,
                                          std::shared_ptr<PendingPart> pending) {
    auto result = co_await fetchGuarded(*client, request);
    if (!result) {
        spdlog::debug("[PartPipeline] part {} fetch failed: {}", pending->partIndex(),
                      result.error().message);
    }
    pending->complete(std::move(result));
}

} // namespace

boost::asio::awaitable<Result<FetchResponse>> fetchGuarded(IFetchClient& client,
                                                           const FetchRequest& request) {
    std::optional<Error> failure;
    try {
        co_return co_await client.fetch(request);
    } catch (const std::exception& e) {
        failure = Error{ErrorCode::InternalError, std::string("fetch threw: ") + e.what()};
    } catch (...) {
        failure = Error{ErrorCode::InternalError, "fetch threw a non-standard exception"};
    }
    co_return *failure;
}

PartPipeline::PartPipeline(std::shared_ptr<IFetchClient> client, ObjectLocation location,
                           std::shared_ptr<IOutputSink> sink, PipelineState state,
                           ProgressCallback onProgress, std::uint64_t alreadyDeliveredBytes)
    : client_(std::move(client)), location_(std::move(location)), sink_(std::move(sink)),
      state_(std::move(state)), onProgress_(std::move(onProgress)),
      deliveredBytes_(alreadyDeliveredBytes), startingPart_(state_.nextPartIndex) {
    if (state_.concurrency == 0) {
        state_.concurrency = 1;
    }
}

void PartPipeline::issue(const boost::asio::any_io_executor& executor, std::uint64_t partIndex) {
    const auto range =
        computeRange(partIndex, state_.totalLength, state_.partSize, state_.offsetBias);

    FetchRequest request;
    request.location = location_;
    request.range = formatRange(range);

    spdlog::debug("[PartPipeline] {}/{}: issuing part {} ({})", location_.bucket, location_.key,
                  partIndex, *request.range);

    auto pending = std::make_shared<PendingPart>(executor, partIndex);
    state_.queue.push_back(pending);
    boost::asio::co_spawn(executor, runPartFetch(client_, std::move(request), std::move(pending)),
                          boost::asio::detached);
}

void PartPipeline::reportProgress(std::uint64_t totalParts) const {
    if (!onProgress_)
        return;
    ProgressEvent ev;
    ev.bucket = location_.bucket;
    ev.key = location_.key;
    ev.deliveredBytes = deliveredBytes_;
    ev.totalBytes = state_.totalLength;
    ev.partsDelivered = startingPart_ + state_.deliveredCount;
    ev.totalParts = totalParts;
    onProgress_(ev);
}

boost::asio::awaitable<void> PartPipeline::run() {
    std::optional<Error> failure;
    try {
        auto executor = co_await boost::asio::this_coro::executor;
        const auto totalParts = partCount(state_.totalLength, state_.partSize);
        const auto remaining = totalParts > startingPart_ ? totalParts - startingPart_ : 0;

        spdlog::debug("[PartPipeline] {}/{}: {} parts remaining (part size {}, concurrency {})",
                      location_.bucket, location_.key, remaining, state_.partSize,
                      state_.concurrency);

        while (state_.deliveredCount < remaining) {
            // Fill: keep the window saturated.
            while (state_.queue.size() < state_.concurrency && state_.nextPartIndex < totalParts) {
                issue(executor, state_.nextPartIndex);
                ++state_.nextPartIndex;
            }

            // Drain head: always the lowest undelivered part, whatever finished first.
            auto head = std::move(state_.queue.front());
            state_.queue.pop_front();
            auto result = co_await head->wait();
            if (!result) {
                spdlog::warn("[PartPipeline] {}/{}: part {} failed, aborting: {}",
                             location_.bucket, location_.key, head->partIndex(),
                             result.error().message);
                sink_->fail(result.error());
                co_return;
            }

            // Deliver.
            auto body = std::move(result).value().body;
            deliveredBytes_ += body.size();
            const bool ready = sink_->write(std::move(body));

            // Backpressure: no fill until the sink is ready again.
            if (!ready) {
                spdlog::trace("[PartPipeline] {}/{}: sink not ready after part {}",
                              location_.bucket, location_.key, head->partIndex());
                co_await sink_->waitReady();
                if (sink_->state() != SinkState::Open) {
                    spdlog::debug("[PartPipeline] {}/{}: sink terminated while suspended",
                                  location_.bucket, location_.key);
                    co_return;
                }
            }

            ++state_.deliveredCount;
            reportProgress(totalParts);
        }

        spdlog::debug("[PartPipeline] {}/{}: all {} parts delivered ({} bytes)",
                      location_.bucket, location_.key, totalParts, deliveredBytes_);
        sink_->end();
        co_return;
    } catch (const std::exception& e) {
        failure = Error{ErrorCode::InternalError, std::string("pipeline error: ") + e.what()};
    } catch (...) {
        failure = Error{ErrorCode::InternalError, "pipeline error: non-standard exception"};
    }
    spdlog::error("[PartPipeline] {}/{}: {}", location_.bucket, location_.key, failure->message);
    sink_->fail(*failure);
}

} // namespace partstream::downloader
