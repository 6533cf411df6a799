#pragma once

#include <partstream/downloader/downloader.hpp>
#include <partstream/downloader/ready_event.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include <cstdint>
#include <deque>
#include <memory>
#include <optional>

namespace partstream::downloader {

/**
 * Handle for one issued part fetch. The fetch runs on its own coroutine and parks its
 * result here; the pipeline collects it when the handle reaches the head of the window.
 */
class PendingPart {
public:
    PendingPart(boost::asio::any_io_executor executor, std::uint64_t partIndex)
        : done_(std::move(executor), false), partIndex_(partIndex) {}

    void complete(Result<FetchResponse> result) {
        result_.emplace(std::move(result));
        done_.set();
    }

    [[nodiscard]] bool ready() const noexcept { return result_.has_value(); }
    [[nodiscard]] std::uint64_t partIndex() const noexcept { return partIndex_; }

    boost::asio::awaitable<Result<FetchResponse>> wait() {
        co_await done_.wait();
        co_return std::move(*result_);
    }

private:
    ReadyEvent done_;
    std::uint64_t partIndex_;
    std::optional<Result<FetchResponse>> result_;
};

/**
 * Per-download scheduling state. Owned by exactly one PartPipeline; never shared.
 */
struct PipelineState {
    std::uint64_t partSize{0};
    std::size_t concurrency{1};
    std::uint64_t totalLength{0};
    std::uint64_t offsetBias{0};
    std::uint64_t nextPartIndex{0};
    std::deque<std::shared_ptr<PendingPart>> queue; // issue order == part order
    std::uint64_t deliveredCount{0};
};

/**
 * Call client.fetch() and turn an escaping exception into an InternalError result.
 * The caller keeps the client alive until the returned awaitable completes.
 */
boost::asio::awaitable<Result<FetchResponse>> fetchGuarded(IFetchClient& client,
                                                           const FetchRequest& request);

/**
 * Sliding-window scheduler for the parts after the bootstrap fetch.
 *
 * Keeps up to `concurrency` fetches in flight, always awaits the oldest one, writes
 * payloads to the sink in ascending part order and suspends while the sink reports it
 * is not ready. A failed fetch fails the sink and stops the loop; fetches still in the
 * window are left to finish and their results are dropped.
 */
class PartPipeline {
public:
    PartPipeline(std::shared_ptr<IFetchClient> client, ObjectLocation location,
                 std::shared_ptr<IOutputSink> sink, PipelineState state,
                 ProgressCallback onProgress = {}, std::uint64_t alreadyDeliveredBytes = 0);

    /**
     * Runs until every part is delivered or a fetch fails. Never throws.
     */
    boost::asio::awaitable<void> run();

    [[nodiscard]] const PipelineState& state() const noexcept { return state_; }

private:
    void issue(const boost::asio::any_io_executor& executor, std::uint64_t partIndex);
    void reportProgress(std::uint64_t totalParts) const;

    std::shared_ptr<IFetchClient> client_;
    ObjectLocation location_;
    std::shared_ptr<IOutputSink> sink_;
    PipelineState state_;
    ProgressCallback onProgress_;
    std::uint64_t deliveredBytes_;
    std::uint64_t startingPart_;
};

} // namespace partstream::downloader
