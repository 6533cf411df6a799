#pragma once

#include <partstream/downloader/downloader.hpp>
#include <partstream/downloader/range_math.hpp>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace partstream::test {

inline ByteVector makeBytes(std::string_view text) {
    ByteVector out(text.size());
    std::transform(text.begin(), text.end(), out.begin(),
                   [](char c) { return static_cast<std::byte>(c); });
    return out;
}

inline ByteVector makePatternObject(std::size_t size) {
    ByteVector out(size);
    for (std::size_t i = 0; i < size; ++i)
        out[i] = static_cast<std::byte>((i * 31 + i / 251) & 0xFF);
    return out;
}

inline ByteVector slice(const ByteVector& data, std::size_t begin, std::size_t end) {
    return ByteVector(data.begin() + static_cast<std::ptrdiff_t>(begin),
                      data.begin() + static_cast<std::ptrdiff_t>(end));
}

/**
 * Drive a test coroutine to completion on io; rethrows anything it threw.
 */
inline void runCoro(boost::asio::io_context& io, boost::asio::awaitable<void> body) {
    auto done = boost::asio::co_spawn(io, std::move(body), boost::asio::use_future);
    io.run();
    io.restart();
    done.get();
}

inline boost::asio::awaitable<void> sleepFor(std::chrono::milliseconds delay) {
    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
    timer.expires_after(delay);
    boost::system::error_code ec;
    co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
}

/**
 * In-memory object store speaking the IFetchClient contract.
 *
 * - Range requests answer with the clamped slice and "bytes <s>-<e>/<total>".
 * - Part requests slice by storePartSize (multipart layout) and carry a Content-Range too.
 * - Latency per call comes from the script (by call index) or a seeded random range.
 * - Failures are injected by exact range string or by call index.
 * - ignoreRange mimics a store that answers a ranged GET with 200 and the full body.
 * Single-threaded: use from one io_context thread only.
 */
class FakeObjectStore final : public downloader::IFetchClient {
public:
    struct Options {
        std::string contentType = "text/plain";
        std::chrono::milliseconds minLatency{0};
        std::chrono::milliseconds maxLatency{0};
        std::uint32_t seed{42};
        std::uint64_t storePartSize{0}; // 0 = object stored as one part
        bool omitContentRange{false};
        bool ignoreRange{false}; // answer range requests with the whole object
        std::optional<std::string> contentRangeOverride;
    };

    explicit FakeObjectStore(ByteVector object) : FakeObjectStore(std::move(object), Options{}) {}

    FakeObjectStore(ByteVector object, Options options)
        : object_(std::move(object)), options_(std::move(options)), rng_(options_.seed) {}

    void failOnRange(std::string range, Error error = Error{ErrorCode::NetworkError, "injected"}) {
        failRanges_[std::move(range)] = std::move(error);
    }

    void failOnCall(std::size_t callIndex,
                    Error error = Error{ErrorCode::NetworkError, "injected"}) {
        failCalls_[callIndex] = std::move(error);
    }

    void setLatencyScript(std::vector<std::chrono::milliseconds> script) {
        latencyScript_ = std::move(script);
    }

    boost::asio::awaitable<Result<downloader::FetchResponse>>
    fetch(const downloader::FetchRequest& request) override {
        const std::size_t callIndex = requests_.size();
        requests_.push_back(request);
        ++inFlight_;
        maxInFlight_ = std::max(maxInFlight_, inFlight_);

        auto delay = latencyFor(callIndex);
        if (delay.count() > 0) {
            co_await sleepFor(delay);
        }

        --inFlight_;
        completionOrder_.push_back(callIndex);
        co_return respond(callIndex, request);
    }

    const std::vector<downloader::FetchRequest>& requests() const { return requests_; }
    const std::vector<std::size_t>& completionOrder() const { return completionOrder_; }
    std::size_t inFlight() const { return inFlight_; }
    std::size_t maxInFlight() const { return maxInFlight_; }
    const ByteVector& object() const { return object_; }

private:
    std::chrono::milliseconds latencyFor(std::size_t callIndex) {
        if (callIndex < latencyScript_.size())
            return latencyScript_[callIndex];
        if (options_.maxLatency <= options_.minLatency)
            return options_.minLatency;
        std::uniform_int_distribution<long long> dist(options_.minLatency.count(),
                                                      options_.maxLatency.count());
        return std::chrono::milliseconds(dist(rng_));
    }

    std::string contentRange(std::uint64_t start, std::uint64_t end) const {
        if (options_.contentRangeOverride)
            return *options_.contentRangeOverride;
        return "bytes " + std::to_string(start) + "-" + std::to_string(end) + "/" +
               std::to_string(object_.size());
    }

    Result<downloader::FetchResponse> respond(std::size_t callIndex,
                                              const downloader::FetchRequest& request) const {
        if (auto it = failCalls_.find(callIndex); it != failCalls_.end())
            return it->second;
        if (request.range) {
            if (auto it = failRanges_.find(*request.range); it != failRanges_.end())
                return it->second;
        }

        downloader::FetchResponse response;
        response.contentType = options_.contentType;
        const std::uint64_t size = object_.size();

        if (request.partNumber) {
            const auto partSize = options_.storePartSize ? options_.storePartSize : size;
            const auto index = static_cast<std::uint64_t>(*request.partNumber - 1);
            if (*request.partNumber < 1 || index * partSize >= size)
                return Error{ErrorCode::NetworkError, "HTTP 416: part number out of range"};
            const auto start = index * partSize;
            const auto end = std::min(size, start + partSize) - 1;
            response.body = slice(object_, start, end + 1);
            response.contentRange = contentRange(start, end);
        } else if (request.range && !options_.ignoreRange) {
            // "bytes=<s>-<e>", end inclusive
            auto dash = request.range->find('-');
            const auto start = std::stoull(request.range->substr(6, dash - 6));
            auto end = std::stoull(request.range->substr(dash + 1));
            if (start >= size || end < start)
                return Error{ErrorCode::NetworkError, "HTTP 416: range not satisfiable"};
            end = std::min<std::uint64_t>(end, size - 1);
            response.body = slice(object_, start, end + 1);
            response.contentRange = contentRange(start, end);
        } else {
            response.body = object_;
        }
        if (options_.omitContentRange)
            response.contentRange.reset();
        return response;
    }

    ByteVector object_;
    Options options_;
    std::mt19937 rng_;
    std::vector<std::chrono::milliseconds> latencyScript_;
    std::map<std::string, Error> failRanges_;
    std::map<std::size_t, Error> failCalls_;
    std::vector<downloader::FetchRequest> requests_;
    std::vector<std::size_t> completionOrder_;
    std::size_t inFlight_{0};
    std::size_t maxInFlight_{0};
};

} // namespace partstream::test
