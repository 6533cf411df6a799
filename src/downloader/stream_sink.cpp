#include <partstream/downloader/stream_sink.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace partstream::downloader {

StreamSink::StreamSink(boost::asio::any_io_executor executor, std::size_t highWaterMarkBytes)
    : highWaterMark_(std::max<std::size_t>(highWaterMarkBytes, 1)), writable_(executor, true),
      readable_(executor, false) {}

Result<void> StreamSink::setMetadata(StreamMetadata metadata) {
    if (metadata_) {
        return Error{ErrorCode::InvalidState, "Stream metadata already set"};
    }
    metadata_ = std::move(metadata);
    return {};
}

bool StreamSink::write(ByteVector chunk) {
    if (state_ != SinkState::Open) {
        spdlog::debug("[StreamSink] dropping {} bytes written after stream termination",
                      chunk.size());
        return true;
    }
    if (!chunk.empty()) {
        bufferedBytes_ += chunk.size();
        chunks_.push_back(std::move(chunk));
        readable_.set();
    }
    if (bufferedBytes_ >= highWaterMark_) {
        writable_.reset();
        return false;
    }
    return true;
}

boost::asio::awaitable<void> StreamSink::waitReady() {
    co_await writable_.wait();
}

void StreamSink::end() {
    if (state_ != SinkState::Open)
        return;
    state_ = SinkState::Ended;
    readable_.set();
}

void StreamSink::fail(Error error) {
    if (state_ != SinkState::Open)
        return;
    spdlog::warn("[StreamSink] stream failed: {}", error.message);
    state_ = SinkState::Failed;
    error_ = std::move(error);
    readable_.set();
    // A failed stream never drains through its producer again; release anyone parked on it.
    writable_.set();
}

boost::asio::awaitable<Result<std::optional<ByteVector>>> StreamSink::read() {
    co_await readable_.wait();

    if (!chunks_.empty()) {
        ByteVector chunk = std::move(chunks_.front());
        chunks_.pop_front();
        bufferedBytes_ -= chunk.size();
        if (chunks_.empty() && state_ == SinkState::Open) {
            readable_.reset();
        }
        if (bufferedBytes_ < highWaterMark_ && !writable_.isSet()) {
            writable_.set();
        }
        co_return std::optional<ByteVector>{std::move(chunk)};
    }

    if (state_ == SinkState::Failed) {
        co_return *error_;
    }
    co_return std::optional<ByteVector>{std::nullopt};
}

boost::asio::awaitable<Result<ByteVector>> StreamSink::readAll() {
    ByteVector out;
    if (metadata_) {
        out.reserve(static_cast<std::size_t>(metadata_->contentLength));
    }
    for (;;) {
        auto next = co_await read();
        if (!next) {
            co_return next.error();
        }
        auto& chunk = next.value();
        if (!chunk) {
            break;
        }
        out.insert(out.end(), chunk->begin(), chunk->end());
    }
    co_return out;
}

} // namespace partstream::downloader
