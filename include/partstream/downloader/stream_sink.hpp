#pragma once

#include <partstream/downloader/downloader.hpp>
#include <partstream/downloader/ready_event.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include <cstddef>
#include <deque>
#include <optional>

namespace partstream::downloader {

/**
 * In-memory pass-through sink with a high-water mark.
 *
 * Producer side follows IOutputSink: write() buffers the chunk and returns false once the
 * buffered byte count reaches the high-water mark. Consumer side pulls chunks with read();
 * when a read brings the buffer below the mark, waiting producers are resumed.
 *
 * Not thread-safe: producer and consumer must run on the same executor (or strand).
 */
class StreamSink final : public IOutputSink {
public:
    StreamSink(boost::asio::any_io_executor executor,
               std::size_t highWaterMarkBytes = kDefaultHighWaterMarkBytes);

    // IOutputSink
    Result<void> setMetadata(StreamMetadata metadata) override;
    [[nodiscard]] std::optional<StreamMetadata> metadata() const override { return metadata_; }
    bool write(ByteVector chunk) override;
    boost::asio::awaitable<void> waitReady() override;
    void end() override;
    void fail(Error error) override;
    [[nodiscard]] SinkState state() const override { return state_; }

    /**
     * Next chunk in write order. std::nullopt after a normal end; the sink's error once the
     * buffered chunks of a failed stream have been consumed.
     */
    boost::asio::awaitable<Result<std::optional<ByteVector>>> read();

    /**
     * Drain the whole stream into one buffer.
     */
    boost::asio::awaitable<Result<ByteVector>> readAll();

    [[nodiscard]] std::size_t bufferedBytes() const noexcept { return bufferedBytes_; }
    [[nodiscard]] std::size_t highWaterMark() const noexcept { return highWaterMark_; }

private:
    std::size_t highWaterMark_;
    std::deque<ByteVector> chunks_;
    std::size_t bufferedBytes_{0};
    std::optional<StreamMetadata> metadata_;
    SinkState state_{SinkState::Open};
    std::optional<Error> error_;

    ReadyEvent writable_; // producer side: buffer below the high-water mark
    ReadyEvent readable_; // consumer side: data buffered or stream terminated
};

} // namespace partstream::downloader
