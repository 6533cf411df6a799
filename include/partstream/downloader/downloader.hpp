#pragma once

/*
 * partstream Downloader - Public Types and Interfaces (C++20)
 *
 * This header defines the public data types and abstract interfaces for the
 * downloader subsystem. It intentionally contains no implementation details.
 *
 * Design principles:
 * - One object (or a client range, or one stored part) becomes one ordered byte stream
 * - Large objects are split into fixed-size parts fetched over a bounded sliding window
 * - The output sink applies backpressure; the pipeline suspends instead of buffering the object
 * - Clear separation of concerns (fetch client, range math, sink, orchestrator)
 */

#include <partstream/core/types.h>

#include <boost/asio/awaitable.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace partstream::downloader {

// ================================
// Constants
// ================================

inline constexpr std::int64_t kDefaultPartSizeBytes = 5ll * 1024ll * 1024ll; // 5 MiB
inline constexpr int kDefaultConcurrency = 1;
inline constexpr std::size_t kDefaultHighWaterMarkBytes = 16ull * 1024ull * 1024ull; // 16 MiB

// ===================
// Small data objects
// ===================

/**
 * Where an object lives in the store.
 */
struct ObjectLocation {
    std::string bucket;
    std::string key;
};

/**
 * A single getObjectStream request. At most one of range / partNumber may be set.
 */
struct DownloadRequest {
    ObjectLocation location;
    std::optional<std::string> range; // "bytes=<start>-<end>"
    std::optional<int> partNumber;    // store-assigned part, 1-based
};

/**
 * One call to the store: either a byte range or a part number (or neither).
 */
struct FetchRequest {
    ObjectLocation location;
    std::optional<std::string> range;
    std::optional<int> partNumber;
};

/**
 * Result of one store call.
 * contentRange has the wire form "bytes <start>-<end>/<total>" (or "bytes=..."); only the
 * total after '/' is used. Absent when the store returned the whole object.
 */
struct FetchResponse {
    ByteVector body;
    std::optional<std::string> contentType;
    std::optional<std::string> contentRange;
};

/**
 * Metadata exposed to stream consumers; set once before data flows.
 */
struct StreamMetadata {
    std::optional<std::string> mimeType;
    std::uint64_t contentLength{0};
};

/**
 * Progress event emitted after each delivered part.
 */
struct ProgressEvent {
    std::string bucket;
    std::string key;
    std::uint64_t deliveredBytes{0};
    std::uint64_t totalBytes{0};
    std::uint64_t partsDelivered{0};
    std::uint64_t totalParts{0};
    std::chrono::steady_clock::time_point timestamp{std::chrono::steady_clock::now()};
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;

/**
 * Orchestrator options. Unset values take the defaults above.
 */
struct DownloaderConfig {
    std::optional<std::int64_t> partSizeBytes;
    std::optional<int> concurrency;
    std::size_t highWaterMarkBytes{kDefaultHighWaterMarkBytes};
    ProgressCallback onProgress;
};

/**
 * Lifecycle of an output sink.
 */
enum class SinkState { Open, Ended, Failed };

// ==========================
// Service interface classes
// ==========================

/**
 * Object store client abstraction (storage::S3FetchClient is the libcurl implementation).
 * One call issues exactly one range or part request. Failures are reported through
 * the Result; anything thrown is turned into an InternalError by the caller.
 */
class IFetchClient {
public:
    virtual ~IFetchClient() = default;

    virtual boost::asio::awaitable<Result<FetchResponse>> fetch(const FetchRequest& request) = 0;
};

/**
 * Backpressure-aware byte destination.
 *
 * - setMetadata() may be called once; a second call fails with InvalidState.
 * - write() never rejects data; a false return means "stop producing until waitReady()".
 * - end() and fail() are terminal; writes afterwards are dropped and return true.
 */
class IOutputSink {
public:
    virtual ~IOutputSink() = default;

    virtual Result<void> setMetadata(StreamMetadata metadata) = 0;
    [[nodiscard]] virtual std::optional<StreamMetadata> metadata() const = 0;

    virtual bool write(ByteVector chunk) = 0;

    /**
     * Resolves on the next readiness notification (immediately if already ready).
     */
    virtual boost::asio::awaitable<void> waitReady() = 0;

    virtual void end() = 0;
    virtual void fail(Error error) = 0;

    [[nodiscard]] virtual SinkState state() const = 0;
};

} // namespace partstream::downloader
