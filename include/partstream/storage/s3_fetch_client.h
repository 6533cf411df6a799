#pragma once

#include <partstream/downloader/downloader.hpp>
#include <partstream/storage/storage_config.h>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/thread_pool.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace partstream::storage {

/**
 * Response headers the fetch client cares about.
 */
struct ResponseHeaders {
    std::optional<std::string> contentType;
    std::optional<std::string> contentRange;
};

/**
 * Feed one raw header line ("Name: value\r\n") into headers. Status lines and unknown
 * headers are ignored. A new status line (redirect, 100-continue) clears earlier values.
 */
void parseResponseHeaderLine(std::string_view line, ResponseHeaders& headers);

/**
 * RFC 3986 percent-encoding; '/' is kept when preserveSlash is true.
 */
std::string percentEncodeRfc3986(std::string_view s, bool preserveSlash);

/**
 * Map an HTTP status >= 400 to the error taxonomy.
 */
Error httpStatusError(long status, std::string_view what);

/**
 * IFetchClient over libcurl against an S3-compatible endpoint (SigV4 signed GETs).
 *
 * curl's easy API blocks, so each fetch runs on the client's own thread pool and the
 * result is handed back to the awaiting coroutine's executor.
 */
class S3FetchClient final : public downloader::IFetchClient {
public:
    explicit S3FetchClient(S3ClientConfig config);
    ~S3FetchClient() override;

    S3FetchClient(const S3FetchClient&) = delete;
    S3FetchClient& operator=(const S3FetchClient&) = delete;

    boost::asio::awaitable<Result<downloader::FetchResponse>>
    fetch(const downloader::FetchRequest& request) override;

    /**
     * Synchronous GET; what fetch() runs on the pool.
     */
    Result<downloader::FetchResponse> fetchBlocking(const downloader::FetchRequest& request) const;

    /**
     * https://<bucket>.<endpoint>/<key> or, path style, https://<endpoint>/<bucket>/<key>,
     * with ?partNumber=N appended for part requests.
     */
    [[nodiscard]] std::string buildObjectUrl(const downloader::ObjectLocation& location,
                                             std::optional<int> partNumber = std::nullopt) const;

    [[nodiscard]] const S3ClientConfig& config() const noexcept { return config_; }

private:
    S3ClientConfig config_;
    boost::asio::thread_pool pool_;
};

} // namespace partstream::storage
