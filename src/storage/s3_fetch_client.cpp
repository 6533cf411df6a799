/*
 * s3_fetch_client.cpp
 *
 * Notes
 * - One GET per fetch using the libcurl easy API, signed with S3Signer (SigV4).
 * - Range requests send a signed "range" header; part requests add ?partNumber=N.
 * - Content-Type and Content-Range are captured from the response headers.
 * - No retries: a failed call is returned to the caller as-is.
 */

#include <partstream/storage/s3_fetch_client.h>
#include <partstream/storage/s3_signer.h>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <memory>
#include <mutex>
#include <utility>

namespace partstream::storage {

namespace {

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

// Map CURLcode to Error
Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
            err.code = ErrorCode::NetworkError;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    auto* out = static_cast<ByteVector*>(userdata);
    auto* bytes = reinterpret_cast<const std::byte*>(ptr);
    out->insert(out->end(), bytes, bytes + total);
    return total;
}

size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (userdata == nullptr)
        return 0;
    parseResponseHeaderLine(std::string_view(buffer, total),
                            *static_cast<ResponseHeaders*>(userdata));
    return total;
}

struct CurlHandleDeleter {
    void operator()(CURL* curl) const noexcept { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};

} // namespace

void parseResponseHeaderLine(std::string_view line, ResponseHeaders& headers) {
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }
    if (line.substr(0, 5) == "HTTP/") {
        headers = ResponseHeaders{};
        return;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return;

    auto key = to_lower(trim(line.substr(0, colon)));
    auto val = trim(line.substr(colon + 1));

    if (key == "content-type") {
        headers.contentType = std::move(val);
    } else if (key == "content-range") {
        headers.contentRange = std::move(val);
    }
}

std::string percentEncodeRfc3986(std::string_view s, bool preserveSlash) {
    static const char* unreserved =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_.~";
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        if ((c != '\0' && std::strchr(unreserved, c)) || (preserveSlash && c == '/')) {
            out.push_back((char)c);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out.append(buf);
        }
    }
    return out;
}

Error httpStatusError(long status, std::string_view what) {
    std::string message = std::string(what) + ": HTTP " + std::to_string(status);
    if (status == 404)
        return Error{ErrorCode::NotFound, std::move(message)};
    if (status == 401 || status == 403)
        return Error{ErrorCode::PermissionDenied, std::move(message)};
    if (status == 408 || status == 504)
        return Error{ErrorCode::Timeout, std::move(message)};
    return Error{ErrorCode::NetworkError, std::move(message)};
}

S3FetchClient::S3FetchClient(S3ClientConfig config)
    : config_(std::move(config)), pool_(std::max<std::size_t>(config_.ioThreads, 1)) {
    // Strip scheme to keep only host[:port]
    auto& host = config_.endpoint;
    if (auto pos = host.find("://"); pos != std::string::npos) {
        if (host.rfind("http://", 0) == 0)
            config_.useHttps = false;
        host = host.substr(pos + 3);
    }
    if (auto slash = host.find('/'); slash != std::string::npos) {
        host = host.substr(0, slash);
    }

    // Initialize curl global once
    static std::once_flag once;
    std::call_once(once, []() { curl_global_init(CURL_GLOBAL_ALL); });
}

S3FetchClient::~S3FetchClient() {
    pool_.join();
}

std::string S3FetchClient::buildObjectUrl(const downloader::ObjectLocation& location,
                                          std::optional<int> partNumber) const {
    const std::string scheme = config_.useHttps ? "https://" : "http://";
    std::string url;
    if (config_.usePathStyle) {
        url = scheme + config_.endpoint + "/" + percentEncodeRfc3986(location.bucket, false) +
              "/" + percentEncodeRfc3986(location.key, true);
    } else {
        url = scheme + location.bucket + "." + config_.endpoint + "/" +
              percentEncodeRfc3986(location.key, true);
    }
    if (partNumber) {
        url += "?partNumber=" + std::to_string(*partNumber);
    }
    return url;
}

Result<downloader::FetchResponse>
S3FetchClient::fetchBlocking(const downloader::FetchRequest& request) const {
    const std::string url = buildObjectUrl(request.location, request.partNumber);

    std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
    if (!curl)
        return Error{ErrorCode::Unknown, "curl init failed"};

    S3Signer::HeaderList extra;
    if (request.range) {
        extra.emplace_back("range", *request.range);
    }
    auto signedHeaders = S3Signer::signRequest(config_, "GET", url, {}, extra);
    if (!signedHeaders)
        return signedHeaders.error();
    std::unique_ptr<curl_slist, SlistDeleter> headers(signedHeaders.value());

    downloader::FetchResponse response;
    ResponseHeaders responseHeaders;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_cb);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &responseHeaders);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(config_.requestTimeout));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    if (config_.tlsInsecure) {
        curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 0L);
    } else if (!config_.caPath.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_CAINFO, config_.caPath.c_str());
    }

    const std::string what = "GET s3://" + request.location.bucket + "/" + request.location.key;
    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK)
        return makeCurlError(res, what);

    long code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
    if (code >= 400)
        return httpStatusError(code, what);

    response.contentType = std::move(responseHeaders.contentType);
    response.contentRange = std::move(responseHeaders.contentRange);

    spdlog::debug("[S3FetchClient] {} {} -> HTTP {} ({} bytes, Content-Range: {})", what,
                  request.range ? *request.range
                                : (request.partNumber
                                       ? "partNumber=" + std::to_string(*request.partNumber)
                                       : std::string("whole object")),
                  code, response.body.size(), response.contentRange.value_or("-"));
    return response;
}

boost::asio::awaitable<Result<downloader::FetchResponse>>
S3FetchClient::fetch(const downloader::FetchRequest& request) {
    using ResultPtr = std::shared_ptr<Result<downloader::FetchResponse>>;
    auto result = co_await boost::asio::co_spawn(
        pool_.get_executor(),
        [this, request]() -> boost::asio::awaitable<ResultPtr> {
            co_return std::make_shared<Result<downloader::FetchResponse>>(fetchBlocking(request));
        },
        boost::asio::use_awaitable);
    co_return std::move(*result);
}

} // namespace partstream::storage
