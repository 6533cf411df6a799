#pragma once

#include <partstream/core/types.h>
#include <partstream/storage/storage_config.h>

#include <chrono>
#include <span>
#include <string>
#include <utility>
#include <vector>

struct curl_slist; // forward decl

namespace partstream::storage {

class S3Signer {
public:
    using HeaderList = std::vector<std::pair<std::string, std::string>>;

    /**
     * Sign the request using AWS Signature Version 4
     * method: HTTP method ("GET", "HEAD", ...)
     * url: full request URL (https://host/encoded/path[?query]); the path must already be
     *      percent-encoded, it is used verbatim as the canonical URI
     * payload: optional body payload for signing; empty for GET/HEAD
     * Returns a curl_slist* with headers to attach via CURLOPT_HTTPHEADER.
     * Caller is responsible for freeing with curl_slist_free_all().
     */
    static Result<curl_slist*> signRequest(const S3ClientConfig& config, const std::string& method,
                                           const std::string& url,
                                           std::span<const std::byte> payload = {},
                                           const HeaderList& extraHeaders = {});

    /**
     * Same as signRequest() with an explicit signing time.
     */
    static Result<curl_slist*> signRequestAt(const S3ClientConfig& config,
                                             const std::string& method, const std::string& url,
                                             std::span<const std::byte> payload,
                                             const HeaderList& extraHeaders,
                                             std::chrono::system_clock::time_point now);
};

} // namespace partstream::storage
