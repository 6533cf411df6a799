#pragma once

#include <cstddef>
#include <string>

namespace partstream::storage {

/**
 * S3-compatible object store client configuration
 * Note: credentials left empty fall back to AWS_* environment variables at signing time.
 */
struct S3ClientConfig {
    // Addressing
    std::string endpoint = "s3.amazonaws.com"; // host[:port], scheme stripped
    std::string region;                        // empty = us-east-1 (auto for Cloudflare R2)
    bool usePathStyle = false;                 // https://endpoint/bucket/key
    bool useHttps = true;

    // Credentials
    std::string accessKey;
    std::string secretKey;
    std::string sessionToken;

    // Transport
    std::size_t requestTimeout = 30; // seconds
    std::size_t ioThreads = 4;       // blocking curl calls run here
    bool tlsInsecure = false;
    std::string caPath; // empty = system default
};

} // namespace partstream::storage
