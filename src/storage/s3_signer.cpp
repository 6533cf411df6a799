/*
 * s3_signer.cpp
 *
 * AWS Signature Version 4 for single S3 GET requests.
 * - Canonical request: method, encoded path, query, sorted lowercase headers, signed list,
 *   payload hash.
 * - Signing key chain: kDate -> kRegion -> kService -> kSigning.
 * - The returned curl list carries every signed header plus Authorization.
 */

#include <partstream/storage/s3_signer.h>

#include <curl/curl.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <string_view>

namespace partstream::storage {

namespace {

constexpr std::string_view kAlgorithm = "AWS4-HMAC-SHA256";
constexpr std::string_view kService = "s3";
constexpr std::string_view kEmptyPayloadHash =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

using Digest = std::array<unsigned char, 32>;

struct Credentials {
    std::string accessKey;
    std::string secretKey;
    std::string sessionToken;
};

struct UrlParts {
    std::string host;
    std::string path = "/";
    std::string query;
};

struct SigningTime {
    std::string stamp; // 20130524T000000Z
    std::string day;   // 20130524
};

std::string lowercase(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string stripWhitespace(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos)
        return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(first, last - first + 1));
}

std::string toHex(const unsigned char* data, std::size_t len) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

std::string sha256Hex(std::string_view data) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
    unsigned int len = 0;
    EVP_Digest(data.data(), data.size(), md.data(), &len, EVP_sha256(), nullptr);
    return toHex(md.data(), len);
}

Digest hmac(std::string_view key, std::string_view data) {
    Digest out{};
    unsigned int len = 0;
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), out.data(), &len);
    return out;
}

std::string_view asKey(const Digest& d) {
    return {reinterpret_cast<const char*>(d.data()), d.size()};
}

// Credentials from config, falling back to the AWS_* environment as a set.
Credentials resolveCredentials(const S3ClientConfig& config) {
    Credentials c{config.accessKey, config.secretKey, config.sessionToken};
    if (!c.accessKey.empty() && !c.secretKey.empty())
        return c;
    if (const char* v = std::getenv("AWS_ACCESS_KEY_ID"))
        c.accessKey = v;
    if (const char* v = std::getenv("AWS_SECRET_ACCESS_KEY"))
        c.secretKey = v;
    if (const char* v = std::getenv("AWS_SESSION_TOKEN"))
        c.sessionToken = v;
    return c;
}

Result<UrlParts> splitUrl(const std::string& url) {
    const auto scheme = url.find("://");
    if (scheme == std::string::npos || scheme + 3 >= url.size()) {
        return Error{ErrorCode::InvalidArgument, "Cannot sign URL: " + url};
    }
    UrlParts parts;
    std::string_view rest(url);
    rest.remove_prefix(scheme + 3);

    const auto slash = rest.find('/');
    parts.host = std::string(rest.substr(0, slash));
    if (slash != std::string_view::npos) {
        auto pathAndQuery = rest.substr(slash);
        const auto q = pathAndQuery.find('?');
        parts.path = std::string(pathAndQuery.substr(0, q));
        if (q != std::string_view::npos)
            parts.query = std::string(pathAndQuery.substr(q + 1));
    }
    if (parts.host.empty()) {
        return Error{ErrorCode::InvalidArgument, "Cannot sign URL: " + url};
    }
    return parts;
}

SigningTime formatSigningTime(std::chrono::system_clock::time_point now) {
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&t, &utc);
    char stamp[20] = {};
    std::strftime(stamp, sizeof(stamp), "%Y%m%dT%H%M%SZ", &utc);
    SigningTime out;
    out.stamp = stamp;
    out.day = out.stamp.substr(0, 8);
    return out;
}

std::string resolveRegion(const S3ClientConfig& config, const std::string& host) {
    const bool r2 = host.find("r2.cloudflarestorage.com") != std::string::npos;
    if (config.region.empty())
        return r2 ? "auto" : "us-east-1";
    if (config.region == "auto" && !r2)
        return "us-east-1";
    return config.region;
}

} // namespace

Result<curl_slist*> S3Signer::signRequest(const S3ClientConfig& config, const std::string& method,
                                          const std::string& url,
                                          std::span<const std::byte> payload,
                                          const HeaderList& extraHeaders) {
    return signRequestAt(config, method, url, payload, extraHeaders,
                         std::chrono::system_clock::now());
}

Result<curl_slist*> S3Signer::signRequestAt(const S3ClientConfig& config,
                                            const std::string& method, const std::string& url,
                                            std::span<const std::byte> payload,
                                            const HeaderList& extraHeaders,
                                            std::chrono::system_clock::time_point now) {
    const auto creds = resolveCredentials(config);
    if (creds.accessKey.empty() || creds.secretKey.empty()) {
        return Error{ErrorCode::PermissionDenied, "Missing S3 credentials"};
    }

    auto parts = splitUrl(url);
    if (!parts)
        return parts.error();
    const auto& target = parts.value();

    const std::string region = resolveRegion(config, target.host);
    const SigningTime when = formatSigningTime(now);
    const std::string payloadHash =
        payload.empty()
            ? std::string(kEmptyPayloadHash)
            : sha256Hex({reinterpret_cast<const char*>(payload.data()), payload.size()});

    // Headers to sign, lowercase names; extras keep their original spelling on the wire.
    HeaderList signedSet{{"host", lowercase(target.host)},
                         {"x-amz-content-sha256", payloadHash},
                         {"x-amz-date", when.stamp}};
    if (!creds.sessionToken.empty())
        signedSet.emplace_back("x-amz-security-token", creds.sessionToken);
    for (const auto& [name, value] : extraHeaders)
        signedSet.emplace_back(lowercase(name), stripWhitespace(value));
    std::sort(signedSet.begin(), signedSet.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    std::string canonicalHeaders;
    std::string signedNames;
    for (const auto& [name, value] : signedSet) {
        canonicalHeaders += name + ":" + value + "\n";
        if (!signedNames.empty())
            signedNames += ';';
        signedNames += name;
    }

    // The path is already percent-encoded by the caller and goes in as-is.
    const std::string canonicalRequest = method + "\n" + target.path + "\n" + target.query +
                                         "\n" + canonicalHeaders + "\n" + signedNames + "\n" +
                                         payloadHash;

    const std::string scope =
        when.day + "/" + region + "/" + std::string(kService) + "/aws4_request";
    const std::string stringToSign = std::string(kAlgorithm) + "\n" + when.stamp + "\n" + scope +
                                     "\n" + sha256Hex(canonicalRequest);

    const Digest kDate = hmac("AWS4" + creds.secretKey, when.day);
    const Digest kRegion = hmac(asKey(kDate), region);
    const Digest kServiceKey = hmac(asKey(kRegion), kService);
    const Digest kSigning = hmac(asKey(kServiceKey), "aws4_request");
    const Digest signature = hmac(asKey(kSigning), stringToSign);

    const std::string authorization = std::string(kAlgorithm) + " Credential=" + creds.accessKey +
                                      "/" + scope + ",SignedHeaders=" + signedNames +
                                      ",Signature=" + toHex(signature.data(), signature.size());

    HeaderList wire{{"Host", target.host},
                    {"x-amz-date", when.stamp},
                    {"x-amz-content-sha256", payloadHash}};
    if (!creds.sessionToken.empty())
        wire.emplace_back("x-amz-security-token", creds.sessionToken);
    wire.insert(wire.end(), extraHeaders.begin(), extraHeaders.end());
    wire.emplace_back("Authorization", authorization);

    curl_slist* list = nullptr;
    for (const auto& [name, value] : wire) {
        const std::string line = name + ": " + value;
        curl_slist* next = curl_slist_append(list, line.c_str());
        if (next == nullptr) {
            curl_slist_free_all(list);
            return Error{ErrorCode::InternalError, "curl_slist_append failed"};
        }
        list = next;
    }
    return list;
}

} // namespace partstream::storage
