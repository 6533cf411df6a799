#include <partstream/downloader/range_math.hpp>

#include <algorithm>
#include <charconv>
#include <system_error>

namespace partstream::downloader {

namespace {

bool parseDecimal(std::string_view text, std::uint64_t& out) {
    if (text.empty())
        return false;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto res = std::from_chars(first, last, out);
    return res.ec == std::errc() && res.ptr == last;
}

bool allDigits(std::string_view text) {
    return !text.empty() &&
           std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; });
}

} // namespace

PartRange computeRange(std::uint64_t partIndex, std::uint64_t totalLength, std::uint64_t partSize,
                       std::uint64_t offsetBias) {
    PartRange r;
    r.start = partIndex * partSize + offsetBias;
    // end is inclusive, so the exclusive bound is clamped first
    const auto endExclusive = std::min(totalLength, (partIndex + 1) * partSize) + offsetBias;
    r.end = endExclusive - 1;
    r.length = endExclusive > r.start ? endExclusive - r.start : 0;
    return r;
}

Result<RangeInfo> parseRange(std::string_view range) {
    constexpr std::string_view kPrefix = "bytes=";
    if (range.substr(0, kPrefix.size()) != kPrefix) {
        return Error{ErrorCode::InvalidRange,
                     "Invalid Range provided by client: " + std::string(range)};
    }
    auto bounds = range.substr(kPrefix.size());
    auto dash = bounds.find('-');
    if (dash == std::string_view::npos) {
        return Error{ErrorCode::InvalidRange,
                     "Invalid Range provided by client: " + std::string(range)};
    }
    auto startText = bounds.substr(0, dash);
    auto endText = bounds.substr(dash + 1);

    RangeInfo info;
    if (!allDigits(startText) || !allDigits(endText) ||
        !parseDecimal(startText, info.startByte) || !parseDecimal(endText, info.endByte)) {
        return Error{ErrorCode::InvalidRange,
                     "Invalid Range provided by client: " + std::string(range)};
    }
    if (info.startByte > info.endByte) {
        return Error{ErrorCode::InvalidRange, "Range start exceeds end: " + std::string(range)};
    }
    info.length = info.endByte - info.startByte;
    return info;
}

std::string formatRange(const PartRange& range) {
    return "bytes=" + std::to_string(range.start) + "-" + std::to_string(range.end);
}

Result<std::uint64_t> parseContentRangeTotal(std::string_view contentRange) {
    auto slash = contentRange.rfind('/');
    if (slash == std::string_view::npos) {
        return Error{ErrorCode::InvalidData,
                     "Content-Range has no total length: " + std::string(contentRange)};
    }
    auto totalText = contentRange.substr(slash + 1);
    while (!totalText.empty() && (totalText.back() == ' ' || totalText.back() == '\r' ||
                                  totalText.back() == '\n')) {
        totalText.remove_suffix(1);
    }
    std::uint64_t total = 0;
    if (!allDigits(totalText) || !parseDecimal(totalText, total)) {
        return Error{ErrorCode::InvalidData,
                     "Content-Range total is not a number: " + std::string(contentRange)};
    }
    return total;
}

} // namespace partstream::downloader
