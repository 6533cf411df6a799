#pragma once

#include <partstream/core/types.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace partstream::downloader {

/**
 * Absolute byte range of one part. end is inclusive.
 */
struct PartRange {
    std::uint64_t start{0};
    std::uint64_t end{0};
    std::uint64_t length{0};
};

/**
 * A client-supplied "bytes=<start>-<end>" range.
 * length is end - start: the bytes [start, end) are streamed.
 */
struct RangeInfo {
    std::uint64_t startByte{0};
    std::uint64_t endByte{0};
    std::uint64_t length{0};
};

/**
 * Range of part partIndex when [offsetBias, offsetBias + totalLength) is split into
 * partSize pieces. partSize must be positive and partIndex < ceil(totalLength / partSize).
 */
[[nodiscard]] PartRange computeRange(std::uint64_t partIndex, std::uint64_t totalLength,
                                     std::uint64_t partSize, std::uint64_t offsetBias = 0);

/**
 * Number of parts needed to cover totalLength bytes.
 */
[[nodiscard]] inline std::uint64_t partCount(std::uint64_t totalLength, std::uint64_t partSize) {
    return partSize == 0 ? 0 : (totalLength + partSize - 1) / partSize;
}

/**
 * Parse exactly "bytes=<start>-<end>" with start <= end. Anything else is InvalidRange.
 */
Result<RangeInfo> parseRange(std::string_view range);

/**
 * Wire form of a part range: "bytes=<start>-<end>".
 */
[[nodiscard]] std::string formatRange(const PartRange& range);

/**
 * Total object length from a Content-Range value ("bytes 0-9/100" or "bytes=0-9/100").
 * Missing or non-numeric total is InvalidData.
 */
Result<std::uint64_t> parseContentRangeTotal(std::string_view contentRange);

} // namespace partstream::downloader
