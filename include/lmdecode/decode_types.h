/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMDECODE_DECODE_TYPES_H
#define LMSHAO_LMDECODE_DECODE_TYPES_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace lmshao::lmdecode {

enum class ErrorCode {
    kOk = 0,
    kFileAccess,
    kEmptyOrTooSmallInput,
    kContainerParse,
    kDecodeFailed,
    kMemoryLimitExceeded,
    kCancelled,
    kWorkerUnresponsive,
    kCapacityExceeded,
    kInvalidState,
    kInvalidArgument,
};

const char *ErrorCodeName(ErrorCode code);

// Contiguous byte range of the source file.
struct FileChunk {
    std::vector<uint8_t> data;
    uint64_t start_position = 0;
    uint64_t end_position = 0;
    bool is_last = false;

    size_t Size() const { return data.size(); }
    bool IsConsistent() const { return end_position >= start_position && end_position - start_position == data.size(); }
};

// Decoded samples; start_sample counts interleaved samples from the session start.
struct AudioChunk {
    std::vector<float> samples;
    uint64_t start_sample = 0;
    bool is_last = false;
};

struct SampleIndexEntry {
    uint64_t byte_offset = 0;
    uint32_t byte_size = 0;
    uint64_t timestamp_us = 0;
    bool is_key_unit = true;
};

struct ContainerMetadata {
    uint32_t sample_rate = 0;
    uint32_t channel_count = 0;
    uint64_t duration_us = 0;
    uint32_t bitrate = 0;
    std::string codec_name;
    uint32_t codec_tag = 0;
    uint16_t sample_size_bits = 0;
    uint32_t timescale = 0;
    std::vector<SampleIndexEntry> sample_index;
    bool has_precise_index = false;
};

struct SeekResult {
    uint64_t actual_position_us = 0;
    uint64_t byte_offset = 0;
    bool is_exact = false;
    std::string warning;

    bool operator==(const SeekResult &other) const
    {
        return actual_position_us == other.actual_position_us && byte_offset == other.byte_offset &&
               is_exact == other.is_exact && warning == other.warning;
    }
};

struct ChunkSizeRecommendation {
    size_t recommended_size = 0;
    size_t min_size = 0;
    size_t max_size = 0;
    std::string reason;
    std::map<std::string, std::string> metadata;
};

// Tagged result of one call into the external decoder.
struct DecodeOutcome {
    enum class Kind { kDecoded, kNeedMoreData, kFatal };

    Kind kind = Kind::kNeedMoreData;
    std::vector<float> samples; // interleaved
    uint32_t sample_rate = 0;
    uint32_t channels = 0;
    uint64_t duration_us = 0;
    std::string error;

    static DecodeOutcome Decoded(std::vector<float> samples, uint32_t sample_rate, uint32_t channels);
    static DecodeOutcome NeedMoreData();
    static DecodeOutcome Fatal(const std::string &error);
};

// External codec entry point. Must hold no state across calls; workers call it concurrently.
using DecodeFunction = std::function<DecodeOutcome(const uint8_t *data, size_t size, const std::string &format_hint)>;

} // namespace lmshao::lmdecode

#endif // LMSHAO_LMDECODE_DECODE_TYPES_H
