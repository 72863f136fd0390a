/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include "lmdecode/sample_index.h"

#include <algorithm>

#include "internal_logger.h"

namespace lmshao::lmdecode {

uint64_t EstimatedHeaderSize(uint64_t file_size)
{
    return std::min<uint64_t>(kMaxEstimatedHeaderBytes, file_size / 10);
}

std::vector<SampleIndexEntry> BuildEstimatedIndex(uint64_t file_size, uint32_t frame_size, uint32_t samples_per_frame,
                                                  uint32_t sample_rate)
{
    std::vector<SampleIndexEntry> index;
    if (frame_size == 0 || samples_per_frame == 0 || sample_rate == 0) {
        LMDECODE_LOGE("Cannot estimate index: frame=%u spf=%u rate=%u", frame_size, samples_per_frame, sample_rate);
        return index;
    }

    uint64_t offset = EstimatedHeaderSize(file_size);
    if (offset >= file_size) {
        return index;
    }
    index.reserve(static_cast<size_t>((file_size - offset + frame_size - 1) / frame_size));

    uint64_t frame = 0;
    while (offset < file_size) {
        SampleIndexEntry e;
        e.byte_offset = offset;
        e.byte_size = static_cast<uint32_t>(std::min<uint64_t>(frame_size, file_size - offset));
        e.timestamp_us = frame * samples_per_frame * 1000000ULL / sample_rate;
        e.is_key_unit = false;
        index.push_back(e);
        offset += frame_size;
        ++frame;
    }
    LMDECODE_LOGD("Estimated index: %zu entries, stride %u bytes", index.size(), frame_size);
    return index;
}

bool FindNearestEntry(const std::vector<SampleIndexEntry> &index, uint64_t target_us, size_t &found)
{
    if (index.empty()) {
        return false;
    }
    auto distance = [target_us](uint64_t ts) { return ts > target_us ? ts - target_us : target_us - ts; };

    size_t best = 0;
    uint64_t best_diff = distance(index[0].timestamp_us);
    for (size_t i = 1; i < index.size(); ++i) {
        uint64_t diff = distance(index[i].timestamp_us);
        if (diff < best_diff) {
            best_diff = diff;
            best = i;
        }
    }
    found = best;
    return true;
}

bool IsIndexOrdered(const std::vector<SampleIndexEntry> &index)
{
    for (size_t i = 1; i < index.size(); ++i) {
        if (index[i].byte_offset <= index[i - 1].byte_offset || index[i].timestamp_us < index[i - 1].timestamp_us) {
            return false;
        }
    }
    return true;
}

} // namespace lmshao::lmdecode
