/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMDECODE_SAMPLE_INDEX_H
#define LMSHAO_LMDECODE_SAMPLE_INDEX_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "lmdecode/decode_types.h"

namespace lmshao::lmdecode {

// Seeks landing within this distance of the target count as exact.
static constexpr uint64_t kExactSeekToleranceUs = 25000;

// Largest header region skipped by the estimated index.
static constexpr uint64_t kMaxEstimatedHeaderBytes = 32 * 1024;

// min(32KB, file_size / 10)
uint64_t EstimatedHeaderSize(uint64_t file_size);

// Fixed-stride index used when the container tables are unusable.
// Empty when the stride or sample rate is zero or the file holds no data past the header.
std::vector<SampleIndexEntry> BuildEstimatedIndex(uint64_t file_size, uint32_t frame_size, uint32_t samples_per_frame,
                                                  uint32_t sample_rate);

// Linear nearest-match by absolute time difference; ties resolve to the first entry.
bool FindNearestEntry(const std::vector<SampleIndexEntry> &index, uint64_t target_us, size_t &found);

// byte_offset strictly increasing, timestamp_us non-decreasing
bool IsIndexOrdered(const std::vector<SampleIndexEntry> &index);

} // namespace lmshao::lmdecode

#endif // LMSHAO_LMDECODE_SAMPLE_INDEX_H
