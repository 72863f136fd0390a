/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMDECODE_DECODER_PROFILE_H
#define LMSHAO_LMDECODE_DECODER_PROFILE_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace lmshao::lmdecode {

enum class AudioFormat { kUnknown = 0, kMp4, kMp3, kFlac, kOgg, kOpus, kWav };

const char *AudioFormatName(AudioFormat format);

// By file extension, case-insensitive.
AudioFormat DetectAudioFormat(const std::string &path);

// By magic bytes at the start of the file.
AudioFormat DetectAudioFormat(const uint8_t *data, size_t size);

struct ChunkSizeTier {
    size_t recommended;
    size_t min;
    size_t max;
};

// Per-format tuning of the chunked decode controller.
struct DecoderProfile {
    AudioFormat format = AudioFormat::kUnknown;
    std::string format_hint = "unknown"; // handed to the decode function

    size_t decode_threshold = 32 * 1024;        // live bytes before a retained retry
    size_t max_retained_buffer = 1024 * 1024;   // retained bytes kept across failures, at least 3 chunks
    uint32_t max_consecutive_failures = 0;      // fatal outcomes skipped in a row; 0 fails on the first
    uint32_t typical_frame_size = 1024;         // estimated index stride
    uint32_t samples_per_frame = 1152;
    uint32_t default_sample_rate = 44100;       // 0: estimation needs container data
    uint32_t default_channels = 2;

    bool box_container = false;                 // parse ISO BMFF tables on initialize
    size_t max_header_bytes = 16 * 1024 * 1024; // largest moov read into memory

    ChunkSizeTier medium{1024 * 1024, 256 * 1024, 4 * 1024 * 1024};
    ChunkSizeTier large{4 * 1024 * 1024, 1024 * 1024, 16 * 1024 * 1024};

    static DecoderProfile ForFormat(AudioFormat format);
};

} // namespace lmshao::lmdecode

#endif // LMSHAO_LMDECODE_DECODER_PROFILE_H
