/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include <cstdio>
#include <cstring>
#include <string>

#include "lmdecode/chunked_decoder.h"
#include "lmdecode/decoder_profile.h"
#include "lmdecode/lmdecode_logger.h"

using namespace lmshao::lmdecode;

// Metadata only: nothing is decoded
static DecodeOutcome NoDecode(const uint8_t *, size_t, const std::string &)
{
    return DecodeOutcome::NeedMoreData();
}

int main(int argc, char **argv)
{
    if (argc < 2) {
        std::fprintf(stderr, "Usage: %s <input> [--entries=N] [--seek-ms=T]\n", argv[0]);
        return 1;
    }

    InitLmdecodeLogger(lmshao::lmcore::LogLevel::kWarn);

    const std::string path = argv[1];
    size_t entries = 10;
    long long seek_ms = -1;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--entries=", 0) == 0) {
            entries = std::strtoul(arg.c_str() + 10, nullptr, 10);
        } else if (arg.rfind("--seek-ms=", 0) == 0) {
            seek_ms = std::strtoll(arg.c_str() + 10, nullptr, 10);
        }
    }

    AudioFormat format = DetectAudioFormat(path);
    ChunkedDecoder decoder(DecoderProfile::ForFormat(format), NoDecode);
    ErrorCode rc = decoder.Initialize(path);
    if (rc != ErrorCode::kOk) {
        std::fprintf(stderr, "Cannot open %s: %s\n", path.c_str(), ErrorCodeName(rc));
        return 2;
    }

    for (const auto &kv : decoder.GetMetadata()) {
        printf("%-16s %s\n", kv.first.c_str(), kv.second.c_str());
    }

    ChunkSizeRecommendation rec = decoder.GetOptimalChunkSize(decoder.Reader().FileSize());
    printf("Chunk size: %zu [%zu, %zu] %s\n", rec.recommended_size, rec.min_size, rec.max_size, rec.reason.c_str());

    const auto &index = decoder.GetContainerMetadata().sample_index;
    printf("Seek index (%s, %zu entries):\n", decoder.GetContainerMetadata().has_precise_index ? "precise" : "estimated",
           index.size());
    for (size_t i = 0; i < index.size() && i < entries; ++i) {
        printf("  #%zu  %10.3f s  offset %llu  size %u\n", i, index[i].timestamp_us / 1e6,
               (unsigned long long)index[i].byte_offset, index[i].byte_size);
    }

    if (seek_ms >= 0) {
        SeekResult seek;
        rc = decoder.SeekToTime(static_cast<uint64_t>(seek_ms) * 1000, seek);
        if (rc != ErrorCode::kOk) {
            std::fprintf(stderr, "Seek failed: %s\n", ErrorCodeName(rc));
        } else {
            printf("Seek %lld ms -> %.3f s at byte %llu (%s)%s%s\n", seek_ms, seek.actual_position_us / 1e6,
                   (unsigned long long)seek.byte_offset, seek.is_exact ? "exact" : "approximate",
                   seek.warning.empty() ? "" : ": ", seek.warning.c_str());
        }
    }

    decoder.Cleanup();
    return 0;
}
