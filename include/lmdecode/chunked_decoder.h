/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMDECODE_CHUNKED_DECODER_H
#define LMSHAO_LMDECODE_CHUNKED_DECODER_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "lmcore/noncopyable.h"
#include "lmdecode/decode_types.h"
#include "lmdecode/decoder_profile.h"

namespace lmshao::lmdecode {

class ChunkReader;
class MemoryGovernor;

enum class DecodeSessionState { kUninitialized = 0, kInitialized, kProcessing, kCleaned };

const char *DecodeSessionStateName(DecodeSessionState state);

struct DecodeStatistics {
    uint64_t chunks_processed = 0;
    uint64_t bytes_consumed = 0;
    uint64_t samples_emitted = 0;
    uint64_t audio_chunks_emitted = 0;
    uint64_t decode_calls = 0;
    uint64_t retained_retries = 0;
    uint64_t truncation_warnings = 0;
    uint64_t decode_errors = 0; // fatal outcomes, skipped or not
    uint64_t skipped_bytes = 0;
};

/**
 * @brief Per-file decode session
 *
 * Feeds arbitrary byte ranges of a compressed file to a stateless decode
 * function. Bytes that do not decode on their own are kept and retried
 * together with the following chunks, so frames split across chunk
 * boundaries are neither lost nor decoded twice. Not thread safe: one
 * session belongs to one worker.
 */
class ChunkedDecoder final : public lmcore::NonCopyable {
public:
    ChunkedDecoder(const DecoderProfile &profile, DecodeFunction decode_fn,
                   std::shared_ptr<MemoryGovernor> governor = nullptr);
    ~ChunkedDecoder();

    // seek_position_us < 0 means start of stream
    ErrorCode Initialize(const std::string &path, size_t chunk_size_hint = 0, int64_t seek_position_us = -1);

    // Chunks must be contiguous; out receives zero or more AudioChunks in order.
    // A fatal decode outcome fails the call once the profile's tolerance is used up.
    ErrorCode ProcessChunk(const FileChunk &chunk, std::vector<AudioChunk> &out);

    ErrorCode SeekToTime(uint64_t target_us, SeekResult &result);

    ChunkSizeRecommendation GetOptimalChunkSize(uint64_t file_size) const;

    std::map<std::string, std::string> GetMetadata() const;
    const ContainerMetadata &GetContainerMetadata() const;

    // Releases buffers, governor accounting and the file. Safe to call twice.
    void Cleanup();

    DecodeSessionState GetState() const;
    DecodeStatistics GetStatistics() const;
    const DecoderProfile &GetProfile() const;

    // Open reader positioned at the next chunk to feed.
    ChunkReader &Reader();

    uint64_t CurrentPositionUs() const;
    uint64_t CurrentSample() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace lmshao::lmdecode

#endif // LMSHAO_LMDECODE_CHUNKED_DECODER_H
