/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMDECODE_CHUNK_READER_H
#define LMSHAO_LMDECODE_CHUNK_READER_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "lmcore/noncopyable.h"
#include "lmdecode/decode_types.h"

namespace lmshao::lmcore {
class MappedFile;
}

namespace lmshao::lmdecode {

/**
 * @brief Read-only chunked access to a file
 *
 * Hands out contiguous FileChunks from the current position and serves
 * random byte ranges for header parsing. The file is memory mapped, so
 * only the bytes copied into chunks count against the caller's budget.
 */
class ChunkReader final : public lmcore::NonCopyable {
public:
    static constexpr size_t kDefaultChunkSize = 1024 * 1024;

    explicit ChunkReader(size_t chunk_size = kDefaultChunkSize);
    ~ChunkReader();

    // kFileAccess when missing or unreadable, kEmptyOrTooSmallInput when empty.
    ErrorCode Open(const std::string &path);
    void Close();
    bool IsOpen() const;

    uint64_t FileSize() const;
    uint64_t Position() const;
    bool Seek(uint64_t offset);

    void SetChunkSize(size_t chunk_size);
    size_t ChunkSize() const { return chunk_size_; }

    bool HasMore() const;

    // Next chunk of up to ChunkSize() bytes; is_last marks the end of file.
    ErrorCode ReadNext(FileChunk &chunk);

    // Random access read, clamped to the end of file. Does not move the position.
    ErrorCode ReadRange(uint64_t offset, size_t length, std::vector<uint8_t> &out) const;

    size_t EstimateRemainingChunks() const;

    static bool Exists(const std::string &path);

private:
    std::shared_ptr<lmcore::MappedFile> file_;
    std::string path_;
    size_t chunk_size_;
    uint64_t position_ = 0;
};

} // namespace lmshao::lmdecode

#endif // LMSHAO_LMDECODE_CHUNK_READER_H
