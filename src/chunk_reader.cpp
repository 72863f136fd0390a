/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include "lmdecode/chunk_reader.h"

#include <sys/stat.h>
#include <sys/types.h>

#include <algorithm>

#include "internal_logger.h"
#include "lmcore/mapped_file.h"

namespace lmshao::lmdecode {

ChunkReader::ChunkReader(size_t chunk_size) : chunk_size_(chunk_size > 0 ? chunk_size : kDefaultChunkSize) {}

ChunkReader::~ChunkReader()
{
    Close();
}

bool ChunkReader::Exists(const std::string &path)
{
    struct stat st {};
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

ErrorCode ChunkReader::Open(const std::string &path)
{
    Close();

    struct stat st {};
    if (stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        LMDECODE_LOGE("File does not exist: %s", path.c_str());
        return ErrorCode::kFileAccess;
    }
    if (st.st_size == 0) {
        LMDECODE_LOGE("File is empty: %s", path.c_str());
        return ErrorCode::kEmptyOrTooSmallInput;
    }

    std::shared_ptr<lmcore::MappedFile> mf = lmcore::MappedFile::Open(path);
    if (!mf || !mf->IsValid()) {
        LMDECODE_LOGE("Cannot map file: %s", path.c_str());
        return ErrorCode::kFileAccess;
    }

    file_ = std::move(mf);
    path_ = path;
    position_ = 0;
    LMDECODE_LOGD("Opened %s (%zu bytes, chunk size %zu)", path.c_str(), file_->Size(), chunk_size_);
    return ErrorCode::kOk;
}

void ChunkReader::Close()
{
    file_.reset();
    path_.clear();
    position_ = 0;
}

bool ChunkReader::IsOpen() const
{
    return file_ != nullptr;
}

uint64_t ChunkReader::FileSize() const
{
    return file_ ? static_cast<uint64_t>(file_->Size()) : 0;
}

uint64_t ChunkReader::Position() const
{
    return position_;
}

bool ChunkReader::Seek(uint64_t offset)
{
    if (!file_ || offset > FileSize()) {
        return false;
    }
    position_ = offset;
    return true;
}

void ChunkReader::SetChunkSize(size_t chunk_size)
{
    if (chunk_size > 0) {
        chunk_size_ = chunk_size;
    }
}

bool ChunkReader::HasMore() const
{
    return file_ && position_ < FileSize();
}

ErrorCode ChunkReader::ReadNext(FileChunk &chunk)
{
    if (!file_) {
        return ErrorCode::kInvalidState;
    }
    if (!HasMore()) {
        return ErrorCode::kInvalidArgument;
    }

    uint64_t remaining = FileSize() - position_;
    size_t to_read = static_cast<size_t>(std::min<uint64_t>(remaining, chunk_size_));
    const uint8_t *base = file_->Data() + position_;

    chunk.data.assign(base, base + to_read);
    chunk.start_position = position_;
    chunk.end_position = position_ + to_read;
    chunk.is_last = chunk.end_position >= FileSize();
    position_ = chunk.end_position;
    return ErrorCode::kOk;
}

ErrorCode ChunkReader::ReadRange(uint64_t offset, size_t length, std::vector<uint8_t> &out) const
{
    out.clear();
    if (!file_) {
        return ErrorCode::kInvalidState;
    }
    if (offset > FileSize()) {
        return ErrorCode::kInvalidArgument;
    }
    size_t to_read = static_cast<size_t>(std::min<uint64_t>(FileSize() - offset, length));
    const uint8_t *base = file_->Data() + offset;
    out.assign(base, base + to_read);
    return ErrorCode::kOk;
}

size_t ChunkReader::EstimateRemainingChunks() const
{
    if (!file_ || position_ >= FileSize()) {
        return 0;
    }
    uint64_t remaining = FileSize() - position_;
    return static_cast<size_t>((remaining + chunk_size_ - 1) / chunk_size_);
}

} // namespace lmshao::lmdecode
