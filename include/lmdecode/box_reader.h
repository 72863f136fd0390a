/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMDECODE_BOX_READER_H
#define LMSHAO_LMDECODE_BOX_READER_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace lmshao::lmdecode {

// Builds a four-character code from a literal such as "moov".
constexpr uint32_t FourCC(const char (&tag)[5])
{
    return (static_cast<uint32_t>(static_cast<uint8_t>(tag[0])) << 24) |
           (static_cast<uint32_t>(static_cast<uint8_t>(tag[1])) << 16) |
           (static_cast<uint32_t>(static_cast<uint8_t>(tag[2])) << 8) |
           static_cast<uint32_t>(static_cast<uint8_t>(tag[3]));
}

std::string FourCCToString(uint32_t type);

struct BoxHeader {
    uint32_t type = 0;
    uint64_t size = 0;        // whole box including header
    uint32_t header_size = 0; // 8, or 16 with largesize
};

// Buffer-only cursor for sequential reading over memory
struct BufferCursor {
    const uint8_t *data_;
    size_t size_;
    size_t pos_;
    BufferCursor(const uint8_t *d, size_t s) : data_(d), size_(s), pos_(0) {}
    size_t Read(uint8_t *dst, size_t n)
    {
        size_t remain = Remaining();
        size_t to_read = n < remain ? n : remain;
        for (size_t i = 0; i < to_read; ++i)
            dst[i] = data_[pos_ + i];
        pos_ += to_read;
        return to_read;
    }
    bool Seek(size_t offset)
    {
        if (offset > size_)
            return false;
        pos_ = offset;
        return true;
    }
    bool Skip(size_t n) { return n <= Remaining() && Seek(pos_ + n); }
    size_t Tell() const { return pos_; }
    size_t Remaining() const { return (pos_ < size_) ? (size_ - pos_) : 0; }
    const uint8_t *Current() const { return data_ + pos_; }
};

// Fixed-width big-endian reads; false when the read would run past the end.
bool ReadU8(BufferCursor &cur, uint8_t &value);
bool ReadBE16(BufferCursor &cur, uint16_t &value);
bool ReadBE32(BufferCursor &cur, uint32_t &value);
bool ReadBE64(BufferCursor &cur, uint64_t &value);

// Parse the next box header. Size 0 extends the box to the end of the cursor.
// Fails when the header is truncated or the declared size does not fit the remaining bytes.
bool NextBox(BufferCursor &cur, BoxHeader &out);

} // namespace lmshao::lmdecode

#endif // LMSHAO_LMDECODE_BOX_READER_H
