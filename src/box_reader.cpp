/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include "lmdecode/box_reader.h"

#include <cctype>

#include "internal_logger.h"
#include "lmcore/byte_order.h"

namespace lmshao::lmdecode {

using lmshao::lmcore::ByteOrder;

std::string FourCCToString(uint32_t type)
{
    std::string s(4, '?');
    for (int i = 0; i < 4; ++i) {
        char c = static_cast<char>((type >> (24 - 8 * i)) & 0xFF);
        s[i] = std::isprint(static_cast<unsigned char>(c)) ? c : '?';
    }
    return s;
}

bool ReadU8(BufferCursor &cur, uint8_t &value)
{
    return cur.Read(&value, 1) == 1;
}

bool ReadBE16(BufferCursor &cur, uint16_t &value)
{
    if (cur.Remaining() < 2) {
        return false;
    }
    const uint8_t *p = cur.Current();
    value = static_cast<uint16_t>((p[0] << 8) | p[1]);
    cur.Skip(2);
    return true;
}

bool ReadBE32(BufferCursor &cur, uint32_t &value)
{
    if (cur.Remaining() < 4) {
        return false;
    }
    value = ByteOrder::ReadBE32(cur.Current());
    cur.Skip(4);
    return true;
}

bool ReadBE64(BufferCursor &cur, uint64_t &value)
{
    if (cur.Remaining() < 8) {
        return false;
    }
    value = ByteOrder::ReadBE64(cur.Current());
    cur.Skip(8);
    return true;
}

bool NextBox(BufferCursor &cur, BoxHeader &out)
{
    size_t start = cur.Tell();
    size_t available = cur.Remaining();
    uint32_t size32 = 0;
    uint32_t type = 0;
    if (!ReadBE32(cur, size32) || !ReadBE32(cur, type)) {
        cur.Seek(start);
        return false;
    }

    uint64_t size = size32;
    uint32_t header_size = 8;
    if (size32 == 1) {
        if (!ReadBE64(cur, size)) {
            LMDECODE_LOGW("Truncated largesize in box '%s'", FourCCToString(type).c_str());
            cur.Seek(start);
            return false;
        }
        header_size = 16;
    } else if (size32 == 0) {
        size = available;
    }

    if (size < header_size || size > available) {
        LMDECODE_LOGW("Box '%s' declares %llu bytes, %zu available", FourCCToString(type).c_str(),
                      (unsigned long long)size, available);
        cur.Seek(start);
        return false;
    }

    out.type = type;
    out.size = size;
    out.header_size = header_size;
    return true;
}

} // namespace lmshao::lmdecode
