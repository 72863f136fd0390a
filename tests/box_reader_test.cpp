/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include <cassert>
#include <cstdint>
#include <vector>

#include "lmdecode/box_reader.h"

using namespace lmshao::lmdecode;

int main()
{
    // Test FourCC packing and printing
    {
        assert(FourCC("moov") == 0x6D6F6F76u);
        assert(FourCCToString(FourCC("stsz")) == "stsz");
    }

    // Test compact box header: size 16, type 'free'
    {
        std::vector<uint8_t> bytes = {0x00, 0x00, 0x00, 0x10, 'f', 'r', 'e', 'e', 0, 0, 0, 0, 0, 0, 0, 0};
        BufferCursor in(bytes.data(), bytes.size());
        BoxHeader h;
        assert(NextBox(in, h));
        assert(h.type == FourCC("free"));
        assert(h.size == 16);
        assert(h.header_size == 8);
        assert(in.Tell() == 8);
    }

    // Test largesize header: size field 1 followed by 64-bit size 24
    {
        std::vector<uint8_t> bytes = {0x00, 0x00, 0x00, 0x01, 'm', 'd', 'a', 't', 0, 0, 0, 0, 0, 0, 0, 0x18,
                                      1,    2,    3,    4,    5,   6,   7,   8};
        BufferCursor in(bytes.data(), bytes.size());
        BoxHeader h;
        assert(NextBox(in, h));
        assert(h.type == FourCC("mdat"));
        assert(h.size == 24);
        assert(h.header_size == 16);
    }

    // Test size 0 extends to the end of the buffer
    {
        std::vector<uint8_t> bytes = {0x00, 0x00, 0x00, 0x00, 'm', 'd', 'a', 't', 9, 9, 9};
        BufferCursor in(bytes.data(), bytes.size());
        BoxHeader h;
        assert(NextBox(in, h));
        assert(h.size == bytes.size());
    }

    // Test declared size beyond the buffer fails and leaves the cursor in place
    {
        std::vector<uint8_t> bytes = {0x00, 0x00, 0x01, 0x00, 'm', 'o', 'o', 'v', 0, 0};
        BufferCursor in(bytes.data(), bytes.size());
        BoxHeader h;
        assert(!NextBox(in, h));
        assert(in.Tell() == 0);
    }

    // Test size smaller than its own header is rejected
    {
        std::vector<uint8_t> bytes = {0x00, 0x00, 0x00, 0x04, 't', 'r', 'a', 'k'};
        BufferCursor in(bytes.data(), bytes.size());
        BoxHeader h;
        assert(!NextBox(in, h));
    }

    // Test fixed-width reads stop at the end
    {
        std::vector<uint8_t> bytes = {0x12, 0x34, 0x56, 0x78, 0x9A};
        BufferCursor in(bytes.data(), bytes.size());
        uint32_t v32 = 0;
        assert(ReadBE32(in, v32));
        assert(v32 == 0x12345678u);
        uint16_t v16 = 0;
        assert(!ReadBE16(in, v16));
        uint8_t v8 = 0;
        assert(ReadU8(in, v8));
        assert(v8 == 0x9A);
        uint64_t v64 = 0;
        assert(!ReadBE64(in, v64));
    }

    return 0;
}
