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

#include "lmdecode/sample_index.h"

using namespace lmshao::lmdecode;

int main()
{
    // Test header region is min(32KB, size / 10)
    {
        assert(EstimatedHeaderSize(1000) == 100);
        assert(EstimatedHeaderSize(10 * 1024 * 1024) == 32 * 1024);
    }

    // Test fixed stride walk and timestamps
    {
        const uint64_t file_size = 1024 * 1024;
        auto index = BuildEstimatedIndex(file_size, 418, 1152, 44100);
        assert(!index.empty());
        assert(index[0].byte_offset == 32 * 1024);
        assert(index[1].byte_offset == 32 * 1024 + 418);
        assert(index[0].timestamp_us == 0);
        assert(index[1].timestamp_us == 1152ULL * 1000000 / 44100);
        assert(!index[0].is_key_unit);
        assert(index.back().byte_offset < file_size);
        assert(index.back().byte_offset + index.back().byte_size == file_size);
        assert(IsIndexOrdered(index));
    }

    // Test estimation refuses a zero sample rate or stride
    {
        assert(BuildEstimatedIndex(100000, 418, 1152, 0).empty());
        assert(BuildEstimatedIndex(100000, 0, 1152, 44100).empty());
    }

    // Test nearest match, ties resolve to the earlier entry
    {
        std::vector<SampleIndexEntry> index(3);
        index[0].byte_offset = 100;
        index[0].timestamp_us = 0;
        index[1].byte_offset = 200;
        index[1].timestamp_us = 1000;
        index[2].byte_offset = 300;
        index[2].timestamp_us = 2000;

        size_t found = 99;
        assert(FindNearestEntry(index, 1400, found));
        assert(found == 1);
        assert(FindNearestEntry(index, 1500, found));
        assert(found == 1);
        assert(FindNearestEntry(index, 1000000, found));
        assert(found == 2);
        assert(!FindNearestEntry(std::vector<SampleIndexEntry>(), 0, found));
    }

    // Test ordering check catches repeated offsets
    {
        std::vector<SampleIndexEntry> index(2);
        index[0].byte_offset = 10;
        index[1].byte_offset = 10;
        assert(!IsIndexOrdered(index));
    }

    return 0;
}
