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
#include "lmdecode/chunk_reader.h"
#include "lmdecode/mp4_parser.h"
#include "lmdecode/sample_index.h"
#include "test_utils.h"

using namespace lmshao::lmdecode;
using namespace lmshao::lmdecode::test;

static std::vector<uint8_t> MoovOf(const std::vector<uint8_t> &file)
{
    BufferCursor cur(file.data(), file.size());
    BoxHeader h;
    while (NextBox(cur, h)) {
        if (h.type == FourCC("moov")) {
            return std::vector<uint8_t>(cur.Current() - h.header_size, cur.Current() - h.header_size + h.size);
        }
        cur.Skip(static_cast<size_t>(h.size - h.header_size));
    }
    return {};
}

int main()
{
    // Test complete tables give a precise index
    {
        Mp4TrackLayout layout;
        auto file = BuildMp4File(layout);
        auto moov = MoovOf(file);
        assert(!moov.empty());

        Mp4Parser parser;
        ContainerMetadata meta;
        assert(parser.ParseBuffer(moov.data(), moov.size(), meta) == ParseStatus::kOk);
        assert(meta.has_precise_index);
        assert(meta.codec_name == "AAC");
        assert(meta.codec_tag == FourCC("mp4a"));
        assert(meta.sample_rate == 44100);
        assert(meta.channel_count == 2);
        assert(meta.timescale == 44100);
        assert(meta.sample_index.size() == layout.sample_count);
        assert(IsIndexOrdered(meta.sample_index));

        // 100 x 1024 ticks at 44.1 kHz
        assert(meta.duration_us == 2321995);
        assert(meta.sample_index[0].timestamp_us == 0);
        assert(meta.sample_index[1].timestamp_us == 23219);
        assert(meta.sample_index[1].byte_offset == meta.sample_index[0].byte_offset + layout.sample_size);
        assert(meta.bitrate > 0);
    }

    // Test the whole file parses the same as the moov alone
    {
        Mp4TrackLayout layout;
        auto file = BuildMp4File(layout);
        Mp4Parser parser;
        ContainerMetadata meta;
        assert(parser.ParseBuffer(file.data(), file.size(), meta) == ParseStatus::kOk);
        assert(meta.sample_index.size() == layout.sample_count);
    }

    // Test a missing table is reported apart from skipped boxes, with partial metadata kept
    {
        Mp4TrackLayout layout;
        layout.with_stco = false;
        auto moov = MoovOf(BuildMp4File(layout));
        Mp4Parser parser;
        ContainerMetadata meta;
        assert(parser.ParseBuffer(moov.data(), moov.size(), meta) == ParseStatus::kMissingTables);
        assert(!meta.has_precise_index);
        assert(meta.sample_index.empty());
        assert(meta.sample_rate == 44100);
        assert(meta.channel_count == 2);
    }

    // Test stts and stsz disagreeing on the sample count
    {
        Mp4TrackLayout layout;
        auto moov = MoovOf(BuildMp4File(layout));
        // Patch the stts run count: find "stts" and bump the first run
        for (size_t i = 0; i + 4 < moov.size(); ++i) {
            if (moov[i] == 's' && moov[i + 1] == 't' && moov[i + 2] == 't' && moov[i + 3] == 's') {
                // tag, version/flags, entry_count, then sample_count
                moov[i + 4 + 4 + 4 + 3] += 1;
                break;
            }
        }
        Mp4Parser parser;
        ContainerMetadata meta;
        assert(parser.ParseBuffer(moov.data(), moov.size(), meta) == ParseStatus::kInconsistentTables);
    }

    // Test a truncated movie box keeps what was read
    {
        Mp4TrackLayout layout;
        auto moov = MoovOf(BuildMp4File(layout));
        moov.resize(moov.size() - 40);
        Mp4Parser parser;
        ContainerMetadata meta;
        ParseStatus status = parser.ParseBuffer(moov.data(), moov.size(), meta);
        assert(status != ParseStatus::kOk);
        assert(meta.sample_index.empty());
    }

    // Test a buffer with no sound track
    {
        auto moov = Box("moov", FullBox("mvhd", 0, std::vector<uint8_t>(96, 0)));
        Mp4Parser parser;
        ContainerMetadata meta;
        assert(parser.ParseBuffer(moov.data(), moov.size(), meta) == ParseStatus::kIncomplete);
    }

    // Test unknown boxes are skipped
    {
        Mp4TrackLayout layout;
        auto file = BuildMp4File(layout);
        auto junk = Box("junk", std::vector<uint8_t>(33, 0xEE));
        std::vector<uint8_t> with_junk = Concat({junk, file});
        Mp4Parser parser;
        ContainerMetadata meta;
        assert(parser.ParseBuffer(with_junk.data(), with_junk.size(), meta) == ParseStatus::kOk);
    }

    // Test codec names
    {
        assert(std::string(Mp4Parser::CodecNameForTag(FourCC("alac"))) == "ALAC");
        assert(std::string(Mp4Parser::CodecNameForTag(FourCC("Opus"))) == "Opus");
        assert(std::string(Mp4Parser::CodecNameForTag(FourCC("xxxx"))) == "Unknown");
    }

    // Test locating moov after mdat through the reader
    {
        Mp4TrackLayout layout;
        auto ftyp = BuildFtyp();
        auto mdat = Box("mdat", std::vector<uint8_t>(5000, 0x11));
        auto moov = BuildMoov(layout, ftyp.size() + 8);
        auto file = Concat({ftyp, mdat, moov});
        TempFile tmp(file, ".m4a");

        ChunkReader reader;
        assert(reader.Open(tmp.Path()) == ErrorCode::kOk);
        uint64_t offset = 0;
        uint64_t size = 0;
        assert(Mp4Parser::LocateMovieBox(reader, offset, size));
        assert(offset == ftyp.size() + mdat.size());
        assert(size == moov.size());
    }

    return 0;
}
