/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include "lmdecode/mp4_parser.h"

#include <memory>
#include <vector>

#include "internal_logger.h"
#include "lmcore/byte_order.h"
#include "lmdecode/box_reader.h"
#include "lmdecode/chunk_reader.h"

namespace lmshao::lmdecode {

// ISO BMFF box types (partial)
static constexpr uint32_t kMoovBox = FourCC("moov");
static constexpr uint32_t kMvhdBox = FourCC("mvhd");
static constexpr uint32_t kTrakBox = FourCC("trak");
static constexpr uint32_t kEdtsBox = FourCC("edts");
static constexpr uint32_t kUdtaBox = FourCC("udta");
static constexpr uint32_t kMdiaBox = FourCC("mdia");
static constexpr uint32_t kMdhdBox = FourCC("mdhd");
static constexpr uint32_t kHdlrBox = FourCC("hdlr");
static constexpr uint32_t kMinfBox = FourCC("minf");
static constexpr uint32_t kStblBox = FourCC("stbl");
static constexpr uint32_t kStsdBox = FourCC("stsd");
static constexpr uint32_t kSttsBox = FourCC("stts");
static constexpr uint32_t kStscBox = FourCC("stsc");
static constexpr uint32_t kStszBox = FourCC("stsz");
static constexpr uint32_t kStcoBox = FourCC("stco");
static constexpr uint32_t kCo64Box = FourCC("co64");

static constexpr uint32_t kSoundHandler = FourCC("soun");

static constexpr int kMaxBoxDepth = 16;

struct StscEntry {
    uint32_t first_chunk;
    uint32_t samples_per_chunk;
};

struct SttsEntry {
    uint32_t sample_count;
    uint32_t sample_delta;
};

struct TrackState {
    uint32_t handler_type = 0;
    uint32_t timescale = 0;
    uint64_t duration = 0;

    // Sample entry
    uint32_t codec_tag = 0;
    uint16_t channels = 0;
    uint16_t sample_size_bits = 0;
    uint32_t sample_rate = 0;

    bool has_stts = false;
    bool has_stsc = false;
    bool has_stsz = false;
    bool has_stco = false;
    std::vector<SttsEntry> time_to_sample;
    std::vector<StscEntry> sample_to_chunk;
    uint32_t constant_sample_size = 0;
    uint32_t sample_count = 0;
    std::vector<uint32_t> sample_sizes;
    std::vector<uint64_t> chunk_offsets;
};

struct ParseContext {
    uint32_t movie_timescale = 0;
    uint64_t movie_duration = 0;
    std::unique_ptr<TrackState> audio_track;
    ParseStatus status = ParseStatus::kOk;
    uint32_t boxes_skipped = 0;
};

const char *ParseStatusName(ParseStatus status)
{
    switch (status) {
        case ParseStatus::kOk:
            return "ok";
        case ParseStatus::kIncomplete:
            return "incomplete";
        case ParseStatus::kMissingTables:
            return "missing sample tables";
        case ParseStatus::kOutOfBounds:
            return "read out of bounds";
        case ParseStatus::kInconsistentTables:
            return "inconsistent sample tables";
    }
    return "unknown";
}

const char *Mp4Parser::CodecNameForTag(uint32_t codec_tag)
{
    switch (codec_tag) {
        case FourCC("mp4a"):
            return "AAC";
        case FourCC("alac"):
            return "ALAC";
        case FourCC("Opus"):
            return "Opus";
        case FourCC("fLaC"):
            return "FLAC";
        case FourCC("ac-3"):
            return "AC-3";
        case FourCC("ec-3"):
            return "E-AC-3";
        case FourCC(".mp3"):
            return "MP3";
        default:
            return "Unknown";
    }
}

static inline uint64_t TicksToMicros(uint64_t ticks, uint32_t timescale)
{
    if (timescale == 0) {
        return 0;
    }
    return (ticks / timescale) * 1000000ULL + (ticks % timescale) * 1000000ULL / timescale;
}

// Reads version/flags and returns the version byte.
static inline bool ReadFullBoxHeader(BufferCursor &cur, uint8_t &version)
{
    uint32_t vf = 0;
    if (!ReadBE32(cur, vf)) {
        return false;
    }
    version = static_cast<uint8_t>(vf >> 24);
    return true;
}

// mvhd and mdhd share the timescale/duration layout
static bool ParseTimingBox(BufferCursor &cur, uint32_t &timescale, uint64_t &duration)
{
    uint8_t version = 0;
    if (!ReadFullBoxHeader(cur, version)) {
        return false;
    }
    if (version == 1) {
        uint64_t creation = 0, modification = 0;
        return ReadBE64(cur, creation) && ReadBE64(cur, modification) && ReadBE32(cur, timescale) &&
               ReadBE64(cur, duration);
    }
    uint32_t creation = 0, modification = 0, duration32 = 0;
    if (!ReadBE32(cur, creation) || !ReadBE32(cur, modification) || !ReadBE32(cur, timescale) ||
        !ReadBE32(cur, duration32)) {
        return false;
    }
    duration = duration32;
    return true;
}

static bool ParseHdlr(BufferCursor &cur, TrackState &track)
{
    uint8_t version = 0;
    uint32_t pre_defined = 0;
    return ReadFullBoxHeader(cur, version) && ReadBE32(cur, pre_defined) && ReadBE32(cur, track.handler_type);
}

static bool ParseStsd(BufferCursor &cur, TrackState &track)
{
    uint8_t version = 0;
    uint32_t entry_count = 0;
    if (!ReadFullBoxHeader(cur, version) || !ReadBE32(cur, entry_count)) {
        return false;
    }
    if (entry_count == 0) {
        LMDECODE_LOGW("stsd without sample entries");
        return true;
    }

    // Only the first sample entry is used
    BoxHeader entry{};
    if (!NextBox(cur, entry)) {
        return false;
    }
    BufferCursor ent(cur.Current(), static_cast<size_t>(entry.size - entry.header_size));
    track.codec_tag = entry.type;

    uint8_t reserved[6];
    uint16_t data_reference_index = 0;
    uint16_t sound_version = 0, revision = 0, compression_id = 0, packet_size = 0;
    uint32_t vendor = 0, rate_fixed = 0;
    if (ent.Read(reserved, sizeof(reserved)) != sizeof(reserved) || !ReadBE16(ent, data_reference_index) ||
        !ReadBE16(ent, sound_version) || !ReadBE16(ent, revision) || !ReadBE32(ent, vendor) ||
        !ReadBE16(ent, track.channels) || !ReadBE16(ent, track.sample_size_bits) || !ReadBE16(ent, compression_id) ||
        !ReadBE16(ent, packet_size) || !ReadBE32(ent, rate_fixed)) {
        return false;
    }
    track.sample_rate = rate_fixed >> 16; // 16.16 fixed point
    return true;
}

static bool ParseStts(BufferCursor &cur, TrackState &track)
{
    uint8_t version = 0;
    uint32_t count = 0;
    if (!ReadFullBoxHeader(cur, version) || !ReadBE32(cur, count)) {
        return false;
    }
    if (static_cast<uint64_t>(count) * 8 > cur.Remaining()) {
        LMDECODE_LOGE("stts declares %u entries, only %zu bytes left", count, cur.Remaining());
        return false;
    }
    track.time_to_sample.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        SttsEntry e{};
        if (!ReadBE32(cur, e.sample_count) || !ReadBE32(cur, e.sample_delta)) {
            return false;
        }
        track.time_to_sample.push_back(e);
    }
    track.has_stts = true;
    return true;
}

static bool ParseStsc(BufferCursor &cur, TrackState &track)
{
    uint8_t version = 0;
    uint32_t count = 0;
    if (!ReadFullBoxHeader(cur, version) || !ReadBE32(cur, count)) {
        return false;
    }
    if (static_cast<uint64_t>(count) * 12 > cur.Remaining()) {
        LMDECODE_LOGE("stsc declares %u entries, only %zu bytes left", count, cur.Remaining());
        return false;
    }
    track.sample_to_chunk.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        StscEntry e{};
        uint32_t description_index = 0;
        if (!ReadBE32(cur, e.first_chunk) || !ReadBE32(cur, e.samples_per_chunk) ||
            !ReadBE32(cur, description_index)) {
            return false;
        }
        track.sample_to_chunk.push_back(e);
    }
    track.has_stsc = true;
    return true;
}

static bool ParseStsz(BufferCursor &cur, TrackState &track)
{
    uint8_t version = 0;
    if (!ReadFullBoxHeader(cur, version) || !ReadBE32(cur, track.constant_sample_size) ||
        !ReadBE32(cur, track.sample_count)) {
        return false;
    }
    if (track.constant_sample_size == 0) {
        if (static_cast<uint64_t>(track.sample_count) * 4 > cur.Remaining()) {
            LMDECODE_LOGE("stsz declares %u sizes, only %zu bytes left", track.sample_count, cur.Remaining());
            return false;
        }
        track.sample_sizes.reserve(track.sample_count);
        for (uint32_t i = 0; i < track.sample_count; ++i) {
            uint32_t sz = 0;
            if (!ReadBE32(cur, sz)) {
                return false;
            }
            track.sample_sizes.push_back(sz);
        }
    }
    track.has_stsz = true;
    return true;
}

static bool ParseChunkOffsets(BufferCursor &cur, TrackState &track, bool wide)
{
    uint8_t version = 0;
    uint32_t count = 0;
    if (!ReadFullBoxHeader(cur, version) || !ReadBE32(cur, count)) {
        return false;
    }
    const uint64_t entry_size = wide ? 8 : 4;
    if (static_cast<uint64_t>(count) * entry_size > cur.Remaining()) {
        LMDECODE_LOGE("%s declares %u offsets, only %zu bytes left", wide ? "co64" : "stco", count, cur.Remaining());
        return false;
    }
    track.chunk_offsets.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        if (wide) {
            uint64_t off = 0;
            if (!ReadBE64(cur, off)) {
                return false;
            }
            track.chunk_offsets.push_back(off);
        } else {
            uint32_t off = 0;
            if (!ReadBE32(cur, off)) {
                return false;
            }
            track.chunk_offsets.push_back(off);
        }
    }
    track.has_stco = true;
    return true;
}

static bool IsContainerBox(uint32_t type)
{
    return type == kMoovBox || type == kTrakBox || type == kEdtsBox || type == kUdtaBox || type == kMdiaBox ||
           type == kMinfBox || type == kStblBox;
}

static void WalkBoxes(BufferCursor &cur, int depth, ParseContext &ctx, TrackState *track);

static bool HandleLeafBox(uint32_t type, BufferCursor &payload, ParseContext &ctx, TrackState *track)
{
    if (type == kMvhdBox) {
        return ParseTimingBox(payload, ctx.movie_timescale, ctx.movie_duration);
    }
    if (track == nullptr) {
        ctx.boxes_skipped++;
        return true;
    }
    switch (type) {
        case kMdhdBox:
            return ParseTimingBox(payload, track->timescale, track->duration);
        case kHdlrBox:
            return ParseHdlr(payload, *track);
        case kStsdBox:
            return ParseStsd(payload, *track);
        case kSttsBox:
            return ParseStts(payload, *track);
        case kStscBox:
            return ParseStsc(payload, *track);
        case kStszBox:
            return ParseStsz(payload, *track);
        case kStcoBox:
            return ParseChunkOffsets(payload, *track, false);
        case kCo64Box:
            return ParseChunkOffsets(payload, *track, true);
        default:
            ctx.boxes_skipped++;
            return true;
    }
}

static void WalkBoxes(BufferCursor &cur, int depth, ParseContext &ctx, TrackState *track)
{
    if (depth > kMaxBoxDepth) {
        LMDECODE_LOGW("Box nesting deeper than %d, ignoring", kMaxBoxDepth);
        return;
    }
    while (cur.Remaining() >= 8 && ctx.status == ParseStatus::kOk) {
        BoxHeader hdr{};
        if (!NextBox(cur, hdr)) {
            // Declared size does not fit: abandon this box and the rest of this level
            LMDECODE_LOGW("Stopping walk at depth %d, offset %zu", depth, cur.Tell());
            break;
        }
        size_t payload_size = static_cast<size_t>(hdr.size - hdr.header_size);
        BufferCursor payload(cur.Current(), payload_size);

        if (hdr.type == kTrakBox) {
            TrackState trak;
            WalkBoxes(payload, depth + 1, ctx, &trak);
            if (trak.handler_type == kSoundHandler && !ctx.audio_track) {
                ctx.audio_track.reset(new TrackState(std::move(trak)));
            }
        } else if (IsContainerBox(hdr.type)) {
            WalkBoxes(payload, depth + 1, ctx, track);
        } else if (!HandleLeafBox(hdr.type, payload, ctx, track)) {
            LMDECODE_LOGE("Read past end of '%s' box", FourCCToString(hdr.type).c_str());
            ctx.status = ParseStatus::kOutOfBounds;
        }
        cur.Skip(payload_size);
    }
}

static void FillTrackMetadata(const ParseContext &ctx, ContainerMetadata &meta)
{
    const TrackState &t = *ctx.audio_track;
    meta.codec_tag = t.codec_tag;
    meta.codec_name = Mp4Parser::CodecNameForTag(t.codec_tag);
    meta.channel_count = t.channels;
    meta.sample_size_bits = t.sample_size_bits;
    meta.sample_rate = t.sample_rate != 0 ? t.sample_rate : t.timescale;
    meta.timescale = t.timescale;
    if (t.timescale != 0 && t.duration != 0) {
        meta.duration_us = TicksToMicros(t.duration, t.timescale);
    } else {
        meta.duration_us = TicksToMicros(ctx.movie_duration, ctx.movie_timescale);
    }
}

static ParseStatus BuildSampleIndex(const TrackState &t, ContainerMetadata &meta)
{
    uint64_t stts_total = 0;
    for (const auto &e : t.time_to_sample) {
        stts_total += e.sample_count;
    }
    if (stts_total != t.sample_count) {
        LMDECODE_LOGE("stts covers %llu samples, stsz declares %u", (unsigned long long)stts_total, t.sample_count);
        return ParseStatus::kInconsistentTables;
    }

    std::vector<SampleIndexEntry> index;
    index.reserve(t.sample_count);

    const size_t chunk_count = t.chunk_offsets.size();
    uint32_t sample = 0;
    for (size_t i = 0; i < t.sample_to_chunk.size() && sample < t.sample_count; ++i) {
        const StscEntry &group = t.sample_to_chunk[i];
        uint64_t first = group.first_chunk;
        uint64_t last = (i + 1 < t.sample_to_chunk.size()) ? t.sample_to_chunk[i + 1].first_chunk - 1 : chunk_count;
        if (first == 0 || first > chunk_count || last < first || last > chunk_count) {
            LMDECODE_LOGE("stsc group %zu covers chunks [%llu, %llu] of %zu", i, (unsigned long long)first,
                          (unsigned long long)last, chunk_count);
            return ParseStatus::kInconsistentTables;
        }
        for (uint64_t chunk = first; chunk <= last && sample < t.sample_count; ++chunk) {
            uint64_t offset = t.chunk_offsets[chunk - 1];
            for (uint32_t s = 0; s < group.samples_per_chunk && sample < t.sample_count; ++s, ++sample) {
                uint32_t size = t.constant_sample_size != 0 ? t.constant_sample_size : t.sample_sizes[sample];
                SampleIndexEntry entry;
                entry.byte_offset = offset;
                entry.byte_size = size;
                entry.is_key_unit = true;
                index.push_back(entry);
                offset += size;
            }
        }
    }
    if (index.size() != t.sample_count) {
        LMDECODE_LOGE("Chunk groups expand to %zu samples, expected %u", index.size(), t.sample_count);
        return ParseStatus::kInconsistentTables;
    }

    // Timestamps from duration runs
    uint64_t ticks = 0;
    size_t pos = 0;
    for (const auto &run : t.time_to_sample) {
        for (uint32_t k = 0; k < run.sample_count; ++k, ++pos) {
            index[pos].timestamp_us = TicksToMicros(ticks, t.timescale);
            ticks += run.sample_delta;
        }
    }

    uint64_t total_bytes = 0;
    for (size_t i = 0; i < index.size(); ++i) {
        if (i > 0 && index[i].byte_offset <= index[i - 1].byte_offset) {
            LMDECODE_LOGE("Sample %zu offset %llu not after previous %llu", i, (unsigned long long)index[i].byte_offset,
                          (unsigned long long)index[i - 1].byte_offset);
            return ParseStatus::kInconsistentTables;
        }
        total_bytes += index[i].byte_size;
    }

    if (meta.duration_us == 0 && t.timescale != 0) {
        meta.duration_us = TicksToMicros(ticks, t.timescale);
    }
    if (meta.duration_us > 0) {
        meta.bitrate = static_cast<uint32_t>(total_bytes * 8ULL * 1000000ULL / meta.duration_us);
    }
    meta.sample_index = std::move(index);
    meta.has_precise_index = true;
    return ParseStatus::kOk;
}

ParseStatus Mp4Parser::ParseBuffer(const uint8_t *data, size_t size, ContainerMetadata &meta)
{
    meta = ContainerMetadata{};
    if (data == nullptr || size < 8) {
        LMDECODE_LOGE("Buffer too small for a box header: %zu", size);
        return ParseStatus::kIncomplete;
    }

    BufferCursor cur(data, size);
    ParseContext ctx;
    WalkBoxes(cur, 0, ctx, nullptr);

    if (!ctx.audio_track) {
        LMDECODE_LOGW("No sound track found (%u boxes skipped)", ctx.boxes_skipped);
        if (ctx.status != ParseStatus::kOk) {
            return ctx.status;
        }
        return ParseStatus::kIncomplete;
    }

    FillTrackMetadata(ctx, meta);
    if (ctx.status != ParseStatus::kOk) {
        return ctx.status;
    }

    const TrackState &t = *ctx.audio_track;
    bool sizes_present = t.constant_sample_size != 0 || !t.sample_sizes.empty();
    if (!t.has_stts || t.time_to_sample.empty() || !t.has_stsc || t.sample_to_chunk.empty() || !t.has_stsz ||
        t.sample_count == 0 || !sizes_present || !t.has_stco || t.chunk_offsets.empty()) {
        LMDECODE_LOGW("Sample tables incomplete: stts=%d stsc=%d stsz=%d stco=%d", t.has_stts, t.has_stsc, t.has_stsz,
                      t.has_stco);
        return ParseStatus::kMissingTables;
    }

    ParseStatus status = BuildSampleIndex(t, meta);
    if (status == ParseStatus::kOk) {
        LMDECODE_LOGI("Parsed MP4: codec=%s rate=%u ch=%u duration=%llu us, %zu samples indexed",
                      meta.codec_name.c_str(), meta.sample_rate, meta.channel_count,
                      (unsigned long long)meta.duration_us, meta.sample_index.size());
    }
    return status;
}

bool Mp4Parser::LocateMovieBox(const ChunkReader &reader, uint64_t &offset, uint64_t &size)
{
    using lmshao::lmcore::ByteOrder;

    const uint64_t file_size = reader.FileSize();
    uint64_t pos = 0;
    std::vector<uint8_t> hdr;
    while (pos + 8 <= file_size) {
        if (reader.ReadRange(pos, 16, hdr) != ErrorCode::kOk || hdr.size() < 8) {
            return false;
        }
        uint64_t box_size = ByteOrder::ReadBE32(hdr.data());
        uint32_t type = ByteOrder::ReadBE32(hdr.data() + 4);
        uint64_t header_size = 8;
        if (box_size == 1) {
            if (hdr.size() < 16) {
                return false;
            }
            box_size = ByteOrder::ReadBE64(hdr.data() + 8);
            header_size = 16;
        } else if (box_size == 0) {
            box_size = file_size - pos;
        }
        if (box_size < header_size || box_size > file_size - pos) {
            LMDECODE_LOGD("Top-level scan stopped at %llu: box '%s' size %llu", (unsigned long long)pos,
                          FourCCToString(type).c_str(), (unsigned long long)box_size);
            return false;
        }
        if (type == kMoovBox) {
            offset = pos;
            size = box_size;
            return true;
        }
        pos += box_size;
    }
    return false;
}

} // namespace lmshao::lmdecode
