/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMDECODE_TEST_UTILS_H
#define LMSHAO_LMDECODE_TEST_UTILS_H

#include <unistd.h>

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <initializer_list>
#include <string>
#include <vector>

#include "lmdecode/decode_types.h"

namespace lmshao::lmdecode::test {

inline void PutBE16(std::vector<uint8_t> &out, uint16_t v)
{
    out.push_back(static_cast<uint8_t>(v >> 8));
    out.push_back(static_cast<uint8_t>(v));
}

inline void PutBE32(std::vector<uint8_t> &out, uint32_t v)
{
    for (int shift = 24; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>(v >> shift));
    }
}

inline void PutBE64(std::vector<uint8_t> &out, uint64_t v)
{
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>(v >> shift));
    }
}

inline void PutTag(std::vector<uint8_t> &out, const char *tag)
{
    out.insert(out.end(), tag, tag + 4);
}

inline std::vector<uint8_t> Box(const char *type, const std::vector<uint8_t> &payload)
{
    std::vector<uint8_t> out;
    PutBE32(out, static_cast<uint32_t>(payload.size() + 8));
    PutTag(out, type);
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

inline std::vector<uint8_t> FullBox(const char *type, uint8_t version, const std::vector<uint8_t> &payload)
{
    std::vector<uint8_t> body;
    PutBE32(body, static_cast<uint32_t>(version) << 24);
    body.insert(body.end(), payload.begin(), payload.end());
    return Box(type, body);
}

inline std::vector<uint8_t> Concat(std::initializer_list<std::vector<uint8_t>> parts)
{
    std::vector<uint8_t> out;
    for (const auto &p : parts) {
        out.insert(out.end(), p.begin(), p.end());
    }
    return out;
}

// Single audio track laid out as fixed-size samples in equal chunks
struct Mp4TrackLayout {
    uint32_t timescale = 44100;
    uint32_t sample_rate = 44100;
    uint16_t channels = 2;
    uint32_t sample_count = 100;
    uint32_t sample_delta = 1024;
    uint32_t sample_size = 400;
    uint32_t samples_per_chunk = 10;
    bool with_stts = true;
    bool with_stsc = true;
    bool with_stsz = true;
    bool with_stco = true;
};

inline std::vector<uint8_t> BuildFtyp()
{
    std::vector<uint8_t> p;
    PutTag(p, "M4A ");
    PutBE32(p, 0);
    PutTag(p, "M4A ");
    PutTag(p, "isom");
    return Box("ftyp", p);
}

inline std::vector<uint8_t> BuildMoov(const Mp4TrackLayout &t, uint64_t data_offset)
{
    const uint64_t duration = uint64_t(t.sample_count) * t.sample_delta;

    std::vector<uint8_t> mvhd;
    PutBE32(mvhd, 0);
    PutBE32(mvhd, 0);
    PutBE32(mvhd, 1000);
    PutBE32(mvhd, static_cast<uint32_t>(duration * 1000 / t.timescale));
    mvhd.resize(mvhd.size() + 80, 0);

    std::vector<uint8_t> mdhd;
    PutBE32(mdhd, 0);
    PutBE32(mdhd, 0);
    PutBE32(mdhd, t.timescale);
    PutBE32(mdhd, static_cast<uint32_t>(duration));
    PutBE32(mdhd, 0);

    std::vector<uint8_t> hdlr;
    PutBE32(hdlr, 0);
    PutTag(hdlr, "soun");
    hdlr.resize(hdlr.size() + 13, 0);

    std::vector<uint8_t> entry(6, 0);
    PutBE16(entry, 1);
    PutBE16(entry, 0);
    PutBE16(entry, 0);
    PutBE32(entry, 0);
    PutBE16(entry, t.channels);
    PutBE16(entry, 16);
    PutBE16(entry, 0);
    PutBE16(entry, 0);
    PutBE32(entry, t.sample_rate << 16);
    std::vector<uint8_t> stsd;
    PutBE32(stsd, 1);
    std::vector<uint8_t> mp4a = Box("mp4a", entry);
    stsd.insert(stsd.end(), mp4a.begin(), mp4a.end());

    std::vector<uint8_t> stts;
    PutBE32(stts, 1);
    PutBE32(stts, t.sample_count);
    PutBE32(stts, t.sample_delta);

    std::vector<uint8_t> stsc;
    PutBE32(stsc, 1);
    PutBE32(stsc, 1);
    PutBE32(stsc, t.samples_per_chunk);
    PutBE32(stsc, 1);

    std::vector<uint8_t> stsz;
    PutBE32(stsz, 0);
    PutBE32(stsz, t.sample_count);
    for (uint32_t i = 0; i < t.sample_count; ++i) {
        PutBE32(stsz, t.sample_size);
    }

    const uint32_t chunk_count = (t.sample_count + t.samples_per_chunk - 1) / t.samples_per_chunk;
    std::vector<uint8_t> stco;
    PutBE32(stco, chunk_count);
    for (uint32_t c = 0; c < chunk_count; ++c) {
        PutBE32(stco, static_cast<uint32_t>(data_offset + uint64_t(c) * t.samples_per_chunk * t.sample_size));
    }

    std::vector<uint8_t> stbl = FullBox("stsd", 0, stsd);
    if (t.with_stts) {
        auto b = FullBox("stts", 0, stts);
        stbl.insert(stbl.end(), b.begin(), b.end());
    }
    if (t.with_stsc) {
        auto b = FullBox("stsc", 0, stsc);
        stbl.insert(stbl.end(), b.begin(), b.end());
    }
    if (t.with_stsz) {
        auto b = FullBox("stsz", 0, stsz);
        stbl.insert(stbl.end(), b.begin(), b.end());
    }
    if (t.with_stco) {
        auto b = FullBox("stco", 0, stco);
        stbl.insert(stbl.end(), b.begin(), b.end());
    }

    auto minf = Box("minf", Box("stbl", stbl));
    auto mdia = Box("mdia", Concat({FullBox("mdhd", 0, mdhd), FullBox("hdlr", 0, hdlr), minf}));
    auto trak = Box("trak", mdia);
    return Box("moov", Concat({FullBox("mvhd", 0, mvhd), trak}));
}

// ftyp, moov, mdat; mdat is padded to reach total_size when it is larger.
inline std::vector<uint8_t> BuildMp4File(const Mp4TrackLayout &t, size_t total_size = 0)
{
    auto ftyp = BuildFtyp();
    const size_t moov_size = BuildMoov(t, 0).size();
    const uint64_t data_offset = ftyp.size() + moov_size + 8;
    auto moov = BuildMoov(t, data_offset);

    size_t media_bytes = size_t(t.sample_count) * t.sample_size;
    size_t used = ftyp.size() + moov.size() + 8;
    if (total_size > used + media_bytes) {
        media_bytes = total_size - used;
    }
    std::vector<uint8_t> media(media_bytes);
    for (size_t i = 0; i < media.size(); ++i) {
        media[i] = static_cast<uint8_t>(i * 7);
    }
    return Concat({ftyp, moov, Box("mdat", media)});
}

// Test codec: "FRAM" | u16 sample count | u16 reserved | count x s16 BE, mono 8 kHz.
static constexpr uint32_t kFrameSampleRate = 8000;
static constexpr size_t kFrameHeaderSize = 8;

inline std::vector<uint8_t> MakeFrame(uint16_t sample_count, int16_t first_value)
{
    std::vector<uint8_t> out;
    PutTag(out, "FRAM");
    PutBE16(out, sample_count);
    PutBE16(out, 0);
    for (uint16_t i = 0; i < sample_count; ++i) {
        // small values keep "FRAM" from appearing inside payloads
        PutBE16(out, static_cast<uint16_t>((first_value + i) % 200));
    }
    return out;
}

// Decodes only when the buffer is a whole number of frames.
inline DecodeOutcome DecodeFrames(const uint8_t *data, size_t size, const std::string &)
{
    std::vector<float> samples;
    size_t pos = 0;
    while (pos < size) {
        if (size - pos < kFrameHeaderSize || std::memcmp(data + pos, "FRAM", 4) != 0) {
            return DecodeOutcome::NeedMoreData();
        }
        uint16_t count = static_cast<uint16_t>((data[pos + 4] << 8) | data[pos + 5]);
        size_t frame_size = kFrameHeaderSize + size_t(count) * 2;
        if (size - pos < frame_size) {
            return DecodeOutcome::NeedMoreData();
        }
        for (uint16_t i = 0; i < count; ++i) {
            const uint8_t *p = data + pos + kFrameHeaderSize + i * 2;
            int16_t v = static_cast<int16_t>((p[0] << 8) | p[1]);
            samples.push_back(static_cast<float>(v) / 32768.0f);
        }
        pos += frame_size;
    }
    if (samples.empty()) {
        return DecodeOutcome::NeedMoreData();
    }
    return DecodeOutcome::Decoded(std::move(samples), kFrameSampleRate, 1);
}

// Removes the file on destruction.
class TempFile {
public:
    explicit TempFile(const std::vector<uint8_t> &bytes, const char *suffix = ".bin")
    {
        char tmpl[] = "/tmp/lmdecode_test_XXXXXX";
        int fd = mkstemp(tmpl);
        if (fd >= 0) {
            close(fd);
            unlink(tmpl);
        }
        path_ = std::string(tmpl) + suffix;
        FILE *fp = fopen(path_.c_str(), "wb");
        if (fp != nullptr) {
            if (!bytes.empty()) {
                fwrite(bytes.data(), 1, bytes.size(), fp);
            }
            fclose(fp);
        }
    }
    ~TempFile() { std::remove(path_.c_str()); }

    TempFile(const TempFile &) = delete;
    TempFile &operator=(const TempFile &) = delete;

    const std::string &Path() const { return path_; }

private:
    std::string path_;
};

} // namespace lmshao::lmdecode::test

#endif // LMSHAO_LMDECODE_TEST_UTILS_H
