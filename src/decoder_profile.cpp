/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include "lmdecode/decoder_profile.h"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace lmshao::lmdecode {

static constexpr size_t kKiB = 1024;
static constexpr size_t kMiB = 1024 * 1024;

const char *AudioFormatName(AudioFormat format)
{
    switch (format) {
        case AudioFormat::kMp4:
            return "MP4/AAC";
        case AudioFormat::kMp3:
            return "MP3";
        case AudioFormat::kFlac:
            return "FLAC";
        case AudioFormat::kOgg:
            return "OGG Vorbis";
        case AudioFormat::kOpus:
            return "Opus";
        case AudioFormat::kWav:
            return "WAV";
        case AudioFormat::kUnknown:
            break;
    }
    return "Unknown";
}

AudioFormat DetectAudioFormat(const std::string &path)
{
    size_t dot = path.find_last_of('.');
    if (dot == std::string::npos || dot + 1 >= path.size()) {
        return AudioFormat::kUnknown;
    }
    std::string ext = path.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });

    if (ext == "mp4" || ext == "m4a" || ext == "m4b" || ext == "aac") {
        return AudioFormat::kMp4;
    }
    if (ext == "mp3") {
        return AudioFormat::kMp3;
    }
    if (ext == "flac") {
        return AudioFormat::kFlac;
    }
    if (ext == "ogg" || ext == "oga") {
        return AudioFormat::kOgg;
    }
    if (ext == "opus") {
        return AudioFormat::kOpus;
    }
    if (ext == "wav" || ext == "wave") {
        return AudioFormat::kWav;
    }
    return AudioFormat::kUnknown;
}

AudioFormat DetectAudioFormat(const uint8_t *data, size_t size)
{
    if (data == nullptr || size < 4) {
        return AudioFormat::kUnknown;
    }
    if (size >= 8 && std::memcmp(data + 4, "ftyp", 4) == 0) {
        return AudioFormat::kMp4;
    }
    if (std::memcmp(data, "fLaC", 4) == 0) {
        return AudioFormat::kFlac;
    }
    if (std::memcmp(data, "OggS", 4) == 0) {
        // OpusHead sits in the first page payload
        const size_t scan = std::min<size_t>(size, 128);
        for (size_t i = 0; i + 8 <= scan; ++i) {
            if (std::memcmp(data + i, "OpusHead", 8) == 0) {
                return AudioFormat::kOpus;
            }
        }
        return AudioFormat::kOgg;
    }
    if (size >= 12 && std::memcmp(data, "RIFF", 4) == 0 && std::memcmp(data + 8, "WAVE", 4) == 0) {
        return AudioFormat::kWav;
    }
    if (std::memcmp(data, "ID3", 3) == 0 || (data[0] == 0xFF && (data[1] & 0xE0) == 0xE0)) {
        return AudioFormat::kMp3;
    }
    return AudioFormat::kUnknown;
}

DecoderProfile DecoderProfile::ForFormat(AudioFormat format)
{
    DecoderProfile p;
    p.format = format;
    switch (format) {
        case AudioFormat::kMp4:
            p.format_hint = "mp4";
            p.decode_threshold = 32 * kKiB;
            p.max_retained_buffer = 2 * kMiB;
            p.typical_frame_size = 512;
            p.samples_per_frame = 1024;
            p.box_container = true;
            p.medium = {2 * kMiB, 512 * kKiB, 8 * kMiB};
            p.large = {8 * kMiB, 2 * kMiB, 32 * kMiB};
            break;
        case AudioFormat::kMp3:
            p.format_hint = "mp3";
            p.decode_threshold = 16 * kKiB;
            p.max_retained_buffer = 512 * kKiB;
            p.typical_frame_size = 418; // 128 kbps at 44.1 kHz
            p.samples_per_frame = 1152;
            p.medium = {1 * kMiB, 32 * kKiB, 5 * kMiB};
            p.large = {4 * kMiB, 1 * kMiB, 20 * kMiB};
            break;
        case AudioFormat::kFlac:
            p.format_hint = "flac";
            p.decode_threshold = 64 * kKiB;
            p.max_retained_buffer = 4 * kMiB;
            p.typical_frame_size = 8192;
            p.samples_per_frame = 4096;
            p.medium = {3 * kMiB, 512 * kKiB, 15 * kMiB};
            p.large = {8 * kMiB, 2 * kMiB, 25 * kMiB};
            break;
        case AudioFormat::kOgg:
            p.format_hint = "ogg";
            p.decode_threshold = 16 * kKiB;
            p.max_retained_buffer = 1 * kMiB;
            p.typical_frame_size = 4096; // one page
            p.samples_per_frame = 2048;
            p.medium = {4 * kMiB, 1 * kMiB, 15 * kMiB};
            p.large = {8 * kMiB, 2 * kMiB, 30 * kMiB};
            break;
        case AudioFormat::kOpus:
            p.format_hint = "opus";
            p.decode_threshold = 8 * kKiB;
            p.max_retained_buffer = 512 * kKiB;
            p.typical_frame_size = 160; // 20 ms at 64 kbps
            p.samples_per_frame = 960;
            p.default_sample_rate = 48000;
            p.medium = {2 * kMiB, 32 * kKiB, 8 * kMiB};
            p.large = {4 * kMiB, 1 * kMiB, 16 * kMiB};
            break;
        case AudioFormat::kWav:
            p.format_hint = "wav";
            p.decode_threshold = 4 * kKiB;
            p.max_retained_buffer = 256 * kKiB;
            p.typical_frame_size = 4096;
            p.samples_per_frame = 1024; // 16-bit stereo
            p.medium = {4 * kMiB, 1 * kMiB, 16 * kMiB};
            p.large = {16 * kMiB, 4 * kMiB, 64 * kMiB};
            break;
        case AudioFormat::kUnknown:
            break;
    }
    return p;
}

} // namespace lmshao::lmdecode
