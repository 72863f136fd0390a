/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include <cassert>
#include <cstdint>
#include <string>
#include <vector>

#include "lmdecode/decoder_profile.h"

using namespace lmshao::lmdecode;

int main()
{
    // Test detection by extension
    {
        assert(DetectAudioFormat(std::string("/music/a.M4A")) == AudioFormat::kMp4);
        assert(DetectAudioFormat(std::string("b.mp3")) == AudioFormat::kMp3);
        assert(DetectAudioFormat(std::string("c.flac")) == AudioFormat::kFlac);
        assert(DetectAudioFormat(std::string("d.ogg")) == AudioFormat::kOgg);
        assert(DetectAudioFormat(std::string("e.opus")) == AudioFormat::kOpus);
        assert(DetectAudioFormat(std::string("f.wav")) == AudioFormat::kWav);
        assert(DetectAudioFormat(std::string("noext")) == AudioFormat::kUnknown);
        assert(DetectAudioFormat(std::string("dir.v2/file")) == AudioFormat::kUnknown);
    }

    // Test detection by magic bytes
    {
        const uint8_t mp4[] = {0, 0, 0, 0x20, 'f', 't', 'y', 'p', 'M', '4', 'A', ' '};
        assert(DetectAudioFormat(mp4, sizeof(mp4)) == AudioFormat::kMp4);

        const uint8_t flac[] = {'f', 'L', 'a', 'C', 0, 0, 0, 0x22};
        assert(DetectAudioFormat(flac, sizeof(flac)) == AudioFormat::kFlac);

        std::vector<uint8_t> opus = {'O', 'g', 'g', 'S'};
        opus.resize(28, 0);
        const char head[] = "OpusHead";
        opus.insert(opus.end(), head, head + 8);
        assert(DetectAudioFormat(opus.data(), opus.size()) == AudioFormat::kOpus);

        const uint8_t vorbis[] = {'O', 'g', 'g', 'S', 0, 2, 0, 0, 1, 'v', 'o', 'r', 'b', 'i', 's'};
        assert(DetectAudioFormat(vorbis, sizeof(vorbis)) == AudioFormat::kOgg);

        const uint8_t wav[] = {'R', 'I', 'F', 'F', 0, 0, 0, 0, 'W', 'A', 'V', 'E'};
        assert(DetectAudioFormat(wav, sizeof(wav)) == AudioFormat::kWav);

        const uint8_t id3[] = {'I', 'D', '3', 4, 0};
        assert(DetectAudioFormat(id3, sizeof(id3)) == AudioFormat::kMp3);

        const uint8_t sync[] = {0xFF, 0xFB, 0x90, 0x64};
        assert(DetectAudioFormat(sync, sizeof(sync)) == AudioFormat::kMp3);

        const uint8_t junk[] = {1, 2, 3};
        assert(DetectAudioFormat(junk, sizeof(junk)) == AudioFormat::kUnknown);
    }

    // Test every profile is self-consistent
    {
        const AudioFormat formats[] = {AudioFormat::kUnknown, AudioFormat::kMp4,  AudioFormat::kMp3,
                                       AudioFormat::kFlac,    AudioFormat::kOgg,  AudioFormat::kOpus,
                                       AudioFormat::kWav};
        for (AudioFormat f : formats) {
            DecoderProfile p = DecoderProfile::ForFormat(f);
            assert(p.format == f);
            assert(p.decode_threshold > 0);
            assert(p.max_retained_buffer >= p.decode_threshold);
            assert(p.typical_frame_size > 0);
            assert(p.samples_per_frame > 0);
            assert(p.default_sample_rate > 0);
            assert(p.medium.min <= p.medium.recommended && p.medium.recommended <= p.medium.max);
            assert(p.large.min <= p.large.recommended && p.large.recommended <= p.large.max);
        }
        assert(DecoderProfile::ForFormat(AudioFormat::kMp4).box_container);
        assert(!DecoderProfile::ForFormat(AudioFormat::kMp3).box_container);
        assert(DecoderProfile::ForFormat(AudioFormat::kOpus).default_sample_rate == 48000);
    }

    return 0;
}
