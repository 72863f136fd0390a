/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMDECODE_MP4_PARSER_H
#define LMSHAO_LMDECODE_MP4_PARSER_H

#include <cstddef>
#include <cstdint>

#include "lmdecode/decode_types.h"

namespace lmshao::lmdecode {

class ChunkReader;

enum class ParseStatus {
    kOk = 0,
    kIncomplete,         // no audio track found; metadata may be empty
    kMissingTables,      // audio track found, a required sample table absent or empty
    kOutOfBounds,        // a fixed-width read ran past the end of its box
    kInconsistentTables, // tables present but contradicting each other
};

const char *ParseStatusName(ParseStatus status);

/**
 * @brief ISO BMFF (MP4/M4A) audio track parser
 *
 * Walks the box tree of a movie box (or a whole file held in memory),
 * picks the first sound track and flattens its stts/stsc/stsz/stco tables
 * into a Sample Index. Everything but kOk leaves the metadata partially
 * filled so callers can fall back to an estimated index.
 */
class Mp4Parser {
public:
    Mp4Parser() = default;

    // Parse from memory buffer without IO
    ParseStatus ParseBuffer(const uint8_t *data, size_t size, ContainerMetadata &meta);

    // Scan top-level box headers for 'moov' without reading box payloads.
    static bool LocateMovieBox(const ChunkReader &reader, uint64_t &offset, uint64_t &size);

    static const char *CodecNameForTag(uint32_t codec_tag);
};

} // namespace lmshao::lmdecode

#endif // LMSHAO_LMDECODE_MP4_PARSER_H
