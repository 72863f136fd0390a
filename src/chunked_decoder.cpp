/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include "lmdecode/chunked_decoder.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

#include "internal_logger.h"
#include "lmdecode/chunk_reader.h"
#include "lmdecode/memory_governor.h"
#include "lmdecode/mp4_parser.h"
#include "lmdecode/sample_index.h"

namespace lmshao::lmdecode {

static constexpr size_t kKiB = 1024;
static constexpr size_t kMiB = 1024 * 1024;

// Chunk size tiers
static constexpr uint64_t kSmallFileLimit = 2 * kMiB;
static constexpr uint64_t kMediumFileLimit = 100 * kMiB;
static constexpr size_t kSmallChunkMin = 8 * kKiB;
static constexpr size_t kSmallChunkMax = 512 * kKiB;

// Retained bytes may span this many chunks before the oldest are dropped
static constexpr size_t kRetainedChunks = 3;

const char *DecodeSessionStateName(DecodeSessionState state)
{
    switch (state) {
        case DecodeSessionState::kUninitialized:
            return "uninitialized";
        case DecodeSessionState::kInitialized:
            return "initialized";
        case DecodeSessionState::kProcessing:
            return "processing";
        case DecodeSessionState::kCleaned:
            return "cleaned";
    }
    return "unknown";
}

static std::string FormatBytes(uint64_t bytes)
{
    char buf[32];
    if (bytes >= kMiB) {
        snprintf(buf, sizeof(buf), "%.1fMB", static_cast<double>(bytes) / kMiB);
    } else {
        snprintf(buf, sizeof(buf), "%.1fKB", static_cast<double>(bytes) / kKiB);
    }
    return buf;
}

class ChunkedDecoder::Impl {
public:
    Impl(const DecoderProfile &profile, DecodeFunction decode_fn, std::shared_ptr<MemoryGovernor> governor)
        : profile_(profile), decode_fn_(std::move(decode_fn)), governor_(std::move(governor))
    {
    }

    ~Impl() { Cleanup(); }

    ErrorCode Initialize(const std::string &path, size_t chunk_size_hint, int64_t seek_position_us)
    {
        if (state_ != DecodeSessionState::kUninitialized) {
            LMDECODE_LOGE("Initialize called in state %s", DecodeSessionStateName(state_));
            return ErrorCode::kInvalidState;
        }
        if (!decode_fn_) {
            LMDECODE_LOGE("No decode function supplied");
            return ErrorCode::kInvalidArgument;
        }

        ErrorCode rc = reader_.Open(path);
        if (rc != ErrorCode::kOk) {
            return rc;
        }
        const uint64_t file_size = reader_.FileSize();
        metadata_ = ContainerMetadata();

        ParseStatus status = ParseStatus::kIncomplete;
        if (profile_.box_container) {
            status = ParseContainer();
        }
        if (status != ParseStatus::kOk || metadata_.sample_index.empty()) {
            LMDECODE_LOGW("Container index unusable (%s), estimating from file size", ParseStatusName(status));
            rc = BuildFallbackIndex(file_size);
            if (rc != ErrorCode::kOk) {
                reader_.Close();
                metadata_ = ContainerMetadata();
                return rc;
            }
        }
        if (metadata_.channel_count == 0) {
            metadata_.channel_count = profile_.default_channels;
        }

        size_t chunk_size = chunk_size_hint > 0 ? chunk_size_hint : GetOptimalChunkSize(file_size).recommended_size;
        reader_.SetChunkSize(chunk_size);
        retained_cap_ = std::max(profile_.max_retained_buffer, kRetainedChunks * chunk_size);
        expected_position_ = 0;
        consecutive_failures_ = 0;
        state_ = DecodeSessionState::kInitialized;

        if (seek_position_us >= 0) {
            SeekResult ignored;
            rc = SeekToTime(static_cast<uint64_t>(seek_position_us), ignored);
            if (rc != ErrorCode::kOk) {
                LMDECODE_LOGE("Initial seek to %lld us failed: %s", (long long)seek_position_us, ErrorCodeName(rc));
                Rollback();
                return rc;
            }
        }

        LMDECODE_LOGI("Session ready: %s, %s, %u Hz, %u ch, %zu index entries (%s), chunk %zu, retained cap %zu",
                      path.c_str(), metadata_.codec_name.c_str(), metadata_.sample_rate, metadata_.channel_count,
                      metadata_.sample_index.size(), metadata_.has_precise_index ? "precise" : "estimated",
                      chunk_size, retained_cap_);
        return ErrorCode::kOk;
    }

    ErrorCode ProcessChunk(const FileChunk &chunk, std::vector<AudioChunk> &out)
    {
        out.clear();
        if (state_ != DecodeSessionState::kInitialized && state_ != DecodeSessionState::kProcessing) {
            LMDECODE_LOGE("ProcessChunk called in state %s", DecodeSessionStateName(state_));
            return ErrorCode::kInvalidState;
        }
        if (!chunk.IsConsistent()) {
            LMDECODE_LOGE("Chunk range [%llu, %llu) does not match %zu bytes", (unsigned long long)chunk.start_position,
                          (unsigned long long)chunk.end_position, chunk.Size());
            return ErrorCode::kInvalidArgument;
        }
        if (chunk.start_position != expected_position_) {
            LMDECODE_LOGE("Chunk starts at %llu, expected %llu", (unsigned long long)chunk.start_position,
                          (unsigned long long)expected_position_);
            return ErrorCode::kInvalidArgument;
        }

        if (governor_ && chunk.Size() > 0) {
            if (governor_->Allocate(chunk.Size()) != ErrorCode::kOk) {
                return ErrorCode::kMemoryLimitExceeded;
            }
            accounted_bytes_ += chunk.Size();
        }
        live_.insert(live_.end(), chunk.data.begin(), chunk.data.end());
        expected_position_ = chunk.end_position;
        state_ = DecodeSessionState::kProcessing;
        stats_.chunks_processed++;
        stats_.bytes_consumed += chunk.Size();

        ErrorCode rc = DecodePending(chunk.is_last, out);
        if (rc == ErrorCode::kOk && chunk.is_last && (out.empty() || !out.back().is_last)) {
            AudioChunk tail;
            tail.start_sample = sample_cursor_;
            tail.is_last = true;
            out.push_back(std::move(tail));
            stats_.audio_chunks_emitted++;
        }
        SyncAccounting();
        return rc;
    }

    ErrorCode SeekToTime(uint64_t target_us, SeekResult &result)
    {
        if (state_ != DecodeSessionState::kInitialized && state_ != DecodeSessionState::kProcessing) {
            LMDECODE_LOGE("SeekToTime called in state %s", DecodeSessionStateName(state_));
            return ErrorCode::kInvalidState;
        }
        size_t idx = 0;
        if (!FindNearestEntry(metadata_.sample_index, target_us, idx)) {
            LMDECODE_LOGE("Seek with empty sample index");
            return ErrorCode::kInvalidArgument;
        }
        const SampleIndexEntry &entry = metadata_.sample_index[idx];
        uint64_t diff = entry.timestamp_us > target_us ? entry.timestamp_us - target_us : target_us - entry.timestamp_us;

        result = SeekResult();
        result.actual_position_us = entry.timestamp_us;
        result.byte_offset = entry.byte_offset;
        result.is_exact = metadata_.has_precise_index && diff < kExactSeekToleranceUs;
        if (!metadata_.has_precise_index) {
            result.warning = "Seek position estimated from file size; actual position may differ";
        }

        if (!reader_.Seek(entry.byte_offset)) {
            LMDECODE_LOGE("Index offset %llu beyond end of file", (unsigned long long)entry.byte_offset);
            return ErrorCode::kInvalidArgument;
        }
        ResetBuffers();
        SyncAccounting();
        expected_position_ = entry.byte_offset;
        time_position_us_ = entry.timestamp_us;
        uint64_t frames = static_cast<uint64_t>(
            std::llround(static_cast<double>(entry.timestamp_us) * metadata_.sample_rate / 1000000.0));
        sample_cursor_ = frames * metadata_.channel_count;
        anchor_us_ = time_position_us_;
        anchor_sample_ = sample_cursor_;

        LMDECODE_LOGD("Seek %llu us -> %llu us at byte %llu (%s)", (unsigned long long)target_us,
                      (unsigned long long)result.actual_position_us, (unsigned long long)result.byte_offset,
                      result.is_exact ? "exact" : "approximate");
        return ErrorCode::kOk;
    }

    ChunkSizeRecommendation GetOptimalChunkSize(uint64_t file_size) const
    {
        ChunkSizeRecommendation rec;
        rec.metadata["fileSize"] = std::to_string(file_size);
        rec.metadata["format"] = AudioFormatName(profile_.format);

        if (file_size < kSmallFileLimit) {
            size_t size = static_cast<size_t>(file_size * 2 / 5);
            rec.recommended_size = std::min(std::max(size, kSmallChunkMin), kSmallChunkMax);
            rec.min_size = kSmallChunkMin;
            rec.max_size = kSmallChunkMax;
            rec.reason = "Small file (" + FormatBytes(file_size) + "): 40% of file size";
            rec.metadata["tier"] = "small";
            return rec;
        }

        // Never below the largest small-tier size
        const ChunkSizeTier &medium = profile_.medium;
        size_t medium_size = std::min(std::max(std::max(medium.recommended, kSmallChunkMax), medium.min), medium.max);
        if (file_size < kMediumFileLimit) {
            rec.recommended_size = medium_size;
            rec.min_size = std::min(medium.min, medium_size);
            rec.max_size = std::max(medium.max, medium_size);
            rec.reason = "Medium file (" + FormatBytes(file_size) + "): " + AudioFormatName(profile_.format) +
                         " sized chunks";
            rec.metadata["tier"] = "medium";
            return rec;
        }

        const ChunkSizeTier &large = profile_.large;
        rec.recommended_size = std::max(large.recommended, medium_size);
        rec.min_size = std::min(large.min, rec.recommended_size);
        rec.max_size = std::max(large.max, rec.recommended_size);
        rec.reason = "Large file (" + FormatBytes(file_size) + "): larger chunks within wider bounds";
        rec.metadata["tier"] = "large";
        return rec;
    }

    std::map<std::string, std::string> GetMetadata() const
    {
        std::map<std::string, std::string> m;
        m["state"] = DecodeSessionStateName(state_);
        m["format"] = AudioFormatName(profile_.format);
        m["hasPreciseIndex"] = metadata_.has_precise_index ? "true" : "false";
        m["codec"] = metadata_.codec_name;
        m["sampleRate"] = std::to_string(metadata_.sample_rate);
        m["channels"] = std::to_string(metadata_.channel_count);
        m["durationMs"] = std::to_string(metadata_.duration_us / 1000);
        m["bitrate"] = std::to_string(metadata_.bitrate);
        m["indexEntries"] = std::to_string(metadata_.sample_index.size());
        m["fileSize"] = std::to_string(reader_.FileSize());
        m["chunkSize"] = std::to_string(reader_.ChunkSize());
        m["retainedCap"] = std::to_string(retained_cap_);
        return m;
    }

    void Cleanup()
    {
        if (state_ == DecodeSessionState::kCleaned) {
            return;
        }
        ResetBuffers();
        SyncAccounting();
        reader_.Close();
        state_ = DecodeSessionState::kCleaned;
        LMDECODE_LOGD("Session cleaned: %llu chunks, %llu samples, %llu truncations, %llu decode errors",
                      (unsigned long long)stats_.chunks_processed, (unsigned long long)stats_.samples_emitted,
                      (unsigned long long)stats_.truncation_warnings, (unsigned long long)stats_.decode_errors);
    }

private:
    friend class ChunkedDecoder;

    // Back to Uninitialized after a failed initialize
    void Rollback()
    {
        ResetBuffers();
        SyncAccounting();
        reader_.Close();
        metadata_ = ContainerMetadata();
        expected_position_ = 0;
        sample_cursor_ = 0;
        time_position_us_ = 0;
        anchor_sample_ = 0;
        anchor_us_ = 0;
        retained_cap_ = 0;
        state_ = DecodeSessionState::kUninitialized;
    }

    ParseStatus ParseContainer()
    {
        uint64_t moov_offset = 0;
        uint64_t moov_size = 0;
        if (!Mp4Parser::LocateMovieBox(reader_, moov_offset, moov_size)) {
            LMDECODE_LOGW("No moov box found");
            return ParseStatus::kIncomplete;
        }
        if (moov_size > profile_.max_header_bytes) {
            LMDECODE_LOGW("moov of %llu bytes exceeds header limit %zu, reading a prefix",
                          (unsigned long long)moov_size, profile_.max_header_bytes);
            moov_size = profile_.max_header_bytes;
        }

        size_t header_bytes = static_cast<size_t>(moov_size);
        if (governor_ && governor_->Allocate(header_bytes) != ErrorCode::kOk) {
            LMDECODE_LOGW("No budget for %zu header bytes, skipping container parse", header_bytes);
            return ParseStatus::kIncomplete;
        }

        std::vector<uint8_t> moov;
        ParseStatus status = ParseStatus::kIncomplete;
        if (reader_.ReadRange(moov_offset, header_bytes, moov) == ErrorCode::kOk) {
            Mp4Parser parser;
            status = parser.ParseBuffer(moov.data(), moov.size(), metadata_);
        }
        if (governor_) {
            governor_->Deallocate(header_bytes);
        }
        return status;
    }

    ErrorCode BuildFallbackIndex(uint64_t file_size)
    {
        uint32_t rate = metadata_.sample_rate != 0 ? metadata_.sample_rate : profile_.default_sample_rate;
        if (rate == 0) {
            LMDECODE_LOGE("No sample rate known and no default for %s", AudioFormatName(profile_.format));
            return ErrorCode::kContainerParse;
        }
        metadata_.sample_rate = rate;
        metadata_.sample_index =
            BuildEstimatedIndex(file_size, profile_.typical_frame_size, profile_.samples_per_frame, rate);
        if (metadata_.sample_index.empty()) {
            return ErrorCode::kContainerParse;
        }
        metadata_.has_precise_index = false;
        if (metadata_.codec_name.empty()) {
            metadata_.codec_name = AudioFormatName(profile_.format);
        }
        if (metadata_.duration_us == 0) {
            const SampleIndexEntry &last = metadata_.sample_index.back();
            metadata_.duration_us = last.timestamp_us + uint64_t(profile_.samples_per_frame) * 1000000ULL / rate;
        }
        if (metadata_.bitrate == 0 && metadata_.duration_us > 0) {
            metadata_.bitrate = static_cast<uint32_t>(file_size * 8 * 1000000ULL / metadata_.duration_us);
        }
        return ErrorCode::kOk;
    }

    DecodeOutcome Decode(const std::vector<uint8_t> &buffer)
    {
        stats_.decode_calls++;
        return decode_fn_(buffer.data(), buffer.size(), profile_.format_hint);
    }

    ErrorCode DecodePending(bool is_last, std::vector<AudioChunk> &out)
    {
        if (live_.empty()) {
            return ErrorCode::kOk;
        }

        DecodeOutcome live = Decode(live_);
        if (live.kind == DecodeOutcome::Kind::kFatal) {
            return SkipUndecodable(live.error);
        }
        if (live.kind == DecodeOutcome::Kind::kDecoded) {
            consecutive_failures_ = 0;
            Emit(live, 0, is_last, out);
            live_.clear();
            retained_.clear();
            last_decoded_count_ = 0;
            return ErrorCode::kOk;
        }

        if (live_.size() < profile_.decode_threshold && !is_last) {
            return ErrorCode::kOk;
        }

        // Live bytes alone are not a frame: retry with everything kept so far
        stats_.retained_retries++;
        retained_.insert(retained_.end(), live_.begin(), live_.end());
        live_.clear();

        DecodeOutcome retained = Decode(retained_);
        if (retained.kind == DecodeOutcome::Kind::kFatal) {
            return SkipUndecodable(retained.error);
        }
        if (retained.kind == DecodeOutcome::Kind::kDecoded) {
            consecutive_failures_ = 0;
            size_t total = retained.samples.size();
            if (total > last_decoded_count_) {
                Emit(retained, last_decoded_count_, is_last, out);
                last_decoded_count_ = total;
            }
            if (is_last) {
                retained_.clear();
                last_decoded_count_ = 0;
                return ErrorCode::kOk;
            }
        }
        TruncateRetained();
        return ErrorCode::kOk;
    }

    // Pending bytes are dropped until max_consecutive_failures fatal outcomes in a row.
    ErrorCode SkipUndecodable(const std::string &error)
    {
        stats_.decode_errors++;
        consecutive_failures_++;
        if (consecutive_failures_ > profile_.max_consecutive_failures) {
            LMDECODE_LOGE("Decoder failed: %s (%u in a row, %u tolerated)", error.c_str(), consecutive_failures_,
                          profile_.max_consecutive_failures);
            return ErrorCode::kDecodeFailed;
        }
        const size_t dropped = live_.size() + retained_.size();
        stats_.skipped_bytes += dropped;
        LMDECODE_LOGW("Decoder failed: %s, skipping %zu bytes (%u of %u in a row)", error.c_str(), dropped,
                      consecutive_failures_, profile_.max_consecutive_failures);
        live_.clear();
        retained_.clear();
        last_decoded_count_ = 0;
        return ErrorCode::kOk;
    }

    // Drop the oldest bytes; the samples already emitted for them are not emitted again.
    void TruncateRetained()
    {
        if (retained_.size() <= retained_cap_) {
            return;
        }
        size_t excess = retained_.size() - retained_cap_;
        retained_.erase(retained_.begin(), retained_.begin() + static_cast<std::ptrdiff_t>(excess));
        stats_.truncation_warnings++;
        LMDECODE_LOGW("Retained buffer over %zu bytes, dropped %zu oldest bytes", retained_cap_, excess);
    }

    void Emit(const DecodeOutcome &outcome, size_t from, bool is_last, std::vector<AudioChunk> &out)
    {
        if (outcome.sample_rate != 0) {
            metadata_.sample_rate = outcome.sample_rate;
        }
        if (outcome.channels != 0) {
            metadata_.channel_count = outcome.channels;
        }

        if (from >= outcome.samples.size() && !is_last) {
            return;
        }

        AudioChunk chunk;
        chunk.samples.assign(outcome.samples.begin() + static_cast<std::ptrdiff_t>(from), outcome.samples.end());
        chunk.start_sample = sample_cursor_;
        chunk.is_last = is_last;

        const uint64_t count = chunk.samples.size();
        sample_cursor_ += count;
        if (metadata_.sample_rate != 0 && metadata_.channel_count != 0) {
            uint64_t frames = (sample_cursor_ - anchor_sample_) / metadata_.channel_count;
            time_position_us_ = anchor_us_ + frames * 1000000ULL / metadata_.sample_rate;
        }
        stats_.samples_emitted += count;
        stats_.audio_chunks_emitted++;
        out.push_back(std::move(chunk));
    }

    void ResetBuffers()
    {
        live_.clear();
        live_.shrink_to_fit();
        retained_.clear();
        retained_.shrink_to_fit();
        last_decoded_count_ = 0;
    }

    // Give back whatever the buffers no longer hold.
    void SyncAccounting()
    {
        if (!governor_) {
            return;
        }
        size_t held = live_.size() + retained_.size();
        if (accounted_bytes_ > held) {
            governor_->Deallocate(accounted_bytes_ - held);
            accounted_bytes_ = held;
        }
    }

    DecoderProfile profile_;
    DecodeFunction decode_fn_;
    std::shared_ptr<MemoryGovernor> governor_;
    ChunkReader reader_;

    DecodeSessionState state_ = DecodeSessionState::kUninitialized;
    ContainerMetadata metadata_;
    DecodeStatistics stats_;

    std::vector<uint8_t> live_;
    std::vector<uint8_t> retained_;
    size_t last_decoded_count_ = 0;
    size_t accounted_bytes_ = 0;
    size_t retained_cap_ = 0;
    uint32_t consecutive_failures_ = 0;

    uint64_t expected_position_ = 0;
    uint64_t sample_cursor_ = 0;
    uint64_t time_position_us_ = 0;

    // Cursor and time at the last seek
    uint64_t anchor_sample_ = 0;
    uint64_t anchor_us_ = 0;
};

ChunkedDecoder::ChunkedDecoder(const DecoderProfile &profile, DecodeFunction decode_fn,
                               std::shared_ptr<MemoryGovernor> governor)
    : impl_(new Impl(profile, std::move(decode_fn), std::move(governor)))
{
}

ChunkedDecoder::~ChunkedDecoder() = default;

ErrorCode ChunkedDecoder::Initialize(const std::string &path, size_t chunk_size_hint, int64_t seek_position_us)
{
    return impl_->Initialize(path, chunk_size_hint, seek_position_us);
}

ErrorCode ChunkedDecoder::ProcessChunk(const FileChunk &chunk, std::vector<AudioChunk> &out)
{
    return impl_->ProcessChunk(chunk, out);
}

ErrorCode ChunkedDecoder::SeekToTime(uint64_t target_us, SeekResult &result)
{
    return impl_->SeekToTime(target_us, result);
}

ChunkSizeRecommendation ChunkedDecoder::GetOptimalChunkSize(uint64_t file_size) const
{
    return impl_->GetOptimalChunkSize(file_size);
}

std::map<std::string, std::string> ChunkedDecoder::GetMetadata() const
{
    return impl_->GetMetadata();
}

const ContainerMetadata &ChunkedDecoder::GetContainerMetadata() const
{
    return impl_->metadata_;
}

void ChunkedDecoder::Cleanup()
{
    impl_->Cleanup();
}

DecodeSessionState ChunkedDecoder::GetState() const
{
    return impl_->state_;
}

DecodeStatistics ChunkedDecoder::GetStatistics() const
{
    return impl_->stats_;
}

const DecoderProfile &ChunkedDecoder::GetProfile() const
{
    return impl_->profile_;
}

ChunkReader &ChunkedDecoder::Reader()
{
    return impl_->reader_;
}

uint64_t ChunkedDecoder::CurrentPositionUs() const
{
    return impl_->time_position_us_;
}

uint64_t ChunkedDecoder::CurrentSample() const
{
    return impl_->sample_cursor_;
}

} // namespace lmshao::lmdecode
