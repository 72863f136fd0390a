/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMDECODE_WORKER_MESSAGES_H
#define LMSHAO_LMDECODE_WORKER_MESSAGES_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "lmdecode/decode_types.h"
#include "lmdecode/decoder_profile.h"

namespace lmshao::lmdecode {

// Per-request options
struct DecodeConfig {
    size_t chunk_size = 0;                   // 0: derived from the file size
    int64_t seek_position_us = -1;           // < 0: from the start
    AudioFormat format = AudioFormat::kUnknown; // kUnknown: detect from path, then magic bytes
    bool collect_samples = false;            // keep every sample in the final result
    int max_consecutive_failures = -1;       // < 0: the format profile's tolerance
};

struct DecodeResult {
    uint64_t total_samples = 0;
    uint32_t sample_rate = 0;
    uint32_t channels = 0;
    uint64_t duration_us = 0;
    uint64_t chunks_processed = 0;
    uint64_t truncation_warnings = 0;
    uint64_t decode_errors = 0;
    uint64_t skipped_bytes = 0;
    bool has_precise_index = false;
    std::vector<float> samples; // only with DecodeConfig::collect_samples
    std::map<std::string, std::string> metadata;
};

enum class MessageKind {
    kProcessingRequest = 0,
    kProgressUpdate,
    kProcessingResponse,
    kCancellationRequest,
    kHealthCheckRequest,
    kHealthCheckResponse,
    kError,
    kShutdown,
};

const char *MessageKindName(MessageKind kind);

// Random 128-bit id in 8-4-4-4-12 hex form
std::string GenerateMessageId();

// Milliseconds on the steady clock
int64_t NowMs();

struct Message {
    explicit Message(MessageKind k);
    virtual ~Message() = default;

    MessageKind kind;
    std::string id;
    int64_t timestamp_ms;
    std::string request_id;
    uint32_t worker_id = 0; // stamped by the sending worker
};

using MessagePtr = std::shared_ptr<Message>;

struct ProcessingRequest : Message {
    ProcessingRequest() : Message(MessageKind::kProcessingRequest) { request_id = id; }

    std::string file_path;
    DecodeConfig config;
    bool stream_results = false;
};

struct ProgressUpdate : Message {
    ProgressUpdate() : Message(MessageKind::kProgressUpdate) {}

    double progress = 0.0; // [0, 1]
    std::string status_message;
    std::vector<AudioChunk> partial_data;
};

struct ProcessingResponse : Message {
    ProcessingResponse() : Message(MessageKind::kProcessingResponse) {}

    bool has_result = false;
    DecodeResult result;
    ErrorCode error_code = ErrorCode::kOk;
    std::string error; // empty on success, "cancelled" when cancelled
    bool is_complete = true;

    bool IsCancelled() const { return error_code == ErrorCode::kCancelled; }
};

struct CancellationRequest : Message {
    CancellationRequest() : Message(MessageKind::kCancellationRequest) {}
};

struct HealthCheckRequest : Message {
    HealthCheckRequest() : Message(MessageKind::kHealthCheckRequest) {}
};

struct HealthCheckResponse : Message {
    HealthCheckResponse() : Message(MessageKind::kHealthCheckResponse) {}

    uint32_t active_tasks = 0;
    size_t memory_usage = 0;
    std::map<std::string, std::string> status_info;
};

// Non-terminal problem inside a running request; the request goes on.
struct ErrorMessage : Message {
    ErrorMessage() : Message(MessageKind::kError) {}

    ErrorCode error_code = ErrorCode::kOk;
    std::string message;
};

struct ShutdownRequest : Message {
    ShutdownRequest() : Message(MessageKind::kShutdown) {}
};

// Terminal response with only an error
std::shared_ptr<ProcessingResponse> MakeErrorResponse(const std::string &request_id, ErrorCode code,
                                                      const std::string &error);

template <typename T>
std::shared_ptr<T> MessageAs(const MessagePtr &msg)
{
    return std::static_pointer_cast<T>(msg);
}

} // namespace lmshao::lmdecode

#endif // LMSHAO_LMDECODE_WORKER_MESSAGES_H
