/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include "lmdecode/worker_messages.h"

#include <chrono>
#include <cstdio>
#include <random>

namespace lmshao::lmdecode {

const char *MessageKindName(MessageKind kind)
{
    switch (kind) {
        case MessageKind::kProcessingRequest:
            return "ProcessingRequest";
        case MessageKind::kProgressUpdate:
            return "ProgressUpdate";
        case MessageKind::kProcessingResponse:
            return "ProcessingResponse";
        case MessageKind::kCancellationRequest:
            return "CancellationRequest";
        case MessageKind::kHealthCheckRequest:
            return "HealthCheckRequest";
        case MessageKind::kHealthCheckResponse:
            return "HealthCheckResponse";
        case MessageKind::kError:
            return "ErrorMessage";
        case MessageKind::kShutdown:
            return "Shutdown";
    }
    return "Unknown";
}

std::string GenerateMessageId()
{
    thread_local std::mt19937_64 rng(std::random_device{}());
    uint64_t hi = rng();
    uint64_t lo = rng();

    char buf[40];
    snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx", static_cast<unsigned>(hi >> 32),
             static_cast<unsigned>((hi >> 16) & 0xFFFF), static_cast<unsigned>(hi & 0xFFFF),
             static_cast<unsigned>(lo >> 48), static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}

int64_t NowMs()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

Message::Message(MessageKind k) : kind(k), id(GenerateMessageId()), timestamp_ms(NowMs()) {}

std::shared_ptr<ProcessingResponse> MakeErrorResponse(const std::string &request_id, ErrorCode code,
                                                      const std::string &error)
{
    auto response = std::make_shared<ProcessingResponse>();
    response->request_id = request_id;
    response->error_code = code;
    response->error = error;
    response->is_complete = true;
    return response;
}

} // namespace lmshao::lmdecode
