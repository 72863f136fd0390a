/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include "decode_worker.h"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "internal_logger.h"
#include "lmdecode/chunk_reader.h"
#include "lmdecode/chunked_decoder.h"
#include "lmdecode/decoder_profile.h"
#include "lmdecode/memory_governor.h"

namespace lmshao::lmdecode {

static constexpr uint32_t kIdlePollMs = 100;
static constexpr size_t kProbeBytes = 64;

// Extension first, then magic bytes
static AudioFormat ResolveFormat(const std::string &path, AudioFormat requested)
{
    if (requested != AudioFormat::kUnknown) {
        return requested;
    }
    AudioFormat format = DetectAudioFormat(path);
    if (format != AudioFormat::kUnknown) {
        return format;
    }
    ChunkReader probe;
    if (probe.Open(path) != ErrorCode::kOk) {
        return AudioFormat::kUnknown;
    }
    std::vector<uint8_t> head;
    if (probe.ReadRange(0, kProbeBytes, head) != ErrorCode::kOk) {
        return AudioFormat::kUnknown;
    }
    return DetectAudioFormat(head.data(), head.size());
}

DecodeWorker::DecodeWorker(uint32_t id, DecodeFunction decode_fn, std::shared_ptr<MemoryGovernor> governor,
                           std::shared_ptr<MessageQueue> outbound, uint32_t memory_wait_timeout_ms)
    : id_(id), decode_fn_(std::move(decode_fn)), governor_(std::move(governor)),
      inbound_(std::make_shared<MessageQueue>()), outbound_(std::move(outbound)),
      memory_wait_timeout_ms_(memory_wait_timeout_ms)
{
}

DecodeWorker::~DecodeWorker()
{
    if (thread_.joinable()) {
        if (thread_.get_id() == std::this_thread::get_id()) {
            thread_.detach();
        } else {
            thread_.join();
        }
    }
}

bool DecodeWorker::Start()
{
    if (thread_.joinable()) {
        LMDECODE_LOGW("Worker %u already started", id_);
        return true;
    }
    auto self = shared_from_this();
    thread_ = std::thread([self]() { self->Run(); });
    LMDECODE_LOGD("Worker %u started", id_);
    return true;
}

bool DecodeWorker::Post(MessagePtr msg)
{
    return inbound_->Send(std::move(msg));
}

void DecodeWorker::Shutdown()
{
    stopping_ = true;
    if (!inbound_->Send(std::make_shared<ShutdownRequest>())) {
        LMDECODE_LOGD("Worker %u inbound already closed", id_);
    }
    inbound_->Close();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
    LMDECODE_LOGD("Worker %u stopped", id_);
}

void DecodeWorker::Abandon()
{
    stopping_ = true;
    inbound_->Close();
    if (thread_.joinable()) {
        thread_.detach();
    }
    LMDECODE_LOGW("Worker %u abandoned", id_);
}

void DecodeWorker::Run()
{
    while (!stopping_) {
        MessagePtr msg;
        if (!inbound_->Receive(msg, kIdlePollMs)) {
            if (inbound_->IsClosed()) {
                break;
            }
            continue;
        }
        switch (msg->kind) {
            case MessageKind::kProcessingRequest:
                HandleRequest(MessageAs<ProcessingRequest>(msg));
                break;
            case MessageKind::kHealthCheckRequest:
                AnswerHealthCheck(false);
                break;
            case MessageKind::kCancellationRequest:
                LMDECODE_LOGD("Worker %u idle, ignoring cancel for %s", id_, msg->request_id.c_str());
                break;
            case MessageKind::kShutdown:
                stopping_ = true;
                break;
            default:
                LMDECODE_LOGW("Worker %u got unexpected %s", id_, MessageKindName(msg->kind));
                break;
        }
    }
}

bool DecodeWorker::DrainInbound(const std::string &request_id)
{
    bool stop = false;
    MessagePtr msg;
    while (inbound_->TryReceive(msg)) {
        switch (msg->kind) {
            case MessageKind::kCancellationRequest:
                if (msg->request_id == request_id) {
                    LMDECODE_LOGI("Worker %u cancelling %s", id_, request_id.c_str());
                    stop = true;
                }
                break;
            case MessageKind::kHealthCheckRequest:
                AnswerHealthCheck(true);
                break;
            case MessageKind::kShutdown:
                stopping_ = true;
                stop = true;
                break;
            case MessageKind::kProcessingRequest:
                LMDECODE_LOGE("Worker %u busy with %s, rejecting %s", id_, request_id.c_str(),
                              msg->request_id.c_str());
                SendResponse(MakeErrorResponse(msg->request_id, ErrorCode::kInvalidState, "worker busy"));
                break;
            default:
                LMDECODE_LOGW("Worker %u got unexpected %s", id_, MessageKindName(msg->kind));
                break;
        }
    }
    return stop || inbound_->IsClosed();
}

void DecodeWorker::HandleRequest(const std::shared_ptr<ProcessingRequest> &request)
{
    const std::string &rid = request->request_id;
    LMDECODE_LOGI("Worker %u processing %s: %s", id_, rid.c_str(), request->file_path.c_str());

    AudioFormat format = ResolveFormat(request->file_path, request->config.format);
    DecoderProfile profile = DecoderProfile::ForFormat(format);
    if (request->config.max_consecutive_failures >= 0) {
        profile.max_consecutive_failures = static_cast<uint32_t>(request->config.max_consecutive_failures);
    }
    ChunkedDecoder decoder(profile, decode_fn_, governor_);
    ErrorCode rc = decoder.Initialize(request->file_path, request->config.chunk_size,
                                      request->config.seek_position_us);
    if (rc != ErrorCode::kOk) {
        SendResponse(MakeErrorResponse(rid, rc, std::string("initialize failed: ") + ErrorCodeName(rc)));
        return;
    }

    ChunkReader &reader = decoder.Reader();
    const size_t base_chunk = reader.ChunkSize();
    const size_t min_chunk = std::min(base_chunk, decoder.GetProfile().medium.min);
    const uint64_t start = reader.Position();
    const uint64_t span = reader.FileSize() - start;

    SendProgress(rid, 0.0, "Initialized", {});

    auto fail = [&](ErrorCode code, const std::string &what) {
        decoder.Cleanup();
        SendResponse(MakeErrorResponse(rid, code, what));
    };

    DecodeResult result;
    DecodeStatistics seen;
    std::vector<AudioChunk> audio;
    while (reader.HasMore()) {
        if (DrainInbound(rid)) {
            fail(ErrorCode::kCancelled, ErrorCodeName(ErrorCode::kCancelled));
            return;
        }

        size_t chunk_size = base_chunk;
        size_t reserved = 0;
        if (governor_) {
            QualityReduction q = governor_->GetSuggestedQualityReduction();
            if (q.should_reduce) {
                chunk_size = std::max(min_chunk, static_cast<size_t>(base_chunk * q.resolution_factor));
                LMDECODE_LOGD("Worker %u: %s, chunk %zu", id_, q.reason.c_str(), chunk_size);
            }
            rc = governor_->WaitAndAllocate(chunk_size, memory_wait_timeout_ms_);
            if (rc != ErrorCode::kOk) {
                fail(rc, "memory budget exhausted while waiting for a chunk");
                return;
            }
            reserved = chunk_size;
        }
        reader.SetChunkSize(chunk_size);

        FileChunk chunk;
        rc = reader.ReadNext(chunk);
        if (rc == ErrorCode::kOk) {
            rc = decoder.ProcessChunk(chunk, audio);
        }
        if (governor_) {
            governor_->Deallocate(reserved);
        }
        if (rc != ErrorCode::kOk) {
            fail(rc, std::string("decode failed: ") + ErrorCodeName(rc));
            return;
        }

        // Lost input is reported as it happens; the request goes on
        DecodeStatistics now = decoder.GetStatistics();
        if (now.truncation_warnings > seen.truncation_warnings) {
            SendError(rid, ErrorCode::kDecodeFailed,
                      "undecodable data dropped near byte " + std::to_string(chunk.start_position) + ", " +
                          std::to_string(now.truncation_warnings) + " truncations so far");
        }
        if (now.decode_errors > seen.decode_errors) {
            SendError(rid, ErrorCode::kDecodeFailed,
                      "decode error skipped at byte " + std::to_string(chunk.start_position) + ", " +
                          std::to_string(now.skipped_bytes) + " bytes skipped so far");
        }
        seen = now;

        for (const auto &a : audio) {
            result.total_samples += a.samples.size();
            if (request->config.collect_samples) {
                result.samples.insert(result.samples.end(), a.samples.begin(), a.samples.end());
            }
        }

        double progress = span > 0 ? static_cast<double>(reader.Position() - start) / span : 1.0;
        std::string status = "Decoded " + std::to_string(reader.Position() - start) + " of " + std::to_string(span) +
                             " bytes";
        if (request->stream_results) {
            SendProgress(rid, progress, status, std::move(audio));
        } else {
            SendProgress(rid, progress, status, {});
        }
        audio.clear();
    }

    const ContainerMetadata &meta = decoder.GetContainerMetadata();
    DecodeStatistics stats = decoder.GetStatistics();
    result.sample_rate = meta.sample_rate;
    result.channels = meta.channel_count;
    if (meta.sample_rate != 0 && meta.channel_count != 0) {
        result.duration_us = result.total_samples / meta.channel_count * 1000000ULL / meta.sample_rate;
    }
    result.chunks_processed = stats.chunks_processed;
    result.truncation_warnings = stats.truncation_warnings;
    result.decode_errors = stats.decode_errors;
    result.skipped_bytes = stats.skipped_bytes;
    result.has_precise_index = meta.has_precise_index;
    result.metadata = decoder.GetMetadata();
    decoder.Cleanup();

    auto response = std::make_shared<ProcessingResponse>();
    response->request_id = rid;
    response->has_result = true;
    response->result = std::move(result);
    response->is_complete = true;
    SendResponse(std::move(response));
    LMDECODE_LOGI("Worker %u finished %s", id_, rid.c_str());
}

void DecodeWorker::AnswerHealthCheck(bool busy)
{
    auto response = std::make_shared<HealthCheckResponse>();
    response->worker_id = id_;
    response->active_tasks = busy ? 1 : 0;
    response->memory_usage = governor_ ? governor_->GetSnapshot().used : 0;
    response->status_info["state"] = busy ? "busy" : "idle";
    if (!outbound_->Send(std::move(response))) {
        LMDECODE_LOGD("Worker %u: outbound closed, health answer dropped", id_);
    }
}

void DecodeWorker::SendProgress(const std::string &request_id, double progress, const std::string &status,
                                std::vector<AudioChunk> partial)
{
    auto update = std::make_shared<ProgressUpdate>();
    update->worker_id = id_;
    update->request_id = request_id;
    update->progress = std::min(1.0, std::max(0.0, progress));
    update->status_message = status;
    update->partial_data = std::move(partial);
    if (!outbound_->Send(std::move(update))) {
        LMDECODE_LOGD("Worker %u: outbound closed, progress dropped", id_);
    }
}

void DecodeWorker::SendError(const std::string &request_id, ErrorCode code, const std::string &message)
{
    LMDECODE_LOGW("Worker %u, %s: %s", id_, request_id.c_str(), message.c_str());
    auto error = std::make_shared<ErrorMessage>();
    error->worker_id = id_;
    error->request_id = request_id;
    error->error_code = code;
    error->message = message;
    if (!outbound_->Send(std::move(error))) {
        LMDECODE_LOGD("Worker %u: outbound closed, error dropped", id_);
    }
}

void DecodeWorker::SendResponse(std::shared_ptr<ProcessingResponse> response)
{
    response->worker_id = id_;
    if (!outbound_->Send(std::move(response))) {
        LMDECODE_LOGW("Worker %u: outbound closed, response dropped", id_);
    }
}

} // namespace lmshao::lmdecode
