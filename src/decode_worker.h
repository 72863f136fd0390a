/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMDECODE_DECODE_WORKER_H
#define LMSHAO_LMDECODE_DECODE_WORKER_H

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "lmcore/noncopyable.h"
#include "lmdecode/decode_types.h"
#include "lmdecode/message_channel.h"
#include "lmdecode/worker_messages.h"

namespace lmshao::lmdecode {

class MemoryGovernor;

using MessageQueue = MessageChannel<MessagePtr>;

/**
 * @brief One worker thread of the pool
 *
 * The thread keeps the worker alive through a shared_ptr, so an abandoned
 * worker can be detached and forgotten while it finishes a stuck decode.
 * Everything it produces goes to the shared outbound queue tagged with its id.
 */
class DecodeWorker final : public lmcore::NonCopyable, public std::enable_shared_from_this<DecodeWorker> {
public:
    DecodeWorker(uint32_t id, DecodeFunction decode_fn, std::shared_ptr<MemoryGovernor> governor,
                 std::shared_ptr<MessageQueue> outbound, uint32_t memory_wait_timeout_ms);
    ~DecodeWorker();

    bool Start();

    // False once the worker has been shut down or abandoned.
    bool Post(MessagePtr msg);

    // Asks the thread to exit and waits for it.
    void Shutdown();

    // Stops listening and lets the thread run out on its own.
    void Abandon();

    uint32_t Id() const { return id_; }

private:
    void Run();
    void HandleRequest(const std::shared_ptr<ProcessingRequest> &request);

    // Handles control messages queued between chunks. True when the task must stop.
    bool DrainInbound(const std::string &request_id);

    void AnswerHealthCheck(bool busy);
    void SendProgress(const std::string &request_id, double progress, const std::string &status,
                      std::vector<AudioChunk> partial);
    void SendError(const std::string &request_id, ErrorCode code, const std::string &message);
    void SendResponse(std::shared_ptr<ProcessingResponse> response);

    uint32_t id_;
    DecodeFunction decode_fn_;
    std::shared_ptr<MemoryGovernor> governor_;
    std::shared_ptr<MessageQueue> inbound_;
    std::shared_ptr<MessageQueue> outbound_;
    uint32_t memory_wait_timeout_ms_;

    std::thread thread_;
    std::atomic<bool> stopping_{false};
};

} // namespace lmshao::lmdecode

#endif // LMSHAO_LMDECODE_DECODE_WORKER_H
