/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMDECODE_WORKER_POOL_H
#define LMSHAO_LMDECODE_WORKER_POOL_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "lmcore/noncopyable.h"
#include "lmdecode/decode_types.h"
#include "lmdecode/worker_listeners.h"
#include "lmdecode/worker_messages.h"

namespace lmshao::lmdecode {

class MemoryGovernor;

struct WorkerPoolOptions {
    size_t pool_size = 4;
    size_t max_concurrent_operations = 16; // queued requests beyond busy workers
    size_t min_workers = 1;                // kept alive when idle
    uint32_t idle_timeout_ms = 30000;
    uint32_t health_check_interval_ms = 1000;
    uint32_t unresponsive_timeout_ms = 10000;
    uint32_t max_task_retries = 1;
    uint32_t memory_wait_timeout_ms = 5000;
    size_t memory_budget = 256 * 1024 * 1024; // used when no governor is shared in
};

struct PoolStatistics {
    size_t workers = 0;
    size_t busy = 0;
    size_t queued = 0;
    uint64_t completed = 0;
    uint64_t failed = 0;
    uint64_t cancelled = 0;
    uint64_t replaced = 0;
    uint64_t recycled = 0;
    double average_processing_ms = 0.0;
};

/**
 * @brief Background decode workers
 *
 * Each worker thread runs one decode session at a time and talks to the
 * pool only through message channels. A dispatcher thread owned by the
 * pool forwards worker output to the listener, assigns queued requests,
 * runs health checks and recycles idle workers.
 */
class WorkerPool final : public lmcore::NonCopyable {
public:
    WorkerPool(const WorkerPoolOptions &options, DecodeFunction decode_fn,
               std::shared_ptr<MemoryGovernor> governor = nullptr);
    ~WorkerPool();

    void SetListener(const std::shared_ptr<IWorkerPoolListener> &listener);

    bool Start();
    // Cancels queued and running requests and joins the workers. Also safe from a listener callback.
    void Stop();
    bool IsRunning() const;

    // kCapacityExceeded when all workers are busy and the queue is full.
    ErrorCode Submit(const std::string &file_path, const DecodeConfig &config, bool stream_results,
                     std::string &request_id);

    // kInvalidArgument when the request is unknown or already finished.
    ErrorCode Cancel(const std::string &request_id);

    PoolStatistics GetStatistics() const;
    std::shared_ptr<MemoryGovernor> GetMemoryGovernor() const;

private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace lmshao::lmdecode

#endif // LMSHAO_LMDECODE_WORKER_POOL_H
