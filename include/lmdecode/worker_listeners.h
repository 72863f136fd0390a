/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMDECODE_WORKER_LISTENERS_H
#define LMSHAO_LMDECODE_WORKER_LISTENERS_H

#include <string>

#include "lmdecode/worker_messages.h"

namespace lmshao::lmdecode {

// Receives pool output. Called on the pool's dispatcher thread, never concurrently.
// A callback may stop or destroy the pool.
class IWorkerPoolListener {
public:
    virtual ~IWorkerPoolListener() = default;

    // Progress of a running request, with decoded chunks when streaming
    virtual void OnProgress(const ProgressUpdate &update) = 0;

    // Exactly one terminal response per accepted request
    virtual void OnResponse(const ProcessingResponse &response) = 0;

    // Input lost inside a running request (truncated or skipped bytes); the request goes on
    virtual void OnError(const ErrorMessage &error) = 0;
};

} // namespace lmshao::lmdecode

#endif // LMSHAO_LMDECODE_WORKER_LISTENERS_H
