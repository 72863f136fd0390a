/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include <stdint.h>

#include <condition_variable>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "lmdecode/lmdecode_logger.h"
#include "lmdecode/memory_governor.h"
#include "lmdecode/worker_pool.h"

using namespace lmshao::lmdecode;

// Raw 16-bit little-endian PCM stands in for a real codec
static uint32_t g_rate = 44100;
static uint32_t g_channels = 2;

static DecodeOutcome DecodeRawPcm(const uint8_t *data, size_t size, const std::string &)
{
    const size_t frame_bytes = 2 * g_channels;
    size_t usable = size - size % frame_bytes;
    if (usable == 0 || usable != size) {
        return DecodeOutcome::NeedMoreData();
    }
    std::vector<float> samples(usable / 2);
    for (size_t i = 0; i < samples.size(); ++i) {
        int16_t v = static_cast<int16_t>(data[2 * i] | (data[2 * i + 1] << 8));
        samples[i] = static_cast<float>(v) / 32768.0f;
    }
    return DecodeOutcome::Decoded(std::move(samples), g_rate, g_channels);
}

int main(int argc, char **argv)
{
    if (argc < 2) {
        std::fprintf(stderr, "Usage: %s <input> [--chunk=BYTES] [--rate=HZ] [--channels=N] [--budget-mb=N]\n",
                     argv[0]);
        return 1;
    }

    InitLmdecodeLogger(lmshao::lmcore::LogLevel::kInfo);

    std::string input_path = argv[1];
    DecodeConfig config;
    WorkerPoolOptions options;
    options.pool_size = 1;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--chunk=", 0) == 0) {
            config.chunk_size = std::strtoul(arg.c_str() + 8, nullptr, 10);
        } else if (arg.rfind("--rate=", 0) == 0) {
            g_rate = static_cast<uint32_t>(std::strtoul(arg.c_str() + 7, nullptr, 10));
        } else if (arg.rfind("--channels=", 0) == 0) {
            g_channels = static_cast<uint32_t>(std::strtoul(arg.c_str() + 11, nullptr, 10));
        } else if (arg.rfind("--budget-mb=", 0) == 0) {
            options.memory_budget = std::strtoul(arg.c_str() + 12, nullptr, 10) * 1024 * 1024;
        }
    }
    if (g_rate == 0 || g_channels == 0) {
        std::fprintf(stderr, "Rate and channel count must be positive\n");
        return 1;
    }

    struct DemoListener : public IWorkerPoolListener {
        std::mutex mutex;
        std::condition_variable done_cond;
        bool done = false;
        int exit_code = 0;

        void OnProgress(const ProgressUpdate &update) override
        {
            size_t samples = 0;
            for (const auto &chunk : update.partial_data) {
                samples += chunk.samples.size();
            }
            printf("[%5.1f%%] %s, %zu samples\n", update.progress * 100.0, update.status_message.c_str(), samples);
        }
        void OnResponse(const ProcessingResponse &response) override
        {
            if (response.has_result) {
                const DecodeResult &r = response.result;
                printf("Done: %llu samples, %u Hz, %u ch, %.3f s, %llu chunks, %llu truncations, %llu decode errors\n",
                       (unsigned long long)r.total_samples, r.sample_rate, r.channels, r.duration_us / 1e6,
                       (unsigned long long)r.chunks_processed, (unsigned long long)r.truncation_warnings,
                       (unsigned long long)r.decode_errors);
            } else {
                std::fprintf(stderr, "Failed: %s (%s)\n", response.error.c_str(), ErrorCodeName(response.error_code));
            }
            std::lock_guard<std::mutex> lock(mutex);
            exit_code = response.has_result ? 0 : 2;
            done = true;
            done_cond.notify_all();
        }
        void OnError(const ErrorMessage &error) override
        {
            std::fprintf(stderr, "Error(%s): %s\n", ErrorCodeName(error.error_code), error.message.c_str());
        }
    };
    auto listener = std::make_shared<DemoListener>();

    WorkerPool pool(options, DecodeRawPcm);
    pool.SetListener(listener);
    int callback_id = pool.GetMemoryGovernor()->RegisterPressureCallback(
        [](PressureLevel level, const MemorySnapshot &snapshot) {
            printf("Memory pressure %s: %zu of %zu bytes\n", PressureLevelName(level), snapshot.used,
                   snapshot.total_budget);
        });

    if (!pool.Start()) {
        std::fprintf(stderr, "Worker pool failed to start\n");
        return 1;
    }

    std::string request_id;
    ErrorCode rc = pool.Submit(input_path, config, true, request_id);
    if (rc != ErrorCode::kOk) {
        std::fprintf(stderr, "Submit failed: %s\n", ErrorCodeName(rc));
        pool.Stop();
        return 1;
    }
    printf("Submitted %s as %s\n", input_path.c_str(), request_id.c_str());

    int exit_code = 0;
    {
        std::unique_lock<std::mutex> lock(listener->mutex);
        listener->done_cond.wait(lock, [&]() { return listener->done; });
        exit_code = listener->exit_code;
    }

    PoolStatistics stats = pool.GetStatistics();
    printf("Pool: %llu completed, %llu failed, avg %.1f ms, peak memory %zu bytes\n",
           (unsigned long long)stats.completed, (unsigned long long)stats.failed, stats.average_processing_ms,
           pool.GetMemoryGovernor()->GetSnapshot().peak);

    pool.GetMemoryGovernor()->UnregisterPressureCallback(callback_id);
    pool.Stop();
    return exit_code;
}
