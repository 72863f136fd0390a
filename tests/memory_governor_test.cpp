/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include <atomic>
#include <cassert>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "lmdecode/memory_governor.h"

using namespace lmshao::lmdecode;

static constexpr size_t kKiB = 1024;

int main()
{
    // Scenario D: 1MB budget walks through high, critical and back to none
    {
        MemoryGovernor governor(1024 * kKiB);
        std::vector<PressureLevel> seen;
        governor.RegisterPressureCallback([&seen](PressureLevel level, const MemorySnapshot &) { seen.push_back(level); });

        assert(governor.Allocate(850 * kKiB) == ErrorCode::kOk);
        assert(governor.GetPressureLevel() == PressureLevel::kHigh);
        assert(governor.Allocate(100 * kKiB) == ErrorCode::kOk);
        assert(governor.GetPressureLevel() == PressureLevel::kCritical);
        governor.Deallocate(300 * kKiB);
        assert(governor.GetPressureLevel() == PressureLevel::kNone);

        assert(seen.size() == 3);
        assert(seen[0] == PressureLevel::kHigh);
        assert(seen[1] == PressureLevel::kCritical);
        assert(seen[2] == PressureLevel::kNone);

        MemorySnapshot snap = governor.GetSnapshot();
        assert(snap.used == 650 * kKiB);
        assert(snap.peak == 950 * kKiB);
        assert(snap.Available() == 374 * kKiB);
    }

    // Test the 80% and 90% edges are inclusive
    {
        assert(MemoryGovernor::LevelFor(79, 100) == PressureLevel::kNone);
        assert(MemoryGovernor::LevelFor(80, 100) == PressureLevel::kHigh);
        assert(MemoryGovernor::LevelFor(89, 100) == PressureLevel::kHigh);
        assert(MemoryGovernor::LevelFor(90, 100) == PressureLevel::kCritical);
        assert(MemoryGovernor::LevelFor(100, 100) == PressureLevel::kCritical);
        assert(MemoryGovernor::LevelFor(0, 0) == PressureLevel::kNone);
    }

    // Test rejection leaves nothing behind and deallocation clamps at zero
    {
        MemoryGovernor governor(1000);
        assert(governor.Allocate(600) == ErrorCode::kOk);
        assert(governor.WouldExceedLimit(401));
        assert(!governor.WouldExceedLimit(400));
        assert(governor.Allocate(401) == ErrorCode::kMemoryLimitExceeded);
        assert(governor.GetSnapshot().used == 600);
        assert(governor.Allocate(400) == ErrorCode::kOk);
        assert(governor.GetSnapshot().used == 1000);

        governor.Deallocate(5000);
        assert(governor.GetSnapshot().used == 0);
        assert(governor.GetSnapshot().peak == 1000);
        assert(governor.GetPressureLevel() == PressureLevel::kNone);
    }

    // Test callbacks fire on transitions only and may throw
    {
        MemoryGovernor governor(100);
        int calls = 0;
        int throwing = governor.RegisterPressureCallback(
            [](PressureLevel, const MemorySnapshot &) { throw std::runtime_error("listener bug"); });
        int counting = governor.RegisterPressureCallback([&calls](PressureLevel, const MemorySnapshot &) { ++calls; });

        assert(governor.Allocate(10) == ErrorCode::kOk);
        assert(calls == 0);
        assert(governor.Allocate(75) == ErrorCode::kOk);
        assert(calls == 1);
        assert(governor.Allocate(1) == ErrorCode::kOk);
        assert(calls == 1);

        governor.UnregisterPressureCallback(throwing);
        governor.UnregisterPressureCallback(counting);
        governor.Deallocate(86);
        assert(calls == 1);
    }

    // Test quality reduction per level
    {
        MemoryGovernor governor(100);
        QualityReduction q = governor.GetSuggestedQualityReduction();
        assert(!q.should_reduce && q.resolution_factor == 1.0 && !q.enable_streaming);

        assert(governor.Allocate(85) == ErrorCode::kOk);
        q = governor.GetSuggestedQualityReduction();
        assert(q.should_reduce && q.resolution_factor == 0.5 && !q.enable_streaming);

        assert(governor.Allocate(10) == ErrorCode::kOk);
        q = governor.GetSuggestedQualityReduction();
        assert(q.should_reduce && q.resolution_factor == 0.25 && q.enable_streaming);
        assert(!q.reason.empty());
    }

    // Test waiting for budget times out, or succeeds once another thread releases
    {
        MemoryGovernor governor(1000);
        assert(governor.Allocate(900) == ErrorCode::kOk);
        assert(governor.WaitAndAllocate(2000, 10) == ErrorCode::kMemoryLimitExceeded);

        auto begin = std::chrono::steady_clock::now();
        assert(governor.WaitAndAllocate(500, 30) == ErrorCode::kMemoryLimitExceeded);
        assert(std::chrono::steady_clock::now() - begin >= std::chrono::milliseconds(25));
        assert(governor.GetSnapshot().used == 900);

        std::thread releaser([&governor]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(30));
            governor.Deallocate(600);
        });
        assert(governor.WaitAndAllocate(500, 5000) == ErrorCode::kOk);
        releaser.join();
        assert(governor.GetSnapshot().used == 800);
    }

    // Test concurrent allocations never exceed the budget
    {
        MemoryGovernor governor(64 * kKiB);
        std::atomic<int> granted{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&governor, &granted]() {
                for (int i = 0; i < 200; ++i) {
                    if (governor.Allocate(1024) == ErrorCode::kOk) {
                        granted++;
                        assert(governor.GetSnapshot().used <= 64 * kKiB);
                        governor.Deallocate(1024);
                    }
                }
            });
        }
        for (auto &t : threads) {
            t.join();
        }
        assert(granted.load() == 800);
        assert(governor.GetSnapshot().used == 0);
    }

    // Test concurrent transitions are delivered in order: the last one seen is the current level
    {
        MemoryGovernor governor(1000);
        std::mutex seen_mutex;
        PressureLevel last_seen = PressureLevel::kNone;
        int deliveries = 0;
        governor.RegisterPressureCallback([&](PressureLevel level, const MemorySnapshot &snapshot) {
            assert(snapshot.pressure_level == level);
            std::lock_guard<std::mutex> lock(seen_mutex);
            last_seen = level;
            deliveries++;
        });

        // 300 + 300 + 250 + 100 walks across both thresholds
        const size_t sizes[] = {300, 300, 250, 100};
        std::vector<std::thread> threads;
        for (size_t bytes : sizes) {
            threads.emplace_back([&governor, bytes]() {
                for (int i = 0; i < 2000; ++i) {
                    if (governor.Allocate(bytes) == ErrorCode::kOk) {
                        governor.Deallocate(bytes);
                    }
                }
            });
        }
        for (auto &t : threads) {
            t.join();
        }
        assert(governor.GetSnapshot().used == 0);
        assert(governor.GetPressureLevel() == PressureLevel::kNone);
        {
            std::lock_guard<std::mutex> lock(seen_mutex);
            assert(last_seen == PressureLevel::kNone);
        }

        // A final transition that lands after the racing ones
        assert(governor.Allocate(850) == ErrorCode::kOk);
        std::lock_guard<std::mutex> lock(seen_mutex);
        assert(deliveries > 0);
        assert(last_seen == PressureLevel::kHigh);
        assert(governor.GetPressureLevel() == PressureLevel::kHigh);
    }

    return 0;
}
