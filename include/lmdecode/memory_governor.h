/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMDECODE_MEMORY_GOVERNOR_H
#define LMSHAO_LMDECODE_MEMORY_GOVERNOR_H

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "lmcore/noncopyable.h"
#include "lmdecode/decode_types.h"

namespace lmshao::lmdecode {

enum class PressureLevel { kNone = 0, kHigh, kCritical };

const char *PressureLevelName(PressureLevel level);

struct MemorySnapshot {
    size_t total_budget = 0;
    size_t used = 0;
    size_t peak = 0;
    PressureLevel pressure_level = PressureLevel::kNone;

    size_t Available() const { return used < total_budget ? total_budget - used : 0; }
};

struct QualityReduction {
    bool should_reduce = false;
    double resolution_factor = 1.0;
    bool enable_streaming = false;
    std::string reason;
};

/**
 * @brief Byte budget shared by all decode sessions
 *
 * Allocations are bookkeeping only: callers report the buffers they are
 * about to grow and release them when done. Pressure is High from 80% of
 * the budget and Critical from 90%. Callbacks run on the thread that caused
 * the level change, after the internal lock is released. Notifications are
 * serialized: callbacks never see an older level after a newer one.
 */
class MemoryGovernor final : public lmcore::NonCopyable {
public:
    using PressureCallback = std::function<void(PressureLevel level, const MemorySnapshot &snapshot)>;

    static constexpr size_t kDefaultBudget = 256 * 1024 * 1024;

    explicit MemoryGovernor(size_t total_budget = kDefaultBudget);
    ~MemoryGovernor() = default;

    // kMemoryLimitExceeded, with nothing recorded, when the budget would be breached.
    ErrorCode Allocate(size_t bytes);

    // Clamped at zero.
    void Deallocate(size_t bytes);

    // Blocks until the bytes fit or timeout_ms elapses.
    ErrorCode WaitAndAllocate(size_t bytes, uint32_t timeout_ms);

    bool WouldExceedLimit(size_t bytes) const;

    MemorySnapshot GetSnapshot() const;
    PressureLevel GetPressureLevel() const;
    QualityReduction GetSuggestedQualityReduction() const;

    int RegisterPressureCallback(PressureCallback callback);
    void UnregisterPressureCallback(int id);

    static PressureLevel LevelFor(size_t used, size_t total_budget);

private:
    struct CallbackEntry {
        int id;
        PressureCallback callback;
    };

    // Caller holds mutex_. Returns true when the level changed.
    bool UpdateLevelLocked();
    void NotifyPressureChange(PressureLevel level, const MemorySnapshot &snapshot, uint64_t seq);

    mutable std::mutex mutex_;
    std::condition_variable released_;
    size_t total_budget_;
    size_t used_ = 0;
    size_t peak_ = 0;
    PressureLevel level_ = PressureLevel::kNone;
    uint64_t level_seq_ = 0; // bumped on every level change

    // Held while callbacks run; recursive so a callback may allocate
    std::recursive_mutex notify_mutex_;
    uint64_t notified_seq_ = 0;

    std::mutex callback_mutex_;
    std::vector<CallbackEntry> callbacks_;
    int next_callback_id_ = 1;
};

} // namespace lmshao::lmdecode

#endif // LMSHAO_LMDECODE_MEMORY_GOVERNOR_H
