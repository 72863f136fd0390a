/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include "lmdecode/memory_governor.h"

#include <algorithm>
#include <chrono>
#include <exception>

#include "internal_logger.h"

namespace lmshao::lmdecode {

const char *PressureLevelName(PressureLevel level)
{
    switch (level) {
        case PressureLevel::kNone:
            return "none";
        case PressureLevel::kHigh:
            return "high";
        case PressureLevel::kCritical:
            return "critical";
    }
    return "unknown";
}

MemoryGovernor::MemoryGovernor(size_t total_budget) : total_budget_(total_budget)
{
    LMDECODE_LOGD("Memory budget: %zu bytes", total_budget_);
}

PressureLevel MemoryGovernor::LevelFor(size_t used, size_t total_budget)
{
    if (total_budget == 0) {
        return used > 0 ? PressureLevel::kCritical : PressureLevel::kNone;
    }
    // Integer compare so the 80%/90% edges are exact
    const uint64_t u = used;
    const uint64_t b = total_budget;
    if (u * 10 >= b * 9) {
        return PressureLevel::kCritical;
    }
    if (u * 5 >= b * 4) {
        return PressureLevel::kHigh;
    }
    return PressureLevel::kNone;
}

bool MemoryGovernor::UpdateLevelLocked()
{
    peak_ = std::max(peak_, used_);
    PressureLevel level = LevelFor(used_, total_budget_);
    if (level == level_) {
        return false;
    }
    LMDECODE_LOGI("Memory pressure %s -> %s (%zu/%zu bytes)", PressureLevelName(level_), PressureLevelName(level),
                  used_, total_budget_);
    level_ = level;
    level_seq_++;
    return true;
}

ErrorCode MemoryGovernor::Allocate(size_t bytes)
{
    MemorySnapshot snapshot;
    bool changed = false;
    uint64_t seq = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (bytes > total_budget_ - std::min(used_, total_budget_)) {
            LMDECODE_LOGW("Allocation of %zu bytes rejected (%zu/%zu used)", bytes, used_, total_budget_);
            return ErrorCode::kMemoryLimitExceeded;
        }
        used_ += bytes;
        changed = UpdateLevelLocked();
        snapshot = {total_budget_, used_, peak_, level_};
        seq = level_seq_;
    }
    if (changed) {
        NotifyPressureChange(snapshot.pressure_level, snapshot, seq);
    }
    return ErrorCode::kOk;
}

void MemoryGovernor::Deallocate(size_t bytes)
{
    MemorySnapshot snapshot;
    bool changed = false;
    uint64_t seq = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (bytes > used_) {
            LMDECODE_LOGW("Deallocating %zu bytes with only %zu in use", bytes, used_);
            used_ = 0;
        } else {
            used_ -= bytes;
        }
        changed = UpdateLevelLocked();
        snapshot = {total_budget_, used_, peak_, level_};
        seq = level_seq_;
    }
    released_.notify_all();
    if (changed) {
        NotifyPressureChange(snapshot.pressure_level, snapshot, seq);
    }
}

ErrorCode MemoryGovernor::WaitAndAllocate(size_t bytes, uint32_t timeout_ms)
{
    MemorySnapshot snapshot;
    bool changed = false;
    uint64_t seq = 0;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (bytes > total_budget_) {
            LMDECODE_LOGE("Request of %zu bytes exceeds the whole budget %zu", bytes, total_budget_);
            return ErrorCode::kMemoryLimitExceeded;
        }
        auto fits = [this, bytes]() { return used_ <= total_budget_ && bytes <= total_budget_ - used_; };
        if (!released_.wait_for(lock, std::chrono::milliseconds(timeout_ms), fits)) {
            LMDECODE_LOGW("Timed out after %u ms waiting for %zu bytes", timeout_ms, bytes);
            return ErrorCode::kMemoryLimitExceeded;
        }
        used_ += bytes;
        changed = UpdateLevelLocked();
        snapshot = {total_budget_, used_, peak_, level_};
        seq = level_seq_;
    }
    if (changed) {
        NotifyPressureChange(snapshot.pressure_level, snapshot, seq);
    }
    return ErrorCode::kOk;
}

bool MemoryGovernor::WouldExceedLimit(size_t bytes) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return used_ > total_budget_ || bytes > total_budget_ - used_;
}

MemorySnapshot MemoryGovernor::GetSnapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return {total_budget_, used_, peak_, level_};
}

PressureLevel MemoryGovernor::GetPressureLevel() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

QualityReduction MemoryGovernor::GetSuggestedQualityReduction() const
{
    QualityReduction q;
    switch (GetPressureLevel()) {
        case PressureLevel::kNone:
            q.reason = "Memory usage within budget";
            break;
        case PressureLevel::kHigh:
            q.should_reduce = true;
            q.resolution_factor = 0.5;
            q.reason = "High memory pressure: halving chunk resolution";
            break;
        case PressureLevel::kCritical:
            q.should_reduce = true;
            q.resolution_factor = 0.25;
            q.enable_streaming = true;
            q.reason = "Critical memory pressure: quarter resolution, streaming forced";
            break;
    }
    return q;
}

int MemoryGovernor::RegisterPressureCallback(PressureCallback callback)
{
    std::lock_guard<std::mutex> lock(callback_mutex_);
    int id = next_callback_id_++;
    callbacks_.push_back({id, std::move(callback)});
    return id;
}

void MemoryGovernor::UnregisterPressureCallback(int id)
{
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callbacks_.erase(std::remove_if(callbacks_.begin(), callbacks_.end(),
                                    [id](const CallbackEntry &e) { return e.id == id; }),
                     callbacks_.end());
}

void MemoryGovernor::NotifyPressureChange(PressureLevel level, const MemorySnapshot &snapshot, uint64_t seq)
{
    // Transitions go out one at a time in the order they happened; one overtaken by a later one is dropped
    std::lock_guard<std::recursive_mutex> order(notify_mutex_);
    if (seq <= notified_seq_) {
        LMDECODE_LOGD("Pressure change %llu to %s superseded", (unsigned long long)seq, PressureLevelName(level));
        return;
    }
    notified_seq_ = seq;

    std::vector<CallbackEntry> callbacks;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callbacks = callbacks_;
    }
    for (const auto &entry : callbacks) {
        if (notified_seq_ != seq) {
            // A callback changed the level again on this thread
            break;
        }
        if (!entry.callback) {
            continue;
        }
        try {
            entry.callback(level, snapshot);
        } catch (const std::exception &e) {
            LMDECODE_LOGE("Pressure callback %d threw: %s", entry.id, e.what());
        } catch (...) {
            LMDECODE_LOGE("Pressure callback %d threw a non-standard exception", entry.id);
        }
    }
}

} // namespace lmshao::lmdecode
