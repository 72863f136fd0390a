/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMDECODE_MESSAGE_CHANNEL_H
#define LMSHAO_LMDECODE_MESSAGE_CHANNEL_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <utility>

#include "lmcore/noncopyable.h"

namespace lmshao::lmdecode {

/**
 * @brief Multi-producer FIFO between threads
 *
 * The only path by which a worker and the pool exchange data. Once closed,
 * Send fails and Receive drains what is left before reporting closure.
 */
template <typename T>
class MessageChannel final : public lmcore::NonCopyable {
public:
    // capacity 0 = unbounded
    explicit MessageChannel(size_t capacity = 0) : capacity_(capacity) {}

    bool Send(T item)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || (capacity_ > 0 && queue_.size() >= capacity_)) {
                return false;
            }
            queue_.push_back(std::move(item));
        }
        ready_.notify_one();
        return true;
    }

    // Waits up to timeout_ms; false on timeout or when closed and empty.
    bool Receive(T &item, uint32_t timeout_ms)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!ready_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                             [this]() { return closed_ || !queue_.empty(); })) {
            return false;
        }
        if (queue_.empty()) {
            return false;
        }
        item = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    bool TryReceive(T &item)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return false;
        }
        item = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    void Close()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        ready_.notify_all();
    }

    bool IsClosed() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t Size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<T> queue_;
    size_t capacity_;
    bool closed_ = false;
};

} // namespace lmshao::lmdecode

#endif // LMSHAO_LMDECODE_MESSAGE_CHANNEL_H
