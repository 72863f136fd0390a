/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include "lmdecode/worker_pool.h"

#include <algorithm>
#include <atomic>
#include <deque>
#include <map>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include "decode_worker.h"
#include "internal_logger.h"
#include "lmdecode/memory_governor.h"

namespace lmshao::lmdecode {

static constexpr uint32_t kDispatchTickMs = 20;

struct WorkerSlot {
    std::shared_ptr<DecodeWorker> worker;
    bool busy = false;
    std::shared_ptr<ProcessingRequest> request;
    bool streamed = false; // partial results of request already delivered
    int64_t task_started_ms = 0;
    int64_t idle_since_ms = 0;
    int64_t last_seen_ms = 0;
};

class WorkerPool::Impl : public std::enable_shared_from_this<WorkerPool::Impl> {
public:
    Impl(const WorkerPoolOptions &options, DecodeFunction decode_fn, std::shared_ptr<MemoryGovernor> governor)
        : options_(options), decode_fn_(std::move(decode_fn)), governor_(std::move(governor))
    {
        if (options_.pool_size == 0) {
            options_.pool_size = 1;
        }
        options_.min_workers = std::min(options_.min_workers, options_.pool_size);
        if (options_.health_check_interval_ms >= options_.unresponsive_timeout_ms) {
            LMDECODE_LOGW("Health check interval %u ms not below unresponsive timeout %u ms",
                          options_.health_check_interval_ms, options_.unresponsive_timeout_ms);
        }
        if (!governor_) {
            governor_ = std::make_shared<MemoryGovernor>(options_.memory_budget);
        }
    }

    ~Impl() { Stop(); }

    void SetListener(const std::shared_ptr<IWorkerPoolListener> &listener)
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener_ = listener;
    }

    bool Start()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            LMDECODE_LOGW("Worker pool already running");
            return true;
        }
        if (!decode_fn_) {
            LMDECODE_LOGE("Worker pool needs a decode function");
            return false;
        }
        outbound_ = std::make_shared<MessageQueue>();
        running_ = true;
        dispatcher_stop_ = false;
        last_health_check_ms_ = NowMs();
        for (size_t i = 0; i < options_.min_workers; ++i) {
            SpawnWorkerLocked();
        }
        auto self = shared_from_this();
        dispatcher_ = std::thread([self]() { self->DispatchLoop(); });
        LMDECODE_LOGI("Worker pool started: size %zu, min %zu, queue %zu", options_.pool_size, options_.min_workers,
                      options_.max_concurrent_operations);
        return true;
    }

    void Stop()
    {
        std::vector<std::shared_ptr<DecodeWorker>> workers;
        std::vector<std::shared_ptr<ProcessingResponse>> dropped;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_) {
                return;
            }
            running_ = false;
            for (auto &req : queue_) {
                dropped.push_back(MakeErrorResponse(req->request_id, ErrorCode::kCancelled, "cancelled"));
                stats_.cancelled++;
            }
            queue_.clear();
            for (auto &kv : workers_) {
                workers.push_back(kv.second.worker);
            }
        }
        for (auto &r : dropped) {
            DeliverResponse(*r);
        }

        // Running tasks stop at their next chunk boundary and answer "cancelled"
        for (auto &w : workers) {
            w->Shutdown();
        }

        dispatcher_stop_ = true;
        if (dispatcher_.joinable()) {
            // From a listener callback the dispatcher exits once the callback returns
            if (dispatcher_.get_id() == std::this_thread::get_id()) {
                dispatcher_.detach();
            } else {
                dispatcher_.join();
            }
        }
        outbound_->Close();

        std::lock_guard<std::mutex> lock(mutex_);
        workers_.clear();
        retries_.clear();
        LMDECODE_LOGI("Worker pool stopped: %llu completed, %llu failed, %llu cancelled",
                      (unsigned long long)stats_.completed, (unsigned long long)stats_.failed,
                      (unsigned long long)stats_.cancelled);
    }

    bool IsRunning() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return running_;
    }

    ErrorCode Submit(const std::string &file_path, const DecodeConfig &config, bool stream_results,
                     std::string &request_id)
    {
        auto request = std::make_shared<ProcessingRequest>();
        request->file_path = file_path;
        request->config = config;
        request->stream_results = stream_results;

        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            LMDECODE_LOGE("Submit on a stopped pool");
            return ErrorCode::kInvalidState;
        }
        if (!HasIdleWorkerLocked() && workers_.size() >= options_.pool_size &&
            queue_.size() >= options_.max_concurrent_operations) {
            LMDECODE_LOGW("Pool at capacity: %zu busy, %zu queued", workers_.size(), queue_.size());
            return ErrorCode::kCapacityExceeded;
        }
        request_id = request->request_id;
        queue_.push_back(request);
        LMDECODE_LOGD("Queued %s: %s", request_id.c_str(), file_path.c_str());
        AssignLocked();
        return ErrorCode::kOk;
    }

    ErrorCode Cancel(const std::string &request_id)
    {
        std::shared_ptr<ProcessingResponse> response;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = std::find_if(queue_.begin(), queue_.end(),
                                   [&](const std::shared_ptr<ProcessingRequest> &r) { return r->request_id == request_id; });
            if (it != queue_.end()) {
                queue_.erase(it);
                retries_.erase(request_id);
                stats_.cancelled++;
                response = MakeErrorResponse(request_id, ErrorCode::kCancelled, "cancelled");
            } else {
                WorkerSlot *slot = FindSlotLocked(request_id);
                if (slot == nullptr) {
                    LMDECODE_LOGW("Cancel for unknown request %s", request_id.c_str());
                    return ErrorCode::kInvalidArgument;
                }
                auto cancel = std::make_shared<CancellationRequest>();
                cancel->request_id = request_id;
                if (!slot->worker->Post(cancel)) {
                    LMDECODE_LOGE("Worker %u not accepting messages", slot->worker->Id());
                    return ErrorCode::kInvalidState;
                }
                LMDECODE_LOGD("Cancellation sent to worker %u for %s", slot->worker->Id(), request_id.c_str());
                return ErrorCode::kOk;
            }
        }
        DeliverResponse(*response);
        return ErrorCode::kOk;
    }

    PoolStatistics GetStatistics() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        PoolStatistics s = stats_;
        s.workers = workers_.size();
        s.busy = 0;
        for (const auto &kv : workers_) {
            s.busy += kv.second.busy ? 1 : 0;
        }
        s.queued = queue_.size();
        uint64_t finished = stats_.completed + stats_.failed;
        s.average_processing_ms = finished > 0 ? static_cast<double>(total_processing_ms_) / finished : 0.0;
        return s;
    }

    std::shared_ptr<MemoryGovernor> GetMemoryGovernor() const { return governor_; }

private:
    void DispatchLoop()
    {
        while (true) {
            MessagePtr msg;
            if (outbound_->Receive(msg, kDispatchTickMs)) {
                HandleWorkerMessage(msg);
                continue;
            }
            if (dispatcher_stop_) {
                break;
            }
            RunMaintenance();
        }
    }

    void HandleWorkerMessage(const MessagePtr &msg)
    {
        std::shared_ptr<ProcessingResponse> response;
        std::shared_ptr<ProgressUpdate> progress;
        std::shared_ptr<ErrorMessage> error;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = workers_.find(msg->worker_id);
            if (it == workers_.end()) {
                // Abandoned or recycled; its request has been re-queued or answered already
                LMDECODE_LOGD("Dropping %s from retired worker %u", MessageKindName(msg->kind), msg->worker_id);
                return;
            } else {
                WorkerSlot &slot = it->second;
                slot.last_seen_ms = NowMs();
                switch (msg->kind) {
                    case MessageKind::kProgressUpdate:
                        if (slot.busy && slot.request && slot.request->request_id == msg->request_id) {
                            progress = MessageAs<ProgressUpdate>(msg);
                            slot.streamed = slot.streamed || !progress->partial_data.empty();
                        }
                        break;
                    case MessageKind::kProcessingResponse:
                        response = MessageAs<ProcessingResponse>(msg);
                        if (slot.busy && slot.request && slot.request->request_id == msg->request_id) {
                            CountResponseLocked(*response, slot.last_seen_ms - slot.task_started_ms);
                            retries_.erase(msg->request_id);
                            slot.busy = false;
                            slot.request.reset();
                            slot.idle_since_ms = slot.last_seen_ms;
                            AssignLocked();
                        } else {
                            LMDECODE_LOGW("Unexpected response %s from worker %u", msg->request_id.c_str(),
                                          msg->worker_id);
                            response.reset();
                        }
                        break;
                    case MessageKind::kHealthCheckResponse:
                        break;
                    case MessageKind::kError:
                        if (slot.busy && slot.request && slot.request->request_id == msg->request_id) {
                            error = MessageAs<ErrorMessage>(msg);
                        }
                        break;
                    default:
                        LMDECODE_LOGW("Unexpected %s from worker %u", MessageKindName(msg->kind), msg->worker_id);
                        break;
                }
            }
        }

        if (progress) {
            auto listener = GetListener();
            if (listener) {
                listener->OnProgress(*progress);
            }
        }
        if (response) {
            DeliverResponse(*response);
        }
        if (error) {
            auto listener = GetListener();
            if (listener) {
                listener->OnError(*error);
            }
        }
    }

    void RunMaintenance()
    {
        std::vector<std::shared_ptr<DecodeWorker>> recycled;
        std::vector<std::shared_ptr<ProcessingResponse>> failed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_) {
                return;
            }
            const int64_t now = NowMs();
            if (now - last_health_check_ms_ >= options_.health_check_interval_ms) {
                last_health_check_ms_ = now;
                for (auto &kv : workers_) {
                    if (!kv.second.worker->Post(std::make_shared<HealthCheckRequest>())) {
                        LMDECODE_LOGW("Worker %u rejected health check", kv.first);
                    }
                }
            }

            // Unresponsive: silent past the timeout
            std::vector<uint32_t> unhealthy;
            for (auto &kv : workers_) {
                if (now - kv.second.last_seen_ms > options_.unresponsive_timeout_ms) {
                    unhealthy.push_back(kv.first);
                }
            }
            for (uint32_t id : unhealthy) {
                auto response = ReplaceWorkerLocked(id);
                if (response) {
                    failed.push_back(response);
                }
            }

            // Idle beyond the timeout, above the floor
            for (auto it = workers_.begin(); it != workers_.end() && workers_.size() > options_.min_workers;) {
                WorkerSlot &slot = it->second;
                if (!slot.busy && now - slot.idle_since_ms > options_.idle_timeout_ms) {
                    LMDECODE_LOGD("Recycling idle worker %u", it->first);
                    recycled.push_back(slot.worker);
                    stats_.recycled++;
                    it = workers_.erase(it);
                } else {
                    ++it;
                }
            }

            while (workers_.size() < options_.min_workers) {
                SpawnWorkerLocked();
            }
            AssignLocked();
        }

        for (auto &w : recycled) {
            w->Shutdown();
        }
        for (auto &r : failed) {
            DeliverResponse(*r);
        }
    }

    // Abandons the worker and re-queues its task. Returns a terminal response once retries are used up,
    // or at once when partial results were streamed: a rerun would deliver them again.
    std::shared_ptr<ProcessingResponse> ReplaceWorkerLocked(uint32_t id)
    {
        auto it = workers_.find(id);
        if (it == workers_.end()) {
            return nullptr;
        }
        WorkerSlot slot = it->second;
        workers_.erase(it);
        stats_.replaced++;
        LMDECODE_LOGW("Worker %u unresponsive for %lld ms, replacing", id,
                      (long long)(NowMs() - slot.last_seen_ms));
        slot.worker->Abandon();

        if (!slot.busy || !slot.request) {
            return nullptr;
        }
        const std::string &rid = slot.request->request_id;
        uint32_t attempts = ++retries_[rid];
        if (slot.streamed) {
            retries_.erase(rid);
            stats_.failed++;
            return MakeErrorResponse(rid, ErrorCode::kWorkerUnresponsive,
                                     "worker unresponsive after streaming partial results");
        }
        if (attempts <= options_.max_task_retries) {
            LMDECODE_LOGI("Retrying %s (attempt %u of %u)", rid.c_str(), attempts, options_.max_task_retries);
            queue_.push_front(slot.request);
            return nullptr;
        }
        retries_.erase(rid);
        stats_.failed++;
        return MakeErrorResponse(rid, ErrorCode::kWorkerUnresponsive,
                                 std::string("worker unresponsive after ") + std::to_string(attempts) + " attempts");
    }

    void AssignLocked()
    {
        while (!queue_.empty()) {
            WorkerSlot *slot = LeastRecentlyUsedIdleLocked();
            if (slot == nullptr) {
                if (workers_.size() >= options_.pool_size) {
                    return;
                }
                slot = SpawnWorkerLocked();
                if (slot == nullptr) {
                    return;
                }
            }
            std::shared_ptr<ProcessingRequest> request = queue_.front();
            queue_.pop_front();
            if (!slot->worker->Post(request)) {
                LMDECODE_LOGE("Worker %u refused %s", slot->worker->Id(), request->request_id.c_str());
                queue_.push_front(request);
                return;
            }
            const int64_t now = NowMs();
            slot->busy = true;
            slot->request = request;
            slot->streamed = false;
            slot->task_started_ms = now;
            slot->last_seen_ms = now;
            LMDECODE_LOGD("Assigned %s to worker %u", request->request_id.c_str(), slot->worker->Id());
        }
    }

    WorkerSlot *SpawnWorkerLocked()
    {
        uint32_t id = next_worker_id_++;
        auto worker = std::make_shared<DecodeWorker>(id, decode_fn_, governor_, outbound_,
                                                     options_.memory_wait_timeout_ms);
        if (!worker->Start()) {
            LMDECODE_LOGE("Failed to start worker %u", id);
            return nullptr;
        }
        const int64_t now = NowMs();
        WorkerSlot &slot = workers_[id];
        slot.worker = worker;
        slot.idle_since_ms = now;
        slot.last_seen_ms = now;
        return &slot;
    }

    bool HasIdleWorkerLocked() const
    {
        for (const auto &kv : workers_) {
            if (!kv.second.busy) {
                return true;
            }
        }
        return false;
    }

    WorkerSlot *LeastRecentlyUsedIdleLocked()
    {
        WorkerSlot *best = nullptr;
        for (auto &kv : workers_) {
            WorkerSlot &slot = kv.second;
            if (!slot.busy && (best == nullptr || slot.idle_since_ms < best->idle_since_ms)) {
                best = &slot;
            }
        }
        return best;
    }

    WorkerSlot *FindSlotLocked(const std::string &request_id)
    {
        for (auto &kv : workers_) {
            if (kv.second.busy && kv.second.request && kv.second.request->request_id == request_id) {
                return &kv.second;
            }
        }
        return nullptr;
    }

    void CountResponseLocked(const ProcessingResponse &response, int64_t elapsed_ms)
    {
        if (response.IsCancelled()) {
            stats_.cancelled++;
            return;
        }
        if (response.error_code == ErrorCode::kOk) {
            stats_.completed++;
        } else {
            stats_.failed++;
        }
        total_processing_ms_ += static_cast<uint64_t>(std::max<int64_t>(0, elapsed_ms));
    }

    std::shared_ptr<IWorkerPoolListener> GetListener()
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        return listener_;
    }

    void DeliverResponse(const ProcessingResponse &response)
    {
        if (response.error_code != ErrorCode::kOk) {
            LMDECODE_LOGI("Request %s ended: %s", response.request_id.c_str(), response.error.c_str());
        }
        auto listener = GetListener();
        if (listener) {
            listener->OnResponse(response);
        }
    }

    WorkerPoolOptions options_;
    DecodeFunction decode_fn_;
    std::shared_ptr<MemoryGovernor> governor_;

    mutable std::mutex mutex_;
    bool running_ = false;
    std::map<uint32_t, WorkerSlot> workers_;
    std::deque<std::shared_ptr<ProcessingRequest>> queue_;
    std::map<std::string, uint32_t> retries_;
    uint32_t next_worker_id_ = 1;
    int64_t last_health_check_ms_ = 0;
    PoolStatistics stats_;
    uint64_t total_processing_ms_ = 0;

    std::shared_ptr<MessageQueue> outbound_;
    std::thread dispatcher_;
    std::atomic<bool> dispatcher_stop_{false};

    std::mutex listener_mutex_;
    std::shared_ptr<IWorkerPoolListener> listener_;
};

WorkerPool::WorkerPool(const WorkerPoolOptions &options, DecodeFunction decode_fn,
                       std::shared_ptr<MemoryGovernor> governor)
    : impl_(std::make_shared<Impl>(options, std::move(decode_fn), std::move(governor)))
{
}

// The dispatcher shares the Impl, so this may run on it from inside a listener callback
WorkerPool::~WorkerPool()
{
    impl_->Stop();
}

void WorkerPool::SetListener(const std::shared_ptr<IWorkerPoolListener> &listener)
{
    impl_->SetListener(listener);
}

bool WorkerPool::Start()
{
    return impl_->Start();
}

void WorkerPool::Stop()
{
    impl_->Stop();
}

bool WorkerPool::IsRunning() const
{
    return impl_->IsRunning();
}

ErrorCode WorkerPool::Submit(const std::string &file_path, const DecodeConfig &config, bool stream_results,
                             std::string &request_id)
{
    return impl_->Submit(file_path, config, stream_results, request_id);
}

ErrorCode WorkerPool::Cancel(const std::string &request_id)
{
    return impl_->Cancel(request_id);
}

PoolStatistics WorkerPool::GetStatistics() const
{
    return impl_->GetStatistics();
}

std::shared_ptr<MemoryGovernor> WorkerPool::GetMemoryGovernor() const
{
    return impl_->GetMemoryGovernor();
}

} // namespace lmshao::lmdecode
