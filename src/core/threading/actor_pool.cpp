/**
 * @file actor_pool.cpp
 * @brief Keyed serial-lane worker pool implementation
 */

#include "tessera/core/threading/actor_pool.h"
#include "tessera/core/logging.h"
#include "tessera/telemetry/telemetry.h"
#include <exception>

namespace tessera::core {

// ============================================================================
// ActorPool Implementation
// ============================================================================

ActorPool::ActorPool(SizeT num_lanes)
{
    if (num_lanes == 0) {
        num_lanes = std::thread::hardware_concurrency();
        if (num_lanes == 0) {
            num_lanes = 4;  // Fallback
        }
    }

    lanes_.reserve(num_lanes);
    for (SizeT i = 0; i < num_lanes; ++i) {
        lanes_.push_back(std::make_unique<Lane>());
    }

    workers_.reserve(num_lanes);
    for (SizeT i = 0; i < num_lanes; ++i) {
        workers_.emplace_back(&ActorPool::worker_thread, this, i);
    }
}

ActorPool::~ActorPool()
{
    shutdown();
}

SizeT ActorPool::lane_for(const std::string& key) const
{
    return std::hash<std::string>{}(key) % lanes_.size();
}

bool ActorPool::post(const std::string& key, std::function<void()> task)
{
    return enqueue(lane_for(key), std::move(task));
}

bool ActorPool::enqueue(SizeT lane, Task task)
{
    if (stop_.load(std::memory_order_acquire)) {
        return false;
    }

    Lane& target = *lanes_[lane];
    {
        std::lock_guard<std::mutex> lock(target.mutex);
        target.queue.push_back(std::move(task));
        outstanding_.fetch_add(1, std::memory_order_relaxed);
    }
    target.cv.notify_one();
    return true;
}

SizeT ActorPool::pending(SizeT lane) const
{
    if (lane >= lanes_.size()) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(lanes_[lane]->mutex);
    return lanes_[lane]->queue.size();
}

void ActorPool::wait_all()
{
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait(lock, [this]() {
        return outstanding_.load(std::memory_order_acquire) == 0;
    });
}

void ActorPool::shutdown()
{
    if (stop_.exchange(true, std::memory_order_acq_rel)) {
        return;  // Already stopped
    }

    for (auto& lane : lanes_) {
        std::lock_guard<std::mutex> lock(lane->mutex);
        lane->cv.notify_all();
    }

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void ActorPool::worker_thread(SizeT id)
{
    Lane& lane = *lanes_[id];

    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(lane.mutex);
            lane.cv.wait(lock, [this, &lane]() {
                return stop_.load(std::memory_order_acquire) || !lane.queue.empty();
            });

            // Queued tasks are drained before the worker exits
            if (lane.queue.empty()) {
                return;
            }
            task = std::move(lane.queue.front());
            lane.queue.pop_front();
        }

        run_task(task);

        if (outstanding_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
            std::lock_guard<std::mutex> lock(wait_mutex_);
            wait_cv_.notify_all();
        }
    }
}

void ActorPool::run_task(Task& task)
{
    try {
        task();
    } catch (const std::exception& e) {
        failed_tasks_.fetch_add(1, std::memory_order_relaxed);
        telemetry::record_error("actor_task");
        logging::get_logger("tessera.actor")->error("Task failed on actor lane: {}", e.what());
    }
}

} // namespace tessera::core
