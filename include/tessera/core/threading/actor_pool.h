#pragma once
/**
 * @file actor_pool.h
 * @brief Keyed worker pool giving each whiteboard a single processing actor
 *
 * Every key (whiteboard id, or a named channel such as the audit writer) is
 * hashed to one fixed lane. A lane is a FIFO queue drained by exactly one
 * worker thread, so tasks for the same key run one at a time and in
 * submission order, while different keys proceed in parallel.
 */

#include "tessera/core/types.h"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace tessera::core {

// ============================================================================
// Actor Pool
// ============================================================================

/**
 * @brief Fixed set of serial lanes backed by worker threads
 *
 * Features:
 * - Per-key ordering (single writer per whiteboard)
 * - Futures for request/response tasks
 * - Fire-and-forget posting for cold-path work (audit, analytics)
 * - Graceful shutdown that drains queued tasks
 */
class ActorPool {
public:
    /**
     * @brief Construct the pool
     * @param num_lanes Number of lanes/worker threads (0 = hardware concurrency)
     */
    explicit ActorPool(SizeT num_lanes = 0);

    /**
     * @brief Destructor - drains queued tasks and joins workers
     */
    ~ActorPool();

    ActorPool(const ActorPool&) = delete;
    ActorPool& operator=(const ActorPool&) = delete;

    /**
     * @brief Run a callable on the key's lane and get a future for its result
     *
     * Exceptions thrown by the callable are delivered through the future.
     * After shutdown the returned future holds a std::runtime_error.
     */
    template <typename F>
    auto submit(const std::string& key, F&& f) -> std::future<std::invoke_result_t<F>> {
        using ReturnType = std::invoke_result_t<F>;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(f));
        std::future<ReturnType> result = task->get_future();

        if (!enqueue(lane_for(key), [task]() { (*task)(); })) {
            std::promise<ReturnType> rejected;
            rejected.set_exception(std::make_exception_ptr(
                std::runtime_error("actor pool is shut down")));
            return rejected.get_future();
        }
        return result;
    }

    /**
     * @brief Queue a fire-and-forget task on the key's lane
     *
     * Exceptions escaping the task are logged and counted, never propagated.
     * @return false when the pool is shut down and the task was dropped
     */
    bool post(const std::string& key, std::function<void()> task);

    /**
     * @brief Lane index for a key
     */
    SizeT lane_for(const std::string& key) const;

    /**
     * @brief Number of lanes
     */
    SizeT num_lanes() const { return lanes_.size(); }

    /**
     * @brief Tasks queued (not yet started) on a lane
     */
    SizeT pending(SizeT lane) const;

    /**
     * @brief Number of posted tasks that ended with an exception
     */
    UInt64 failed_tasks() const { return failed_tasks_.load(std::memory_order_relaxed); }

    /**
     * @brief Block until every queued task has finished
     */
    void wait_all();

    /**
     * @brief Stop accepting tasks, drain queues and join workers
     */
    void shutdown();

    bool is_shutdown() const { return stop_.load(std::memory_order_acquire); }

private:
    using Task = std::function<void()>;

    struct Lane {
        std::deque<Task> queue;
        mutable std::mutex mutex;
        std::condition_variable cv;
    };

    bool enqueue(SizeT lane, Task task);
    void worker_thread(SizeT id);
    void run_task(Task& task);

    std::vector<std::unique_ptr<Lane>> lanes_;
    std::vector<std::thread> workers_;
    std::atomic<bool> stop_{false};
    std::atomic<SizeT> outstanding_{0};
    std::atomic<UInt64> failed_tasks_{0};

    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
};

} // namespace tessera::core
