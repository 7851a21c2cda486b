// src/core/ThreadPool.hpp
//
// Fixed-size thread pool used by the **ChatteringOptimizationEngine** to
// evaluate swarm candidates and to run independent per-controller tuning
// campaigns concurrently.
//
// Key features:
// • **Fixed thread count**, defaulting to `std::thread::hardware_concurrency()`
// • **Single FIFO task queue** guarded by a mutex, workers woken through a
//   `std::condition_variable`
// • **Futures for every task**: exceptions thrown by a task (e.g. a simulation
//   divergence) are stored in its future and rethrown by `get()`
// • **RAII lifecycle**: the destructor finishes queued work and joins workers
//
// One closed-loop simulation per task dominates the cost, so a central queue
// with coarse tasks keeps contention negligible.
#ifndef THREAD_POOL_HPP
#define THREAD_POOL_HPP
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

/**
 * @brief Fixed-size thread pool for independent fitness evaluations.
 *
 * @note Non-copyable; intended to live for a whole optimisation run so that
 * threads are created once, not per iteration.
 */
class ThreadPool {
public:
    /**
     * @brief Starts the worker threads.
     *
     * @param threads Number of workers; zero is raised to one.
     */
    explicit ThreadPool(size_t threads = std::thread::hardware_concurrency());
    /**
     * @brief Drains the queue, then joins all workers.
     */
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Enqueues a callable task for asynchronous execution.
     *
     * @tparam F Callable type (function, lambda, functor).
     * @tparam R Return type of the callable (deduced).
     * @return std::future<R> Result or exception of the task.
     */
    template<class F, class R = std::invoke_result_t<std::decay_t<F>>>
    std::future<R> enqueue(F&& f);

    /// Number of worker threads.
    size_t thread_count() const { return workers.size(); }

private:
    std::vector<std::thread> workers;          ///< Worker threads.
    std::queue<std::function<void()>> tasks;   ///< Pending tasks (FIFO).
    std::mutex mtx;                            ///< Guards tasks and stop.
    std::condition_variable cv;                ///< Signals new work or shutdown.
    bool stop = false;
};

inline ThreadPool::ThreadPool(size_t threads) {
    if (threads == 0) threads = 1;
    workers.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers.emplace_back([this] {
            while (true) {
                std::function<void()> task;
                {
                    std::unique_lock<std::mutex> lock(mtx);
                    cv.wait(lock, [this] { return stop || !tasks.empty(); });
                    if (stop && tasks.empty()) return;
                    task = std::move(tasks.front());
                    tasks.pop();
                }
                // packaged_task captures exceptions in the future; task() does not throw.
                task();
            }
        });
    }
}

inline ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        stop = true;
    }
    cv.notify_all();
    for (auto& w : workers) w.join();
}

template<class F, class R>
inline std::future<R> ThreadPool::enqueue(F&& f) {
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
    std::future<R> future = task->get_future();
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (stop) throw std::runtime_error("ThreadPool: enqueue on stopped pool");
        tasks.emplace([task]() { (*task)(); });
    }
    cv.notify_one();
    return future;
}

#endif // THREAD_POOL_HPP
