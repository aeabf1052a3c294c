/**
 * @file threadpool.hpp
 * @brief Fixed-size task queue and the block-partitioned parallel loop
 * built on top of it.
 */
#pragma once

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

class ThreadPool {
  public:
    explicit ThreadPool(size_t num_threads);
    /// Drains the queue, then joins every worker
    ~ThreadPool();

    ThreadPool(const ThreadPool &) = delete;
    ThreadPool &operator=(const ThreadPool &) = delete;

    void enqueue(std::function<void()> task);

  private:
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;

    std::mutex queue_mutex;
    std::condition_variable condition;
    std::atomic<bool> stop;
};

inline ThreadPool::ThreadPool(size_t num_threads) : stop(false) {
    for (size_t i = 0; i < num_threads; ++i) {
        workers.emplace_back([this] {
            while (true) {
                std::function<void()> task;
                {
                    std::unique_lock<std::mutex> lock(queue_mutex);
                    condition.wait(lock, [this] { return stop || !tasks.empty(); });
                    if (stop && tasks.empty()) return;
                    task = std::move(tasks.front());
                    tasks.pop();
                }
                task();
            }
        });
    }
}

inline ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        stop = true;
    }
    condition.notify_all();
    for (auto &worker : workers) {
        worker.join();
    }
}

inline void ThreadPool::enqueue(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        tasks.push(std::move(task));
    }
    condition.notify_one();
}

/// Number of worker threads to use when the caller did not ask for one
inline auto default_thread_count() -> size_t {
    size_t max_threads = std::thread::hardware_concurrency();
    return max_threads ? max_threads : 1;
}

/**
 * @brief Run `body(begin, end)` over contiguous blocks of [0, count).
 *
 * Every block is handed to exactly one task, so a body that only
 * writes to indices inside its own block needs no synchronisation and
 * gives the same result for any thread count. Returns once all blocks
 * are done. With a single thread the body runs on the calling thread.
 *
 * If the body throws, the remaining blocks still run and the first
 * exception is rethrown on the calling thread.
 *
 * @param count Total number of items
 * @param nthreads Number of worker threads
 * @param body Callable taking the half-open item range of one block
 * @param block_size Items per task (0 chooses one block per thread)
 */
template <typename Body>
void parallel_for_blocks(size_t count, size_t nthreads, Body &&body, size_t block_size = 0) {
    if (count == 0) return;
    nthreads = std::max<size_t>(1, std::min(nthreads, count));
    if (block_size == 0) {
        block_size = (count + nthreads - 1) / nthreads;
    }
    if (nthreads == 1) {
        body(size_t{0}, count);
        return;
    }
    std::exception_ptr error;
    std::mutex error_mutex;
    {
        ThreadPool pool(nthreads);
        for (size_t begin = 0; begin < count; begin += block_size) {
            size_t end = std::min(count, begin + block_size);
            pool.enqueue([&body, &error, &error_mutex, begin, end] {
                try {
                    body(begin, end);
                } catch (...) {
                    std::lock_guard<std::mutex> lock(error_mutex);
                    if (!error) error = std::current_exception();
                }
            });
        }
    }
    if (error) {
        std::rethrow_exception(error);
    }
}
