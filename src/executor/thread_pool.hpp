/**
 * @file thread_pool.hpp
 * @brief std::jthread-based worker pool for fitness evaluation.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <concepts>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace mic_scheduler {

/**
 * @brief Thread pool using std::jthread for automatic join and stop_token support.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = 0);
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Submit a callable for execution.
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    /**
     * @brief Run @p body(i) for every i in [0, count) and wait for all of them.
     *
     * Indices are split into contiguous chunks, one per worker. The first
     * exception thrown by any chunk is rethrown after every chunk finished.
     */
    template <std::invocable<size_t> F>
    void parallel_for(size_t count, F&& body);

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;

private:
    void worker_loop(std::stop_token stop);

    std::vector<std::jthread> workers_;
    std::queue<std::function<void()>> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::atomic<size_t> active_tasks_{0};
};

// ── Template implementations ─────────────────

template <std::invocable F>
std::future<std::invoke_result_t<F>> ThreadPool::submit(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    {
        std::lock_guard lock(queue_mutex_);
        task_queue_.push([p = std::move(promise), f = std::forward<F>(func)]() mutable {
            try {
                if constexpr (std::is_void_v<ReturnType>) {
                    f();
                    p->set_value();
                } else {
                    p->set_value(f());
                }
            } catch (...) {
                p->set_exception(std::current_exception());
            }
        });
    }
    queue_cv_.notify_one();
    return future;
}

template <std::invocable<size_t> F>
void ThreadPool::parallel_for(size_t count, F&& body) {
    if (count == 0) return;

    const auto chunks = std::min(count, std::max<size_t>(thread_count(), 1));
    const auto chunk_size = (count + chunks - 1) / chunks;

    std::vector<std::future<void>> pending;
    pending.reserve(chunks);
    for (size_t begin = 0; begin < count; begin += chunk_size) {
        auto end = std::min(count, begin + chunk_size);
        pending.push_back(submit([&body, begin, end] {
            for (auto i = begin; i < end; ++i) body(i);
        }));
    }

    std::exception_ptr first_error;
    for (auto& f : pending) {
        try {
            f.get();
        } catch (...) {
            if (!first_error) first_error = std::current_exception();
        }
    }
    if (first_error) std::rethrow_exception(first_error);
}

}  // namespace mic_scheduler
