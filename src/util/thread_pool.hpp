#ifndef PRIVACYGUARD_UTIL_THREAD_POOL_HPP
#define PRIVACYGUARD_UTIL_THREAD_POOL_HPP

#include <algorithm>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool used to anonymize independent texts in parallel.
 *
 * Usage Example:
 *  @code
 *    privacyguard::util::ThreadPool pool(4);
 *    auto fut = pool.enqueue([&guard, text] { return guard.anonymize(text); });
 *    auto result = fut.get(); // rethrows whatever the task threw
 *  @endcode
 */

namespace privacyguard {
namespace util {

/**
 * @class ThreadPool
 * @brief Tasks are nullary callables; their results and exceptions travel
 *        back through the returned std::future.
 */
class ThreadPool
{
public:
    /**
     * @param threadCount Number of worker threads. Zero means hardware concurrency.
     */
    explicit ThreadPool(size_t threadCount = 0)
        : stop_(false)
    {
        if (threadCount == 0) {
            threadCount = std::max<size_t>(1, std::thread::hardware_concurrency());
        }
        workers_.reserve(threadCount);
        for (size_t i = 0; i < threadCount; ++i) {
            workers_.emplace_back([this] { workerLoop(); });
        }
    }

    /**
     * @brief Drains the queue, then joins every worker.
     */
    ~ThreadPool()
    {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            stop_ = true;
        }
        condVar_.notify_all();
        for (auto &worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    size_t size() const { return workers_.size(); }

    /**
     * @brief Queue a nullary task.
     * @throw std::runtime_error if the pool is shutting down.
     */
    template<typename F>
    auto enqueue(F&& f) -> std::future<typename std::invoke_result<F>::type>
    {
        using return_type = typename std::invoke_result<F>::type;

        auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
        std::future<return_type> res = task->get_future();
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (stop_) {
                throw std::runtime_error("ThreadPool: enqueue on stopped pool");
            }
            taskQueue_.emplace([task]() { (*task)(); });
        }
        condVar_.notify_one();
        return res;
    }

private:
    void workerLoop()
    {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queueMutex_);
                condVar_.wait(lock, [this] { return stop_ || !taskQueue_.empty(); });
                if (stop_ && taskQueue_.empty()) {
                    return;
                }
                task = std::move(taskQueue_.front());
                taskQueue_.pop();
            }
            task();
        }
    }

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> taskQueue_;
    std::mutex queueMutex_;
    std::condition_variable condVar_;
    bool stop_;
};

} // namespace util
} // namespace privacyguard

#endif // PRIVACYGUARD_UTIL_THREAD_POOL_HPP
