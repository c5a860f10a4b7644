#ifndef ARBOR_THREAD_POOL_HPP
#define ARBOR_THREAD_POOL_HPP

#include "common.hpp"
#include "logger.hpp"

// Fixed set of worker threads draining one bounded task queue
class ThreadPool
{
private:
    // tasks waiting beyond this are refused instead of queued
    static constexpr size_t MAX_QUEUED_TASKS = 65536;

    std::deque<std::function<void()>> tasks;
    std::mutex taskMutex;
    std::condition_variable_any condition;
    std::atomic<bool> stop_flag{false};
    std::atomic<size_t> active_threads{0};
    std::vector<std::jthread> workers;

    void worker_thread(std::stop_token st, size_t id);

public:
    explicit ThreadPool(size_t numThreads);
    ~ThreadPool();

    // throws std::runtime_error when stopped or full
    template <typename F, typename... Args>
    auto enqueue(F &&f, Args &&...args)
        -> std::future<typename std::invoke_result_t<F, Args...>>;

    // finish queued tasks, then join the workers
    void stop();

    [[nodiscard]] size_t size() const noexcept { return workers.size(); }
    [[nodiscard]] size_t active() const noexcept { return active_threads.load(); }

    ThreadPool(const ThreadPool &) = delete;
    ThreadPool &operator=(const ThreadPool &) = delete;
};

#include "thread_pool.inl"

#endif // ARBOR_THREAD_POOL_HPP
