#include "thread_pool.hpp"

ThreadPool::ThreadPool(size_t numThreads)
{
    if (numThreads == 0)
    {
        throw std::invalid_argument("thread pool needs at least one thread");
    }

    workers.reserve(numThreads);
    for (size_t i = 0; i < numThreads; i++)
    {
        workers.emplace_back([this, i](std::stop_token st)
                             { worker_thread(st, i); });
    }

    const unsigned num_cores = std::thread::hardware_concurrency();
    Logger::getInstance()->success(
        "Thread pool initialized with " + std::to_string(numThreads) +
        " threads" +
        (num_cores > 0 ? " across " + std::to_string(num_cores) + " CPU cores"
                       : " (CPU core count unknown)"));
}

ThreadPool::~ThreadPool()
{
    stop();
}

void ThreadPool::worker_thread(std::stop_token st, size_t id)
{
    pthread_setname_np(pthread_self(), ("worker-" + std::to_string(id)).c_str());

    for (;;)
    {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(taskMutex);
            condition.wait(lock, st, [this]
                           { return !tasks.empty(); });

            // stop requested and nothing left to run
            if (tasks.empty())
            {
                return;
            }
            task = std::move(tasks.front());
            tasks.pop_front();
        }

        active_threads.fetch_add(1, std::memory_order_relaxed);
        // packaged_task stores exceptions in its future
        task();
        active_threads.fetch_sub(1, std::memory_order_relaxed);
    }
}

void ThreadPool::stop()
{
    {
        std::lock_guard<std::mutex> lock(taskMutex);
        if (stop_flag.exchange(true))
        {
            return;
        }
    }

    for (auto &worker : workers)
    {
        worker.request_stop();
    }
    condition.notify_all();

    for (auto &worker : workers)
    {
        if (worker.joinable())
        {
            worker.join();
        }
    }
}
