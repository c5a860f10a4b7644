#ifndef ARBOR_THREAD_POOL_INL
#define ARBOR_THREAD_POOL_INL

#ifdef ARBOR_THREAD_POOL_HPP

template <typename F, typename... Args>
auto ThreadPool::enqueue(F &&f, Args &&...args)
    -> std::future<typename std::invoke_result_t<F, Args...>>
{
    using return_type = typename std::invoke_result_t<F, Args...>;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        [f = std::forward<F>(f), ... args = std::forward<Args>(args)]() mutable
        {
            return f(std::forward<Args>(args)...);
        });

    std::future<return_type> res = task->get_future();

    {
        std::lock_guard<std::mutex> lock(taskMutex);
        if (stop_flag)
        {
            throw std::runtime_error("cannot enqueue on stopped thread pool");
        }
        if (tasks.size() >= MAX_QUEUED_TASKS)
        {
            throw std::runtime_error("thread pool queue is full");
        }
        tasks.emplace_back([task]()
                           { (*task)(); });
    }

    condition.notify_one();
    return res;
}

#endif // ARBOR_THREAD_POOL_HPP
#endif // ARBOR_THREAD_POOL_INL
