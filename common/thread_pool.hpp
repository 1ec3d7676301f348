#ifndef THREAD_POOL_HPP
#define THREAD_POOL_HPP

#include <condition_variable>
#include <functional>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

/*
 * Fixed set of workers pulling tasks from one queue. enqueue() hands back a
 * future; an exception thrown by the task is rethrown by future::get().
 * Workers finish the queued tasks before the destructor joins them.
 */
class ThreadPool
{
    private:
        std::vector<std::thread> pool;
        std::list<std::function<void()>> tasks;
        std::mutex queue_mutex;
        std::condition_variable queue_cv;
        bool stop = false;

    public:
        explicit ThreadPool(const unsigned int num_threads);
        ~ThreadPool();
        ThreadPool(const ThreadPool &) = delete;
        ThreadPool &operator=(const ThreadPool &) = delete;

        template <class F>
        auto enqueue(F &&f) -> std::future<decltype(f())>;
        void stop_all();
        size_t size() const { return pool.size(); }
};

inline ThreadPool::ThreadPool(const unsigned int num_threads)
{
    if (num_threads == 0)
        throw std::invalid_argument("ThreadPool needs at least one thread");
    for (unsigned int i = 0; i < num_threads; i++) {
        this->pool.emplace_back([this] {
            while (true) {
                std::function<void()> task;
                {
                    std::unique_lock<std::mutex> lock(this->queue_mutex);
                    this->queue_cv.wait(lock, [this] {
                        return (!this->tasks.empty() || this->stop);
                    });
                    if (this->stop && this->tasks.empty())
                        return;
                    task = std::move(this->tasks.front());
                    this->tasks.pop_front();
                }
                task();
            }
        });
    }
}

inline ThreadPool::~ThreadPool()
{
    this->stop_all();
}

template <class F>
auto ThreadPool::enqueue(F &&f) -> std::future<decltype(f())>
{
    typedef decltype(f()) Result;
    auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(f));
    std::future<Result> result = task->get_future();
    {
        std::unique_lock<std::mutex> lock(this->queue_mutex);
        if (this->stop)
            throw std::runtime_error("enqueue on stopped ThreadPool");
        this->tasks.emplace_back([task] { (*task)(); });
    }
    this->queue_cv.notify_one();
    return result;
}

inline void ThreadPool::stop_all()
{
    {
        std::unique_lock<std::mutex> lock(this->queue_mutex);
        if (this->stop)
            return;
        this->stop = true;
    }
    this->queue_cv.notify_all();
    for (std::thread &worker : this->pool) {
        worker.join();
    }
}

#endif
