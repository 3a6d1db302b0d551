#include "ccdfit/ThreadPool.hpp"

namespace ccdfit {

ThreadPool::ThreadPool(unsigned nthreads)
{
    if (nthreads == 0) nthreads = 1;
    workers_.reserve(nthreads);
    for (unsigned i = 0; i < nthreads; ++i) {
        workers_.emplace_back([this] {
            for (;;) {
                std::function<void()> task;
                {
                    std::unique_lock lk(mtx_);
                    cv_.wait(lk, [this] { return stop_ || !tasks_.empty(); });
                    if (stop_ && tasks_.empty()) return;
                    task = std::move(tasks_.front());
                    tasks_.pop();
                }
                task();
            }
        });
    }
}

// Drains the queue, then joins (jthread joins on destruction).
ThreadPool::~ThreadPool()
{
    {
        std::lock_guard lk(mtx_);
        stop_ = true;
    }
    cv_.notify_all();
    workers_.clear();
}

} // namespace ccdfit
