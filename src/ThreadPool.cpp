#include "xrfcal/ThreadPool.hpp"
#include <algorithm>

namespace xrfcal {

ThreadPool::ThreadPool(unsigned nthreads)
{
    if (nthreads == 0) nthreads = std::max(1u, std::thread::hardware_concurrency());

    workers_.reserve(nthreads);
    for (unsigned i = 0; i < nthreads; ++i) {
        workers_.emplace_back([this] {
            for (;;) {
                std::function<void()> job;
                {
                    std::unique_lock lk(mtx_);
                    cv_.wait(lk, [this] { return stop_ || !tasks_.empty(); });
                    if (stop_ && tasks_.empty()) return;
                    job = std::move(tasks_.front());
                    tasks_.pop();
                }
                job();
            }
        });
    }
}

ThreadPool::~ThreadPool()
{
    {
        std::lock_guard lk(mtx_);
        stop_ = true;
    }
    cv_.notify_all();
    for (auto& w : workers_)
        if (w.joinable()) w.join();
}

} // namespace xrfcal
