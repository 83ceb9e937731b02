#include "thread_pool.hpp"

namespace seedwise {

// Jobs mostly wait on the network, so there may be more of them than cores.
static int default_concurrency()
{
    const int n = 2 * std::thread::hardware_concurrency();
    return n > 0 ? n : 2;
}

thread_pool::thread_pool() : thread_pool(default_concurrency()) {}

thread_pool::thread_pool(int concurrency)
    : concurrency_(concurrency > 0 ? concurrency : default_concurrency())
{}

thread_pool::~thread_pool()
{
    join();
}

void thread_pool::set_concurrency(const int n)
{
    if(n > 0) { concurrency_ = n; }
}

void thread_pool::post(job_type job)
{
    {
        std::lock_guard<std::mutex> l(mutex_);
        jobs_.emplace_back(std::move(job));
        // only the owner thread touches workers_, so this may run under the lock
        if(needs_new_worker()) { workers_.emplace_back([this] { work(); }); }
    }
    has_work_.notify_one();
}

void thread_pool::clear_pending_jobs()
{
    std::lock_guard<std::mutex> l(mutex_);
    jobs_.clear();
}

void thread_pool::join()
{
    {
        std::lock_guard<std::mutex> l(mutex_);
        is_joining_ = true;
    }
    has_work_.notify_all();
    for(auto& w : workers_) { if(w.joinable()) { w.join(); } }
    workers_.clear();

    std::lock_guard<std::mutex> l(mutex_);
    is_joining_ = false;
}

bool thread_pool::needs_new_worker() const noexcept
{
    return int(jobs_.size()) > num_idle_workers_ && num_threads() < concurrency_;
}

void thread_pool::work()
{
    std::unique_lock<std::mutex> l(mutex_);
    while(true)
    {
        ++num_idle_workers_;
        has_work_.wait(l, [this] { return is_joining_ || !jobs_.empty(); });
        --num_idle_workers_;

        // when joining, queued jobs are still executed before exiting
        if(jobs_.empty()) { break; }

        job_type job = std::move(jobs_.front());
        jobs_.pop_front();
        l.unlock();

        job();
        ++num_executed_jobs_;

        l.lock();
    }
}

} // namespace seedwise
