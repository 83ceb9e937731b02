#ifndef SEEDWISE_THREAD_POOL_HEADER
#define SEEDWISE_THREAD_POOL_HEADER

#include "time.hpp"

#include <condition_variable>
#include <functional>
#include <thread>
#include <atomic>
#include <vector>
#include <deque>
#include <mutex>

namespace seedwise {

/**
 * Runs blocking jobs (tracker queries) off the caller's thread.
 *
 * Workers are started on demand: posting a job when there are more queued jobs than
 * idle workers starts a new one, as long as there are fewer than `concurrency()` of
 * them. Workers are only
 * torn down by `join`.
 *
 * All member functions must be called from the same (the owner's) thread.
 */
class thread_pool
{
public:
    // A job that throws takes the program down with it.
    using job_type = std::function<void()>;

private:
    // Owned and touched by the owner's thread only.
    std::vector<std::thread> workers_;
    int concurrency_;

    // Guards jobs_, is_joining_ and num_idle_workers_.
    mutable std::mutex mutex_;
    std::condition_variable has_work_;
    std::deque<job_type> jobs_;
    // While set, workers drain jobs_ and then exit instead of waiting.
    bool is_joining_ = false;
    // Workers blocked on has_work_. A notified worker counts as idle until it
    // reacquires the lock, so a posted job is never left to a busy one.
    int num_idle_workers_ = 0;

    std::atomic<int> num_executed_jobs_{0};

public:

    /** Uses a concurrency derived from the number of hardware threads. */
    thread_pool();
    explicit thread_pool(int concurrency);

    /** Joins, so queued jobs still run. */
    ~thread_pool();

    thread_pool(const thread_pool&) = delete;
    thread_pool& operator=(const thread_pool&) = delete;

    int concurrency() const noexcept { return concurrency_; }
    int num_threads() const noexcept { return workers_.size(); }
    int num_executed_jobs() const noexcept { return num_executed_jobs_.load(); }

    int num_pending_jobs() const
    {
        std::lock_guard<std::mutex> l(mutex_);
        return jobs_.size();
    }

    /** Values below 1 are ignored. A lowered limit only applies to new workers. */
    void set_concurrency(const int n);

    void post(job_type job);

    /** Drops queued jobs. Jobs already being executed are not affected. */
    void clear_pending_jobs();

    /**
     * Blocks until every queued job has been executed and all workers exited.
     * Jobs may be posted again afterwards.
     */
    void join();

private:

    /** Must be called with mutex_ held. */
    bool needs_new_worker() const noexcept;
    void work();
};

} // namespace seedwise

#endif // SEEDWISE_THREAD_POOL_HEADER
