#include "catalog_fetcher.hpp"
#include "string_utils.hpp"
#include "plan_error.hpp"

#include <exception>

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/error.hpp>
#include <asio/post.hpp>

namespace seedwise {
namespace {

/**
 * The state of a single `fetch` call. Jobs hold a strong reference to it, so that
 * its io_context outlives a job that finishes after a timeout, but handlers queued in
 * the io_context only hold weak ones, or the state would own itself.
 */
struct fetch_state
{
    asio::io_context ios;
    asio::executor_work_guard<asio::io_context::executor_type> work;
    deadline_timer timeout_timer;

    // Only accessed from within ios.run(), i.e. on the caller's thread.
    std::vector<tracker_listing> listings;
    std::vector<bool> is_done;
    int num_pending = 0;

    explicit fetch_state(const int num_trackers)
        : work(asio::make_work_guard(ios))
        , timeout_timer(ios)
        , listings(num_trackers)
        , is_done(num_trackers, false)
        , num_pending(num_trackers)
    {}

    void finish()
    {
        timeout_timer.cancel();
        work.reset();
    }
};

template<typename... Args>
void log_fetch(const log::priority priority, const char* format, Args&&... args)
{
#ifdef SEEDWISE_ENABLE_LOGGING
    log::log_fetcher("FETCH", util::format(format, std::forward<Args>(args)...),
        true, priority);
#endif // SEEDWISE_ENABLE_LOGGING
}

/** Runs on a thread pool thread. */
tracker_listing query_tracker(tracker_adapter& tracker,
    const candidate_filter& filter, const bool include_hot)
{
    tracker_listing listing;
    listing.tracker = tracker.name();
    const time_point start = clock::now();
    error_code error;
    try
    {
        listing.candidates = tracker.list_candidates(filter, error);
        if(!error && include_hot) { listing.hot = tracker.list_hot_torrents(error); }
        if(error) { listing.message = error.message(); }
    }
    catch(const std::exception& e)
    {
        // an exception must not escape to the thread pool
        error = make_error_code(plan_errc::adapter_failure);
        listing.message = e.what();
    }

    if(error)
    {
        listing.candidates.clear();
        listing.hot.clear();
        listing.error = make_error_code(plan_errc::fetch_failure);
        log_fetch(log::priority::high, "%s failed: %s", listing.tracker.c_str(),
            listing.message.c_str());
    }
    else
    {
        log_fetch(log::priority::normal,
            "%s listed %i candidates and %i hot torrents in %lims",
            listing.tracker.c_str(), int(listing.candidates.size()),
            int(listing.hot.size()), long(to_int<milliseconds>(elapsed_since(start))));
    }
    return listing;
}

} // namespace

catalog_fetcher::catalog_fetcher(fetch_settings s)
    : settings_(std::move(s))
    , thread_pool_(settings_.concurrency > 0 ? settings_.concurrency : 1)
{}

std::vector<tracker_listing> catalog_fetcher::fetch(
    const std::vector<std::shared_ptr<tracker_adapter>>& trackers,
    const candidate_filter& filter, const bool include_hot)
{
    if(trackers.empty()) { return {}; }

    if(settings_.concurrency == values::none)
    {
        thread_pool_.set_concurrency(trackers.size());
    }

    auto state = std::make_shared<fetch_state>(trackers.size());
    std::weak_ptr<fetch_state> weak_state = state;

    for(auto i = 0; i < int(trackers.size()); ++i)
    {
        auto& entry = state->listings[i];
        entry.tracker = trackers[i]->name();
        if(!mark_busy(*trackers[i]))
        {
            entry.error = make_error_code(plan_errc::fetch_timeout);
            entry.message = "still busy with a previous query";
            state->is_done[i] = true;
            --state->num_pending;
            log_fetch(log::priority::high, "%s is still busy, not queried",
                entry.tracker.c_str());
            continue;
        }
        thread_pool_.post([this, state, weak_state, tracker = trackers[i], i, filter,
            include_hot]
        {
            tracker_listing listing = query_tracker(*tracker, filter, include_hot);
            clear_busy(*tracker);
            asio::post(state->ios,
                [weak_state, i, listing = std::move(listing)]() mutable
                {
                    auto s = weak_state.lock();
                    if(!s || s->is_done[i]) { return; }
                    s->listings[i] = std::move(listing);
                    s->is_done[i] = true;
                    if(--s->num_pending == 0) { s->finish(); }
                });
        });
    }

    // every tracker was busy, there is nothing to wait for
    if(state->num_pending == 0) { return std::move(state->listings); }

    start_timer(state->timeout_timer, settings_.timeout,
        [weak_state](const error_code& error)
        {
            auto s = weak_state.lock();
            if(!s || error == asio::error::operation_aborted) { return; }
            for(auto i = 0; i < int(s->listings.size()); ++i)
            {
                if(s->is_done[i]) { continue; }
                auto& listing = s->listings[i];
                listing.error = make_error_code(plan_errc::fetch_timeout);
                listing.message = "no answer within the timeout";
                s->is_done[i] = true;
                log_fetch(log::priority::high, "%s timed out", listing.tracker.c_str());
            }
            s->num_pending = 0;
            s->work.reset();
            // late results are dropped by their handlers
            s->ios.stop();
        });

    state->ios.run();
    return std::move(state->listings);
}

void catalog_fetcher::join()
{
    thread_pool_.join();
}

bool catalog_fetcher::is_busy(const tracker_adapter& tracker) const
{
    std::lock_guard<std::mutex> l(busy_mutex_);
    return busy_trackers_.count(&tracker) > 0;
}

bool catalog_fetcher::mark_busy(const tracker_adapter& tracker)
{
    std::lock_guard<std::mutex> l(busy_mutex_);
    return busy_trackers_.insert(&tracker).second;
}

void catalog_fetcher::clear_busy(const tracker_adapter& tracker)
{
    std::lock_guard<std::mutex> l(busy_mutex_);
    busy_trackers_.erase(&tracker);
}

} // namespace seedwise
