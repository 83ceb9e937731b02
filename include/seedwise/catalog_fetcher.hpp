#ifndef SEEDWISE_CATALOG_FETCHER_HEADER
#define SEEDWISE_CATALOG_FETCHER_HEADER

#include "torrent_record.hpp"
#include "thread_pool.hpp"
#include "error_code.hpp"
#include "adapters.hpp"
#include "settings.hpp"
#include "log.hpp"

#include <memory>
#include <string>
#include <vector>
#include <mutex>
#include <set>

namespace seedwise {

/** What a single tracker returned for a run. */
struct tracker_listing
{
    std::string tracker;
    std::vector<torrent_record> candidates;
    std::vector<torrent_record> hot;

    // `plan_errc::fetch_failure` or `plan_errc::fetch_timeout` if the tracker could
    // not be queried, in which case its lists are empty, with details in `message`.
    error_code error;
    std::string message;
};

/**
 * Queries all trackers concurrently, each on its own thread pool job. Results are
 * collected on the caller's thread through an io_context that runs until every
 * tracker has answered or the timeout expires.
 *
 * A tracker that times out is not waited for, but its job is not cancelled either
 * (adapters are expected to bound their own network calls), so its adapter stays in
 * use until the job returns. Its results are then discarded. Until then the tracker
 * is busy: a later fetch reports it as timed out without querying it again, so an
 * adapter is never called from two jobs at once.
 */
class catalog_fetcher
{
    fetch_settings settings_;

    // Adapters with a job in flight, possibly from an earlier fetch.
    mutable std::mutex busy_mutex_;
    std::set<const tracker_adapter*> busy_trackers_;

    // Joined on destruction, before the members above go away.
    thread_pool thread_pool_;

public:

    explicit catalog_fetcher(fetch_settings s);

    /**
     * Returns one listing per tracker, in the order of `trackers`. Hot torrents are
     * only listed if `include_hot` is set.
     */
    std::vector<tracker_listing> fetch(
        const std::vector<std::shared_ptr<tracker_adapter>>& trackers,
        const candidate_filter& filter, const bool include_hot);

    /** Waits for all jobs, including those of timed out trackers, to return. */
    void join();

    bool is_busy(const tracker_adapter& tracker) const;

private:

    /** Returns false if `tracker` was already busy. */
    bool mark_busy(const tracker_adapter& tracker);
    void clear_busy(const tracker_adapter& tracker);
};

} // namespace seedwise

#endif // SEEDWISE_CATALOG_FETCHER_HEADER
