#ifndef SEEDWISE_ENGINE_HEADER
#define SEEDWISE_ENGINE_HEADER

#include "cross_seed_matcher.hpp"
#include "content_resolver.hpp"
#include "catalog_fetcher.hpp"
#include "storage_ledger.hpp"
#include "score_policy.hpp"
#include "error_code.hpp"
#include "settings.hpp"
#include "executor.hpp"
#include "adapters.hpp"
#include "planner.hpp"
#include "plan.hpp"

#include <memory>
#include <string>
#include <vector>

namespace seedwise {

struct run_report
{
    plan planned;

    // Only meaningful if `is_executed` is set, i.e. if this was not a dry-run.
    execution_report execution;
    bool is_executed = false;

    // Set if the run could not get as far as planning, e.g. because the client's
    // inventory could not be listed.
    error_code error;
    std::string message;
};

/**
 * The entry point of a run: gathers the client's inventory and the trackers'
 * listings, plans downloads, evictions and cross-seeds, and (unless dry-running)
 * executes the plan.
 *
 * No state survives a run, each one starts from a fresh inventory.
 */
class engine
{
    settings settings_;

    std::vector<std::shared_ptr<tracker_adapter>> trackers_;
    std::shared_ptr<client_adapter> client_;

    std::unique_ptr<score_policy> policy_;
    content_resolver resolver_;
    catalog_fetcher fetcher_;

public:

    /**
     * Throws std::invalid_argument if `s` does not pass `verify`. If `policy` is
     * not given, `default_score_policy` is used with `s.scoring`.
     */
    engine(settings s, std::vector<std::shared_ptr<tracker_adapter>> trackers,
        std::shared_ptr<client_adapter> client);
    engine(settings s, std::vector<std::shared_ptr<tracker_adapter>> trackers,
        std::shared_ptr<client_adapter> client, std::unique_ptr<score_policy> policy);

    const settings& get_settings() const noexcept { return settings_; }
    const score_policy& policy() const noexcept { return *policy_; }

    /**
     * Plans with all trackers' candidates, and executes the plan unless `dry_run`.
     * The plan is the same either way.
     */
    run_report run(const bool dry_run);

    /**
     * Plans to download `candidate` alone, making room for it by eviction if needed.
     * It is treated as outscoring every resident torrent, and the download budget
     * does not apply to it, but the storage budget and protections still do.
     */
    run_report download_one(torrent_record candidate, const bool dry_run);

private:

    /**
     * Lists the client's torrents into a ledger and works out the storage budget
     * this run may actually use, which is less than the configured one if the disk
     * is short of space.
     */
    bool load_inventory(storage_ledger& ledger, bytes_t& storage_budget,
        run_report& report);

    /**
     * Drops records that are already in `ledger`, non-free ones if `free_only`, and
     * repeated keys (the first one wins), then scores and ranks the rest.
     */
    std::vector<scored_record> prepare_candidates(std::vector<torrent_record> records,
        const storage_ledger& ledger, const bool free_only) const;

    void finish(run_report& report, const storage_ledger& ledger, const bool dry_run);

    enum class log_event
    {
        inventory,
        fetch,
        plan,
        execution
    };

    template<typename... Args>
    void log(const log_event event, const char* format, Args&&... args) const;
    template<typename... Args>
    void log(const log_event event, const log::priority priority,
        const char* format, Args&&... args) const;
};

} // namespace seedwise

#endif // SEEDWISE_ENGINE_HEADER
