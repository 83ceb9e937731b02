#ifndef SEEDWISE_PLANNER_HEADER
#define SEEDWISE_PLANNER_HEADER

#include "storage_ledger.hpp"
#include "score_policy.hpp"
#include "adapters.hpp"
#include "settings.hpp"
#include "plan.hpp"
#include "log.hpp"

#include <vector>

namespace seedwise {

/**
 * Decides which remote candidates to download and which local torrents to evict to
 * make room for them, under a storage budget (space occupied, shared content counted
 * once) and a download budget (bytes fetched in this run).
 *
 * The selection is greedy over candidates in ranking order:
 *
 * 1. Admission: the candidate's manifest is fetched if unknown (lazily, so only for
 *    candidates actually reached, and at most `shortlist_size` times per run). If
 *    its content is already on disk it is cross-seeded or skipped. Otherwise it is
 *    admitted if it fits both budgets.
 * 2. Eviction: if only the storage budget stands in the way, evictable resident
 *    clusters are considered from the lowest score up, as long as the candidate
 *    outscores each by more than `eviction_margin`. If the candidate fits once
 *    enough of them are gone, they are evicted and the candidate is admitted.
 *    Otherwise nothing is evicted and the candidate is skipped. The planner never
 *    evicts anything without admitting a better candidate in its place.
 *
 * Planning is deterministic: it iterates only ordered containers and breaks every
 * tie, so the same inputs always give the same plan. It does the same thing for
 * dry-runs and real runs, as it never executes anything itself.
 */
class planner
{
    planner_settings settings_;
    const score_policy& policy_;

    /** A resident cluster that may be evicted as a whole. */
    struct eviction_candidate
    {
        cluster_index_t cluster;
        // The best score among its resident members, as evicting it loses them all.
        double score;
        bytes_t size;
        torrent_key key;
        bool is_evicted = false;
    };

public:

    /**
     * `s` must have gone through `fill_in_defaults`. `policy` is used to score
     * resident torrents and must outlive the planner.
     */
    planner(planner_settings s, const score_policy& policy);

    const planner_settings& settings() const noexcept { return settings_; }

    /**
     * Makes a plan for `candidates` (they need not be sorted, they are ranked here).
     * `ledger` is updated to what it would be after executing the plan, so callers
     * that need the original should pass a copy. Manifests are fetched from
     * `manifests`, a failed fetch skips the candidate but not the run.
     */
    plan make_plan(std::vector<scored_record> candidates, storage_ledger& ledger,
        manifest_source& manifests) const;

private:

    /** Returns the evictable resident clusters, worst first. */
    std::vector<eviction_candidate> collect_eviction_candidates(
        const storage_ledger& ledger) const;

    bool is_cluster_evictable(const storage_ledger& ledger, const cluster_index_t c) const;

    /**
     * Handles a candidate whose content is already in cluster `c`: cross-seeds it if
     * possible, skips it otherwise.
     */
    void handle_resident_match(scored_record& candidate, const cluster_index_t c,
        storage_ledger& ledger, plan& p) const;

    void admit(scored_record& candidate, storage_ledger& ledger, plan& p) const;

    /** Evicts all resident members of the cluster, the last one reclaiming space. */
    void evict_cluster(const eviction_candidate& victim, storage_ledger& ledger,
        plan& p) const;

    void skip(const scored_record& candidate, const error_code reason, plan& p) const;

    bool fits_download_budget(const plan& p, const bytes_t size) const noexcept;

    enum class log_event
    {
        admission,
        eviction,
        manifest,
        cross_seed,
        skip
    };

    template<typename... Args>
    void log(const log_event event, const char* format, Args&&... args) const;
    template<typename... Args>
    void log(const log_event event, const log::priority priority,
        const char* format, Args&&... args) const;
};

} // namespace seedwise

#endif // SEEDWISE_PLANNER_HEADER
