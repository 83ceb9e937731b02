#ifndef SEEDWISE_SETTINGS_HEADER
#define SEEDWISE_SETTINGS_HEADER

#include "time.hpp"
#include "types.hpp"

#include <set>

namespace seedwise {
namespace values {

constexpr int unlimited = -1;
constexpr int none = -2;

} // values

struct identity_settings
{
    // Whether paths that differ only in letter case are different files. Trackers
    // serving case-insensitive file systems may want this off.
    bool case_sensitive_paths = true;

    // When one of two manifests is unknown, their declared total sizes are still
    // compared, and a match is reported as an ambiguous identity. Such a match is
    // never merged into a cluster, it only raises a warning, as same-sized
    // different content is common enough to risk deleting data.
    bool size_fallback = true;
};

struct scoring_settings
{
    // The extra weight a free torrent receives, half-price torrents get half of it
    // and so on.
    double free_weight = 1.0;

    // Remote candidates that are not expected to reach a share ratio of 1.0 within
    // this many days score zero.
    double cost_recovery_days = 7.0;

    // Torrents that completed fewer than this many days ago are not evicted.
    double removal_exemption_days = 15.0;

    // Torrents uploading faster than this (bytes/s) are not evicted.
    int64_t active_upload_rate = 5 * kib;
};

struct planner_settings
{
    // The upper bound of the space all resident torrents may occupy, counting
    // shared content once. This must be specified.
    bytes_t storage_budget = values::none;

    // The upper bound of the bytes newly downloaded in a single run. If `none`, it
    // is set to one fiftieth of `storage_budget`. May be `unlimited`.
    bytes_t download_budget = values::none;

    // Candidates must score above this to be downloaded at all.
    double min_candidate_score = 0.0;

    // A candidate must outscore every torrent evicted on its behalf by more than
    // this.
    double eviction_margin = 0.0;

    // The number of manifests the planner may fetch in a single run. Candidates
    // reached after this are skipped rather than fetched. If `none`, a default is
    // chosen, may be `unlimited`.
    int shortlist_size = values::none;

    // If a candidate turns out to be content that is already on disk and complete,
    // it is cross-seeded instead of being skipped.
    bool cross_seed_resident_matches = true;

    // This much space is always left free on the download volume, regardless of
    // `storage_budget`.
    bytes_t min_free_space = 0;
};

struct cross_seed_settings
{
    bool enabled = true;

    // Hot torrents are only considered for a resident cluster, and their manifests
    // only fetched, if their declared size is within this fraction of the cluster's
    // effective size.
    double size_tolerance = 0.01;

    // The number of cross-seed actions emitted per run. May be `unlimited`.
    int max_cross_seeds = values::unlimited;

    // The number of manifests the matcher may fetch in a single run. If `none`, a
    // default is chosen, may be `unlimited`.
    int max_manifest_fetches = values::none;
};

struct fetch_settings
{
    // The number of threads used to query trackers concurrently. If `none`, one per
    // tracker.
    int concurrency = values::none;

    // A tracker that has not returned its listings in this time is skipped for the
    // run.
    seconds timeout{60};

    // Only free candidates are considered for download.
    bool free_only = false;
};

struct settings
{
    identity_settings identity;
    scoring_settings scoring;
    planner_settings planner;
    cross_seed_settings cross_seed;
    fetch_settings fetch;

    // These are never evicted, in addition to torrents in the `kept` state.
    std::set<torrent_key> protected_keys;
};

/**
 * Throws std::invalid_argument naming the offending field if any of the settings is
 * out of its domain. Sentinels (`values::none`, and `values::unlimited` where
 * documented) are accepted.
 */
void verify(const settings& s);

/** Replaces the `values::none` sentinels with their defaults. */
void fill_in_defaults(settings& s);

} // seedwise

#endif // SEEDWISE_SETTINGS_HEADER
