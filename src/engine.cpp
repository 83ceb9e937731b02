#include "string_utils.hpp"
#include "plan_error.hpp"
#include "engine.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <limits>
#include <map>
#include <set>

namespace seedwise {
namespace {

/** Routes manifest requests to the tracker named in the key. */
class tracker_manifests : public manifest_source
{
    std::map<std::string, tracker_adapter*> trackers_;

public:

    explicit tracker_manifests(
        const std::vector<std::shared_ptr<tracker_adapter>>& trackers)
    {
        for(const auto& t : trackers) { trackers_.emplace(t->name(), t.get()); }
    }

    file_manifest fetch_manifest(const torrent_key& key, error_code& error) override
    {
        error.clear();
        auto it = trackers_.find(key.tracker);
        if(it == trackers_.end())
        {
            error = make_error_code(plan_errc::fetch_failure);
            return {};
        }
        try
        {
            return it->second->fetch_manifest(key, error);
        }
        catch(const std::exception&)
        {
            error = make_error_code(plan_errc::adapter_failure);
            return {};
        }
    }
};

} // namespace

engine::engine(settings s, std::vector<std::shared_ptr<tracker_adapter>> trackers,
    std::shared_ptr<client_adapter> client)
    : engine(s, std::move(trackers), std::move(client),
        std::make_unique<default_score_policy>(s.scoring))
{}

engine::engine(settings s, std::vector<std::shared_ptr<tracker_adapter>> trackers,
    std::shared_ptr<client_adapter> client, std::unique_ptr<score_policy> policy)
    : settings_(std::move(s))
    , trackers_(std::move(trackers))
    , client_(std::move(client))
    , policy_(std::move(policy))
    , resolver_(settings_.identity)
    , fetcher_(settings_.fetch)
{
    verify(settings_);
    fill_in_defaults(settings_);
    if(client_ == nullptr) { throw std::invalid_argument("engine needs a client"); }
    if(policy_ == nullptr) { throw std::invalid_argument("engine needs a score policy"); }
    for(const auto& t : trackers_)
    {
        if(t == nullptr) { throw std::invalid_argument("null tracker adapter"); }
    }
}

run_report engine::run(const bool dry_run)
{
    run_report report;
    storage_ledger ledger;
    bytes_t storage_budget = 0;
    if(!load_inventory(ledger, storage_budget, report)) { return report; }

    const std::vector<tracker_listing> listings = fetcher_.fetch(trackers_,
        candidate_filter{settings_.fetch.free_only}, settings_.cross_seed.enabled);

    std::vector<torrent_record> candidates;
    std::vector<torrent_record> hot;
    std::vector<plan_warning> fetch_warnings;
    for(const auto& listing : listings)
    {
        if(listing.error)
        {
            plan_warning w;
            w.key.tracker = listing.tracker;
            w.error = listing.error;
            w.message = util::format("%s could not be queried: %s",
                listing.tracker.c_str(), listing.message.c_str());
            log(log_event::fetch, log::priority::high, "%s", w.message.c_str());
            fetch_warnings.emplace_back(std::move(w));
            continue;
        }
        candidates.insert(candidates.end(),
            listing.candidates.begin(), listing.candidates.end());
        hot.insert(hot.end(), listing.hot.begin(), listing.hot.end());
    }
    log(log_event::fetch, "%i candidates and %i hot torrents from %i trackers",
        int(candidates.size()), int(hot.size()), int(listings.size()));

    planner_settings limits = settings_.planner;
    limits.storage_budget = storage_budget;

    tracker_manifests manifests(trackers_);
    storage_ledger working = ledger;
    planner selector(limits, *policy_);
    report.planned = selector.make_plan(
        prepare_candidates(std::move(candidates), working, settings_.fetch.free_only),
        working, manifests);

    cross_seed_matcher matcher(settings_.cross_seed);
    // cross-seeds cost no download volume, so they need not be free
    matcher.match(prepare_candidates(std::move(hot), working, false), working,
        manifests, report.planned);

    auto& warnings = report.planned.warnings;
    warnings.insert(warnings.begin(), fetch_warnings.begin(), fetch_warnings.end());
    report.planned.occupied_after = working.occupied_bytes();

    finish(report, ledger, dry_run);
    return report;
}

run_report engine::download_one(torrent_record candidate, const bool dry_run)
{
    run_report report;
    storage_ledger ledger;
    bytes_t storage_budget = 0;
    if(!load_inventory(ledger, storage_budget, report)) { return report; }

    planner_settings limits = settings_.planner;
    limits.storage_budget = storage_budget;
    limits.download_budget = values::unlimited;

    log(log_event::plan, "planning targeted download of %s (%s)",
        to_string(candidate.key).c_str(), util::format_size(candidate.size).c_str());

    std::vector<scored_record> candidates;
    candidates.emplace_back(std::move(candidate),
        std::numeric_limits<double>::infinity());

    tracker_manifests manifests(trackers_);
    storage_ledger working = ledger;
    planner selector(limits, *policy_);
    report.planned = selector.make_plan(std::move(candidates), working, manifests);

    finish(report, ledger, dry_run);
    return report;
}

bool engine::load_inventory(storage_ledger& ledger, bytes_t& storage_budget,
    run_report& report)
{
    error_code error;
    std::vector<torrent_record> local;
    try
    {
        local = client_->list_local_torrents(error);
    }
    catch(const std::exception& e)
    {
        error = make_error_code(plan_errc::adapter_failure);
        report.message = e.what();
    }
    if(error)
    {
        report.error = error;
        if(report.message.empty()) { report.message = error.message(); }
        log(log_event::inventory, log::priority::high,
            "could not list local torrents: %s", report.message.c_str());
        return false;
    }

    ledger = storage_ledger(std::move(local), resolver_, settings_.protected_keys);
    storage_budget = settings_.planner.storage_budget;

    bytes_t free_space = 0;
    try
    {
        free_space = client_->free_space(error);
    }
    catch(const std::exception&)
    {
        error = make_error_code(plan_errc::adapter_failure);
    }
    if(error)
    {
        log(log_event::inventory, log::priority::high,
            "could not query free space (%s), using the configured budget",
            error.message().c_str());
    }
    else
    {
        // the resident content is already on disk, so it may grow by the free space
        const bytes_t disk_limit = std::max(bytes_t(0),
            ledger.occupied_bytes() + free_space - settings_.planner.min_free_space);
        storage_budget = std::min(storage_budget, disk_limit);
    }

    log(log_event::inventory, "%i resident torrents in %i clusters, occupied: %s, "
        "storage budget: %s", ledger.num_records(), int(ledger.resident_clusters().size()),
        util::format_size(ledger.occupied_bytes()).c_str(),
        util::format_size(storage_budget).c_str());
    return true;
}

std::vector<scored_record> engine::prepare_candidates(
    std::vector<torrent_record> records, const storage_ledger& ledger,
    const bool free_only) const
{
    std::set<torrent_key> seen;
    std::vector<torrent_record> filtered;
    for(auto& r : records)
    {
        if(ledger.contains(r.key) || !seen.insert(r.key).second) { continue; }
        if(free_only && !r.inputs.is_free) { continue; }
        filtered.emplace_back(std::move(r));
    }
    return rank(std::move(filtered), *policy_);
}

void engine::finish(run_report& report, const storage_ledger& ledger, const bool dry_run)
{
    log(log_event::plan, "%s%s", dry_run ? "dry-run\n" : "",
        to_string(report.planned).c_str());
    if(dry_run) { return; }

    report.execution = execute_plan(report.planned, *client_, ledger);
    report.is_executed = true;
    if(!report.execution.is_complete())
    {
        log(log_event::execution, log::priority::high, "%i of %i actions executed: %s",
            report.execution.num_executed, int(report.planned.actions.size()),
            report.execution.message.c_str());
    }
}

template<typename... Args>
void engine::log(const log_event event, const char* format, Args&&... args) const
{
    log(event, log::priority::normal, format, std::forward<Args>(args)...);
}

template<typename... Args>
void engine::log(const log_event event, const log::priority priority,
    const char* format, Args&&... args) const
{
#ifdef SEEDWISE_ENABLE_LOGGING
    const auto header = [event]() -> std::string
    {
        switch(event)
        {
        case log_event::inventory: return "INVENTORY";
        case log_event::fetch: return "FETCH";
        case log_event::plan: return "PLAN";
        case log_event::execution: return "EXECUTION";
        default: return "";
        }
    }();
    log::log_engine(std::move(header),
        util::format(format, std::forward<Args>(args)...), priority);
#endif // SEEDWISE_ENABLE_LOGGING
}

} // namespace seedwise
