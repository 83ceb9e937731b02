#include "string_utils.hpp"
#include "plan_error.hpp"
#include "planner.hpp"

#include <algorithm>
#include <stdexcept>
#include <cmath>

namespace seedwise {

planner::planner(planner_settings s, const score_policy& policy)
    : settings_(std::move(s))
    , policy_(policy)
{}

plan planner::make_plan(std::vector<scored_record> candidates,
    storage_ledger& ledger, manifest_source& manifests) const
{
    rank(candidates);

    plan p;
    p.storage_budget = settings_.storage_budget;
    p.download_budget = settings_.download_budget;
    p.occupied_before = ledger.occupied_bytes();

    log(log_event::admission, "planning %i candidates, occupied: %s, budget: %s",
        int(candidates.size()), util::format_size(ledger.occupied_bytes()).c_str(),
        util::format_size(settings_.storage_budget).c_str());

    if(ledger.occupied_bytes() > settings_.storage_budget)
    {
        // Admitting anything now would only leave us further over budget, and
        // evicting without a replacement is not the planner's call to make.
        plan_warning w;
        w.error = make_error_code(plan_errc::budget_exceeded);
        w.message = util::format("occupied space (%s) already exceeds the storage "
            "budget (%s), no candidates admitted",
            util::format_size(ledger.occupied_bytes()).c_str(),
            util::format_size(settings_.storage_budget).c_str());
        log(log_event::admission, log::priority::high, "%s", w.message.c_str());
        p.warnings.emplace_back(std::move(w));
        for(const auto& c : candidates)
        {
            if(!ledger.contains(c.record.key))
            {
                skip(c, plan_errc::budget_exceeded, p);
            }
        }
        p.occupied_after = ledger.occupied_bytes();
        return p;
    }

    std::vector<eviction_candidate> evictables = collect_eviction_candidates(ledger);
    int num_fetches = 0;

    for(auto& candidate : candidates)
    {
        const auto& key = candidate.record.key;
        if(ledger.contains(key))
        {
            skip(candidate, plan_errc::already_resident, p);
            continue;
        }

        if(!(candidate.score > settings_.min_candidate_score))
        {
            skip(candidate, plan_errc::below_minimum_score, p);
            continue;
        }

        if(!candidate.record.manifest.is_known())
        {
            if(settings_.shortlist_size != values::unlimited
               && num_fetches >= settings_.shortlist_size)
            {
                skip(candidate, plan_errc::manifest_unavailable, p);
                continue;
            }
            ++num_fetches;
            error_code error;
            file_manifest manifest = manifests.fetch_manifest(key, error);
            if(error)
            {
                log(log_event::manifest, log::priority::high,
                    "failed to fetch manifest of %s: %s",
                    to_string(key).c_str(), error.message().c_str());
                skip(candidate, plan_errc::fetch_failure, p);
                continue;
            }
            if(!manifest.is_known())
            {
                log(log_event::manifest, "%s has an empty manifest",
                    to_string(key).c_str());
                skip(candidate, plan_errc::manifest_unavailable, p);
                continue;
            }
            log(log_event::manifest, "fetched manifest of %s (%i files)",
                to_string(key).c_str(), manifest.num_files());
            candidate.record.manifest = std::move(manifest);
        }

        cluster_index_t cluster = invalid_index;
        const identity_match match = ledger.match(candidate.record, cluster);
        if(match == identity_match::identical)
        {
            handle_resident_match(candidate, cluster, ledger, p);
            continue;
        }
        else if(match == identity_match::ambiguous)
        {
            const auto& other = ledger.record(ledger.clusters()[cluster].representative());
            plan_warning w;
            w.key = key;
            w.error = make_error_code(plan_errc::ambiguous_identity);
            w.message = util::format("%s has the same size as resident %s but their "
                "manifests could not be compared, treated as different content",
                to_string(key).c_str(), to_string(other.key).c_str());
            log(log_event::admission, log::priority::high, "%s", w.message.c_str());
            p.warnings.emplace_back(std::move(w));
        }

        const bytes_t size = candidate.record.size;
        if(!fits_download_budget(p, size))
        {
            skip(candidate, plan_errc::budget_exceeded, p);
            continue;
        }

        if(ledger.occupied_bytes() + size <= settings_.storage_budget)
        {
            admit(candidate, ledger, p);
            continue;
        }

        // Accumulate victims from the worst up, but only commit to evicting them
        // once it's certain the candidate fits afterwards.
        std::vector<int> victims;
        bytes_t num_freeable = 0;
        bool is_margin_blocked = false;
        for(int i = 0; i < int(evictables.size()); ++i)
        {
            const auto& v = evictables[i];
            if(v.is_evicted || ledger.is_pending_cluster(v.cluster)) { continue; }
            // evictables are ordered by score, so no later one can pass either
            if(!(candidate.score > v.score + settings_.eviction_margin))
            {
                is_margin_blocked = true;
                break;
            }
            victims.push_back(i);
            num_freeable += v.size;
            if(ledger.occupied_bytes() - num_freeable + size <= settings_.storage_budget)
            {
                break;
            }
        }

        if(ledger.occupied_bytes() - num_freeable + size > settings_.storage_budget)
        {
            skip(candidate, is_margin_blocked ? plan_errc::below_eviction_margin
                : plan_errc::budget_exceeded, p);
            continue;
        }

        log(log_event::eviction, "evicting %i clusters (%s) for %s (score: %f)",
            int(victims.size()), util::format_size(num_freeable).c_str(),
            to_string(key).c_str(), candidate.score);
        for(const int i : victims)
        {
            evict_cluster(evictables[i], ledger, p);
            evictables[i].is_evicted = true;
        }
        admit(candidate, ledger, p);
    }

    p.occupied_after = ledger.occupied_bytes();
    log(log_event::admission, "planned %i downloads (%s), %i evictions (%s freed), "
        "%i cross-seeds, %i skipped",
        p.num_actions(action_type::download),
        util::format_size(p.downloaded_bytes).c_str(),
        p.num_actions(action_type::evict),
        util::format_size(p.freed_bytes).c_str(),
        p.num_actions(action_type::cross_seed), int(p.skipped.size()));
    return p;
}

std::vector<planner::eviction_candidate> planner::collect_eviction_candidates(
    const storage_ledger& ledger) const
{
    std::vector<eviction_candidate> evictables;
    for(const cluster_index_t c : ledger.resident_clusters())
    {
        if(!is_cluster_evictable(ledger, c)) { continue; }

        eviction_candidate v;
        v.cluster = c;
        v.score = -INFINITY;
        v.size = ledger.clusters()[c].effective_size;
        bool is_first = true;
        for(const record_index_t i : ledger.resident_members(c))
        {
            const auto& r = ledger.record(i);
            double score = policy_.score(r);
            if(std::isnan(score)) { score = -INFINITY; }
            v.score = std::max(v.score, score);
            if(is_first || r.key < v.key) { v.key = r.key; }
            is_first = false;
        }
        evictables.emplace_back(std::move(v));
    }

    std::sort(evictables.begin(), evictables.end(),
        [](const eviction_candidate& a, const eviction_candidate& b)
        {
            if(a.score != b.score) { return a.score < b.score; }
            // of equally bad ones, the one that frees the most space goes first
            if(a.size != b.size) { return a.size > b.size; }
            return a.key < b.key;
        });
    return evictables;
}

bool planner::is_cluster_evictable(
    const storage_ledger& ledger, const cluster_index_t c) const
{
    if(ledger.is_pending_cluster(c) || ledger.has_protected_member(c)) { return false; }
    for(const record_index_t i : ledger.resident_members(c))
    {
        const auto& r = ledger.record(i);
        if(!ledger.can_evict(r.key) || !policy_.is_evictable(r)) { return false; }
    }
    return true;
}

void planner::handle_resident_match(scored_record& candidate,
    const cluster_index_t c, storage_ledger& ledger, plan& p) const
{
    const auto& key = candidate.record.key;
    if(settings_.cross_seed_resident_matches)
    {
        const record_index_t source = ledger.complete_member(c);
        if(source != invalid_index && !ledger.has_member_from(c, candidate.record.origin()))
        {
            // the source must be copied before the ledger grows
            const torrent_record source_record = ledger.record(source);
            error_code error;
            ledger.join_cluster(c, candidate.record, error);
            if(error)
            {
                throw std::logic_error("cannot join content cluster: " + error.message());
            }
            log(log_event::cross_seed, "cross-seeding %s from %s",
                to_string(key).c_str(), to_string(source_record.key).c_str());
            p.cross_seeded_bytes += candidate.record.size;
            p.actions.emplace_back(plan_action::make_cross_seed(
                std::move(candidate.record), candidate.score, source_record));
            return;
        }
    }
    skip(candidate, plan_errc::already_resident, p);
}

void planner::admit(scored_record& candidate, storage_ledger& ledger, plan& p) const
{
    log(log_event::admission, "downloading %s (%s, score: %f)",
        to_string(candidate.record.key).c_str(),
        util::format_size(candidate.record.size).c_str(), candidate.score);
    p.downloaded_bytes += candidate.record.size;
    ledger.add_download(candidate.record);
    p.actions.emplace_back(plan_action::make_download(
        std::move(candidate.record), candidate.score));
}

void planner::evict_cluster(const eviction_candidate& victim,
    storage_ledger& ledger, plan& p) const
{
    std::vector<torrent_key> keys;
    for(const record_index_t i : ledger.resident_members(victim.cluster))
    {
        keys.push_back(ledger.record(i).key);
    }
    std::sort(keys.begin(), keys.end());

    for(const auto& key : keys)
    {
        const torrent_record r = ledger.record(ledger.find(key));
        const eviction_mode mode = ledger.eviction_mode_for(key);
        error_code error;
        const bytes_t freed = ledger.evict(key, mode, error);
        if(error)
        {
            // the cluster was vetted for eviction, so the ledger must not refuse
            throw std::logic_error(util::format("cannot evict %s: %s",
                to_string(key).c_str(), error.message().c_str()));
        }
        log(log_event::eviction, "evicting %s (%s, score: %f)", to_string(key).c_str(),
            to_string(mode), victim.score);
        p.freed_bytes += freed;
        p.actions.emplace_back(plan_action::make_evict(
            r, victim.score, mode, freed));
    }
}

void planner::skip(const scored_record& candidate,
    const error_code reason, plan& p) const
{
    log(log_event::skip, log::priority::low, "skipping %s (score: %f): %s",
        to_string(candidate.record.key).c_str(), candidate.score,
        reason.message().c_str());
    skipped_candidate s;
    s.key = candidate.record.key;
    s.title = candidate.record.title;
    s.score = candidate.score;
    s.reason = reason;
    p.skipped.emplace_back(std::move(s));
}

bool planner::fits_download_budget(const plan& p, const bytes_t size) const noexcept
{
    if(settings_.download_budget < 0) { return true; }
    return p.downloaded_bytes + size <= settings_.download_budget;
}

template<typename... Args>
void planner::log(const log_event event, const char* format, Args&&... args) const
{
    log(event, log::priority::normal, format, std::forward<Args>(args)...);
}

template<typename... Args>
void planner::log(const log_event event, const log::priority priority,
    const char* format, Args&&... args) const
{
#ifdef SEEDWISE_ENABLE_LOGGING
    const auto header = [event]() -> std::string
    {
        switch(event)
        {
        case log_event::admission: return "ADMISSION";
        case log_event::eviction: return "EVICTION";
        case log_event::manifest: return "MANIFEST";
        case log_event::cross_seed: return "CROSS-SEED";
        case log_event::skip: return "SKIP";
        default: return "";
        }
    }();
    log::log_planner(std::move(header),
        util::format(format, std::forward<Args>(args)...), priority);
#endif // SEEDWISE_ENABLE_LOGGING
}

} // namespace seedwise
