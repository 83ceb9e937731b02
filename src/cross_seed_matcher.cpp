#include "cross_seed_matcher.hpp"
#include "string_utils.hpp"
#include "plan_error.hpp"

#include <algorithm>
#include <stdexcept>
#include <cmath>

namespace seedwise {

cross_seed_matcher::cross_seed_matcher(cross_seed_settings s)
    : settings_(std::move(s))
{}

int cross_seed_matcher::match(std::vector<scored_record> hot,
    storage_ledger& ledger, manifest_source& manifests, plan& p) const
{
    if(!settings_.enabled || hot.empty()) { return 0; }
    if(ledger.occupied_bytes() > p.storage_budget)
    {
        log(log::priority::high, "occupied space (%s) exceeds budget (%s), not matching",
            util::format_size(ledger.occupied_bytes()).c_str(),
            util::format_size(p.storage_budget).c_str());
        return 0;
    }

    std::sort(hot.begin(), hot.end(), [](const auto& a, const auto& b)
        {
            if(a.record.size != b.record.size) { return a.record.size < b.record.size; }
            return a.record.key < b.record.key;
        });

    // a hot torrent whose manifest could not be fetched is not retried for other
    // clusters
    std::vector<bool> is_unavailable(hot.size(), false);
    int num_fetches = 0;
    int num_matches = 0;

    // Only clusters resident before matching are considered. Those pending a
    // download have no complete member to seed from anyway.
    for(const cluster_index_t c : ledger.resident_clusters())
    {
        const record_index_t source = ledger.complete_member(c);
        if(source == invalid_index) { continue; }
        const bytes_t target = ledger.clusters()[c].effective_size;

        for(int i = 0; i < int(hot.size()); ++i)
        {
            if(settings_.max_cross_seeds != values::unlimited
               && num_matches >= settings_.max_cross_seeds)
            {
                log(log::priority::normal, "reached cross-seed limit (%i)", num_matches);
                return num_matches;
            }

            auto& candidate = hot[i];
            const auto& key = candidate.record.key;
            // sorted by size, so nothing after this can fit the window
            if(candidate.record.size > target
               && !is_within_size_window(candidate.record.size, target)) { break; }
            if(!is_within_size_window(candidate.record.size, target)
               || is_unavailable[i]
               || ledger.contains(key)
               || ledger.has_member_from(c, candidate.record.origin()))
            {
                continue;
            }

            if(!candidate.record.manifest.is_known())
            {
                if(settings_.max_manifest_fetches != values::unlimited
                   && num_fetches >= settings_.max_manifest_fetches)
                {
                    continue;
                }
                ++num_fetches;
                error_code error;
                file_manifest manifest = manifests.fetch_manifest(key, error);
                if(error || !manifest.is_known())
                {
                    is_unavailable[i] = true;
                    log(log::priority::normal, "no manifest for %s: %s",
                        to_string(key).c_str(),
                        error ? error.message().c_str() : "empty");
                    if(candidate.record.size == target)
                    {
                        plan_warning w;
                        w.key = key;
                        w.error = make_error_code(plan_errc::ambiguous_identity);
                        w.message = util::format("%s has the same size as resident %s "
                            "but its manifest could not be fetched, not cross-seeded",
                            to_string(key).c_str(),
                            to_string(ledger.record(source).key).c_str());
                        p.warnings.emplace_back(std::move(w));
                    }
                    continue;
                }
                candidate.record.manifest = std::move(manifest);
            }

            const torrent_record source_record = ledger.record(source);
            if(ledger.resolver().compare(candidate.record, source_record)
               != identity_match::identical)
            {
                continue;
            }

            error_code error;
            ledger.join_cluster(c, candidate.record, error);
            if(error)
            {
                throw std::logic_error("cannot join content cluster: " + error.message());
            }
            log(log::priority::normal, "cross-seeding %s from %s (%s)",
                to_string(key).c_str(), to_string(source_record.key).c_str(),
                util::format_size(candidate.record.size).c_str());
            p.cross_seeded_bytes += candidate.record.size;
            p.actions.emplace_back(plan_action::make_cross_seed(
                candidate.record, candidate.score, source_record));
            ++num_matches;
        }
    }

    log(log::priority::normal, "%i cross-seeds, %i manifests fetched",
        num_matches, num_fetches);
    return num_matches;
}

bool cross_seed_matcher::is_within_size_window(
    const bytes_t size, const bytes_t target) const noexcept
{
    return std::abs(double(size - target)) <= settings_.size_tolerance * double(target);
}

template<typename... Args>
void cross_seed_matcher::log(const log::priority priority,
    const char* format, Args&&... args) const
{
#ifdef SEEDWISE_ENABLE_LOGGING
    log::log_planner("CROSS-SEED", util::format(format, std::forward<Args>(args)...),
        priority);
#endif // SEEDWISE_ENABLE_LOGGING
}

} // namespace seedwise
