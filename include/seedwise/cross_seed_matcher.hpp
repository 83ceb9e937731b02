#ifndef SEEDWISE_CROSS_SEED_MATCHER_HEADER
#define SEEDWISE_CROSS_SEED_MATCHER_HEADER

#include "storage_ledger.hpp"
#include "score_policy.hpp"
#include "adapters.hpp"
#include "settings.hpp"
#include "plan.hpp"
#include "log.hpp"

#include <vector>

namespace seedwise {

/**
 * Finds torrents on other trackers whose content we already have on disk, so they can
 * be seeded from the existing files at no storage cost.
 *
 * Only resident clusters with a completed member are considered, and for each of
 * them only hot torrents whose declared size is within `size_tolerance` of the
 * cluster's effective size, so most manifests never need to be fetched.
 */
class cross_seed_matcher
{
    cross_seed_settings settings_;

public:

    explicit cross_seed_matcher(cross_seed_settings s);

    const cross_seed_settings& settings() const noexcept { return settings_; }

    /**
     * Appends a cross-seed action to `p` for every hot torrent found to be identical
     * to a resident cluster, and has `ledger` join it to that cluster. `p` is
     * expected to be the plan made over the same `ledger`, as its storage budget is
     * honoured. Returns the number of cross-seeds added.
     */
    int match(std::vector<scored_record> hot, storage_ledger& ledger,
        manifest_source& manifests, plan& p) const;

private:

    bool is_within_size_window(const bytes_t size, const bytes_t target) const noexcept;

    template<typename... Args>
    void log(const log::priority priority, const char* format, Args&&... args) const;
};

} // namespace seedwise

#endif // SEEDWISE_CROSS_SEED_MATCHER_HEADER
