#ifndef SEEDWISE_PLAN_HEADER
#define SEEDWISE_PLAN_HEADER

#include "storage_ledger.hpp"
#include "torrent_record.hpp"
#include "error_code.hpp"
#include "types.hpp"
#include "path.hpp"

#include <string>
#include <vector>

namespace seedwise {

enum class action_type
{
    // Start downloading a remote candidate.
    download,
    // Remove a local torrent, in the given eviction mode.
    evict,
    // Register a remote candidate with the client, pointed at the files of a
    // complete resident torrent of the same content.
    cross_seed
};

inline const char* to_string(const action_type t) noexcept
{
    switch(t)
    {
    case action_type::download: return "download";
    case action_type::evict: return "evict";
    case action_type::cross_seed: return "cross-seed";
    default: return "";
    }
}

struct plan_action
{
    action_type type = action_type::download;

    // The candidate for downloads and cross-seeds, the local torrent for evictions.
    torrent_record record;
    double score = 0.0;

    // Evictions only.
    eviction_mode mode = eviction_mode::file_safe;
    bytes_t freed_bytes = 0;

    // Cross-seeds only: the resident torrent whose files are reused.
    torrent_key source;
    path source_path;

    static plan_action make_download(torrent_record r, double score);
    static plan_action make_evict(torrent_record r, double score,
        eviction_mode mode, bytes_t freed_bytes);
    static plan_action make_cross_seed(torrent_record r, double score,
        const torrent_record& source);
};

/** A candidate that was passed over, and why. */
struct skipped_candidate
{
    torrent_key key;
    std::string title;
    double score = 0.0;
    error_code reason;
};

/** Something the user should look at that did not stop the run. */
struct plan_warning
{
    torrent_key key;
    error_code error;
    std::string message;
};

/**
 * The outcome of a planning run: the actions to execute, in order, and what is
 * expected of them. Both `occupied_after` and `downloaded_bytes` are within their
 * budgets, unless the inventory was already over the storage budget, in which case
 * there are no downloads and a warning says so.
 */
struct plan
{
    std::vector<plan_action> actions;
    std::vector<skipped_candidate> skipped;
    std::vector<plan_warning> warnings;

    bytes_t storage_budget = 0;
    // Negative if unlimited.
    bytes_t download_budget = 0;

    bytes_t occupied_before = 0;
    bytes_t occupied_after = 0;

    bytes_t downloaded_bytes = 0;
    bytes_t freed_bytes = 0;
    // Declared sizes of cross-seeded torrents. They take up no extra space.
    bytes_t cross_seeded_bytes = 0;

    bool empty() const noexcept { return actions.empty(); }

    int num_actions(const action_type t) const noexcept;
};

/**
 * Returns a human readable summary of `p`: budgets, occupancy before and after, the
 * actions in order, skipped candidates and warnings. Equal plans produce equal
 * summaries, so this doubles as the dry-run preview.
 */
std::string to_string(const plan& p);

} // namespace seedwise

#endif // SEEDWISE_PLAN_HEADER
