#ifndef SEEDWISE_STORAGE_LEDGER_HEADER
#define SEEDWISE_STORAGE_LEDGER_HEADER

#include "content_resolver.hpp"
#include "torrent_record.hpp"
#include "error_code.hpp"
#include "types.hpp"

#include <vector>
#include <map>
#include <set>

namespace seedwise {

/**
 * How a local torrent is removed from the client.
 */
enum class eviction_mode
{
    // The torrent is stopped and dropped, its files are kept because another
    // resident torrent of the same content still uses them. Frees nothing.
    file_safe,
    // The torrent is the last resident user of its content: stop it and delete its
    // data. Frees the content's effective size.
    reclaim
};

inline const char* to_string(const eviction_mode m) noexcept
{
    return m == eviction_mode::file_safe ? "file-safe" : "reclaim";
}

/**
 * The set of locally held torrents, grouped into content clusters, and the space
 * they truly occupy: each cluster is counted once, by its effective size, no matter
 * how many torrents (typically from different trackers) share its files.
 *
 * The ledger is built fresh from the client's inventory each run. The planner works
 * on a copy that it mutates as it decides (evictions, downloads, cross-seeds), and
 * the executor replays the plan on another copy to re-validate every eviction.
 * Records added during a run are called pending: they count as resident (their
 * space is reserved) but they can't be evicted.
 *
 * Mutations never perform an unsafe eviction, they report `plan_errc::unsafe_eviction`
 * instead.
 */
class storage_ledger
{
    // All records ever added to this ledger, including evicted ones. Indices into
    // this vector are stable.
    std::vector<torrent_record> records_;
    std::vector<cluster_index_t> cluster_of_;
    std::vector<bool> is_resident_;
    std::vector<bool> is_pending_;

    std::vector<content_cluster> clusters_;
    // The number of resident records per cluster.
    std::vector<int> num_resident_;

    std::map<torrent_key, record_index_t> key_index_;
    std::set<torrent_key> protected_keys_;

    content_resolver resolver_;

    bytes_t occupied_ = 0;

public:

    storage_ledger() = default;

    /**
     * `local` is the client's inventory. Records that are not resident (i.e. in
     * state `remote`) are ignored. `protected_keys` are never evicted, on top of
     * the records in state `kept`.
     */
    storage_ledger(std::vector<torrent_record> local, content_resolver resolver,
        std::set<torrent_key> protected_keys = {});

    bytes_t occupied_bytes() const noexcept { return occupied_; }

    int num_records() const noexcept { return records_.size(); }
    const torrent_record& record(const record_index_t i) const { return records_[i]; }
    const std::vector<content_cluster>& clusters() const noexcept { return clusters_; }
    const content_resolver& resolver() const noexcept { return resolver_; }

    /** Returns the index of the record with `key`, or `invalid_index`. */
    record_index_t find(const torrent_key& key) const;
    bool contains(const torrent_key& key) const { return find(key) != invalid_index; }

    cluster_index_t cluster_of(const record_index_t i) const { return cluster_of_[i]; }
    bool is_resident(const record_index_t i) const { return is_resident_[i]; }
    bool is_resident_cluster(const cluster_index_t c) const { return num_resident_[c] > 0; }

    /** Whether any member of the cluster was added during this run. */
    bool is_pending_cluster(const cluster_index_t c) const;

    /** Resident clusters in index order. */
    std::vector<cluster_index_t> resident_clusters() const;

    /** The cluster's resident members, in ascending record index order. */
    std::vector<record_index_t> resident_members(const cluster_index_t c) const;

    /**
     * Returns the first resident member whose payload is fully on disk, or
     * `invalid_index` if there's none. Only such clusters can be cross-seeded.
     */
    record_index_t complete_member(const cluster_index_t c) const;

    /** Whether the record is in state `kept` or its key is protected. */
    bool is_protected(const record_index_t i) const;
    bool has_protected_member(const cluster_index_t c) const;

    /** Whether any resident member of the cluster comes from `tracker`. */
    bool has_member_from(const cluster_index_t c, const std::string& tracker) const;

    /**
     * Looks for a resident cluster holding the same content as `r`. Returns
     * `identical` and sets `cluster` if a member's manifest matches. Otherwise, if
     * the content can't be told apart by size alone (see content_resolver::compare),
     * returns `ambiguous` and sets `cluster` to the first such cluster. Otherwise
     * returns `distinct`.
     */
    identity_match match(const torrent_record& r, cluster_index_t& cluster) const;

    /**
     * Returns the space evicting `key` would free: the cluster's effective size if
     * the record is its last resident member, 0 otherwise (or if the record is not
     * resident).
     */
    bytes_t would_free_bytes(const torrent_key& key) const;

    /**
     * The only mode in which `key` may be evicted. `reclaim` if it is the last
     * resident member of its cluster, `file_safe` otherwise.
     */
    eviction_mode eviction_mode_for(const torrent_key& key) const;

    /**
     * Whether `key` may be evicted at all: resident, not pending, not protected.
     */
    bool can_evict(const torrent_key& key) const;

    /**
     * Removes a resident record. Fails with `unsafe_eviction`, leaving the ledger
     * untouched, if the record may not be evicted or `mode` is not its eviction
     * mode. Returns the bytes freed.
     */
    bytes_t evict(const torrent_key& key, const eviction_mode mode, error_code& error);

    /**
     * Adds a remote candidate that is about to be downloaded as a new resident
     * cluster, charging its declared size.
     */
    cluster_index_t add_download(torrent_record candidate);

    /**
     * Adds a remote candidate as a member of the existing resident cluster `c`,
     * whose files it will reuse. Occupancy doesn't change. Fails with
     * `already_resident` if the key is already in the ledger, and with `unknown` if
     * the cluster is not resident.
     */
    void join_cluster(const cluster_index_t c, torrent_record candidate, error_code& error);

private:

    record_index_t add_record(torrent_record r, const bool is_pending);
    void recompute_occupied();
};

} // namespace seedwise

#endif // SEEDWISE_STORAGE_LEDGER_HEADER
