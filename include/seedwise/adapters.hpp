#ifndef SEEDWISE_ADAPTERS_HEADER
#define SEEDWISE_ADAPTERS_HEADER

#include "torrent_record.hpp"
#include "file_manifest.hpp"
#include "error_code.hpp"
#include "types.hpp"
#include "path.hpp"

#include <string>
#include <vector>

namespace seedwise {

/**
 * Anything that can produce the manifest of a torrent by key. The planner and the
 * cross-seed matcher resolve manifests lazily through this, only for the candidates
 * they actually reach.
 */
class manifest_source
{
public:
    virtual ~manifest_source() = default;

    /**
     * Returns the manifest of `key`. On failure `error` is set and the returned
     * manifest is unknown (empty).
     */
    virtual file_manifest fetch_manifest(const torrent_key& key, error_code& error) = 0;
};

struct candidate_filter
{
    // Only list torrents that are free to download.
    bool free_only = false;
};

/**
 * The interface to a single tracker site. Each instance is an independent handle
 * with its own session state (cookies, login, captcha), so that several trackers
 * may be queried at the same time. Implementations are not required to be
 * thread-safe, but different instances are used concurrently.
 */
class tracker_adapter : public manifest_source
{
public:

    /** The tracker's name, as used in `torrent_key::tracker`. */
    virtual std::string name() const = 0;

    /** Lists the tracker's current download candidates, without manifests. */
    virtual std::vector<torrent_record> list_candidates(
        const candidate_filter& filter, error_code& error) = 0;

    /** Lists promoted or popular torrents, considered for cross-seeding. */
    virtual std::vector<torrent_record> list_hot_torrents(error_code& error) = 0;
};

/**
 * The interface to the BitTorrent client. Only the engine's inventory queries and
 * the plan executor call it.
 */
class client_adapter
{
public:
    virtual ~client_adapter() = default;

    /**
     * Lists all torrents the client manages, with manifests, states and (for
     * torrents matched to a tracker) keys.
     */
    virtual std::vector<torrent_record> list_local_torrents(error_code& error) = 0;

    /** The free space of the download volume, in bytes. */
    virtual bytes_t free_space(error_code& error) = 0;

    virtual void start_download(const torrent_key& key, error_code& error) = 0;

    /**
     * Adds `key` to the client with its save path set to `existing_files`, skipping
     * the download. The client is expected to verify that the layout matches before
     * skipping the hash check.
     */
    virtual void register_cross_seed(const torrent_key& key, const path& existing_files,
        error_code& error) = 0;

    /** Removes the torrent from the client but keeps its files. */
    virtual void stop(const torrent_key& key, error_code& error) = 0;

    /** Removes the torrent and deletes its files. */
    virtual void stop_and_delete(const torrent_key& key, error_code& error) = 0;
};

} // namespace seedwise

#endif // SEEDWISE_ADAPTERS_HEADER
