#ifndef SEEDWISE_TORRENT_RECORD_HEADER
#define SEEDWISE_TORRENT_RECORD_HEADER

#include "file_manifest.hpp"
#include "types.hpp"
#include "path.hpp"

#include <string>

namespace seedwise {

/**
 * Where a record stands relative to the local client. Remote candidates are
 * `remote`; the others describe torrents the client holds.
 *
 * `kept` is the protected state (the "keep" tag): it is a state of its own rather
 * than a flag next to downloading/seeding so that every eviction check short-circuits
 * on it the same way. Whether a kept torrent has finished is told by
 * `score_inputs::bytes_left`.
 */
enum class local_state
{
    remote,
    downloading,
    seeding,
    kept
};

inline const char* to_string(const local_state s) noexcept
{
    switch(s)
    {
    case local_state::remote: return "remote";
    case local_state::downloading: return "downloading";
    case local_state::seeding: return "seeding";
    case local_state::kept: return "kept";
    default: return "";
    }
}

/**
 * The attributes a score_policy may look at. The tracker fields come from the
 * tracker listing, the rest only make sense for local records and are left at zero
 * for remote ones.
 */
struct score_inputs
{
    int seeders = 0;
    int leechers = 0;
    // Number of times the torrent has been downloaded to completion (snatches).
    int completed = 0;

    // Days since the torrent was published on its tracker.
    double age_days = 0.0;

    // Promotions. A free torrent has a download multiplier of 0, half-price 0.5,
    // "30% down" 0.3. Double upload is an upload multiplier of 2.
    bool is_free = false;
    double download_multiplier = 1.0;
    double upload_multiplier = 1.0;

    // Traffic we have already done on this torrent.
    bytes_t uploaded = 0;
    bytes_t downloaded = 0;

    // Local only.
    bytes_t bytes_left = 0;
    // Bytes per second.
    int64_t upload_rate = 0;
    // Seconds since the download completed, negative if it hasn't.
    int64_t seconds_since_completion = -1;
};

struct torrent_record
{
    torrent_key key;

    // May be unknown (empty) for remote candidates whose details were not fetched.
    file_manifest manifest;

    // Declared total size.
    bytes_t size = 0;

    score_inputs inputs;

    local_state state = local_state::remote;

    // Human readable name, only used for logging and summaries.
    std::string title;

    // Local only. The directory in which the payload lives, handed to the client
    // when another tracker's torrent is cross-seeded from these files.
    path save_path;

    const std::string& origin() const noexcept { return key.tracker; }

    bool is_local() const noexcept { return state != local_state::remote; }

    /** Local records that occupy disk space. */
    bool is_resident() const noexcept
    {
        return state == local_state::downloading
            || state == local_state::seeding
            || state == local_state::kept;
    }

    bool is_kept() const noexcept { return state == local_state::kept; }

    /** Whether the payload is fully on disk, i.e. other torrents may reuse it. */
    bool is_complete() const noexcept
    {
        return (state == local_state::seeding || state == local_state::kept)
            && inputs.bytes_left == 0;
    }
};

} // namespace seedwise

#endif // SEEDWISE_TORRENT_RECORD_HEADER
