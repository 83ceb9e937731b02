#ifndef SEEDWISE_TYPES_HEADER
#define SEEDWISE_TYPES_HEADER

#include <cstdint>
#include <string>
#include <tuple>

namespace seedwise {

// All sizes, budgets and traffic counters are in bytes.
using bytes_t = int64_t;

constexpr bytes_t kib = 1024;
constexpr bytes_t mib = 1024 * kib;
constexpr bytes_t gib = 1024 * mib;

// Trackers usually present sizes in decimal units, hence these.
constexpr bytes_t kb = 1000;
constexpr bytes_t mb = 1000 * kb;
constexpr bytes_t gb = 1000 * mb;

/**
 * Identifies a torrent on a single tracker. The tracker-local id is unique only
 * within its tracker, so both parts are needed for a globally unique key.
 *
 * Keys are ordered by tracker name first, then lexicographically by id, which is
 * the final tie-breaker when ranking so it must be a total order.
 */
struct torrent_key
{
    std::string tracker;
    std::string id;

    torrent_key() = default;
    torrent_key(std::string t, std::string i)
        : tracker(std::move(t))
        , id(std::move(i))
    {}

    bool empty() const noexcept { return tracker.empty() && id.empty(); }
};

inline bool operator==(const torrent_key& a, const torrent_key& b) noexcept
{
    return a.tracker == b.tracker && a.id == b.id;
}

inline bool operator!=(const torrent_key& a, const torrent_key& b) noexcept
{
    return !(a == b);
}

inline bool operator<(const torrent_key& a, const torrent_key& b) noexcept
{
    return std::tie(a.tracker, a.id) < std::tie(b.tracker, b.id);
}

inline std::string to_string(const torrent_key& key)
{
    return '[' + key.tracker + '-' + key.id + ']';
}

// Index of a record in a record arena, or of a cluster in a cluster list.
using record_index_t = int;
using cluster_index_t = int;

static constexpr int invalid_index = -1;

} // namespace seedwise

#endif // SEEDWISE_TYPES_HEADER
