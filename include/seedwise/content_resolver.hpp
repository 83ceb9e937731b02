#ifndef SEEDWISE_CONTENT_RESOLVER_HEADER
#define SEEDWISE_CONTENT_RESOLVER_HEADER

#include "torrent_record.hpp"
#include "file_manifest.hpp"
#include "settings.hpp"
#include "types.hpp"

#include <vector>

namespace seedwise {

enum class identity_match
{
    distinct,
    identical,
    // Only the declared sizes could be compared and they are equal. This is never
    // to be treated as identical.
    ambiguous
};

/**
 * A set of records that all resolve as the same on-disk content. Members are
 * indices into the record list the cluster was built from, in ascending order; the
 * first member is the cluster's representative.
 */
struct content_cluster
{
    std::vector<record_index_t> members;

    // The size of the representative member, as content is stored once no matter
    // how many torrents refer to it.
    bytes_t effective_size = 0;

    record_index_t representative() const noexcept
    {
        return members.empty() ? invalid_index : members.front();
    }
};

/**
 * Decides whether torrents are the same content by comparing their file manifests
 * as unordered sets of (path, length) pairs.
 */
class content_resolver
{
    identity_settings settings_;

public:

    content_resolver() = default;
    explicit content_resolver(identity_settings s) : settings_(std::move(s)) {}

    const identity_settings& settings() const noexcept { return settings_; }

    /**
     * Whether both manifests are known and describe the same set of files. An
     * unknown manifest is never identical to anything, not even another unknown one.
     */
    bool identical(const file_manifest& a, const file_manifest& b) const;

    /**
     * Compares two records. If both manifests are known, the result is `identical`
     * or `distinct`. If either is unknown and the size fallback is enabled, equal
     * declared sizes yield `ambiguous`.
     */
    identity_match compare(const torrent_record& a, const torrent_record& b) const;

    /**
     * Partitions `records` into clusters of identical content, each record in
     * exactly one cluster. Records with unknown manifests form clusters of their
     * own. Clusters are ordered by their smallest member index.
     */
    std::vector<content_cluster> cluster(const std::vector<torrent_record>& records) const;
};

} // namespace seedwise

#endif // SEEDWISE_CONTENT_RESOLVER_HEADER
