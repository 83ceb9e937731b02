#include "content_resolver.hpp"
#include "disjoint_set.hpp"

#include <map>

namespace seedwise {

bool content_resolver::identical(const file_manifest& a, const file_manifest& b) const
{
    if(!a.is_known() || !b.is_known()) { return false; }
    const bool case_sensitive = settings_.case_sensitive_paths;
    return a.canonical_files(case_sensitive) == b.canonical_files(case_sensitive);
}

identity_match content_resolver::compare(
    const torrent_record& a, const torrent_record& b) const
{
    if(a.manifest.is_known() && b.manifest.is_known())
    {
        return identical(a.manifest, b.manifest)
            ? identity_match::identical
            : identity_match::distinct;
    }
    if(settings_.size_fallback && a.size > 0 && a.size == b.size)
    {
        return identity_match::ambiguous;
    }
    return identity_match::distinct;
}

std::vector<content_cluster>
content_resolver::cluster(const std::vector<torrent_record>& records) const
{
    const int n = records.size();
    disjoint_set sets(n);

    // Identical manifests have identical fingerprints, so only records within the
    // same bucket need to be compared. Each bucket keeps the first record of every
    // distinct manifest seen so far, which guards against (however unlikely) digest
    // collisions.
    std::map<sha256_hash, std::vector<record_index_t>> buckets;
    for(record_index_t i = 0; i < n; ++i)
    {
        const auto& manifest = records[i].manifest;
        if(!manifest.is_known()) { continue; }
        auto& heads = buckets[manifest.fingerprint(settings_.case_sensitive_paths)];
        bool is_merged = false;
        for(const record_index_t head : heads)
        {
            if(identical(records[head].manifest, manifest))
            {
                sets.unite(head, i);
                is_merged = true;
                break;
            }
        }
        if(!is_merged) { heads.push_back(i); }
    }

    // a root is the smallest index in its set, so visiting indices in order creates
    // the clusters ordered by their smallest member
    std::vector<content_cluster> clusters;
    std::vector<cluster_index_t> cluster_of_root(n, invalid_index);
    for(record_index_t i = 0; i < n; ++i)
    {
        const int root = sets.find(i);
        if(cluster_of_root[root] == invalid_index)
        {
            cluster_of_root[root] = clusters.size();
            clusters.emplace_back();
            clusters.back().effective_size = records[i].size;
        }
        clusters[cluster_of_root[root]].members.push_back(i);
    }
    return clusters;
}

} // namespace seedwise
