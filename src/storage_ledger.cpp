#include "storage_ledger.hpp"
#include "plan_error.hpp"

#include <cassert>

namespace seedwise {

storage_ledger::storage_ledger(std::vector<torrent_record> local,
    content_resolver resolver, std::set<torrent_key> protected_keys)
    : protected_keys_(std::move(protected_keys))
    , resolver_(std::move(resolver))
{
    for(auto& r : local)
    {
        if(!r.is_resident() || contains(r.key)) { continue; }
        key_index_.emplace(r.key, records_.size());
        records_.emplace_back(std::move(r));
    }

    clusters_ = resolver_.cluster(records_);
    cluster_of_.assign(records_.size(), invalid_index);
    for(cluster_index_t c = 0; c < int(clusters_.size()); ++c)
    {
        for(const record_index_t i : clusters_[c].members) { cluster_of_[i] = c; }
        num_resident_.push_back(clusters_[c].members.size());
    }
    is_resident_.assign(records_.size(), true);
    is_pending_.assign(records_.size(), false);
    recompute_occupied();
}

void storage_ledger::recompute_occupied()
{
    occupied_ = 0;
    for(cluster_index_t c = 0; c < int(clusters_.size()); ++c)
    {
        if(is_resident_cluster(c)) { occupied_ += clusters_[c].effective_size; }
    }
}

record_index_t storage_ledger::find(const torrent_key& key) const
{
    auto it = key_index_.find(key);
    return it == key_index_.end() ? invalid_index : it->second;
}

bool storage_ledger::is_pending_cluster(const cluster_index_t c) const
{
    for(const record_index_t i : clusters_[c].members)
    {
        if(is_pending_[i]) { return true; }
    }
    return false;
}

std::vector<cluster_index_t> storage_ledger::resident_clusters() const
{
    std::vector<cluster_index_t> resident;
    for(cluster_index_t c = 0; c < int(clusters_.size()); ++c)
    {
        if(is_resident_cluster(c)) { resident.push_back(c); }
    }
    return resident;
}

std::vector<record_index_t> storage_ledger::resident_members(const cluster_index_t c) const
{
    std::vector<record_index_t> members;
    for(const record_index_t i : clusters_[c].members)
    {
        if(is_resident_[i]) { members.push_back(i); }
    }
    return members;
}

record_index_t storage_ledger::complete_member(const cluster_index_t c) const
{
    for(const record_index_t i : clusters_[c].members)
    {
        if(is_resident_[i] && !is_pending_[i] && records_[i].is_complete()) { return i; }
    }
    return invalid_index;
}

bool storage_ledger::is_protected(const record_index_t i) const
{
    return records_[i].is_kept() || protected_keys_.count(records_[i].key) > 0;
}

bool storage_ledger::has_protected_member(const cluster_index_t c) const
{
    for(const record_index_t i : clusters_[c].members)
    {
        if(is_resident_[i] && is_protected(i)) { return true; }
    }
    return false;
}

bool storage_ledger::has_member_from(
    const cluster_index_t c, const std::string& tracker) const
{
    for(const record_index_t i : clusters_[c].members)
    {
        if(is_resident_[i] && records_[i].origin() == tracker) { return true; }
    }
    return false;
}

identity_match storage_ledger::match(const torrent_record& r, cluster_index_t& cluster) const
{
    cluster_index_t ambiguous = invalid_index;
    for(cluster_index_t c = 0; c < int(clusters_.size()); ++c)
    {
        if(!is_resident_cluster(c)) { continue; }
        for(const record_index_t i : clusters_[c].members)
        {
            if(!is_resident_[i]) { continue; }
            const auto m = resolver_.compare(r, records_[i]);
            if(m == identity_match::identical)
            {
                cluster = c;
                return m;
            }
            if(m == identity_match::ambiguous && ambiguous == invalid_index)
            {
                ambiguous = c;
            }
        }
    }
    if(ambiguous != invalid_index)
    {
        cluster = ambiguous;
        return identity_match::ambiguous;
    }
    return identity_match::distinct;
}

bytes_t storage_ledger::would_free_bytes(const torrent_key& key) const
{
    const record_index_t i = find(key);
    if(i == invalid_index || !is_resident_[i]) { return 0; }
    const cluster_index_t c = cluster_of_[i];
    return num_resident_[c] == 1 ? clusters_[c].effective_size : 0;
}

eviction_mode storage_ledger::eviction_mode_for(const torrent_key& key) const
{
    const record_index_t i = find(key);
    if(i == invalid_index || !is_resident_[i]) { return eviction_mode::file_safe; }
    return num_resident_[cluster_of_[i]] == 1
        ? eviction_mode::reclaim
        : eviction_mode::file_safe;
}

bool storage_ledger::can_evict(const torrent_key& key) const
{
    const record_index_t i = find(key);
    return i != invalid_index && is_resident_[i] && !is_pending_[i] && !is_protected(i);
}

bytes_t storage_ledger::evict(
    const torrent_key& key, const eviction_mode mode, error_code& error)
{
    error.clear();
    if(!can_evict(key) || mode != eviction_mode_for(key))
    {
        error = make_error_code(plan_errc::unsafe_eviction);
        return 0;
    }
    const bytes_t freed = would_free_bytes(key);
    const record_index_t i = find(key);
    is_resident_[i] = false;
    --num_resident_[cluster_of_[i]];
    occupied_ -= freed;
    assert(occupied_ >= 0);
    return freed;
}

record_index_t storage_ledger::add_record(torrent_record r, const bool is_pending)
{
    const record_index_t i = records_.size();
    key_index_.emplace(r.key, i);
    records_.emplace_back(std::move(r));
    cluster_of_.push_back(invalid_index);
    is_resident_.push_back(true);
    is_pending_.push_back(is_pending);
    return i;
}

cluster_index_t storage_ledger::add_download(torrent_record candidate)
{
    const bytes_t size = candidate.size;
    const record_index_t i = add_record(std::move(candidate), true);
    const cluster_index_t c = clusters_.size();
    clusters_.emplace_back();
    clusters_.back().members.push_back(i);
    clusters_.back().effective_size = size;
    num_resident_.push_back(1);
    cluster_of_[i] = c;
    occupied_ += size;
    return c;
}

void storage_ledger::join_cluster(
    const cluster_index_t c, torrent_record candidate, error_code& error)
{
    error.clear();
    if(contains(candidate.key))
    {
        error = make_error_code(plan_errc::already_resident);
        return;
    }
    if(c < 0 || c >= int(clusters_.size()) || !is_resident_cluster(c))
    {
        error = make_error_code(plan_errc::unknown);
        return;
    }
    const record_index_t i = add_record(std::move(candidate), true);
    clusters_[c].members.push_back(i);
    ++num_resident_[c];
    cluster_of_[i] = c;
}

} // namespace seedwise
