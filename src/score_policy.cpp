#include "score_policy.hpp"

#include <algorithm>
#include <stdexcept>
#include <cmath>
#include <limits>

namespace seedwise {

double piecewise_linear(const std::vector<std::pair<double, double>>& points, double x)
{
    if(points.empty()) {
        throw std::invalid_argument("piecewise_linear needs at least one point");
    }
    if(x < points.front().first) { return points.front().second; }
    for(size_t i = 0; i + 1 < points.size(); ++i)
    {
        const auto& left = points[i];
        const auto& right = points[i + 1];
        if(left.first > right.first) {
            throw std::invalid_argument("piecewise_linear points must be ordered by x");
        }
        if(left.first <= x && x < right.first)
        {
            return (right.second - left.second) / (right.first - left.first)
                * (x - left.first) + left.second;
        }
    }
    return points.back().second;
}

double sigmoid(double x)
{
    // exp overflows to inf for large -x, which still yields the correct limit of 0
    return 1.0 / (1.0 + std::exp(-x));
}

double default_score_policy::expected_daily_ratio(const torrent_record& t) const
{
    const auto& in = t.inputs;
    // nobody to download from, or nobody to upload to
    if(in.seeders <= 0 || in.leechers <= 0) { return 0.0; }

    const double age = std::max(0.0, in.age_days);
    const double completed = in.completed;
    const double leechers = in.leechers;
    const double seeders = in.seeders;

    // young torrents' completions are still being made
    const double finished_ratio = 0.5 * sigmoid(-age + 30.0) + 0.5;
    double value = ((finished_ratio * completed + leechers * 1.5) / (age + 2.0) + leechers)
        / (seeders + leechers + 1.0);
    value *= piecewise_linear(leecher_weights_, leechers);

    value *= std::max(0.0, in.upload_multiplier);

    const double discount = in.is_free
        ? 1.0
        : std::min(1.0, std::max(0.0, 1.0 - in.download_multiplier));
    value *= 1.0 + settings_.free_weight * discount;

    // Torrents that are snatched at a high rate are worth it no matter their size,
    // so the size penalty fades out as the rate goes up.
    const double size_ratio = sigmoid((finished_ratio + completed) / (age + 1.0) - 20.0);
    const double size_gb = double(t.size) / gb;
    value *= (1.0 - size_ratio) * piecewise_linear(size_weights_, size_gb) + size_ratio;

    return value;
}

double default_score_policy::score(const torrent_record& t) const
{
    const double value = expected_daily_ratio(t);
    // only a download has a cost to recover, for local torrents it's already paid
    if(!t.is_local() && value < 1.0 / settings_.cost_recovery_days) { return 0.0; }
    return value;
}

bool default_score_policy::is_evictable(const torrent_record& t) const
{
    if(t.is_kept()) { return false; }
    if(t.inputs.bytes_left > 0 || t.state == local_state::downloading) { return false; }
    if(t.inputs.upload_rate > settings_.active_upload_rate) { return false; }
    const double exemption = settings_.removal_exemption_days * 24 * 60 * 60;
    if(t.inputs.seconds_since_completion < 0
            || t.inputs.seconds_since_completion < exemption) {
        return false;
    }
    // we may be the only seeder
    if(t.inputs.seeders <= 1) { return false; }
    return true;
}

bool ranks_before(const scored_record& a, const scored_record& b) noexcept
{
    if(a.score != b.score) { return a.score > b.score; }
    if(a.record.inputs.is_free != b.record.inputs.is_free) {
        return a.record.inputs.is_free;
    }
    if(a.record.size != b.record.size) { return a.record.size < b.record.size; }
    return a.record.key < b.record.key;
}

void rank(std::vector<scored_record>& records)
{
    // NaN would break the ordering
    for(auto& r : records)
    {
        if(std::isnan(r.score)) { r.score = -std::numeric_limits<double>::infinity(); }
    }
    std::stable_sort(records.begin(), records.end(), ranks_before);
}

std::vector<scored_record> rank(std::vector<torrent_record> records,
    const score_policy& policy)
{
    std::vector<scored_record> scored;
    scored.reserve(records.size());
    for(auto& r : records)
    {
        const double s = policy.score(r);
        scored.emplace_back(std::move(r), s);
    }
    rank(scored);
    return scored;
}

} // namespace seedwise
