#ifndef SEEDWISE_SCORE_POLICY_HEADER
#define SEEDWISE_SCORE_POLICY_HEADER

#include "torrent_record.hpp"
#include "settings.hpp"

#include <utility>
#include <vector>

namespace seedwise {

/**
 * The desirability of a torrent. Scores only order torrents, they carry no absolute
 * meaning, so a tracker with its own promotion scheme can plug in its own policy.
 */
class score_policy
{
public:
    virtual ~score_policy() = default;

    /** Higher is more desirable. Called for both remote and local records. */
    virtual double score(const torrent_record& t) const = 0;

    /**
     * Whether a local record may be considered for eviction at all. Records in
     * state `kept` are never passed to this, they are not evictable regardless.
     * The default allows everything.
     */
    virtual bool is_evictable(const torrent_record& t) const { return true; }
};

/**
 * Estimates the share ratio a torrent would earn per day once downloaded: popularity
 * (leechers relative to the swarm, with diminishing returns), freshness (older
 * torrents attract fewer downloaders), promotion bonuses and a size penalty that
 * favours torrents which give the best return for the download volume they cost.
 */
class default_score_policy : public score_policy
{
    scoring_settings settings_;

    // (x, y) points of piecewise linear weights.
    // By size in decimal GB: tiny and huge torrents are worth less.
    std::vector<std::pair<double, double>> size_weights_ = {
        {0.0, 0.1}, {2.0, 1.0}, {15.0, 1.0}, {60.0, 0.1}, {500.0, 0.01}
    };
    // By the number of leechers: too few of them is a risk.
    std::vector<std::pair<double, double>> leecher_weights_ = {
        {0.0, 0.1}, {2.0, 0.6}, {6.0, 0.9}, {10.0, 1.0}
    };

public:

    default_score_policy() = default;
    explicit default_score_policy(scoring_settings s) : settings_(std::move(s)) {}

    double score(const torrent_record& t) const override;

    /**
     * A local torrent is spared if it is still downloading, finished recently,
     * uploads actively, or we are one of at most one seeder in its swarm.
     */
    bool is_evictable(const torrent_record& t) const override;

private:

    double expected_daily_ratio(const torrent_record& t) const;
};

/**
 * Returns a value in [min(y), max(y)] by linearly interpolating `points` (ordered by
 * x), clamped to the first and last points' y outside their range.
 */
double piecewise_linear(const std::vector<std::pair<double, double>>& points, double x);

double sigmoid(double x);

struct scored_record
{
    torrent_record record;
    double score = 0.0;

    scored_record() = default;
    scored_record(torrent_record r, double s) : record(std::move(r)), score(s) {}
};

/**
 * The ranking order: higher score first, then free torrents first, then smaller
 * size, then the lexicographically smaller key. This is a strict total order on
 * distinct keys, so rankings are reproducible.
 */
bool ranks_before(const scored_record& a, const scored_record& b) noexcept;

/** Scores every record with `policy` and sorts them by `ranks_before`. */
std::vector<scored_record> rank(std::vector<torrent_record> records,
    const score_policy& policy);

/** Sorts already scored records by `ranks_before`. NaN scores become -inf first. */
void rank(std::vector<scored_record>& records);

} // namespace seedwise

#endif // SEEDWISE_SCORE_POLICY_HEADER
