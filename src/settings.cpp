#include "settings.hpp"

#include <stdexcept>

namespace seedwise {

template<typename T, typename U, typename String>
void throw_if_below(const T& v, const U& min, const String& msg)
{
    if((v != values::none) && (v < min)) throw std::invalid_argument(msg);
}

template<typename T, typename U, typename String>
void throw_if_below_allow_unlimited(const T& v, const U& min, const String& msg)
{
    if((v != values::unlimited) && (v != values::none) && (v < min))
        throw std::invalid_argument(msg);
}

static void verify(const identity_settings&) {}

static void verify(const scoring_settings& s)
{
    if(s.free_weight < 0.0) throw std::invalid_argument(
        "scoring_settings::free_weight must be 0 or more");
    if(s.cost_recovery_days <= 0.0) throw std::invalid_argument(
        "scoring_settings::cost_recovery_days must be above 0");
    if(s.removal_exemption_days < 0.0) throw std::invalid_argument(
        "scoring_settings::removal_exemption_days must be 0 or more");
    if(s.active_upload_rate < 0) throw std::invalid_argument(
        "scoring_settings::active_upload_rate must be 0 or more");
}

static void verify(const planner_settings& s)
{
    if(s.storage_budget == values::none || s.storage_budget < 0)
        throw std::invalid_argument(
            "planner_settings::storage_budget must be specified and 0 or more");
    throw_if_below_allow_unlimited(s.download_budget, bytes_t(0),
        "planner_settings::download_budget must be unlimited, none or 0 or more");
    if(s.eviction_margin < 0.0) throw std::invalid_argument(
        "planner_settings::eviction_margin must be 0 or more");
    throw_if_below_allow_unlimited(s.shortlist_size, 0,
        "planner_settings::shortlist_size must be unlimited, none or 0 or more");
    if(s.min_free_space < 0) throw std::invalid_argument(
        "planner_settings::min_free_space must be 0 or more");
}

static void verify(const cross_seed_settings& s)
{
    if(s.size_tolerance < 0.0 || s.size_tolerance >= 1.0) throw std::invalid_argument(
        "cross_seed_settings::size_tolerance must be in [0, 1)");
    throw_if_below_allow_unlimited(s.max_cross_seeds, 0,
        "cross_seed_settings::max_cross_seeds must be unlimited or 0 or more");
    throw_if_below_allow_unlimited(s.max_manifest_fetches, 0,
        "cross_seed_settings::max_manifest_fetches must be unlimited, none or 0 or more");
}

static void verify(const fetch_settings& s)
{
    throw_if_below(s.concurrency, 1, "fetch_settings::concurrency must be none or above 0");
    if(s.timeout <= seconds(0)) throw std::invalid_argument(
        "fetch_settings::timeout must be above 0");
}

void verify(const settings& s)
{
    verify(s.identity);
    verify(s.scoring);
    verify(s.planner);
    verify(s.cross_seed);
    verify(s.fetch);
}

void fill_in_defaults(settings& s)
{
    using values::none;

    auto set_if_none = [](auto& setting, auto val) { if(setting == none) setting = val; };

    // a run should not fetch more than a small fraction of the storage budget
    set_if_none(s.planner.download_budget, s.planner.storage_budget / 50);
    set_if_none(s.planner.shortlist_size, 30);
    set_if_none(s.cross_seed.max_manifest_fetches, 30);
}

} // namespace seedwise
