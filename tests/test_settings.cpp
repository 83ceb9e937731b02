#include "seedwise/settings.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using namespace seedwise;

namespace {

settings valid_settings()
{
    settings s;
    s.planner.storage_budget = 500 * gb;
    return s;
}

// Returns the message of the std::invalid_argument thrown by verify.
std::string verify_error(const settings& s)
{
    try
    {
        verify(s);
    }
    catch(const std::invalid_argument& e)
    {
        return e.what();
    }
    return {};
}

bool names(const std::string& message, const std::string& field)
{
    return message.find(field) != std::string::npos;
}

} // namespace

TEST(settings, defaults_verify_once_storage_budget_is_set)
{
    EXPECT_NO_THROW(verify(valid_settings()));
    EXPECT_TRUE(names(verify_error(settings()), "planner_settings::storage_budget"));
}

TEST(settings, sentinels_are_accepted)
{
    auto s = valid_settings();
    s.planner.download_budget = values::unlimited;
    s.planner.shortlist_size = values::unlimited;
    s.cross_seed.max_cross_seeds = values::unlimited;
    s.cross_seed.max_manifest_fetches = values::unlimited;
    s.fetch.concurrency = values::none;
    EXPECT_NO_THROW(verify(s));

    s.planner.download_budget = 0;
    s.planner.shortlist_size = 0;
    EXPECT_NO_THROW(verify(s));
}

TEST(settings, out_of_range_values_name_the_field)
{
    auto s = valid_settings();
    s.planner.download_budget = -5;
    EXPECT_TRUE(names(verify_error(s), "planner_settings::download_budget"));

    s = valid_settings();
    s.planner.eviction_margin = -0.5;
    EXPECT_TRUE(names(verify_error(s), "planner_settings::eviction_margin"));

    s = valid_settings();
    s.planner.shortlist_size = -3;
    EXPECT_TRUE(names(verify_error(s), "planner_settings::shortlist_size"));

    s = valid_settings();
    s.planner.min_free_space = -1;
    EXPECT_TRUE(names(verify_error(s), "planner_settings::min_free_space"));

    s = valid_settings();
    s.scoring.cost_recovery_days = 0.0;
    EXPECT_TRUE(names(verify_error(s), "scoring_settings::cost_recovery_days"));

    s = valid_settings();
    s.scoring.free_weight = -1.0;
    EXPECT_TRUE(names(verify_error(s), "scoring_settings::free_weight"));

    s = valid_settings();
    s.cross_seed.size_tolerance = 1.0;
    EXPECT_TRUE(names(verify_error(s), "cross_seed_settings::size_tolerance"));

    s = valid_settings();
    s.cross_seed.max_cross_seeds = -7;
    EXPECT_TRUE(names(verify_error(s), "cross_seed_settings::max_cross_seeds"));

    s = valid_settings();
    s.fetch.concurrency = 0;
    EXPECT_TRUE(names(verify_error(s), "fetch_settings::concurrency"));

    s = valid_settings();
    s.fetch.timeout = seconds(0);
    EXPECT_TRUE(names(verify_error(s), "fetch_settings::timeout"));
}

TEST(settings, fill_in_defaults)
{
    auto s = valid_settings();
    fill_in_defaults(s);
    EXPECT_EQ(s.planner.download_budget, 10 * gb);
    EXPECT_EQ(s.planner.shortlist_size, 30);
    EXPECT_EQ(s.cross_seed.max_manifest_fetches, 30);
    // one thread per tracker is decided by the fetcher
    EXPECT_EQ(s.fetch.concurrency, values::none);
}

TEST(settings, fill_in_defaults_keeps_explicit_values)
{
    auto s = valid_settings();
    s.planner.download_budget = values::unlimited;
    s.planner.shortlist_size = 5;
    s.cross_seed.max_manifest_fetches = 0;
    fill_in_defaults(s);
    EXPECT_EQ(s.planner.download_budget, values::unlimited);
    EXPECT_EQ(s.planner.shortlist_size, 5);
    EXPECT_EQ(s.cross_seed.max_manifest_fetches, 0);
}
