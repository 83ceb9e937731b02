#include "seedwise/catalog_fetcher.hpp"
#include "seedwise/plan_error.hpp"
#include "fake_adapters.hpp"

#include <gtest/gtest.h>

#include <memory>

using namespace seedwise;
using namespace seedwise::test;

namespace {

std::shared_ptr<fake_tracker> make_tracker(const std::string& name, const int num_candidates)
{
    auto t = std::make_shared<fake_tracker>(name);
    for(int i = 0; i < num_candidates; ++i)
    {
        t->candidates.push_back(make_remote(name, std::to_string(i), 1 * gb));
    }
    t->hot.push_back(make_remote(name, "hot", 2 * gb));
    return t;
}

} // namespace

TEST(catalog_fetcher, listings_follow_tracker_order)
{
    catalog_fetcher fetcher{fetch_settings()};
    const auto listings = fetcher.fetch(
        {make_tracker("b", 2), make_tracker("c", 3), make_tracker("d", 0)},
        candidate_filter(), true);

    ASSERT_EQ(listings.size(), 3u);
    EXPECT_EQ(listings[0].tracker, "b");
    EXPECT_EQ(listings[0].candidates.size(), 2u);
    EXPECT_EQ(listings[1].tracker, "c");
    EXPECT_EQ(listings[1].candidates.size(), 3u);
    EXPECT_EQ(listings[2].tracker, "d");
    EXPECT_TRUE(listings[2].candidates.empty());
    for(const auto& l : listings)
    {
        EXPECT_FALSE(l.error) << l.tracker << ": " << l.message;
        EXPECT_EQ(l.hot.size(), 1u);
    }
}

TEST(catalog_fetcher, hot_torrents_only_on_request)
{
    catalog_fetcher fetcher{fetch_settings()};
    const auto listings = fetcher.fetch({make_tracker("b", 1)}, candidate_filter(), false);
    ASSERT_EQ(listings.size(), 1u);
    EXPECT_EQ(listings[0].candidates.size(), 1u);
    EXPECT_TRUE(listings[0].hot.empty());
}

TEST(catalog_fetcher, filter_is_passed_to_trackers)
{
    auto tracker = make_tracker("b", 1);
    catalog_fetcher fetcher{fetch_settings()};
    candidate_filter filter;
    filter.free_only = true;
    fetcher.fetch({tracker}, filter, false);
    fetcher.join();

    std::lock_guard<std::mutex> l(tracker->mutex);
    ASSERT_EQ(tracker->filters.size(), 1u);
    EXPECT_TRUE(tracker->filters[0].free_only);
}

TEST(catalog_fetcher, failed_tracker_does_not_affect_others)
{
    auto broken = make_tracker("c", 2);
    broken->fail_listing = true;
    auto throwing = make_tracker("d", 2);
    throwing->throw_on_listing = true;

    catalog_fetcher fetcher{fetch_settings()};
    const auto listings = fetcher.fetch({make_tracker("b", 2), broken, throwing},
        candidate_filter(), true);

    ASSERT_EQ(listings.size(), 3u);
    EXPECT_FALSE(listings[0].error);
    EXPECT_EQ(listings[0].candidates.size(), 2u);

    EXPECT_EQ(listings[1].error, plan_errc::fetch_failure);
    EXPECT_TRUE(listings[1].candidates.empty());
    EXPECT_TRUE(listings[1].hot.empty());
    EXPECT_FALSE(listings[1].message.empty());

    EXPECT_EQ(listings[2].error, plan_errc::fetch_failure);
    EXPECT_EQ(listings[2].message, "tracker exploded");
}

TEST(catalog_fetcher, slow_tracker_times_out)
{
    auto slow = make_tracker("c", 2);
    slow->listing_delay = milliseconds(2500);

    fetch_settings s;
    s.timeout = seconds(1);
    catalog_fetcher fetcher(s);
    const time_point start = seedwise::clock::now();
    const auto listings = fetcher.fetch({make_tracker("b", 2), slow},
        candidate_filter(), true);
    EXPECT_LT(elapsed_since(start), milliseconds(2500));

    ASSERT_EQ(listings.size(), 2u);
    EXPECT_FALSE(listings[0].error);
    EXPECT_EQ(listings[0].candidates.size(), 2u);
    EXPECT_EQ(listings[1].tracker, "c");
    EXPECT_EQ(listings[1].error, plan_errc::fetch_timeout);
    EXPECT_TRUE(listings[1].candidates.empty());

    // the slow job still runs to completion, its results are dropped
    fetcher.join();
}

TEST(catalog_fetcher, timed_out_tracker_is_not_queried_while_busy)
{
    auto slow = make_tracker("c", 2);
    slow->listing_delay = milliseconds(2500);

    fetch_settings s;
    s.timeout = seconds(1);
    catalog_fetcher fetcher(s);
    auto listings = fetcher.fetch({slow}, candidate_filter(), false);
    ASSERT_EQ(listings.size(), 1u);
    EXPECT_EQ(listings[0].error, plan_errc::fetch_timeout);
    EXPECT_TRUE(fetcher.is_busy(*slow));

    // with nothing to query, the fetch returns right away
    listings = fetcher.fetch({slow}, candidate_filter(), false);
    ASSERT_EQ(listings.size(), 1u);
    EXPECT_EQ(listings[0].error, plan_errc::fetch_timeout);

    // the first job is still sleeping in the adapter
    auto fast = make_tracker("b", 1);
    const time_point start = seedwise::clock::now();
    listings = fetcher.fetch({fast, slow}, candidate_filter(), false);
    EXPECT_LT(elapsed_since(start), milliseconds(1000));
    ASSERT_EQ(listings.size(), 2u);
    EXPECT_FALSE(listings[0].error);
    EXPECT_EQ(listings[0].candidates.size(), 1u);
    EXPECT_EQ(listings[1].tracker, "c");
    EXPECT_EQ(listings[1].error, plan_errc::fetch_timeout);
    EXPECT_EQ(listings[1].message, "still busy with a previous query");
    {
        std::lock_guard<std::mutex> l(slow->mutex);
        EXPECT_EQ(slow->filters.size(), 1u);
    }

    fetcher.join();
    EXPECT_FALSE(fetcher.is_busy(*slow));
    slow->listing_delay = milliseconds(0);
    listings = fetcher.fetch({slow}, candidate_filter(), false);
    ASSERT_EQ(listings.size(), 1u);
    EXPECT_FALSE(listings[0].error);
    EXPECT_EQ(listings[0].candidates.size(), 2u);
    std::lock_guard<std::mutex> l(slow->mutex);
    EXPECT_EQ(slow->filters.size(), 2u);
}

TEST(catalog_fetcher, limited_concurrency_still_queries_everyone)
{
    fetch_settings s;
    s.concurrency = 1;
    catalog_fetcher fetcher(s);
    const auto listings = fetcher.fetch(
        {make_tracker("b", 1), make_tracker("c", 1), make_tracker("d", 1)},
        candidate_filter(), false);
    ASSERT_EQ(listings.size(), 3u);
    for(const auto& l : listings)
    {
        EXPECT_FALSE(l.error);
        EXPECT_EQ(l.candidates.size(), 1u);
    }
}

TEST(catalog_fetcher, fetcher_is_reusable)
{
    catalog_fetcher fetcher{fetch_settings()};
    auto tracker = make_tracker("b", 1);
    EXPECT_EQ(fetcher.fetch({tracker}, candidate_filter(), false).size(), 1u);
    EXPECT_EQ(fetcher.fetch({tracker}, candidate_filter(), false).size(), 1u);
    EXPECT_TRUE(fetcher.fetch({}, candidate_filter(), false).empty());
}
