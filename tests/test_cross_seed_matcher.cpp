#include "seedwise/cross_seed_matcher.hpp"
#include "seedwise/plan_error.hpp"
#include "fake_adapters.hpp"

#include <gtest/gtest.h>

using namespace seedwise;
using namespace seedwise::test;

namespace {

struct cross_seed_matcher_test : public ::testing::Test
{
    cross_seed_settings settings;
    fake_manifest_source manifests;
    plan p;

    const file_manifest release = single_file("Release.2020", 20 * gb);
    const file_manifest other = single_file("Other.2019", 20 * gb);

    cross_seed_matcher_test()
    {
        settings.max_manifest_fetches = values::unlimited;
        p.storage_budget = 100 * gb;
    }

    storage_ledger make_ledger(std::vector<torrent_record> local)
    {
        return storage_ledger(std::move(local), content_resolver());
    }

    // Hot torrents arrive without their manifests, those are fetched on demand.
    scored_record hot(const std::string& tracker, const std::string& id,
        const bytes_t size, const file_manifest& manifest)
    {
        auto r = make_remote(tracker, id, size);
        manifests.manifests[r.key] = manifest;
        return scored_record(std::move(r), 1.0);
    }

    int match(std::vector<scored_record> candidates, storage_ledger& ledger)
    {
        return cross_seed_matcher(settings).match(std::move(candidates), ledger, manifests, p);
    }
};

} // namespace

TEST_F(cross_seed_matcher_test, matches_identical_content_on_another_tracker)
{
    auto ledger = make_ledger({make_local("a", "1", 20 * gb, release)});
    ASSERT_EQ(match({hot("b", "5", 20 * gb, release)}, ledger), 1);

    ASSERT_EQ(p.actions.size(), 1u);
    const auto& a = p.actions[0];
    EXPECT_EQ(a.type, action_type::cross_seed);
    EXPECT_EQ(a.record.key, torrent_key("b", "5"));
    EXPECT_EQ(a.source, torrent_key("a", "1"));
    EXPECT_EQ(a.source_path.string(), "/downloads/a-1");

    EXPECT_EQ(p.cross_seeded_bytes, 20 * gb);
    EXPECT_EQ(ledger.occupied_bytes(), 20 * gb);
    EXPECT_TRUE(ledger.contains(torrent_key("b", "5")));
    EXPECT_TRUE(p.warnings.empty());
}

TEST_F(cross_seed_matcher_test, different_content_of_equal_size_is_not_matched)
{
    auto ledger = make_ledger({make_local("a", "1", 20 * gb, release)});
    EXPECT_EQ(match({hot("b", "5", 20 * gb, other)}, ledger), 0);
    EXPECT_TRUE(p.actions.empty());
    EXPECT_EQ(manifests.fetched.size(), 1u);
}

TEST_F(cross_seed_matcher_test, sizes_outside_the_window_are_never_fetched)
{
    auto ledger = make_ledger({make_local("a", "1", 20 * gb, release)});
    EXPECT_EQ(match({
        hot("b", "1", 15 * gb, release),
        hot("b", "2", 25 * gb, release),
    }, ledger), 0);
    EXPECT_TRUE(manifests.fetched.empty());
}

TEST_F(cross_seed_matcher_test, size_tolerance_widens_the_window)
{
    auto ledger = make_ledger({make_local("a", "1", 20 * gb, release)});
    // a declared size that is slightly off, e.g. because the tracker rounds it
    std::vector<scored_record> candidates = {hot("b", "5", 20 * gb + 150 * mb, release)};

    settings.size_tolerance = 0.005;
    EXPECT_EQ(match(candidates, ledger), 0);
    EXPECT_TRUE(manifests.fetched.empty());

    settings.size_tolerance = 0.01;
    EXPECT_EQ(match(candidates, ledger), 1);
}

TEST_F(cross_seed_matcher_test, skips_trackers_already_in_the_cluster)
{
    auto ledger = make_ledger({make_local("a", "1", 20 * gb, release)});
    EXPECT_EQ(match({hot("a", "9", 20 * gb, release)}, ledger), 0);
    EXPECT_TRUE(manifests.fetched.empty());
}

TEST_F(cross_seed_matcher_test, skips_torrents_already_in_the_inventory)
{
    auto ledger = make_ledger({
        make_local("a", "1", 20 * gb, release),
        make_local("b", "5", 20 * gb, other),
    });
    EXPECT_EQ(match({hot("b", "5", 20 * gb, release)}, ledger), 0);
    EXPECT_TRUE(manifests.fetched.empty());
}

TEST_F(cross_seed_matcher_test, unfinished_content_is_not_a_source)
{
    auto partial = make_local("a", "1", 20 * gb, release, local_state::downloading);
    partial.inputs.bytes_left = 5 * gb;
    auto ledger = make_ledger({partial});
    EXPECT_EQ(match({hot("b", "5", 20 * gb, release)}, ledger), 0);
    EXPECT_TRUE(manifests.fetched.empty());
}

TEST_F(cross_seed_matcher_test, failed_fetch_of_equal_size_is_a_warning)
{
    auto ledger = make_ledger({make_local("a", "1", 20 * gb, release)});
    auto candidate = hot("b", "5", 20 * gb, release);
    manifests.failing.insert(candidate.record.key);

    EXPECT_EQ(match({candidate}, ledger), 0);
    EXPECT_TRUE(p.actions.empty());
    ASSERT_EQ(p.warnings.size(), 1u);
    EXPECT_EQ(p.warnings[0].key, torrent_key("b", "5"));
    EXPECT_EQ(p.warnings[0].error, plan_errc::ambiguous_identity);
    EXPECT_FALSE(ledger.contains(torrent_key("b", "5")));
}

TEST_F(cross_seed_matcher_test, unavailable_manifest_is_not_retried)
{
    auto ledger = make_ledger({
        make_local("a", "1", 20 * gb, release),
        make_local("a", "2", 20 * gb, other),
    });
    auto candidate = hot("b", "5", 20 * gb, release);
    manifests.failing.insert(candidate.record.key);

    EXPECT_EQ(match({candidate}, ledger), 0);
    EXPECT_EQ(manifests.fetched.size(), 1u);
}

TEST_F(cross_seed_matcher_test, manifest_fetches_are_bounded)
{
    auto ledger = make_ledger({make_local("a", "1", 20 * gb, release)});
    settings.max_manifest_fetches = 1;
    // sorted by size then key, b-1 is fetched first and is different content
    EXPECT_EQ(match({
        hot("b", "2", 20 * gb, release),
        hot("b", "1", 20 * gb, other),
    }, ledger), 0);
    ASSERT_EQ(manifests.fetched.size(), 1u);
    EXPECT_EQ(manifests.fetched[0], torrent_key("b", "1"));
}

TEST_F(cross_seed_matcher_test, known_manifests_need_no_fetch)
{
    auto ledger = make_ledger({make_local("a", "1", 20 * gb, release)});
    settings.max_manifest_fetches = 0;
    EXPECT_EQ(match({scored_record(make_remote("b", "5", 20 * gb, release), 1.0)}, ledger), 1);
    EXPECT_TRUE(manifests.fetched.empty());
}

TEST_F(cross_seed_matcher_test, number_of_cross_seeds_is_bounded)
{
    auto ledger = make_ledger({make_local("a", "1", 20 * gb, release)});
    settings.max_cross_seeds = 2;
    EXPECT_EQ(match({
        hot("b", "5", 20 * gb, release),
        hot("c", "5", 20 * gb, release),
        hot("d", "5", 20 * gb, release),
    }, ledger), 2);
    EXPECT_EQ(p.num_actions(action_type::cross_seed), 2);
    EXPECT_TRUE(ledger.contains(torrent_key("b", "5")));
    EXPECT_TRUE(ledger.contains(torrent_key("c", "5")));
    EXPECT_FALSE(ledger.contains(torrent_key("d", "5")));
}

TEST_F(cross_seed_matcher_test, one_cross_seed_per_tracker_and_cluster)
{
    auto ledger = make_ledger({make_local("a", "1", 20 * gb, release)});
    EXPECT_EQ(match({
        hot("b", "5", 20 * gb, release),
        hot("b", "6", 20 * gb, release),
    }, ledger), 1);
    EXPECT_EQ(p.actions[0].record.key, torrent_key("b", "5"));
}

TEST_F(cross_seed_matcher_test, disabled_does_nothing)
{
    auto ledger = make_ledger({make_local("a", "1", 20 * gb, release)});
    settings.enabled = false;
    EXPECT_EQ(match({hot("b", "5", 20 * gb, release)}, ledger), 0);
    EXPECT_TRUE(manifests.fetched.empty());
}

TEST_F(cross_seed_matcher_test, over_budget_inventory_is_left_alone)
{
    auto ledger = make_ledger({make_local("a", "1", 20 * gb, release)});
    p.storage_budget = 10 * gb;
    EXPECT_EQ(match({hot("b", "5", 20 * gb, release)}, ledger), 0);
    EXPECT_TRUE(p.actions.empty());
}
