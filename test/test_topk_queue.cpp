#define CATCH_CONFIG_MAIN
#include "catch2/catch.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <vector>

#include <rapidcheck.h>

#include "quarry/topk_queue.hpp"

using namespace rc;
using quarry::DocId;

/// Scale scores to (0, 1] to get smaller score differences.
auto scale_unit(float score) -> float
{
    return std::max(score / std::numeric_limits<float>::max(), std::numeric_limits<float>::min());
}

auto gen_postings(int min_length, int max_length)
{
    return gen::mapcat(gen::inRange(min_length, max_length), [](int length) {
        return rc::gen::pair(
            gen::container<std::vector<float>>(length, gen::map(gen::positive<float>(), scale_unit)),
            gen::unique<std::vector<DocId>>(length, gen::positive<DocId>()));
    });
}

void accumulate(quarry::topk_queue& topk, std::vector<float> const& scores, std::vector<DocId> const& docids)
{
    for (std::size_t posting = 0; posting < docids.size(); ++posting) {
        topk.insert(scores[posting], docids[posting]);
    }
}

auto kth(std::vector<float> scores, int k) -> float
{
    std::sort(scores.begin(), scores.end(), std::greater{});
    return scores.at(k - 1);
}

TEST_CASE("Insert and finalize", "[topk_queue][unit]")
{
    quarry::topk_queue topk(3);
    REQUIRE(topk.capacity() == 3);
    REQUIRE(topk.insert(1.0F, 10));
    REQUIRE(topk.insert(3.0F, 11));
    REQUIRE_FALSE(topk.insert(0.0F, 12));
    REQUIRE(topk.insert(2.0F, 13));
    REQUIRE(topk.size() == 3);
    REQUIRE(topk.true_threshold() == 1.0F);
    REQUIRE(topk.insert(2.0F, 5));
    REQUIRE_FALSE(topk.insert(2.0F, 20));
    REQUIRE(topk.size() == 3);
    topk.finalize();
    using entry = quarry::topk_queue::entry_type;
    REQUIRE(topk.topk() == std::vector<entry>{{3.0F, 11}, {2.0F, 5}, {2.0F, 13}});

    topk.clear();
    REQUIRE(topk.size() == 0);
    REQUIRE(topk.effective_threshold() == 0.0F);
}

TEST_CASE("Zero capacity", "[topk_queue][unit]")
{
    quarry::topk_queue topk(0);
    REQUIRE_FALSE(topk.would_enter(1.0F));
    REQUIRE_FALSE(topk.insert(1.0F, 0));
    REQUIRE(topk.topk().empty());
}

TEST_CASE("Negative initial threshold admits every finite score", "[topk_queue][unit]")
{
    quarry::topk_queue topk(5, -std::numeric_limits<float>::infinity());
    REQUIRE(topk.insert(0.0F, 1));
    REQUIRE(topk.insert(-2.0F, 2));
    topk.finalize();
    REQUIRE(topk.topk().back().second == 2);
}

TEST_CASE("Threshold", "[topk_queue][prop]")
{
    SECTION("When initial = 0.0, the final threshold is the k-th score")
    {
        check([] {
            auto [scores, docids] = *gen_postings(10, 1000);

            quarry::topk_queue topk(10);
            accumulate(topk, scores, docids);

            auto expected = kth(scores, 10);
            REQUIRE(topk.true_threshold() == expected);
            REQUIRE(topk.effective_threshold() == expected);
            REQUIRE(topk.initial_threshold() == 0.0);
        });
    }

    SECTION("When too few postings, then final threshold 0.0")
    {
        check([] {
            auto [scores, docids] = *gen_postings(1, 9);
            quarry::topk_queue topk(10);
            accumulate(topk, scores, docids);
            REQUIRE(topk.true_threshold() == 0.0);
            REQUIRE(topk.effective_threshold() == 0.0);
        });
    }

    SECTION("When initial is exact, final is the same")
    {
        check([] {
            auto [scores, docids] = *gen_postings(10, 1000);
            auto initial = kth(scores, 10);
            quarry::topk_queue topk(10, initial);
            accumulate(topk, scores, docids);
            REQUIRE(topk.true_threshold() == initial);
            REQUIRE(topk.effective_threshold() == initial);
        });
    }

    SECTION("When initial is too high, true is lower than effective")
    {
        check([] {
            auto [scores, docids] = *gen_postings(10, 1000);
            auto initial = std::nextafter(kth(scores, 10), std::numeric_limits<float>::max());
            quarry::topk_queue topk(10, initial);
            accumulate(topk, scores, docids);
            REQUIRE(topk.true_threshold() < topk.effective_threshold());
        });
    }

    SECTION("Threshold never decreases")
    {
        check([] {
            auto [scores, docids] = *gen_postings(10, 1000);

            // Pick a document to use as threshold
            auto n = *gen::inRange<std::size_t>(0, docids.size());
            quarry::topk_queue topk(10, scores[n]);

            std::vector<float> thresholds;
            std::vector<float> true_thresholds;
            for (std::size_t posting = 0; posting < docids.size(); ++posting) {
                topk.insert(scores[posting], docids[posting]);
                thresholds.push_back(topk.effective_threshold());
                true_thresholds.push_back(topk.true_threshold());
            }

            CAPTURE(thresholds);
            REQUIRE(std::is_sorted(thresholds.begin(), thresholds.end()));
            REQUIRE(std::is_sorted(true_thresholds.begin(), true_thresholds.end()));
        });
    }
}

TEST_CASE("Finalized entries are sorted", "[topk_queue][prop]")
{
    check([] {
        auto [scores, docids] = *gen_postings(1, 100);
        quarry::topk_queue topk(10);
        accumulate(topk, scores, docids);
        topk.finalize();
        auto const& entries = topk.topk();
        REQUIRE(entries.size() == std::min<std::size_t>(10, scores.size()));
        REQUIRE(std::is_sorted(entries.begin(), entries.end(), [](auto const& lhs, auto const& rhs) {
            return lhs.first > rhs.first;
        }));
    });
}

namespace {

auto is_min_heap(std::vector<quarry::topk_queue::entry_type> const& entries) -> bool
{
    return std::is_heap(entries.begin(), entries.end(), [](auto const& lhs, auto const& rhs) {
        return lhs.first > rhs.first;
    });
}

}  // namespace

TEST_CASE("Replacing the lowest entry keeps a min heap", "[topk_queue][unit]")
{
    quarry::topk_queue topk(3);
    REQUIRE(topk.insert(1.0F, 0));
    REQUIRE(topk.insert(5.0F, 1));
    REQUIRE(topk.insert(6.0F, 2));
    REQUIRE(topk.insert(2.0F, 3));
    REQUIRE(is_min_heap(topk.topk()));
    REQUIRE(topk.topk().front() == quarry::topk_queue::entry_type{2.0F, 3});
    REQUIRE(topk.effective_threshold() == 2.0F);
    REQUIRE(topk.insert(7.0F, 4));
    REQUIRE(is_min_heap(topk.topk()));
    REQUIRE(topk.effective_threshold() == 5.0F);
    topk.finalize();
    using entry = quarry::topk_queue::entry_type;
    REQUIRE(topk.topk() == std::vector<entry>{{7.0F, 4}, {6.0F, 2}, {5.0F, 1}});
}

TEST_CASE("Entries form a min heap after every insertion", "[topk_queue][prop]")
{
    check([] {
        auto [scores, docids] = *gen_postings(1, 200);
        auto k = *gen::inRange<std::size_t>(1, 20);
        quarry::topk_queue topk(k);
        for (std::size_t posting = 0; posting < docids.size(); ++posting) {
            topk.insert(scores[posting], docids[posting]);
            REQUIRE(is_min_heap(topk.topk()));
            REQUIRE(topk.size() <= k);
        }
    });
}
