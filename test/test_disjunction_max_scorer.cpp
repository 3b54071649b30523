#define CATCH_CONFIG_MAIN
#include "catch2/catch.hpp"

#include <algorithm>
#include <map>
#include <memory>
#include <set>
#include <vector>

#include <rapidcheck.h>

#include "quarry/scorer/disjunction_max_scorer.hpp"
#include "vector_scorer.hpp"

using namespace quarry;
using namespace rc;

namespace {

using Postings = std::map<DocId, Score>;

auto make_scorer(float tie_breaker, std::vector<Postings> const& lists) -> DisjunctionMaxScorer {
    std::vector<std::unique_ptr<Scorer>> scorers;
    for (auto const& list: lists) {
        std::vector<DocId> documents;
        std::vector<Score> scores;
        for (auto [doc, score]: list) {
            documents.push_back(doc);
            scores.push_back(score);
        }
        scorers.push_back(primed_scorer(std::move(documents), std::move(scores)));
    }
    return DisjunctionMaxScorer(tie_breaker, std::move(scorers));
}

/// Positive scores in [1, 100] with two decimal places, so that sums stay exact enough.
const auto gen_score =
    gen::map(gen::inRange(100, 10'000), [](int value) { return static_cast<Score>(value) / 100; });

const auto gen_postings = gen::container<std::vector<Postings>>(
    gen::nonEmpty(gen::container<Postings>(gen::inRange<DocId>(0, 100), gen_score))
);

struct Match {
    DocId docid;
    Score score;
};

auto drain_scored(DisjunctionMaxScorer& scorer) -> std::vector<Match> {
    std::vector<Match> matches;
    for (auto doc = scorer.next_doc(); doc != NO_MORE_DOCS; doc = scorer.next_doc()) {
        matches.push_back(Match{doc, scorer.score()});
    }
    return matches;
}

}  // namespace

TEST_CASE("Weighted max of two sub-scorers", "[disjunction_max_scorer][unit]")
{
    auto scorer = make_scorer(0.5F, {{{1, 0.5F}, {3, 0.9F}}, {{2, 0.4F}, {3, 0.2F}}});
    REQUIRE(scorer.docid() == UNSTARTED);
    REQUIRE(scorer.num_scorers() == 2);
    REQUIRE(scorer.tie_breaker() == 0.5F);

    REQUIRE(scorer.next_doc() == 1);
    REQUIRE(scorer.score() == Approx(0.5F));
    REQUIRE(scorer.next_doc() == 2);
    REQUIRE(scorer.score() == Approx(0.4F));
    REQUIRE(scorer.next_doc() == 3);
    REQUIRE(scorer.docid() == 3);
    REQUIRE(scorer.score() == Approx(1.0F));
    REQUIRE(scorer.next_doc() == NO_MORE_DOCS);
    REQUIRE(scorer.num_scorers() == 0);
}

TEST_CASE("No sub-scorers", "[disjunction_max_scorer][unit]")
{
    DisjunctionMaxScorer scorer(0.1F, {});
    REQUIRE(scorer.num_scorers() == 0);
    REQUIRE(scorer.next_doc() == NO_MORE_DOCS);
    REQUIRE(scorer.docid() == NO_MORE_DOCS);
    REQUIRE(scorer.advance(5) == NO_MORE_DOCS);
}

TEST_CASE("Exhausted scorer stays exhausted", "[disjunction_max_scorer][unit]")
{
    auto scorer = make_scorer(0.0F, {{{4, 1.0F}}, {{7, 2.0F}}});
    REQUIRE(scorer.next_doc() == 4);
    REQUIRE(scorer.next_doc() == 7);
    REQUIRE(scorer.next_doc() == NO_MORE_DOCS);
    for (int call = 0; call < 3; ++call) {
        REQUIRE(scorer.next_doc() == NO_MORE_DOCS);
        REQUIRE(scorer.advance(100) == NO_MORE_DOCS);
        REQUIRE(scorer.docid() == NO_MORE_DOCS);
        REQUIRE(scorer.num_scorers() == 0);
    }
}

TEST_CASE("Advance", "[disjunction_max_scorer][unit]")
{
    auto scorer = make_scorer(1.0F, {{{1, 1.0F}, {5, 1.0F}, {8, 1.0F}}, {{2, 2.0F}, {8, 3.0F}}});
    REQUIRE(scorer.advance(3) == 5);
    REQUIRE(scorer.score() == Approx(1.0F));
    REQUIRE(scorer.advance(5) == 5);
    REQUIRE(scorer.advance(6) == 8);
    REQUIRE(scorer.score() == Approx(4.0F));
    REQUIRE(scorer.advance(9) == NO_MORE_DOCS);
    REQUIRE(scorer.num_scorers() == 0);
}

TEST_CASE("Tie breaker of 0 and 1", "[disjunction_max_scorer][unit]")
{
    std::vector<Postings> lists{{{2, 1.0F}}, {{2, 3.0F}}, {{2, 2.0F}}};
    SECTION("0 is the maximum")
    {
        auto scorer = make_scorer(0.0F, lists);
        REQUIRE(scorer.next_doc() == 2);
        REQUIRE(scorer.score() == Approx(3.0F));
    }
    SECTION("1 is the sum")
    {
        auto scorer = make_scorer(1.0F, lists);
        REQUIRE(scorer.next_doc() == 2);
        REQUIRE(scorer.score() == Approx(6.0F));
    }
    SECTION("Negative tie breaker is accepted")
    {
        auto scorer = make_scorer(-1.0F, lists);
        REQUIRE(scorer.next_doc() == 2);
        REQUIRE(scorer.score() == Approx(0.0F));
    }
}

TEST_CASE("Score only reads matching sub-scorers", "[disjunction_max_scorer][unit]")
{
    std::vector<std::shared_ptr<ScorerCalls>> calls;
    std::vector<std::unique_ptr<Scorer>> scorers;
    for (auto documents: std::vector<std::vector<DocId>>{{1, 4}, {2, 4}, {3}, {4}, {5}, {6}}) {
        auto scorer = std::make_unique<VectorScorer>(documents, 1.0F);
        scorer->next_doc();
        calls.push_back(scorer->calls());
        scorers.push_back(std::move(scorer));
    }
    DisjunctionMaxScorer scorer(0.0F, std::move(scorers));
    REQUIRE(scorer.next_doc() == 1);
    CHECK(scorer.score() == Approx(1.0F));
    REQUIRE(calls[0]->score == 1);
    for (std::size_t idx = 1; idx < calls.size(); ++idx) {
        REQUIRE(calls[idx]->score == 0);
    }
    REQUIRE(scorer.advance(4) == 4);
    CHECK(scorer.score() == Approx(1.0F));
    REQUIRE(calls[0]->score == 2);
    REQUIRE(calls[1]->score == 1);
    REQUIRE(calls[3]->score == 1);
    REQUIRE(calls[2]->score == 0);
    REQUIRE(calls[4]->score == 0);
    REQUIRE(calls[5]->score == 0);
}

TEST_CASE("Sub-scorer failure propagates", "[disjunction_max_scorer][unit]")
{
    auto failing = std::make_unique<VectorScorer>(std::vector<DocId>{1, 3}, 1.0F);
    failing->fail_on(3);
    failing->next_doc();
    std::vector<std::unique_ptr<Scorer>> scorers;
    scorers.push_back(std::move(failing));
    scorers.push_back(primed_scorer({2, 4}, {1.0F, 1.0F}));
    DisjunctionMaxScorer scorer(0.0F, std::move(scorers));
    REQUIRE(scorer.next_doc() == 1);
    REQUIRE_THROWS_AS(scorer.next_doc(), ScorerFailure);
}

TEST_CASE("Disjunction max produces the sorted union", "[disjunction_max_scorer][prop]")
{
    rc::check([] {
        auto lists = *gen_postings;
        std::set<DocId> expected;
        for (auto const& list: lists) {
            for (auto [doc, score]: list) {
                expected.insert(doc);
            }
        }
        auto scorer = make_scorer(0.0F, lists);
        std::vector<DocId> actual;
        for (auto match: drain_scored(scorer)) {
            actual.push_back(match.docid);
        }
        REQUIRE(actual == std::vector<DocId>(expected.begin(), expected.end()));
        REQUIRE(scorer.next_doc() == NO_MORE_DOCS);
    });
}

TEST_CASE("Interleaved next_doc and advance follow the union", "[disjunction_max_scorer][prop]")
{
    rc::check([] {
        auto lists = *gen_postings;
        std::set<DocId> expected;
        for (auto const& list: lists) {
            for (auto [doc, score]: list) {
                expected.insert(doc);
            }
        }
        auto at_or_end = [&](auto pos) { return pos == expected.end() ? NO_MORE_DOCS : *pos; };
        auto scorer = make_scorer(0.5F, lists);
        DocId current = UNSTARTED;
        while (current != NO_MORE_DOCS) {
            DocId doc = 0;
            if (*gen::arbitrary<bool>()) {
                doc = scorer.next_doc();
                REQUIRE(doc == at_or_end(expected.upper_bound(current)));
            } else {
                // Targets at or below the current document must not move the scorer.
                auto target = *gen::inRange<DocId>(std::max(current, 0) - 5, 110);
                doc = scorer.advance(target);
                REQUIRE(doc == at_or_end(expected.lower_bound(std::max(target, current))));
            }
            REQUIRE(doc >= current);
            REQUIRE(scorer.docid() == doc);
            current = doc;
        }
        REQUIRE(scorer.num_scorers() == 0);
        REQUIRE(scorer.next_doc() == NO_MORE_DOCS);
        REQUIRE(scorer.advance(0) == NO_MORE_DOCS);
    });
}

TEST_CASE("Disjunction max score formula", "[disjunction_max_scorer][prop]")
{
    rc::check([] {
        auto lists = *gen_postings;
        auto tie_breaker = *gen::element(0.0F, 0.1F, 0.5F, 1.0F);
        auto scorer = make_scorer(tie_breaker, lists);
        for (auto match: drain_scored(scorer)) {
            float sum = 0.0F;
            float max = 0.0F;
            for (auto const& list: lists) {
                if (auto pos = list.find(match.docid); pos != list.end()) {
                    sum += pos->second;
                    max = std::max(max, pos->second);
                }
            }
            REQUIRE(match.score == Approx(max + (sum - max) * tie_breaker).epsilon(1e-4));
        }
    });
}
