#include <algorithm>

#include <gsl/gsl_assert>

#include "quarry/scorer/disjunction_max_scorer.hpp"

namespace quarry {

namespace {

    [[nodiscard]] auto expect_positioned(std::vector<std::unique_ptr<Scorer>> sub_scorers)
        -> std::vector<std::unique_ptr<Scorer>> {
        for (auto const& scorer: sub_scorers) {
            Expects(scorer != nullptr);
            Expects(is_positioned(scorer->docid()));
        }
        return sub_scorers;
    }

}  // namespace

DisjunctionMaxScorer::DisjunctionMaxScorer(
    float tie_breaker, std::vector<std::unique_ptr<Scorer>> sub_scorers
)
    : m_heap(expect_positioned(std::move(sub_scorers))), m_tie_breaker(tie_breaker) {}

auto DisjunctionMaxScorer::docid() const -> DocId {
    return m_doc;
}

auto DisjunctionMaxScorer::next_doc() -> DocId {
    if (m_heap.empty()) {
        return m_doc = NO_MORE_DOCS;
    }
    return m_doc = m_heap.next_after(m_doc);
}

auto DisjunctionMaxScorer::advance(DocId target) -> DocId {
    if (m_heap.empty()) {
        return m_doc = NO_MORE_DOCS;
    }
    return m_doc = m_heap.advance_to(target);
}

auto DisjunctionMaxScorer::score() -> Score {
    Expects(is_positioned(m_doc));
    auto& top = m_heap.top();
    auto const doc = top.docid();
    Score sum = top.score();
    Score max = sum;
    auto accumulate = [&sum, &max](Scorer& scorer) {
        auto sub = scorer.score();
        sum += sub;
        max = std::max(max, sub);
    };
    m_heap.for_each_on(doc, accumulate, 1);
    m_heap.for_each_on(doc, accumulate, 2);
    return max + (sum - max) * m_tie_breaker;
}

auto DisjunctionMaxScorer::tie_breaker() const noexcept -> float {
    return m_tie_breaker;
}

auto DisjunctionMaxScorer::num_scorers() const noexcept -> std::size_t {
    return m_heap.size();
}

}  // namespace quarry
