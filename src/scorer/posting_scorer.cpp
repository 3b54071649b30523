#include <algorithm>
#include <iterator>

#include <gsl/gsl_assert>

#include "quarry/scorer/posting_scorer.hpp"

namespace quarry {

auto frequency_scorer() -> TermScorer {
    return [](DocId, std::uint32_t freq) { return static_cast<float>(freq); };
}

auto resolve_term_scorer(TermScorer scorer, float weight) -> TermScorer {
    if (weight == 1.0F) {
        // No multiplication necessary if weight is 1.0
        return scorer;
    }
    return [scorer = std::move(scorer), weight](DocId doc, std::uint32_t freq) {
        return weight * scorer(doc, freq);
    };
}

PostingScorer::PostingScorer(PostingList postings, TermScorer term_scorer, float weight)
    : m_postings(postings),
      m_weight(weight),
      m_term_scorer(resolve_term_scorer(std::move(term_scorer), weight)) {}

auto PostingScorer::docid() const -> DocId {
    return m_doc;
}

auto PostingScorer::next_doc() -> DocId {
    if (m_doc == NO_MORE_DOCS) {
        return NO_MORE_DOCS;
    }
    return position_at(m_doc == UNSTARTED ? 0 : m_position + 1);
}

auto PostingScorer::advance(DocId target) -> DocId {
    if (m_doc != UNSTARTED && m_doc >= target) {
        return m_doc;
    }
    auto const& documents = m_postings.documents;
    auto first = std::next(
        documents.begin(), static_cast<std::ptrdiff_t>(m_doc == UNSTARTED ? 0 : m_position)
    );
    auto pos = std::lower_bound(first, documents.end(), target);
    return position_at(static_cast<std::size_t>(std::distance(documents.begin(), pos)));
}

auto PostingScorer::score() -> Score {
    Expects(is_positioned(m_doc));
    return m_term_scorer(m_doc, m_postings.frequencies[m_position]);
}

auto PostingScorer::freq() const -> std::uint32_t {
    Expects(is_positioned(m_doc));
    return m_postings.frequencies[m_position];
}

auto PostingScorer::weight() const noexcept -> float {
    return m_weight;
}

auto PostingScorer::size() const noexcept -> std::size_t {
    return m_postings.size();
}

auto PostingScorer::position_at(std::size_t position) -> DocId {
    m_position = position;
    m_doc = position < m_postings.size() ? m_postings.documents[position] : NO_MORE_DOCS;
    return m_doc;
}

}  // namespace quarry
