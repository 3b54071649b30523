#include <algorithm>
#include <iterator>
#include <stdexcept>

#include <gsl/gsl_assert>

#include "quarry/scorer/conjunction_scorer.hpp"

namespace quarry {

ConjunctionScorer::ConjunctionScorer(std::vector<std::unique_ptr<Scorer>> sub_scorers)
    : m_scorers(std::move(sub_scorers)) {
    if (m_scorers.empty()) {
        throw std::invalid_argument("conjunction requires at least one sub-scorer");
    }
    if (std::any_of(m_scorers.begin(), m_scorers.end(), [](auto const& s) { return !s; })) {
        throw std::invalid_argument("conjunction sub-scorer must not be null");
    }
}

auto ConjunctionScorer::docid() const -> DocId {
    return m_doc;
}

auto ConjunctionScorer::next_doc() -> DocId {
    if (m_doc == NO_MORE_DOCS) {
        return NO_MORE_DOCS;
    }
    return align(m_scorers.front()->next_doc());
}

auto ConjunctionScorer::advance(DocId target) -> DocId {
    if (m_doc != UNSTARTED && m_doc >= target) {
        return m_doc;
    }
    return align(m_scorers.front()->advance(target));
}

auto ConjunctionScorer::score() -> Score {
    Expects(is_positioned(m_doc));
    Score sum = 0.0F;
    for (auto& scorer: m_scorers) {
        sum += scorer->score();
    }
    return sum;
}

auto ConjunctionScorer::align(DocId candidate) -> DocId {
    auto& lead = *m_scorers.front();
    while (candidate != NO_MORE_DOCS) {
        auto aligned = true;
        for (auto pos = std::next(m_scorers.begin()); pos != m_scorers.end(); ++pos) {
            if (auto doc = (*pos)->advance(candidate); doc > candidate) {
                candidate = lead.advance(doc);
                aligned = false;
                break;
            }
        }
        if (aligned) {
            return m_doc = candidate;
        }
    }
    return m_doc = NO_MORE_DOCS;
}

}  // namespace quarry
