#include <algorithm>

#include <gsl/gsl_assert>

#include "quarry/scorer/value_source_scorer.hpp"

namespace quarry {

ValueSourceScorer::ValueSourceScorer(std::unique_ptr<DocValues> values, DocId max_doc, float boost)
    : m_values(std::move(values)), m_max_doc(max_doc), m_boost(boost) {
    Expects(m_values != nullptr);
}

auto ValueSourceScorer::docid() const -> DocId {
    return m_doc;
}

auto ValueSourceScorer::next_doc() -> DocId {
    if (m_doc == NO_MORE_DOCS) {
        return NO_MORE_DOCS;
    }
    return advance(m_doc + 1);
}

auto ValueSourceScorer::advance(DocId target) -> DocId {
    if (m_doc != UNSTARTED && m_doc >= target) {
        return m_doc;
    }
    m_doc = target < m_max_doc ? std::max(target, 0) : NO_MORE_DOCS;
    return m_doc;
}

auto ValueSourceScorer::score() -> Score {
    Expects(is_positioned(m_doc));
    return m_boost * m_values->float_val(m_doc);
}

}  // namespace quarry
