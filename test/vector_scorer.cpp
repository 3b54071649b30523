#include <algorithm>
#include <iterator>

#include <fmt/format.h>
#include <gsl/gsl_assert>

#include "vector_scorer.hpp"

using quarry::DocId;
using quarry::NO_MORE_DOCS;
using quarry::Score;
using quarry::UNSTARTED;

VectorScorer::VectorScorer(std::vector<DocId> documents, std::vector<Score> scores)
    : m_documents(std::move(documents)), m_scores(std::move(scores)) {
    Expects(m_documents.size() == m_scores.size());
    Expects(std::is_sorted(m_documents.begin(), m_documents.end()));
}

VectorScorer::VectorScorer(std::vector<DocId> documents, Score score)
    : VectorScorer(documents, std::vector<Score>(documents.size(), score)) {}

auto VectorScorer::docid() const -> DocId {
    return m_doc;
}

auto VectorScorer::next_doc() -> DocId {
    m_calls->next_doc += 1;
    if (m_doc == NO_MORE_DOCS) {
        return NO_MORE_DOCS;
    }
    return position_at(m_doc == UNSTARTED ? 0 : m_position + 1);
}

auto VectorScorer::advance(DocId target) -> DocId {
    m_calls->advance += 1;
    if (m_doc != UNSTARTED && m_doc >= target) {
        return m_doc;
    }
    auto pos = std::lower_bound(m_documents.begin(), m_documents.end(), target);
    return position_at(static_cast<std::size_t>(std::distance(m_documents.begin(), pos)));
}

auto VectorScorer::score() -> Score {
    m_calls->score += 1;
    Expects(quarry::is_positioned(m_doc));
    return m_scores[m_position];
}

void VectorScorer::fail_on(DocId doc) {
    m_failing_document = doc;
}

auto VectorScorer::calls() const -> std::shared_ptr<ScorerCalls> {
    return m_calls;
}

auto VectorScorer::position_at(std::size_t position) -> DocId {
    auto doc = position < m_documents.size() ? m_documents[position] : NO_MORE_DOCS;
    if (m_failing_document && *m_failing_document == doc) {
        throw ScorerFailure(fmt::format("Cannot read document {}", doc));
    }
    m_position = position;
    m_doc = doc;
    return m_doc;
}

auto primed_scorer(std::vector<DocId> documents, std::vector<Score> scores)
    -> std::unique_ptr<quarry::Scorer> {
    auto scorer = std::make_unique<VectorScorer>(std::move(documents), std::move(scores));
    scorer->next_doc();
    return scorer;
}

auto drain(quarry::DocIterator& iterator) -> std::vector<DocId> {
    std::vector<DocId> documents;
    for (auto doc = iterator.next_doc(); doc != NO_MORE_DOCS; doc = iterator.next_doc()) {
        documents.push_back(doc);
    }
    return documents;
}
