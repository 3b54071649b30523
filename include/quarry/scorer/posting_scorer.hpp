#pragma once

#include <cstdint>
#include <functional>

#include "quarry/index_reader.hpp"
#include "quarry/scorer/scorer.hpp"

namespace quarry {

/// Computes the score of a term in a document given its frequency.
using TermScorer = std::function<float(DocId, std::uint32_t)>;

/// Scores a document with the raw term frequency.
[[nodiscard]] auto frequency_scorer() -> TermScorer;

/// Folds a query weight into a term scorer.
[[nodiscard]] auto resolve_term_scorer(TermScorer scorer, float weight) -> TermScorer;

/**
 * Leaf scorer iterating over the postings of a single term.
 *
 * `advance()` binary-searches the remaining postings instead of stepping through them.
 */
class PostingScorer final: public Scorer {
  public:
    PostingScorer(PostingList postings, TermScorer term_scorer, float weight = 1.0F);

    [[nodiscard]] auto docid() const -> DocId override;
    auto next_doc() -> DocId override;
    auto advance(DocId target) -> DocId override;
    [[nodiscard]] auto score() -> Score override;

    /** Frequency of the term in the current document. */
    [[nodiscard]] auto freq() const -> std::uint32_t;
    [[nodiscard]] auto weight() const noexcept -> float;
    [[nodiscard]] auto size() const noexcept -> std::size_t;

  private:
    auto position_at(std::size_t position) -> DocId;

    PostingList m_postings;
    float m_weight;
    TermScorer m_term_scorer;
    std::size_t m_position = 0;
    DocId m_doc = UNSTARTED;
};

}  // namespace quarry
