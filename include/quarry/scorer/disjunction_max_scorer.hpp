#pragma once

#include <memory>
#include <vector>

#include "quarry/heap_merge.hpp"
#include "quarry/scorer/scorer.hpp"

namespace quarry {

/**
 * Scorer for the union of several sub-scorers, combining their scores with a weighted max.
 *
 * Documents matched by any sub-scorer are produced in increasing order, each exactly once.
 * The score of a document is the maximum of the scores of the sub-scorers positioned on it,
 * plus `tie_breaker` times the sum of the other scores of those sub-scorers. With a tie breaker
 * of 0 this is the pure maximum; with 1 it is the sum.
 *
 * `score()` finds the matching sub-scorers by walking the heap from the root, which is only
 * valid until the next call to `next_doc()` or `advance()`.
 */
class DisjunctionMaxScorer final: public Scorer {
  public:
    /**
     * Creates a scorer over `sub_scorers`.
     *
     * Every sub-scorer must already be positioned on its first document (`next_doc()` was called
     * and did not return `NO_MORE_DOCS`). An empty vector is valid and matches nothing.
     * The tie breaker is not validated.
     */
    DisjunctionMaxScorer(float tie_breaker, std::vector<std::unique_ptr<Scorer>> sub_scorers);

    [[nodiscard]] auto docid() const -> DocId override;
    auto next_doc() -> DocId override;
    auto advance(DocId target) -> DocId override;
    [[nodiscard]] auto score() -> Score override;

    [[nodiscard]] auto tie_breaker() const noexcept -> float;

    /** Number of sub-scorers that are not exhausted yet. */
    [[nodiscard]] auto num_scorers() const noexcept -> std::size_t;

  private:
    HeapMerge<std::unique_ptr<Scorer>> m_heap;
    float m_tie_breaker;
    DocId m_doc = UNSTARTED;
};

}  // namespace quarry
