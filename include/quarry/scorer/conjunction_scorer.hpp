#pragma once

#include <memory>
#include <vector>

#include "quarry/scorer/scorer.hpp"

namespace quarry {

/**
 * Scorer for the intersection of several sub-scorers; the score is the sum of sub-scores.
 *
 * Sub-scorers are taken unstarted. The first one leads: every candidate it produces is
 * checked against the others with `advance()`, and any sub-scorer overshooting the candidate
 * moves the leader forward.
 */
class ConjunctionScorer final: public Scorer {
  public:
    /** \throws std::invalid_argument  if `sub_scorers` is empty or contains a null scorer */
    explicit ConjunctionScorer(std::vector<std::unique_ptr<Scorer>> sub_scorers);

    [[nodiscard]] auto docid() const -> DocId override;
    auto next_doc() -> DocId override;
    auto advance(DocId target) -> DocId override;
    [[nodiscard]] auto score() -> Score override;

  private:
    auto align(DocId candidate) -> DocId;

    std::vector<std::unique_ptr<Scorer>> m_scorers;
    DocId m_doc = UNSTARTED;
};

}  // namespace quarry
