#pragma once

#include <memory>

#include "quarry/function/value_source.hpp"
#include "quarry/scorer/scorer.hpp"

namespace quarry {

/// Matches every document in `[0, max_doc)` and scores it with `boost` times its value.
class ValueSourceScorer final: public Scorer {
  public:
    ValueSourceScorer(std::unique_ptr<DocValues> values, DocId max_doc, float boost = 1.0F);

    [[nodiscard]] auto docid() const -> DocId override;
    auto next_doc() -> DocId override;
    auto advance(DocId target) -> DocId override;
    [[nodiscard]] auto score() -> Score override;

  private:
    std::unique_ptr<DocValues> m_values;
    DocId m_max_doc;
    float m_boost;
    DocId m_doc = UNSTARTED;
};

}  // namespace quarry
