#pragma once

#include "quarry/concepts/doc_iterator.hpp"
#include "quarry/doc_iterator.hpp"
#include "quarry/type_alias.hpp"

namespace quarry {

/**
 * A document iterator that can score the document it is positioned on.
 *
 * `score()` may be called only while `docid()` is a real document; calling it before the first
 * move or after exhaustion is a contract violation. The score is not cached: implementations
 * recompute it, so repeated calls for the same document must return the same value.
 */
class Scorer: public DocIterator {
  public:
    Scorer();
    Scorer(Scorer const&);
    Scorer(Scorer&&);
    Scorer& operator=(Scorer const&);
    Scorer& operator=(Scorer&&);
    ~Scorer() override;

    [[nodiscard]] virtual auto score() -> Score = 0;
};

static_assert(concepts::ScoredDocIterator<Scorer>);

}  // namespace quarry
