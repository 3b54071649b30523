#pragma once

#include "quarry/type_alias.hpp"

namespace quarry {

/**
 * A monotonically increasing stream of document IDs.
 *
 * An iterator starts unstarted (`docid() == UNSTARTED`), is positioned by the first call to
 * `next_doc()` or `advance()`, and ends exhausted (`docid() == NO_MORE_DOCS`). It never moves
 * backwards, and once exhausted it stays exhausted.
 */
class DocIterator {
  public:
    DocIterator();
    DocIterator(DocIterator const&);
    DocIterator(DocIterator&&);
    DocIterator& operator=(DocIterator const&);
    DocIterator& operator=(DocIterator&&);
    virtual ~DocIterator();

    /** Returns the current document ID, `UNSTARTED`, or `NO_MORE_DOCS`. */
    [[nodiscard]] virtual auto docid() const -> DocId = 0;

    /**
     * Moves to the next document and returns its ID, or `NO_MORE_DOCS` if there are no more
     * documents. Calling it again after exhaustion returns `NO_MORE_DOCS` and has no effect.
     */
    virtual auto next_doc() -> DocId = 0;

    /**
     * Moves to the first document whose ID is at least `target` and returns it, or
     * `NO_MORE_DOCS`. If the iterator is already positioned at or past `target`, it does
     * not move.
     */
    virtual auto advance(DocId target) -> DocId = 0;
};

/** Returns `true` if `docid` names an actual document rather than a sentinel. */
[[nodiscard]] constexpr auto is_positioned(DocId docid) noexcept -> bool {
    return docid != UNSTARTED && docid != NO_MORE_DOCS;
}

}  // namespace quarry
