#pragma once

#include <cstddef>
#include <utility>
#include <vector>

#include <gsl/gsl_assert>

#include "quarry/concepts/doc_iterator.hpp"
#include "quarry/type_alias.hpp"

namespace quarry {

/// Binary min-heap of document iterators keyed by their current document ID.
///
/// The heap is stored in a vector in the usual implicit layout: the children of node `i`
/// are `2i + 1` and `2i + 2`. The cursor positioned on the smallest document is always at the
/// root. The heap owns its cursors; an exhausted cursor is destroyed when it is removed.
/// The number of live cursors is the length of the vector; removal truncates the length and
/// leaves the capacity untouched.
///
/// If a cursor throws while being moved, the exception is propagated as is and the heap must
/// not be used anymore.
template <typename Cursor>
    requires concepts::DocIteratorHandle<Cursor>
class HeapMerge {
  public:
    using cursor_type = Cursor;
    using size_type = std::size_t;

    /// Takes cursors that are already positioned on their first document, in any order, and
    /// establishes the heap property.
    explicit HeapMerge(std::vector<Cursor> cursors) : m_cursors(std::move(cursors)) { build(); }

    [[nodiscard]] auto size() const noexcept -> size_type { return m_cursors.size(); }
    [[nodiscard]] auto capacity() const noexcept -> size_type { return m_cursors.capacity(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return m_cursors.empty(); }

    /// Returns the cursor at the root, i.e., the one positioned on the smallest document.
    [[nodiscard]] auto top() -> decltype(auto) {
        Expects(not empty());
        return *m_cursors.front();
    }

    /// Returns the smallest current document, or `NO_MORE_DOCS` if the heap is empty.
    [[nodiscard]] auto top_docid() const -> DocId { return empty() ? NO_MORE_DOCS : docid(0); }

    /// Restores the heap property bottom-up over all live cursors.
    void build() {
        for (auto node = static_cast<std::ptrdiff_t>(size() / 2) - 1; node >= 0; --node) {
            sift_down(static_cast<size_type>(node));
        }
    }

    /// Moves the cursor at `root` down until neither of its children is positioned on a
    /// smaller document. Both subtrees of `root` must already be heaps.
    ///
    /// When both children are on the same document, the left one is swapped.
    void sift_down(size_type root) {
        Expects(root < size());
        auto const len = size();
        auto const doc = docid(root);
        auto idx = root;
        size_type left;
        while ((left = 2 * idx + 1) < len) {
            auto right = left + 1;
            auto next = idx;
            auto next_doc = doc;
            if (auto left_doc = docid(left); left_doc < doc) {
                next = left;
                next_doc = left_doc;
            }
            if (right < len && docid(right) < next_doc) {
                next = right;
            }
            if (next == idx) {
                return;
            }
            std::swap(m_cursors[idx], m_cursors[next]);
            idx = next;
        }
    }

    /// Removes the root cursor, replacing it with the last one and restoring the heap.
    void remove_root() {
        Expects(not empty());
        if (size() == 1) {
            m_cursors.pop_back();
            return;
        }
        m_cursors.front() = std::move(m_cursors.back());
        m_cursors.pop_back();
        sift_down(0);
    }

    /// Advances cursors until the root is positioned at or past `target`.
    ///
    /// Returns the smallest document at least `target`, or `NO_MORE_DOCS` once every cursor
    /// is exhausted (and removed).
    auto advance_to(DocId target) -> DocId {
        while (not empty()) {
            auto& cursor = *m_cursors.front();
            if (cursor.docid() >= target) {
                return cursor.docid();
            }
            if (cursor.advance(target) != NO_MORE_DOCS) {
                sift_down(0);
            } else {
                remove_root();
            }
        }
        return NO_MORE_DOCS;
    }

    /// Moves every cursor positioned on `current` to its next document.
    ///
    /// Returns the smallest document past `current`, or `NO_MORE_DOCS` once every cursor
    /// is exhausted (and removed).
    auto next_after(DocId current) -> DocId {
        while (not empty()) {
            auto& cursor = *m_cursors.front();
            if (cursor.docid() != current) {
                return cursor.docid();
            }
            if (cursor.next_doc() != NO_MORE_DOCS) {
                sift_down(0);
            } else {
                remove_root();
            }
        }
        return NO_MORE_DOCS;
    }

    /// Calls `fn` on every cursor in the subtree of `root` that is positioned on `doc`.
    ///
    /// Relies on the heap property: a node whose cursor is not on `doc` cannot have a
    /// descendant on `doc`, so its whole subtree is skipped. The cost is proportional to the
    /// number of matching cursors, not to the size of the heap.
    template <typename Fn>
    void for_each_on(DocId doc, Fn&& fn, size_type root = 0) {
        if (root < size() && docid(root) == doc) {
            fn(*m_cursors[root]);
            for_each_on(doc, fn, 2 * root + 1);
            for_each_on(doc, fn, 2 * root + 2);
        }
    }

    /// Checks that every live node is positioned at or before both of its children.
    [[nodiscard]] auto is_heap() const -> bool {
        auto const len = size();
        for (size_type node = 0; node < len; ++node) {
            for (auto child: {2 * node + 1, 2 * node + 2}) {
                if (child < len && docid(child) < docid(node)) {
                    return false;
                }
            }
        }
        return true;
    }

  private:
    [[nodiscard]] auto docid(size_type node) const -> DocId {
        return (*m_cursors[node]).docid();
    }

    std::vector<Cursor> m_cursors;
};

}  // namespace quarry
