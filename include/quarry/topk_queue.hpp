#pragma once

#include <algorithm>
#include <cmath>
#include <iterator>
#include <utility>
#include <vector>

#include "quarry/type_alias.hpp"

namespace quarry {

/// Top-k document priority queue.
///
/// Collects (score, document) pairs produced by a scorer. This is a min heap by score; once it
/// is full (contains k elements), a new entry with a score higher than the one on the top of the
/// heap replaces the min element. The entries are not sorted until `finalize()` is called.
struct topk_queue {
    using entry_type = std::pair<Score, DocId>;

    /// Constructs a top-k priority queue with the given initial threshold.
    ///
    /// Entries with scores not above the threshold are never inserted.
    explicit topk_queue(std::size_t k, Score initial_threshold = 0.0F)
        : m_k(k), m_initial_threshold(initial_threshold) {
        m_effective_threshold = std::nextafter(m_initial_threshold, 0.0F);
        m_q.reserve(m_k + 1);
    }

    /// Inserts an entry if its score is above the current threshold; returns `true` if it was
    /// inserted. When the queue is full, the lowest entry is evicted.
    auto insert(Score score, DocId docid) -> bool {
        if (not would_enter(score)) [[unlikely]] {
            return false;
        }
        m_q.emplace_back(score, docid);
        if (m_q.size() <= m_k) [[unlikely]] {
            std::push_heap(m_q.begin(), m_q.end(), min_heap_order);
            if (m_q.size() == m_k) [[unlikely]] {
                m_effective_threshold = m_q.front().first;
            }
        } else {
            std::iter_swap(m_q.begin(), std::prev(m_q.end()));
            m_q.pop_back();
            sift_down(m_q.begin(), m_q.end());
            m_effective_threshold = m_q.front().first;
        }
        return true;
    }

    /// Checks if an entry with the given score would be inserted.
    [[nodiscard]] auto would_enter(Score score) const -> bool {
        return m_k > 0 && score > m_effective_threshold;
    }

    /// Sorts the entries by descending score; ties are broken by ascending document ID.
    ///
    /// After calling this function, the queue should no longer be modified.
    void finalize() {
        std::sort(m_q.begin(), m_q.end(), [](entry_type const& lhs, entry_type const& rhs) {
            return lhs.first > rhs.first || (lhs.first == rhs.first && lhs.second < rhs.second);
        });
    }

    /// Returns the entries; sorted only after `finalize()`.
    [[nodiscard]] auto topk() const noexcept -> std::vector<entry_type> const& { return m_q; }

    /// Score of the k-th entry, or 0.0 if the queue is not full.
    [[nodiscard]] auto true_threshold() const noexcept -> Score {
        return capacity() == size() && not m_q.empty() ? m_q.front().first : 0.0F;
    }

    [[nodiscard]] auto initial_threshold() const noexcept -> Score { return m_initial_threshold; }

    [[nodiscard]] auto effective_threshold() const noexcept -> Score {
        return m_effective_threshold;
    }

    /// Empties the queue and resets the threshold.
    void clear(Score initial_threshold = 0.0F) noexcept {
        m_q.clear();
        m_initial_threshold = initial_threshold;
        m_effective_threshold = std::nextafter(m_initial_threshold, 0.0F);
    }

    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return m_k; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return m_q.size(); }

  private:
    [[nodiscard]] constexpr static auto
    min_heap_order(entry_type const& lhs, entry_type const& rhs) noexcept -> bool {
        return lhs.first > rhs.first;
    }

    using entry_iterator_type = typename std::vector<entry_type>::iterator;

    /// Restores the heap after the root has been replaced; the rest of the range must be a heap.
    static void sift_down(entry_iterator_type first, entry_iterator_type last) {
        auto cmp = [first](std::size_t lhs, std::size_t rhs) {
            return (first + lhs)->first > (first + rhs)->first;
        };
        auto len = static_cast<std::size_t>(std::distance(first, last));
        std::size_t idx = 0;
        std::size_t right = 0;
        std::size_t left = 0;
        while ((right = 2 * (idx + 1)) < len) {
            left = right - 1;
            auto next = idx;
            if (cmp(next, left)) {
                next = left;
            }
            if (cmp(next, right)) {
                next = right;
            }
            if (next == idx) {
                return;
            }
            std::iter_swap(first + idx, first + next);
            idx = next;
        }
        if ((left = 2 * idx + 1) < len && cmp(idx, left)) {
            std::iter_swap(first + idx, first + left);
        }
    }

    std::size_t m_k;
    Score m_initial_threshold;
    std::vector<entry_type> m_q;
    Score m_effective_threshold;
};

}  // namespace quarry
