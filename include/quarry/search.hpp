#pragma once

#include <utility>
#include <vector>

#include "quarry/index_reader.hpp"
#include "quarry/query/query.hpp"
#include "quarry/scorer/scorer.hpp"
#include "quarry/topk_queue.hpp"

namespace quarry {

/// A matching document with its score.
struct ScoredDocument {
    DocId docid;
    Score score;

    [[nodiscard]] auto operator==(ScoredDocument const&) const -> bool = default;
};

/// Drives `scorer` until exhaustion and returns every match in document order.
[[nodiscard]] auto collect_all(Scorer& scorer) -> std::vector<ScoredDocument>;

/// Drives `scorer` until exhaustion, inserting every match into `topk`.
void collect(Scorer& scorer, topk_queue& topk);

/// Evaluates `query` over `reader` and returns the `k` highest scored documents, sorted by
/// descending score. Documents with equal scores are ordered by ID.
[[nodiscard]] auto search(IndexReader const& reader, Query const& query, std::size_t k)
    -> std::vector<topk_queue::entry_type>;

}  // namespace quarry
