#include <limits>

#include <spdlog/spdlog.h>

#include "quarry/search.hpp"

namespace quarry {

auto collect_all(Scorer& scorer) -> std::vector<ScoredDocument> {
    std::vector<ScoredDocument> matches;
    for (auto doc = scorer.next_doc(); doc != NO_MORE_DOCS; doc = scorer.next_doc()) {
        matches.push_back(ScoredDocument{doc, scorer.score()});
    }
    return matches;
}

void collect(Scorer& scorer, topk_queue& topk) {
    for (auto doc = scorer.next_doc(); doc != NO_MORE_DOCS; doc = scorer.next_doc()) {
        topk.insert(scorer.score(), doc);
    }
}

auto search(IndexReader const& reader, Query const& query, std::size_t k)
    -> std::vector<topk_queue::entry_type> {
    spdlog::debug("Searching: {}", query.to_string());
    auto scorer = query.create_weight()->scorer(reader);
    if (scorer == nullptr) {
        return {};
    }
    topk_queue topk(k, -std::numeric_limits<Score>::infinity());
    collect(*scorer, topk);
    topk.finalize();
    return topk.topk();
}

}  // namespace quarry
