#pragma once

#include <memory>
#include <vector>

#include "quarry/query/query.hpp"

namespace quarry {

/**
 * Matches the union of its disjuncts and scores each document with the maximum score of the
 * disjuncts matching it, plus `tie_breaker` times the scores of the other matching disjuncts.
 *
 * Typical use: searching a term in several fields, where a match in the best field should
 * dominate and a small tie breaker (e.g. 0.1) favors documents matching in more fields.
 */
class DisjunctionMaxQuery final: public Query {
  public:
    explicit DisjunctionMaxQuery(float tie_breaker = 0.0F);
    DisjunctionMaxQuery(std::vector<std::unique_ptr<Query>> disjuncts, float tie_breaker);
    DisjunctionMaxQuery(DisjunctionMaxQuery const& other);
    DisjunctionMaxQuery(DisjunctionMaxQuery&&) = default;
    DisjunctionMaxQuery& operator=(DisjunctionMaxQuery const& other);
    DisjunctionMaxQuery& operator=(DisjunctionMaxQuery&&) = default;
    ~DisjunctionMaxQuery() override = default;

    void add(std::unique_ptr<Query> disjunct);

    /**
     * The weight's scorer primes every disjunct scorer with `next_doc()` and leaves out those
     * without any document. It is `nullptr` if no disjunct is left.
     */
    [[nodiscard]] auto create_weight(float boost = 1.0F) const -> std::unique_ptr<Weight> override;

    /** Renders as `(a | b)~tie_breaker`; the suffix is omitted when the tie breaker is 0. */
    [[nodiscard]] auto to_string() const -> std::string override;
    [[nodiscard]] auto clone() const -> std::unique_ptr<Query> override;

    [[nodiscard]] auto tie_breaker() const noexcept -> float;
    [[nodiscard]] auto disjuncts() const noexcept -> std::vector<std::unique_ptr<Query>> const&;

  private:
    std::vector<std::unique_ptr<Query>> m_disjuncts;
    float m_tie_breaker;
};

}  // namespace quarry
