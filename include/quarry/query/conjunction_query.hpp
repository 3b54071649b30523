#pragma once

#include <memory>
#include <vector>

#include "quarry/query/query.hpp"

namespace quarry {

/// Matches documents matched by all of its clauses; scores are summed.
class ConjunctionQuery final: public Query {
  public:
    ConjunctionQuery() = default;
    explicit ConjunctionQuery(std::vector<std::unique_ptr<Query>> clauses);
    ConjunctionQuery(ConjunctionQuery const& other);
    ConjunctionQuery(ConjunctionQuery&&) = default;
    ConjunctionQuery& operator=(ConjunctionQuery const& other);
    ConjunctionQuery& operator=(ConjunctionQuery&&) = default;
    ~ConjunctionQuery() override = default;

    void add(std::unique_ptr<Query> clause);

    /** The weight's scorer is `nullptr` if there are no clauses or any clause matches nothing. */
    [[nodiscard]] auto create_weight(float boost = 1.0F) const -> std::unique_ptr<Weight> override;
    [[nodiscard]] auto to_string() const -> std::string override;
    [[nodiscard]] auto clone() const -> std::unique_ptr<Query> override;

    [[nodiscard]] auto clauses() const noexcept -> std::vector<std::unique_ptr<Query>> const&;

  private:
    std::vector<std::unique_ptr<Query>> m_clauses;
};

}  // namespace quarry
