#pragma once

#include <memory>
#include <string>

#include "quarry/index_reader.hpp"
#include "quarry/scorer/scorer.hpp"

namespace quarry {

/**
 * Query-level state needed to build scorers for one query over a reader.
 */
class Weight {
  public:
    Weight();
    Weight(Weight const&);
    Weight(Weight&&);
    Weight& operator=(Weight const&);
    Weight& operator=(Weight&&);
    virtual ~Weight();

    /**
     * Returns an unstarted scorer over `reader`, or `nullptr` if the query cannot match any
     * document in it.
     */
    [[nodiscard]] virtual auto scorer(IndexReader const& reader) const -> std::unique_ptr<Scorer> = 0;
};

/**
 * A query is a tree of clauses that is turned into a tree of scorers through its weight.
 *
 * Every query has a boost multiplying the scores it produces. Composite queries pass their
 * boost down to their clauses when creating weights.
 */
class Query {
  public:
    Query();
    Query(Query const&);
    Query(Query&&);
    Query& operator=(Query const&);
    Query& operator=(Query&&);
    virtual ~Query();

    /** Creates the weight of this query, with scores further multiplied by `boost`. */
    [[nodiscard]] virtual auto create_weight(float boost = 1.0F) const -> std::unique_ptr<Weight> = 0;

    /** Returns a human readable representation of the query. */
    [[nodiscard]] virtual auto to_string() const -> std::string = 0;

    [[nodiscard]] virtual auto clone() const -> std::unique_ptr<Query> = 0;

    [[nodiscard]] auto boost() const noexcept -> float;
    void set_boost(float boost) noexcept;

  protected:
    /** Returns `^boost` if the boost is not 1, or an empty string otherwise. */
    [[nodiscard]] auto boost_suffix() const -> std::string;

  private:
    float m_boost = 1.0F;
};

}  // namespace quarry
