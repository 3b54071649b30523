#pragma once

#include <string>

#include "quarry/query/query.hpp"
#include "quarry/scorer/posting_scorer.hpp"

namespace quarry {

/// Matches documents containing `term` in `field`.
class TermQuery final: public Query {
  public:
    TermQuery(std::string field, std::string term, TermScorer term_scorer = frequency_scorer());

    [[nodiscard]] auto create_weight(float boost = 1.0F) const -> std::unique_ptr<Weight> override;
    [[nodiscard]] auto to_string() const -> std::string override;
    [[nodiscard]] auto clone() const -> std::unique_ptr<Query> override;

    [[nodiscard]] auto field() const noexcept -> std::string const&;
    [[nodiscard]] auto term() const noexcept -> std::string const&;

  private:
    std::string m_field;
    std::string m_term;
    TermScorer m_term_scorer;
};

}  // namespace quarry
