#pragma once

#include <memory>

#include "quarry/function/value_source.hpp"
#include "quarry/query/query.hpp"

namespace quarry {

/// Matches all documents and scores each with its value in a `ValueSource`.
class ValueSourceQuery final: public Query {
  public:
    explicit ValueSourceQuery(std::unique_ptr<ValueSource> source);
    ValueSourceQuery(ValueSourceQuery const& other);
    ValueSourceQuery(ValueSourceQuery&&) = default;
    ValueSourceQuery& operator=(ValueSourceQuery const& other);
    ValueSourceQuery& operator=(ValueSourceQuery&&) = default;
    ~ValueSourceQuery() override = default;

    [[nodiscard]] auto create_weight(float boost = 1.0F) const -> std::unique_ptr<Weight> override;
    [[nodiscard]] auto to_string() const -> std::string override;
    [[nodiscard]] auto clone() const -> std::unique_ptr<Query> override;

    [[nodiscard]] auto source() const noexcept -> ValueSource const&;

  private:
    std::unique_ptr<ValueSource> m_source;
};

}  // namespace quarry
