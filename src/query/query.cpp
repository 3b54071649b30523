#include <fmt/format.h>

#include "quarry/query/query.hpp"

namespace quarry {

Weight::Weight() = default;
Weight::Weight(Weight const&) = default;
Weight::Weight(Weight&&) = default;
Weight& Weight::operator=(Weight const&) = default;
Weight& Weight::operator=(Weight&&) = default;
Weight::~Weight() = default;

Query::Query() = default;
Query::Query(Query const&) = default;
Query::Query(Query&&) = default;
Query& Query::operator=(Query const&) = default;
Query& Query::operator=(Query&&) = default;
Query::~Query() = default;

auto Query::boost() const noexcept -> float {
    return m_boost;
}

void Query::set_boost(float boost) noexcept {
    m_boost = boost;
}

auto Query::boost_suffix() const -> std::string {
    if (m_boost == 1.0F) {
        return {};
    }
    return fmt::format("^{}", m_boost);
}

}  // namespace quarry
