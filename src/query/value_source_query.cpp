#include <gsl/gsl_assert>

#include "quarry/query/value_source_query.hpp"
#include "quarry/scorer/value_source_scorer.hpp"

namespace quarry {

namespace {

    class ValueSourceWeight final: public Weight {
      public:
        ValueSourceWeight(std::unique_ptr<ValueSource> source, float boost)
            : m_source(std::move(source)), m_boost(boost) {}

        [[nodiscard]] auto scorer(IndexReader const& reader) const
            -> std::unique_ptr<Scorer> override {
            return std::make_unique<ValueSourceScorer>(
                m_source->get_values(reader), reader.max_doc(), m_boost
            );
        }

      private:
        std::unique_ptr<ValueSource> m_source;
        float m_boost;
    };

}  // namespace

ValueSourceQuery::ValueSourceQuery(std::unique_ptr<ValueSource> source)
    : m_source(std::move(source)) {
    Expects(m_source != nullptr);
}

ValueSourceQuery::ValueSourceQuery(ValueSourceQuery const& other)
    : Query(other), m_source(other.m_source->clone()) {}

ValueSourceQuery& ValueSourceQuery::operator=(ValueSourceQuery const& other) {
    if (this != &other) {
        Query::operator=(other);
        m_source = other.m_source->clone();
    }
    return *this;
}

auto ValueSourceQuery::create_weight(float boost) const -> std::unique_ptr<Weight> {
    return std::make_unique<ValueSourceWeight>(m_source->clone(), boost * this->boost());
}

auto ValueSourceQuery::to_string() const -> std::string {
    return m_source->description() + boost_suffix();
}

auto ValueSourceQuery::clone() const -> std::unique_ptr<Query> {
    return std::make_unique<ValueSourceQuery>(*this);
}

auto ValueSourceQuery::source() const noexcept -> ValueSource const& {
    return *m_source;
}

}  // namespace quarry
