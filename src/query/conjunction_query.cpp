#include <fmt/format.h>
#include <fmt/ranges.h>

#include "quarry/query/conjunction_query.hpp"
#include "quarry/scorer/conjunction_scorer.hpp"

namespace quarry {

namespace {

    class ConjunctionWeight final: public Weight {
      public:
        explicit ConjunctionWeight(std::vector<std::unique_ptr<Weight>> weights)
            : m_weights(std::move(weights)) {}

        [[nodiscard]] auto scorer(IndexReader const& reader) const
            -> std::unique_ptr<Scorer> override {
            if (m_weights.empty()) {
                return nullptr;
            }
            std::vector<std::unique_ptr<Scorer>> scorers;
            scorers.reserve(m_weights.size());
            for (auto const& weight: m_weights) {
                auto scorer = weight->scorer(reader);
                if (scorer == nullptr) {
                    return nullptr;
                }
                scorers.push_back(std::move(scorer));
            }
            return std::make_unique<ConjunctionScorer>(std::move(scorers));
        }

      private:
        std::vector<std::unique_ptr<Weight>> m_weights;
    };

}  // namespace

ConjunctionQuery::ConjunctionQuery(std::vector<std::unique_ptr<Query>> clauses)
    : m_clauses(std::move(clauses)) {}

ConjunctionQuery::ConjunctionQuery(ConjunctionQuery const& other) : Query(other) {
    m_clauses.reserve(other.m_clauses.size());
    for (auto const& clause: other.m_clauses) {
        m_clauses.push_back(clause->clone());
    }
}

ConjunctionQuery& ConjunctionQuery::operator=(ConjunctionQuery const& other) {
    if (this != &other) {
        ConjunctionQuery copy(other);
        *this = std::move(copy);
    }
    return *this;
}

void ConjunctionQuery::add(std::unique_ptr<Query> clause) {
    m_clauses.push_back(std::move(clause));
}

auto ConjunctionQuery::create_weight(float boost) const -> std::unique_ptr<Weight> {
    std::vector<std::unique_ptr<Weight>> weights;
    weights.reserve(m_clauses.size());
    for (auto const& clause: m_clauses) {
        weights.push_back(clause->create_weight(boost * this->boost()));
    }
    return std::make_unique<ConjunctionWeight>(std::move(weights));
}

auto ConjunctionQuery::to_string() const -> std::string {
    std::vector<std::string> clauses;
    clauses.reserve(m_clauses.size());
    for (auto const& clause: m_clauses) {
        clauses.push_back(fmt::format("+{}", clause->to_string()));
    }
    return fmt::format("({}){}", fmt::join(clauses, " "), boost_suffix());
}

auto ConjunctionQuery::clone() const -> std::unique_ptr<Query> {
    return std::make_unique<ConjunctionQuery>(*this);
}

auto ConjunctionQuery::clauses() const noexcept -> std::vector<std::unique_ptr<Query>> const& {
    return m_clauses;
}

}  // namespace quarry
