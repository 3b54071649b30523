#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "quarry/query/disjunction_max_query.hpp"
#include "quarry/scorer/disjunction_max_scorer.hpp"

namespace quarry {

namespace {

    class DisjunctionMaxWeight final: public Weight {
      public:
        DisjunctionMaxWeight(std::vector<std::unique_ptr<Weight>> weights, float tie_breaker)
            : m_weights(std::move(weights)), m_tie_breaker(tie_breaker) {}

        [[nodiscard]] auto scorer(IndexReader const& reader) const
            -> std::unique_ptr<Scorer> override {
            std::vector<std::unique_ptr<Scorer>> scorers;
            scorers.reserve(m_weights.size());
            for (auto const& weight: m_weights) {
                auto scorer = weight->scorer(reader);
                if (scorer != nullptr && scorer->next_doc() != NO_MORE_DOCS) {
                    scorers.push_back(std::move(scorer));
                }
            }
            if (scorers.size() < m_weights.size()) {
                spdlog::debug(
                    "Dropped {} of {} disjuncts without matching documents",
                    m_weights.size() - scorers.size(),
                    m_weights.size()
                );
            }
            if (scorers.empty()) {
                return nullptr;
            }
            return std::make_unique<DisjunctionMaxScorer>(m_tie_breaker, std::move(scorers));
        }

      private:
        std::vector<std::unique_ptr<Weight>> m_weights;
        float m_tie_breaker;
    };

    [[nodiscard]] auto clone_all(std::vector<std::unique_ptr<Query>> const& queries)
        -> std::vector<std::unique_ptr<Query>> {
        std::vector<std::unique_ptr<Query>> clones;
        clones.reserve(queries.size());
        for (auto const& query: queries) {
            clones.push_back(query->clone());
        }
        return clones;
    }

}  // namespace

DisjunctionMaxQuery::DisjunctionMaxQuery(float tie_breaker) : m_tie_breaker(tie_breaker) {}

DisjunctionMaxQuery::DisjunctionMaxQuery(
    std::vector<std::unique_ptr<Query>> disjuncts, float tie_breaker
)
    : m_disjuncts(std::move(disjuncts)), m_tie_breaker(tie_breaker) {}

DisjunctionMaxQuery::DisjunctionMaxQuery(DisjunctionMaxQuery const& other)
    : Query(other), m_disjuncts(clone_all(other.m_disjuncts)), m_tie_breaker(other.m_tie_breaker) {}

DisjunctionMaxQuery& DisjunctionMaxQuery::operator=(DisjunctionMaxQuery const& other) {
    if (this != &other) {
        Query::operator=(other);
        m_disjuncts = clone_all(other.m_disjuncts);
        m_tie_breaker = other.m_tie_breaker;
    }
    return *this;
}

void DisjunctionMaxQuery::add(std::unique_ptr<Query> disjunct) {
    m_disjuncts.push_back(std::move(disjunct));
}

auto DisjunctionMaxQuery::create_weight(float boost) const -> std::unique_ptr<Weight> {
    std::vector<std::unique_ptr<Weight>> weights;
    weights.reserve(m_disjuncts.size());
    for (auto const& disjunct: m_disjuncts) {
        weights.push_back(disjunct->create_weight(boost * this->boost()));
    }
    return std::make_unique<DisjunctionMaxWeight>(std::move(weights), m_tie_breaker);
}

auto DisjunctionMaxQuery::to_string() const -> std::string {
    std::vector<std::string> clauses;
    clauses.reserve(m_disjuncts.size());
    for (auto const& disjunct: m_disjuncts) {
        clauses.push_back(disjunct->to_string());
    }
    auto tie_breaker = m_tie_breaker != 0.0F ? fmt::format("~{}", m_tie_breaker) : std::string();
    return fmt::format("({}){}{}", fmt::join(clauses, " | "), tie_breaker, boost_suffix());
}

auto DisjunctionMaxQuery::clone() const -> std::unique_ptr<Query> {
    return std::make_unique<DisjunctionMaxQuery>(*this);
}

auto DisjunctionMaxQuery::tie_breaker() const noexcept -> float {
    return m_tie_breaker;
}

auto DisjunctionMaxQuery::disjuncts() const noexcept -> std::vector<std::unique_ptr<Query>> const& {
    return m_disjuncts;
}

}  // namespace quarry
