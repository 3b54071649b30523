#include <fmt/format.h>

#include "quarry/query/term_query.hpp"

namespace quarry {

namespace {

    class TermWeight final: public Weight {
      public:
        TermWeight(std::string field, std::string term, TermScorer term_scorer, float weight)
            : m_field(std::move(field)),
              m_term(std::move(term)),
              m_term_scorer(std::move(term_scorer)),
              m_weight(weight) {}

        [[nodiscard]] auto scorer(IndexReader const& reader) const
            -> std::unique_ptr<Scorer> override {
            auto postings = reader.postings(m_field, m_term);
            if (not postings.has_value() || postings->size() == 0) {
                return nullptr;
            }
            return std::make_unique<PostingScorer>(*postings, m_term_scorer, m_weight);
        }

      private:
        std::string m_field;
        std::string m_term;
        TermScorer m_term_scorer;
        float m_weight;
    };

}  // namespace

TermQuery::TermQuery(std::string field, std::string term, TermScorer term_scorer)
    : m_field(std::move(field)), m_term(std::move(term)), m_term_scorer(std::move(term_scorer)) {}

auto TermQuery::create_weight(float boost) const -> std::unique_ptr<Weight> {
    return std::make_unique<TermWeight>(m_field, m_term, m_term_scorer, boost * this->boost());
}

auto TermQuery::to_string() const -> std::string {
    return fmt::format("{}:{}{}", m_field, m_term, boost_suffix());
}

auto TermQuery::clone() const -> std::unique_ptr<Query> {
    return std::make_unique<TermQuery>(*this);
}

auto TermQuery::field() const noexcept -> std::string const& {
    return m_field;
}

auto TermQuery::term() const noexcept -> std::string const& {
    return m_term;
}

}  // namespace quarry
