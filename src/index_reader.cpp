#include <atomic>

#include "quarry/index_reader.hpp"

namespace quarry {

namespace {

    /// Source of reader IDs and generations, shared so that no value is ever handed out twice.
    [[nodiscard]] auto fresh_identity() noexcept -> std::uint64_t {
        static std::atomic<std::uint64_t> next{0};
        return next.fetch_add(1, std::memory_order_relaxed);
    }

}  // namespace

IndexReader::IndexReader() : m_id(fresh_identity()), m_generation(fresh_identity()) {}
IndexReader::IndexReader(IndexReader const&) : IndexReader() {}
IndexReader::IndexReader(IndexReader&&) : IndexReader() {}

IndexReader& IndexReader::operator=(IndexReader const&) {
    bump_generation();
    return *this;
}

IndexReader& IndexReader::operator=(IndexReader&&) {
    bump_generation();
    return *this;
}

IndexReader::~IndexReader() = default;

void IndexReader::bump_generation() noexcept {
    m_generation = fresh_identity();
}

auto IndexReader::doc_freq(std::string_view field, std::string_view term) const -> std::size_t {
    if (auto list = postings(field, term); list.has_value()) {
        return list->size();
    }
    return 0;
}

auto MemoryIndex::add_document(std::vector<Field> const& fields) -> DocId {
    auto docid = m_num_docs++;
    bump_generation();
    for (auto const& field: fields) {
        std::map<std::string_view, std::uint32_t> counts;
        for (auto const& term: field.terms) {
            counts[term] += 1;
        }
        auto& field_postings = m_fields[field.name];
        for (auto [term, freq]: counts) {
            auto pos = field_postings.find(term);
            if (pos == field_postings.end()) {
                pos = field_postings.emplace(std::string(term), Postings{}).first;
            }
            // The same field name may appear more than once in a document.
            auto& postings = pos->second;
            if (not postings.documents.empty() && postings.documents.back() == docid) {
                postings.frequencies.back() += freq;
            } else {
                postings.documents.push_back(docid);
                postings.frequencies.push_back(freq);
            }
        }
    }
    return docid;
}

auto MemoryIndex::max_doc() const -> DocId {
    return m_num_docs;
}

auto MemoryIndex::postings(std::string_view field, std::string_view term) const
    -> std::optional<PostingList> {
    auto field_pos = m_fields.find(field);
    if (field_pos == m_fields.end()) {
        return std::nullopt;
    }
    auto term_pos = field_pos->second.find(term);
    if (term_pos == field_pos->second.end()) {
        return std::nullopt;
    }
    auto const& postings = term_pos->second;
    return PostingList{
        gsl::span<DocId const>(postings.documents),
        gsl::span<std::uint32_t const>(postings.frequencies)};
}

auto MemoryIndex::terms(std::string_view field) const -> std::vector<std::string> {
    std::vector<std::string> terms;
    if (auto pos = m_fields.find(field); pos != m_fields.end()) {
        terms.reserve(pos->second.size());
        for (auto const& [term, postings]: pos->second) {
            terms.push_back(term);
        }
    }
    return terms;
}

}  // namespace quarry
