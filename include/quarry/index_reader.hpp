#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <gsl/span>

#include "quarry/type_alias.hpp"

namespace quarry {

/// Read-only view of the postings of a single term: sorted document IDs with the number of
/// occurrences of the term in each document.
struct PostingList {
    gsl::span<DocId const> documents;
    gsl::span<std::uint32_t const> frequencies;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return documents.size(); }
};

/**
 * The part of an index that query evaluation reads from.
 *
 * How postings are stored is up to the implementation; scorers only see `PostingList` views,
 * which stay valid as long as the reader is alive and unmodified.
 */
class IndexReader {
  public:
    IndexReader();
    IndexReader(IndexReader const&);
    IndexReader(IndexReader&&);
    IndexReader& operator=(IndexReader const&);
    IndexReader& operator=(IndexReader&&);
    virtual ~IndexReader();

    /** One greater than the largest document ID in the index. */
    [[nodiscard]] virtual auto max_doc() const -> DocId = 0;

    /** Returns the postings of `term` in `field`, or `std::nullopt` if there are none. */
    [[nodiscard]] virtual auto postings(std::string_view field, std::string_view term) const
        -> std::optional<PostingList> = 0;

    /** Returns all terms of `field` in lexicographical order. */
    [[nodiscard]] virtual auto terms(std::string_view field) const -> std::vector<std::string> = 0;

    /** Number of documents containing `term` in `field`. */
    [[nodiscard]] auto doc_freq(std::string_view field, std::string_view term) const -> std::size_t;

    /**
     * Identifies this reader object. Never shared with another reader, even one constructed
     * later at the same address; copies and moved-to readers get their own.
     */
    [[nodiscard]] auto id() const noexcept -> std::uint64_t { return m_id; }

    /**
     * Identifies the current contents of this reader. Changes whenever the contents change and
     * is never reused, so values derived from the reader can be cached under it.
     */
    [[nodiscard]] auto generation() const noexcept -> std::uint64_t { return m_generation; }

  protected:
    /** Must be called by implementations after every change of the contents. */
    void bump_generation() noexcept;

  private:
    std::uint64_t m_id;
    std::uint64_t m_generation;
};

/// A document field with its terms, already tokenized.
struct Field {
    std::string name;
    std::vector<std::string> terms;
};

/**
 * In-memory index built one document at a time.
 *
 * Adding documents invalidates posting lists returned earlier.
 */
class MemoryIndex final: public IndexReader {
  public:
    /** Adds a document and returns its ID. IDs are assigned consecutively from 0. */
    auto add_document(std::vector<Field> const& fields) -> DocId;

    [[nodiscard]] auto max_doc() const -> DocId override;
    [[nodiscard]] auto postings(std::string_view field, std::string_view term) const
        -> std::optional<PostingList> override;
    [[nodiscard]] auto terms(std::string_view field) const -> std::vector<std::string> override;

  private:
    struct Postings {
        std::vector<DocId> documents;
        std::vector<std::uint32_t> frequencies;
    };
    using FieldPostings = std::map<std::string, Postings, std::less<>>;

    std::map<std::string, FieldPostings, std::less<>> m_fields;
    DocId m_num_docs = 0;
};

}  // namespace quarry
