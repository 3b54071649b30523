#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include "quarry/index_reader.hpp"

namespace quarry {

/// Converts the terms of a field to values of type `T`.
///
/// Parsers are identified by name: two lookups with parsers of the same name share a cache
/// entry.
template <typename T>
struct FieldParser {
    std::string name;
    std::function<T(std::string_view)> parse;
};

template <typename T>
struct FieldValueTraits;

template <>
struct FieldValueTraits<std::int8_t> {
    static constexpr std::string_view name = "byte";
};

template <>
struct FieldValueTraits<std::int32_t> {
    static constexpr std::string_view name = "int";
};

template <>
struct FieldValueTraits<float> {
    static constexpr std::string_view name = "float";
};

/// Parses decimal integers in `[-128, 127]`.
[[nodiscard]] auto default_byte_parser() -> FieldParser<std::int8_t>;
/// Parses decimal 32-bit integers.
[[nodiscard]] auto default_int_parser() -> FieldParser<std::int32_t>;
/// Parses decimal floating point numbers.
[[nodiscard]] auto default_float_parser() -> FieldParser<float>;

/**
 * Caches per-document values of a field, one array per (reader, field, type, parser).
 *
 * Entries are keyed by the reader's `id()` and `generation()`, never by its address. Entries of
 * earlier generations of a reader are dropped when values of its current generation are loaded.
 *
 * Values are obtained by un-inverting the field: every term is parsed and its value assigned
 * to all documents in its postings. Documents with no term in the field get `T{}`. If a document
 * has several terms, the lexicographically last one wins.
 *
 * Lookups are synchronized, so one cache can be shared by searches running in parallel.
 */
class FieldCache {
  public:
    template <typename T>
    using Values = std::shared_ptr<std::vector<T> const>;

    /// The cache used by field value sources unless told otherwise.
    [[nodiscard]] static auto default_cache() -> FieldCache&;

    /// \throws InvalidFormat  if a term of the field cannot be parsed
    [[nodiscard]] auto get_bytes(
        IndexReader const& reader,
        std::string const& field,
        std::optional<FieldParser<std::int8_t>> const& parser = std::nullopt
    ) -> Values<std::int8_t>;

    /// \throws InvalidFormat  if a term of the field cannot be parsed
    [[nodiscard]] auto get_ints(
        IndexReader const& reader,
        std::string const& field,
        std::optional<FieldParser<std::int32_t>> const& parser = std::nullopt
    ) -> Values<std::int32_t>;

    /// \throws InvalidFormat  if a term of the field cannot be parsed
    [[nodiscard]] auto get_floats(
        IndexReader const& reader,
        std::string const& field,
        std::optional<FieldParser<float>> const& parser = std::nullopt
    ) -> Values<float>;

    /// Looks up values of type `T`; dispatches to one of the typed getters.
    template <typename T>
    [[nodiscard]] auto get(
        IndexReader const& reader,
        std::string const& field,
        std::optional<FieldParser<T>> const& parser = std::nullopt
    ) -> Values<T> {
        if constexpr (std::is_same_v<T, std::int8_t>) {
            return get_bytes(reader, field, parser);
        } else if constexpr (std::is_same_v<T, std::int32_t>) {
            return get_ints(reader, field, parser);
        } else {
            static_assert(std::is_same_v<T, float>, "unsupported field value type");
            return get_floats(reader, field, parser);
        }
    }

    /// Drops all entries of `reader`.
    void purge(IndexReader const& reader);

    /// Number of cached arrays.
    [[nodiscard]] auto size() const -> std::size_t;

  private:
    struct Key {
        std::uint64_t reader;
        std::uint64_t generation;
        std::string field;
        std::string_view type;
        std::string parser;

        [[nodiscard]] auto operator<=>(Key const&) const = default;
    };
    using Entry = std::variant<Values<std::int8_t>, Values<std::int32_t>, Values<float>>;

    template <typename T>
    auto lookup(IndexReader const& reader, std::string const& field, FieldParser<T> const& parser)
        -> Values<T>;

    std::map<Key, Entry> m_entries;
    mutable std::mutex m_mutex;
};

}  // namespace quarry
