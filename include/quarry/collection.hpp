#pragma once

#include <functional>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "quarry/index_reader.hpp"
#include "quarry/query/disjunction_max_query.hpp"

namespace quarry {

/// Splits `text` on whitespace and lowercases every token.
[[nodiscard]] auto analyze(std::string_view text) -> std::vector<std::string>;

/**
 * Parses one line of a collection: field values separated by tabs, in the order of
 * `field_names`. Missing trailing values are treated as empty fields.
 *
 * \throws InvalidFormat  if the line has more values than there are fields
 */
[[nodiscard]] auto parse_document(std::string_view line, std::vector<std::string> const& field_names)
    -> std::vector<Field>;

/// Indexes every line of `is` as a document; see `parse_document`.
[[nodiscard]] auto read_collection(std::istream& is, std::vector<std::string> const& field_names)
    -> MemoryIndex;

/// A query as read from a query file: `id:text` or just `text`.
struct TextQuery {
    std::optional<std::string> id;
    std::vector<std::string> terms;
};

[[nodiscard]] auto parse_query(std::string_view line) -> TextQuery;

/// Reads one query per line; empty lines are skipped.
void for_each_query(std::istream& is, std::function<void(TextQuery)> fn);

/**
 * Builds a query matching any of `terms` in any of `fields`: one `TermQuery` per pair, all
 * combined in a single disjunction with the given tie breaker.
 */
[[nodiscard]] auto multi_field_query(
    std::vector<std::string> const& terms, std::vector<std::string> const& fields, float tie_breaker
) -> DisjunctionMaxQuery;

}  // namespace quarry
