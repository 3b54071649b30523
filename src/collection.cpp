#include <memory>

#include <boost/algorithm/string.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "quarry/collection.hpp"
#include "quarry/error.hpp"
#include "quarry/query/term_query.hpp"

namespace quarry {

auto analyze(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> tokens;
    std::string input(text);
    boost::algorithm::split(
        tokens, input, boost::algorithm::is_space(), boost::algorithm::token_compress_on
    );
    std::erase_if(tokens, [](auto const& token) { return token.empty(); });
    for (auto& token: tokens) {
        boost::algorithm::to_lower(token);
    }
    return tokens;
}

auto parse_document(std::string_view line, std::vector<std::string> const& field_names)
    -> std::vector<Field> {
    std::vector<std::string> values;
    std::string input(line);
    boost::algorithm::split(values, input, boost::algorithm::is_any_of("\t"));
    if (values.size() > field_names.size()) {
        throw InvalidFormat(fmt::format(
            "Document has {} fields but only {} names were given: {}",
            values.size(),
            field_names.size(),
            line
        ));
    }
    std::vector<Field> fields;
    fields.reserve(values.size());
    for (std::size_t idx = 0; idx < values.size(); ++idx) {
        fields.push_back(Field{field_names[idx], analyze(values[idx])});
    }
    return fields;
}

auto read_collection(std::istream& is, std::vector<std::string> const& field_names) -> MemoryIndex {
    MemoryIndex index;
    std::string line;
    while (std::getline(is, line)) {
        index.add_document(parse_document(line, field_names));
    }
    spdlog::info("Indexed {} documents", index.max_doc());
    return index;
}

auto parse_query(std::string_view line) -> TextQuery {
    TextQuery query;
    if (auto colon = line.find(':'); colon != std::string_view::npos) {
        query.id = std::string(line.substr(0, colon));
        line.remove_prefix(colon + 1);
    }
    query.terms = analyze(line);
    return query;
}

void for_each_query(std::istream& is, std::function<void(TextQuery)> fn) {
    std::string line;
    while (std::getline(is, line)) {
        if (boost::algorithm::trim_copy(line).empty()) {
            continue;
        }
        fn(parse_query(line));
    }
}

auto multi_field_query(
    std::vector<std::string> const& terms, std::vector<std::string> const& fields, float tie_breaker
) -> DisjunctionMaxQuery {
    DisjunctionMaxQuery query(tie_breaker);
    for (auto const& term: terms) {
        for (auto const& field: fields) {
            query.add(std::make_unique<TermQuery>(field, term));
        }
    }
    return query;
}

}  // namespace quarry
