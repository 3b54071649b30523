#include <cmath>
#include <limits>
#include <type_traits>

#include <boost/lexical_cast.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "quarry/error.hpp"
#include "quarry/function/field_cache.hpp"

namespace quarry {

namespace {

    /// Infinities are representable in any floating point type.
    template <typename T, typename Parsed>
    [[nodiscard]] auto in_range(Parsed value) -> bool {
        if constexpr (std::is_floating_point_v<T>) {
            if (not std::isfinite(value)) {
                return true;
            }
        }
        return value >= std::numeric_limits<T>::lowest() && value <= std::numeric_limits<T>::max();
    }

    template <typename T, typename Parsed = T>
    [[nodiscard]] auto lexical_parser() -> FieldParser<T> {
        return FieldParser<T>{"default", [](std::string_view term) -> T {
                                  Parsed value;
                                  try {
                                      value = boost::lexical_cast<Parsed>(std::string(term));
                                  } catch (boost::bad_lexical_cast const&) {
                                      throw InvalidFormat(fmt::format(
                                          "cannot parse {} value: {}",
                                          FieldValueTraits<T>::name,
                                          term
                                      ));
                                  }
                                  if (in_range<T>(value)) {
                                      return static_cast<T>(value);
                                  }
                                  throw InvalidFormat(fmt::format(
                                      "{} value out of range: {}", FieldValueTraits<T>::name, term
                                  ));
                              }};
    }

    template <typename T>
    [[nodiscard]] auto uninvert(
        IndexReader const& reader, std::string const& field, FieldParser<T> const& parser
    ) -> std::vector<T> {
        std::vector<T> values(static_cast<std::size_t>(reader.max_doc()), T{});
        for (auto const& term: reader.terms(field)) {
            auto value = parser.parse(term);
            if (auto postings = reader.postings(field, term); postings.has_value()) {
                for (auto doc: postings->documents) {
                    values[static_cast<std::size_t>(doc)] = value;
                }
            }
        }
        return values;
    }

}  // namespace

// lexical_cast to int8_t would read a single character, hence the int intermediate.
auto default_byte_parser() -> FieldParser<std::int8_t> {
    return lexical_parser<std::int8_t, int>();
}

auto default_int_parser() -> FieldParser<std::int32_t> {
    return lexical_parser<std::int32_t, std::int64_t>();
}

auto default_float_parser() -> FieldParser<float> {
    return lexical_parser<float, double>();
}

auto FieldCache::default_cache() -> FieldCache& {
    static FieldCache instance;
    return instance;
}

auto FieldCache::get_bytes(
    IndexReader const& reader,
    std::string const& field,
    std::optional<FieldParser<std::int8_t>> const& parser
) -> Values<std::int8_t> {
    return lookup(reader, field, parser.value_or(default_byte_parser()));
}

auto FieldCache::get_ints(
    IndexReader const& reader,
    std::string const& field,
    std::optional<FieldParser<std::int32_t>> const& parser
) -> Values<std::int32_t> {
    return lookup(reader, field, parser.value_or(default_int_parser()));
}

auto FieldCache::get_floats(
    IndexReader const& reader, std::string const& field, std::optional<FieldParser<float>> const& parser
) -> Values<float> {
    return lookup(reader, field, parser.value_or(default_float_parser()));
}

void FieldCache::purge(IndexReader const& reader) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::erase_if(m_entries, [&](auto const& entry) { return entry.first.reader == reader.id(); });
    spdlog::debug("Purged field cache entries of reader {}", reader.id());
}

auto FieldCache::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

template <typename T>
auto FieldCache::lookup(
    IndexReader const& reader, std::string const& field, FieldParser<T> const& parser
) -> Values<T> {
    Key key{reader.id(), reader.generation(), field, FieldValueTraits<T>::name, parser.name};
    std::lock_guard<std::mutex> lock(m_mutex);
    if (auto pos = m_entries.find(key); pos != m_entries.end()) {
        return std::get<Values<T>>(pos->second);
    }
    spdlog::debug("Loading {} values of field `{}`", FieldValueTraits<T>::name, field);
    auto values = std::make_shared<std::vector<T> const>(uninvert(reader, field, parser));
    std::erase_if(m_entries, [&](auto const& entry) {
        return entry.first.reader == key.reader && entry.first.generation != key.generation;
    });
    m_entries.emplace(std::move(key), values);
    return values;
}

}  // namespace quarry
