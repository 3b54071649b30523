#pragma once

#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

#include "quarry/function/field_cache.hpp"
#include "quarry/index_reader.hpp"
#include "quarry/type_alias.hpp"

namespace quarry {

/// Per-document values of a value source, for a single reader.
class DocValues {
  public:
    DocValues();
    DocValues(DocValues const&);
    DocValues(DocValues&&);
    DocValues& operator=(DocValues const&);
    DocValues& operator=(DocValues&&);
    virtual ~DocValues();

    [[nodiscard]] virtual auto float_val(DocId doc) const -> float = 0;
    [[nodiscard]] virtual auto int_val(DocId doc) const -> std::int32_t = 0;
    /** Human readable value of `doc`, used for explanations. */
    [[nodiscard]] virtual auto to_string(DocId doc) const -> std::string = 0;
};

/// A source of per-document values, e.g., the cached values of a numeric field.
class ValueSource {
  public:
    ValueSource();
    ValueSource(ValueSource const&);
    ValueSource(ValueSource&&);
    ValueSource& operator=(ValueSource const&);
    ValueSource& operator=(ValueSource&&);
    virtual ~ValueSource();

    [[nodiscard]] virtual auto get_values(IndexReader const& reader) const
        -> std::unique_ptr<DocValues> = 0;
    [[nodiscard]] virtual auto description() const -> std::string = 0;
    [[nodiscard]] virtual auto equals(ValueSource const& other) const -> bool = 0;
    [[nodiscard]] virtual auto clone() const -> std::unique_ptr<ValueSource> = 0;
};

[[nodiscard]] inline auto operator==(ValueSource const& lhs, ValueSource const& rhs) -> bool {
    return lhs.equals(rhs);
}

/// Values cached by a `FieldCache`, exposed as other numeric types by casting.
template <typename T>
class CachedDocValues final: public DocValues {
  public:
    CachedDocValues(FieldCache::Values<T> values, std::string description)
        : m_values(std::move(values)), m_description(std::move(description)) {}

    [[nodiscard]] auto float_val(DocId doc) const -> float override {
        return static_cast<float>(value(doc));
    }
    [[nodiscard]] auto int_val(DocId doc) const -> std::int32_t override {
        return static_cast<std::int32_t>(value(doc));
    }
    [[nodiscard]] auto to_string(DocId doc) const -> std::string override {
        if constexpr (std::is_floating_point_v<T>) {
            return fmt::format("{}={}", m_description, float_val(doc));
        } else {
            return fmt::format("{}={}", m_description, int_val(doc));
        }
    }

  private:
    [[nodiscard]] auto value(DocId doc) const -> T {
        return m_values->at(static_cast<std::size_t>(doc));
    }

    FieldCache::Values<T> m_values;
    std::string m_description;
};

/**
 * Value source reading the values of a numeric field through a `FieldCache`.
 *
 * Two sources are equal if they read the same field as the same type with parsers of the same
 * name.
 */
template <typename T>
class FieldCacheSource final: public ValueSource {
  public:
    explicit FieldCacheSource(
        std::string field,
        std::optional<FieldParser<T>> parser = std::nullopt,
        FieldCache& cache = FieldCache::default_cache()
    )
        : m_field(std::move(field)), m_parser(std::move(parser)), m_cache(&cache) {}

    [[nodiscard]] auto get_values(IndexReader const& reader) const
        -> std::unique_ptr<DocValues> override {
        return std::make_unique<CachedDocValues<T>>(
            m_cache->get<T>(reader, m_field, m_parser), description()
        );
    }

    [[nodiscard]] auto description() const -> std::string override {
        return fmt::format("{}({})", FieldValueTraits<T>::name, m_field);
    }

    [[nodiscard]] auto equals(ValueSource const& other) const -> bool override {
        auto const* source = dynamic_cast<FieldCacheSource const*>(&other);
        return source != nullptr && source->m_field == m_field
            && source->parser_name() == parser_name();
    }

    [[nodiscard]] auto clone() const -> std::unique_ptr<ValueSource> override {
        return std::make_unique<FieldCacheSource>(*this);
    }

    [[nodiscard]] auto field() const noexcept -> std::string const& { return m_field; }

  private:
    [[nodiscard]] auto parser_name() const -> std::string {
        return m_parser.has_value() ? m_parser->name : std::string("default");
    }

    std::string m_field;
    std::optional<FieldParser<T>> m_parser;
    FieldCache* m_cache;
};

using ByteFieldSource = FieldCacheSource<std::int8_t>;
using IntFieldSource = FieldCacheSource<std::int32_t>;
using FloatFieldSource = FieldCacheSource<float>;

}  // namespace quarry
