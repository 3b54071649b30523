#include "quarry/function/value_source.hpp"

namespace quarry {

DocValues::DocValues() = default;
DocValues::DocValues(DocValues const&) = default;
DocValues::DocValues(DocValues&&) = default;
DocValues& DocValues::operator=(DocValues const&) = default;
DocValues& DocValues::operator=(DocValues&&) = default;
DocValues::~DocValues() = default;

ValueSource::ValueSource() = default;
ValueSource::ValueSource(ValueSource const&) = default;
ValueSource::ValueSource(ValueSource&&) = default;
ValueSource& ValueSource::operator=(ValueSource const&) = default;
ValueSource& ValueSource::operator=(ValueSource&&) = default;
ValueSource::~ValueSource() = default;

}  // namespace quarry
