#include "quarry/doc_iterator.hpp"
#include "quarry/scorer/scorer.hpp"

namespace quarry {

DocIterator::DocIterator() = default;
DocIterator::DocIterator(DocIterator const&) = default;
DocIterator::DocIterator(DocIterator&&) = default;
DocIterator& DocIterator::operator=(DocIterator const&) = default;
DocIterator& DocIterator::operator=(DocIterator&&) = default;
DocIterator::~DocIterator() = default;

Scorer::Scorer() = default;
Scorer::Scorer(Scorer const&) = default;
Scorer::Scorer(Scorer&&) = default;
Scorer& Scorer::operator=(Scorer const&) = default;
Scorer& Scorer::operator=(Scorer&&) = default;
Scorer::~Scorer() = default;

}  // namespace quarry
