#pragma once

#include <cstdint>
#include <limits>

namespace quarry {

using DocId = std::int32_t;
using Score = float;

/// Returned by a document iterator once it runs out of documents.
constexpr DocId NO_MORE_DOCS = std::numeric_limits<DocId>::max();

/// Value of `docid()` before the iterator has been positioned for the first time.
constexpr DocId UNSTARTED = -1;

}  // namespace quarry
