#pragma once

// clang-format off

#include <concepts>
#include <memory>
#include <type_traits>

#include "quarry/type_alias.hpp"

namespace quarry::concepts {

/**
 * A document iterator produces a strictly increasing sequence of document IDs.
 */
template <typename C>
concept DocIterator = requires(C const &iterator)
{
    /** Returns the document ID at the current position. */
    { iterator.docid() } -> std::convertible_to<DocId>;
} && requires(C& iterator, DocId target) {
    /** Moves to the next document; returns `NO_MORE_DOCS` when exhausted. */
    { iterator.next_doc() } -> std::convertible_to<DocId>;
    /**
     * Moves to the first document whose ID is at least `target`. If the current ID already
     * satisfies this condition, the iterator will not move. It will never move backwards.
     */
    { iterator.advance(target) } -> std::convertible_to<DocId>;
};

/**
 * A document iterator returning a score for the current document.
 */
template <typename C>
concept ScoredDocIterator = DocIterator<C> && requires(C& iterator) {
    { iterator.score() } -> std::convertible_to<Score>;
};

/**
 * A pointer-like handle (raw or smart pointer) to a document iterator.
 */
template <typename H>
concept DocIteratorHandle = requires(H handle) {
    *handle;
} && DocIterator<std::remove_reference_t<decltype(*std::declval<H&>())>>;

};  // namespace quarry::concepts

// clang-format on
