/**
 * @file Merge.hpp
 * @brief Merge patch (RFC 7396)
 *
 * An overlay describes a partial document: object members are merged into
 * the target key by key, null members delete keys, and anything that is
 * not an object replaces the target outright.
 */

#ifndef DOCPATCH_MERGE_HPP
#define DOCPATCH_MERGE_HPP

#include "docpatch/Value.hpp"

#include <vector>

namespace docpatch {

/**
 * @brief Merge-patch doc with overlay in place
 *
 * Rules:
 * - Overlay not an object (array, scalar, null): doc becomes a copy of it
 * - Overlay object, doc not an object: doc first becomes {}
 * - For each overlay member: null removes the key (no-op if absent),
 *   anything else is merged recursively into doc[key]
 *
 * Keys are used as-is, no pointer escaping applies.
 *
 * Examples:
 * ```cpp
 * Value doc = {{"title", "Goodbye!"}, {"author", {{"givenName", "John"},
 *                                                 {"familyName", "Doe"}}}};
 * merge(doc, {{"title", "Hello!"}, {"author", {{"familyName", nullptr}}}});
 * // doc == {"title": "Hello!", "author": {"givenName": "John"}}
 *
 * Value arr = {{"a", {1, 2}}};
 * merge(arr, {{"a", {3}}});
 * // arr == {"a": [3]}  (arrays are replaced, not merged)
 * ```
 */
void merge(Value& doc, const Value& overlay);

/**
 * @brief Apply several overlays in order
 *
 * Equivalent to calling merge() for each overlay; later overlays win.
 */
void merge_all(Value& doc, const std::vector<Value>& overlays);

} // namespace docpatch

#endif // DOCPATCH_MERGE_HPP
