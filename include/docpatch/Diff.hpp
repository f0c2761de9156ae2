/**
 * @file Diff.hpp
 * @brief Tree diff producing a patch (RFC 6902)
 */

#ifndef DOCPATCH_DIFF_HPP
#define DOCPATCH_DIFF_HPP

#include "docpatch/Value.hpp"
#include "docpatch/Operation.hpp"

namespace docpatch {

/**
 * @brief Compute a patch transforming left into right
 *
 * The result contains only replace, add and remove operations, and
 * applying it to left yields a document deep-equal to right.
 *
 * Rules, applied recursively from the root:
 * - Both objects: keys of right are visited first (recursing into keys
 *   present on both sides, adding the others), then keys only in left
 *   are removed.
 * - Both arrays: common indices are recursed into; trailing elements only
 *   in left are removed, each removal index lowered by the number of
 *   removals already emitted for that array; trailing elements only in
 *   right are added at their index.
 * - Otherwise: equal values produce nothing, different values a single
 *   replace of the whole subtree.
 *
 * Keys containing '/' or '~' are escaped in the emitted paths.
 *
 * Examples:
 * ```cpp
 * diff({{"a", 1}}, {{"a", 1}});             // []
 * diff({"a", "b", "c"}, {"a"});             // remove /1, remove /1
 * diff(nullptr, {{"title", "Hello!"}});     // replace "" {"title": "Hello!"}
 * ```
 */
Patch diff(const Value& left, const Value& right);

} // namespace docpatch

#endif // DOCPATCH_DIFF_HPP
