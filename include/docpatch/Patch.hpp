/**
 * @file Patch.hpp
 * @brief Patch application engine (RFC 6902)
 *
 * Operation semantics:
 * - add: insert into an object (overwriting) or an array (shifting later
 *   elements; "-" appends). The root path replaces the whole document.
 * - remove: delete an existing key or element. "-" is rejected.
 * - replace: overwrite an existing value; the root path replaces the whole
 *   document.
 * - move: remove at from, add at path. A path below from is rejected.
 * - copy: add a deep copy of the value at from.
 * - test: compare the value at path with a deep equality check.
 *
 * A failing operation stops the patch. PatchError::index() names it and
 * PatchError::path() names the pointer it failed on.
 */

#ifndef DOCPATCH_PATCH_HPP
#define DOCPATCH_PATCH_HPP

#include "docpatch/Value.hpp"
#include "docpatch/Operation.hpp"
#include "docpatch/Errors.hpp"

namespace docpatch {

/**
 * @brief Apply a patch atomically
 *
 * Either every operation succeeds and doc holds the cumulative result, or
 * the first failure is thrown and doc is deep-equal to its state before
 * the call. Rollback replays the inverse of every applied operation in
 * reverse order.
 *
 * @param doc Document to patch in place
 * @param ops Operations, applied in order
 * @throws PatchError for the first failing operation:
 *         - TestFailed: test value differs from the document
 *         - InvalidPointer: path malformed, missing or inapplicable
 *           (including a test against a missing path)
 *         - InvalidFromPointer: move/copy source missing (path() is the
 *           from pointer)
 *         - CannotMoveInsideItself: move target below its source
 * @throws UndoFailure if rollback itself fails (engine defect)
 *
 * Qualify the call (docpatch::apply) when passing a non-const Patch:
 * argument-dependent lookup also finds std::apply, which is the better
 * match for a non-const std::vector argument.
 *
 * Example:
 * ```cpp
 * Value doc = {{"title", "Old"}};
 * docpatch::apply(doc, {TestOperation{Pointer{"title"}, "Old"},
 *                       ReplaceOperation{Pointer{"title"}, "New"}});
 * // doc == {"title": "New"}
 * ```
 */
void apply(Value& doc, const Patch& ops);

/**
 * @brief Apply a patch without rollback
 *
 * Operations applied before the failing one stay applied; the failing
 * operation itself leaves the document untouched. No undo log is kept.
 *
 * @throws PatchError as for apply()
 */
void apply_unsafe(Value& doc, const Patch& ops);

/**
 * @brief Apply a patch atomically to a copy of doc
 * @return The patched copy
 * @throws PatchError as for apply()
 */
Value patched(Value doc, const Patch& ops);

} // namespace docpatch

#endif // DOCPATCH_PATCH_HPP
