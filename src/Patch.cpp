/**
 * @file Patch.cpp
 * @brief Implementation of the patch application engine
 */

#include "docpatch/Patch.hpp"
#include "docpatch/Pointer.hpp"
#include "docpatch/Logging.hpp"

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace docpatch {

namespace {

/// Inverse operations recorded during an atomic apply
using UndoLog = std::vector<PatchOperation>;

// ============================================================================
// Mutation primitives
// ============================================================================

/**
 * @brief Where an add put its value and what it displaced
 *
 * location is the concrete pointer of the new value: for an array append
 * ("-") it holds the index the value landed at.
 */
struct AddOutcome {
    Pointer location;
    std::optional<Value> previous;
};

/**
 * @brief Add value at path
 *
 * value is only moved from once the target is known to be valid, so on
 * PointerError the caller still owns it.
 */
AddOutcome add_value(Value& doc, const Pointer& path, Value&& value) {
    if (path.is_root()) {
        Value previous = std::exchange(doc, std::move(value));
        return {path, std::move(previous)};
    }

    auto [parent_ptr, last] = path.split();
    Value& parent = resolve(doc, parent_ptr);

    if (parent.is_object()) {
        auto it = parent.find(last);
        if (it != parent.end()) {
            Value previous = std::exchange(*it, std::move(value));
            return {path, std::move(previous)};
        }
        parent.emplace(last, std::move(value));
        return {path, std::nullopt};
    }

    if (parent.is_array()) {
        std::size_t idx = parent.size();
        if (last != "-") {
            auto parsed = parse_index(last, parent.size() + 1);
            if (!parsed) {
                throw PointerError(path.to_string(), last,
                                   "invalid insertion index (size " +
                                   std::to_string(parent.size()) + ")");
            }
            idx = *parsed;
        }
        parent.insert(parent.begin() + static_cast<std::ptrdiff_t>(idx), std::move(value));
        return {parent_ptr / idx, std::nullopt};
    }

    throw PointerError(path.to_string(), last, "cannot add into " + type_name(parent));
}

/**
 * @brief Remove and return the value at path
 */
Value remove_value(Value& doc, const Pointer& path) {
    if (path.is_root()) {
        throw PointerError("", "", "cannot remove the whole document");
    }

    auto [parent_ptr, last] = path.split();
    Value& parent = resolve(doc, parent_ptr);

    if (parent.is_object()) {
        auto it = parent.find(last);
        if (it == parent.end()) {
            throw PointerError(path.to_string(), last, "key not found");
        }
        Value removed = std::move(*it);
        parent.erase(it);
        return removed;
    }

    if (parent.is_array()) {
        auto idx = parse_index(last, parent.size());
        if (!idx) {
            throw PointerError(path.to_string(), last,
                               last == "-" ? "append marker cannot be removed"
                                           : "invalid index (size " +
                                                 std::to_string(parent.size()) + ")");
        }
        Value removed = std::move(parent[*idx]);
        parent.erase(*idx);
        return removed;
    }

    throw PointerError(path.to_string(), last, "cannot remove from " + type_name(parent));
}

/**
 * @brief Overwrite the existing value at path, returning the old one
 */
Value replace_value(Value& doc, const Pointer& path, Value&& value) {
    Value& target = resolve(doc, path);
    return std::exchange(target, std::move(value));
}

// ============================================================================
// Error mapping
// ============================================================================

std::string describe(const PointerError& e) {
    if (e.token().empty()) return e.reason();
    return e.reason() + " ('" + e.token() + "')";
}

PatchError invalid_pointer(std::size_t index, const Pointer& path, const PointerError& e) {
    return PatchError(PatchErrorKind::InvalidPointer, index, path.to_string(), describe(e));
}

PatchError invalid_from(std::size_t index, const Pointer& from, const PointerError& e) {
    return PatchError(PatchErrorKind::InvalidFromPointer, index, from.to_string(), describe(e));
}

/**
 * @brief Record the inverse of an add
 */
void record_add_undo(UndoLog* undo, AddOutcome&& outcome) {
    if (!undo) return;
    if (outcome.previous) {
        // Re-adding at a key overwrites; at the root it replaces the document
        undo->push_back(AddOperation{std::move(outcome.location), std::move(*outcome.previous)});
    } else {
        undo->push_back(RemoveOperation{std::move(outcome.location)});
    }
}

// ============================================================================
// Operations
// ============================================================================

/**
 * @brief Apply one operation, pushing its inverse entries to undo
 *
 * A failing operation leaves doc unchanged. undo may be null (non-atomic
 * application and rollback replay).
 */
void apply_operation(Value& doc, const PatchOperation& operation,
                     std::size_t index, UndoLog* undo) {
    std::visit(overload{
        [&](const AddOperation& op) {
            Value value = op.value;
            try {
                record_add_undo(undo, add_value(doc, op.path, std::move(value)));
            } catch (const PointerError& e) {
                throw invalid_pointer(index, op.path, e);
            }
        },
        [&](const RemoveOperation& op) {
            try {
                Value removed = remove_value(doc, op.path);
                if (undo) undo->push_back(AddOperation{op.path, std::move(removed)});
            } catch (const PointerError& e) {
                throw invalid_pointer(index, op.path, e);
            }
        },
        [&](const ReplaceOperation& op) {
            Value value = op.value;
            try {
                Value previous = replace_value(doc, op.path, std::move(value));
                if (undo) undo->push_back(ReplaceOperation{op.path, std::move(previous)});
            } catch (const PointerError& e) {
                throw invalid_pointer(index, op.path, e);
            }
        },
        [&](const MoveOperation& op) {
            if (op.from.is_ancestor_of(op.path)) {
                throw PatchError(PatchErrorKind::CannotMoveInsideItself, index,
                                 op.path.to_string(), "from '" + op.from.to_string() + "'");
            }

            Value moved;
            try {
                moved = remove_value(doc, op.from);
            } catch (const PointerError& e) {
                throw invalid_from(index, op.from, e);
            }

            // Moving back from a root target or from an ancestor of the
            // source is not a valid move, so those are undone as an add
            // of the moved value at from.
            const bool undo_by_move = !op.path.is_root() && !op.path.is_ancestor_of(op.from);
            std::optional<Value> moved_copy;
            if (undo && !undo_by_move) moved_copy = moved;

            AddOutcome outcome;
            try {
                outcome = add_value(doc, op.path, std::move(moved));
            } catch (const PointerError& e) {
                try {
                    add_value(doc, op.from, std::move(moved));
                } catch (const PointerError& restore_error) {
                    throw UndoFailure("cannot restore '" + op.from.to_string() +
                                      "' after failed move: " + restore_error.what());
                }
                throw invalid_pointer(index, op.path, e);
            }

            if (!undo) return;
            if (undo_by_move) {
                if (outcome.previous) {
                    undo->push_back(AddOperation{outcome.location, std::move(*outcome.previous)});
                }
                undo->push_back(MoveOperation{outcome.location, op.from});
            } else {
                undo->push_back(AddOperation{op.from, std::move(*moved_copy)});
                record_add_undo(undo, std::move(outcome));
            }
        },
        [&](const CopyOperation& op) {
            Value source;
            try {
                source = resolve(doc, op.from);
            } catch (const PointerError& e) {
                throw invalid_from(index, op.from, e);
            }
            try {
                record_add_undo(undo, add_value(doc, op.path, std::move(source)));
            } catch (const PointerError& e) {
                throw invalid_pointer(index, op.path, e);
            }
        },
        [&](const TestOperation& op) {
            const Value* target = find(doc, op.path);
            if (!target) {
                throw PatchError(PatchErrorKind::InvalidPointer, index,
                                 op.path.to_string(), "path does not exist");
            }
            if (*target != op.value) {
                throw PatchError(PatchErrorKind::TestFailed, index, op.path.to_string(),
                                 "expected " + op.value.dump() + ", found " + target->dump());
            }
        },
    }, operation);
}

/**
 * @brief Replay the undo log in reverse
 * @throws UndoFailure if an entry does not apply
 */
void roll_back(Value& doc, const UndoLog& undo) {
    for (std::size_t i = undo.size(); i-- > 0;) {
        try {
            apply_operation(doc, undo[i], i, nullptr);
        } catch (const Error& e) {
            logger()->critical("rollback failed at undo entry {} ({}): {}",
                               i, to_string(undo[i]), e.what());
            throw UndoFailure(std::string("rollback failed: ") + e.what());
        }
    }
}

} // anonymous namespace

void apply(Value& doc, const Patch& ops) {
    auto log = logger();
    UndoLog undo;
    undo.reserve(ops.size());

    for (std::size_t i = 0; i < ops.size(); ++i) {
        if (log->should_log(spdlog::level::trace)) {
            log->trace("applying operation {}: {}", i, to_string(ops[i]));
        }
        try {
            apply_operation(doc, ops[i], i, &undo);
        } catch (const PatchError& e) {
            log->debug("{}; rolling back {} undo entries", e.what(), undo.size());
            roll_back(doc, undo);
            throw;
        }
    }
}

void apply_unsafe(Value& doc, const Patch& ops) {
    auto log = logger();

    for (std::size_t i = 0; i < ops.size(); ++i) {
        if (log->should_log(spdlog::level::trace)) {
            log->trace("applying operation {}: {}", i, to_string(ops[i]));
        }
        try {
            apply_operation(doc, ops[i], i, nullptr);
        } catch (const PatchError& e) {
            log->debug("{}; keeping {} applied operations", e.what(), i);
            throw;
        }
    }
}

Value patched(Value doc, const Patch& ops) {
    docpatch::apply(doc, ops);
    return doc;
}

} // namespace docpatch
