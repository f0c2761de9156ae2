/**
 * @file Operation.hpp
 * @brief Patch operations (RFC 6902) and their wire codec
 *
 * A patch is an ordered list of operations; each one sees the document
 * produced by the previous one. Wire form of a single operation:
 *
 * ```json
 * {"op": "add"|"remove"|"replace"|"move"|"copy"|"test",
 *  "path": "<pointer>", ["from": "<pointer>"], ["value": <any>]}
 * ```
 */

#ifndef DOCPATCH_OPERATION_HPP
#define DOCPATCH_OPERATION_HPP

#include "docpatch/Value.hpp"
#include "docpatch/Pointer.hpp"
#include "docpatch/Errors.hpp"

#include <iosfwd>
#include <string>
#include <variant>
#include <vector>

namespace docpatch {

// ============================================================================
// Operation kinds
// ============================================================================

/// Insert or overwrite value at path
struct AddOperation {
    Pointer path;
    Value value;
};

/// Delete the value at path
struct RemoveOperation {
    Pointer path;
};

/// Overwrite the existing value at path
struct ReplaceOperation {
    Pointer path;
    Value value;
};

/// Remove the value at from and add it at path
struct MoveOperation {
    Pointer from;
    Pointer path;
};

/// Add a deep copy of the value at from at path
struct CopyOperation {
    Pointer from;
    Pointer path;
};

/// Check that the value at path equals value
struct TestOperation {
    Pointer path;
    Value value;
};

/**
 * @brief One patch operation
 *
 * Dispatch with std::visit; every call site handles all six kinds.
 */
using PatchOperation = std::variant<
    AddOperation,
    RemoveOperation,
    ReplaceOperation,
    MoveOperation,
    CopyOperation,
    TestOperation
>;

/// Ordered list of operations
using Patch = std::vector<PatchOperation>;

bool operator==(const AddOperation& lhs, const AddOperation& rhs);
bool operator==(const RemoveOperation& lhs, const RemoveOperation& rhs);
bool operator==(const ReplaceOperation& lhs, const ReplaceOperation& rhs);
bool operator==(const MoveOperation& lhs, const MoveOperation& rhs);
bool operator==(const CopyOperation& lhs, const CopyOperation& rhs);
bool operator==(const TestOperation& lhs, const TestOperation& rhs);

/**
 * @brief Helper for building std::visit visitors from lambdas
 *
 * ```cpp
 * std::visit(overload{
 *     [](const AddOperation& op) { ... },
 *     [](const auto& op) { ... },
 * }, operation);
 * ```
 */
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

/**
 * @brief Wire name of the operation ("add", "remove", ...)
 */
const char* op_name(const PatchOperation& op);

/**
 * @brief Target path of the operation
 */
const Pointer& path_of(const PatchOperation& op);

// ============================================================================
// Wire codec (nlohmann::json ADL)
// ============================================================================

void to_json(Value& j, const Pointer& ptr);
void from_json(const Value& j, Pointer& ptr);

void to_json(Value& j, const AddOperation& op);
void to_json(Value& j, const RemoveOperation& op);
void to_json(Value& j, const ReplaceOperation& op);
void to_json(Value& j, const MoveOperation& op);
void to_json(Value& j, const CopyOperation& op);
void to_json(Value& j, const TestOperation& op);

/**
 * @brief Encode an operation as {"op": ..., "path": ..., ...}
 */
void to_json(Value& j, const PatchOperation& op);

/**
 * @brief Decode one operation
 * @throws PatchFormatError if the entry is not a valid operation
 */
void from_json(const Value& j, PatchOperation& op);

/**
 * @brief Decode a patch document
 *
 * @param j JSON array of operation objects
 * @return Decoded patch
 * @throws PatchFormatError if j is not an array, or an entry is not an
 *         object, has a missing or unknown "op", lacks a required member
 *         ("path", "from", "value"), or holds a malformed pointer.
 *         index() names the offending entry.
 *
 * Members other than op/path/from/value are ignored.
 *
 * Example:
 * ```cpp
 * Patch p = patch_from_json(Value::parse(R"([
 *     {"op": "test", "path": "/0/name", "value": "Andrew"},
 *     {"op": "add", "path": "/0/happy", "value": true}
 * ])"));
 * ```
 */
Patch patch_from_json(const Value& j);

/**
 * @brief Encode a patch as a JSON array
 */
Value patch_to_json(const Patch& patch);

// ============================================================================
// Display
// ============================================================================

/**
 * @brief JSON text of an operation
 * @param indent -1 for compact output, otherwise spaces per level
 */
std::string to_string(const PatchOperation& op, int indent = -1);

/**
 * @brief JSON text of a patch
 * @param indent -1 for compact output, otherwise spaces per level
 */
std::string to_string(const Patch& patch, int indent = -1);

/// Writes the compact JSON text
std::ostream& operator<<(std::ostream& os, const PatchOperation& op);

} // namespace docpatch

#endif // DOCPATCH_OPERATION_HPP
