/**
 * @file Value.hpp
 * @brief Document value type
 *
 * Uses nlohmann::json as the underlying value model:
 * - Null
 * - Bool (true | false)
 * - Number (int64_t, uint64_t, double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...}, unique keys)
 */

#ifndef DOCPATCH_VALUE_HPP
#define DOCPATCH_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace docpatch {

/**
 * @brief JSON-like document value
 *
 * This is an alias for nlohmann::json. Objects are stored in a key-sorted
 * map, so serialization is deterministic and deep equality (operator==)
 * does not depend on the order in which keys were inserted.
 *
 * Each Value exclusively owns its children; copying a Value is a deep
 * clone.
 */
using Value = nlohmann::json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string ("null", "boolean", "integer", "float",
 *         "string", "array", "object")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

} // namespace docpatch

#endif // DOCPATCH_VALUE_HPP
