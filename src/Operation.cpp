/**
 * @file Operation.cpp
 * @brief Implementation of patch operations and their wire codec
 */

#include "docpatch/Operation.hpp"

#include <ostream>

namespace docpatch {

bool operator==(const AddOperation& lhs, const AddOperation& rhs) {
    return lhs.path == rhs.path && lhs.value == rhs.value;
}

bool operator==(const RemoveOperation& lhs, const RemoveOperation& rhs) {
    return lhs.path == rhs.path;
}

bool operator==(const ReplaceOperation& lhs, const ReplaceOperation& rhs) {
    return lhs.path == rhs.path && lhs.value == rhs.value;
}

bool operator==(const MoveOperation& lhs, const MoveOperation& rhs) {
    return lhs.from == rhs.from && lhs.path == rhs.path;
}

bool operator==(const CopyOperation& lhs, const CopyOperation& rhs) {
    return lhs.from == rhs.from && lhs.path == rhs.path;
}

bool operator==(const TestOperation& lhs, const TestOperation& rhs) {
    return lhs.path == rhs.path && lhs.value == rhs.value;
}

const char* op_name(const PatchOperation& op) {
    return std::visit(overload{
        [](const AddOperation&) { return "add"; },
        [](const RemoveOperation&) { return "remove"; },
        [](const ReplaceOperation&) { return "replace"; },
        [](const MoveOperation&) { return "move"; },
        [](const CopyOperation&) { return "copy"; },
        [](const TestOperation&) { return "test"; },
    }, op);
}

const Pointer& path_of(const PatchOperation& op) {
    return std::visit([](const auto& o) -> const Pointer& { return o.path; }, op);
}

// ============================================================================
// Encoding
// ============================================================================

void to_json(Value& j, const Pointer& ptr) {
    j = ptr.to_string();
}

void from_json(const Value& j, Pointer& ptr) {
    ptr = Pointer::parse(j.get<std::string>());
}

void to_json(Value& j, const AddOperation& op) {
    j = Value{{"op", "add"}, {"path", op.path}, {"value", op.value}};
}

void to_json(Value& j, const RemoveOperation& op) {
    j = Value{{"op", "remove"}, {"path", op.path}};
}

void to_json(Value& j, const ReplaceOperation& op) {
    j = Value{{"op", "replace"}, {"path", op.path}, {"value", op.value}};
}

void to_json(Value& j, const MoveOperation& op) {
    j = Value{{"op", "move"}, {"from", op.from}, {"path", op.path}};
}

void to_json(Value& j, const CopyOperation& op) {
    j = Value{{"op", "copy"}, {"from", op.from}, {"path", op.path}};
}

void to_json(Value& j, const TestOperation& op) {
    j = Value{{"op", "test"}, {"path", op.path}, {"value", op.value}};
}

void to_json(Value& j, const PatchOperation& op) {
    std::visit([&j](const auto& o) { to_json(j, o); }, op);
}

Value patch_to_json(const Patch& patch) {
    Value result = Value::array();
    for (const auto& op : patch) {
        result.push_back(Value(op));
    }
    return result;
}

// ============================================================================
// Decoding
// ============================================================================

namespace {
    /**
     * @brief Read a required pointer member ("path" or "from")
     * @throws PatchFormatError if absent, not a string, or malformed
     */
    Pointer pointer_member(const Value& entry, const char* name) {
        auto it = entry.find(name);
        if (it == entry.end()) {
            throw PatchFormatError(std::string("missing '") + name + "'");
        }
        if (!it->is_string()) {
            throw PatchFormatError(std::string("'") + name + "' must be a string, got " +
                                   type_name(*it));
        }
        try {
            return Pointer::parse(it->get<std::string>());
        } catch (const PointerError& e) {
            throw PatchFormatError(std::string("'") + name + "': " + e.what());
        }
    }

    /**
     * @brief Read the required "value" member (null is a valid value)
     */
    Value value_member(const Value& entry) {
        auto it = entry.find("value");
        if (it == entry.end()) {
            throw PatchFormatError("missing 'value'");
        }
        return *it;
    }

    PatchOperation decode_operation(const Value& entry) {
        if (!entry.is_object()) {
            throw PatchFormatError("operation must be an object, got " + type_name(entry));
        }

        auto op_it = entry.find("op");
        if (op_it == entry.end()) {
            throw PatchFormatError("missing 'op'");
        }
        if (!op_it->is_string()) {
            throw PatchFormatError("'op' must be a string, got " + type_name(*op_it));
        }
        const auto& op = op_it->get_ref<const std::string&>();

        if (op == "add") {
            return AddOperation{pointer_member(entry, "path"), value_member(entry)};
        }
        if (op == "remove") {
            return RemoveOperation{pointer_member(entry, "path")};
        }
        if (op == "replace") {
            return ReplaceOperation{pointer_member(entry, "path"), value_member(entry)};
        }
        if (op == "move") {
            return MoveOperation{pointer_member(entry, "from"), pointer_member(entry, "path")};
        }
        if (op == "copy") {
            return CopyOperation{pointer_member(entry, "from"), pointer_member(entry, "path")};
        }
        if (op == "test") {
            return TestOperation{pointer_member(entry, "path"), value_member(entry)};
        }
        throw PatchFormatError("unknown operation '" + op + "'");
    }
}

void from_json(const Value& j, PatchOperation& op) {
    op = decode_operation(j);
}

Patch patch_from_json(const Value& j) {
    if (!j.is_array()) {
        throw PatchFormatError("patch must be an array, got " + type_name(j));
    }

    Patch patch;
    patch.reserve(j.size());
    for (std::size_t i = 0; i < j.size(); ++i) {
        try {
            patch.push_back(decode_operation(j[i]));
        } catch (const PatchFormatError& e) {
            throw PatchFormatError(i, e.details());
        }
    }
    return patch;
}

// ============================================================================
// Display
// ============================================================================

std::string to_string(const PatchOperation& op, int indent) {
    return Value(op).dump(indent);
}

std::string to_string(const Patch& patch, int indent) {
    return patch_to_json(patch).dump(indent);
}

std::ostream& operator<<(std::ostream& os, const PatchOperation& op) {
    return os << to_string(op);
}

} // namespace docpatch
