/**
 * @file Merge.cpp
 * @brief Implementation of merge patch
 */

#include "docpatch/Merge.hpp"

namespace docpatch {

void merge(Value& doc, const Value& overlay) {
    if (!overlay.is_object()) {
        doc = overlay;
        return;
    }

    if (!doc.is_object()) {
        doc = Value::object();
    }

    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        const auto& key = it.key();
        const auto& value = it.value();

        if (value.is_null()) {
            doc.erase(key);
        } else {
            // operator[] inserts null for a new key, which any overlay replaces
            merge(doc[key], value);
        }
    }
}

void merge_all(Value& doc, const std::vector<Value>& overlays) {
    for (const auto& overlay : overlays) {
        merge(doc, overlay);
    }
}

} // namespace docpatch
