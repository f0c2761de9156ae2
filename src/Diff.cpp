/**
 * @file Diff.cpp
 * @brief Implementation of the tree diff
 */

#include "docpatch/Diff.hpp"
#include "docpatch/Pointer.hpp"
#include "docpatch/Logging.hpp"

#include <algorithm>

namespace docpatch {

namespace {

/**
 * @brief Recursive differ over a shared path prefix
 */
class Differ {
public:
    explicit Differ(Patch& out) : out_(out) {}

    void compare(const Value& left, const Value& right) {
        if (left.is_object() && right.is_object()) {
            compare_objects(left, right);
        } else if (left.is_array() && right.is_array()) {
            compare_arrays(left, right);
        } else if (left != right) {
            out_.push_back(ReplaceOperation{path_, right});
        }
    }

private:
    Patch& out_;
    Pointer path_;

    void compare_objects(const Value& left, const Value& right) {
        for (auto it = right.begin(); it != right.end(); ++it) {
            auto match = left.find(it.key());
            path_.push(it.key());
            if (match != left.end()) {
                compare(*match, it.value());
            } else {
                out_.push_back(AddOperation{path_, it.value()});
            }
            path_.pop();
        }

        for (auto it = left.begin(); it != left.end(); ++it) {
            if (!right.contains(it.key())) {
                out_.push_back(RemoveOperation{path_ / it.key()});
            }
        }
    }

    void compare_arrays(const Value& left, const Value& right) {
        // Removals are applied in order, each one lowering the position of
        // the elements after it.
        std::size_t shift = 0;
        const std::size_t len = std::max(left.size(), right.size());

        for (std::size_t idx = 0; idx < len; ++idx) {
            if (idx < left.size() && idx < right.size()) {
                path_.push(idx);
                compare(left[idx], right[idx]);
                path_.pop();
            } else if (idx < left.size()) {
                out_.push_back(RemoveOperation{path_ / (idx - shift)});
                ++shift;
            } else {
                out_.push_back(AddOperation{path_ / idx, right[idx]});
            }
        }
    }
};

} // anonymous namespace

Patch diff(const Value& left, const Value& right) {
    Patch result;
    Differ(result).compare(left, right);

    auto log = logger();
    if (log->should_log(spdlog::level::debug)) {
        log->debug("diff produced {} operations", result.size());
    }
    return result;
}

} // namespace docpatch
