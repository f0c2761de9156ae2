/**
 * @file Pointer.cpp
 * @brief Implementation of document pointers
 */

#include "docpatch/Pointer.hpp"

#include <limits>
#include <ostream>

namespace docpatch {

// ============================================================================
// Token escaping
// ============================================================================

namespace {
    /**
     * @brief Decode a token, or std::nullopt on a malformed escape
     */
    std::optional<std::string> try_unescape(const std::string& token) {
        std::string result;
        result.reserve(token.size());

        for (std::size_t i = 0; i < token.size(); ++i) {
            char c = token[i];
            if (c != '~') {
                result += c;
                continue;
            }
            if (i + 1 >= token.size()) {
                return std::nullopt;
            }
            char next = token[++i];
            if (next == '0') {
                result += '~';
            } else if (next == '1') {
                result += '/';
            } else {
                return std::nullopt;
            }
        }
        return result;
    }
}

std::string escape_token(const std::string& token) {
    std::string result;
    result.reserve(token.size());

    for (char c : token) {
        if (c == '~') {
            result += "~0";
        } else if (c == '/') {
            result += "~1";
        } else {
            result += c;
        }
    }
    return result;
}

std::string unescape_token(const std::string& token) {
    auto decoded = try_unescape(token);
    if (!decoded) {
        throw PointerError(token, token, "malformed escape sequence");
    }
    return *decoded;
}

std::optional<std::size_t> parse_index(const std::string& token, std::size_t bound) {
    if (token.empty()) return std::nullopt;
    // No leading zeros except "0" itself
    if (token[0] == '0' && token.size() > 1) return std::nullopt;

    constexpr std::size_t max = std::numeric_limits<std::size_t>::max();
    std::size_t value = 0;
    for (char c : token) {
        if (c < '0' || c > '9') return std::nullopt;
        const auto digit = static_cast<std::size_t>(c - '0');
        if (value > (max - digit) / 10) return std::nullopt;
        value = value * 10 + digit;
    }

    if (value >= bound) return std::nullopt;
    return value;
}

// ============================================================================
// Pointer
// ============================================================================

Pointer Pointer::parse(const std::string& text) {
    if (text.empty()) {
        return Pointer();
    }
    if (text[0] != '/') {
        throw PointerError(text, "", "must be empty or start with '/'");
    }

    std::vector<std::string> tokens;
    std::size_t start = 1;
    while (true) {
        const auto slash = text.find('/', start);
        const auto raw = text.substr(start, slash == std::string::npos
                                                ? std::string::npos
                                                : slash - start);
        auto decoded = try_unescape(raw);
        if (!decoded) {
            throw PointerError(text, raw, "malformed escape sequence");
        }
        tokens.push_back(std::move(*decoded));

        if (slash == std::string::npos) break;
        start = slash + 1;
    }

    return Pointer(std::move(tokens));
}

std::string Pointer::to_string() const {
    std::string result;
    for (const auto& token : tokens_) {
        result += '/';
        result += escape_token(token);
    }
    return result;
}

const std::string& Pointer::back() const {
    if (tokens_.empty()) {
        throw PointerError("", "", "root pointer has no last token");
    }
    return tokens_.back();
}

Pointer Pointer::parent() const {
    if (tokens_.empty()) {
        throw PointerError("", "", "root pointer has no parent");
    }
    return Pointer(std::vector<std::string>(tokens_.begin(), tokens_.end() - 1));
}

std::pair<Pointer, std::string> Pointer::split() const {
    return {parent(), tokens_.back()};
}

void Pointer::push(std::string token) {
    tokens_.push_back(std::move(token));
}

void Pointer::push(std::size_t index) {
    tokens_.push_back(std::to_string(index));
}

void Pointer::pop() {
    if (tokens_.empty()) {
        throw PointerError("", "", "cannot pop the root pointer");
    }
    tokens_.pop_back();
}

Pointer Pointer::operator/(const std::string& token) const {
    Pointer child = *this;
    child.push(token);
    return child;
}

Pointer Pointer::operator/(std::size_t index) const {
    Pointer child = *this;
    child.push(index);
    return child;
}

bool Pointer::is_ancestor_of(const Pointer& other) const noexcept {
    if (tokens_.size() >= other.tokens_.size()) {
        return false;
    }
    for (std::size_t i = 0; i < tokens_.size(); ++i) {
        if (tokens_[i] != other.tokens_[i]) return false;
    }
    return true;
}

std::ostream& operator<<(std::ostream& os, const Pointer& ptr) {
    return os << ptr.to_string();
}

// ============================================================================
// Resolution
// ============================================================================

namespace {
    /**
     * @brief Where and why a walk stopped
     */
    struct WalkFailure {
        std::string token;
        std::string reason;
    };

    std::string index_failure_reason(const std::string& token, std::size_t size) {
        if (token == "-") {
            return "append marker does not address an element";
        }
        if (parse_index(token, std::numeric_limits<std::size_t>::max())) {
            return "index out of range (size " + std::to_string(size) + ")";
        }
        return "not a valid array index";
    }

    /**
     * @brief Walk ptr from doc; V is Value or const Value
     * @return Addressed node, or nullptr with failure filled in
     */
    template <typename V>
    V* walk(V& doc, const Pointer& ptr, WalkFailure* failure) {
        V* current = &doc;

        for (const auto& token : ptr.tokens()) {
            if (current->is_object()) {
                auto it = current->find(token);
                if (it == current->end()) {
                    if (failure) *failure = {token, "key not found"};
                    return nullptr;
                }
                current = &*it;
            } else if (current->is_array()) {
                auto idx = parse_index(token, current->size());
                if (!idx) {
                    if (failure) *failure = {token, index_failure_reason(token, current->size())};
                    return nullptr;
                }
                current = &(*current)[*idx];
            } else {
                if (failure) *failure = {token, "cannot traverse into " + type_name(*current)};
                return nullptr;
            }
        }

        return current;
    }

    template <typename V>
    V& walk_or_throw(V& doc, const Pointer& ptr) {
        WalkFailure failure;
        V* node = walk(doc, ptr, &failure);
        if (!node) {
            throw PointerError(ptr.to_string(), failure.token, failure.reason);
        }
        return *node;
    }
}

const Value& resolve(const Value& doc, const Pointer& ptr) {
    return walk_or_throw(doc, ptr);
}

Value& resolve(Value& doc, const Pointer& ptr) {
    return walk_or_throw(doc, ptr);
}

const Value* find(const Value& doc, const Pointer& ptr) {
    return walk(doc, ptr, nullptr);
}

Value* find(Value& doc, const Pointer& ptr) {
    return walk(doc, ptr, nullptr);
}

bool contains(const Value& doc, const Pointer& ptr) {
    return find(doc, ptr) != nullptr;
}

} // namespace docpatch
