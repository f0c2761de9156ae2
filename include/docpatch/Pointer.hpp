/**
 * @file Pointer.hpp
 * @brief Document pointers (RFC 6901)
 *
 * A pointer addresses a node inside a document as a sequence of tokens.
 * Its wire form is either the empty string (the whole document) or a
 * sequence of '/'-prefixed tokens in which '~' is written as "~0" and
 * '/' as "~1":
 *
 * - ""            → root
 * - "/a/b"        → ["a", "b"]
 * - "/a~1b/m~0n"  → ["a/b", "m~n"]
 * - "/"           → [""] (the empty key)
 * - "/items/0"    → ["items", "0"]
 *
 * Tokens are stored decoded. Whether a token is an object key or an array
 * index is decided by the container it is applied to.
 */

#ifndef DOCPATCH_POINTER_HPP
#define DOCPATCH_POINTER_HPP

#include "docpatch/Value.hpp"
#include "docpatch/Errors.hpp"

#include <cstddef>
#include <initializer_list>
#include <iosfwd>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace docpatch {

// ============================================================================
// Token escaping
// ============================================================================

/**
 * @brief Encode a decoded token for the wire form
 *
 * Replaces '~' with "~0" and '/' with "~1". Total: every string has
 * exactly one encoding.
 *
 * Examples:
 * - "a/b" → "a~1b"
 * - "m~n" → "m~0n"
 * - "~1"  → "~01"
 */
std::string escape_token(const std::string& token);

/**
 * @brief Decode a wire-form token
 *
 * Decodes "~1" to '/' and "~0" to '~' in one left-to-right pass, so
 * unescape_token(escape_token(k)) == k for every k.
 *
 * @throws PointerError if '~' is not followed by '0' or '1'
 */
std::string unescape_token(const std::string& token);

/**
 * @brief Parse an array index token
 *
 * Accepts only decimal digits without a leading zero (except "0" itself).
 *
 * @param token Decoded token
 * @param bound Exclusive upper bound; pass size() for element access and
 *              size() + 1 for insertion
 * @return The index, or std::nullopt if malformed or >= bound
 */
std::optional<std::size_t> parse_index(const std::string& token, std::size_t bound);

// ============================================================================
// Pointer
// ============================================================================

/**
 * @brief Ordered sequence of decoded tokens addressing a document node
 */
class Pointer {
public:
    /// Root pointer (zero tokens)
    Pointer() = default;

    explicit Pointer(std::vector<std::string> tokens)
        : tokens_(std::move(tokens))
    {}

    Pointer(std::initializer_list<std::string> tokens)
        : tokens_(tokens)
    {}

    /**
     * @brief Parse the wire form of a pointer
     *
     * @param text "" or a sequence of '/'-prefixed escaped tokens
     * @return Parsed pointer
     * @throws PointerError if text is non-empty and does not start with
     *         '/', or contains a malformed escape
     *
     * Examples:
     * ```cpp
     * Pointer::parse("");          // root
     * Pointer::parse("/a~1b/0");   // ["a/b", "0"]
     * Pointer::parse("a/b");       // throws PointerError
     * ```
     */
    static Pointer parse(const std::string& text);

    /**
     * @brief Wire form of the pointer ("" for root)
     */
    std::string to_string() const;

    bool is_root() const noexcept {
        return tokens_.empty();
    }

    std::size_t size() const noexcept {
        return tokens_.size();
    }

    const std::vector<std::string>& tokens() const noexcept {
        return tokens_;
    }

    /**
     * @brief Last token
     * @throws PointerError if this is the root pointer
     */
    const std::string& back() const;

    /**
     * @brief Pointer to the parent node
     * @throws PointerError if this is the root pointer
     */
    Pointer parent() const;

    /**
     * @brief Split into parent pointer and last token
     *
     * Used by the mutating operations, which act on a container and a key
     * or index inside it. The root has no parent and is only addressable
     * as a whole-document target.
     *
     * @throws PointerError if this is the root pointer
     */
    std::pair<Pointer, std::string> split() const;

    /// Append a token
    void push(std::string token);

    /// Append an array index token
    void push(std::size_t index);

    /**
     * @brief Remove the last token
     * @throws PointerError if this is the root pointer
     */
    void pop();

    /// Child pointer with one more token
    Pointer operator/(const std::string& token) const;

    /// Child pointer with one more array index token
    Pointer operator/(std::size_t index) const;

    /**
     * @brief Check if this pointer addresses a strict ancestor of other
     *
     * Equivalent to: other's wire form starts with this wire form and the
     * next character is '/'.
     *
     * Examples:
     * - "/a" is an ancestor of "/a/b"
     * - "/a" is not an ancestor of "/a" or "/ab"
     * - "" is an ancestor of every non-root pointer
     */
    bool is_ancestor_of(const Pointer& other) const noexcept;

    friend bool operator==(const Pointer& lhs, const Pointer& rhs) {
        return lhs.tokens_ == rhs.tokens_;
    }

    friend bool operator!=(const Pointer& lhs, const Pointer& rhs) {
        return !(lhs == rhs);
    }

private:
    std::vector<std::string> tokens_;
};

/// Writes the wire form
std::ostream& operator<<(std::ostream& os, const Pointer& ptr);

// ============================================================================
// Resolution
// ============================================================================

/**
 * @brief Resolve a pointer in a document (strict)
 *
 * Walks tokens from the root. An object token looks up the exact decoded
 * key; an array token must be a valid index in [0, size). The append
 * marker "-" never resolves.
 *
 * @param doc Document to walk
 * @param ptr Pointer to resolve
 * @return Reference to the addressed node
 * @throws PointerError on a missing key, malformed or out-of-range index,
 *         or an attempt to index through a scalar
 *
 * Examples:
 * ```cpp
 * Value doc = {{"db", {{"hosts", {"a", "b"}}}}};
 * resolve(doc, Pointer::parse("/db/hosts/1"));  // "b"
 * resolve(doc, Pointer::parse("/db/port"));     // throws PointerError
 * resolve(doc, Pointer::parse("/db/hosts/01")); // throws PointerError
 * ```
 */
const Value& resolve(const Value& doc, const Pointer& ptr);

/**
 * @brief Resolve a pointer in a document (strict, mutable)
 * @throws PointerError as for the const overload
 */
Value& resolve(Value& doc, const Pointer& ptr);

/**
 * @brief Resolve a pointer, returning nullptr if it does not resolve
 */
const Value* find(const Value& doc, const Pointer& ptr);

/**
 * @brief Resolve a pointer, returning nullptr if it does not resolve
 */
Value* find(Value& doc, const Pointer& ptr);

/**
 * @brief Check if a pointer resolves in a document
 */
bool contains(const Value& doc, const Pointer& ptr);

} // namespace docpatch

#endif // DOCPATCH_POINTER_HPP
