/**
 * @file Loader.cpp
 * @brief Document loading and rendering implementation
 */

#include "docpatch/Loader.hpp"
#include "docpatch/Errors.hpp"
#include "docpatch/Logging.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace docpatch {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && !fs::is_directory(path, ec);
}

/**
 * @brief Read entire file into string
 */
std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

/**
 * @brief 1-based line and column of a byte offset in text
 *
 * nlohmann::json reports the position as the count of bytes read, so the
 * offending character is at offset - 1.
 */
std::pair<int, int> line_and_column(const std::string& text, std::size_t offset) {
    int line = 1;
    int column = 1;
    const std::size_t end = std::min(offset > 0 ? offset - 1 : 0, text.size());
    for (std::size_t i = 0; i < end; ++i) {
        if (text[i] == '\n') {
            ++line;
            column = 1;
        } else {
            ++column;
        }
    }
    return {line, column};
}

/**
 * @brief Convert a toml++ node to a Value
 */
Value toml_value_to_json(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date: {
            std::ostringstream ss;
            ss << node.as_date()->get();
            return Value(ss.str());
        }

        case toml::node_type::time: {
            std::ostringstream ss;
            ss << node.as_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::date_time: {
            std::ostringstream ss;
            ss << node.as_date_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_value_to_json(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_value_to_json(val);
            }
            return obj;
        }

        default:
            return Value(nullptr);
    }
}

// ---- Value -> TOML ---------------------------------------------------------

/**
 * @brief Append a scalar to a TOML array or table
 *
 * Insert is called with the converted scalar; the two containers differ
 * only in how a value is added.
 */
template <typename Insert>
void emit_scalar(const Value& v, Insert&& insert) {
    if (v.is_string()) {
        insert(v.get<std::string>());
    } else if (v.is_boolean()) {
        insert(v.get<bool>());
    } else if (v.is_number_unsigned()) {
        const auto u = v.get<std::uint64_t>();
        if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            insert(static_cast<std::int64_t>(u));
        } else {
            // Too large for a TOML integer
            insert(static_cast<double>(u));
        }
    } else if (v.is_number_integer()) {
        insert(v.get<std::int64_t>());
    } else if (v.is_number_float()) {
        insert(v.get<double>());
    } else if (v.is_null()) {
        insert(std::string{});
    } else {
        insert(v.dump());
    }
}

toml::table make_table(const Value& obj);

toml::array make_array(const Value& arr) {
    toml::array out;
    for (const auto& elem : arr) {
        if (elem.is_object()) {
            out.push_back(make_table(elem));
        } else if (elem.is_array()) {
            out.push_back(make_array(elem));
        } else {
            emit_scalar(elem, [&out](auto&& scalar) {
                out.push_back(std::forward<decltype(scalar)>(scalar));
            });
        }
    }
    return out;
}

toml::table make_table(const Value& obj) {
    toml::table tbl;
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        const auto& key = it.key();
        const auto& v = it.value();
        if (v.is_object()) {
            tbl.insert(key, make_table(v));
        } else if (v.is_array()) {
            tbl.insert(key, make_array(v));
        } else {
            emit_scalar(v, [&tbl, &key](auto&& scalar) {
                tbl.insert(key, std::forward<decltype(scalar)>(scalar));
            });
        }
    }
    return tbl;
}

} // anonymous namespace

// ============================================================================
// Input
// ============================================================================

Value load_json_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string content = read_file(path);

    try {
        return Value::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        auto [line, column] = line_and_column(content, e.byte);
        throw DocumentParseError(path, line, column, e.what());
    }
}

Value load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        throw DocumentParseError(
            path,
            static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column),
            std::string(e.description())
        );
    }

    return toml_value_to_json(table);
}

Value load_document(const std::string& path) {
    if (path == kStdinPath) {
        return read_documents(std::cin, 1).front();
    }

    logger()->debug("loading document '{}'", path);

    if (get_file_extension(path) == ".toml") {
        return load_toml_file(path);
    }
    return load_json_file(path);
}

std::vector<Value> read_documents(std::istream& in, std::size_t count,
                                  const std::string& source) {
    std::vector<Value> documents;
    documents.reserve(count);

    for (std::size_t i = 0; i < count; ++i) {
        Value doc;
        try {
            in >> doc;
        } catch (const nlohmann::json::parse_error& e) {
            throw DocumentParseError(source, 0, 0,
                                     "document " + std::to_string(i + 1) + " of " +
                                     std::to_string(count) + ": " + e.what());
        }
        documents.push_back(std::move(doc));
    }
    return documents;
}

std::string get_file_extension(const std::string& path) {
    fs::path p(path);
    return to_lower(p.extension().string());
}

// ============================================================================
// Output
// ============================================================================

std::string to_json_string(const Value& doc, int indent) {
    return doc.dump(indent);
}

std::string to_toml_string(const Value& doc) {
    if (!doc.is_object()) {
        throw Error("TOML output requires an object at the root, got " + type_name(doc));
    }

    std::ostringstream oss;
    oss << make_table(doc);
    return oss.str();
}

} // namespace docpatch
