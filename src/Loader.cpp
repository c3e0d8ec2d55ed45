/**
 * @file Loader.cpp
 * @brief Document file loading and writing
 */

#include "pathpatch/Loader.hpp"
#include "pathpatch/Errors.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace pathpatch {

// ============================================================================
// Utility functions
// ============================================================================

namespace {

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

template <typename T>
std::string stream_to_string(const T& value) {
    std::ostringstream ss;
    ss << value;
    return ss.str();
}

/**
 * @brief Convert a toml++ node to a document value
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

        case toml::node_type::date:
            return Value(stream_to_string(node.as_date()->get()));

        case toml::node_type::time:
            return Value(stream_to_string(node.as_time()->get()));

        case toml::node_type::date_time:
            return Value(stream_to_string(node.as_date_time()->get()));

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

toml::array make_array_from_json(const Value& a);
toml::table make_table_from_json(const Value& o);

/**
 * @brief Hand the TOML form of a JSON value to sink
 *
 * Unsigned integers above INT64_MAX become floats.
 *
 * @return false for null, which has no TOML form (sink is not called)
 */
template <typename Sink>
bool emit_toml(const Value& v, Sink&& sink) {
    switch (v.type()) {
        case Value::value_t::object:
            sink(make_table_from_json(v));
            return true;
        case Value::value_t::array:
            sink(make_array_from_json(v));
            return true;
        case Value::value_t::string:
            sink(v.get<std::string>());
            return true;
        case Value::value_t::boolean:
            sink(v.get<bool>());
            return true;
        case Value::value_t::number_unsigned: {
            const auto u = v.get<std::uint64_t>();
            if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                sink(static_cast<std::int64_t>(u));
            } else {
                sink(static_cast<double>(u));
            }
            return true;
        }
        case Value::value_t::number_integer:
            sink(v.get<std::int64_t>());
            return true;
        case Value::value_t::number_float:
            sink(v.get<double>());
            return true;
        default:
            return false;
    }
}

toml::array make_array_from_json(const Value& a) {
    toml::array out;
    for (const auto& elem : a) {
        auto push = [&out](auto&& node) { out.push_back(std::forward<decltype(node)>(node)); };
        if (!emit_toml(elem, push)) {
            // Keep the slot so later indices do not shift
            out.push_back(std::string{});
        }
    }
    return out;
}

/**
 * @brief Build a TOML table; null members are skipped
 */
toml::table make_table_from_json(const Value& o) {
    toml::table tbl;
    for (auto it = o.begin(); it != o.end(); ++it) {
        const std::string& key = it.key();
        emit_toml(it.value(), [&tbl, &key](auto&& node) {
            tbl.insert(key, std::forward<decltype(node)>(node));
        });
    }
    return tbl;
}

} // anonymous namespace

// ============================================================================
// Files
// ============================================================================

std::string get_file_extension(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return ext;
}

Bytes read_file_bytes(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }
    return Bytes(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

Value load_document_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string ext = get_file_extension(path);

    if (ext == ".json") {
        const Bytes content = read_file_bytes(path);
        try {
            return Value::parse(content);
        } catch (const Value::parse_error& e) {
            throw DocumentParseError(path, e.what());
        }
    }

    if (ext == ".toml") {
        try {
            toml::table table = toml::parse_file(path);
            return toml_value_to_json(table);
        } catch (const toml::parse_error& e) {
            std::ostringstream details;
            details << e.description() << " (line " << e.source().begin.line
                    << ", column " << e.source().begin.column << ")";
            throw DocumentParseError(path, details.str());
        }
    }

    throw UnsupportedFormatError(ext);
}

std::string to_toml_string(const Value& document) {
    if (document.is_object()) {
        return stream_to_string(make_table_from_json(document));
    }
    return stream_to_string(make_table_from_json(Value{{"value", document}}));
}

void write_document_file(const std::string& path, const Value& document, int indent) {
    const std::string ext = get_file_extension(path);
    std::string text;
    if (ext == ".json") {
        text = document.dump(indent) + "\n";
    } else if (ext == ".toml") {
        text = to_toml_string(document) + "\n";
    } else {
        throw UnsupportedFormatError(ext);
    }

    std::ofstream ofs(path, std::ios::binary);
    if (!ofs) {
        throw DocumentError("Failed to open for write: " + path);
    }
    ofs << text;
}

} // namespace pathpatch
