/**
 * @file Loader.cpp
 * @brief Document loading and saving
 */

#include "deepmerge/Loader.hpp"
#include "deepmerge/Errors.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

namespace fs = std::filesystem;

namespace deepmerge {

// ============================================================================
// Utility functions
// ============================================================================

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

/**
 * @brief Read entire file into string.
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

template <typename T>
Value stringify(const T& v) {
    std::ostringstream ss;
    ss << v;
    return Value(ss.str());
}

/**
 * @brief Convert toml++ node to Value.
 */
Value toml_to_value(const toml::node& node) {
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
            return stringify(node.as_date()->get());

        case toml::node_type::time:
            return stringify(node.as_time()->get());

        case toml::node_type::date_time:
            return stringify(node.as_date_time()->get());

        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_to_value(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_to_value(val);
            }
            return obj;
        }

        default:
            return Value(nullptr);
    }
}

// ---- Value -> TOML ---------------------------------------------------------

toml::table make_table(const Value& o, const std::string& path);

toml::array make_array(const Value& a, const std::string& path) {
    toml::array out;
    for (const auto& elem : a) {
        if (elem.is_object()) {
            out.push_back(make_table(elem, path));
        } else if (elem.is_array()) {
            out.push_back(make_array(elem, path));
        } else if (elem.is_string()) {
            out.push_back(elem.get<std::string>());
        } else if (elem.is_boolean()) {
            out.push_back(elem.get<bool>());
        } else if (elem.is_number_unsigned()) {
            const auto u = elem.get<std::uint64_t>();
            if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
                out.push_back(static_cast<std::int64_t>(u));
            else
                out.push_back(static_cast<double>(u));
        } else if (elem.is_number_integer()) {
            out.push_back(elem.get<std::int64_t>());
        } else if (elem.is_number_float()) {
            out.push_back(elem.get<double>());
        } else if (elem.is_null()) {
            throw UnsupportedFormatError(path, "TOML arrays cannot hold null");
        } else {
            out.push_back(elem.dump());
        }
    }
    return out;
}

toml::table make_table(const Value& o, const std::string& path) {
    toml::table tbl;
    for (auto it = o.begin(); it != o.end(); ++it) {
        const auto& k = it.key();
        const auto& v = it.value();
        if (v.is_null()) {
            continue; // no null in TOML
        } else if (v.is_object()) {
            tbl.insert(k, make_table(v, path));
        } else if (v.is_array()) {
            tbl.insert(k, make_array(v, path));
        } else if (v.is_string()) {
            tbl.insert(k, v.get<std::string>());
        } else if (v.is_boolean()) {
            tbl.insert(k, v.get<bool>());
        } else if (v.is_number_unsigned()) {
            const auto u = v.get<std::uint64_t>();
            if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
                tbl.insert(k, static_cast<std::int64_t>(u));
            else
                tbl.insert(k, static_cast<double>(u)); // oversize for TOML int
        } else if (v.is_number_integer()) {
            tbl.insert(k, v.get<std::int64_t>());
        } else if (v.is_number_float()) {
            tbl.insert(k, v.get<double>());
        } else {
            tbl.insert(k, v.dump());
        }
    }
    return tbl;
}

} // anonymous namespace

// ============================================================================
// Formats
// ============================================================================

std::string get_file_extension(const std::string& path) {
    fs::path p(path);
    return to_lower(p.extension().string());
}

DocumentFormat format_from_extension(const std::string& path) {
    const std::string ext = get_file_extension(path);
    if (ext == ".json") {
        return DocumentFormat::Json;
    }
    if (ext == ".toml") {
        return DocumentFormat::Toml;
    }
    throw UnsupportedFormatError(
        path, "unknown extension '" + ext + "' (expected .json or .toml)");
}

DocumentFormat format_from_name(const std::string& name) {
    const std::string lowered = to_lower(name);
    if (lowered == "json") {
        return DocumentFormat::Json;
    }
    if (lowered == "toml") {
        return DocumentFormat::Toml;
    }
    throw UnsupportedFormatError(
        name, "unknown format name (expected json or toml)");
}

Value parse_document(const std::string& text, DocumentFormat format,
                     const std::string& origin) {
    if (format == DocumentFormat::Json) {
        try {
            return nlohmann::json::parse(text);
        } catch (const nlohmann::json::parse_error& e) {
            // nlohmann reports a byte offset rather than line/column
            throw DocumentParseError(origin, 0, 0, e.what());
        }
    }

    try {
        toml::table table = toml::parse(text, origin);
        return toml_to_value(table);
    } catch (const toml::parse_error& e) {
        throw DocumentParseError(
            origin,
            static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column),
            std::string(e.description())
        );
    }
}

// ============================================================================
// Loading
// ============================================================================

Value load_json_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }
    return parse_document(read_file(path), DocumentFormat::Json, path);
}

Value load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }
    return parse_document(read_file(path), DocumentFormat::Toml, path);
}

Value load_document(const std::string& path) {
    const DocumentFormat format = format_from_extension(path);
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }
    return parse_document(read_file(path), format, path);
}

// ============================================================================
// Saving
// ============================================================================

std::string dump_document(const Value& document, DocumentFormat format, int indent) {
    if (format == DocumentFormat::Json) {
        return document.dump(indent);
    }

    if (!document.is_object()) {
        throw UnsupportedFormatError(
            "<toml>", "TOML root must be an object, got " + type_name(document));
    }

    std::ostringstream oss;
    oss << make_table(document, "<toml>");
    return oss.str();
}

void write_document(const std::string& path, const Value& document, int indent) {
    write_document(path, document, format_from_extension(path), indent);
}

void write_document(const std::string& path, const Value& document, DocumentFormat format,
                    int indent) {
    const std::string text = dump_document(document, format, indent);

    std::ofstream ofs(path);
    if (!ofs) {
        throw DeepMergeError("Failed to open for write: " + path);
    }
    ofs << text << "\n";
    ofs.flush();
    if (!ofs) {
        throw DeepMergeError("Failed to write: " + path);
    }
}

} // namespace deepmerge
