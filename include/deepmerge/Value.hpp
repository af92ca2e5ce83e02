/**
 * @file Value.hpp
 * @brief Dynamic tree value used by the untyped merge path
 *
 * Uses nlohmann::json as the underlying value model:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t / uint64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...})
 */

#ifndef DEEPMERGE_VALUE_HPP
#define DEEPMERGE_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace deepmerge {

/**
 * @brief Schema-less JSON tree
 *
 * This is an alias for nlohmann::json. Values of this type are merged with
 * RFC 7396 semantics (see JsonMerge.hpp), never with the typed rules.
 */
using Value = nlohmann::json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
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
    if (val.is_binary()) return "binary";
    return "unknown";
}

} // namespace deepmerge

#endif // DEEPMERGE_VALUE_HPP
