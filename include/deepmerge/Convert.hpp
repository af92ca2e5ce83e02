/**
 * @file Convert.hpp
 * @brief Apply an untyped JSON merge patch to a typed value
 *
 * Bridges the two merge paths: the typed value is converted to a Value,
 * patched with RFC 7396 semantics and converted back. Any T with
 * nlohmann::json `to_json` / `from_json` overloads qualifies.
 */

#ifndef DEEPMERGE_CONVERT_HPP
#define DEEPMERGE_CONVERT_HPP

#include "deepmerge/JsonMerge.hpp"
#include "deepmerge/Value.hpp"

#include <utility>

namespace deepmerge {

/**
 * @brief Merge-patch a typed value through its JSON representation
 *
 * Unlike merge_from(), a null member in `patch` clears the corresponding
 * field, provided T's from_json treats a missing member as absent.
 *
 * @param target Typed value; replaced only if conversion back succeeds
 * @param patch RFC 7396 merge patch
 * @throws nlohmann::json::exception or InvalidValueError if the patched
 *         document does not convert back to T
 *
 * Example:
 * ```cpp
 * Container c = ...;
 * apply_json_patch(c, Value::parse(R"({"image": "nginx:1.25", "workingDir": null})"));
 * ```
 */
template <typename T>
void apply_json_patch(T& target, const Value& patch) {
    Value document = target;
    merge_patch(document, patch);
    T patched = document.template get<T>();
    target = std::move(patched);
}

} // namespace deepmerge

#endif // DEEPMERGE_CONVERT_HPP
