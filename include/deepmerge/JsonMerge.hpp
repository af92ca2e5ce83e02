/**
 * @file JsonMerge.hpp
 * @brief JSON Merge Patch (RFC 7396) over untyped Value trees
 *
 * This path is independent of the typed rules in DeepMerge.hpp. Unlike a
 * typed std::optional, a null member in a patch object deletes the key.
 */

#ifndef DEEPMERGE_JSON_MERGE_HPP
#define DEEPMERGE_JSON_MERGE_HPP

#include "deepmerge/Value.hpp"

#include <vector>

namespace deepmerge {

/**
 * @brief Apply `patch` to `target` in place
 *
 * Merging rules:
 * - Both objects: for each member of patch, a null value removes the key
 *   from target; any other value is merged into target's member (a missing
 *   member starts out as null)
 * - Anything else: target is replaced by patch wholesale
 *
 * Arrays are never merged element-wise. A null patch at the root replaces
 * the target with null; it only deletes when it is an object member.
 *
 * @param target Document modified in place
 * @param patch Merge patch (consumed)
 *
 * Examples:
 * ```cpp
 * Value doc = {{"a", 1}, {"b", 2}};
 * merge_patch(doc, {{"a", nullptr}});
 * // doc: {"b": 2}
 *
 * Value doc2 = {{"db", {{"host", "a"}, {"port", 1}}}};
 * merge_patch(doc2, {{"db", {{"port", 2}}}});
 * // doc2: {"db": {"host": "a", "port": 2}}
 *
 * Value doc3 = {{"tags", {1, 2}}};
 * merge_patch(doc3, {{"tags", {3}}});
 * // doc3: {"tags": [3]}
 * ```
 */
void merge_patch(Value& target, Value patch);

/**
 * @brief Copying form of merge_patch
 *
 * @param target Document to patch (unchanged)
 * @param patch Merge patch
 * @return Patched copy of target
 */
Value merge_patched(const Value& target, const Value& patch);

/**
 * @brief Apply a sequence of documents in order
 *
 * The first document is the base, each following one is a merge patch on
 * the result so far.
 *
 * @param documents Documents in precedence order (lowest first)
 * @return Merged result; an empty object when documents is empty
 *
 * Example:
 * ```cpp
 * Value defaults = {{"a", 1}, {"b", 2}};
 * Value file = {{"b", 3}, {"c", 4}};
 * Value overrides = {{"c", nullptr}};
 *
 * auto result = merge_patch_all({defaults, file, overrides});
 * // Result: {"a": 1, "b": 3}
 * ```
 */
Value merge_patch_all(const std::vector<Value>& documents);

} // namespace deepmerge

#endif // DEEPMERGE_JSON_MERGE_HPP
