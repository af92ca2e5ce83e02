/**
 * @file DeepMerge.hpp
 * @brief The merge contract and its built-in rules
 *
 * `merge_from(target, source)` merges `source` into `target` in place and
 * consumes `source`. Source takes precedence wherever it carries a value;
 * target keeps everything else. Merge is not commutative.
 *
 * Built-in rules:
 * - Scalars (arithmetic, enums, std::string, ByteString, Time): overwrite
 * - std::unique_ptr<T>: merge the pointees, keep the target's allocation
 * - std::optional<T>: absent source is a no-op, absent target adopts the
 *   source, two present values merge recursively
 * - std::vector<T>: source elements are appended
 * - std::map<K, V>: per-key merge, new keys inserted
 * - Value: RFC 7396 JSON Merge Patch (JsonMerge.hpp)
 * - Any class with a member `void merge_from(T other)`: that member
 *
 * Collection fields whose merge kind is fixed by schema metadata should call
 * the strategies in strategies/List.hpp and strategies/Map.hpp instead of the
 * vector/map defaults.
 *
 * Example of a structural type:
 * ```cpp
 * struct Probe {
 *     std::optional<int> period_seconds;
 *     std::optional<std::string> path;
 *
 *     void merge_from(Probe other) {
 *         deepmerge::merge_from(period_seconds, std::move(other.period_seconds));
 *         deepmerge::merge_from(path, std::move(other.path));
 *     }
 * };
 * ```
 */

#ifndef DEEPMERGE_DEEPMERGE_HPP
#define DEEPMERGE_DEEPMERGE_HPP

#include "deepmerge/JsonMerge.hpp"
#include "deepmerge/Types.hpp"
#include "deepmerge/Value.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace deepmerge {

/**
 * @brief Merge rule for T
 *
 * Specializations provide `static void merge(T& target, T&& source)`.
 * The primary template is left undefined, so merging a type without a
 * rule does not compile.
 */
template <typename T, typename Enable = void>
struct MergeTraits;

namespace detail {

template <typename T>
struct identity {
    using type = T;
};

template <typename T, typename = void>
struct has_member_merge : std::false_type {};

template <typename T>
struct has_member_merge<
    T, std::void_t<decltype(std::declval<T&>().merge_from(std::declval<T&&>()))>>
    : std::true_type {};

} // namespace detail

/**
 * @brief Merge `source` into `target`
 *
 * @param target Value mutated in place; becomes the result
 * @param source Value consumed by the merge
 */
template <typename T>
void merge_from(T& target, typename detail::identity<T>::type source) {
    MergeTraits<T>::merge(target, std::move(source));
}

/**
 * @brief Overwrite rule: target is replaced by source
 */
template <typename T>
struct OverwritingMerge {
    static void merge(T& target, T&& source) {
        target = std::move(source);
    }
};

template <typename T>
struct MergeTraits<T, std::enable_if_t<std::is_arithmetic_v<T> || std::is_enum_v<T>>>
    : OverwritingMerge<T> {};

template <>
struct MergeTraits<std::string> : OverwritingMerge<std::string> {};

template <>
struct MergeTraits<ByteString> : OverwritingMerge<ByteString> {};

template <>
struct MergeTraits<Time> : OverwritingMerge<Time> {};

template <>
struct MergeTraits<Value> {
    static void merge(Value& target, Value&& source) {
        merge_patch(target, std::move(source));
    }
};

// Structural types generated per resource
template <typename T>
struct MergeTraits<T, std::enable_if_t<detail::has_member_merge<T>::value>> {
    static void merge(T& target, T&& source) {
        target.merge_from(std::move(source));
    }
};

/**
 * @brief Owned indirection
 *
 * A null source leaves the target alone. A null target has no pointee to
 * merge into, so it takes ownership of the source's.
 */
template <typename T, typename D>
struct MergeTraits<std::unique_ptr<T, D>> {
    static void merge(std::unique_ptr<T, D>& target, std::unique_ptr<T, D>&& source) {
        if (!source) {
            return;
        }
        if (!target) {
            target = std::move(source);
            return;
        }
        MergeTraits<T>::merge(*target, std::move(*source));
    }
};

template <typename T>
struct MergeTraits<std::optional<T>> {
    static void merge(std::optional<T>& target, std::optional<T>&& source) {
        if (!source) {
            return;
        }
        if (target) {
            MergeTraits<T>::merge(*target, std::move(*source));
        } else {
            target = std::move(source);
        }
    }
};

/**
 * @brief Unannotated sequences: positional append
 */
template <typename T, typename A>
struct MergeTraits<std::vector<T, A>> {
    static void merge(std::vector<T, A>& target, std::vector<T, A>&& source) {
        target.reserve(target.size() + source.size());
        for (auto& item : source) {
            target.push_back(std::move(item));
        }
    }
};

/**
 * @brief Unannotated maps: per-key merge
 */
template <typename K, typename V, typename C, typename A>
struct MergeTraits<std::map<K, V, C, A>> {
    static void merge(std::map<K, V, C, A>& target, std::map<K, V, C, A>&& source) {
        for (auto& [key, value] : source) {
            auto it = target.find(key);
            if (it == target.end()) {
                target.emplace(key, std::move(value));
            } else {
                MergeTraits<V>::merge(it->second, std::move(value));
            }
        }
    }
};

} // namespace deepmerge

#endif // DEEPMERGE_DEEPMERGE_HPP
