/**
 * @file List.hpp
 * @brief Merge strategies for sequence fields
 *
 * The strategy of a list field is a property of the field (schema metadata),
 * so generated types call one of these explicitly:
 * - atomic: the patch list replaces the current list
 * - map:    items are reconciled by identity key, matches merge recursively,
 *           the rest are appended
 * - set:    patch items are appended unless an equal item is present
 *
 * Every strategy accepts either `std::vector<T>` or
 * `std::optional<std::vector<T>>` through ListCarrier. When the current
 * value is an absent optional, the patch is assigned if it is present.
 */

#ifndef DEEPMERGE_STRATEGIES_LIST_HPP
#define DEEPMERGE_STRATEGIES_LIST_HPP

#include "deepmerge/DeepMerge.hpp"

#include <algorithm>
#include <functional>
#include <optional>
#include <vector>

namespace deepmerge {
namespace strategies {
namespace list {

/**
 * @brief Adapter over a bare or optional sequence
 *
 * - set():        replace wholesale (optional carriers skip an absent patch)
 * - as_mut_opt(): the current sequence, or nullptr when absent
 * - into_opt():   the patch as an owned sequence, if present
 */
template <typename V>
struct ListCarrier;

template <typename T, typename A>
struct ListCarrier<std::vector<T, A>> {
    using Item = T;
    using List = std::vector<T, A>;

    static void set(List& current, List&& patch) {
        current = std::move(patch);
    }

    static List* as_mut_opt(List& current) {
        return &current;
    }

    static std::optional<List> into_opt(List&& patch) {
        return std::optional<List>(std::move(patch));
    }
};

template <typename T, typename A>
struct ListCarrier<std::optional<std::vector<T, A>>> {
    using Item = T;
    using List = std::vector<T, A>;

    static void set(std::optional<List>& current, std::optional<List>&& patch) {
        if (patch) {
            current = std::move(patch);
        }
    }

    static List* as_mut_opt(std::optional<List>& current) {
        return current ? &*current : nullptr;
    }

    static std::optional<List> into_opt(std::optional<List>&& patch) {
        return std::move(patch);
    }
};

/**
 * @brief Identity test between a patch item (first) and a current item
 */
template <typename V>
using KeyComparator = std::function<bool(const typename ListCarrier<V>::Item&,
                                         const typename ListCarrier<V>::Item&)>;

/**
 * @brief list/atomic: replace the whole sequence
 */
template <typename V>
void atomic(V& current, typename detail::identity<V>::type patch) {
    ListCarrier<V>::set(current, std::move(patch));
}

/**
 * @brief list/map: treat the sequence as a map keyed by identity
 *
 * For each patch item, the first current item for which every comparator
 * returns true is merged with it; otherwise the patch item is appended.
 * Current order is kept and appended items keep patch order. Comparators
 * are AND-combined, so several of them form a composite key. If the key
 * does not single out one item, the first match wins.
 *
 * @param current Sequence modified in place
 * @param patch Sequence consumed by the merge
 * @param key_comparators Identity tests, called as f(patch_item, current_item)
 *
 * Example:
 * ```cpp
 * list::map(spec.containers, std::move(other.containers), {
 *     [](const Container& a, const Container& b) { return a.name == b.name; },
 * });
 * ```
 */
template <typename V>
void map(V& current, typename detail::identity<V>::type patch,
         const std::vector<KeyComparator<V>>& key_comparators) {
    auto* items = ListCarrier<V>::as_mut_opt(current);
    if (items == nullptr) {
        ListCarrier<V>::set(current, std::move(patch));
        return;
    }

    auto incoming = ListCarrier<V>::into_opt(std::move(patch));
    if (!incoming) {
        return;
    }

    for (auto& patch_item : *incoming) {
        auto match = std::find_if(items->begin(), items->end(), [&](const auto& item) {
            return std::all_of(key_comparators.begin(), key_comparators.end(),
                               [&](const auto& same_key) { return same_key(patch_item, item); });
        });

        if (match != items->end()) {
            deepmerge::merge_from(*match, std::move(patch_item));
        } else {
            items->push_back(std::move(patch_item));
        }
    }
}

/**
 * @brief list/set: append patch items not already present
 *
 * Items are compared with operator==, so duplicates inside the patch are
 * dropped too.
 */
template <typename V>
void set(V& current, typename detail::identity<V>::type patch) {
    auto* items = ListCarrier<V>::as_mut_opt(current);
    if (items == nullptr) {
        ListCarrier<V>::set(current, std::move(patch));
        return;
    }

    auto incoming = ListCarrier<V>::into_opt(std::move(patch));
    if (!incoming) {
        return;
    }

    for (auto& patch_item : *incoming) {
        if (std::find(items->begin(), items->end(), patch_item) == items->end()) {
            items->push_back(std::move(patch_item));
        }
    }
}

} // namespace list
} // namespace strategies
} // namespace deepmerge

#endif // DEEPMERGE_STRATEGIES_LIST_HPP
