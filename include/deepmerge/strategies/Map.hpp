/**
 * @file Map.hpp
 * @brief Merge strategies for string-keyed map fields
 *
 * - granular: per-key merge, new keys inserted verbatim
 * - atomic:   the patch map replaces the current map
 *
 * Like the list strategies, these accept a bare `std::map<std::string, V>`
 * or an optional one (see MapCarrier).
 */

#ifndef DEEPMERGE_STRATEGIES_MAP_HPP
#define DEEPMERGE_STRATEGIES_MAP_HPP

#include "deepmerge/DeepMerge.hpp"

#include <map>
#include <optional>
#include <string>

namespace deepmerge {
namespace strategies {
namespace map {

/**
 * @brief Adapter over a bare or optional string-keyed map
 */
template <typename M>
struct MapCarrier;

template <typename V, typename C, typename A>
struct MapCarrier<std::map<std::string, V, C, A>> {
    using Mapped = V;
    using Map = std::map<std::string, V, C, A>;

    static void set(Map& current, Map&& patch) {
        current = std::move(patch);
    }

    static Map* as_mut_opt(Map& current) {
        return &current;
    }

    static std::optional<Map> into_opt(Map&& patch) {
        return std::optional<Map>(std::move(patch));
    }
};

template <typename V, typename C, typename A>
struct MapCarrier<std::optional<std::map<std::string, V, C, A>>> {
    using Mapped = V;
    using Map = std::map<std::string, V, C, A>;

    static void set(std::optional<Map>& current, std::optional<Map>&& patch) {
        if (patch) {
            current = std::move(patch);
        }
    }

    static Map* as_mut_opt(std::optional<Map>& current) {
        return current ? &*current : nullptr;
    }

    static std::optional<Map> into_opt(std::optional<Map>&& patch) {
        return std::move(patch);
    }
};

/**
 * @brief map/granular: merge values key by key
 *
 * @param current Map modified in place
 * @param patch Map consumed by the merge
 */
template <typename M>
void granular(M& current, typename detail::identity<M>::type patch) {
    auto* entries = MapCarrier<M>::as_mut_opt(current);
    if (entries == nullptr) {
        MapCarrier<M>::set(current, std::move(patch));
        return;
    }

    auto incoming = MapCarrier<M>::into_opt(std::move(patch));
    if (!incoming) {
        return;
    }

    for (auto& [key, value] : *incoming) {
        auto it = entries->find(key);
        if (it == entries->end()) {
            entries->emplace(key, std::move(value));
        } else {
            deepmerge::merge_from(it->second, std::move(value));
        }
    }
}

/**
 * @brief map/atomic: replace the whole map
 */
template <typename M>
void atomic(M& current, typename detail::identity<M>::type patch) {
    MapCarrier<M>::set(current, std::move(patch));
}

} // namespace map
} // namespace strategies
} // namespace deepmerge

#endif // DEEPMERGE_STRATEGIES_MAP_HPP
