#pragma once
/**
 * @file difference.hpp
 * @brief Zone-partitioned set difference between desired and actual state.
 * @details One algorithm for both set flavors (EncodedEndpointSet and
 *          NetworkEndpointSet). A Set must be default constructible, iterable,
 *          and provide insert(value), contains(value) and empty().
 */

#include <utility>

#include "negsync/endpoint/network_endpoint.hpp"

namespace negsync::sync {

/// Changes that move `current` to `target`. add[z] and remove[z] are disjoint.
template <class Set>
struct ZoneDifference {
    ZoneMap<Set> add;    ///< target[z] - current[z], non-empty zones only
    ZoneMap<Set> remove; ///< current[z] - target[z], non-empty zones only
};

namespace detail {
    /// lhs - *rhs; a null rhs is an empty set.
    template <class Set>
    Set minus(const Set& lhs, const Set* rhs) {
        Set out;
        for (const auto& e : lhs) {
            if (rhs == nullptr || !rhs->contains(e)) out.insert(e);
        }
        return out;
    }

    template <class Set>
    void accumulate(const ZoneMap<Set>& from, const ZoneMap<Set>& without, ZoneMap<Set>& out) {
        for (const auto& [zone, set] : from) {
            const auto it = without.find(zone);
            Set diff = minus(set, it == without.end() ? nullptr : &it->second);
            if (!diff.empty()) out.emplace(zone, std::move(diff));
        }
    }
}

/**
 * @brief Compute per-zone add and remove sets.
 * @param target Desired zone map.
 * @param current Actual zone map.
 * @return Zones missing from either side are treated as empty sets.
 */
template <class Set>
ZoneDifference<Set> calculate_difference(const ZoneMap<Set>& target, const ZoneMap<Set>& current) {
    ZoneDifference<Set> out;
    detail::accumulate(target, current, out.add);
    detail::accumulate(current, target, out.remove);
    return out;
}

} // namespace negsync::sync
