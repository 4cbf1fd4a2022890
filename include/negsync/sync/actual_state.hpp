#pragma once
/**
 * @file actual_state.hpp
 * @brief Backend group membership -> zoned actual endpoint set.
 */

#include <string>

#include "negsync/cloud/neg_cloud.hpp"
#include "negsync/cluster/stores.hpp"
#include "negsync/core/error.hpp"
#include "negsync/endpoint/network_endpoint.hpp"

namespace negsync::sync {

/**
 * @class ActualStateRetriever
 * @brief Lists a group's registered endpoints in every known zone.
 *
 * Every zone from the zone getter appears in the result, with an empty set
 * when the group has no members there, so stale members of zones without
 * desired endpoints still show up as removals.
 */
class ActualStateRetriever {
public:
    ActualStateRetriever(const cluster::ZoneGetter& zones, const cloud::NegCloud& cloud) noexcept
        : zones_(zones), cloud_(cloud) {}

    /// @return The first zone-listing or endpoint-listing error, unchanged.
    Result<ZoneEndpointMap> retrieve(const std::string& neg_name) const;

private:
    const cluster::ZoneGetter& zones_;
    const cloud::NegCloud& cloud_;
};

} // namespace negsync::sync
