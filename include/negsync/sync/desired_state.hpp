#pragma once
/**
 * @file desired_state.hpp
 * @brief Endpoint-discovery object -> zoned desired endpoint set.
 */

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "negsync/cluster/objects.hpp"
#include "negsync/cluster/stores.hpp"
#include "negsync/core/error.hpp"
#include "negsync/endpoint/network_endpoint.hpp"

namespace negsync::sync {

/** @struct DesiredState
 *  @brief Mapper output.
 */
struct DesiredState {
    ZoneEndpointMap zones; ///< zone -> endpoints; a zone may map to an empty set
    EndpointPodMap  pods;  ///< endpoint -> backing pod
};

/**
 * @brief Resolve a service target port against one subset's port list.
 * @param target_port Non-zero integer literal, or a port name.
 * @return Decimal port string, or std::nullopt when no listed port matches.
 */
std::optional<std::string> resolve_target_port(const std::vector<cluster::EndpointPort>& ports,
                                               std::string_view target_port);

/**
 * @class DesiredStateMapper
 * @brief Maps a service's endpoints into zone sets.
 *
 * Ready addresses are included as-is. Not-ready addresses are included only
 * while their pod exists and is not terminating. With subset labels set,
 * only addresses backed by pods matching the selector are considered.
 */
class DesiredStateMapper {
public:
    /// @param pods Optional; without it not-ready addresses and subset checks fail closed.
    DesiredStateMapper(const cluster::ZoneGetter& zones, const cluster::PodStore* pods) noexcept
        : zones_(zones), pods_(pods) {}

    /**
     * @brief Build the desired state.
     * @param endpoints Discovery object; nullptr yields empty results.
     * @param target_port Numeric or named target port.
     * @param subset_labels Selector expression; empty disables subset filtering.
     * @return ErrorCode::ZoneLookup if any considered node cannot be zoned.
     */
    Result<DesiredState> map(const cluster::Endpoints* endpoints, std::string_view target_port,
                             std::string_view subset_labels = {}) const;

private:
    const cluster::ZoneGetter& zones_;
    const cluster::PodStore* pods_;
};

} // namespace negsync::sync
