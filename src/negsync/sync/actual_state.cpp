/**
 * @file actual_state.cpp
 * @brief Implementation of ActualStateRetriever.
 */
#include "negsync/sync/actual_state.hpp"

#include "negsync/obs/log.hpp"

namespace negsync::sync {

Result<ZoneEndpointMap> ActualStateRetriever::retrieve(const std::string& neg_name) const {
    auto zones = zones_.list_zones();
    if (!zones) return negsync_detail::unexpected<Error>(zones.error());

    ZoneEndpointMap out;
    for (const auto& zone : *zones) {
        auto& set = out[zone];
        auto listed = cloud_.list_network_endpoints(neg_name, zone, /*show_health=*/false);
        if (!listed) return negsync_detail::unexpected<Error>(listed.error());

        for (const auto& ne : *listed) {
            set.insert(NetworkEndpoint{ne.endpoint.ip_address, std::to_string(ne.endpoint.port), ne.endpoint.instance});
        }
        obs::logger()->trace("NEG {} in {} has {} endpoints", neg_name, zone, set.size());
    }
    return out;
}

} // namespace negsync::sync
