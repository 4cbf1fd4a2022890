#pragma once
/**
 * @file neg_cloud.hpp
 * @brief Backend-group (NEG) cloud API contract consumed by the core.
 * @details Transport, auth and pagination belong to the implementation.
 */

#include <cstdint>
#include <string>
#include <vector>

#include "negsync/core/error.hpp"

namespace negsync::cloud {

    /** @struct NetworkEndpointGroup
     *  @brief Zonal backend group descriptor, keyed by (name, zone).
     */
    struct NetworkEndpointGroup {
        std::string name;
        std::string network_endpoint_type; ///< GCE_VM_IP_PORT or NON_GCP_PRIVATE_IP_PORT
        std::string network;               ///< Network URL
        std::string subnetwork;            ///< Subnetwork URL; empty for hybrid groups
        std::string zone;                  ///< Filled in by the cloud on reads

        bool operator==(const NetworkEndpointGroup&) const = default;
    };

    /** @struct NetworkEndpoint
     *  @brief Cloud representation of one endpoint.
     */
    struct NetworkEndpoint {
        std::string  ip_address;
        std::string  instance; ///< Empty in hybrid mode
        std::int64_t port{0};

        bool operator==(const NetworkEndpoint&) const = default;
    };

    /** @struct NetworkEndpointWithHealth
     *  @brief Listing entry; health states are only filled when requested.
     */
    struct NetworkEndpointWithHealth {
        NetworkEndpoint          endpoint;
        std::vector<std::string> health_states;
    };

    /** @class NegCloud
     *  @brief Backend group CRUD + endpoint membership for one cluster network.
     */
    class NegCloud {
    public:
        virtual ~NegCloud() = default;

        /// ErrorCode::NotFound when the group does not exist.
        virtual Result<NetworkEndpointGroup> get_network_endpoint_group(const std::string& name,
                                                                        const std::string& zone) const = 0;

        virtual Status create_network_endpoint_group(const NetworkEndpointGroup& neg,
                                                     const std::string& zone) = 0;

        virtual Status delete_network_endpoint_group(const std::string& name,
                                                     const std::string& zone) = 0;

        virtual Result<std::vector<NetworkEndpointWithHealth>>
        list_network_endpoints(const std::string& name, const std::string& zone, bool show_health) const = 0;

        virtual Status attach_network_endpoints(const std::string& name, const std::string& zone,
                                                const std::vector<NetworkEndpoint>& endpoints) = 0;

        virtual Status detach_network_endpoints(const std::string& name, const std::string& zone,
                                                const std::vector<NetworkEndpoint>& endpoints) = 0;

        /// Cluster network URL new groups are created in.
        virtual std::string network_url() const = 0;

        /// Cluster subnetwork URL new groups are created in.
        virtual std::string subnetwork_url() const = 0;
    };

} // namespace negsync::cloud
