#pragma once
/**
 * @file memory_neg_cloud.hpp
 * @brief In-process backend-group API simulator.
 * @details Stands in for the real cloud API in tests and the demo app. Mirrors
 *          the real API's failure modes: duplicate create, delete/attach on a
 *          missing group and detach of a non-member endpoint are errors.
 */

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "negsync/cloud/neg_cloud.hpp"

namespace negsync::cloud {

    /** @struct CallCounters
     *  @brief Successful mutating calls, for assertions and the demo output.
     */
    struct CallCounters {
        uint64_t creates{0};
        uint64_t deletes{0};
        uint64_t attaches{0};
        uint64_t detaches{0};
    };

    class MemoryNegCloud final : public NegCloud {
    public:
        MemoryNegCloud(std::string network_url, std::string subnetwork_url);

        /// Seed a group as-is (no validation, no counters).
        void put_network_endpoint_group(const NetworkEndpointGroup& neg, const std::string& zone);

        /// Current members of a group; empty if the group is missing.
        std::vector<NetworkEndpoint> endpoints(const std::string& name, const std::string& zone) const;

        /// Zones that currently hold a group called @p name.
        std::vector<std::string> zones_with_group(const std::string& name) const;

        CallCounters counters() const;

        Result<NetworkEndpointGroup> get_network_endpoint_group(const std::string& name,
                                                                const std::string& zone) const override;
        Status create_network_endpoint_group(const NetworkEndpointGroup& neg, const std::string& zone) override;
        Status delete_network_endpoint_group(const std::string& name, const std::string& zone) override;
        Result<std::vector<NetworkEndpointWithHealth>>
        list_network_endpoints(const std::string& name, const std::string& zone, bool show_health) const override;
        Status attach_network_endpoints(const std::string& name, const std::string& zone,
                                        const std::vector<NetworkEndpoint>& endpoints) override;
        Status detach_network_endpoints(const std::string& name, const std::string& zone,
                                        const std::vector<NetworkEndpoint>& endpoints) override;
        std::string network_url() const override { return network_url_; }
        std::string subnetwork_url() const override { return subnetwork_url_; }

    private:
        struct Group {
            NetworkEndpointGroup         neg;
            std::vector<NetworkEndpoint> members;
        };

        // (zone, name) -> group
        using Key = std::pair<std::string, std::string>;

        static Error missing(const std::string& name, const std::string& zone);

        std::string network_url_;
        std::string subnetwork_url_;
        mutable std::mutex mu_;
        std::map<Key, Group> groups_;
        CallCounters counters_;
    };

} // namespace negsync::cloud
