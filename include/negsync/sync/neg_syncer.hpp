#pragma once
/**
 * @file neg_syncer.hpp
 * @brief One reconciliation pass for one backend group, end to end.
 * @details ensure groups -> desired state -> actual state -> difference ->
 *          batched attach/detach. Holds no state between passes; the
 *          scheduler runs at most one pass per group key at a time.
 */

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "negsync/cloud/neg_cloud.hpp"
#include "negsync/cluster/objects.hpp"
#include "negsync/cluster/stores.hpp"
#include "negsync/config/config_loader.hpp"
#include "negsync/core/error.hpp"
#include "negsync/endpoint/network_endpoint.hpp"
#include "negsync/obs/observability.hpp"

namespace negsync::sync {

/** @struct SyncRequest
 *  @brief Inputs of one pass.
 */
struct SyncRequest {
    std::string service_namespace;
    std::string service_name;
    std::string neg_name;
    std::string port_name;      ///< For event messages, e.g. "default/web:http"
    std::string target_port;    ///< Numeric or named target port
    std::string subset_labels;  ///< Optional subset selector
    const cluster::Endpoints* endpoints{nullptr};
};

/** @struct SyncReport
 *  @brief What one pass changed.
 */
struct SyncReport {
    std::size_t attached{0};      ///< Endpoints added
    std::size_t detached{0};      ///< Endpoints removed
    std::size_t created{0};       ///< Groups created or recreated
    std::size_t deleted{0};       ///< Misconfigured groups deleted
    std::size_t api_calls{0};     ///< Attach + detach calls issued
    EndpointPodMap endpoint_pods; ///< Desired endpoint -> pod attribution
};

/**
 * @class NegSyncer
 * @brief Composes the reconciliation components against injected collaborators.
 */
class NegSyncer {
public:
    NegSyncer(cloud::NegCloud& cloud, const cluster::ZoneGetter& zones, const cluster::PodStore* pods,
              const cluster::ServiceStore* services, obs::EventRecorder* recorder,
              config::SyncerConfig cfg, obs::Observer* observer = nullptr)
        : cloud_(cloud), zones_(zones), pods_(pods), services_(services), recorder_(recorder),
          cfg_(std::move(cfg)), observer_(observer) {}

    /**
     * @brief Run one pass.
     * @return The first fatal error (zone lookup, cloud call, port encoding).
     *         Changes applied before the failure stay applied; a retried pass
     *         picks up from the resulting actual state.
     */
    Result<SyncReport> sync(const SyncRequest& req);

    /// @return Current configuration (by const reference).
    const config::SyncerConfig& config() const noexcept { return cfg_; }

private:
    Result<SyncReport> run(const SyncRequest& req);

    /// Drain every zone of @p changes through attach (or detach).
    Status apply(const std::string& neg_name, ZoneEndpointMap& changes, bool attach, SyncReport& report);

    cloud::NegCloud& cloud_;
    const cluster::ZoneGetter& zones_;
    const cluster::PodStore* pods_;
    const cluster::ServiceStore* services_;
    obs::EventRecorder* recorder_;
    config::SyncerConfig cfg_;
    obs::Observer* observer_;
};

} // namespace negsync::sync
