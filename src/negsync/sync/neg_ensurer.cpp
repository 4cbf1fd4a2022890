/**
 * @file neg_ensurer.cpp
 * @brief Implementation of NegEnsurer.
 */
#include "negsync/sync/neg_ensurer.hpp"

#include <optional>
#include <utility>

#include "negsync/cloud/resource_id.hpp"
#include "negsync/config/constants.hpp"
#include "negsync/obs/log.hpp"

namespace negsync::sync {

namespace {

std::optional<cluster::Service> lookup_service(const cluster::ServiceStore& services,
                                               const std::string& namespace_, const std::string& name) {
    const std::string key = cluster::object_key(namespace_, name);
    auto svc = services.get_by_key(key);
    if (!svc) {
        obs::logger()->error("Failed to retrieve service {} from store: {}", key, svc.error().message);
        return std::nullopt;
    }
    return std::move(*svc);
}

} // namespace

bool NegEnsurer::matches_cluster(const cloud::NetworkEndpointGroup& neg) const {
    // Hybrid groups are created without a subnetwork.
    const std::string want_subnetwork = hybrid_ ? std::string{} : cloud_.subnetwork_url();
    return cloud::equal_resource_ids(neg.network, cloud_.network_url()) &&
           cloud::equal_resource_ids(neg.subnetwork, want_subnetwork);
}

void NegEnsurer::notify(const EnsureRequest& req, std::string_view reason, std::string_view verb) const {
    if (recorder_ == nullptr || services_ == nullptr) return;
    const auto svc = lookup_service(*services_, req.service_namespace, req.service_name);
    if (!svc) return;
    recorder_->eventf(*svc, obs::EventType::Normal, reason, "{} NEG \"{}\" for {} in \"{}\".",
                      verb, req.neg_name, req.port_name, req.zone);
}

Result<EnsureOutcome> NegEnsurer::ensure(const EnsureRequest& req) const {
    auto existing = cloud_.get_network_endpoint_group(req.neg_name, req.zone);
    if (!existing) {
        // Most likely the group does not exist yet.
        obs::logger()->trace("Error while retrieving \"{}\" in zone \"{}\": {}",
                             req.neg_name, req.zone, existing.error().message);
    }

    bool recreate = false;
    if (existing && !matches_cluster(*existing)) {
        recreate = true;
        obs::logger()->info("NEG \"{}\" in \"{}\" does not match network and subnetwork of the cluster. Deleting NEG.",
                            req.neg_name, req.zone);
        if (auto st = cloud_.delete_network_endpoint_group(req.neg_name, req.zone); !st) {
            return negsync_detail::unexpected<Error>(st.error());
        }
        notify(req, config::constants::EVENT_REASON_DELETE, "Deleted");
    }

    if (existing && !recreate) return EnsureOutcome::NoOp;

    obs::logger()->info("Creating NEG \"{}\" for {} in \"{}\".", req.neg_name, req.port_name, req.zone);
    cloud::NetworkEndpointGroup desired{
        .name = req.neg_name,
        .network_endpoint_type = std::string(config::constants::NEG_TYPE_GCE_VM_IP_PORT),
        .network = cloud_.network_url(),
        .subnetwork = cloud_.subnetwork_url(),
    };
    if (hybrid_) {
        desired.network_endpoint_type = std::string(config::constants::NEG_TYPE_NON_GCP_PRIVATE_IP_PORT);
        desired.subnetwork.clear();
    }
    if (auto st = cloud_.create_network_endpoint_group(desired, req.zone); !st) {
        return negsync_detail::unexpected<Error>(st.error());
    }
    notify(req, config::constants::EVENT_REASON_CREATE, "Created");
    return recreate ? EnsureOutcome::Recreated : EnsureOutcome::Created;
}

} // namespace negsync::sync
