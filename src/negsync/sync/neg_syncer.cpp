/**
 * @file neg_syncer.cpp
 * @brief Implementation of NegSyncer.
 */
#include "negsync/sync/neg_syncer.hpp"

#include <utility>

#include "negsync/endpoint/endpoint_codec.hpp"
#include "negsync/obs/log.hpp"
#include "negsync/sync/actual_state.hpp"
#include "negsync/sync/batcher.hpp"
#include "negsync/sync/desired_state.hpp"
#include "negsync/sync/difference.hpp"
#include "negsync/sync/neg_ensurer.hpp"

namespace negsync::sync {

namespace {

// Hybrid endpoints are stored without an instance; compare them the same way.
void strip_nodes(DesiredState& desired) {
    for (auto& [zone, set] : desired.zones) {
        NetworkEndpointSet stripped;
        for (const auto& e : set) stripped.insert(NetworkEndpoint{e.ip, e.port, {}});
        set = std::move(stripped);
    }
    EndpointPodMap pods;
    for (auto& [e, pod] : desired.pods) {
        pods.insert_or_assign(NetworkEndpoint{e.ip, e.port, {}}, std::move(pod));
    }
    desired.pods = std::move(pods);
}

} // namespace

Result<SyncReport> NegSyncer::sync(const SyncRequest& req) {
    auto report = run(req);
    if (observer_) {
        obs::PassRecord rec{.neg_name = req.neg_name};
        if (report) {
            rec.attached = report->attached;
            rec.detached = report->detached;
            rec.created = report->created;
            rec.deleted = report->deleted;
        } else {
            rec.ok = false;
            rec.error = report.error().message;
        }
        observer_->record(rec);
    }
    if (!report) {
        obs::logger()->error("sync of NEG {} for {}/{} failed ({}): {}", req.neg_name, req.service_namespace,
                             req.service_name, to_string(report.error().code), report.error().message);
    }
    return report;
}

Result<SyncReport> NegSyncer::run(const SyncRequest& req) {
    SyncReport report;

    auto zones = zones_.list_zones();
    if (!zones) return negsync_detail::unexpected<Error>(zones.error());

    const NegEnsurer ensurer(cloud_, services_, recorder_, cfg_.create_hybrid_neg);
    for (const auto& zone : *zones) {
        auto outcome = ensurer.ensure(EnsureRequest{req.service_namespace, req.service_name,
                                                    req.neg_name, zone, req.port_name});
        if (!outcome) return negsync_detail::unexpected<Error>(outcome.error());
        if (*outcome == EnsureOutcome::Created) {
            ++report.created;
        } else if (*outcome == EnsureOutcome::Recreated) {
            ++report.created;
            ++report.deleted;
        }
    }

    const DesiredStateMapper mapper(zones_, pods_);
    auto desired = mapper.map(req.endpoints, req.target_port, req.subset_labels);
    if (!desired) return negsync_detail::unexpected<Error>(desired.error());
    if (cfg_.create_hybrid_neg) strip_nodes(*desired);

    const ActualStateRetriever retriever(zones_, cloud_);
    auto actual = retriever.retrieve(req.neg_name);
    if (!actual) return negsync_detail::unexpected<Error>(actual.error());

    auto diff = calculate_difference(desired->zones, *actual);
    for (const auto& [zone, set] : diff.add) {
        obs::logger()->debug("NEG {} in {}: {} endpoints to attach", req.neg_name, zone, set.size());
    }
    for (const auto& [zone, set] : diff.remove) {
        obs::logger()->debug("NEG {} in {}: {} endpoints to detach", req.neg_name, zone, set.size());
    }

    if (auto st = apply(req.neg_name, diff.add, /*attach=*/true, report); !st) {
        return negsync_detail::unexpected<Error>(st.error());
    }
    if (auto st = apply(req.neg_name, diff.remove, /*attach=*/false, report); !st) {
        return negsync_detail::unexpected<Error>(st.error());
    }

    report.endpoint_pods = std::move(desired->pods);
    return report;
}

Status NegSyncer::apply(const std::string& neg_name, ZoneEndpointMap& changes, bool attach, SyncReport& report) {
    const EndpointBatcher batcher(cfg_.create_hybrid_neg, cfg_.max_endpoints_per_batch);
    for (auto& [zone, set] : changes) {
        while (!set.empty()) {
            auto batch = batcher.make_batch(set);
            if (!batch) return negsync_detail::unexpected<Error>(batch.error());

            std::vector<cloud::NetworkEndpoint> endpoints;
            endpoints.reserve(batch->size());
            for (const auto& [ep, cloud_ep] : *batch) {
                obs::logger()->trace("{} {} {} NEG {} in {}", attach ? "attaching" : "detaching",
                                     encode_endpoint(ep), attach ? "to" : "from", neg_name, zone);
                endpoints.push_back(cloud_ep);
            }

            auto st = attach ? cloud_.attach_network_endpoints(neg_name, zone, endpoints)
                             : cloud_.detach_network_endpoints(neg_name, zone, endpoints);
            ++report.api_calls;
            if (!st) return negsync_detail::unexpected<Error>(st.error());
            (attach ? report.attached : report.detached) += endpoints.size();
        }
    }
    return {};
}

} // namespace negsync::sync
