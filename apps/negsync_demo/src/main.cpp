// apps/negsync_demo/src/main.cpp
// negsync_demo
// Purpose: Drive reconciliation passes for one service against the in-memory
// cloud and print what each pass changed.
//
// Usage:
//   ./negsync_demo [pods_per_zone]   (0..240, default 2)
//
// Notes:
// - Settings come from NEGSYNC_* environment variables (see config_loader.hpp).
// - Pass 1 converges from nothing, pass 2 is a no-op, pass 3 follows a pod
//   going into termination.

#include <charconv>
#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include "negsync/cloud/memory_neg_cloud.hpp"
#include "negsync/cluster/memory_stores.hpp"
#include "negsync/config/config_loader.hpp"
#include "negsync/obs/log.hpp"
#include "negsync/obs/observability.hpp"
#include "negsync/sync/neg_syncer.hpp"
#include "negsync/sync/retry_policy.hpp"
#include "negsync/version.hpp"

using namespace negsync;

namespace {

constexpr const char* kNegName = "k8s1-demo-default-web-8080";
const std::string kZones[] = {"us-central1-a", "us-central1-b", "us-central1-c"};

void print_state(const cloud::MemoryNegCloud& cloud) {
    for (const auto& zone : kZones) {
        std::cout << "  " << zone << ":";
        for (const auto& ep : cloud.endpoints(kNegName, zone)) {
            std::cout << ' ' << ep.ip_address << ':' << ep.port;
            if (!ep.instance.empty()) std::cout << '@' << ep.instance;
        }
        std::cout << '\n';
    }
}

bool run_pass(int n, sync::NegSyncer& syncer, sync::RetryTracker& retries, const sync::SyncRequest& req,
              const cloud::MemoryNegCloud& cloud) {
    const std::string key = req.service_namespace + "/" + req.service_name + "/" + req.neg_name;
    auto report = syncer.sync(req);
    if (!report) {
        const auto d = retries.on_failure(key, report.error());
        std::cout << "pass " << n << " failed: " << report.error().message;
        if (d.retry) std::cout << " (retry in " << d.delay.count() << " ms)";
        std::cout << '\n';
        return false;
    }
    retries.forget(key);
    std::cout << "pass " << n << ": created=" << report->created << " deleted=" << report->deleted
              << " attached=" << report->attached << " detached=" << report->detached
              << " api_calls=" << report->api_calls << '\n';
    print_state(cloud);
    return true;
}

} // namespace

int main(int argc, char** argv) {
    int pods_per_zone = 2;
    if (argc > 1) {
        const std::string_view arg(argv[1]);
        const auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), pods_per_zone);
        if (ec != std::errc{} || ptr != arg.data() + arg.size() || pods_per_zone < 0 || pods_per_zone > 240) {
            std::cerr << "usage: negsync_demo [pods_per_zone 0..240]\n";
            return 2;
        }
    }

    auto cfg = config::Loader::from_environment();
    if (!cfg) {
        std::cerr << "negsync_demo: " << cfg.error().message << '\n';
        return 2;
    }
    if (!obs::set_log_level(cfg->log_level)) {
        std::cerr << "negsync_demo: unknown log level " << cfg->log_level << '\n';
        return 2;
    }
    obs::logger()->info("negsync_demo {} starting (hybrid={}, batch={})", version_string,
                        cfg->create_hybrid_neg, cfg->max_endpoints_per_batch);

    cloud::MemoryNegCloud cloud("projects/demo/global/networks/default",
                                "projects/demo/regions/us-central1/subnetworks/default");
    cluster::StaticZoneGetter zones;
    cluster::MemoryPodStore pods;
    cluster::MemoryServiceStore services;
    obs::MemoryEventRecorder recorder;
    services.upsert(cluster::Service{.namespace_ = "default", .name = "web"});

    cluster::EndpointSubset subset;
    subset.ports = {cluster::EndpointPort{.name = "http", .port = 8080}};
    int ordinal = 0;
    for (int z = 0; z < 3; ++z) {
        const std::string node = "node-" + std::to_string(z);
        zones.set_node_zone(node, kZones[z]);
        for (int i = 0; i < pods_per_zone; ++i, ++ordinal) {
            const std::string pod = "web-" + std::to_string(ordinal);
            pods.upsert(cluster::Pod{.namespace_ = "default", .name = pod, .labels = {{"app", "web"}},
                                     .deletion_timestamp = std::nullopt});
            subset.addresses.push_back(cluster::EndpointAddress{
                .ip = "10.8." + std::to_string(z) + "." + std::to_string(i + 10),
                .node_name = node,
                .target_ref = cluster::ObjectReference{.kind = "Pod", .namespace_ = "default", .name = pod},
            });
        }
    }
    cluster::Endpoints endpoints{.namespace_ = "default", .name = "web", .subsets = {subset}};

    auto* observer = obs::make_simple_observer();
    sync::NegSyncer syncer(cloud, zones, &pods, &services, &recorder, *cfg, observer);
    sync::RetryTracker retries(cfg->retry, observer);

    const sync::SyncRequest req{
        .service_namespace = "default",
        .service_name = "web",
        .neg_name = kNegName,
        .port_name = "default/web:http",
        .target_port = "http",
        .subset_labels = {},
        .endpoints = &endpoints,
    };

    bool ok = run_pass(1, syncer, retries, req, cloud);
    ok = run_pass(2, syncer, retries, req, cloud) && ok;

    // First pod turns not ready and starts terminating.
    auto& s = endpoints.subsets.front();
    if (!s.addresses.empty()) {
        const auto leaving = s.addresses.front();
        s.addresses.erase(s.addresses.begin());
        s.not_ready_addresses.push_back(leaving);
        pods.upsert(cluster::Pod{.namespace_ = "default", .name = leaving.target_ref->name, .labels = {{"app", "web"}},
                                 .deletion_timestamp = std::chrono::system_clock::now()});
    }
    ok = run_pass(3, syncer, retries, req, cloud) && ok;

    std::cout << "events:\n";
    for (const auto& e : recorder.events()) {
        std::cout << "  " << e.namespace_ << '/' << e.name << ' ' << e.reason << ": " << e.message << '\n';
    }
    const auto c = observer->snapshot();
    std::cout << "totals: passes=" << c.passes << " failed=" << c.failed_passes
              << " attached=" << c.endpoints_attached << " detached=" << c.endpoints_detached
              << " groups_created=" << c.groups_created << std::endl;
    return ok ? 0 : 1;
}
