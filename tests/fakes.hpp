/**
 * @file fakes.hpp
 * @brief Collaborator fakes with error injection, shared by the unit tests.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "negsync/cloud/memory_neg_cloud.hpp"
#include "negsync/cluster/memory_stores.hpp"
#include "negsync/obs/observability.hpp"

namespace negsync::testing {

/// Pod store that fails lookups for selected keys.
class FlakyPodStore final : public cluster::PodStore {
public:
  cluster::MemoryPodStore inner;
  std::set<std::string> failing_keys;

  Result<std::optional<cluster::Pod>> get_by_key(std::string_view key) const override {
    if (failing_keys.count(std::string(key)) != 0) {
      return make_error(ErrorCode::Cloud, "injected pod store failure");
    }
    return inner.get_by_key(key);
  }
};

/// Zone getter whose zone listing can be made to fail.
class FakeZoneGetter final : public cluster::ZoneGetter {
public:
  cluster::StaticZoneGetter inner;
  bool fail_list{false};

  Result<std::string> zone_for_node(const std::string& node) const override {
    return inner.zone_for_node(node);
  }
  Result<std::vector<std::string>> list_zones() const override {
    if (fail_list) return make_error(ErrorCode::Cloud, "injected zone listing failure");
    return inner.list_zones();
  }
};

/// MemoryNegCloud with per-operation failure switches.
class FaultyNegCloud final : public cloud::NegCloud {
public:
  FaultyNegCloud(std::string network, std::string subnetwork)
    : inner(std::move(network), std::move(subnetwork)) {}

  cloud::MemoryNegCloud inner;
  bool fail_get{false};
  bool fail_create{false};
  bool fail_delete{false};
  bool fail_list{false};
  int  attach_failures_left{0};   ///< Next N attach calls fail

  Result<cloud::NetworkEndpointGroup> get_network_endpoint_group(const std::string& name,
                                                                 const std::string& zone) const override {
    if (fail_get) return make_error(ErrorCode::Cloud, "injected get failure");
    return inner.get_network_endpoint_group(name, zone);
  }
  Status create_network_endpoint_group(const cloud::NetworkEndpointGroup& neg, const std::string& zone) override {
    if (fail_create) return make_error(ErrorCode::Cloud, "injected create failure");
    return inner.create_network_endpoint_group(neg, zone);
  }
  Status delete_network_endpoint_group(const std::string& name, const std::string& zone) override {
    if (fail_delete) return make_error(ErrorCode::Cloud, "injected delete failure");
    return inner.delete_network_endpoint_group(name, zone);
  }
  Result<std::vector<cloud::NetworkEndpointWithHealth>>
  list_network_endpoints(const std::string& name, const std::string& zone, bool show_health) const override {
    if (fail_list) return make_error(ErrorCode::Cloud, "injected list failure");
    return inner.list_network_endpoints(name, zone, show_health);
  }
  Status attach_network_endpoints(const std::string& name, const std::string& zone,
                                  const std::vector<cloud::NetworkEndpoint>& endpoints) override {
    if (attach_failures_left > 0) {
      --attach_failures_left;
      return make_error(ErrorCode::Cloud, "injected attach failure");
    }
    return inner.attach_network_endpoints(name, zone, endpoints);
  }
  Status detach_network_endpoints(const std::string& name, const std::string& zone,
                                  const std::vector<cloud::NetworkEndpoint>& endpoints) override {
    return inner.detach_network_endpoints(name, zone, endpoints);
  }
  std::string network_url() const override { return inner.network_url(); }
  std::string subnetwork_url() const override { return inner.subnetwork_url(); }
};

/// Observer that only counts.
class CountingObserver final : public obs::Observer {
public:
  std::vector<obs::PassRecord> passes;
  std::vector<std::string> exhausted;

  void record(const obs::PassRecord& r) override { passes.push_back(r); }
  void record_exhausted(std::string_view key, std::string_view) override { exhausted.emplace_back(key); }
  obs::Counters snapshot() const override {
    obs::Counters c;
    c.passes = passes.size();
    c.retries_exhausted = exhausted.size();
    return c;
  }
};

// Cluster defaults shared by the cloud-facing tests.
inline constexpr const char* kNetwork =
    "https://www.googleapis.com/compute/v1/projects/proj/global/networks/default";
inline constexpr const char* kSubnetwork =
    "https://www.googleapis.com/compute/v1/projects/proj/regions/us-central1/subnetworks/default";

/// Pod with optional labels / termination flag.
inline cluster::Pod make_pod(std::string ns, std::string name, cluster::Labels labels = {},
                             bool terminating = false) {
  cluster::Pod p{.namespace_ = std::move(ns), .name = std::move(name), .labels = std::move(labels),
                 .deletion_timestamp = std::nullopt};
  if (terminating) p.deletion_timestamp = std::chrono::system_clock::now();
  return p;
}

/// Address backed by a pod on a node.
inline cluster::EndpointAddress pod_address(std::string ip, std::string node, std::string ns, std::string pod) {
  return cluster::EndpointAddress{
    .ip = std::move(ip),
    .node_name = std::move(node),
    .target_ref = cluster::ObjectReference{.kind = "Pod", .namespace_ = std::move(ns), .name = std::move(pod)},
  };
}

} // namespace negsync::testing
