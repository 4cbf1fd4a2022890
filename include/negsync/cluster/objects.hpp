/**
 * @file objects.hpp
 * @brief Subset of cluster objects consumed by the reconciliation core.
 *
 * Only the fields the core reads are modelled: pod labels and deletion
 * timestamp, service identity, and the endpoint-discovery object with its
 * ready / not-ready address lists grouped by port list.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace negsync::cluster {

using Labels = std::unordered_map<std::string, std::string>;

/// Pod as seen by the pod store.
struct Pod final {
  std::string namespace_;
  std::string name;
  Labels labels;

  /// Set once the pod enters graceful termination.
  std::optional<std::chrono::system_clock::time_point> deletion_timestamp;
};

/// Service as seen by the service store (event subject only).
struct Service final {
  std::string namespace_;
  std::string name;
};

/// Reference from an endpoint address to the object backing it.
struct ObjectReference final {
  std::string kind;       ///< e.g. "Pod"
  std::string namespace_;
  std::string name;
};

struct EndpointAddress final {
  std::string ip;
  std::optional<std::string> node_name;
  std::optional<ObjectReference> target_ref;
};

struct EndpointPort final {
  std::string name;     ///< May be empty for single-port services.
  std::int32_t port{0};
  std::string protocol{"TCP"};
};

/// Addresses sharing one port list.
struct EndpointSubset final {
  std::vector<EndpointPort> ports;
  std::vector<EndpointAddress> addresses;           ///< ready
  std::vector<EndpointAddress> not_ready_addresses; ///< not ready
};

/// Endpoint-discovery object of one service.
struct Endpoints final {
  std::string namespace_;
  std::string name;
  std::vector<EndpointSubset> subsets;
};

} // namespace negsync::cluster
