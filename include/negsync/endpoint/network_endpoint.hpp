/**
 * @file network_endpoint.hpp
 * @brief Network endpoint model shared across the reconciliation components.
 *
 * Defines the `NetworkEndpoint` value type, the mutable `NetworkEndpointSet`
 * used for diffing and batching, and the endpoint -> pod attribution map.
 * Centralizing these types keeps hashing and equality consistent between
 * the desired-state mapper, actual-state retriever and batcher.
 */
#pragma once

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace negsync {

/**
 * @brief One routable endpoint of a backend group.
 *
 * Identity is the full (ip, port, node) tuple. Port is kept in its decimal
 * string form; conversion to the cloud's numeric port happens at batching.
 */
struct NetworkEndpoint final {
  /// IPv4/IPv6 literal.
  std::string ip;

  /// Decimal port, e.g. "8080".
  std::string port;

  /// Owning node (cloud instance) name. Empty for hybrid endpoints.
  std::string node;

  /// Structural equality (compares all fields).
  bool operator==(const NetworkEndpoint&) const = default;
};

/// Structural hash over (ip, port, node).
struct NetworkEndpointHash {
  std::size_t operator()(const NetworkEndpoint& e) const noexcept {
    std::size_t h = std::hash<std::string_view>{}(e.ip);
    h = combine(h, std::hash<std::string_view>{}(e.port));
    return combine(h, std::hash<std::string_view>{}(e.node));
  }

private:
  static std::size_t combine(std::size_t seed, std::size_t v) noexcept {
    constexpr std::size_t PHI = static_cast<std::size_t>(0x9e3779b97f4a7c15ULL); // golden ratio constant
    return seed ^ (v + PHI + (seed << 6) + (seed >> 2));
  }
};

/**
 * @brief Unordered set of endpoints with a destructive pop.
 *
 * Elements live in a dense vector; an index map gives O(1) membership.
 * Erase and pop swap the victim with the last slot, so iteration order is
 * unspecified and changes under mutation.
 */
class NetworkEndpointSet {
public:
  using value_type     = NetworkEndpoint;
  using const_iterator = std::vector<NetworkEndpoint>::const_iterator;

  NetworkEndpointSet() = default;
  NetworkEndpointSet(std::initializer_list<NetworkEndpoint> init);

  /// Insert; returns false if already present.
  bool insert(const NetworkEndpoint& e);

  /// Erase; returns false if absent.
  bool erase(const NetworkEndpoint& e);

  [[nodiscard]] bool contains(const NetworkEndpoint& e) const;

  /// Remove and return an arbitrary element; std::nullopt when empty.
  std::optional<NetworkEndpoint> pop_any();

  /// Elements of *this that are not in @p other.
  [[nodiscard]] NetworkEndpointSet difference(const NetworkEndpointSet& other) const;

  [[nodiscard]] std::size_t size() const noexcept { return items_.size(); }
  [[nodiscard]] bool empty() const noexcept { return items_.empty(); }

  const_iterator begin() const noexcept { return items_.begin(); }
  const_iterator end() const noexcept { return items_.end(); }

  /// Order-independent equality.
  bool operator==(const NetworkEndpointSet& other) const;

private:
  std::vector<NetworkEndpoint> items_;
  std::unordered_map<NetworkEndpoint, std::size_t, NetworkEndpointHash> index_;
};

/// Raw-string flavor: endpoints encoded with encode_endpoint().
using EncodedEndpointSet = std::unordered_set<std::string>;

/// zone -> set. Zones are opaque, flat identifiers.
template <class Set>
using ZoneMap = std::unordered_map<std::string, Set>;

using ZoneEndpointMap        = ZoneMap<NetworkEndpointSet>;
using ZoneEncodedEndpointMap = ZoneMap<EncodedEndpointSet>;

/// Cluster object identity ("namespace/name").
struct NamespacedName final {
  std::string namespace_;
  std::string name;

  bool operator==(const NamespacedName&) const = default;

  /// Store key form, e.g. "default/web-0".
  [[nodiscard]] std::string key() const { return namespace_ + "/" + name; }
};

/// endpoint -> backing pod. Duplicate endpoints overwrite (last write wins).
using EndpointPodMap = std::unordered_map<NetworkEndpoint, NamespacedName, NetworkEndpointHash>;

} // namespace negsync
