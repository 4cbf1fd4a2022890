/**
 * @file network_endpoint.cpp
 * @brief Dense vector + index map implementation of NetworkEndpointSet.
 */
#include "negsync/endpoint/network_endpoint.hpp"

#include <utility>

namespace negsync {

NetworkEndpointSet::NetworkEndpointSet(std::initializer_list<NetworkEndpoint> init) {
  items_.reserve(init.size());
  for (const auto& e : init) insert(e);
}

bool NetworkEndpointSet::insert(const NetworkEndpoint& e) {
  const auto [it, inserted] = index_.try_emplace(e, items_.size());
  if (!inserted) return false;
  items_.push_back(e);
  return true;
}

bool NetworkEndpointSet::erase(const NetworkEndpoint& e) {
  const auto it = index_.find(e);
  if (it == index_.end()) return false;

  const std::size_t slot = it->second;
  const std::size_t last = items_.size() - 1;
  index_.erase(it);
  if (slot != last) {
    // Move the tail into the hole and repoint its index entry.
    items_[slot] = std::move(items_[last]);
    index_[items_[slot]] = slot;
  }
  items_.pop_back();
  return true;
}

bool NetworkEndpointSet::contains(const NetworkEndpoint& e) const {
  return index_.find(e) != index_.end();
}

std::optional<NetworkEndpoint> NetworkEndpointSet::pop_any() {
  if (items_.empty()) return std::nullopt;
  NetworkEndpoint out = std::move(items_.back());
  items_.pop_back();
  index_.erase(out);
  return out;
}

NetworkEndpointSet NetworkEndpointSet::difference(const NetworkEndpointSet& other) const {
  NetworkEndpointSet out;
  for (const auto& e : items_) {
    if (!other.contains(e)) out.insert(e);
  }
  return out;
}

bool NetworkEndpointSet::operator==(const NetworkEndpointSet& other) const {
  if (size() != other.size()) return false;
  for (const auto& e : items_) {
    if (!other.contains(e)) return false;
  }
  return true;
}

} // namespace negsync
