/**
 * @file memory_stores.cpp
 * @brief StaticZoneGetter implementation.
 */
#include "negsync/cluster/memory_stores.hpp"

#include <set>

namespace negsync::cluster {

void StaticZoneGetter::set_node_zone(const std::string& node, const std::string& zone) {
    std::lock_guard<std::mutex> lk(mu_);
    node_zone_.insert_or_assign(node, zone);
}

void StaticZoneGetter::remove_node(const std::string& node) {
    std::lock_guard<std::mutex> lk(mu_);
    node_zone_.erase(node);
}

Result<std::string> StaticZoneGetter::zone_for_node(const std::string& node) const {
    std::lock_guard<std::mutex> lk(mu_);
    const auto it = node_zone_.find(node);
    if (it == node_zone_.end()) {
        return make_error(ErrorCode::NotFound, "node \"" + node + "\" not found");
    }
    return it->second;
}

Result<std::vector<std::string>> StaticZoneGetter::list_zones() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::set<std::string> zones;
    for (const auto& kv : node_zone_) zones.insert(kv.second);
    return std::vector<std::string>(zones.begin(), zones.end());
}

} // namespace negsync::cluster
