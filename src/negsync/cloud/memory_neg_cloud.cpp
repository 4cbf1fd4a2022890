/**
 * @file memory_neg_cloud.cpp
 * @brief Implementation of the backend-group API simulator.
 */
#include "negsync/cloud/memory_neg_cloud.hpp"

#include <algorithm>
#include <utility>

namespace negsync::cloud {

MemoryNegCloud::MemoryNegCloud(std::string network_url, std::string subnetwork_url)
    : network_url_(std::move(network_url)), subnetwork_url_(std::move(subnetwork_url)) {}

Error MemoryNegCloud::missing(const std::string& name, const std::string& zone) {
    return Error{ErrorCode::NotFound, "networkEndpointGroup \"" + name + "\" not found in zone \"" + zone + "\""};
}

void MemoryNegCloud::put_network_endpoint_group(const NetworkEndpointGroup& neg, const std::string& zone) {
    std::lock_guard<std::mutex> lk(mu_);
    auto& g = groups_[Key{zone, neg.name}];
    g.neg = neg;
    g.neg.zone = zone;
}

std::vector<NetworkEndpoint> MemoryNegCloud::endpoints(const std::string& name, const std::string& zone) const {
    std::lock_guard<std::mutex> lk(mu_);
    const auto it = groups_.find(Key{zone, name});
    return it == groups_.end() ? std::vector<NetworkEndpoint>{} : it->second.members;
}

std::vector<std::string> MemoryNegCloud::zones_with_group(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::string> out;
    for (const auto& [key, g] : groups_) {
        if (key.second == name) out.push_back(key.first);
    }
    return out;
}

CallCounters MemoryNegCloud::counters() const {
    std::lock_guard<std::mutex> lk(mu_);
    return counters_;
}

Result<NetworkEndpointGroup> MemoryNegCloud::get_network_endpoint_group(const std::string& name,
                                                                        const std::string& zone) const {
    std::lock_guard<std::mutex> lk(mu_);
    const auto it = groups_.find(Key{zone, name});
    if (it == groups_.end()) return negsync_detail::unexpected<Error>(missing(name, zone));
    return it->second.neg;
}

Status MemoryNegCloud::create_network_endpoint_group(const NetworkEndpointGroup& neg, const std::string& zone) {
    std::lock_guard<std::mutex> lk(mu_);
    const Key key{zone, neg.name};
    if (groups_.count(key) != 0) {
        return make_error(ErrorCode::Cloud, "networkEndpointGroup \"" + neg.name + "\" already exists in zone \"" + zone + "\"");
    }
    auto& g = groups_[key];
    g.neg = neg;
    g.neg.zone = zone;
    ++counters_.creates;
    return {};
}

Status MemoryNegCloud::delete_network_endpoint_group(const std::string& name, const std::string& zone) {
    std::lock_guard<std::mutex> lk(mu_);
    if (groups_.erase(Key{zone, name}) == 0) return negsync_detail::unexpected<Error>(missing(name, zone));
    ++counters_.deletes;
    return {};
}

Result<std::vector<NetworkEndpointWithHealth>>
MemoryNegCloud::list_network_endpoints(const std::string& name, const std::string& zone, bool show_health) const {
    std::lock_guard<std::mutex> lk(mu_);
    const auto it = groups_.find(Key{zone, name});
    if (it == groups_.end()) return negsync_detail::unexpected<Error>(missing(name, zone));

    std::vector<NetworkEndpointWithHealth> out;
    out.reserve(it->second.members.size());
    for (const auto& m : it->second.members) {
        NetworkEndpointWithHealth e{m, {}};
        if (show_health) e.health_states.emplace_back("UNKNOWN");
        out.push_back(std::move(e));
    }
    return out;
}

Status MemoryNegCloud::attach_network_endpoints(const std::string& name, const std::string& zone,
                                                const std::vector<NetworkEndpoint>& endpoints) {
    std::lock_guard<std::mutex> lk(mu_);
    const auto it = groups_.find(Key{zone, name});
    if (it == groups_.end()) return negsync_detail::unexpected<Error>(missing(name, zone));

    auto& members = it->second.members;
    for (const auto& e : endpoints) {
        if (std::find(members.begin(), members.end(), e) == members.end()) members.push_back(e);
    }
    ++counters_.attaches;
    return {};
}

Status MemoryNegCloud::detach_network_endpoints(const std::string& name, const std::string& zone,
                                                const std::vector<NetworkEndpoint>& endpoints) {
    std::lock_guard<std::mutex> lk(mu_);
    const auto it = groups_.find(Key{zone, name});
    if (it == groups_.end()) return negsync_detail::unexpected<Error>(missing(name, zone));

    auto& members = it->second.members;
    // Validate the whole batch first; the real API rejects it atomically.
    for (const auto& e : endpoints) {
        if (std::find(members.begin(), members.end(), e) == members.end()) {
            return make_error(ErrorCode::Cloud, "endpoint " + e.ip_address + ":" + std::to_string(e.port) +
                                                " is not a member of \"" + name + "\" in zone \"" + zone + "\"");
        }
    }
    for (const auto& e : endpoints) {
        members.erase(std::remove(members.begin(), members.end(), e), members.end());
    }
    ++counters_.detaches;
    return {};
}

} // namespace negsync::cloud
