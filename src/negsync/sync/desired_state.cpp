/**
 * @file desired_state.cpp
 * @brief Implementation of DesiredStateMapper.
 */
#include "negsync/sync/desired_state.hpp"

#include <charconv>

#include "negsync/cluster/label_selector.hpp"
#include "negsync/config/constants.hpp"
#include "negsync/obs/log.hpp"
#include "negsync/sync/pod_filter.hpp"

namespace negsync::sync {

namespace {

// Numeric target port, 0 for anything but a plain integer (i.e. a port name).
// An explicit leading '+' is accepted.
int32_t numeric_port(std::string_view s) noexcept {
    if (s.size() > 1 && s.front() == '+' && s[1] != '-') s.remove_prefix(1);
    int32_t v{};
    const auto* end = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(s.data(), end, v);
    return (ec == std::errc{} && ptr == end) ? v : 0;
}

enum class AddressList { Ready, NotReady };

} // namespace

std::optional<std::string> resolve_target_port(const std::vector<cluster::EndpointPort>& ports,
                                               std::string_view target_port) {
    const int32_t wanted = numeric_port(target_port);
    for (const auto& p : ports) {
        const bool hit = wanted != 0 ? p.port == wanted : p.name == target_port;
        if (hit) return std::to_string(p.port);
    }
    return std::nullopt;
}

Result<DesiredState> DesiredStateMapper::map(const cluster::Endpoints* endpoints, std::string_view target_port,
                                             std::string_view subset_labels) const {
    DesiredState out;
    if (endpoints == nullptr) {
        obs::logger()->error("Endpoint object is nil");
        return out;
    }

    const bool subset_filtering = !subset_labels.empty();
    std::optional<cluster::LabelSelector> selector;
    if (subset_filtering) {
        auto parsed = cluster::LabelSelector::parse(subset_labels);
        if (parsed) {
            selector = std::move(*parsed);
        } else {
            // Fail closed: nothing matches an unparsable subset.
            obs::logger()->error("Failed to parse the subset selectors: {}", parsed.error().message);
        }
    }

    const auto& ns = endpoints->namespace_;
    const auto& svc = endpoints->name;

    for (const auto& subset : endpoints->subsets) {
        const auto match_port = resolve_target_port(subset.ports, target_port);
        if (!match_port) continue; // subset does not expose the target port

        auto process = [&](const std::vector<cluster::EndpointAddress>& addresses, AddressList list) -> Status {
            for (const auto& address : addresses) {
                if (subset_filtering) {
                    if (!address.target_ref || address.target_ref->kind != config::constants::KIND_POD) {
                        obs::logger()->debug("Endpoint {} in Endpoints {}/{} does not have a Pod as the TargetRef object. Skipping",
                                             address.ip, ns, svc);
                        continue;
                    }
                    if (!selector || !should_pod_be_in_subset(pods_, address.target_ref->namespace_,
                                                              address.target_ref->name, *selector)) {
                        continue;
                    }
                }
                if (!address.node_name) {
                    obs::logger()->debug("Endpoint {} in Endpoints {}/{} does not have an associated node. Skipping",
                                         address.ip, ns, svc);
                    continue;
                }
                if (!address.target_ref) {
                    obs::logger()->debug("Endpoint {} in Endpoints {}/{} does not have an associated pod. Skipping",
                                         address.ip, ns, svc);
                    continue;
                }

                auto zone = zones_.zone_for_node(*address.node_name);
                if (!zone) {
                    return make_error(ErrorCode::ZoneLookup, "failed to retrieve associated zone of node \"" +
                                                             *address.node_name + "\": " + zone.error().message);
                }
                // The zone is represented even if this address ends up excluded.
                auto& zone_set = out.zones[*zone];

                const auto& ref = *address.target_ref;
                if (list == AddressList::Ready || should_pod_be_in_neg(pods_, ref.namespace_, ref.name)) {
                    NetworkEndpoint ep{address.ip, *match_port, *address.node_name};
                    zone_set.insert(ep);
                    out.pods.insert_or_assign(std::move(ep), NamespacedName{ref.namespace_, ref.name});
                }
            }
            return {};
        };

        if (auto st = process(subset.addresses, AddressList::Ready); !st) {
            return negsync_detail::unexpected<Error>(st.error());
        }
        if (auto st = process(subset.not_ready_addresses, AddressList::NotReady); !st) {
            return negsync_detail::unexpected<Error>(st.error());
        }
    }
    return out;
}

} // namespace negsync::sync
