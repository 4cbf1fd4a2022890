#pragma once
/**
 * @file neg_ensurer.hpp
 * @brief Idempotent "a correctly configured backend group exists in this zone".
 */

#include <cstdint>
#include <string>
#include <string_view>

#include "negsync/cloud/neg_cloud.hpp"
#include "negsync/cluster/stores.hpp"
#include "negsync/core/error.hpp"
#include "negsync/obs/observability.hpp"

namespace negsync::sync {

/** @enum EnsureOutcome
 *  @brief Terminal state of one ensure call.
 */
enum class EnsureOutcome : uint8_t {
    NoOp,      ///< Group existed with matching network/subnetwork
    Created,   ///< Group was missing and has been created
    Recreated  ///< Misconfigured group was deleted and created again
};

constexpr std::string_view to_string(EnsureOutcome o) noexcept {
    switch (o) {
        case EnsureOutcome::NoOp:      return "no-op";
        case EnsureOutcome::Created:   return "created";
        case EnsureOutcome::Recreated: return "recreated";
    }
    return "unknown";
}

/** @struct EnsureRequest
 *  @brief Which group to ensure, and for which service port.
 */
struct EnsureRequest {
    std::string service_namespace;
    std::string service_name;
    std::string neg_name;
    std::string zone;
    std::string port_name; ///< Human readable service port, used in event messages
};

/**
 * @class NegEnsurer
 * @brief Get -> (delete) -> create state machine for one zonal group.
 *
 * Network/subnetwork drift is never patched in place: the group is deleted
 * and created again. A crash between the two leaves no group behind; the next
 * call sees it missing and creates it.
 */
class NegEnsurer {
public:
    /**
     * @param cloud Backend group API.
     * @param services Optional; needed together with @p recorder to emit events.
     * @param recorder Optional event sink.
     * @param hybrid Create NON_GCP_PRIVATE_IP_PORT groups without a subnetwork.
     */
    NegEnsurer(cloud::NegCloud& cloud, const cluster::ServiceStore* services,
               obs::EventRecorder* recorder, bool hybrid) noexcept
        : cloud_(cloud), services_(services), recorder_(recorder), hybrid_(hybrid) {}

    /// @return Delete/create errors unchanged (fatal to the pass).
    Result<EnsureOutcome> ensure(const EnsureRequest& req) const;

private:
    /// Network/subnetwork a correctly configured group carries.
    bool matches_cluster(const cloud::NetworkEndpointGroup& neg) const;

    /// Emit an event against the owning service when both collaborators exist.
    void notify(const EnsureRequest& req, std::string_view reason, std::string_view verb) const;

    cloud::NegCloud& cloud_;
    const cluster::ServiceStore* services_;
    obs::EventRecorder* recorder_;
    bool hybrid_;
};

} // namespace negsync::sync
