#pragma once
/**
 * @file upstream_builder.hpp
 * @brief Derives the named backend pools referenced by a resource set.
 */

#include <span>

#include "ngsynth/config/settings.hpp"
#include "ngsynth/model/backend.hpp"
#include "ngsynth/model/resource.hpp"
#include "ngsynth/synthesis/collaborators.hpp"
#include "ngsynth/synthesis/diagnostics.hpp"

namespace ngsynth::synthesis {

/**
 * @class UpstreamBuilder
 * @brief One backend per distinct (namespace, service, port), plus the default backend.
 *
 * Endpoint population is first-writer-wins: when several resources reference
 * the same service port they share the backend created for the first one,
 * including its load-balancing and canary settings.
 */
class UpstreamBuilder {
public:
    UpstreamBuilder(const ResourceStore& store,
                    const EndpointResolver& resolver,
                    DiagnosticLog& diag) noexcept
        : store_(store), resolver_(resolver), diag_(diag) {}

    /**
     * @brief Build the backend map.
     * @param resources Resource set of this pass (bundles already extracted).
     * @param default_backend Backend stored under the reserved default key.
     */
    [[nodiscard]] model::BackendMap build(std::span<const model::RoutingResource> resources,
                                          const model::Backend& default_backend) const;

    /**
     * @brief Build the default backend from the configured default service.
     * @param service_key "namespace/name" of the default backend service; empty for none.
     * @return Backend named with the reserved key; falls back to the local
     *         default endpoint when nothing resolves.
     */
    [[nodiscard]] model::Backend default_upstream(const std::string& service_key) const;

private:
    /// Create and populate the backend for @p ref of @p res.
    [[nodiscard]] model::Backend make_upstream(const model::RoutingResource& res,
                                               const model::ServiceRef& ref,
                                               const std::string& name) const;

    const ResourceStore&    store_;
    const EndpointResolver& resolver_;
    DiagnosticLog&          diag_;
};

} // namespace ngsynth::synthesis
