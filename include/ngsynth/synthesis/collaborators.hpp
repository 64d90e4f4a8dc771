#pragma once
/**
 * @file collaborators.hpp
 * @brief Interfaces of the external services the synthesis core calls into.
 * @details Implementations are expected to answer from a local cache; the core
 *          never retries and treats every lookup failure as degradable.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ngsynth/compat/expected.hpp"
#include "ngsynth/config/settings.hpp"
#include "ngsynth/model/configuration.hpp"
#include "ngsynth/model/resource.hpp"
#include "ngsynth/model/secret.hpp"
#include "ngsynth/model/service.hpp"
#include "ngsynth/model/ssl_cert.hpp"

namespace ngsynth::synthesis {

/// Why a lookup failed.
enum class LookupErrc : std::uint8_t {
    NotFound,   ///< Object does not exist in the cache
    NoPorts,    ///< Service exposes no usable port
    Invalid     ///< Object exists but cannot be used (e.g. headless service for service-upstream)
};

struct LookupError {
    LookupErrc  code{LookupErrc::NotFound};
    std::string message;
};

template <class T>
using Lookup = ngsynth_detail::expected<T, LookupError>;

/** @class ResourceStore
 *  @brief Cached view of cluster objects.
 */
class ResourceStore {
public:
    virtual ~ResourceStore() = default;
    /// Every routing resource with its parsed annotation bundle.
    virtual model::ResourceList list_routing_resources() const = 0;
    /// Service by "namespace/name".
    virtual Lookup<model::Service> get_service(std::string_view key) const = 0;
    /// Certificate by secret key "namespace/name".
    virtual Lookup<model::SSLCert> get_certificate(std::string_view key) const = 0;
    /// Raw secret by "namespace/name" (auth files, client CA bundles).
    virtual Lookup<model::Secret> get_secret(std::string_view key) const = 0;
    /// Cluster-wide backend policy.
    virtual const config::BackendPolicy& backend_policy() const = 0;
    /// Default TLS certificate; nullopt when none is configured.
    virtual std::optional<model::SSLCert> default_certificate() const = 0;
};

/** @class EndpointResolver
 *  @brief Endpoint discovery for services.
 */
class EndpointResolver {
public:
    virtual ~EndpointResolver() = default;
    /// Per-pod endpoints of service @p service_key for port @p port ("80" or "http").
    virtual Lookup<model::EndpointList> resolve_endpoints(std::string_view service_key,
                                                          std::string_view port) const = 0;
    /// Single endpoint at the service's cluster address.
    virtual Lookup<model::Endpoint> resolve_cluster_endpoint(std::string_view service_key,
                                                             const model::ServiceRef& ref) const = 0;
};

/** @class StreamConfigSource
 *  @brief TCP/UDP services exposed by the data plane.
 */
class StreamConfigSource {
public:
    virtual ~StreamConfigSource() = default;
    virtual std::vector<model::L4Service> stream_services(model::Protocol protocol) const = 0;
};

/** @class TemplateRenderer
 *  @brief Turns a Configuration into the data plane's configuration artifact.
 */
class TemplateRenderer {
public:
    virtual ~TemplateRenderer() = default;
    virtual ngsynth_detail::expected<std::string, std::string>
    render(const config::BackendPolicy& policy, const model::Configuration& cfg) const = 0;
};

/** @class SyntaxChecker
 *  @brief Dry-run validation of a rendered artifact.
 */
class SyntaxChecker {
public:
    virtual ~SyntaxChecker() = default;
    virtual ngsynth_detail::expected<void, std::string> check(std::string_view rendered) const = 0;
};

} // namespace ngsynth::synthesis
