#pragma once
/**
 * @file memory_store.hpp
 * @brief In-memory implementation of the store, endpoint and stream collaborators.
 * @details Backs the dump tool and the test fixtures. Not synchronized: one
 *          synthesis pass at a time, as the pipeline itself.
 */

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ngsynth/annotations/extractor.hpp"
#include "ngsynth/config/settings.hpp"
#include "ngsynth/model/configuration.hpp"
#include "ngsynth/model/resource.hpp"
#include "ngsynth/model/secret.hpp"
#include "ngsynth/model/service.hpp"
#include "ngsynth/model/ssl_cert.hpp"
#include "ngsynth/synthesis/collaborators.hpp"

namespace ngsynth::store {

/** @struct StreamBinding
 *  @brief Data-plane port forwarded to "namespace/service:port".
 */
struct StreamBinding {
    model::Protocol protocol{model::Protocol::TCP};
    std::int32_t    port{0};
    std::string     service_key;
    std::string     service_port;
};

/**
 * @class InMemoryStore
 * @brief Map-backed cluster snapshot.
 */
class InMemoryStore final : public synthesis::ResourceStore,
                            public synthesis::EndpointResolver,
                            public synthesis::StreamConfigSource {
public:
    InMemoryStore() = default;
    explicit InMemoryStore(config::BackendPolicy policy) : policy_(std::move(policy)) {}

    // ---- mutation ------------------------------------------------------------
    /// Insert or replace by "namespace/name".
    void upsert_resource(model::RoutingResource res);
    /// @return false when no resource had that key.
    bool remove_resource(std::string_view key);
    void add_service(model::Service svc);
    /// Endpoints of "namespace/name" for port @p port ("80" or "http").
    void set_endpoints(const std::string& service_key, const std::string& port, model::EndpointList endpoints);
    void add_certificate(model::SSLCert cert);
    void add_secret(model::Secret secret);
    void set_default_certificate(std::optional<model::SSLCert> cert) { default_cert_ = std::move(cert); }
    void set_backend_policy(config::BackendPolicy policy) { policy_ = std::move(policy); }
    void add_stream(StreamBinding binding) { streams_.push_back(std::move(binding)); }

    /// Re-extract the annotation bundle of every stored resource.
    void extract_annotations(const annotations::AnnotationExtractor& extractor);

    [[nodiscard]] std::size_t resource_count() const noexcept { return resources_.size(); }

    // ---- ResourceStore -------------------------------------------------------
    model::ResourceList list_routing_resources() const override;
    synthesis::Lookup<model::Service> get_service(std::string_view key) const override;
    synthesis::Lookup<model::SSLCert> get_certificate(std::string_view key) const override;
    synthesis::Lookup<model::Secret> get_secret(std::string_view key) const override;
    const config::BackendPolicy& backend_policy() const override { return policy_; }
    std::optional<model::SSLCert> default_certificate() const override { return default_cert_; }

    // ---- EndpointResolver ----------------------------------------------------
    synthesis::Lookup<model::EndpointList> resolve_endpoints(std::string_view service_key,
                                                             std::string_view port) const override;
    synthesis::Lookup<model::Endpoint> resolve_cluster_endpoint(std::string_view service_key,
                                                                const model::ServiceRef& ref) const override;

    // ---- StreamConfigSource --------------------------------------------------
    std::vector<model::L4Service> stream_services(model::Protocol protocol) const override;

private:
    config::BackendPolicy                                          policy_;
    std::vector<model::RoutingResource>                            resources_;  ///< Insertion order
    std::map<std::string, model::Service, std::less<>>             services_;
    std::map<std::string, model::EndpointList, std::less<>>        endpoints_;  ///< "ns/name:port"
    std::map<std::string, model::SSLCert, std::less<>>             certs_;
    std::map<std::string, model::Secret, std::less<>>              secrets_;
    std::optional<model::SSLCert>                                  default_cert_;
    std::vector<StreamBinding>                                     streams_;
};

} // namespace ngsynth::store
