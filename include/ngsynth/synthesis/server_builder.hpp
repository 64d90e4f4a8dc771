#pragma once
/**
 * @file server_builder.hpp
 * @brief Virtual hosts, their locations and their TLS identity.
 */

#include <chrono>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "ngsynth/config/settings.hpp"
#include "ngsynth/model/backend.hpp"
#include "ngsynth/model/resource.hpp"
#include "ngsynth/model/server.hpp"
#include "ngsynth/model/ssl_cert.hpp"
#include "ngsynth/synthesis/collaborators.hpp"
#include "ngsynth/synthesis/diagnostics.hpp"

namespace ngsynth::synthesis {

/**
 * @class ServerBuilder
 * @brief Builds the hostname → Server map and wires locations to upstreams.
 *
 * Canary resources are ignored here; their backends only reach a location
 * through the CanaryMerger. Server-level fields shared by several resources
 * follow the table in merge_policy.hpp. TLS failures never abort: the default
 * certificate is substituted and a diagnostic recorded.
 */
class ServerBuilder {
public:
    using Clock = std::chrono::system_clock;

    ServerBuilder(const ResourceStore& store, DiagnosticLog& diag, Clock::time_point now) noexcept
        : store_(store), diag_(diag), now_(now) {}

    /**
     * @brief Build servers and bind every non-canary path to its backend.
     * @param resources Resource set of this pass.
     * @param upstreams Backend map from the UpstreamBuilder; cookie affinity
     *        settings are written back onto it.
     * @param default_backend The reserved default backend.
     */
    [[nodiscard]] model::ServerMap build(std::span<const model::RoutingResource> resources,
                                         model::BackendMap& upstreams,
                                         const model::Backend& default_backend) const;

    /**
     * @brief Name of the secret holding a certificate for @p host, or empty.
     * @details Exact (case-insensitive) match against the TLS host lists first,
     *          then every referenced secret whose certificate validates @p host.
     */
    [[nodiscard]] std::string tls_secret_name(const std::string& host,
                                              const model::RoutingResource& res) const;

    /**
     * @brief Certificate for @p host from the TLS section of @p res.
     * @pre @p res has a non-empty TLS section.
     * @return The certificate, or the default certificate with a diagnostic.
     */
    [[nodiscard]] Resolution<std::optional<model::SSLCert>>
    resolve_certificate(const std::string& host, const model::RoutingResource& res) const;

private:
    /// Catch-all server, per-resource fallback upstreams and one server per new hostname.
    void create_servers(std::span<const model::RoutingResource> resources,
                        const model::BackendMap& upstreams,
                        const model::Backend& default_backend,
                        model::ServerMap& servers) const;

    /// Aliases, snippets, ciphers and certificates; returns the alias candidates per host.
    std::map<std::string, std::vector<std::string>>
    configure_servers(std::span<const model::RoutingResource> resources,
                      model::ServerMap& servers) const;

    /// Drop aliases equal to the host, to another primary hostname, or repeated.
    static void dedupe_aliases(const std::map<std::string, std::vector<std::string>>& all_aliases,
                               model::ServerMap& servers);

    /// Attach every non-canary path to its server.
    void bind_locations(std::span<const model::RoutingResource> resources,
                        model::BackendMap& upstreams,
                        model::ServerMap& servers) const;

    /// Warn when @p cert is expired or about to.
    void check_expiry(const std::string& host, const model::SSLCert& cert) const;

    const ResourceStore& store_;
    DiagnosticLog&       diag_;
    Clock::time_point    now_;
};

} // namespace ngsynth::synthesis
