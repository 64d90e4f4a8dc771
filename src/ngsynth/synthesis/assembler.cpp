/**
 * @file assembler.cpp
 * @brief Pass orchestration and final normalization.
 */
#include "ngsynth/synthesis/assembler.hpp"
#include "ngsynth/config/constants.hpp"
#include "ngsynth/obs/observability.hpp"
#include "ngsynth/synthesis/canary_merger.hpp"
#include "ngsynth/synthesis/server_builder.hpp"
#include "ngsynth/synthesis/upstream_builder.hpp"

#include <algorithm>

namespace ngsynth::synthesis {

using namespace ngsynth::config::constants;

void ConfigurationAssembler::strip_snippets(model::ResourceList& resources) noexcept {
    for (auto& res : resources) {
        res.parsed.server_snippet.clear();
        res.parsed.configuration_snippet.clear();
        res.parsed.stream_snippet.clear();
    }
}

void ConfigurationAssembler::sort_locations(std::vector<model::Location>& locations) {
    std::stable_sort(locations.begin(), locations.end(),
                     [](const model::Location& a, const model::Location& b) { return a.path > b.path; });
    std::stable_sort(locations.begin(), locations.end(),
                     [](const model::Location& a, const model::Location& b) { return a.path.size() > b.path.size(); });
}

void ConfigurationAssembler::add_custom_default_backends(model::BackendMap& upstreams,
                                                         model::ServerMap& servers,
                                                         DiagnosticLog& diag) const {
    model::BackendMap custom;

    for (const auto& [name, ups] : upstreams) {
        if (name == DEFAULT_UPSTREAM_NAME) continue;

        for (auto& [hostname, server] : servers) {
            for (auto& loc : server.locations) {
                if (loc.backend != ups.name || !loc.default_backend) continue;

                const auto& svc = *loc.default_backend;
                if (svc.ports.empty()) {
                    diag.warn(svc.key(), "custom default backend service exposes no port");
                    continue;
                }
                const auto& sp = svc.ports.front();
                const auto port = sp.name.empty() ? std::to_string(sp.port) : sp.name;

                auto endps = resolver_.resolve_endpoints(svc.key(), port);
                if (!endps) {
                    diag.warn(svc.key(), "error obtaining endpoints for custom default backend: " +
                                         endps.error().message);
                    continue;
                }
                if (endps->empty()) continue;

                const auto custom_name = std::string(CUSTOM_DEFAULT_BACKEND_PREFIX) +
                                         svc.namespace_name + "-" + svc.name;
                obs::log().debug("creating upstream {} for custom default backend of location {}{}",
                                 custom_name, hostname, loc.path);

                if (!custom.contains(custom_name)) {
                    auto nb = ups;
                    nb.name = custom_name;
                    nb.service = svc;
                    nb.endpoints = std::move(*endps);
                    custom.emplace(custom_name, std::move(nb));
                }

                loc.default_backend_upstream_name = custom_name;
                // the owning backend cannot serve anything
                if (ups.endpoints.empty()) loc.backend = custom_name;
            }
        }
    }

    for (auto& [name, backend] : custom) {
        upstreams.try_emplace(name, std::move(backend));
    }
}

SynthesisResult ConfigurationAssembler::assemble(model::ResourceList resources) const {
    const auto& policy = store_.backend_policy();
    if (!policy.allow_snippet_annotations) strip_snippets(resources);

    DiagnosticLog diag;

    UpstreamBuilder upstream_builder(store_, resolver_, diag);
    const auto default_backend = upstream_builder.default_upstream(controller_.default_backend_service);
    auto upstreams = upstream_builder.build(resources, default_backend);

    ServerBuilder server_builder(store_, diag, now_);
    auto servers = server_builder.build(resources, upstreams, default_backend);

    CanaryMerger merger(diag);
    if (CanaryMerger::non_canary_exists(resources)) {
        merger.merge(resources, upstreams, servers);
    } else {
        merger.drop_orphans(resources, upstreams);
    }

    add_custom_default_backends(upstreams, servers, diag);

    SynthesisResult result;
    auto& cfg = result.configuration;

    // the root location of a passthrough server owns the TLS stream
    for (const auto& [hostname, server] : servers) {
        if (!server.ssl_passthrough) continue;

        for (const auto& loc : server.locations) {
            if (loc.path != ROOT_LOCATION) continue;

            // the default backend never carries the passthrough flag, the stream entry is still emitted
            if (loc.backend == DEFAULT_UPSTREAM_NAME) {
                diag.warn(hostname, "server has no default backend, not flagging it for SSL passthrough");
            } else if (auto it = upstreams.find(loc.backend); it != upstreams.end()) {
                it->second.ssl_passthrough = true;
            }
            cfg.passthrough_backends.push_back(model::SSLPassthroughBackend{
                .backend = loc.backend, .hostname = hostname, .service = loc.service, .port = loc.port});
            break;
        }
    }

    cfg.backends.reserve(upstreams.size());
    for (auto& [name, backend] : upstreams) cfg.backends.push_back(std::move(backend));

    cfg.servers.reserve(servers.size());
    for (auto& [hostname, server] : servers) {
        sort_locations(server.locations);
        result.hosts.insert(hostname);
        result.hosts.insert(server.aliases.begin(), server.aliases.end());
        cfg.servers.push_back(std::move(server));
    }

    if (streams_ != nullptr) {
        cfg.tcp_endpoints = streams_->stream_services(model::Protocol::TCP);
        cfg.udp_endpoints = streams_->stream_services(model::Protocol::UDP);
    }

    cfg.backend_config_checksum = policy.checksum;
    cfg.default_ssl_certificate = store_.default_certificate();

    for (const auto& res : resources) {
        if (!res.parsed.stream_snippet.empty()) cfg.stream_snippets.push_back(res.parsed.stream_snippet);
    }

    result.diagnostics = diag.take();
    obs::log().debug("synthesized {} backends, {} servers from {} resources",
                     cfg.backends.size(), cfg.servers.size(), resources.size());
    return result;
}

} // namespace ngsynth::synthesis
