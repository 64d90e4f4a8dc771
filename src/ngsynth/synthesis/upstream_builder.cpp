/**
 * @file upstream_builder.cpp
 * @brief Backend creation, endpoint population and canary stamping.
 */
#include "ngsynth/synthesis/upstream_builder.hpp"
#include "ngsynth/config/constants.hpp"
#include "ngsynth/obs/observability.hpp"

namespace ngsynth::synthesis {

using namespace ngsynth::config::constants;

model::Backend UpstreamBuilder::default_upstream(const std::string& service_key) const {
    model::Backend ups;
    ups.name = std::string(DEFAULT_UPSTREAM_NAME);
    ups.load_balancing = store_.backend_policy().load_balancing;

    if (!service_key.empty()) {
        if (auto svc = store_.get_service(service_key)) {
            ups.service = *svc;
            if (!svc->ports.empty()) {
                const auto& sp = svc->ports.front();
                ups.port = sp.name.empty() ? std::to_string(sp.port) : sp.name;
                if (auto endps = resolver_.resolve_endpoints(service_key, ups.port)) {
                    ups.endpoints = std::move(*endps);
                } else {
                    diag_.warn(ups.name, "error obtaining endpoints for default backend service " +
                                         service_key + ": " + endps.error().message);
                }
            }
        } else {
            diag_.warn(ups.name, "unexpected error obtaining default backend service " +
                                 service_key + ": " + svc.error().message);
        }
    }

    if (ups.endpoints.empty()) {
        diag_.info(ups.name, "service has no active endpoints, using the local default backend");
        ups.endpoints.push_back(model::Endpoint{std::string(DEFAULT_BACKEND_FALLBACK_ADDRESS),
                                                DEFAULT_BACKEND_FALLBACK_PORT});
    }
    return ups;
}

model::Backend UpstreamBuilder::make_upstream(const model::RoutingResource& res,
                                              const model::ServiceRef& ref,
                                              const std::string& name) const {
    const auto& anns = res.parsed;
    obs::log().trace("creating upstream {}", name);

    model::Backend ups;
    ups.name = name;
    ups.port = ref.port_string();
    ups.upstream_hash_by = anns.upstream_hash_by;
    ups.load_balancing = anns.load_balancing.empty() ? store_.backend_policy().load_balancing
                                                     : anns.load_balancing;

    const std::string svc_key = res.namespace_name + "/" + ref.name;

    if (anns.service_upstream) {
        // the service cluster address as a single endpoint instead of the pods
        if (auto endp = resolver_.resolve_cluster_endpoint(svc_key, ref)) {
            ups.endpoints.push_back(std::move(*endp));
        } else {
            diag_.error(name, "failed to determine a suitable ClusterIP endpoint for service " +
                              svc_key + ": " + endp.error().message);
        }
    } else {
        if (auto endps = resolver_.resolve_endpoints(svc_key, ups.port)) {
            ups.endpoints = std::move(*endps);
        } else {
            diag_.warn(name, "error obtaining endpoints for service " + svc_key + ": " +
                             endps.error().message);
        }
    }

    if (anns.canary.enabled) {
        ups.no_server = true;
        ups.traffic_shaping = model::TrafficShapingPolicy{
            .weight         = anns.canary.weight,
            .weight_total   = anns.canary.weight_total,
            .header         = anns.canary.header,
            .header_value   = anns.canary.header_value,
            .header_pattern = anns.canary.header_pattern,
            .cookie         = anns.canary.cookie,
        };
    }

    if (auto svc = store_.get_service(svc_key)) {
        ups.service = std::move(*svc);
    } else {
        diag_.warn(name, "error obtaining service " + svc_key + ": " + svc.error().message);
    }
    return ups;
}

model::BackendMap UpstreamBuilder::build(std::span<const model::RoutingResource> resources,
                                         const model::Backend& default_backend) const {
    model::BackendMap upstreams;
    upstreams.emplace(std::string(DEFAULT_UPSTREAM_NAME), default_backend);

    for (const auto& res : resources) {
        if (res.default_backend) {
            const auto name = model::upstream_name(res.namespace_name, *res.default_backend);
            if (!upstreams.contains(name)) {
                upstreams.emplace(name, make_upstream(res, *res.default_backend, name));
            }
        }

        for (const auto& rule : res.rules) {
            if (!rule.http) continue;

            for (const auto& path : rule.http->paths) {
                if (!path.service) {
                    obs::log().trace("resource {} path {} has no service backend, using default backend",
                                     res.key(), path.path);
                    continue;
                }
                const auto name = model::upstream_name(res.namespace_name, *path.service);
                if (upstreams.contains(name)) continue;
                upstreams.emplace(name, make_upstream(res, *path.service, name));
            }
        }
    }
    return upstreams;
}

} // namespace ngsynth::synthesis
