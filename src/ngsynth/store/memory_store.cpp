/**
 * @file memory_store.cpp
 * @brief InMemoryStore lookups.
 */
#include "ngsynth/store/memory_store.hpp"
#include "ngsynth/obs/observability.hpp"

#include <algorithm>

namespace ngsynth::store {

using synthesis::Lookup;
using synthesis::LookupErrc;
using synthesis::LookupError;

namespace {

ngsynth_detail::unexpected<LookupError> not_found(std::string_view what, std::string_view key) {
    return ngsynth_detail::unexpected<LookupError>(
        LookupError{LookupErrc::NotFound, std::string(what) + " " + std::string(key) + " not found"});
}

std::string endpoints_key(std::string_view service_key, std::string_view port) {
    return std::string(service_key) + ":" + std::string(port);
}

} // namespace

void InMemoryStore::upsert_resource(model::RoutingResource res) {
    const auto key = res.key();
    const auto it = std::find_if(resources_.begin(), resources_.end(),
                                 [&](const model::RoutingResource& r) { return r.key() == key; });
    if (it != resources_.end()) {
        *it = std::move(res);
    } else {
        resources_.push_back(std::move(res));
    }
}

bool InMemoryStore::remove_resource(std::string_view key) {
    return std::erase_if(resources_, [&](const model::RoutingResource& r) { return r.key() == key; }) > 0;
}

void InMemoryStore::add_service(model::Service svc) {
    auto key = svc.key();
    services_.insert_or_assign(std::move(key), std::move(svc));
}

void InMemoryStore::set_endpoints(const std::string& service_key, const std::string& port,
                                  model::EndpointList endpoints) {
    endpoints_.insert_or_assign(endpoints_key(service_key, port), std::move(endpoints));
}

void InMemoryStore::add_certificate(model::SSLCert cert) {
    auto key = cert.name;
    certs_.insert_or_assign(std::move(key), std::move(cert));
}

void InMemoryStore::add_secret(model::Secret secret) {
    auto key = secret.key();
    secrets_.insert_or_assign(std::move(key), std::move(secret));
}

void InMemoryStore::extract_annotations(const annotations::AnnotationExtractor& extractor) {
    annotations::extract_all(extractor, resources_);
}

model::ResourceList InMemoryStore::list_routing_resources() const {
    return resources_;
}

Lookup<model::Service> InMemoryStore::get_service(std::string_view key) const {
    const auto it = services_.find(key);
    if (it == services_.end()) return not_found("service", key);
    return it->second;
}

Lookup<model::SSLCert> InMemoryStore::get_certificate(std::string_view key) const {
    const auto it = certs_.find(key);
    if (it == certs_.end()) return not_found("certificate", key);
    return it->second;
}

Lookup<model::Secret> InMemoryStore::get_secret(std::string_view key) const {
    const auto it = secrets_.find(key);
    if (it == secrets_.end()) return not_found("secret", key);
    return it->second;
}

Lookup<model::EndpointList> InMemoryStore::resolve_endpoints(std::string_view service_key,
                                                             std::string_view port) const {
    const auto svc = services_.find(service_key);
    if (svc == services_.end()) return not_found("service", service_key);

    if (const auto it = endpoints_.find(endpoints_key(service_key, port)); it != endpoints_.end()) {
        return it->second;
    }

    // the port may be referenced by number while endpoints were registered by name, or the reverse
    for (const auto& sp : svc->second.ports) {
        const auto number = std::to_string(sp.port);
        if (port != number && port != sp.name) continue;
        for (const auto& alias : {number, sp.name}) {
            if (alias.empty() || alias == port) continue;
            if (const auto it = endpoints_.find(endpoints_key(service_key, alias)); it != endpoints_.end()) {
                return it->second;
            }
        }
    }
    obs::log().trace("service {} has no endpoints for port {}", service_key, port);
    return model::EndpointList{};
}

Lookup<model::Endpoint> InMemoryStore::resolve_cluster_endpoint(std::string_view service_key,
                                                                const model::ServiceRef& ref) const {
    const auto it = services_.find(service_key);
    if (it == services_.end()) return not_found("service", service_key);
    const auto& svc = it->second;

    if (svc.cluster_ip.empty() || svc.cluster_ip == "None") {
        return ngsynth_detail::unexpected<LookupError>(
            LookupError{LookupErrc::Invalid, "service " + svc.key() + " is headless"});
    }
    if (svc.ports.empty()) {
        return ngsynth_detail::unexpected<LookupError>(
            LookupError{LookupErrc::NoPorts, "service " + svc.key() + " exposes no port"});
    }

    for (const auto& sp : svc.ports) {
        const bool match = ref.port_name.empty() ? sp.port == ref.port_number : sp.name == ref.port_name;
        if (match) return model::Endpoint{svc.cluster_ip, sp.port};
    }
    return ngsynth_detail::unexpected<LookupError>(
        LookupError{LookupErrc::NoPorts, "service " + svc.key() + " has no port " + ref.port_string()});
}

std::vector<model::L4Service> InMemoryStore::stream_services(model::Protocol protocol) const {
    std::vector<model::L4Service> out;
    for (const auto& b : streams_) {
        if (b.protocol != protocol) continue;

        const auto svc = services_.find(b.service_key);
        if (svc == services_.end()) {
            obs::log().warn("stream port {}: service {} not found", b.port, b.service_key);
            continue;
        }

        model::L4Service l4;
        l4.port = b.port;
        l4.backend.port = b.service_port;
        l4.backend.name = svc->second.name;
        l4.backend.namespace_name = svc->second.namespace_name;
        l4.backend.protocol = protocol;
        l4.service = svc->second;
        if (auto endps = resolve_endpoints(b.service_key, b.service_port)) l4.endpoints = std::move(*endps);
        out.push_back(std::move(l4));
    }
    std::sort(out.begin(), out.end(),
              [](const model::L4Service& a, const model::L4Service& b) { return a.port < b.port; });
    return out;
}

} // namespace ngsynth::store
