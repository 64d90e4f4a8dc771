#pragma once
/**
 * @file fixtures.hpp
 * @brief Shared builders for the synthesis test suites.
 *
 * Resources are built in namespace "ns1" unless stated otherwise; services are
 * registered on an InMemoryStore together with their endpoints. Every helper
 * that runs synthesis extracts annotation bundles first, as the store does.
 */

#include <algorithm>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ngsynth/annotations/extractor.hpp"
#include "ngsynth/annotations/view.hpp"
#include "ngsynth/config/constants.hpp"
#include "ngsynth/config/settings.hpp"
#include "ngsynth/model/configuration.hpp"
#include "ngsynth/model/resource.hpp"
#include "ngsynth/store/memory_store.hpp"
#include "ngsynth/synthesis/assembler.hpp"
#include "ngsynth/synthesis/collaborators.hpp"
#include "ngsynth/synthesis/diagnostics.hpp"
#include "ngsynth/synthesis/server_builder.hpp"
#include "ngsynth/synthesis/upstream_builder.hpp"

namespace ngsynth::testing {

using Clock = std::chrono::system_clock;

/// Fixed "now" so certificate expiry checks are reproducible.
inline const Clock::time_point NOW = Clock::time_point(std::chrono::hours(24 * 365 * 50));

inline constexpr std::string_view PREFIX = config::constants::DEFAULT_ANNOTATIONS_PREFIX;

/// Full annotation key for @p name under the default prefix.
inline std::string ann(std::string_view name) {
  return std::string(PREFIX) + "/" + std::string(name);
}

// --------------------------- Resources -------------------------------------

inline model::ServiceRef svc_ref(std::string name, std::int32_t port = 80) {
  return model::ServiceRef{.name = std::move(name), .port_number = port, .port_name = {}};
}

inline model::PathRule path_rule(std::string path, std::string service, std::int32_t port = 80,
                                 std::optional<model::PathKind> kind = model::PathKind::Prefix) {
  return model::PathRule{.path = std::move(path), .kind = kind, .service = svc_ref(std::move(service), port)};
}

inline model::Rule http_rule(std::string host, std::vector<model::PathRule> paths) {
  return model::Rule{.host = std::move(host), .http = model::HttpRule{.paths = std::move(paths)}};
}

inline model::RoutingResource resource(std::string ns, std::string name,
                                       std::vector<model::Rule> rules,
                                       model::AnnotationMap annotations = {}) {
  model::RoutingResource r;
  r.namespace_name = std::move(ns);
  r.name = std::move(name);
  r.rules = std::move(rules);
  r.annotations = std::move(annotations);
  return r;
}

/// One host, one Prefix path, one service on port 80.
inline model::RoutingResource simple(std::string name, std::string host, std::string path,
                                     std::string service, model::AnnotationMap annotations = {}) {
  return resource("ns1", std::move(name),
                  {http_rule(std::move(host), {path_rule(std::move(path), std::move(service))})},
                  std::move(annotations));
}

// --------------------------- Cluster state ---------------------------------

inline model::Service service(std::string ns, std::string name, std::int32_t port = 80,
                              std::string cluster_ip = "10.96.0.10") {
  model::Service svc;
  svc.namespace_name = std::move(ns);
  svc.name = std::move(name);
  svc.cluster_ip = std::move(cluster_ip);
  svc.ports.push_back(model::ServicePort{.name = "http", .port = port,
                                         .target_port = "8080", .protocol = model::Protocol::TCP});
  return svc;
}

/// Register ns/name with one port and one endpoint per address.
inline void add_backend(store::InMemoryStore& store, const std::string& ns, const std::string& name,
                        std::vector<std::string> addresses = {"10.0.0.1"}, std::int32_t port = 80) {
  store.add_service(service(ns, name, port));
  model::EndpointList endpoints;
  for (auto& a : addresses) endpoints.push_back(model::Endpoint{std::move(a), 8080});
  store.set_endpoints(ns + "/" + name, std::to_string(port), std::move(endpoints));
}

inline model::SSLCert certificate(std::string key, std::vector<std::string> dns_names,
                                  Clock::time_point expires = NOW + std::chrono::hours(24 * 365)) {
  model::SSLCert cert;
  cert.name = std::move(key);
  cert.pem = "-----BEGIN CERTIFICATE-----";
  cert.pem_sha = "sha-" + cert.name;
  cert.expire_time = expires;
  cert.dns_names = std::move(dns_names);
  return cert;
}

// --------------------------- Running passes ---------------------------------

/// @p res with its bundle extracted against @p store.
inline model::RoutingResource extracted(const synthesis::ResourceStore& store, model::RoutingResource res) {
  const annotations::DefaultAnnotationExtractor extractor(std::string(PREFIX), store);
  res.parsed = extractor.extract(annotations::RoutingResourceView(res));
  return res;
}

inline model::ResourceList extracted(const synthesis::ResourceStore& store, model::ResourceList resources) {
  const annotations::DefaultAnnotationExtractor extractor(std::string(PREFIX), store);
  annotations::extract_all(extractor, resources);
  return resources;
}

/// Full assembler pass over @p resources.
inline synthesis::SynthesisResult assemble(const store::InMemoryStore& store,
                                           model::ResourceList resources,
                                           config::ControllerConfig controller = {}) {
  const synthesis::ConfigurationAssembler assembler(store, store, &store, std::move(controller), NOW);
  return assembler.assemble(extracted(store, std::move(resources)));
}

/// Output of the upstream and server builders, before canary merging.
struct BuildPass {
  synthesis::DiagnosticLog diag;
  model::Backend           default_backend;
  model::BackendMap        upstreams;
  model::ServerMap         servers;
};

inline BuildPass build_servers(const store::InMemoryStore& store, const model::ResourceList& input) {
  const auto resources = extracted(store, input);
  BuildPass pass;
  const synthesis::UpstreamBuilder upstreams(store, store, pass.diag);
  pass.default_backend = upstreams.default_upstream("");
  pass.upstreams = upstreams.build(resources, pass.default_backend);
  const synthesis::ServerBuilder servers(store, pass.diag, NOW);
  pass.servers = servers.build(resources, pass.upstreams, pass.default_backend);
  return pass;
}

// --------------------------- Lookups ----------------------------------------

inline const model::Server* find_server(const model::Configuration& cfg, std::string_view host) {
  const auto it = std::find_if(cfg.servers.begin(), cfg.servers.end(),
                               [&](const model::Server& s) { return s.hostname == host; });
  return it == cfg.servers.end() ? nullptr : &*it;
}

inline const model::Location* find_location(const model::Server& server, std::string_view path,
                                             model::PathKind kind = model::PathKind::Prefix) {
  const auto it = std::find_if(server.locations.begin(), server.locations.end(),
                               [&](const model::Location& l) { return l.path == path && l.kind == kind; });
  return it == server.locations.end() ? nullptr : &*it;
}

inline const model::Backend* find_backend(const model::Configuration& cfg, std::string_view name) {
  const auto it = std::find_if(cfg.backends.begin(), cfg.backends.end(),
                               [&](const model::Backend& b) { return b.name == name; });
  return it == cfg.backends.end() ? nullptr : &*it;
}

inline std::size_t count_diagnostics(const std::vector<synthesis::Diagnostic>& diags,
                                     synthesis::Severity severity, std::string_view subject) {
  return static_cast<std::size_t>(std::count_if(diags.begin(), diags.end(),
      [&](const synthesis::Diagnostic& d) { return d.severity == severity && d.subject == subject; }));
}

// --------------------------- Fake collaborators -----------------------------

/// Renders a one-line summary; fails with @ref failure when set.
class FakeRenderer final : public synthesis::TemplateRenderer {
public:
  std::string failure;
  mutable model::Configuration last;
  mutable int calls{0};

  ngsynth_detail::expected<std::string, std::string>
  render(const config::BackendPolicy&, const model::Configuration& cfg) const override {
    ++calls;
    last = cfg;
    if (!failure.empty()) return ngsynth_detail::unexpected<std::string>(failure);
    return "servers=" + std::to_string(cfg.servers.size()) + " backends=" + std::to_string(cfg.backends.size());
  }
};

/// Accepts everything unless @ref failure is set.
class FakeChecker final : public synthesis::SyntaxChecker {
public:
  std::string failure;

  ngsynth_detail::expected<void, std::string> check(std::string_view) const override {
    if (!failure.empty()) return ngsynth_detail::unexpected<std::string>(failure);
    return {};
  }
};

} // namespace ngsynth::testing
