/**
 * @file server.hpp
 * @brief Virtual host ("server") and its path-matching rules ("locations").
 */
#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "ngsynth/annotations/bundle.hpp"
#include "ngsynth/model/resource.hpp"
#include "ngsynth/model/service.hpp"
#include "ngsynth/model/ssl_cert.hpp"

namespace ngsynth::model {

/**
 * @brief Identity of the resource that produced a location.
 *
 * Held by value so nothing in a Configuration points back into the
 * resource set of the pass that built it.
 */
struct ResourceOwner final {
  std::string             namespace_name;
  std::string             name;
  annotations::CanaryMark canary{annotations::CanaryMark::Missing};

  [[nodiscard]] std::string key() const { return namespace_name + "/" + name; }

  bool operator==(const ResourceOwner&) const = default;
};

[[nodiscard]] ResourceOwner owner_of(const RoutingResource& r);

struct Location final {
  std::string                  path;
  PathKind                     kind{PathKind::Prefix};
  std::string                  backend;
  bool                         is_def_backend{false};
  Service                      service;
  std::string                  port;
  std::optional<ResourceOwner> owner;      ///< Absent for the synthesized catch-all root

  // flattened per-location policy
  std::string                        configuration_snippet;
  annotations::RewriteConfig         rewrite;
  annotations::RedirectConfig        redirect;
  std::optional<Service>             default_backend;
  std::string                        default_backend_upstream_name;
  std::string                        backend_protocol{config::constants::BACKEND_PROTOCOL_DEFAULT};
  annotations::AuthConfig            basic_digest_auth;
  annotations::TracingConfig         tracing;
  bool                               http2_push_preload{false};
  annotations::ProxyConfig           proxy;
  annotations::LogConfig             logs;

  bool operator==(const Location&) const = default;
};

struct Server final {
  std::string                       hostname;
  std::vector<std::string>          aliases;
  std::optional<SSLCert>            ssl_cert;
  bool                              ssl_passthrough{false};
  std::string                       ssl_ciphers;
  std::string                       ssl_prefer_server_ciphers;
  std::string                       server_snippet;
  bool                              redirect_from_to_www{false};
  annotations::CertificateAuthConfig certificate_auth;
  std::string                       auth_tls_error;
  std::vector<Location>             locations;

  bool operator==(const Server&) const = default;
};

/// Pass-local arena of servers, keyed by hostname.
using ServerMap = std::map<std::string, Server, std::less<>>;

/**
 * @brief Copy the annotation-derived policy of @p anns onto @p loc.
 * @note Backend assignment is the caller's job and must happen first.
 */
void apply_annotations(Location& loc, const annotations::Bundle& anns);

} // namespace ngsynth::model
