/**
 * @file backend.hpp
 * @brief Named backend pool ("upstream") a location routes to.
 */
#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "ngsynth/annotations/bundle.hpp"
#include "ngsynth/model/service.hpp"

namespace ngsynth::model {

/**
 * @brief Cookie affinity as rendered for a backend.
 *
 * `locations` maps every hostname (and alias) to the paths where the cookie
 * applies, so the renderer can scope the cookie.
 */
struct CookieSessionAffinity final {
  std::string name;
  std::string expires;
  std::string max_age;
  std::string path;
  std::string same_site;
  bool        secure{false};
  bool        conditional_same_site_none{false};
  bool        change_on_failure{false};
  std::map<std::string, std::vector<std::string>> locations;

  bool operator==(const CookieSessionAffinity&) const = default;
};

struct SessionAffinity final {
  std::string           affinity_type;
  std::string           affinity_mode;
  CookieSessionAffinity cookie;

  bool operator==(const SessionAffinity&) const = default;
};

/// Split rules used only when this backend is someone's alternative.
struct TrafficShapingPolicy final {
  std::int32_t weight{0};
  std::int32_t weight_total{0};
  std::string  header;
  std::string  header_value;
  std::string  header_pattern;
  std::string  cookie;

  bool operator==(const TrafficShapingPolicy&) const = default;
};

struct Backend final {
  std::string                        name;        ///< Identity key
  Service                            service;     ///< Owning service; empty when unknown
  std::string                        port;        ///< Service port as referenced ("80" / "http")
  EndpointList                       endpoints;
  bool                               no_server{false};
  SessionAffinity                    session_affinity;
  annotations::UpstreamHashByConfig  upstream_hash_by;
  std::string                        load_balancing;
  TrafficShapingPolicy               traffic_shaping;
  std::vector<std::string>           alternative_backends;
  bool                               ssl_passthrough{false};

  bool operator==(const Backend&) const = default;
};

/// Pass-local arena of backends, keyed by identity.
using BackendMap = std::map<std::string, Backend, std::less<>>;

} // namespace ngsynth::model
