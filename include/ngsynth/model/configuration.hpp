/**
 * @file configuration.hpp
 * @brief Aggregate root handed to the template renderer.
 *
 * Built fresh on every synthesis pass and replaced wholesale; callers keep
 * the previous value only to diff against it.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "ngsynth/model/backend.hpp"
#include "ngsynth/model/server.hpp"
#include "ngsynth/model/service.hpp"
#include "ngsynth/model/ssl_cert.hpp"

namespace ngsynth::model {

/// Target of a TCP/UDP stream service.
struct L4Backend final {
  std::string  port;                  ///< Service port
  std::string  name;
  std::string  namespace_name;
  Protocol     protocol{Protocol::TCP};
  bool         proxy_protocol_decode{false};
  bool         proxy_protocol_encode{false};

  bool operator==(const L4Backend&) const = default;
};

/// A port exposed by the data plane and forwarded to a service.
struct L4Service final {
  std::int32_t port{0};
  L4Backend    backend;
  EndpointList endpoints;
  Service      service;

  bool operator==(const L4Service&) const = default;
};

struct SSLPassthroughBackend final {
  std::string backend;
  std::string hostname;
  Service     service;
  std::string port;

  bool operator==(const SSLPassthroughBackend&) const = default;
};

struct Configuration final {
  std::vector<Backend>               backends;
  std::vector<Server>                servers;
  std::vector<L4Service>             tcp_endpoints;
  std::vector<L4Service>             udp_endpoints;
  std::vector<SSLPassthroughBackend> passthrough_backends;
  std::string                        backend_config_checksum;
  std::optional<SSLCert>             default_ssl_certificate;
  std::vector<std::string>           stream_snippets;

  bool operator==(const Configuration&) const = default;
};

/**
 * @brief Resource keys referenced by locations of @p previous but not of @p next.
 * @return Sorted, unique keys ("namespace/name").
 */
[[nodiscard]] std::vector<std::string> removed_resources(const Configuration& previous,
                                                         const Configuration& next);

} // namespace ngsynth::model
