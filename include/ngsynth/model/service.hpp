/**
 * @file service.hpp
 * @brief Backing service and endpoint descriptors, as served by the Resource Store.
 */
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ngsynth::model {

/// Transport protocol of a service port or stream service.
enum class Protocol : std::uint8_t { TCP = 0, UDP = 1 };

/// One port exposed by a service.
struct ServicePort final {
  std::string   name;                     ///< Optional port name, e.g. "http".
  std::int32_t  port{0};                  ///< Service port number.
  std::string   target_port;              ///< Pod port (number or name) as declared.
  Protocol      protocol{Protocol::TCP};

  bool operator==(const ServicePort&) const = default;
};

/**
 * @brief Minimal service descriptor.
 *
 * Only the fields the synthesis pipeline reads. An empty name means "unknown
 * service" (lookup failed); such a value is still valid to carry around.
 */
struct Service final {
  std::string              namespace_name;
  std::string              name;
  std::string              cluster_ip;    ///< Empty or "None" for headless services.
  std::vector<ServicePort> ports;

  [[nodiscard]] bool empty() const noexcept { return name.empty(); }
  /// "namespace/name"
  [[nodiscard]] std::string key() const { return namespace_name + "/" + name; }

  bool operator==(const Service&) const = default;
};

/// A resolved address a backend forwards to.
struct Endpoint final {
  std::string   address;                  ///< IPv4/IPv6 literal or DNS name.
  std::int32_t  port{0};
  std::uint16_t weight{100};              ///< Relative weight for load balancing.

  bool operator==(const Endpoint&) const = default;
};

using EndpointList = std::vector<Endpoint>;

} // namespace ngsynth::model
