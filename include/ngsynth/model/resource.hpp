/**
 * @file resource.hpp
 * @brief Declarative routing resource: host/path rules referencing services.
 *
 * A RoutingResource is immutable once handed to a synthesis pass. Its
 * identity is "namespace/name". The parsed annotation bundle travels with it
 * so every builder reads the same typed policy.
 */
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ngsynth/annotations/bundle.hpp"

namespace ngsynth::model {

/// How a location path is matched.
enum class PathKind : std::uint8_t {
  Exact = 0,
  Prefix,
  ImplementationSpecific
};

/// Parse "Exact" / "Prefix" / "ImplementationSpecific"; nullopt otherwise.
[[nodiscard]] std::optional<PathKind> parse_path_kind(std::string_view s) noexcept;
[[nodiscard]] std::string_view to_string(PathKind k) noexcept;

/**
 * @brief Reference to a service port, by number or by name.
 * @note Exactly one of @ref port_number / @ref port_name is meaningful; a
 *       non-empty name wins.
 */
struct ServiceRef final {
  std::string  name;
  std::int32_t port_number{0};
  std::string  port_name;

  /// The port as it appears in identity keys ("80" or "http").
  [[nodiscard]] std::string port_string() const;

  bool operator==(const ServiceRef&) const = default;
};

/// One path of an HTTP rule. A path without a service falls back to the default backend.
struct PathRule final {
  std::string               path;
  std::optional<PathKind>   kind;
  std::optional<ServiceRef> service;

  bool operator==(const PathRule&) const = default;
};

/// HTTP section of a rule; a rule without one only claims the hostname.
struct HttpRule final {
  std::vector<PathRule> paths;

  bool operator==(const HttpRule&) const = default;
};

struct Rule final {
  std::string             host;           ///< Empty means the catch-all server.
  std::optional<HttpRule> http;

  bool operator==(const Rule&) const = default;
};

struct TLSEntry final {
  std::vector<std::string> hosts;
  std::string              secret_name;

  bool operator==(const TLSEntry&) const = default;
};

using AnnotationMap = std::map<std::string, std::string, std::less<>>;

struct RoutingResource final {
  std::string               namespace_name;
  std::string               name;
  AnnotationMap             annotations;  ///< Raw annotations, read by admission checks and the extractor
  bool                      deletion_marked{false};

  std::vector<Rule>         rules;
  std::optional<ServiceRef> default_backend;
  std::vector<TLSEntry>     tls;

  annotations::Bundle       parsed;       ///< Filled by an AnnotationExtractor

  /// "namespace/name"
  [[nodiscard]] std::string key() const { return namespace_name + "/" + name; }

  bool operator==(const RoutingResource&) const = default;
};

using ResourceList = std::vector<RoutingResource>;

/// Identity key of a backend derived from a service reference.
[[nodiscard]] std::string upstream_name(std::string_view namespace_name, const ServiceRef& svc);

/// Hostname a rule targets ("_" for an empty host).
[[nodiscard]] std::string rule_host(const Rule& rule);

/// Location path a path rule targets ("/" for an empty path).
[[nodiscard]] std::string location_path(const PathRule& path);

} // namespace ngsynth::model
