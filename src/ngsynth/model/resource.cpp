/**
 * @file resource.cpp
 * @brief Identity helpers for routing resources.
 */
#include "ngsynth/model/resource.hpp"
#include "ngsynth/config/constants.hpp"

namespace ngsynth::model {

using namespace ngsynth::config::constants;

std::optional<PathKind> parse_path_kind(std::string_view s) noexcept {
  if (s == "Exact")                  return PathKind::Exact;
  if (s == "Prefix")                 return PathKind::Prefix;
  if (s == "ImplementationSpecific") return PathKind::ImplementationSpecific;
  return std::nullopt;
}

std::string_view to_string(PathKind k) noexcept {
  switch (k) {
    case PathKind::Exact:                  return "Exact";
    case PathKind::Prefix:                 return "Prefix";
    case PathKind::ImplementationSpecific: return "ImplementationSpecific";
  }
  return "Prefix";
}

std::string ServiceRef::port_string() const {
  if (!port_name.empty()) return port_name;
  return std::to_string(port_number);
}

std::string upstream_name(std::string_view namespace_name, const ServiceRef& svc) {
  std::string out;
  out.reserve(namespace_name.size() + svc.name.size() + 8);
  out.append(namespace_name).append("-").append(svc.name).append("-").append(svc.port_string());
  return out;
}

std::string rule_host(const Rule& rule) {
  return rule.host.empty() ? std::string(DEFAULT_SERVER_NAME) : rule.host;
}

std::string location_path(const PathRule& path) {
  return path.path.empty() ? std::string(ROOT_LOCATION) : path.path;
}

} // namespace ngsynth::model
