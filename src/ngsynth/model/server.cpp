/**
 * @file server.cpp
 * @brief Location policy flattening.
 */
#include "ngsynth/model/server.hpp"

namespace ngsynth::model {

ResourceOwner owner_of(const RoutingResource& r) {
  return ResourceOwner{r.namespace_name, r.name, r.parsed.canary.mark};
}

void apply_annotations(Location& loc, const annotations::Bundle& anns) {
  loc.configuration_snippet = anns.configuration_snippet;
  loc.rewrite               = anns.rewrite;
  loc.redirect              = anns.redirect;
  loc.default_backend       = anns.default_backend;
  loc.backend_protocol      = anns.backend_protocol;
  loc.basic_digest_auth     = anns.basic_digest_auth;
  loc.tracing               = anns.tracing;
  loc.http2_push_preload    = anns.http2_push_preload;
  if (anns.proxy) loc.proxy = *anns.proxy;
  if (anns.logs)  loc.logs  = *anns.logs;
}

} // namespace ngsynth::model
