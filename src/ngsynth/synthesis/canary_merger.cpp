/**
 * @file canary_merger.cpp
 * @brief Alternative backend merging.
 */
#include "ngsynth/synthesis/canary_merger.hpp"
#include "ngsynth/config/constants.hpp"
#include "ngsynth/obs/observability.hpp"

#include <algorithm>
#include <set>
#include <vector>

namespace ngsynth::synthesis {

using namespace ngsynth::config::constants;

bool CanaryMerger::non_canary_exists(std::span<const model::RoutingResource> resources) noexcept {
    return std::any_of(resources.begin(), resources.end(),
                       [](const model::RoutingResource& r) { return !r.parsed.canary.enabled; });
}

void CanaryMerger::attach(model::Backend& primary, model::Backend& alt, const std::string& canary_behavior) {
    const auto& alts = primary.alternative_backends;
    if (std::find(alts.begin(), alts.end(), alt.name) != alts.end()) return;

    primary.alternative_backends.push_back(alt.name);
    if (canary_behavior != CANARY_BEHAVIOR_LEGACY) {
        alt.session_affinity = primary.session_affinity;
    }
}

CanaryMerger::Outcome
CanaryMerger::merge_into_server(const model::Server& server,
                                model::BackendMap& upstreams,
                                model::Backend& alt,
                                const std::string& canary_behavior,
                                const std::function<bool(const model::Location&)>& match) const {
    // a location already routing to the alternative would end up pointing at itself
    for (const auto& loc : server.locations) {
        if (loc.backend == alt.name) {
            diag_.warn(alt.name, "alternative backend is already the backend of a location of server " +
                                 server.hostname + ", cannot merge it into itself");
            return Outcome::SelfReference;
        }
    }

    auto outcome = Outcome::NoPrimary;
    for (const auto& loc : server.locations) {
        if (!match(loc)) continue;

        const auto pri_it = upstreams.find(loc.backend);
        if (pri_it == upstreams.end()) continue;
        auto& primary = pri_it->second;
        if (!can_merge(primary, alt)) continue;

        obs::log().debug("matching backend {} found for alternative backend {}", primary.name, alt.name);
        attach(primary, alt, canary_behavior);
        outcome = Outcome::Merged;
    }
    return outcome;
}

void CanaryMerger::merge(std::span<const model::RoutingResource> resources,
                         model::BackendMap& upstreams,
                         const model::ServerMap& servers) const {
    std::set<std::string> merged;
    std::set<std::string> unmatched;

    const auto record = [&](Outcome outcome, const std::string& alt_name) {
        if (outcome == Outcome::NoPrimary) {
            unmatched.insert(alt_name);
        } else {
            merged.insert(alt_name);
        }
    };

    for (const auto& res : resources) {
        const auto& anns = res.parsed;
        if (!anns.canary.enabled) continue;
        const auto& behavior = anns.session_affinity.canary_behavior;

        if (res.default_backend) {
            const auto alt_name = model::upstream_name(res.namespace_name, *res.default_backend);
            const auto alt_it = upstreams.find(alt_name);
            if (alt_it == upstreams.end()) {
                obs::log().debug("alternative backend {} of resource {} not found, skipping", alt_name, res.key());
            } else {
                const auto& catch_all = servers.find(DEFAULT_SERVER_NAME)->second;
                const auto outcome = merge_into_server(catch_all, upstreams, alt_it->second, behavior,
                                                       [](const model::Location&) { return true; });
                if (outcome == Outcome::NoPrimary) {
                    diag_.warn(alt_name, "unable to find a real backend for the canary default backend of resource " +
                                         res.key() + ", deleting it");
                }
                record(outcome, alt_name);
            }
        }

        for (const auto& rule : res.rules) {
            const auto host = model::rule_host(rule);
            const auto server_it = servers.find(host);
            if (server_it == servers.end()) {
                diag_.error(host, "no server found for canary resource " + res.key() +
                                  ", a non-canary resource must define the host first");
                continue;
            }
            if (!rule.http) continue;

            for (const auto& path : rule.http->paths) {
                if (!path.service) continue;

                const auto alt_name = model::upstream_name(res.namespace_name, *path.service);
                const auto alt_it = upstreams.find(alt_name);
                if (alt_it == upstreams.end()) {
                    obs::log().debug("alternative backend {} of resource {} not found, skipping", alt_name, res.key());
                    continue;
                }

                const auto nginx_path = model::location_path(path);
                const auto kind = path.kind.value_or(model::PathKind::Prefix);
                const auto outcome = merge_into_server(server_it->second, upstreams, alt_it->second, behavior,
                    [&](const model::Location& loc) { return loc.path == nginx_path && loc.kind == kind; });
                if (outcome == Outcome::NoPrimary) {
                    diag_.warn(alt_name, "unable to find a real backend for host " + host + " path " +
                                         nginx_path + " of canary resource " + res.key() + ", deleting it");
                }
                record(outcome, alt_name);
            }
        }
    }

    // an alternative merged through one path stays even if another path found nothing
    for (const auto& name : unmatched) {
        if (!merged.contains(name)) upstreams.erase(name);
    }
}

void CanaryMerger::drop_orphans(std::span<const model::RoutingResource> resources,
                                model::BackendMap& upstreams) const {
    for (const auto& res : resources) {
        if (!res.parsed.canary.enabled) continue;

        std::vector<std::string> names;
        if (res.default_backend) names.push_back(model::upstream_name(res.namespace_name, *res.default_backend));
        for (const auto& rule : res.rules) {
            if (!rule.http) continue;
            for (const auto& path : rule.http->paths) {
                if (path.service) names.push_back(model::upstream_name(res.namespace_name, *path.service));
            }
        }

        for (const auto& name : names) {
            const auto it = upstreams.find(name);
            if (it == upstreams.end() || !it->second.no_server) continue;
            diag_.warn(name, "no non-canary resource exists, dropping the alternative backend of resource " + res.key());
            upstreams.erase(it);
        }
    }
}

} // namespace ngsynth::synthesis
