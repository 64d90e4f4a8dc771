/**
 * @file server_builder.cpp
 * @brief Server creation, server-level policy merging, TLS selection and location wiring.
 */
#include "ngsynth/synthesis/server_builder.hpp"
#include "ngsynth/config/constants.hpp"
#include "ngsynth/obs/observability.hpp"
#include "ngsynth/synthesis/merge_policy.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace ngsynth::synthesis {

using namespace ngsynth::config::constants;

namespace {

std::string to_lower_ascii(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

model::Location root_location(const std::string& backend, const annotations::ProxyConfig& proxy) {
    model::Location loc;
    loc.proxy = proxy;
    loc.path = std::string(ROOT_LOCATION);
    loc.kind = model::PathKind::Prefix;
    loc.backend = backend;
    loc.is_def_backend = true;
    return loc;
}

} // namespace

//------------------------------- Servers --------------------------------------

void ServerBuilder::create_servers(std::span<const model::RoutingResource> resources,
                                   const model::BackendMap& upstreams,
                                   const model::Backend& default_backend,
                                   model::ServerMap& servers) const {
    const auto& policy = store_.backend_policy();

    // catch-all server and its root location
    auto def_root = root_location(default_backend.name, policy.proxy);
    def_root.service = default_backend.service;
    def_root.logs = annotations::LogConfig{.access = policy.enable_access_log_for_default_backend,
                                           .rewrite = false};

    model::Server catch_all;
    catch_all.hostname = std::string(DEFAULT_SERVER_NAME);
    catch_all.ssl_cert = store_.default_certificate();
    catch_all.locations.push_back(std::move(def_root));
    servers.emplace(catch_all.hostname, std::move(catch_all));

    for (const auto& res : resources) {
        const auto& anns = res.parsed;
        if (anns.canary.enabled) {
            obs::log().debug("resource {} is marked as canary, ignoring", res.key());
            continue;
        }

        // upstream used by the placeholder root location of this resource's servers
        std::string fallback = default_backend.name;

        if (res.default_backend) {
            const auto name = model::upstream_name(res.namespace_name, *res.default_backend);
            if (const auto it = upstreams.find(name); it != upstreams.end()) {
                fallback = it->second.name;

                // the catch-all root follows the last resource default backend
                auto& def_loc = servers.find(DEFAULT_SERVER_NAME)->second.locations.front();
                def_loc.backend = it->second.name;
                def_loc.service = it->second.service;
                def_loc.port = it->second.port;
                def_loc.owner = model::owner_of(res);

                if (def_loc.is_def_backend && res.rules.empty()) {
                    obs::log().debug("resource {} defines a backend but no rule, using it to configure the catch-all server",
                                     res.key());
                    def_loc.is_def_backend = false;

                    // redirect and rewrite would change the catch-all behavior
                    const auto original_redirect = def_loc.redirect;
                    const auto original_rewrite = def_loc.rewrite;
                    model::apply_annotations(def_loc, anns);
                    def_loc.redirect = original_redirect;
                    def_loc.rewrite = original_rewrite;
                } else {
                    obs::log().trace("resource {} defines both a backend and rules, using its backend as default upstream for all its rules",
                                     res.key());
                }
            }
        }

        for (const auto& rule : res.rules) {
            const auto host = model::rule_host(rule);
            if (servers.contains(host)) continue;

            auto loc = root_location(fallback, policy.proxy);
            loc.owner = model::owner_of(res);
            model::apply_annotations(loc, anns);

            model::Server server;
            server.hostname = host;
            server.ssl_passthrough = anns.ssl_passthrough;
            server.ssl_ciphers = anns.ssl_cipher.ciphers;
            server.ssl_prefer_server_ciphers = anns.ssl_cipher.prefer_server_ciphers;
            server.locations.push_back(std::move(loc));
            servers.emplace(host, std::move(server));
        }
    }
}

std::map<std::string, std::vector<std::string>>
ServerBuilder::configure_servers(std::span<const model::RoutingResource> resources,
                                 model::ServerMap& servers) const {
    std::map<std::string, std::vector<std::string>> all_aliases;

    for (const auto& res : resources) {
        const auto& anns = res.parsed;
        if (anns.canary.enabled) continue;

        for (const auto& rule : res.rules) {
            const auto host = model::rule_host(rule);
            auto& server = servers.find(host)->second;

            if (merge_field(ServerField::Aliases, server.aliases, anns.aliases) == MergeOutcome::Applied) {
                all_aliases[host] = anns.aliases;
            } else if (!anns.aliases.empty()) {
                diag_.warn(host, "aliases already configured for server, skipping (resource " + res.key() + ")");
            }

            if (merge_field(ServerField::ServerSnippet, server.server_snippet, anns.server_snippet) ==
                MergeOutcome::KeptExisting) {
                diag_.warn(host, "server snippet already configured for server, skipping (resource " + res.key() + ")");
            }

            if (merge_field(ServerField::SSLCiphers, server.ssl_ciphers, anns.ssl_cipher.ciphers) ==
                    MergeOutcome::KeptExisting &&
                server.ssl_ciphers != anns.ssl_cipher.ciphers) {
                obs::log().debug("server {} already has SSL ciphers configured, skipping (resource {})", host, res.key());
            }
            if (merge_field(ServerField::SSLPreferServerCiphers, server.ssl_prefer_server_ciphers,
                            anns.ssl_cipher.prefer_server_ciphers) == MergeOutcome::KeptExisting &&
                server.ssl_prefer_server_ciphers != anns.ssl_cipher.prefer_server_ciphers) {
                obs::log().debug("server {} already has ssl-prefer-server-ciphers configured, skipping (resource {})",
                                 host, res.key());
            }

            // only add a certificate if the server does not have one yet
            if (server.ssl_cert) continue;

            if (res.tls.empty()) {
                obs::log().trace("resource {} does not contain a TLS section", res.key());
                continue;
            }

            auto resolved = resolve_certificate(host, res);
            if (resolved.diagnostic) {
                diag_.record(std::move(*resolved.diagnostic));
            } else if (resolved.value) {
                check_expiry(host, *resolved.value);
            }
            server.ssl_cert = std::move(resolved.value);
        }
    }
    return all_aliases;
}

void ServerBuilder::dedupe_aliases(const std::map<std::string, std::vector<std::string>>& all_aliases,
                                   model::ServerMap& servers) {
    for (const auto& [host, host_aliases] : all_aliases) {
        const auto it = servers.find(host);
        if (it == servers.end()) continue;

        std::set<std::string> uniq;
        for (const auto& alias : host_aliases) {
            if (alias == host) continue;
            if (servers.contains(alias)) continue;
            uniq.insert(alias);
        }
        it->second.aliases.assign(uniq.begin(), uniq.end());
    }
}

//------------------------------- TLS ------------------------------------------

std::string ServerBuilder::tls_secret_name(const std::string& host,
                                           const model::RoutingResource& res) const {
    // naive match of the host name against the TLS host lists
    const auto lowercase_host = to_lower_ascii(host);
    for (const auto& tls : res.tls) {
        for (const auto& tls_host : tls.hosts) {
            if (to_lower_ascii(tls_host) == lowercase_host) return tls.secret_name;
        }
    }

    // no TLS host matches, try every referenced certificate's SAN/CN
    for (const auto& tls : res.tls) {
        if (tls.secret_name.empty()) continue;

        const auto key = res.namespace_name + "/" + tls.secret_name;
        auto cert = store_.get_certificate(key);
        if (!cert) {
            diag_.warn(key, "error getting SSL certificate: " + cert.error().message);
            continue;
        }
        if (!cert->has_certificate()) continue;
        if (!cert->verify_san(host) && !cert->verify_cn(host)) continue;

        obs::log().trace("found SSL certificate matching host {}: {}", host, key);
        return tls.secret_name;
    }
    return {};
}

Resolution<std::optional<model::SSLCert>>
ServerBuilder::resolve_certificate(const std::string& host, const model::RoutingResource& res) const {
    const auto fallback = [&](std::string message) {
        return Resolution<std::optional<model::SSLCert>>{
            store_.default_certificate(),
            Diagnostic{Severity::Warning, host, std::move(message) + ", using default certificate"}};
    };

    const auto secret_name = tls_secret_name(host, res);
    if (secret_name.empty()) {
        return fallback("host is listed in the TLS section but no secret matches it");
    }

    const auto key = res.namespace_name + "/" + secret_name;
    auto cert = store_.get_certificate(key);
    if (!cert) {
        return fallback("error getting SSL certificate " + key + ": " + cert.error().message);
    }
    if (!cert->has_certificate()) {
        return fallback("SSL certificate " + key + " does not contain a valid SSL certificate");
    }
    if (!cert->verify_san(host)) {
        obs::log().debug("SSL certificate {} has no SAN for {}, validating against the common name", key, host);
        if (!cert->verify_cn(host)) {
            return fallback("SSL certificate " + key +
                            " does not contain a Common Name or Subject Alternative Name for server " + host);
        }
    }
    return {std::move(*cert), std::nullopt};
}

void ServerBuilder::check_expiry(const std::string& host, const model::SSLCert& cert) const {
    using namespace std::chrono;
    if (cert.expire_time < now_) {
        diag_.warn(host, "SSL certificate " + cert.name + " expired");
    } else if (cert.expire_time < now_ + hours(CERT_EXPIRY_WARNING_HOURS)) {
        diag_.warn(host, "SSL certificate " + cert.name + " is about to expire");
    }
}

//------------------------------- Locations ------------------------------------

void ServerBuilder::bind_locations(std::span<const model::RoutingResource> resources,
                                   model::BackendMap& upstreams,
                                   model::ServerMap& servers) const {
    const auto& policy = store_.backend_policy();

    for (const auto& res : resources) {
        const auto& anns = res.parsed;
        if (anns.canary.enabled) continue;

        for (const auto& rule : res.rules) {
            const auto host = model::rule_host(rule);
            auto server_it = servers.find(host);
            if (server_it == servers.end()) server_it = servers.find(DEFAULT_SERVER_NAME);
            auto& server = server_it->second;

            if (!rule.http && host != DEFAULT_SERVER_NAME) {
                obs::log().trace("resource {} does not contain any HTTP rule, using default backend", res.key());
                continue;
            }

            if (merge_field(ServerField::AuthTLSError, server.auth_tls_error,
                            anns.certificate_auth.auth_tls_error) == MergeOutcome::KeptExisting &&
                server.auth_tls_error != anns.certificate_auth.auth_tls_error) {
                obs::log().debug("server {} already has an auth-tls error page, skipping (resource {})",
                                 server.hostname, res.key());
            }
            switch (merge_field(ServerField::CertificateAuth, server.certificate_auth, anns.certificate_auth)) {
                case MergeOutcome::Unset:
                    if (!anns.certificate_auth.secret.empty()) {
                        obs::log().debug("secret {} has no 'ca.crt' key, mutual authentication disabled for resource {}",
                                         anns.certificate_auth.secret, res.key());
                    }
                    break;
                case MergeOutcome::KeptExisting:
                    obs::log().debug("server {} is already configured for mutual authentication (resource {})",
                                     server.hostname, res.key());
                    break;
                default:
                    break;
            }

            if (!rule.http) continue;

            for (const auto& path : rule.http->paths) {
                if (!path.service) continue;

                const auto ups_it = upstreams.find(model::upstream_name(res.namespace_name, *path.service));
                if (ups_it == upstreams.end()) continue;
                auto& ups = ups_it->second;

                // canary-only backend, reachable through merging only
                if (ups.no_server) continue;

                const auto nginx_path = model::location_path(path);
                const auto kind = path.kind.value_or(model::PathKind::Prefix);

                auto loc_it = std::find_if(server.locations.begin(), server.locations.end(),
                    [&](const model::Location& l) { return l.path == nginx_path && l.kind == kind; });

                if (loc_it != server.locations.end()) {
                    if (!loc_it->is_def_backend) {
                        obs::log().debug("location {} already configured for server {} with upstream {} (resource {})",
                                         loc_it->path, server.hostname, loc_it->backend, res.key());
                    } else {
                        obs::log().debug("replacing location {} for server {} with upstream {} to use upstream {} (resource {})",
                                         loc_it->path, server.hostname, loc_it->backend, ups.name, res.key());
                        loc_it->backend = ups.name;
                        loc_it->is_def_backend = false;
                        loc_it->port = ups.port;
                        loc_it->service = ups.service;
                        loc_it->owner = model::owner_of(res);
                        model::apply_annotations(*loc_it, anns);
                        if (loc_it->redirect.from_to_www) server.redirect_from_to_www = true;
                    }
                } else {
                    obs::log().debug("adding location {} for server {} with upstream {} (resource {})",
                                     nginx_path, server.hostname, ups.name, res.key());
                    model::Location loc;
                    loc.proxy = policy.proxy;
                    loc.path = nginx_path;
                    loc.kind = kind;
                    loc.backend = ups.name;
                    loc.service = ups.service;
                    loc.port = ups.port;
                    loc.owner = model::owner_of(res);
                    model::apply_annotations(loc, anns);
                    if (loc.redirect.from_to_www) server.redirect_from_to_www = true;
                    server.locations.push_back(std::move(loc));
                }

                auto& affinity = ups.session_affinity;
                if (affinity.affinity_type.empty()) affinity.affinity_type = anns.session_affinity.type;
                if (affinity.affinity_mode.empty()) affinity.affinity_mode = anns.session_affinity.mode;

                if (anns.session_affinity.type != AFFINITY_TYPE_COOKIE) continue;

                const auto& cookie = anns.session_affinity.cookie;
                if (anns.rewrite.use_regex && cookie.path.empty()) {
                    diag_.warn(res.key(), "session-cookie-path should be set when use-regex is true");
                }

                if (affinity.cookie.name.empty()) {
                    affinity.cookie.name = cookie.name;
                    affinity.cookie.expires = cookie.expires;
                    affinity.cookie.max_age = cookie.max_age;
                    affinity.cookie.secure = cookie.secure;
                    affinity.cookie.path = cookie.path;
                    affinity.cookie.same_site = cookie.same_site;
                    affinity.cookie.conditional_same_site_none = cookie.conditional_same_site_none;
                    affinity.cookie.change_on_failure = cookie.change_on_failure;
                }

                affinity.cookie.locations[host].push_back(nginx_path);
                for (const auto& alias : server.aliases) {
                    affinity.cookie.locations[alias].push_back(nginx_path);
                }
            }
        }
    }
}

model::ServerMap ServerBuilder::build(std::span<const model::RoutingResource> resources,
                                      model::BackendMap& upstreams,
                                      const model::Backend& default_backend) const {
    model::ServerMap servers;
    create_servers(resources, upstreams, default_backend, servers);
    const auto all_aliases = configure_servers(resources, servers);
    dedupe_aliases(all_aliases, servers);
    bind_locations(resources, upstreams, servers);
    return servers;
}

} // namespace ngsynth::synthesis
