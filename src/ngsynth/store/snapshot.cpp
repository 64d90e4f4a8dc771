/**
 * @file snapshot.cpp
 * @brief yaml-cpp snapshot reader.
 */
#include "ngsynth/store/snapshot.hpp"
#include "ngsynth/obs/observability.hpp"

#include <yaml-cpp/yaml.h>

#include <charconv>
#include <chrono>
#include <map>
#include <stdexcept>
#include <vector>

namespace ngsynth::store {

using SnapshotResult = ngsynth_detail::expected<std::size_t, config::ConfigError>;

namespace {

/// Thrown inside the reader for values yaml-cpp accepts but the model does not.
struct InvalidSnapshot : std::runtime_error {
    using std::runtime_error::runtime_error;
};

template <class T>
T value_or(const YAML::Node& node, const char* key, T fallback) {
    if (const auto v = node[key]) return v.as<T>();
    return fallback;
}

model::Protocol parse_protocol(const std::string& raw) {
    if (raw == "TCP") return model::Protocol::TCP;
    if (raw == "UDP") return model::Protocol::UDP;
    throw InvalidSnapshot("unknown protocol " + raw);
}

model::ServiceRef parse_service_ref(const YAML::Node& node) {
    model::ServiceRef ref;
    ref.name = node["service"].as<std::string>();
    // "port" is a number or a port name
    const auto port = node["port"].as<std::string>();
    std::int32_t number = 0;
    const auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), number);
    if (!port.empty() && ec == std::errc{} && ptr == port.data() + port.size()) {
        ref.port_number = number;
    } else {
        ref.port_name = port;
    }
    return ref;
}

model::Service parse_service(const YAML::Node& node) {
    model::Service svc;
    svc.namespace_name = node["namespace"].as<std::string>();
    svc.name = node["name"].as<std::string>();
    svc.cluster_ip = value_or<std::string>(node, "cluster-ip", "");
    for (const auto& p : node["ports"]) {
        model::ServicePort sp;
        sp.name = value_or<std::string>(p, "name", "");
        sp.port = p["port"].as<std::int32_t>();
        sp.target_port = value_or<std::string>(p, "target-port", std::to_string(sp.port));
        sp.protocol = parse_protocol(value_or<std::string>(p, "protocol", "TCP"));
        svc.ports.push_back(std::move(sp));
    }
    return svc;
}

model::SSLCert parse_certificate(const YAML::Node& node) {
    model::SSLCert cert;
    cert.name = node["secret"].as<std::string>();
    cert.pem = value_or<std::string>(node, "pem", "");
    cert.pem_sha = value_or<std::string>(node, "pem-sha", "");
    cert.expire_time = std::chrono::system_clock::time_point(
        std::chrono::seconds(value_or<std::int64_t>(node, "expires-unix", 0)));
    if (const auto names = node["dns-names"]) cert.dns_names = names.as<std::vector<std::string>>();
    cert.common_name = value_or<std::string>(node, "common-name", "");
    return cert;
}

model::RoutingResource parse_resource(const YAML::Node& node) {
    model::RoutingResource res;
    res.namespace_name = node["namespace"].as<std::string>();
    res.name = node["name"].as<std::string>();
    res.deletion_marked = value_or<bool>(node, "deleted", false);

    if (const auto anns = node["annotations"]) {
        for (const auto& kv : anns) {
            res.annotations.emplace(kv.first.as<std::string>(), kv.second.as<std::string>());
        }
    }
    if (const auto db = node["default-backend"]) res.default_backend = parse_service_ref(db);

    for (const auto& t : node["tls"]) {
        model::TLSEntry entry;
        if (const auto hosts = t["hosts"]) entry.hosts = hosts.as<std::vector<std::string>>();
        entry.secret_name = value_or<std::string>(t, "secret", "");
        res.tls.push_back(std::move(entry));
    }

    for (const auto& r : node["rules"]) {
        model::Rule rule;
        rule.host = value_or<std::string>(r, "host", "");
        if (const auto paths = r["paths"]) {
            model::HttpRule http;
            for (const auto& p : paths) {
                model::PathRule path;
                path.path = value_or<std::string>(p, "path", "");
                if (const auto type = p["type"]) {
                    const auto raw = type.as<std::string>();
                    path.kind = model::parse_path_kind(raw);
                    if (!path.kind) throw InvalidSnapshot("unknown path type " + raw);
                }
                if (p["service"]) path.service = parse_service_ref(p);
                http.paths.push_back(std::move(path));
            }
            rule.http = std::move(http);
        }
        res.rules.push_back(std::move(rule));
    }
    return res;
}

SnapshotResult load(const YAML::Node& root, InMemoryStore& store) {
    if (!root || root.IsNull()) return std::size_t{0};
    if (!root.IsMap()) {
        return ngsynth_detail::unexpected<config::ConfigError>(
            config::ConfigError{config::ConfigErrc::InvalidValue, "top level of the snapshot must be a map"});
    }

    std::size_t count = 0;
    try {
        for (const auto& s : root["services"]) store.add_service(parse_service(s));

        for (const auto& e : root["endpoints"]) {
            model::EndpointList list;
            for (const auto& a : e["addresses"]) {
                list.push_back(model::Endpoint{a["address"].as<std::string>(), a["port"].as<std::int32_t>(),
                                               value_or<std::uint16_t>(a, "weight", 100)});
            }
            store.set_endpoints(e["service"].as<std::string>(), e["port"].as<std::string>(), std::move(list));
        }

        for (const auto& c : root["certificates"]) store.add_certificate(parse_certificate(c));

        for (const auto& s : root["secrets"]) {
            model::Secret secret;
            secret.namespace_name = s["namespace"].as<std::string>();
            secret.name = s["name"].as<std::string>();
            if (const auto data = s["data"]) secret.data = data.as<std::map<std::string, std::string>>();
            store.add_secret(std::move(secret));
        }

        if (const auto def = root["default-certificate"]) {
            const auto key = def.as<std::string>();
            auto cert = store.get_certificate(key);
            if (!cert) throw InvalidSnapshot("default certificate " + key + " is not listed under certificates");
            store.set_default_certificate(std::move(*cert));
        }

        for (const auto& s : root["streams"]) {
            store.add_stream(StreamBinding{parse_protocol(value_or<std::string>(s, "protocol", "TCP")),
                                           s["port"].as<std::int32_t>(), s["service"].as<std::string>(),
                                           s["service-port"].as<std::string>()});
        }

        for (const auto& r : root["resources"]) {
            store.upsert_resource(parse_resource(r));
            ++count;
        }
    } catch (const YAML::Exception& e) {
        return ngsynth_detail::unexpected<config::ConfigError>(
            config::ConfigError{config::ConfigErrc::InvalidValue, std::string("invalid snapshot: ") + e.what()});
    } catch (const InvalidSnapshot& e) {
        return ngsynth_detail::unexpected<config::ConfigError>(
            config::ConfigError{config::ConfigErrc::InvalidValue, std::string("invalid snapshot: ") + e.what()});
    }

    obs::log().debug("snapshot loaded: {} routing resources", count);
    return count;
}

} // namespace

SnapshotResult load_snapshot_string(const std::string& text, InMemoryStore& store) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        return ngsynth_detail::unexpected<config::ConfigError>(
            config::ConfigError{config::ConfigErrc::ParseError, e.what()});
    }
    return load(root, store);
}

SnapshotResult load_snapshot_file(const std::string& path, InMemoryStore& store) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile& e) {
        return ngsynth_detail::unexpected<config::ConfigError>(
            config::ConfigError{config::ConfigErrc::FileNotFound, "cannot open " + path + ": " + e.what()});
    } catch (const YAML::Exception& e) {
        return ngsynth_detail::unexpected<config::ConfigError>(
            config::ConfigError{config::ConfigErrc::ParseError, path + ": " + e.what()});
    }
    return load(root, store);
}

} // namespace ngsynth::store
