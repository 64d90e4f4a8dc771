#pragma once
/**
 * @file snapshot.hpp
 * @brief YAML snapshot of cluster state -> InMemoryStore.
 *
 * Layout (every section optional):
 * @code
 * services:      [{namespace, name, cluster-ip, ports: [{name, port, target-port, protocol}]}]
 * endpoints:     [{service: ns/name, port: "80", addresses: [{address, port, weight}]}]
 * certificates:  [{secret: ns/name, pem, pem-sha, expires-unix, dns-names: [], common-name}]
 * secrets:       [{namespace, name, data: {key: value}}]
 * default-certificate: ns/name
 * streams:       [{protocol: TCP|UDP, port, service: ns/name, service-port}]
 * resources:     [{namespace, name, deleted, annotations: {}, default-backend: {service, port},
 *                  tls: [{hosts: [], secret}],
 *                  rules: [{host, paths: [{path, type, service, port}]}]}]
 * @endcode
 * A rule without a "paths" key has no HTTP section. Annotation bundles are
 * not extracted here; call InMemoryStore::extract_annotations() afterwards.
 */

#include <cstddef>
#include <string>

#include "ngsynth/compat/expected.hpp"
#include "ngsynth/config/config_loader.hpp"
#include "ngsynth/store/memory_store.hpp"

namespace ngsynth::store {

/// Load @p text into @p store; returns the number of routing resources read.
ngsynth_detail::expected<std::size_t, config::ConfigError>
load_snapshot_string(const std::string& text, InMemoryStore& store);

/// Same as load_snapshot_string() for a file.
ngsynth_detail::expected<std::size_t, config::ConfigError>
load_snapshot_file(const std::string& path, InMemoryStore& store);

} // namespace ngsynth::store
