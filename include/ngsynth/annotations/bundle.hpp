#pragma once
/**
 * @file bundle.hpp
 * @brief Typed policy extracted from a routing resource's annotations.
 * @details The synthesis core reads these named fields only; it never looks at
 *          raw annotation strings except in the admission policy checks.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "ngsynth/config/constants.hpp"
#include "ngsynth/model/service.hpp"

namespace ngsynth::annotations {

/**
 * @enum CanaryMark
 * @brief Raw state of the canary annotation.
 * @note The overlap check distinguishes "absent" from "present but false".
 */
enum class CanaryMark : std::uint8_t {
    Missing = 0, ///< Annotation not set (or not parseable as a boolean)
    Enabled,     ///< canary: "true"
    Disabled     ///< canary: "false"
};

/** @struct CanaryConfig
 *  @brief Traffic split settings of a canary resource.
 */
struct CanaryConfig {
    CanaryMark   mark{CanaryMark::Missing};
    bool         enabled{false};
    std::int32_t weight{0};
    std::int32_t weight_total{config::constants::CANARY_WEIGHT_TOTAL_DEFAULT};
    std::string  header;
    std::string  header_value;
    std::string  header_pattern;
    std::string  cookie;

    bool operator==(const CanaryConfig&) const = default;
};

/** @struct CookieConfig
 *  @brief Session cookie settings for cookie-based affinity.
 */
struct CookieConfig {
    std::string name;
    std::string expires;
    std::string max_age;
    std::string path;
    std::string same_site;
    bool        secure{false};
    bool        conditional_same_site_none{false};
    bool        change_on_failure{false};

    bool operator==(const CookieConfig&) const = default;
};

/** @struct AffinityConfig
 *  @brief Session affinity requested by a resource.
 */
struct AffinityConfig {
    std::string  type;           ///< "" or "cookie"
    std::string  mode;           ///< "balanced" or "persistent"
    std::string  canary_behavior;///< "" or "legacy"
    CookieConfig cookie;

    bool operator==(const AffinityConfig&) const = default;
};

/** @struct UpstreamHashByConfig */
struct UpstreamHashByConfig {
    std::string  hash_by;
    bool         subset{false};
    std::int32_t subset_size{config::constants::UPSTREAM_HASH_SUBSET_SIZE};

    bool operator==(const UpstreamHashByConfig&) const = default;
};

/** @struct SSLCipherConfig */
struct SSLCipherConfig {
    std::string ciphers;
    std::string prefer_server_ciphers; ///< "on", "off" or "" when unset

    bool operator==(const SSLCipherConfig&) const = default;
};

/** @struct RewriteConfig */
struct RewriteConfig {
    std::string target;
    bool        ssl_redirect{true};
    bool        force_ssl_redirect{false};
    bool        use_regex{false};
    std::string app_root;

    bool operator==(const RewriteConfig&) const = default;
};

/** @struct RedirectConfig */
struct RedirectConfig {
    std::string  url;
    std::int32_t code{0};
    bool         from_to_www{false};

    bool operator==(const RedirectConfig&) const = default;
};

/** @struct AuthConfig
 *  @brief Basic/digest authentication bound to a location.
 */
struct AuthConfig {
    std::string type;         ///< "basic" or "digest"
    std::string realm;
    std::string file;         ///< Password file the renderer points at
    bool        secured{false};
    std::string secret;       ///< "namespace/name"
    std::string secret_type;  ///< "auth-file" or "auth-map"

    bool operator==(const AuthConfig&) const = default;
};

/** @struct TracingConfig
 *  @brief Per-location tracing toggles; `set` flags distinguish "unset".
 */
struct TracingConfig {
    bool enabled{false};
    bool set{false};
    bool trust_enabled{false};
    bool trust_set{false};

    bool operator==(const TracingConfig&) const = default;
};

/** @struct CertificateAuthConfig
 *  @brief Client certificate (mTLS) settings applied at server level.
 */
struct CertificateAuthConfig {
    std::string secret;
    std::string ca_file_name;
    std::string verify_client;
    std::int32_t verify_depth{0};
    std::string auth_tls_error;

    bool operator==(const CertificateAuthConfig&) const = default;
};

/** @struct ProxyConfig
 *  @brief Proxy timeouts and buffering.
 */
struct ProxyConfig {
    std::int32_t connect_timeout{config::constants::PROXY_CONNECT_TIMEOUT_S};
    std::int32_t send_timeout{config::constants::PROXY_SEND_TIMEOUT_S};
    std::int32_t read_timeout{config::constants::PROXY_READ_TIMEOUT_S};
    std::string  body_size{config::constants::PROXY_BODY_SIZE};
    std::string  buffer_size{config::constants::PROXY_BUFFER_SIZE};
    std::int32_t buffers_number{config::constants::PROXY_BUFFERS_NUMBER};
    std::string  next_upstream{config::constants::PROXY_NEXT_UPSTREAM};
    std::int32_t next_upstream_tries{config::constants::PROXY_NEXT_UPSTREAM_TRIES};
    std::string  http_version{config::constants::PROXY_HTTP_VERSION};

    bool operator==(const ProxyConfig&) const = default;
};

/** @struct LogConfig */
struct LogConfig {
    bool access{true};
    bool rewrite{false};

    bool operator==(const LogConfig&) const = default;
};

/**
 * @struct Bundle
 * @brief Everything a resource's annotations resolve to.
 */
struct Bundle {
    // server level
    std::vector<std::string> aliases;
    std::string              server_snippet;
    SSLCipherConfig          ssl_cipher;
    bool                     ssl_passthrough{false};
    CertificateAuthConfig    certificate_auth;

    // backend level
    CanaryConfig             canary;
    AffinityConfig           session_affinity;
    UpstreamHashByConfig     upstream_hash_by;
    std::string              load_balancing;
    bool                     service_upstream{false};

    // location level
    std::string              configuration_snippet;
    RewriteConfig            rewrite;
    RedirectConfig           redirect;
    std::optional<model::Service> default_backend; ///< Custom default backend service
    std::string              backend_protocol{config::constants::BACKEND_PROTOCOL_DEFAULT};
    AuthConfig               basic_digest_auth;
    TracingConfig            tracing;
    bool                     http2_push_preload{false};
    std::optional<ProxyConfig> proxy;              ///< Unset keeps the location's proxy settings
    std::optional<LogConfig>   logs;

    // stream level
    std::string              stream_snippet;

    bool operator==(const Bundle&) const = default;
};

} // namespace ngsynth::annotations
