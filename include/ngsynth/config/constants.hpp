#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the synthesis pipeline.
 * @details These values eliminate magic strings/numbers from the codebase. Override the
 *          overridable ones via the Config Loader (YAML) in production deployments.
 */

#include <cstdint>
#include <string_view>

namespace ngsynth::config::constants {

// =====================
// Reserved identities
// =====================
/// Hostname of the catch-all server.
inline constexpr std::string_view DEFAULT_SERVER_NAME   = "_";
/// Path of the root location every server starts with.
inline constexpr std::string_view ROOT_LOCATION         = "/";
/// Key of the default backend; never produced by a service reference.
inline constexpr std::string_view DEFAULT_UPSTREAM_NAME = "upstream-default-backend";
/// Prefix of upstreams synthesized from a per-location default-backend annotation.
inline constexpr std::string_view CUSTOM_DEFAULT_BACKEND_PREFIX = "custom-default-backend-";

// =====================
// Annotations
// =====================
inline constexpr std::string_view DEFAULT_ANNOTATIONS_PREFIX = "nginx.ingress.kubernetes.io";
inline constexpr std::string_view SNIPPET_ANNOTATION_SUFFIX  = "-snippet";
inline constexpr std::string_view GLOBAL_RATE_LIMIT_ANNOTATION = "global-rate-limit";
inline constexpr std::string_view CANARY_ANNOTATION          = "canary";
/// Canary behavior that keeps the alternative backend's own affinity.
inline constexpr std::string_view CANARY_BEHAVIOR_LEGACY     = "legacy";

inline constexpr int32_t          CANARY_WEIGHT_TOTAL_DEFAULT  = 100;
inline constexpr int32_t          UPSTREAM_HASH_SUBSET_SIZE    = 3;
inline constexpr std::string_view SESSION_COOKIE_NAME_DEFAULT  = "INGRESSCOOKIE";
inline constexpr std::string_view AFFINITY_MODE_DEFAULT        = "balanced";
inline constexpr std::string_view AFFINITY_TYPE_COOKIE         = "cookie";
inline constexpr std::string_view BACKEND_PROTOCOL_DEFAULT     = "HTTP";
inline constexpr std::string_view AUTH_SECRET_TYPE_FILE        = "auth-file";
inline constexpr std::string_view AUTH_SECRET_TYPE_MAP         = "auth-map";
inline constexpr std::string_view AUTH_DIRECTORY               = "/etc/ingress-controller/auth";
inline constexpr std::string_view SSL_DIRECTORY                = "/etc/ingress-controller/ssl";
inline constexpr std::string_view AUTH_TLS_VERIFY_CLIENT_DEFAULT = "on";
inline constexpr int32_t          AUTH_TLS_VERIFY_DEPTH_DEFAULT  = 1;
inline constexpr std::string_view AFFINITY_MODE_PERSISTENT     = "persistent";
inline constexpr int32_t          REDIRECT_CODE_PERMANENT      = 301;
inline constexpr int32_t          REDIRECT_CODE_TEMPORAL       = 302;
inline constexpr int32_t          REDIRECT_CODE_MIN            = 300;
inline constexpr int32_t          REDIRECT_CODE_MAX            = 308;

// =====================
// Backend policy defaults (cluster-wide configmap)
// =====================
inline constexpr std::string_view LOAD_BALANCE_DEFAULT          = "round_robin";
inline constexpr bool             ALLOW_SNIPPET_ANNOTATIONS     = true;
inline constexpr bool             ACCESS_LOG_FOR_DEFAULT_BACKEND = false;
inline constexpr bool             PROXY_SSL_LOCATION_ONLY       = false;
inline constexpr int32_t          PROXY_CONNECT_TIMEOUT_S       = 5;
inline constexpr int32_t          PROXY_SEND_TIMEOUT_S          = 60;
inline constexpr int32_t          PROXY_READ_TIMEOUT_S          = 60;
inline constexpr std::string_view PROXY_BODY_SIZE               = "1m";
inline constexpr std::string_view PROXY_BUFFER_SIZE             = "4k";
inline constexpr int32_t          PROXY_BUFFERS_NUMBER          = 4;
inline constexpr std::string_view PROXY_NEXT_UPSTREAM           = "error timeout";
inline constexpr int32_t          PROXY_NEXT_UPSTREAM_TRIES     = 3;
inline constexpr std::string_view PROXY_HTTP_VERSION            = "1.1";

// =====================
// Default backend fallback (served locally when no endpoint resolves)
// =====================
inline constexpr std::string_view DEFAULT_BACKEND_FALLBACK_ADDRESS = "127.0.0.1";
inline constexpr int32_t          DEFAULT_BACKEND_FALLBACK_PORT    = 8181;

// =====================
// TLS
// =====================
/// Certificates expiring within this window raise a warning (10 days).
inline constexpr int32_t CERT_EXPIRY_WARNING_HOURS = 240;

// =====================
// Checksum
// =====================
inline constexpr uint64_t CHECKSUM_SEED_DEFAULT = 0xA17A5EEDULL; ///< Deterministic hash salt

} // namespace ngsynth::config::constants
