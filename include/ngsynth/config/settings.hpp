#pragma once
/**
 * @file settings.hpp
 * @brief Cluster-wide backend policy and controller flags consumed by synthesis/admission.
 * @details All defaults reference named constants to avoid magic values.
 */

#include <cstdint>
#include <string>

#include "ngsynth/annotations/bundle.hpp"
#include "ngsynth/config/constants.hpp"
#include "ngsynth/model/resource.hpp"

namespace ngsynth::config {

    /** @struct BackendPolicy
     *  @brief Cluster-wide backend configuration (the global configmap).
     */
    struct BackendPolicy {
        bool        allow_snippet_annotations{constants::ALLOW_SNIPPET_ANNOTATIONS};
        std::string load_balancing{constants::LOAD_BALANCE_DEFAULT};          ///< Fallback algorithm
        std::string annotation_value_word_blocklist;                          ///< Comma separated
        std::string global_rate_limit_memcached_host;
        bool        enable_access_log_for_default_backend{constants::ACCESS_LOG_FOR_DEFAULT_BACKEND};
        bool        proxy_ssl_location_only{constants::PROXY_SSL_LOCATION_ONLY};
        annotations::ProxyConfig proxy;                                       ///< Defaults for the catch-all location
        std::string checksum;                                                 ///< Content checksum of this section

        bool operator==(const BackendPolicy&) const = default;
    };

    /** @struct ControllerConfig
     *  @brief Process-level flags (command line in a full controller).
     */
    struct ControllerConfig {
        std::string     watch_namespace;                 ///< Empty watches every namespace
        bool            disable_catch_all{false};
        bool            disable_full_validation_test{false};
        std::string     annotations_prefix{constants::DEFAULT_ANNOTATIONS_PREFIX};
        model::PathKind default_path_kind{model::PathKind::Prefix};
        std::string     default_backend_service;         ///< "namespace/name"; empty for the local fallback

        bool operator==(const ControllerConfig&) const = default;
    };

} // namespace ngsynth::config
