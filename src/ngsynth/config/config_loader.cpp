/**
 * @file config_loader.cpp
 * @brief yaml-cpp backed loader; every key is optional.
 */
#include "ngsynth/config/config_loader.hpp"
#include "ngsynth/config/constants.hpp"
#include "ngsynth/obs/observability.hpp"
#include "ngsynth/util/checksum.hpp"

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include <set>
#include <string_view>

namespace ngsynth::config {
    using namespace ngsynth::config::constants;

    using LoadResult = ngsynth_detail::expected<SynthConfig, ConfigError>;

    namespace {

        const std::set<std::string_view> CONTROLLER_KEYS{
            "watch-namespace", "disable-catch-all", "disable-full-validation-test",
            "annotations-prefix", "default-path-type", "default-backend-service"};

        const std::set<std::string_view> BACKEND_KEYS{
            "allow-snippet-annotations", "load-balance", "annotation-value-word-blocklist",
            "global-rate-limit-memcached-host", "enable-access-log-for-default-backend",
            "proxy-ssl-location-only", "proxy-connect-timeout", "proxy-send-timeout",
            "proxy-read-timeout", "proxy-body-size", "proxy-buffer-size", "proxy-buffers-number",
            "proxy-next-upstream", "proxy-next-upstream-tries", "proxy-http-version"};

        /// Assign node[key] to @p slot when present; yaml-cpp throws on a bad conversion.
        template <class T>
        void read(const YAML::Node& node, const char* key, T& slot) {
            if (const auto v = node[key]) slot = v.as<T>();
        }

        void warn_unknown(const YAML::Node& node, std::string_view section, const std::set<std::string_view>& known) {
            for (const auto& kv : node) {
                const auto key = kv.first.as<std::string>();
                if (!known.contains(key)) {
                    obs::log().debug("config: ignoring unknown key {}.{}", section, key);
                }
            }
        }

        LoadResult from_node(const YAML::Node& root) {
            auto cfg = Loader::defaults();
            if (!root || root.IsNull()) return cfg;
            if (!root.IsMap()) {
                return ngsynth_detail::unexpected<ConfigError>(
                    ConfigError{ConfigErrc::InvalidValue, "top level of the configuration must be a map"});
            }

            try {
                if (const auto c = root["controller"]) {
                    auto& cc = cfg.controller;
                    read(c, "watch-namespace", cc.watch_namespace);
                    read(c, "disable-catch-all", cc.disable_catch_all);
                    read(c, "disable-full-validation-test", cc.disable_full_validation_test);
                    read(c, "annotations-prefix", cc.annotations_prefix);
                    read(c, "default-backend-service", cc.default_backend_service);
                    if (const auto pt = c["default-path-type"]) {
                        const auto raw = pt.as<std::string>();
                        const auto kind = model::parse_path_kind(raw);
                        if (!kind) {
                            return ngsynth_detail::unexpected<ConfigError>(
                                ConfigError{ConfigErrc::InvalidValue, "controller.default-path-type: unknown path type " + raw});
                        }
                        cc.default_path_kind = *kind;
                    }
                    warn_unknown(c, "controller", CONTROLLER_KEYS);
                }

                if (const auto b = root["backend"]) {
                    auto& bp = cfg.backend;
                    read(b, "allow-snippet-annotations", bp.allow_snippet_annotations);
                    read(b, "load-balance", bp.load_balancing);
                    read(b, "annotation-value-word-blocklist", bp.annotation_value_word_blocklist);
                    read(b, "global-rate-limit-memcached-host", bp.global_rate_limit_memcached_host);
                    read(b, "enable-access-log-for-default-backend", bp.enable_access_log_for_default_backend);
                    read(b, "proxy-ssl-location-only", bp.proxy_ssl_location_only);
                    read(b, "proxy-connect-timeout", bp.proxy.connect_timeout);
                    read(b, "proxy-send-timeout", bp.proxy.send_timeout);
                    read(b, "proxy-read-timeout", bp.proxy.read_timeout);
                    read(b, "proxy-body-size", bp.proxy.body_size);
                    read(b, "proxy-buffer-size", bp.proxy.buffer_size);
                    read(b, "proxy-buffers-number", bp.proxy.buffers_number);
                    read(b, "proxy-next-upstream", bp.proxy.next_upstream);
                    read(b, "proxy-next-upstream-tries", bp.proxy.next_upstream_tries);
                    read(b, "proxy-http-version", bp.proxy.http_version);
                    warn_unknown(b, "backend", BACKEND_KEYS);
                }
            } catch (const YAML::Exception& e) {
                return ngsynth_detail::unexpected<ConfigError>(
                    ConfigError{ConfigErrc::InvalidValue, std::string("invalid configuration value: ") + e.what()});
            }

            cfg.backend.checksum = util::checksum_hex(Loader::canonical(cfg.backend));
            return cfg;
        }

    } // namespace

    SynthConfig Loader::defaults() {
        SynthConfig sc;
        sc.controller = ControllerConfig{};
        sc.backend = BackendPolicy{};
        sc.backend.checksum = util::checksum_hex(canonical(sc.backend));
        return sc;
    }

    std::string Loader::canonical(const BackendPolicy& p) {
        return fmt::format(
            "allow-snippet-annotations={}\nload-balance={}\nannotation-value-word-blocklist={}\n"
            "global-rate-limit-memcached-host={}\nenable-access-log-for-default-backend={}\n"
            "proxy-ssl-location-only={}\nproxy-connect-timeout={}\nproxy-send-timeout={}\n"
            "proxy-read-timeout={}\nproxy-body-size={}\nproxy-buffer-size={}\nproxy-buffers-number={}\n"
            "proxy-next-upstream={}\nproxy-next-upstream-tries={}\nproxy-http-version={}\n",
            p.allow_snippet_annotations, p.load_balancing, p.annotation_value_word_blocklist,
            p.global_rate_limit_memcached_host, p.enable_access_log_for_default_backend,
            p.proxy_ssl_location_only, p.proxy.connect_timeout, p.proxy.send_timeout,
            p.proxy.read_timeout, p.proxy.body_size, p.proxy.buffer_size, p.proxy.buffers_number,
            p.proxy.next_upstream, p.proxy.next_upstream_tries, p.proxy.http_version);
    }

    LoadResult Loader::load_from_file(const std::string& path) {
        YAML::Node root;
        try {
            root = YAML::LoadFile(path);
        } catch (const YAML::BadFile& e) {
            return ngsynth_detail::unexpected<ConfigError>(
                ConfigError{ConfigErrc::FileNotFound, "cannot open " + path + ": " + e.what()});
        } catch (const YAML::Exception& e) {
            return ngsynth_detail::unexpected<ConfigError>(
                ConfigError{ConfigErrc::ParseError, path + ": " + e.what()});
        }
        return from_node(root);
    }

    LoadResult Loader::load_from_string(const std::string& text) {
        YAML::Node root;
        try {
            root = YAML::Load(text);
        } catch (const YAML::Exception& e) {
            return ngsynth_detail::unexpected<ConfigError>(ConfigError{ConfigErrc::ParseError, e.what()});
        }
        return from_node(root);
    }

} // namespace ngsynth::config
