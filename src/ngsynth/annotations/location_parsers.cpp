/**
 * @file location_parsers.cpp
 * @brief Location-level annotation parsers.
 */
#include "ngsynth/annotations/parsers.hpp"
#include "ngsynth/config/constants.hpp"
#include "ngsynth/obs/observability.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace ngsynth::annotations {

using namespace ngsynth::config::constants;
using Result = ngsynth_detail::expected<void, AnnotationError>;

namespace {

constexpr std::array<std::string_view, 7> VALID_PROTOCOLS{
    "AUTO_HTTP", "HTTP", "HTTPS", "AJP", "GRPC", "GRPCS", "FCGI"};

Result fail(AnnotationError e) { return ngsynth_detail::unexpected<AnnotationError>(std::move(e)); }

/// scheme://host[...], both parts non-empty
bool is_valid_url(std::string_view url) noexcept {
    const auto sep = url.find("://");
    if (sep == std::string_view::npos || sep == 0) return false;
    const auto rest = url.substr(sep + 3);
    return !rest.empty() && rest.front() != '/';
}

} // namespace

Result RewriteParser::parse(const ResourceView& view, Bundle& out) const {
    RewriteConfig cfg;
    if (auto t = reader_.get_string(view, "rewrite-target")) cfg.target = std::move(*t);
    if (auto v = reader_.get_bool(view, "ssl-redirect")) cfg.ssl_redirect = *v;
    if (auto v = reader_.get_bool(view, "force-ssl-redirect")) cfg.force_ssl_redirect = *v;
    if (auto v = reader_.get_bool(view, "use-regex")) cfg.use_regex = *v;

    if (auto root = reader_.get_string(view, "app-root")) {
        if (root->front() == '/') {
            cfg.app_root = std::move(*root);
        } else {
            obs::log().warn("{}/{}: app-root {} must be an absolute path, ignoring",
                            view.namespace_name(), view.name(), *root);
        }
    }

    out.rewrite = std::move(cfg);
    return {};
}

Result RedirectParser::parse(const ResourceView& view, Bundle& out) const {
    RedirectConfig cfg;
    if (auto www = reader_.get_bool(view, "from-to-www-redirect")) cfg.from_to_www = *www;

    if (auto tr = reader_.get_string(view, "temporal-redirect")) {
        if (!is_valid_url(*tr)) {
            return fail({AnnotationErrc::InvalidContent, "temporal-redirect is not a valid URL: " + *tr});
        }
        cfg.url = std::move(*tr);
        cfg.code = REDIRECT_CODE_TEMPORAL;
    } else if (auto pr = reader_.get_string(view, "permanent-redirect")) {
        if (!is_valid_url(*pr)) {
            return fail({AnnotationErrc::InvalidContent, "permanent-redirect is not a valid URL: " + *pr});
        }
        cfg.url = std::move(*pr);
        cfg.code = REDIRECT_CODE_PERMANENT;
        if (auto code = reader_.get_int(view, "permanent-redirect-code");
            code && *code >= REDIRECT_CODE_MIN && *code <= REDIRECT_CODE_MAX) {
            cfg.code = *code;
        }
    }

    out.redirect = std::move(cfg);
    return {};
}

Result DefaultBackendParser::parse(const ResourceView& view, Bundle& out) const {
    auto name = reader_.get_string(view, "default-backend");
    if (!name) return fail(std::move(name.error()));

    const auto key = std::string(view.namespace_name()) + "/" + *name;
    auto svc = store_.get_service(key);
    if (!svc) {
        return fail({AnnotationErrc::LocationDenied, "unexpected error reading service " + key + ": " + svc.error().message});
    }
    out.default_backend = std::move(*svc);
    return {};
}

Result BackendProtocolParser::parse(const ResourceView& view, Bundle& out) const {
    auto proto = reader_.get_string(view, "backend-protocol");
    if (!proto) {
        out.backend_protocol = std::string(BACKEND_PROTOCOL_DEFAULT);
        return {};
    }

    std::string upper(trim(*proto));
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (std::find(VALID_PROTOCOLS.begin(), VALID_PROTOCOLS.end(), upper) == VALID_PROTOCOLS.end()) {
        obs::log().warn("{}/{}: protocol {} is not a valid value for the backend-protocol annotation, using {}",
                        view.namespace_name(), view.name(), upper, BACKEND_PROTOCOL_DEFAULT);
        out.backend_protocol = std::string(BACKEND_PROTOCOL_DEFAULT);
        return {};
    }
    out.backend_protocol = std::move(upper);
    return {};
}

Result TracingParser::parse(const ResourceView& view, Bundle& out) const {
    TracingConfig cfg;
    auto enabled = reader_.get_bool(view, "enable-opentracing");
    if (enabled) {
        cfg.set = true;
        cfg.enabled = *enabled;
        if (auto trust = reader_.get_bool(view, "opentracing-trust-incoming-span")) {
            cfg.trust_set = true;
            cfg.trust_enabled = *trust;
        }
    }
    out.tracing = cfg;
    return {};
}

Result Http2PushPreloadParser::parse(const ResourceView& view, Bundle& out) const {
    auto enabled = reader_.get_bool(view, "http2-push-preload");
    if (!enabled) return fail(std::move(enabled.error()));
    out.http2_push_preload = *enabled;
    return {};
}

Result ProxyParser::parse(const ResourceView& view, Bundle& out) const {
    ProxyConfig cfg = store_.backend_policy().proxy;
    bool any = false;

    const auto read_int = [&](std::string_view name, std::int32_t& slot) {
        if (auto v = reader_.get_int(view, name)) {
            slot = *v;
            any = true;
        }
    };
    const auto read_string = [&](std::string_view name, std::string& slot) {
        if (auto v = reader_.get_string(view, name)) {
            slot = std::move(*v);
            any = true;
        }
    };

    read_int("proxy-connect-timeout", cfg.connect_timeout);
    read_int("proxy-send-timeout", cfg.send_timeout);
    read_int("proxy-read-timeout", cfg.read_timeout);
    read_string("proxy-body-size", cfg.body_size);
    read_string("proxy-buffer-size", cfg.buffer_size);
    read_int("proxy-buffers-number", cfg.buffers_number);
    read_string("proxy-next-upstream", cfg.next_upstream);
    read_int("proxy-next-upstream-tries", cfg.next_upstream_tries);
    read_string("proxy-http-version", cfg.http_version);

    if (!any) return fail({AnnotationErrc::Missing, "no proxy annotation"});
    out.proxy = std::move(cfg);
    return {};
}

Result LogParser::parse(const ResourceView& view, Bundle& out) const {
    auto access = reader_.get_bool(view, "enable-access-log");
    auto rewrite = reader_.get_bool(view, "enable-rewrite-log");
    if (!access && !rewrite) return fail({AnnotationErrc::Missing, "no log annotation"});

    LogConfig cfg;
    if (access) cfg.access = *access;
    if (rewrite) cfg.rewrite = *rewrite;
    out.logs = cfg;
    return {};
}

} // namespace ngsynth::annotations
