/**
 * @file upstream_parsers.cpp
 * @brief Backend-level annotation parsers: canary, affinity, balancing, hashing, service upstream.
 */
#include "ngsynth/annotations/parsers.hpp"
#include "ngsynth/config/constants.hpp"
#include "ngsynth/obs/observability.hpp"

namespace ngsynth::annotations {

using namespace ngsynth::config::constants;
using Result = ngsynth_detail::expected<void, AnnotationError>;

namespace {

Result fail(AnnotationError e) { return ngsynth_detail::unexpected<AnnotationError>(std::move(e)); }

} // namespace

Result CanaryParser::parse(const ResourceView& view, Bundle& out) const {
    CanaryConfig cfg;

    auto enabled = reader_.get_bool(view, CANARY_ANNOTATION);
    if (enabled) {
        cfg.mark = *enabled ? CanaryMark::Enabled : CanaryMark::Disabled;
        cfg.enabled = *enabled;
    } else if (enabled.error().code == AnnotationErrc::InvalidContent) {
        obs::log().warn("{}/{}: {}", view.namespace_name(), view.name(), enabled.error().message);
    }
    out.canary.mark = cfg.mark;

    if (auto w = reader_.get_int(view, "canary-weight")) cfg.weight = *w;
    if (auto t = reader_.get_int(view, "canary-weight-total"); t && *t > 0) cfg.weight_total = *t;
    if (auto h = reader_.get_string(view, "canary-by-header")) cfg.header = std::move(*h);
    if (auto v = reader_.get_string(view, "canary-by-header-value")) cfg.header_value = std::move(*v);
    if (auto p = reader_.get_string(view, "canary-by-header-pattern")) cfg.header_pattern = std::move(*p);
    if (auto c = reader_.get_string(view, "canary-by-cookie")) cfg.cookie = std::move(*c);

    if (!cfg.enabled && (cfg.weight > 0 || !cfg.header.empty() || !cfg.header_value.empty() ||
                         !cfg.header_pattern.empty() || !cfg.cookie.empty())) {
        return fail({AnnotationErrc::InvalidContent, "canary traffic split configured but canary is not enabled"});
    }

    out.canary = std::move(cfg);
    return {};
}

Result AffinityParser::parse(const ResourceView& view, Bundle& out) const {
    AffinityConfig cfg;
    cfg.mode = std::string(AFFINITY_MODE_DEFAULT);

    if (auto t = reader_.get_string(view, "affinity")) cfg.type = std::move(*t);

    if (auto m = reader_.get_string(view, "affinity-mode")) {
        if (*m == AFFINITY_MODE_DEFAULT || *m == AFFINITY_MODE_PERSISTENT) cfg.mode = std::move(*m);
    }
    if (auto b = reader_.get_string(view, "affinity-canary-behavior")) {
        if (*b == CANARY_BEHAVIOR_LEGACY || *b == "sticky") cfg.canary_behavior = std::move(*b);
    }

    if (cfg.type == AFFINITY_TYPE_COOKIE) {
        auto& c = cfg.cookie;
        c.name = std::string(SESSION_COOKIE_NAME_DEFAULT);
        if (auto v = reader_.get_string(view, "session-cookie-name")) c.name = std::move(*v);
        if (auto v = reader_.get_string(view, "session-cookie-expires")) c.expires = std::move(*v);
        if (auto v = reader_.get_string(view, "session-cookie-max-age")) c.max_age = std::move(*v);
        if (auto v = reader_.get_string(view, "session-cookie-path")) c.path = std::move(*v);
        if (auto v = reader_.get_string(view, "session-cookie-samesite")) c.same_site = std::move(*v);
        if (auto v = reader_.get_bool(view, "session-cookie-secure")) c.secure = *v;
        if (auto v = reader_.get_bool(view, "session-cookie-conditional-samesite-none")) c.conditional_same_site_none = *v;
        if (auto v = reader_.get_bool(view, "session-cookie-change-on-failure")) c.change_on_failure = *v;
    } else if (!cfg.type.empty()) {
        return fail({AnnotationErrc::InvalidContent, "unsupported affinity type " + cfg.type});
    }

    out.session_affinity = std::move(cfg);
    return {};
}

Result LoadBalanceParser::parse(const ResourceView& view, Bundle& out) const {
    auto lb = reader_.get_string(view, "load-balance");
    if (!lb) return fail(std::move(lb.error()));
    out.load_balancing = std::move(*lb);
    return {};
}

Result UpstreamHashByParser::parse(const ResourceView& view, Bundle& out) const {
    auto by = reader_.get_string(view, "upstream-hash-by");
    if (!by) return fail(std::move(by.error()));

    UpstreamHashByConfig cfg;
    cfg.hash_by = std::move(*by);
    if (auto s = reader_.get_bool(view, "upstream-hash-by-subset")) cfg.subset = *s;
    if (auto n = reader_.get_int(view, "upstream-hash-by-subset-size"); n && *n > 0) cfg.subset_size = *n;

    out.upstream_hash_by = std::move(cfg);
    return {};
}

Result ServiceUpstreamParser::parse(const ResourceView& view, Bundle& out) const {
    auto enabled = reader_.get_bool(view, "service-upstream");
    if (!enabled) return fail(std::move(enabled.error()));
    out.service_upstream = *enabled;
    return {};
}

} // namespace ngsynth::annotations
