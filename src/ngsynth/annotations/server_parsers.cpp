/**
 * @file server_parsers.cpp
 * @brief Server-level annotation parsers: aliases, snippets, ciphers, passthrough, client auth.
 */
#include "ngsynth/annotations/parsers.hpp"
#include "ngsynth/config/constants.hpp"
#include "ngsynth/obs/observability.hpp"

#include <algorithm>
#include <array>
#include <set>

namespace ngsynth::annotations {

using namespace ngsynth::config::constants;
using Result = ngsynth_detail::expected<void, AnnotationError>;

namespace {

constexpr std::array<std::string_view, 4> VALID_VERIFY_CLIENT{"on", "off", "optional", "optional_no_ca"};

Result fail(AnnotationError e) { return ngsynth_detail::unexpected<AnnotationError>(std::move(e)); }

} // namespace

Result AliasParser::parse(const ResourceView& view, Bundle& out) const {
    auto list = reader_.get_list(view, "server-alias");
    if (!list) return fail(std::move(list.error()));

    const std::set<std::string> uniq(list->begin(), list->end());
    out.aliases.assign(uniq.begin(), uniq.end());
    return {};
}

Result SnippetParser::parse(const ResourceView& view, Bundle& out) const {
    if (auto s = reader_.get_string(view, "server-snippet")) out.server_snippet = std::move(*s);
    if (auto s = reader_.get_string(view, "configuration-snippet")) out.configuration_snippet = std::move(*s);
    if (auto s = reader_.get_string(view, "stream-snippet")) out.stream_snippet = std::move(*s);
    return {};
}

Result SSLCipherParser::parse(const ResourceView& view, Bundle& out) const {
    SSLCipherConfig cfg;
    if (auto c = reader_.get_string(view, "ssl-ciphers")) cfg.ciphers = std::move(*c);

    auto prefer = reader_.get_bool(view, "ssl-prefer-server-ciphers");
    if (prefer) {
        cfg.prefer_server_ciphers = *prefer ? "on" : "off";
    } else if (prefer.error().code != AnnotationErrc::Missing) {
        return fail(std::move(prefer.error()));
    }

    out.ssl_cipher = std::move(cfg);
    return {};
}

Result SSLPassthroughParser::parse(const ResourceView& view, Bundle& out) const {
    auto enabled = reader_.get_bool(view, "ssl-passthrough");
    if (!enabled) return fail(std::move(enabled.error()));
    out.ssl_passthrough = *enabled;
    return {};
}

Result AuthTLSParser::parse(const ResourceView& view, Bundle& out) const {
    auto secret = reader_.get_string(view, "auth-tls-secret");
    if (!secret) return fail(std::move(secret.error()));

    const std::string ns(view.namespace_name());
    const auto key = secret->find('/') == std::string::npos ? ns + "/" + *secret : *secret;

    CertificateAuthConfig cfg;
    cfg.secret = key;
    cfg.verify_client = std::string(AUTH_TLS_VERIFY_CLIENT_DEFAULT);
    cfg.verify_depth = AUTH_TLS_VERIFY_DEPTH_DEFAULT;

    if (auto v = reader_.get_string(view, "auth-tls-verify-client")) {
        if (std::find(VALID_VERIFY_CLIENT.begin(), VALID_VERIFY_CLIENT.end(), *v) != VALID_VERIFY_CLIENT.end()) {
            cfg.verify_client = std::move(*v);
        } else {
            obs::log().warn("{}/{}: invalid auth-tls-verify-client value {}, using {}",
                            view.namespace_name(), view.name(), *v, AUTH_TLS_VERIFY_CLIENT_DEFAULT);
        }
    }
    if (auto d = reader_.get_int(view, "auth-tls-verify-depth"); d && *d > 0) cfg.verify_depth = *d;
    if (auto e = reader_.get_string(view, "auth-tls-error-page")) cfg.auth_tls_error = std::move(*e);

    auto s = store_.get_secret(key);
    if (!s) {
        return fail({AnnotationErrc::LocationDenied, "error obtaining client CA secret " + key + ": " + s.error().message});
    }
    if (s->contains("ca.crt")) {
        cfg.ca_file_name = std::string(SSL_DIRECTORY) + "/ca-" + s->namespace_name + "-" + s->name + ".pem";
    }

    out.certificate_auth = std::move(cfg);
    return {};
}

} // namespace ngsynth::annotations
