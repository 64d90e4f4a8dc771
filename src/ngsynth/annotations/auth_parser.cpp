/**
 * @file auth_parser.cpp
 * @brief Basic/digest authentication annotation.
 */
#include "ngsynth/annotations/parsers.hpp"
#include "ngsynth/config/constants.hpp"

namespace ngsynth::annotations {

using namespace ngsynth::config::constants;
using Result = ngsynth_detail::expected<void, AnnotationError>;

Result AuthParser::parse(const ResourceView& view, Bundle& out) const {
    auto type = reader_.get_string(view, "auth-type");
    if (!type) return ngsynth_detail::unexpected<AnnotationError>(std::move(type.error()));
    if (*type != "basic" && *type != "digest") {
        return annotation_error(AnnotationErrc::LocationDenied, "invalid authentication type " + *type);
    }

    std::string secret_type(AUTH_SECRET_TYPE_FILE);
    if (auto st = reader_.get_string(view, "auth-secret-type")) secret_type = std::move(*st);
    if (secret_type != AUTH_SECRET_TYPE_FILE && secret_type != AUTH_SECRET_TYPE_MAP) {
        return annotation_error(AnnotationErrc::LocationDenied,
                                "invalid auth-secret-type " + secret_type + ", must be 'auth-file' or 'auth-map'");
    }

    auto secret_ref = reader_.get_string(view, "auth-secret");
    if (!secret_ref) {
        return annotation_error(AnnotationErrc::LocationDenied,
                                "error reading secret name from annotation: " + secret_ref.error().message);
    }

    // "name" or "namespace/name"
    std::string sns(view.namespace_name());
    std::string sname = *secret_ref;
    if (const auto slash = secret_ref->find('/'); slash != std::string::npos) {
        if (secret_ref->find('/', slash + 1) != std::string::npos) {
            return annotation_error(AnnotationErrc::LocationDenied, "invalid secret reference " + *secret_ref);
        }
        if (slash > 0) sns = secret_ref->substr(0, slash);
        sname = secret_ref->substr(slash + 1);
    }

    const auto key = sns + "/" + sname;
    auto secret = store_.get_secret(key);
    if (!secret) {
        return annotation_error(AnnotationErrc::LocationDenied,
                                "unexpected error reading secret " + key + ": " + secret.error().message);
    }
    if (secret_type == AUTH_SECRET_TYPE_FILE && !secret->contains("auth")) {
        return annotation_error(AnnotationErrc::LocationDenied,
                                "the secret " + key + " does not contain a key with value auth");
    }

    AuthConfig cfg;
    cfg.type = std::move(*type);
    if (auto realm = reader_.get_string(view, "auth-realm")) cfg.realm = std::move(*realm);
    cfg.file = std::string(AUTH_DIRECTORY) + "/" + std::string(view.namespace_name()) + "-" +
               std::string(view.name()) + "-" + sname + ".passwd";
    cfg.secured = true;
    cfg.secret = key;
    cfg.secret_type = std::move(secret_type);

    out.basic_digest_auth = std::move(cfg);
    return {};
}

} // namespace ngsynth::annotations
