#pragma once
/**
 * @file parsers.hpp
 * @brief One AnnotationParser per policy.
 * @details Annotation names are relative to the configured prefix, e.g. "canary-weight"
 *          is read from "<prefix>/canary-weight".
 */

#include <string_view>
#include <utility>

#include "ngsynth/annotations/parser.hpp"
#include "ngsynth/synthesis/collaborators.hpp"

namespace ngsynth::annotations {

/// Base of every parser: holds the prefixed reader.
class PrefixedParser : public AnnotationParser {
public:
    explicit PrefixedParser(AnnotationReader reader) : reader_(std::move(reader)) {}

protected:
    AnnotationReader reader_;
};

/// Base of parsers that resolve services or secrets.
class StoreBackedParser : public PrefixedParser {
public:
    StoreBackedParser(AnnotationReader reader, const synthesis::ResourceStore& store)
        : PrefixedParser(std::move(reader)), store_(store) {}

protected:
    const synthesis::ResourceStore& store_;
};

// ---- server level ----------------------------------------------------------

/// server-alias: sorted, de-duplicated hostnames.
class AliasParser final : public PrefixedParser {
public:
    using PrefixedParser::PrefixedParser;
    std::string_view name() const noexcept override { return "aliases"; }
    ngsynth_detail::expected<void, AnnotationError> parse(const ResourceView& view, Bundle& out) const override;
};

/// server-snippet, configuration-snippet, stream-snippet.
class SnippetParser final : public PrefixedParser {
public:
    using PrefixedParser::PrefixedParser;
    std::string_view name() const noexcept override { return "snippets"; }
    ngsynth_detail::expected<void, AnnotationError> parse(const ResourceView& view, Bundle& out) const override;
};

/// ssl-ciphers, ssl-prefer-server-ciphers ("on"/"off").
class SSLCipherParser final : public PrefixedParser {
public:
    using PrefixedParser::PrefixedParser;
    std::string_view name() const noexcept override { return "ssl-ciphers"; }
    ngsynth_detail::expected<void, AnnotationError> parse(const ResourceView& view, Bundle& out) const override;
};

class SSLPassthroughParser final : public PrefixedParser {
public:
    using PrefixedParser::PrefixedParser;
    std::string_view name() const noexcept override { return "ssl-passthrough"; }
    ngsynth_detail::expected<void, AnnotationError> parse(const ResourceView& view, Bundle& out) const override;
};

/// auth-tls-*: client certificate authentication; needs a secret with "ca.crt".
class AuthTLSParser final : public StoreBackedParser {
public:
    using StoreBackedParser::StoreBackedParser;
    std::string_view name() const noexcept override { return "auth-tls"; }
    ngsynth_detail::expected<void, AnnotationError> parse(const ResourceView& view, Bundle& out) const override;
};

// ---- backend level ---------------------------------------------------------

/**
 * @brief canary, canary-weight, canary-weight-total, canary-by-*.
 * @note The tri-state mark is always recorded, even when the rest of the
 *       configuration is rejected (split settings without canary: "true").
 */
class CanaryParser final : public PrefixedParser {
public:
    using PrefixedParser::PrefixedParser;
    std::string_view name() const noexcept override { return "canary"; }
    ngsynth_detail::expected<void, AnnotationError> parse(const ResourceView& view, Bundle& out) const override;
};

/// affinity, affinity-mode, affinity-canary-behavior, session-cookie-*.
class AffinityParser final : public PrefixedParser {
public:
    using PrefixedParser::PrefixedParser;
    std::string_view name() const noexcept override { return "affinity"; }
    ngsynth_detail::expected<void, AnnotationError> parse(const ResourceView& view, Bundle& out) const override;
};

class LoadBalanceParser final : public PrefixedParser {
public:
    using PrefixedParser::PrefixedParser;
    std::string_view name() const noexcept override { return "load-balance"; }
    ngsynth_detail::expected<void, AnnotationError> parse(const ResourceView& view, Bundle& out) const override;
};

/// upstream-hash-by, upstream-hash-by-subset, upstream-hash-by-subset-size.
class UpstreamHashByParser final : public PrefixedParser {
public:
    using PrefixedParser::PrefixedParser;
    std::string_view name() const noexcept override { return "upstream-hash-by"; }
    ngsynth_detail::expected<void, AnnotationError> parse(const ResourceView& view, Bundle& out) const override;
};

class ServiceUpstreamParser final : public PrefixedParser {
public:
    using PrefixedParser::PrefixedParser;
    std::string_view name() const noexcept override { return "service-upstream"; }
    ngsynth_detail::expected<void, AnnotationError> parse(const ResourceView& view, Bundle& out) const override;
};

// ---- location level --------------------------------------------------------

/// rewrite-target, ssl-redirect, force-ssl-redirect, use-regex, app-root.
class RewriteParser final : public PrefixedParser {
public:
    using PrefixedParser::PrefixedParser;
    std::string_view name() const noexcept override { return "rewrite"; }
    ngsynth_detail::expected<void, AnnotationError> parse(const ResourceView& view, Bundle& out) const override;
};

/// permanent-redirect(-code), temporal-redirect, from-to-www-redirect.
class RedirectParser final : public PrefixedParser {
public:
    using PrefixedParser::PrefixedParser;
    std::string_view name() const noexcept override { return "redirect"; }
    ngsynth_detail::expected<void, AnnotationError> parse(const ResourceView& view, Bundle& out) const override;
};

/// default-backend: service name in the resource's namespace.
class DefaultBackendParser final : public StoreBackedParser {
public:
    using StoreBackedParser::StoreBackedParser;
    std::string_view name() const noexcept override { return "default-backend"; }
    ngsynth_detail::expected<void, AnnotationError> parse(const ResourceView& view, Bundle& out) const override;
};

/// backend-protocol; unknown protocols fall back to HTTP with a warning.
class BackendProtocolParser final : public PrefixedParser {
public:
    using PrefixedParser::PrefixedParser;
    std::string_view name() const noexcept override { return "backend-protocol"; }
    ngsynth_detail::expected<void, AnnotationError> parse(const ResourceView& view, Bundle& out) const override;
};

/// auth-type, auth-secret, auth-secret-type, auth-realm.
class AuthParser final : public StoreBackedParser {
public:
    using StoreBackedParser::StoreBackedParser;
    std::string_view name() const noexcept override { return "auth"; }
    ngsynth_detail::expected<void, AnnotationError> parse(const ResourceView& view, Bundle& out) const override;
};

/// enable-opentracing, opentracing-trust-incoming-span.
class TracingParser final : public PrefixedParser {
public:
    using PrefixedParser::PrefixedParser;
    std::string_view name() const noexcept override { return "opentracing"; }
    ngsynth_detail::expected<void, AnnotationError> parse(const ResourceView& view, Bundle& out) const override;
};

class Http2PushPreloadParser final : public PrefixedParser {
public:
    using PrefixedParser::PrefixedParser;
    std::string_view name() const noexcept override { return "http2-push-preload"; }
    ngsynth_detail::expected<void, AnnotationError> parse(const ResourceView& view, Bundle& out) const override;
};

/// proxy-*: overrides on top of the cluster proxy defaults.
class ProxyParser final : public StoreBackedParser {
public:
    using StoreBackedParser::StoreBackedParser;
    std::string_view name() const noexcept override { return "proxy"; }
    ngsynth_detail::expected<void, AnnotationError> parse(const ResourceView& view, Bundle& out) const override;
};

/// enable-access-log, enable-rewrite-log.
class LogParser final : public PrefixedParser {
public:
    using PrefixedParser::PrefixedParser;
    std::string_view name() const noexcept override { return "log"; }
    ngsynth_detail::expected<void, AnnotationError> parse(const ResourceView& view, Bundle& out) const override;
};

} // namespace ngsynth::annotations
