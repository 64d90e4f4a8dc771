/**
 * @file extractor.cpp
 * @brief Parser registry and extraction loop.
 */
#include "ngsynth/annotations/extractor.hpp"
#include "ngsynth/annotations/parsers.hpp"
#include "ngsynth/obs/observability.hpp"

namespace ngsynth::annotations {

DefaultAnnotationExtractor::DefaultAnnotationExtractor(std::string prefix, const synthesis::ResourceStore& store) {
    const AnnotationReader reader(std::move(prefix));

    // server level
    parsers_.push_back(std::make_unique<AliasParser>(reader));
    parsers_.push_back(std::make_unique<SnippetParser>(reader));
    parsers_.push_back(std::make_unique<SSLCipherParser>(reader));
    parsers_.push_back(std::make_unique<SSLPassthroughParser>(reader));
    parsers_.push_back(std::make_unique<AuthTLSParser>(reader, store));
    // backend level
    parsers_.push_back(std::make_unique<CanaryParser>(reader));
    parsers_.push_back(std::make_unique<AffinityParser>(reader));
    parsers_.push_back(std::make_unique<LoadBalanceParser>(reader));
    parsers_.push_back(std::make_unique<UpstreamHashByParser>(reader));
    parsers_.push_back(std::make_unique<ServiceUpstreamParser>(reader));
    // location level
    parsers_.push_back(std::make_unique<RewriteParser>(reader));
    parsers_.push_back(std::make_unique<RedirectParser>(reader));
    parsers_.push_back(std::make_unique<DefaultBackendParser>(reader, store));
    parsers_.push_back(std::make_unique<BackendProtocolParser>(reader));
    parsers_.push_back(std::make_unique<AuthParser>(reader, store));
    parsers_.push_back(std::make_unique<TracingParser>(reader));
    parsers_.push_back(std::make_unique<Http2PushPreloadParser>(reader));
    parsers_.push_back(std::make_unique<ProxyParser>(reader, store));
    parsers_.push_back(std::make_unique<LogParser>(reader));
}

Bundle DefaultAnnotationExtractor::extract(const ResourceView& view) const {
    Bundle bundle;
    for (const auto& parser : parsers_) {
        auto r = parser->parse(view, bundle);
        if (!r && r.error().code != AnnotationErrc::Missing) {
            obs::log().warn("{}/{}: error parsing {} annotations: {}",
                            view.namespace_name(), view.name(), parser->name(), r.error().message);
        }
    }
    return bundle;
}

void extract_all(const AnnotationExtractor& extractor, model::ResourceList& resources) {
    for (auto& res : resources) {
        res.parsed = extractor.extract(RoutingResourceView(res));
    }
}

} // namespace ngsynth::annotations
