#pragma once
/**
 * @file extractor.hpp
 * @brief Resource annotations -> typed Bundle.
 */

#include <memory>
#include <string>
#include <vector>

#include "ngsynth/annotations/bundle.hpp"
#include "ngsynth/annotations/parser.hpp"
#include "ngsynth/annotations/view.hpp"
#include "ngsynth/synthesis/collaborators.hpp"

namespace ngsynth::annotations {

/** @class AnnotationExtractor
 *  @brief Produces the policy bundle of one resource.
 */
class AnnotationExtractor {
public:
    virtual ~AnnotationExtractor() = default;
    virtual Bundle extract(const ResourceView& view) const = 0;
};

/**
 * @class DefaultAnnotationExtractor
 * @brief Runs every built-in parser in a fixed order.
 *
 * A missing annotation is silent; any other parser error is logged as a
 * warning and leaves that parser's fields at their defaults.
 */
class DefaultAnnotationExtractor final : public AnnotationExtractor {
public:
    DefaultAnnotationExtractor(std::string prefix, const synthesis::ResourceStore& store);

    Bundle extract(const ResourceView& view) const override;

    [[nodiscard]] std::size_t parser_count() const noexcept { return parsers_.size(); }

private:
    std::vector<std::unique_ptr<AnnotationParser>> parsers_;
};

/// Re-extract the bundle of every resource in place.
void extract_all(const AnnotationExtractor& extractor, model::ResourceList& resources);

} // namespace ngsynth::annotations
