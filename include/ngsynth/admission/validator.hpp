#pragma once
/**
 * @file validator.hpp
 * @brief Admission-time validation of a candidate routing resource.
 */

#include <cstdint>
#include <span>
#include <string>

#include "ngsynth/annotations/extractor.hpp"
#include "ngsynth/compat/expected.hpp"
#include "ngsynth/config/settings.hpp"
#include "ngsynth/model/configuration.hpp"
#include "ngsynth/model/resource.hpp"
#include "ngsynth/obs/observability.hpp"
#include "ngsynth/synthesis/collaborators.hpp"

namespace ngsynth::admission {

/// Why a candidate was refused.
enum class AdmissionErrc : std::uint8_t {
    Rejected,       ///< Cluster policy forbids the resource as written
    Conflict,       ///< Host+path already served by another resource
    RenderFailure,  ///< Template renderer error, verbatim
    CheckFailure    ///< Syntax checker error, verbatim
};

struct AdmissionError {
    AdmissionErrc code{AdmissionErrc::Rejected};
    std::string   message;
};

using AdmissionResult = ngsynth_detail::expected<void, AdmissionError>;

/**
 * @class AdmissionValidator
 * @brief Rejects a change before it can affect live configuration.
 *
 * Steps: no-op filters, policy checks, default path kinds, candidate set
 * (existing resources with the candidate replacing its prior version), full
 * synthesis, host/path overlap check, optional reduced re-synthesis, render,
 * syntax check, metrics. Policy rejections are not counted in the per-resource
 * error counter; conflicts and render/check failures are.
 */
class AdmissionValidator {
public:
    AdmissionValidator(const synthesis::ResourceStore& store,
                       const synthesis::EndpointResolver& resolver,
                       const synthesis::StreamConfigSource* streams,
                       const annotations::AnnotationExtractor& extractor,
                       const synthesis::TemplateRenderer& renderer,
                       const synthesis::SyntaxChecker& checker,
                       obs::MetricsSink& metrics,
                       config::ControllerConfig controller);

    /// Validate @p candidate; null is accepted as a no-op.
    [[nodiscard]] AdmissionResult check(const model::RoutingResource* candidate) const;

    /// Cluster policy checks on raw annotations (step 2).
    [[nodiscard]] AdmissionResult check_policy(const model::RoutingResource& candidate) const;

    /**
     * @brief Host/path overlap of @p candidate against @p cfg (step 6).
     * @details Only locations owned by other resources and not on the default
     *          backend count. Two resources conflict when neither carries the
     *          canary annotation or both enable it. Canary resources own no
     *          location, so a canary candidate is also compared against the
     *          other canary resources of @p resources.
     */
    [[nodiscard]] static AdmissionResult check_overlap(const model::RoutingResource& candidate,
                                                       const model::Configuration& cfg,
                                                       std::span<const model::RoutingResource> resources);

private:
    const synthesis::ResourceStore&         store_;
    const synthesis::EndpointResolver&      resolver_;
    const synthesis::StreamConfigSource*    streams_;
    const annotations::AnnotationExtractor& extractor_;
    const synthesis::TemplateRenderer&      renderer_;
    const synthesis::SyntaxChecker&         checker_;
    obs::MetricsSink&                       metrics_;
    config::ControllerConfig                controller_;
};

} // namespace ngsynth::admission
