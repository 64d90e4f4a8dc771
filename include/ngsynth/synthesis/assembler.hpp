#pragma once
/**
 * @file assembler.hpp
 * @brief Full synthesis pass: resources + cluster state -> Configuration.
 */

#include <chrono>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "ngsynth/config/settings.hpp"
#include "ngsynth/model/configuration.hpp"
#include "ngsynth/model/resource.hpp"
#include "ngsynth/synthesis/collaborators.hpp"
#include "ngsynth/synthesis/diagnostics.hpp"

namespace ngsynth::synthesis {

/** @struct SynthesisResult
 *  @brief Output of one pass.
 */
struct SynthesisResult {
    model::Configuration    configuration;
    std::set<std::string>   hosts;        ///< Every server hostname and alias
    std::vector<Diagnostic> diagnostics;  ///< Degradations recorded during the pass
};

/**
 * @class ConfigurationAssembler
 * @brief Runs the builders in order and normalizes their output.
 *
 * Order: default upstream, UpstreamBuilder, ServerBuilder, CanaryMerger (only
 * when a non-canary resource exists), custom default backends, SSL
 * passthrough, sorting. A pass never fails; see SynthesisResult::diagnostics.
 */
class ConfigurationAssembler {
public:
    using Clock = std::chrono::system_clock;

    /**
     * @param streams Optional stream source; null yields no TCP/UDP endpoints.
     */
    ConfigurationAssembler(const ResourceStore& store,
                           const EndpointResolver& resolver,
                           const StreamConfigSource* streams,
                           config::ControllerConfig controller,
                           Clock::time_point now = Clock::now())
        : store_(store), resolver_(resolver), streams_(streams),
          controller_(std::move(controller)), now_(now) {}

    /**
     * @brief Synthesize a Configuration from @p resources.
     * @param resources Resources with their bundles already extracted; taken by
     *        value because snippets are stripped when the policy disallows them.
     */
    [[nodiscard]] SynthesisResult assemble(model::ResourceList resources) const;

    /// Drop server, configuration and stream snippets from every bundle.
    static void strip_snippets(model::ResourceList& resources) noexcept;

    /// Stable sort: path length descending, ties by path descending.
    static void sort_locations(std::vector<model::Location>& locations);

private:
    /// Synthesize per-location custom default backends and rewire empty owners.
    void add_custom_default_backends(model::BackendMap& upstreams,
                                     model::ServerMap& servers,
                                     DiagnosticLog& diag) const;

    const ResourceStore&      store_;
    const EndpointResolver&   resolver_;
    const StreamConfigSource* streams_;
    config::ControllerConfig  controller_;
    Clock::time_point         now_;
};

} // namespace ngsynth::synthesis
