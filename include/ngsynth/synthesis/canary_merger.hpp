#pragma once
/**
 * @file canary_merger.hpp
 * @brief Folds canary backends into the alternative list of their primary backend.
 */

#include <functional>
#include <span>
#include <string>

#include "ngsynth/model/backend.hpp"
#include "ngsynth/model/resource.hpp"
#include "ngsynth/model/server.hpp"
#include "ngsynth/synthesis/diagnostics.hpp"

namespace ngsynth::synthesis {

/**
 * @class CanaryMerger
 * @brief Second pass over the upstream map, run after the ServerBuilder.
 *
 * A canary backend is attached to the primary backend serving the same
 * (host, path, kind), or to any primary of the catch-all server for a canary
 * default backend. Every matching primary receives the alternative, and a
 * primary may collect several. Alternatives that found no primary are removed
 * from the upstream map. A canary backend never becomes a primary.
 */
class CanaryMerger {
public:
    explicit CanaryMerger(DiagnosticLog& diag) noexcept : diag_(diag) {}

    /// Merge every canary resource of @p resources into @p upstreams.
    void merge(std::span<const model::RoutingResource> resources,
               model::BackendMap& upstreams,
               const model::ServerMap& servers) const;

    /// Remove the canary-only backends of @p resources when nothing can host them.
    void drop_orphans(std::span<const model::RoutingResource> resources, model::BackendMap& upstreams) const;

    /// True when at least one resource is not a canary.
    [[nodiscard]] static bool non_canary_exists(std::span<const model::RoutingResource> resources) noexcept;

    /// A primary accepts alternatives unless it is itself canary-only or is @p alt.
    [[nodiscard]] static bool can_merge(const model::Backend& primary, const model::Backend& alt) noexcept {
        return primary.name != alt.name && !primary.no_server;
    }

    /**
     * @brief Attach @p alt to @p primary.
     * @details Idempotent. Unless @p canary_behavior is "legacy", the primary's
     *          session affinity is deep-copied onto the alternative.
     */
    static void attach(model::Backend& primary, model::Backend& alt, const std::string& canary_behavior);

private:
    enum class Outcome { Merged, SelfReference, NoPrimary };

    /// Merge @p alt into every mergeable primary among the locations of @p server matching @p match.
    Outcome merge_into_server(const model::Server& server,
                              model::BackendMap& upstreams,
                              model::Backend& alt,
                              const std::string& canary_behavior,
                              const std::function<bool(const model::Location&)>& match) const;

    DiagnosticLog& diag_;
};

} // namespace ngsynth::synthesis
