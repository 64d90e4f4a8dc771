/**
 * @file validator.cpp
 * @brief Admission state machine.
 */
#include "ngsynth/admission/validator.hpp"
#include "ngsynth/annotations/parser.hpp"
#include "ngsynth/config/constants.hpp"
#include "ngsynth/synthesis/assembler.hpp"

#include <algorithm>
#include <chrono>
#include <string_view>
#include <utility>
#include <vector>

namespace ngsynth::admission {

using namespace ngsynth::config::constants;
using Clock = std::chrono::steady_clock;

namespace {

ngsynth_detail::unexpected<AdmissionError> reject(AdmissionErrc code, std::string message) {
    return ngsynth_detail::unexpected<AdmissionError>(AdmissionError{code, std::move(message)});
}

double seconds_since(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

bool starts_with(std::string_view s, std::string_view prefix) noexcept {
    return s.substr(0, prefix.size()) == prefix;
}

bool ends_with(std::string_view s, std::string_view suffix) noexcept {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

/// Comma separated, trimmed, empty words dropped.
std::vector<std::string> split_words(std::string_view list) {
    std::vector<std::string> words;
    while (!list.empty()) {
        const auto comma = list.find(',');
        const auto word = annotations::trim(list.substr(0, comma));
        if (!word.empty()) words.emplace_back(word);
        if (comma == std::string_view::npos) break;
        list.remove_prefix(comma + 1);
    }
    return words;
}

} // namespace

AdmissionValidator::AdmissionValidator(const synthesis::ResourceStore& store,
                                       const synthesis::EndpointResolver& resolver,
                                       const synthesis::StreamConfigSource* streams,
                                       const annotations::AnnotationExtractor& extractor,
                                       const synthesis::TemplateRenderer& renderer,
                                       const synthesis::SyntaxChecker& checker,
                                       obs::MetricsSink& metrics,
                                       config::ControllerConfig controller)
    : store_(store), resolver_(resolver), streams_(streams), extractor_(extractor),
      renderer_(renderer), checker_(checker), metrics_(metrics), controller_(std::move(controller)) {}

AdmissionResult AdmissionValidator::check_policy(const model::RoutingResource& candidate) const {
    const auto& policy = store_.backend_policy();
    const auto prefix = controller_.annotations_prefix + "/";

    if (controller_.disable_catch_all && candidate.default_backend) {
        return reject(AdmissionErrc::Rejected,
                      "this deployment is trying to create a catch-all resource while catch-all is disabled");
    }

    if (controller_.annotations_prefix != DEFAULT_ANNOTATIONS_PREFIX) {
        const auto default_prefix = std::string(DEFAULT_ANNOTATIONS_PREFIX) + "/";
        for (const auto& [key, value] : candidate.annotations) {
            if (starts_with(key, default_prefix)) {
                return reject(AdmissionErrc::Rejected,
                              "this deployment has a custom annotation prefix defined: use '" +
                              controller_.annotations_prefix + "' instead of '" +
                              std::string(DEFAULT_ANNOTATIONS_PREFIX) + "'");
            }
        }
    }

    const auto blocklist = split_words(policy.annotation_value_word_blocklist);
    if (!blocklist.empty()) {
        for (const auto& [key, value] : candidate.annotations) {
            if (!starts_with(key, prefix)) continue;
            for (const auto& word : blocklist) {
                if (value.find(word) != std::string::npos) {
                    return reject(AdmissionErrc::Rejected,
                                  "annotation " + key + " contains the blocked word '" + word + "'");
                }
            }
        }
    }

    if (!policy.allow_snippet_annotations) {
        for (const auto& [key, value] : candidate.annotations) {
            if (ends_with(key, SNIPPET_ANNOTATION_SUFFIX)) {
                return reject(AdmissionErrc::Rejected,
                              key + " annotation cannot be used: snippet directives are disabled by the administrator");
            }
        }
    }

    if (policy.global_rate_limit_memcached_host.empty()) {
        const auto rate_limit = prefix + std::string(GLOBAL_RATE_LIMIT_ANNOTATION);
        for (const auto& [key, value] : candidate.annotations) {
            if (starts_with(key, rate_limit)) {
                return reject(AdmissionErrc::Rejected,
                              "'" + key + "' is configured but 'global-rate-limit-memcached-host' is not set");
            }
        }
    }
    return {};
}

AdmissionResult AdmissionValidator::check_overlap(const model::RoutingResource& candidate,
                                                  const model::Configuration& cfg,
                                                  std::span<const model::RoutingResource> resources) {
    const auto candidate_key = candidate.key();
    const auto candidate_mark = candidate.parsed.canary.mark;

    const auto conflict = [](const std::string& host, const std::string& path, const std::string& owner) {
        return reject(AdmissionErrc::Conflict, "host \"" + host + "\" and path \"" + path +
                                               "\" is already defined in routing resource " + owner);
    };

    // two canaries on one host+path
    if (candidate_mark == annotations::CanaryMark::Enabled) {
        for (const auto& other : resources) {
            if (other.parsed.canary.mark != annotations::CanaryMark::Enabled) continue;
            if (other.key() == candidate_key) continue;

            for (const auto& rule : candidate.rules) {
                if (!rule.http) continue;
                const auto host = model::rule_host(rule);
                for (const auto& other_rule : other.rules) {
                    if (!other_rule.http || model::rule_host(other_rule) != host) continue;
                    for (const auto& path : rule.http->paths) {
                        const auto nginx_path = model::location_path(path);
                        for (const auto& other_path : other_rule.http->paths) {
                            if (model::location_path(other_path) == nginx_path) {
                                return conflict(host, nginx_path, other.key());
                            }
                        }
                    }
                }
            }
        }
    }

    for (const auto& rule : candidate.rules) {
        if (!rule.http) continue;
        const auto host = model::rule_host(rule);

        const auto server = std::find_if(cfg.servers.begin(), cfg.servers.end(),
                                         [&](const model::Server& s) { return s.hostname == host; });
        if (server == cfg.servers.end()) continue;

        for (const auto& path : rule.http->paths) {
            const auto nginx_path = model::location_path(path);

            for (const auto& loc : server->locations) {
                if (loc.path != nginx_path || loc.is_def_backend || !loc.owner) continue;
                if (loc.owner->key() == candidate_key) continue;

                const auto existing_mark = loc.owner->canary;
                const bool both_canary = candidate_mark == annotations::CanaryMark::Enabled &&
                                         existing_mark == annotations::CanaryMark::Enabled;
                const bool neither_marked = candidate_mark == annotations::CanaryMark::Missing &&
                                            existing_mark == annotations::CanaryMark::Missing;
                if (both_canary || neither_marked) return conflict(host, nginx_path, loc.owner->key());
            }
        }
    }
    return {};
}

AdmissionResult AdmissionValidator::check(const model::RoutingResource* candidate) const {
    const auto start = Clock::now();

    if (candidate == nullptr) return {};
    if (candidate->deletion_marked) {
        obs::log().debug("resource {} is being deleted, skipping validation", candidate->key());
        return {};
    }
    if (!controller_.watch_namespace.empty() && candidate->namespace_name != controller_.watch_namespace) {
        obs::log().warn("resource {} is outside the watched namespace {}, skipping validation",
                        candidate->key(), controller_.watch_namespace);
        return {};
    }

    if (auto policy = check_policy(*candidate); !policy) {
        obs::log().warn("rejecting resource {}: {}", candidate->key(), policy.error().message);
        return policy;
    }

    model::RoutingResource prepared = *candidate;
    for (auto& rule : prepared.rules) {
        if (!rule.http) continue;
        for (auto& path : rule.http->paths) {
            if (!path.kind) path.kind = controller_.default_path_kind;
        }
    }
    prepared.parsed = extractor_.extract(annotations::RoutingResourceView(prepared));

    const auto prepared_key = prepared.key();
    auto candidates = store_.list_routing_resources();
    std::erase_if(candidates, [&](const model::RoutingResource& r) { return r.key() == prepared_key; });
    candidates.push_back(prepared);

    const double prepare_seconds = seconds_since(start);
    const auto test_start = Clock::now();

    const synthesis::ConfigurationAssembler assembler(store_, resolver_, streams_, controller_);
    auto synthesized = assembler.assemble(candidates);

    if (auto overlap = check_overlap(prepared, synthesized.configuration, candidates); !overlap) {
        metrics_.inc_check_error_count(prepared.namespace_name, prepared.name);
        obs::log().warn("rejecting resource {}: {}", prepared_key, overlap.error().message);
        return overlap;
    }

    std::size_t tested = candidates.size();
    if (controller_.disable_full_validation_test) {
        synthesized = assembler.assemble(model::ResourceList{prepared});
        tested = 1;
    }

    auto rendered = renderer_.render(store_.backend_policy(), synthesized.configuration);
    if (!rendered) {
        metrics_.inc_check_error_count(prepared.namespace_name, prepared.name);
        return reject(AdmissionErrc::RenderFailure, rendered.error());
    }

    if (auto syntax = checker_.check(*rendered); !syntax) {
        metrics_.inc_check_error_count(prepared.namespace_name, prepared.name);
        return reject(AdmissionErrc::CheckFailure, syntax.error());
    }

    const double test_seconds = seconds_since(test_start);
    metrics_.inc_check_count(prepared.namespace_name, prepared.name);
    metrics_.set_admission_metrics(obs::AdmissionMetrics{
        .tested_resources    = static_cast<double>(tested),
        .test_seconds        = test_seconds,
        .candidate_resources = static_cast<double>(candidates.size()),
        .prepare_seconds     = prepare_seconds,
        .rendered_bytes      = static_cast<double>(rendered->size()),
        .admission_seconds   = seconds_since(start),
    });

    obs::log().debug("resource {} accepted ({} resources tested, {} bytes rendered)",
                     prepared_key, tested, rendered->size());
    return {};
}

} // namespace ngsynth::admission
