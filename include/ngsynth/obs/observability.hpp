#pragma once
/**
 * @file observability.hpp
 * @brief Observability facade: project logger + admission metrics sink.
 * @details Logging goes through spdlog; metrics go to a MetricsSink the embedding
 *          process provides (an in-process counter sink is available for tests/tools).
 */

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <spdlog/spdlog.h>

namespace ngsynth::obs {

    /// Name of the shared spdlog logger.
    inline constexpr const char* LOGGER_NAME = "ngsynth";

    /// Project logger (created on first use, writes to stderr).
    spdlog::logger& log();

    /** @struct AdmissionMetrics
     *  @brief Timing/size breakdown of one successful admission check.
     */
    struct AdmissionMetrics {
        double tested_resources{0};    ///< Resources in the configuration that was rendered
        double test_seconds{0};        ///< Synthesis + render + syntax check
        double candidate_resources{0}; ///< Resources in the full candidate set
        double prepare_seconds{0};     ///< Policy checks and candidate set preparation
        double rendered_bytes{0};      ///< Size of the rendered artifact
        double admission_seconds{0};   ///< End-to-end check time
    };

    /** @struct Counters
     *  @brief Per-resource admission outcomes.
     */
    struct Counters {
        uint64_t checks{0};        ///< Accepted checks
        uint64_t check_errors{0};  ///< Rejected checks (conflict/render/syntax)
    };

    /** @class MetricsSink
     *  @brief Admission metrics sink interface.
     */
    class MetricsSink {
    public:
        virtual ~MetricsSink() = default;
        /// Count an accepted check for namespace/name.
        virtual void inc_check_count(const std::string& ns, const std::string& name) = 0;
        /// Count a rejected check for namespace/name.
        virtual void inc_check_error_count(const std::string& ns, const std::string& name) = 0;
        /// Record the timing breakdown of the latest accepted check.
        virtual void set_admission_metrics(const AdmissionMetrics& m) = 0;
    };

    /** @class SimpleMetricsSink
     *  @brief Mutex-guarded in-process sink; logs every update at debug level.
     */
    class SimpleMetricsSink final : public MetricsSink {
    public:
        void inc_check_count(const std::string& ns, const std::string& name) override;
        void inc_check_error_count(const std::string& ns, const std::string& name) override;
        void set_admission_metrics(const AdmissionMetrics& m) override;

        /// Counters for "namespace/name"; zeroes when never seen.
        Counters counters(const std::string& key) const;
        /// Last recorded timing set.
        AdmissionMetrics last_admission() const;

    private:
        mutable std::mutex mu_;
        std::map<std::string, Counters> by_resource_;
        AdmissionMetrics last_{};
    };

    // Factory (implemented in .cpp)
    std::unique_ptr<SimpleMetricsSink> make_simple_metrics_sink();

} // namespace ngsynth::obs
