/**
 * @file observability.cpp
 * @brief spdlog-backed logger and the in-process metrics sink.
 */
#include "ngsynth/obs/observability.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace ngsynth::obs {

    spdlog::logger& log() {
        static std::shared_ptr<spdlog::logger> logger = [] {
            if (auto existing = spdlog::get(LOGGER_NAME)) return existing;
            return spdlog::stderr_color_mt(LOGGER_NAME);
        }();
        return *logger;
    }

    void SimpleMetricsSink::inc_check_count(const std::string& ns, const std::string& name) {
        std::lock_guard<std::mutex> lk(mu_);
        by_resource_[ns + "/" + name].checks++;
        log().debug(R"({{"metric":"admission_check","resource":"{}/{}"}})", ns, name);
    }

    void SimpleMetricsSink::inc_check_error_count(const std::string& ns, const std::string& name) {
        std::lock_guard<std::mutex> lk(mu_);
        by_resource_[ns + "/" + name].check_errors++;
        log().debug(R"({{"metric":"admission_check_error","resource":"{}/{}"}})", ns, name);
    }

    void SimpleMetricsSink::set_admission_metrics(const AdmissionMetrics& m) {
        std::lock_guard<std::mutex> lk(mu_);
        last_ = m;
        log().debug(R"({{"metric":"admission","tested":{},"test_s":{:.3f},"candidates":{},"prepare_s":{:.3f},"bytes":{},"total_s":{:.3f}}})",
                    m.tested_resources, m.test_seconds, m.candidate_resources,
                    m.prepare_seconds, m.rendered_bytes, m.admission_seconds);
    }

    Counters SimpleMetricsSink::counters(const std::string& key) const {
        std::lock_guard<std::mutex> lk(mu_);
        const auto it = by_resource_.find(key);
        return it == by_resource_.end() ? Counters{} : it->second;
    }

    AdmissionMetrics SimpleMetricsSink::last_admission() const {
        std::lock_guard<std::mutex> lk(mu_);
        return last_;
    }

    std::unique_ptr<SimpleMetricsSink> make_simple_metrics_sink() {
        return std::make_unique<SimpleMetricsSink>();
    }

} // namespace ngsynth::obs
