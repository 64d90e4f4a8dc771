/**
 * @file diagnostics.cpp
 * @brief DiagnosticLog: record + forward to spdlog.
 */
#include "ngsynth/synthesis/diagnostics.hpp"
#include "ngsynth/obs/observability.hpp"

#include <algorithm>

namespace ngsynth::synthesis {

void DiagnosticLog::info(std::string subject, std::string message) {
    record(Diagnostic{Severity::Info, std::move(subject), std::move(message)});
}

void DiagnosticLog::warn(std::string subject, std::string message) {
    record(Diagnostic{Severity::Warning, std::move(subject), std::move(message)});
}

void DiagnosticLog::error(std::string subject, std::string message) {
    record(Diagnostic{Severity::Error, std::move(subject), std::move(message)});
}

void DiagnosticLog::record(Diagnostic d) {
    switch (d.severity) {
        case Severity::Info:    obs::log().debug("{}: {}", d.subject, d.message); break;
        case Severity::Warning: obs::log().warn("{}: {}", d.subject, d.message);  break;
        case Severity::Error:   obs::log().error("{}: {}", d.subject, d.message); break;
    }
    entries_.push_back(std::move(d));
}

std::size_t DiagnosticLog::count(Severity severity, std::string_view subject) const noexcept {
    return static_cast<std::size_t>(std::count_if(entries_.begin(), entries_.end(),
        [&](const Diagnostic& d) { return d.severity == severity && d.subject == subject; }));
}

} // namespace ngsynth::synthesis
