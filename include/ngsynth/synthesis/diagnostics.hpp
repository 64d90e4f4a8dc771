#pragma once
/**
 * @file diagnostics.hpp
 * @brief Degraded-result values and the per-pass diagnostic log.
 * @details Synthesis never fails: when a lookup cannot be satisfied the builders
 *          substitute a default and record a Diagnostic. Tests assert on the
 *          recorded diagnostics instead of scraping log output.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ngsynth::synthesis {

/// Severity of a diagnostic; mirrors the log level it is emitted at.
enum class Severity : std::uint8_t { Info, Warning, Error };

/** @struct Diagnostic
 *  @brief One recorded deviation from the requested configuration.
 */
struct Diagnostic {
    Severity    severity{Severity::Warning};
    std::string subject;   ///< What it is about: a hostname, backend name or resource key
    std::string message;

    bool operator==(const Diagnostic&) const = default;
};

/**
 * @brief A value together with the diagnostic explaining why it is a substitute.
 * @tparam T Resolved value type.
 */
template <class T>
struct Resolution {
    T                         value{};
    std::optional<Diagnostic> diagnostic;

    /// True when @ref value is a fallback rather than what was asked for.
    [[nodiscard]] bool degraded() const noexcept { return diagnostic.has_value(); }
};

/** @class DiagnosticLog
 *  @brief Collects diagnostics for one pass and forwards them to the project logger.
 */
class DiagnosticLog {
public:
    void info(std::string subject, std::string message);
    void warn(std::string subject, std::string message);
    void error(std::string subject, std::string message);

    /// Record an already-built diagnostic (e.g. from a Resolution).
    void record(Diagnostic d);

    [[nodiscard]] const std::vector<Diagnostic>& entries() const noexcept { return entries_; }

    /// Count entries of @p severity whose subject equals @p subject.
    [[nodiscard]] std::size_t count(Severity severity, std::string_view subject) const noexcept;

    /// Move the recorded entries out, leaving the log empty.
    [[nodiscard]] std::vector<Diagnostic> take() noexcept { return std::exchange(entries_, {}); }

private:
    std::vector<Diagnostic> entries_;
};

} // namespace ngsynth::synthesis
