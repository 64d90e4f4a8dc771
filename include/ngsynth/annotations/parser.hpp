#pragma once
/**
 * @file parser.hpp
 * @brief Typed access to prefixed annotations and the per-policy parser interface.
 */

#include <cstdint>
#include <string>
#include <utility>
#include <string_view>
#include <vector>

#include "ngsynth/annotations/bundle.hpp"
#include "ngsynth/annotations/view.hpp"
#include "ngsynth/compat/expected.hpp"

namespace ngsynth::annotations {

/// Why an annotation could not be used.
enum class AnnotationErrc : std::uint8_t {
    Missing,         ///< Annotation not present on the resource
    InvalidContent,  ///< Present but not parseable as the requested type
    LocationDenied   ///< Parseable, but the policy cannot be applied (bad secret, bad type...)
};

struct AnnotationError {
    AnnotationErrc code{AnnotationErrc::Missing};
    std::string    message;
};

template <class T>
using Parsed = ngsynth_detail::expected<T, AnnotationError>;

/// Shorthand used by parsers to fail with @p code.
[[nodiscard]] inline ngsynth_detail::unexpected<AnnotationError>
annotation_error(AnnotationErrc code, std::string message) {
    return ngsynth_detail::unexpected<AnnotationError>(AnnotationError{code, std::move(message)});
}

/**
 * @class AnnotationReader
 * @brief Reads "<prefix>/<name>" annotations as strings, booleans, integers and lists.
 */
class AnnotationReader {
public:
    explicit AnnotationReader(std::string prefix) : prefix_(std::move(prefix)) {}

    /// Full annotation key for @p name.
    [[nodiscard]] std::string key(std::string_view name) const;

    [[nodiscard]] const std::string& prefix() const noexcept { return prefix_; }

    /// Present and non-empty.
    [[nodiscard]] Parsed<std::string> get_string(const ResourceView& view, std::string_view name) const;
    /// Accepts the usual spellings: 1/0, t/f, true/false (any case).
    [[nodiscard]] Parsed<bool> get_bool(const ResourceView& view, std::string_view name) const;
    [[nodiscard]] Parsed<std::int32_t> get_int(const ResourceView& view, std::string_view name) const;
    /// Comma-separated list, trimmed, empty items dropped.
    [[nodiscard]] Parsed<std::vector<std::string>> get_list(const ResourceView& view, std::string_view name) const;

private:
    std::string prefix_;
};

/**
 * @class AnnotationParser
 * @brief Parses one policy from a resource's annotations into a Bundle.
 * @note On error the parser leaves its Bundle fields at their defaults.
 */
class AnnotationParser {
public:
    virtual ~AnnotationParser() = default;
    /// Policy name used in log messages.
    virtual std::string_view name() const noexcept = 0;
    virtual ngsynth_detail::expected<void, AnnotationError> parse(const ResourceView& view, Bundle& out) const = 0;
};

/// Trim ASCII whitespace on both ends.
[[nodiscard]] std::string_view trim(std::string_view s) noexcept;

} // namespace ngsynth::annotations
