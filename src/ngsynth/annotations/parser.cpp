/**
 * @file parser.cpp
 * @brief AnnotationReader conversions.
 */
#include "ngsynth/annotations/parser.hpp"

#include <charconv>

namespace ngsynth::annotations {

std::string_view trim(std::string_view s) noexcept {
    constexpr std::string_view ws = " \t\r\n";
    const auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

std::string AnnotationReader::key(std::string_view name) const {
    std::string k;
    k.reserve(prefix_.size() + 1 + name.size());
    k.append(prefix_).append("/").append(name);
    return k;
}

Parsed<std::string> AnnotationReader::get_string(const ResourceView& view, std::string_view name) const {
    const auto& anns = view.annotations();
    const auto it = anns.find(key(name));
    if (it == anns.end()) {
        return annotation_error(AnnotationErrc::Missing, "annotation " + key(name) + " not found");
    }
    if (trim(it->second).empty()) {
        return annotation_error(AnnotationErrc::InvalidContent, "annotation " + key(name) + " is empty");
    }
    return it->second;
}

Parsed<bool> AnnotationReader::get_bool(const ResourceView& view, std::string_view name) const {
    auto raw = get_string(view, name);
    if (!raw) return ngsynth_detail::unexpected<AnnotationError>(std::move(raw.error()));

    const auto v = trim(*raw);
    if (v == "1" || v == "t" || v == "T" || v == "true" || v == "TRUE" || v == "True") return true;
    if (v == "0" || v == "f" || v == "F" || v == "false" || v == "FALSE" || v == "False") return false;
    return annotation_error(AnnotationErrc::InvalidContent,
                            "annotation " + key(name) + " is not a boolean: " + *raw);
}

Parsed<std::int32_t> AnnotationReader::get_int(const ResourceView& view, std::string_view name) const {
    auto raw = get_string(view, name);
    if (!raw) return ngsynth_detail::unexpected<AnnotationError>(std::move(raw.error()));

    const auto v = trim(*raw);
    std::int32_t out = 0;
    const auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
    if (ec != std::errc{} || ptr != v.data() + v.size()) {
        return annotation_error(AnnotationErrc::InvalidContent,
                                "annotation " + key(name) + " is not an integer: " + *raw);
    }
    return out;
}

Parsed<std::vector<std::string>> AnnotationReader::get_list(const ResourceView& view, std::string_view name) const {
    auto raw = get_string(view, name);
    if (!raw) return ngsynth_detail::unexpected<AnnotationError>(std::move(raw.error()));

    std::vector<std::string> out;
    std::string_view rest = *raw;
    while (!rest.empty()) {
        const auto comma = rest.find(',');
        const auto item = trim(rest.substr(0, comma));
        if (!item.empty()) out.emplace_back(item);
        if (comma == std::string_view::npos) break;
        rest.remove_prefix(comma + 1);
    }
    return out;
}

} // namespace ngsynth::annotations
