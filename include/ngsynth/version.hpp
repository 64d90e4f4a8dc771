#pragma once
/**
 * @file version.hpp
 * @brief Release string of the ngsynth library, logged by ngsynth_dump at startup.
 *
 * NGSYNTH_VERSION is defined by the build from project(VERSION) in CMakeLists.txt.
 */

#include <string_view>

namespace ngsynth {

/// "major.minor.patch"
inline constexpr std::string_view version_string{NGSYNTH_VERSION};

} // namespace ngsynth
