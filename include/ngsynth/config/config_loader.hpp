#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: YAML document -> controller flags + backend policy.
 * @details Missing keys keep the named defaults from constants.hpp.
 */

#include <cstdint>
#include <string>

#include "ngsynth/compat/expected.hpp"
#include "ngsynth/config/settings.hpp"

namespace ngsynth::config {

    /** @struct SynthConfig
     *  @brief Aggregate of the settings the synthesis and admission layers need.
     */
    struct SynthConfig {
        ControllerConfig controller; ///< Process-level flags
        BackendPolicy    backend;    ///< Cluster-wide backend policy (checksum filled by the loader)
    };

    enum class ConfigErrc : std::uint8_t {
        FileNotFound,  ///< Path could not be opened
        ParseError,    ///< Not a YAML document
        InvalidValue   ///< Key present with the wrong type or an unknown enum value
    };

    struct ConfigError {
        ConfigErrc  code{ConfigErrc::ParseError};
        std::string message;
    };

    /** @class Loader
     *  @brief Source of synthesis configuration (defaults or parsed YAML).
     */
    class Loader {
    public:
        /// Configuration with every default applied and the checksum computed.
        static SynthConfig defaults();

        /**
         * @brief Parse the YAML file at @p path.
         * @return SynthConfig, or the first error encountered.
         */
        static ngsynth_detail::expected<SynthConfig, ConfigError> load_from_file(const std::string& path);

        /// Same as load_from_file() for an in-memory document.
        static ngsynth_detail::expected<SynthConfig, ConfigError> load_from_string(const std::string& text);

        /// Canonical text of @p policy used for its checksum (checksum field excluded).
        static std::string canonical(const BackendPolicy& policy);
    };

} // namespace ngsynth::config
