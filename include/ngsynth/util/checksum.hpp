#pragma once
/**
 * @file checksum.hpp
 * @brief Deterministic non-cryptographic content checksum.
 */

#include <cstdint>
#include <string>
#include <string_view>

#include "ngsynth/config/constants.hpp"

namespace ngsynth::util {

/// splitmix64-style avalanche of @p x salted with @p seed.
[[nodiscard]] std::uint64_t mix(std::uint64_t x, std::uint64_t seed) noexcept;

/// Fold @p data through mix(), 8 bytes at a time (little-endian), length last.
[[nodiscard]] std::uint64_t checksum(std::string_view data,
                                     std::uint64_t seed = config::constants::CHECKSUM_SEED_DEFAULT) noexcept;

/// checksum() as 16 lowercase hex digits.
[[nodiscard]] std::string checksum_hex(std::string_view data);

} // namespace ngsynth::util
