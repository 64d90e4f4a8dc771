/**
 * @file checksum.cpp
 * @brief mix()-based checksum.
 */
#include "ngsynth/util/checksum.hpp"

#include <fmt/format.h>

namespace ngsynth::util {

std::uint64_t mix(std::uint64_t x, std::uint64_t seed) noexcept {
    // Named constants (splitmix64/wyhash-style avalanching)
    constexpr std::uint64_t PHI = 0x9e3779b97f4a7c15ULL;        // golden ratio constant
    constexpr std::uint64_t M1  = 0xff51afd7ed558ccdULL;        // mix multiplier 1
    constexpr std::uint64_t M2  = 0xc4ceb9fe1a85ec53ULL;        // mix multiplier 2

    x ^= seed + PHI + (x << 6) + (x >> 2);
    x ^= (x >> 33); x *= M1;
    x ^= (x >> 33); x *= M2;
    x ^= (x >> 33);
    return x;
}

std::uint64_t checksum(std::string_view data, std::uint64_t seed) noexcept {
    std::uint64_t h = seed;
    std::size_t i = 0;
    while (i < data.size()) {
        std::uint64_t word = 0;
        for (std::size_t b = 0; b < 8 && i < data.size(); ++b, ++i) {
            word |= static_cast<std::uint64_t>(static_cast<unsigned char>(data[i])) << (8 * b);
        }
        h = mix(word, h);
    }
    return mix(static_cast<std::uint64_t>(data.size()), h);
}

std::string checksum_hex(std::string_view data) {
    return fmt::format("{:016x}", checksum(data));
}

} // namespace ngsynth::util
