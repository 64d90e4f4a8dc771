/**
 * @file configuration.cpp
 * @brief Diffing helpers over successive configurations.
 */
#include "ngsynth/model/configuration.hpp"

#include <algorithm>
#include <iterator>
#include <set>

namespace ngsynth::model {

namespace {

std::set<std::string> referenced_resources(const Configuration& cfg) {
  std::set<std::string> keys;
  for (const auto& server : cfg.servers) {
    for (const auto& loc : server.locations) {
      if (loc.owner) keys.insert(loc.owner->key());
    }
  }
  return keys;
}

} // namespace

std::vector<std::string> removed_resources(const Configuration& previous,
                                           const Configuration& next) {
  const auto before = referenced_resources(previous);
  const auto after  = referenced_resources(next);

  std::vector<std::string> out;
  std::set_difference(before.begin(), before.end(), after.begin(), after.end(),
                      std::back_inserter(out));
  return out;
}

} // namespace ngsynth::model
