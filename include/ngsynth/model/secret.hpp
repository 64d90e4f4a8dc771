/**
 * @file secret.hpp
 * @brief Opaque key/value secret as served by the Resource Store.
 */
#pragma once

#include <map>
#include <string>

namespace ngsynth::model {

struct Secret final {
  std::string                        namespace_name;
  std::string                        name;
  std::map<std::string, std::string> data;

  [[nodiscard]] bool contains(const std::string& k) const { return data.find(k) != data.end(); }
  /// "namespace/name"
  [[nodiscard]] std::string key() const { return namespace_name + "/" + name; }

  bool operator==(const Secret&) const = default;
};

} // namespace ngsynth::model
