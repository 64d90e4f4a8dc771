/**
 * @file ssl_cert.hpp
 * @brief Parsed TLS certificate as handed over by the Resource Store.
 *
 * Certificate parsing happens outside the core. The core only reads the
 * bytes, the expiry and the names the certificate covers.
 */
#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace ngsynth::model {

struct SSLCert final {
  std::string name;                       ///< Secret key "namespace/name".
  std::string pem;                        ///< Certificate bytes; empty means "no certificate".
  std::string pem_sha;                    ///< Content checksum, used by renderers for reload detection.
  std::chrono::system_clock::time_point expire_time{};
  std::vector<std::string> dns_names;     ///< Subject alternative names.
  std::string common_name;                ///< Subject CN.

  [[nodiscard]] bool has_certificate() const noexcept { return !pem.empty(); }

  /// Validate @p host against the SAN list (wildcards match one label).
  [[nodiscard]] bool verify_san(std::string_view host) const;

  /// Validate @p host against the subject common name.
  [[nodiscard]] bool verify_cn(std::string_view host) const;

  bool operator==(const SSLCert&) const = default;
};

/// Match a hostname against a certificate name pattern ("*.example.com" allowed).
[[nodiscard]] bool match_hostname(std::string_view pattern, std::string_view host);

} // namespace ngsynth::model
