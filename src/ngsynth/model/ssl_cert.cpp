/**
 * @file ssl_cert.cpp
 * @brief Hostname validation against certificate names.
 */
#include "ngsynth/model/ssl_cert.hpp"

#include <algorithm>
#include <cctype>

namespace ngsynth::model {

namespace {

std::string normalize(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  // a single trailing dot is an absolute name, not a different one
  if (!out.empty() && out.back() == '.') out.pop_back();
  return out;
}

} // namespace

bool match_hostname(std::string_view pattern, std::string_view host) {
  const std::string p = normalize(pattern);
  const std::string h = normalize(host);
  if (p.empty() || h.empty()) return false;

  if (p.size() > 2 && p[0] == '*' && p[1] == '.') {
    // wildcard covers exactly one leftmost label
    const auto dot = h.find('.');
    if (dot == std::string::npos || dot == 0) return false;
    return std::string_view(h).substr(dot) == std::string_view(p).substr(1);
  }
  return p == h;
}

bool SSLCert::verify_san(std::string_view host) const {
  return std::any_of(dns_names.begin(), dns_names.end(),
                     [&](const std::string& n) { return match_hostname(n, host); });
}

bool SSLCert::verify_cn(std::string_view host) const {
  return !common_name.empty() && match_hostname(common_name, host);
}

} // namespace ngsynth::model
