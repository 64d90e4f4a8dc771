#pragma once
/**
 * @file merge_policy.hpp
 * @brief Conflict resolution for server-level fields set by several resources.
 * @details Resources sharing a hostname may each try to set aliases, snippets,
 *          ciphers and so on. The table below is the single place deciding who wins.
 *
 *  | field                     | policy     |
 *  |---------------------------|------------|
 *  | aliases                   | FirstWins  |
 *  | server snippet            | FirstWins  |
 *  | ssl ciphers               | FirstWins  |
 *  | ssl prefer server ciphers | FirstWins  |
 *  | ssl certificate           | FirstWins  |
 *  | certificate auth          | FirstWins  |
 *  | auth tls error            | FirstWins  |
 */

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "ngsynth/annotations/bundle.hpp"

namespace ngsynth::synthesis {

/// How a second value for an already-set field is handled.
enum class MergePolicy : std::uint8_t {
    FirstWins,       ///< Keep the existing value, ignore the newcomer
    LastWins,        ///< Newcomer replaces the existing value
    RejectDuplicate  ///< A different second value is an error
};

/// Server fields subject to cross-resource merging.
enum class ServerField : std::uint8_t {
    Aliases,
    ServerSnippet,
    SSLCiphers,
    SSLPreferServerCiphers,
    SSLCertificate,
    CertificateAuth,
    AuthTLSError
};

struct FieldPolicy {
    ServerField      field;
    MergePolicy      policy;
    std::string_view name;
};

inline constexpr std::array<FieldPolicy, 7> SERVER_FIELD_POLICIES{{
    {ServerField::Aliases,                MergePolicy::FirstWins, "aliases"},
    {ServerField::ServerSnippet,          MergePolicy::FirstWins, "server-snippet"},
    {ServerField::SSLCiphers,             MergePolicy::FirstWins, "ssl-ciphers"},
    {ServerField::SSLPreferServerCiphers, MergePolicy::FirstWins, "ssl-prefer-server-ciphers"},
    {ServerField::SSLCertificate,         MergePolicy::FirstWins, "ssl-certificate"},
    {ServerField::CertificateAuth,        MergePolicy::FirstWins, "certificate-auth"},
    {ServerField::AuthTLSError,           MergePolicy::FirstWins, "auth-tls-error"},
}};

[[nodiscard]] constexpr const FieldPolicy& field_policy(ServerField f) noexcept {
    for (const auto& p : SERVER_FIELD_POLICIES) {
        if (p.field == f) return p;
    }
    return SERVER_FIELD_POLICIES.front();
}

/// Result of offering a value to a field.
enum class MergeOutcome : std::uint8_t {
    Applied,       ///< Field now holds the offered value
    KeptExisting,  ///< Field already set; offered value ignored
    Unset,         ///< Offered value was empty; nothing to do
    Rejected       ///< RejectDuplicate policy and values differ
};

namespace detail {
    inline bool is_unset(const std::string& s) noexcept { return s.empty(); }
    template <class T>
    bool is_unset(const std::vector<T>& v) noexcept { return v.empty(); }
    /// Client certificate auth only counts once a CA file was resolved.
    inline bool is_unset(const annotations::CertificateAuthConfig& c) noexcept { return c.ca_file_name.empty(); }
}

/**
 * @brief Offer @p incoming to @p slot under @p policy.
 * @note Empty values never overwrite anything, whatever the policy.
 */
template <class T>
MergeOutcome merge_value(MergePolicy policy, T& slot, const T& incoming) {
    if (detail::is_unset(incoming)) return MergeOutcome::Unset;
    if (detail::is_unset(slot)) {
        slot = incoming;
        return MergeOutcome::Applied;
    }
    switch (policy) {
        case MergePolicy::FirstWins:
            return MergeOutcome::KeptExisting;
        case MergePolicy::LastWins:
            slot = incoming;
            return MergeOutcome::Applied;
        case MergePolicy::RejectDuplicate:
            return slot == incoming ? MergeOutcome::KeptExisting : MergeOutcome::Rejected;
    }
    return MergeOutcome::KeptExisting;
}

/// Offer @p incoming to @p slot under the policy registered for @p field.
template <class T>
MergeOutcome merge_field(ServerField field, T& slot, const T& incoming) {
    return merge_value(field_policy(field).policy, slot, incoming);
}

} // namespace ngsynth::synthesis
