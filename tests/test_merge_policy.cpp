/**
 * @file test_merge_policy.cpp
 * @brief Tests for cross-resource server field merging.
 *
 * Validates:
 *  - Every server field is registered and resolves first-writer-wins
 *  - merge_value() semantics for each policy
 *  - Empty values never overwrite; certificate auth without a CA counts as unset
 */

#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "ngsynth/synthesis/merge_policy.hpp"

using namespace ngsynth::synthesis;
using ngsynth::annotations::CertificateAuthConfig;

// --------------------------- Table -------------------------------------------

/**
 * @test Table_All_First_Wins
 * @brief Each field appears once and keeps the first value.
 */
TEST(MergePolicy, Table_All_First_Wins) {
  for (const auto& p : SERVER_FIELD_POLICIES) {
    EXPECT_EQ(p.policy, MergePolicy::FirstWins) << p.name;
    EXPECT_EQ(field_policy(p.field).name, p.name);
  }
  EXPECT_EQ(field_policy(ServerField::AuthTLSError).name, "auth-tls-error");
}

// --------------------------- merge_value -------------------------------------

/**
 * @test First_Wins_Keeps_Existing
 * @brief The first non-empty value sticks.
 */
TEST(MergePolicy, First_Wins_Keeps_Existing) {
  std::string slot;
  EXPECT_EQ(merge_value(MergePolicy::FirstWins, slot, std::string("a")), MergeOutcome::Applied);
  EXPECT_EQ(merge_value(MergePolicy::FirstWins, slot, std::string("b")), MergeOutcome::KeptExisting);
  EXPECT_EQ(slot, "a");
}

/**
 * @test Last_Wins_Replaces
 * @brief A later non-empty value replaces the slot.
 */
TEST(MergePolicy, Last_Wins_Replaces) {
  std::vector<std::string> slot{"a.com"};
  const std::vector<std::string> incoming{"b.com"};
  EXPECT_EQ(merge_value(MergePolicy::LastWins, slot, incoming), MergeOutcome::Applied);
  EXPECT_EQ(slot, incoming);
}

/**
 * @test Reject_Duplicate_Only_When_Different
 * @brief Equal values are accepted silently, differing ones rejected.
 */
TEST(MergePolicy, Reject_Duplicate_Only_When_Different) {
  std::string slot = "on";
  EXPECT_EQ(merge_value(MergePolicy::RejectDuplicate, slot, std::string("on")), MergeOutcome::KeptExisting);
  EXPECT_EQ(merge_value(MergePolicy::RejectDuplicate, slot, std::string("off")), MergeOutcome::Rejected);
  EXPECT_EQ(slot, "on");
}

/**
 * @test Empty_Incoming_Is_Unset
 * @brief Empty values never touch the slot, whatever the policy.
 */
TEST(MergePolicy, Empty_Incoming_Is_Unset) {
  std::string slot = "keep";
  EXPECT_EQ(merge_value(MergePolicy::LastWins, slot, std::string()), MergeOutcome::Unset);
  EXPECT_EQ(merge_field(ServerField::ServerSnippet, slot, std::string()), MergeOutcome::Unset);
  EXPECT_EQ(slot, "keep");
}

/**
 * @test Certificate_Auth_Needs_CA
 * @brief Client auth without a resolved CA file is treated as unset on both sides.
 */
TEST(MergePolicy, Certificate_Auth_Needs_CA) {
  CertificateAuthConfig slot;
  slot.secret = "ns1/first";

  CertificateAuthConfig no_ca;
  no_ca.secret = "ns1/other";
  EXPECT_EQ(merge_field(ServerField::CertificateAuth, slot, no_ca), MergeOutcome::Unset);

  CertificateAuthConfig with_ca;
  with_ca.secret = "ns1/ca";
  with_ca.ca_file_name = "/etc/ingress-controller/ssl/ca-ns1-ca.pem";
  EXPECT_EQ(merge_field(ServerField::CertificateAuth, slot, with_ca), MergeOutcome::Applied);
  EXPECT_EQ(slot, with_ca);

  CertificateAuthConfig later = with_ca;
  later.secret = "ns1/later";
  EXPECT_EQ(merge_field(ServerField::CertificateAuth, slot, later), MergeOutcome::KeptExisting);
  EXPECT_EQ(slot.secret, "ns1/ca");
}
