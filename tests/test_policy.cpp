/**
 * Configuration/Authority Test Suite
 *
 * Authority lifecycle, the shared capability check, policy setters,
 * blacklist maintenance and the reputation ledger.
 */

#include "market/policy.h"
#include "market/reputation_ledger.h"
#include "test_framework.h"

#include <limits>

using namespace tradeguard::market;

namespace {
const Principal ADMIN = "ST1ADMIN";
const Principal OTHER = "ST2OTHER";
} // namespace

void test_policy_defaults() {
  AccessControl access;
  PolicyStore policy(access);

  ASSERT_EQ(50u, policy.policy().fraud_threshold);
  ASSERT_EQ(100u, policy.policy().min_reputation);
  ASSERT_EQ(80u, policy.policy().max_risk_score);
  ASSERT_TRUE(policy.policy().anomaly_detection_enabled);
  ASSERT_FALSE(access.authority().has_value());
}

void test_authority_set_once() {
  AccessControl access;
  ASSERT_OK(access.set_authority(ADMIN));
  ASSERT_TRUE(access.is_authority(ADMIN));

  // Any later set fails regardless of caller or value
  ASSERT_ERR(access.set_authority(OTHER), ErrorKind::AlreadySet);
  ASSERT_ERR(access.set_authority(ADMIN), ErrorKind::AlreadySet);
  ASSERT_EQ(ADMIN, *access.authority());
}

void test_authority_rejects_empty_principal() {
  AccessControl access;
  ASSERT_ERR(access.set_authority(""), ErrorKind::InvalidPrincipal);
  ASSERT_FALSE(access.authority().has_value());
  ASSERT_OK(access.set_authority(ADMIN));
}

void test_privileged_ops_require_authority() {
  AccessControl access;
  PolicyStore policy(access);

  // Unset authority rejects everyone
  ASSERT_ERR(policy.set_min_reputation(ADMIN, 10), ErrorKind::Unauthorized);
  ASSERT_ERR(policy.blacklist_seller(ADMIN, "STBAD"), ErrorKind::Unauthorized);

  ASSERT_OK(access.set_authority(ADMIN));
  ASSERT_ERR(policy.set_fraud_threshold(OTHER, 1), ErrorKind::Unauthorized);
  ASSERT_ERR(policy.set_max_risk_score(OTHER, 1), ErrorKind::Unauthorized);
  ASSERT_ERR(policy.toggle_anomaly_detection(OTHER), ErrorKind::Unauthorized);
  ASSERT_ERR(policy.unblacklist_seller(OTHER, "STBAD"), ErrorKind::Unauthorized);

  // Nothing changed
  ASSERT_EQ(50u, policy.policy().fraud_threshold);
  ASSERT_EQ(80u, policy.policy().max_risk_score);
  ASSERT_TRUE(policy.policy().anomaly_detection_enabled);
}

void test_setters_return_new_value() {
  AccessControl access;
  ASSERT_OK(access.set_authority(ADMIN));
  PolicyStore policy(access);

  auto threshold = policy.set_fraud_threshold(ADMIN, 75);
  ASSERT_OK(threshold);
  ASSERT_EQ(75u, threshold.value());
  ASSERT_EQ(75u, policy.policy().fraud_threshold);

  auto reputation = policy.set_min_reputation(ADMIN, 0);
  ASSERT_OK(reputation);
  ASSERT_EQ(0u, policy.policy().min_reputation);

  uint64_t max = std::numeric_limits<uint64_t>::max();
  ASSERT_OK(policy.set_max_risk_score(ADMIN, max));
  ASSERT_EQ(max, policy.policy().max_risk_score);

  auto off = policy.toggle_anomaly_detection(ADMIN);
  ASSERT_FALSE(off.value());
  auto on = policy.toggle_anomaly_detection(ADMIN);
  ASSERT_TRUE(on.value());
}

void test_blacklist_maintenance() {
  AccessControl access;
  ASSERT_OK(access.set_authority(ADMIN));
  PolicyStore policy(access);

  auto added = policy.blacklist_seller(ADMIN, "STBAD");
  ASSERT_TRUE(added.value());
  ASSERT_TRUE(policy.is_blacklisted("STBAD"));

  // Idempotent, reports no change
  auto again = policy.blacklist_seller(ADMIN, "STBAD");
  ASSERT_OK(again);
  ASSERT_FALSE(again.value());

  auto removed = policy.unblacklist_seller(ADMIN, "STBAD");
  ASSERT_TRUE(removed.value());
  ASSERT_FALSE(policy.is_blacklisted("STBAD"));

  auto missing = policy.unblacklist_seller(ADMIN, "STBAD");
  ASSERT_FALSE(missing.value());
}

void test_reputation_outcomes() {
  ReputationLedger ledger;
  ledger.seed("ST1SELLER", 120);

  ASSERT_EQ(130u, ledger.apply_outcome("ST1SELLER", ReputationOutcome::Fulfilled));
  ASSERT_EQ(80u, ledger.apply_outcome("ST1SELLER", ReputationOutcome::FraudSuspected));
  ASSERT_EQ(30u, ledger.apply_outcome("ST1SELLER", ReputationOutcome::FraudSuspected));
  // Saturates at zero
  ASSERT_EQ(0u, ledger.apply_outcome("ST1SELLER", ReputationOutcome::FraudSuspected));
  ASSERT_EQ(0u, *ledger.get("ST1SELLER"));
}

void test_reputation_unknown_participant() {
  ReputationLedger ledger;
  ASSERT_FALSE(ledger.get("ST9NEW").has_value());

  ASSERT_EQ(10u, ledger.apply_outcome("ST9NEW", ReputationOutcome::Fulfilled));
  ASSERT_TRUE(ledger.get("ST9NEW").has_value());

  ledger.seed("ST9TOP", std::numeric_limits<uint64_t>::max());
  ASSERT_EQ(std::numeric_limits<uint64_t>::max(),
            ledger.apply_outcome("ST9TOP", ReputationOutcome::Fulfilled));
}

void test_reputation_top() {
  ReputationLedger ledger;
  ledger.seed("STA", 50);
  ledger.seed("STB", 300);
  ledger.seed("STC", 300);
  ledger.seed("STD", 10);

  auto top = ledger.top(3);
  ASSERT_EQ(static_cast<size_t>(3), top.size());
  ASSERT_EQ(std::string("STB"), top[0].first);
  ASSERT_EQ(std::string("STC"), top[1].first);
  ASSERT_EQ(std::string("STA"), top[2].first);
}

void run_policy_tests(TestRunner &runner) {
  runner.run_test("Policy Defaults", test_policy_defaults);
  runner.run_test("Authority Set Once", test_authority_set_once);
  runner.run_test("Authority Rejects Empty Principal",
                  test_authority_rejects_empty_principal);
  runner.run_test("Privileged Ops Require Authority",
                  test_privileged_ops_require_authority);
  runner.run_test("Setters Return New Value", test_setters_return_new_value);
  runner.run_test("Blacklist Maintenance", test_blacklist_maintenance);
  runner.run_test("Reputation Outcomes", test_reputation_outcomes);
  runner.run_test("Reputation Unknown Participant",
                  test_reputation_unknown_participant);
  runner.run_test("Reputation Top", test_reputation_top);
}

#ifndef COMPREHENSIVE_TESTS
int main() {
  std::cout << "=== Configuration/Authority Test Suite ===" << std::endl;
  TestRunner runner;
  run_policy_tests(runner);
  runner.print_summary();
  return runner.all_passed() ? 0 : 1;
}
#endif
