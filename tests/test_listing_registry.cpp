/**
 * Listing Registry Test Suite
 *
 * Admission order and atomicity, moderation flags and the seller-side
 * lifecycle.
 */

#include "market/listing_registry.h"
#include "test_framework.h"

using namespace tradeguard::market;

namespace {

const Principal ADMIN = "ST1ADMIN";
const Principal SUBMITTER = "ST1SUBMITTER";
const Principal SELLER = "ST2SELLER";

struct RegistryFixture {
  BlockClock clock;
  AccessControl access;
  PolicyStore policy{access};
  ReputationLedger reputation;
  FraudScoringEngine scoring{policy};
  ListingRegistry registry{policy, scoring, reputation, clock};

  RegistryFixture() {
    if (access.set_authority(ADMIN).is_err()) {
      throw std::runtime_error("fixture authority setup failed");
    }
  }

  ListingId admit(ListingId id, char hash_char = 'a') {
    auto result = registry.submit_listing(SUBMITTER, draft(id, hash_char));
    if (result.is_err()) {
      throw std::runtime_error("fixture admission failed: " + result.error());
    }
    return result.value();
  }

  static ListingDraft draft(ListingId id, char hash_char = 'a') {
    ListingDraft d;
    d.id = id;
    d.item_hash = std::string(64, hash_char);
    d.seller = SELLER;
    d.seller_reputation = 150;
    d.price = 1000;
    d.category = "general";
    d.location = "Lisbon";
    d.currency = "STX";
    return d;
  }
};

} // namespace

void test_admit_listing() {
  RegistryFixture f;
  f.clock.advance(12);

  auto result = f.registry.submit_listing(SUBMITTER, RegistryFixture::draft(1));
  ASSERT_OK(result);
  ASSERT_EQ(1u, result.value());

  auto listing = f.registry.get_listing(1);
  ASSERT_TRUE(listing.has_value());
  ASSERT_TRUE(listing->status() == ListingStatus::Active);
  ASSERT_EQ(1000u, listing->price);
  ASSERT_EQ(SELLER, listing->seller);
  ASSERT_TRUE(listing->currency == Currency::STX);
  ASSERT_EQ(12u, listing->created_at);
  ASSERT_EQ(10u, *f.registry.risk_score(1));
  ASSERT_EQ(1u, *f.registry.listing_for_hash(std::string(64, 'a')));
}

void test_duplicate_hash_rejected() {
  RegistryFixture f;
  f.admit(1);

  auto again = f.registry.submit_listing(SUBMITTER, RegistryFixture::draft(2));
  ASSERT_ERR(again, ErrorKind::DuplicateHash);
  ASSERT_FALSE(f.registry.get_listing(2).has_value());
  ASSERT_EQ(static_cast<size_t>(1), f.registry.listing_count());
}

void test_hash_history_survives_closure() {
  RegistryFixture f;
  f.admit(1);
  ASSERT_OK(f.registry.close_listing(SELLER, 1));

  auto again = f.registry.submit_listing(SUBMITTER, RegistryFixture::draft(2));
  ASSERT_ERR(again, ErrorKind::DuplicateHash);
}

void test_validation_order() {
  RegistryFixture f;

  // Everything wrong: the first check wins
  ListingDraft d;
  d.seller = SUBMITTER;
  d.seller_reputation = 0;
  ASSERT_ERR(f.registry.submit_listing(SUBMITTER, d), ErrorKind::InvalidListingId);

  d.id = 1;
  ASSERT_ERR(f.registry.submit_listing(SUBMITTER, d), ErrorKind::InvalidItemHash);

  d.item_hash = std::string(64, 'b');
  ASSERT_ERR(f.registry.submit_listing(SUBMITTER, d), ErrorKind::InvalidSellerDid);

  d.seller = SELLER;
  ASSERT_ERR(f.registry.submit_listing(SUBMITTER, d), ErrorKind::InsufficientReputation);

  d.seller_reputation = 100;
  ASSERT_ERR(f.registry.submit_listing(SUBMITTER, d), ErrorKind::InvalidPrice);

  d.price = 500;
  ASSERT_ERR(f.registry.submit_listing(SUBMITTER, d), ErrorKind::InvalidCategory);

  d.category = std::string(51, 'c');
  ASSERT_ERR(f.registry.submit_listing(SUBMITTER, d), ErrorKind::InvalidCategory);

  d.category = std::string(50, 'c');
  ASSERT_ERR(f.registry.submit_listing(SUBMITTER, d), ErrorKind::InvalidLocation);

  d.location = std::string(101, 'l');
  ASSERT_ERR(f.registry.submit_listing(SUBMITTER, d), ErrorKind::InvalidLocation);

  d.location = std::string(100, 'l');
  d.currency = "EUR";
  ASSERT_ERR(f.registry.submit_listing(SUBMITTER, d), ErrorKind::InvalidCurrency);

  d.currency = "BTC";
  ASSERT_OK(f.registry.submit_listing(SUBMITTER, d));
}

void test_item_hash_length_boundaries() {
  RegistryFixture f;
  ListingDraft d = RegistryFixture::draft(1);

  d.item_hash = std::string(63, 'a');
  ASSERT_ERR(f.registry.submit_listing(SUBMITTER, d), ErrorKind::InvalidItemHash);
  d.item_hash = std::string(65, 'a');
  ASSERT_ERR(f.registry.submit_listing(SUBMITTER, d), ErrorKind::InvalidItemHash);
}

void test_duplicate_checked_before_blacklist() {
  RegistryFixture f;
  f.admit(1);
  ASSERT_OK(f.policy.blacklist_seller(ADMIN, SELLER));

  // Hash reuse is reported ahead of the blacklist
  ASSERT_ERR(f.registry.submit_listing(SUBMITTER, RegistryFixture::draft(2)),
             ErrorKind::DuplicateHash);
  ASSERT_ERR(f.registry.submit_listing(SUBMITTER, RegistryFixture::draft(2, 'b')),
             ErrorKind::BlacklistedSeller);
}

void test_blacklisted_seller_rejected() {
  RegistryFixture f;
  f.admit(1);
  ASSERT_OK(f.policy.blacklist_seller(ADMIN, SELLER));

  ASSERT_ERR(f.registry.submit_listing(SUBMITTER, RegistryFixture::draft(2, 'b')),
             ErrorKind::BlacklistedSeller);

  // Existing listings are not suspended
  ASSERT_TRUE(f.registry.get_listing(1)->status() == ListingStatus::Active);

  ASSERT_OK(f.policy.unblacklist_seller(ADMIN, SELLER));
  ASSERT_OK(f.registry.submit_listing(SUBMITTER, RegistryFixture::draft(2, 'b')));
}

void test_duplicate_listing_id() {
  RegistryFixture f;
  f.admit(1);

  auto result = f.registry.submit_listing(SUBMITTER, RegistryFixture::draft(1, 'b'));
  ASSERT_ERR(result, ErrorKind::DuplicateListingId);
  ASSERT_FALSE(f.registry.listing_for_hash(std::string(64, 'b')).has_value());
}

void test_anomaly_detected_is_atomic() {
  RegistryFixture f;

  ListingDraft d = RegistryFixture::draft(1);
  d.seller_reputation = 50;
  d.price = 10000;
  d.category = "high-risk";

  // min_reputation must admit reputation 50 for the score check to run
  ASSERT_OK(f.policy.set_min_reputation(ADMIN, 0));
  ASSERT_ERR(f.registry.submit_listing(SUBMITTER, d), ErrorKind::AnomalyDetected);

  ASSERT_FALSE(f.registry.get_listing(1).has_value());
  ASSERT_FALSE(f.registry.listing_for_hash(d.item_hash).has_value());
  ASSERT_FALSE(f.registry.risk_score(1).has_value());
  ASSERT_EQ(static_cast<size_t>(0), f.registry.listing_count());
}

void test_admission_without_scoring() {
  RegistryFixture f;
  ASSERT_OK(f.policy.set_min_reputation(ADMIN, 0));
  ASSERT_OK(f.policy.toggle_anomaly_detection(ADMIN));

  ListingDraft d = RegistryFixture::draft(1);
  d.seller_reputation = 0;
  d.price = 1000000;
  d.category = "high-risk";

  ASSERT_OK(f.registry.submit_listing(SUBMITTER, d));
  ASSERT_TRUE(f.registry.get_listing(1).has_value());
  ASSERT_FALSE(f.registry.risk_score(1).has_value());
}

void test_reputation_read_from_ledger() {
  RegistryFixture f;

  ListingDraft d = RegistryFixture::draft(1);
  d.seller_reputation.reset();

  // Unknown seller
  ASSERT_ERR(f.registry.submit_listing(SUBMITTER, d), ErrorKind::InsufficientReputation);

  f.reputation.seed(SELLER, 99);
  ASSERT_ERR(f.registry.submit_listing(SUBMITTER, d), ErrorKind::InsufficientReputation);

  f.reputation.seed(SELLER, 100);
  ASSERT_OK(f.registry.submit_listing(SUBMITTER, d));
}

void test_flag_and_unflag() {
  RegistryFixture f;
  f.admit(1);
  f.clock.advance(5);

  ASSERT_OK(f.registry.flag_listing(ADMIN, 1, "counterfeit report", 60));
  auto listing = f.registry.get_listing(1);
  ASSERT_TRUE(listing->status() == ListingStatus::Paused);

  auto flag = f.registry.get_flag(1);
  ASSERT_TRUE(flag.has_value());
  ASSERT_EQ(std::string("counterfeit report"), flag->reason);
  ASSERT_EQ(60u, flag->risk_score);
  ASSERT_EQ(5u, flag->timestamp);

  // Re-flag overwrites
  ASSERT_OK(f.registry.flag_listing(ADMIN, 1, "second report", 70));
  ASSERT_EQ(std::string("second report"), f.registry.get_flag(1)->reason);

  ASSERT_OK(f.registry.unflag_listing(ADMIN, 1));
  ASSERT_TRUE(f.registry.get_listing(1)->status() == ListingStatus::Active);
  ASSERT_FALSE(f.registry.get_flag(1).has_value());
}

void test_flag_errors() {
  RegistryFixture f;
  f.admit(1);

  ASSERT_ERR(f.registry.flag_listing(SELLER, 1, "r", 10), ErrorKind::Unauthorized);
  ASSERT_ERR(f.registry.flag_listing(ADMIN, 9, "r", 10), ErrorKind::ListingNotFound);
  ASSERT_ERR(f.registry.flag_listing(ADMIN, 1, "r", 81), ErrorKind::InvalidRiskScore);
  ASSERT_OK(f.registry.flag_listing(ADMIN, 1, "r", 80));

  ASSERT_ERR(f.registry.unflag_listing(SELLER, 1), ErrorKind::Unauthorized);
  ASSERT_ERR(f.registry.unflag_listing(ADMIN, 9), ErrorKind::ListingNotFound);
  ASSERT_OK(f.registry.unflag_listing(ADMIN, 1));
  ASSERT_ERR(f.registry.unflag_listing(ADMIN, 1), ErrorKind::InvalidState);

  ASSERT_OK(f.registry.close_listing(SELLER, 1));
  ASSERT_ERR(f.registry.flag_listing(ADMIN, 1, "r", 10), ErrorKind::InvalidState);
}

void test_flag_blocks_resume() {
  RegistryFixture f;
  f.admit(1);

  ASSERT_OK(f.registry.pause_listing(SELLER, 1));
  ASSERT_OK(f.registry.flag_listing(ADMIN, 1, "review", 10));
  ASSERT_ERR(f.registry.resume_listing(SELLER, 1), ErrorKind::InvalidState);
  ASSERT_TRUE(f.registry.get_listing(1)->status() == ListingStatus::Paused);

  // Unflag clears the seller pause as well
  ASSERT_OK(f.registry.unflag_listing(ADMIN, 1));
  ASSERT_TRUE(f.registry.get_listing(1)->status() == ListingStatus::Active);
}

void test_pause_resume() {
  RegistryFixture f;
  f.admit(1);

  ASSERT_ERR(f.registry.pause_listing(SUBMITTER, 1), ErrorKind::Unauthorized);
  ASSERT_ERR(f.registry.pause_listing(SELLER, 2), ErrorKind::ListingNotFound);
  ASSERT_ERR(f.registry.resume_listing(SELLER, 1), ErrorKind::InvalidState);

  ASSERT_OK(f.registry.pause_listing(SELLER, 1));
  ASSERT_TRUE(f.registry.get_listing(1)->status() == ListingStatus::Paused);
  ASSERT_ERR(f.registry.pause_listing(SELLER, 1), ErrorKind::InvalidState);

  ASSERT_OK(f.registry.resume_listing(SELLER, 1));
  ASSERT_TRUE(f.registry.get_listing(1)->status() == ListingStatus::Active);
}

void test_update_price() {
  RegistryFixture f;
  f.admit(1);

  ASSERT_ERR(f.registry.update_listing_price(SELLER, 2, 10), ErrorKind::ListingNotFound);
  ASSERT_ERR(f.registry.update_listing_price(ADMIN, 1, 10), ErrorKind::Unauthorized);
  ASSERT_ERR(f.registry.update_listing_price(SELLER, 1, 0), ErrorKind::InvalidPrice);

  // Risk score is not recomputed on price change
  auto updated = f.registry.update_listing_price(SELLER, 1, 500000);
  ASSERT_OK(updated);
  ASSERT_EQ(500000u, updated.value());
  ASSERT_EQ(500000u, f.registry.get_listing(1)->price);
  ASSERT_EQ(10u, *f.registry.risk_score(1));

  f.registry.lock_for_escrow(1);
  ASSERT_ERR(f.registry.update_listing_price(SELLER, 1, 10), ErrorKind::InvalidState);
  ASSERT_ERR(f.registry.close_listing(SELLER, 1), ErrorKind::InvalidState);
  f.registry.unlock_escrow(1);
  ASSERT_OK(f.registry.update_listing_price(SELLER, 1, 10));
}

void test_close_listing() {
  RegistryFixture f;
  f.admit(1);

  ASSERT_ERR(f.registry.close_listing(SUBMITTER, 1), ErrorKind::Unauthorized);
  ASSERT_OK(f.registry.close_listing(SELLER, 1));
  ASSERT_TRUE(f.registry.get_listing(1)->status() == ListingStatus::Closed);

  ASSERT_ERR(f.registry.close_listing(SELLER, 1), ErrorKind::InvalidState);
  ASSERT_ERR(f.registry.pause_listing(SELLER, 1), ErrorKind::InvalidState);
  ASSERT_ERR(f.registry.resume_listing(SELLER, 1), ErrorKind::InvalidState);
  ASSERT_ERR(f.registry.update_listing_price(SELLER, 1, 5), ErrorKind::InvalidState);
}

void run_listing_registry_tests(TestRunner &runner) {
  runner.run_test("Admit Listing", test_admit_listing);
  runner.run_test("Duplicate Hash Rejected", test_duplicate_hash_rejected);
  runner.run_test("Hash History Survives Closure",
                  test_hash_history_survives_closure);
  runner.run_test("Validation Order", test_validation_order);
  runner.run_test("Item Hash Length Boundaries",
                  test_item_hash_length_boundaries);
  runner.run_test("Duplicate Checked Before Blacklist",
                  test_duplicate_checked_before_blacklist);
  runner.run_test("Blacklisted Seller Rejected", test_blacklisted_seller_rejected);
  runner.run_test("Duplicate Listing Id", test_duplicate_listing_id);
  runner.run_test("Anomaly Detected Is Atomic", test_anomaly_detected_is_atomic);
  runner.run_test("Admission Without Scoring", test_admission_without_scoring);
  runner.run_test("Reputation Read From Ledger", test_reputation_read_from_ledger);
  runner.run_test("Flag And Unflag", test_flag_and_unflag);
  runner.run_test("Flag Errors", test_flag_errors);
  runner.run_test("Flag Blocks Resume", test_flag_blocks_resume);
  runner.run_test("Pause Resume", test_pause_resume);
  runner.run_test("Update Price", test_update_price);
  runner.run_test("Close Listing", test_close_listing);
}

#ifndef COMPREHENSIVE_TESTS
int main() {
  std::cout << "=== Listing Registry Test Suite ===" << std::endl;
  TestRunner runner;
  run_listing_registry_tests(runner);
  runner.print_summary();
  return runner.all_passed() ? 0 : 1;
}
#endif
