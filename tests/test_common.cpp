#include "common/errors.h"
#include "common/hashing.h"
#include "common/json_fields.h"
#include "common/logging.h"
#include "common/types.h"
#include "test_framework.h"

using namespace tradeguard::common;

void test_result_type() {
  // Test successful result
  Result<uint64_t> success_result(static_cast<uint64_t>(42));
  ASSERT_TRUE(success_result.is_ok());
  ASSERT_FALSE(success_result.is_err());
  ASSERT_EQ(static_cast<uint64_t>(42), success_result.value());
  ASSERT_TRUE(success_result.error_kind() == ErrorKind::None);

  // Test error result
  Result<uint64_t> error_result(ErrorKind::DuplicateHash);
  ASSERT_FALSE(error_result.is_ok());
  ASSERT_TRUE(error_result.is_err());
  ASSERT_TRUE(error_result.error_kind() == ErrorKind::DuplicateHash);
  ASSERT_EQ(std::string("DuplicateHash"), error_result.error());
}

void test_result_type_detail_message() {
  Result<bool> result(ErrorKind::InvalidState, "listing is closed");
  ASSERT_ERR(result, ErrorKind::InvalidState);
  ASSERT_EQ(std::string("InvalidState: listing is closed"), result.error());
}

void test_result_type_move_semantics() {
  Result<std::string> result(std::string("listing-1"));
  ASSERT_TRUE(result.is_ok());

  std::string moved_value = std::move(result).value();
  ASSERT_EQ(std::string("listing-1"), moved_value);
}

void test_result_type_copy_semantics() {
  Result<uint64_t> original(static_cast<uint64_t>(100));
  Result<uint64_t> copied = original;

  ASSERT_TRUE(original.is_ok());
  ASSERT_TRUE(copied.is_ok());
  ASSERT_EQ(static_cast<uint64_t>(100), original.value());
  ASSERT_EQ(static_cast<uint64_t>(100), copied.value());
}

void test_result_type_error_propagation() {
  Result<bool> failed(ErrorKind::Unauthorized, "caller is not the seller");
  auto propagated = Result<uint64_t>::propagate(failed);

  ASSERT_ERR(propagated, ErrorKind::Unauthorized);
  ASSERT_EQ(failed.error(), propagated.error());
  ASSERT_EQ(static_cast<uint64_t>(7), propagated.value_or(7));
}

void test_error_kind_names_round_trip() {
  const ErrorKind kinds[] = {
      ErrorKind::Unauthorized,       ErrorKind::InvalidListingId,
      ErrorKind::InsufficientReputation, ErrorKind::AnomalyDetected,
      ErrorKind::DuplicateListingId, ErrorKind::InvalidEvidenceRef,
      ErrorKind::DisputeNotFound,    ErrorKind::NoOpenEscrow,
      ErrorKind::ConfigInvalid,      ErrorKind::IoError};

  for (ErrorKind kind : kinds) {
    auto parsed = parse_error_kind(to_string(kind));
    ASSERT_TRUE(parsed.has_value());
    ASSERT_TRUE(*parsed == kind);
  }
  ASSERT_FALSE(parse_error_kind("NotAKind").has_value());
}

void test_error_categories() {
  ASSERT_EQ(std::string("authorization"),
            std::string(to_string(category_of(ErrorKind::AlreadySet))));
  ASSERT_EQ(std::string("validation"),
            std::string(to_string(category_of(ErrorKind::InvalidCurrency))));
  ASSERT_EQ(std::string("state-conflict"),
            std::string(to_string(category_of(ErrorKind::AlreadyRuled))));
  ASSERT_EQ(std::string("settlement"),
            std::string(to_string(category_of(ErrorKind::EscrowMismatch))));
  ASSERT_EQ(std::string("storage"),
            std::string(to_string(category_of(ErrorKind::SnapshotInvalid))));
}

void test_error_codes() {
  ASSERT_EQ(0u, error_code(ErrorKind::None));
  ASSERT_EQ(100u, error_code(ErrorKind::Unauthorized));
  ASSERT_EQ(105u, error_code(ErrorKind::DuplicateHash));
  ASSERT_EQ(107u, error_code(ErrorKind::BlacklistedSeller));
  ASSERT_EQ(108u, error_code(ErrorKind::AnomalyDetected));
  ASSERT_EQ(111u, error_code(ErrorKind::AlreadySet));
}

void test_log_level_parsing() {
  ASSERT_TRUE(parse_log_level("debug") == LogLevel::DEBUG);
  ASSERT_TRUE(parse_log_level("WARN") == LogLevel::WARN);
  ASSERT_TRUE(parse_log_level("warning") == LogLevel::WARN);
  ASSERT_TRUE(parse_log_level("Critical") == LogLevel::CRITICAL);
  ASSERT_FALSE(parse_log_level("verbose").has_value());
}

void test_logger_text_output() {
  std::ostringstream captured;
  Logger &logger = Logger::instance();
  LogLevel previous = logger.level();

  logger.set_output(&captured);
  logger.set_json_format(false);
  logger.set_level(LogLevel::INFO);

  LOG_INFO("registry", "Admitted listing ", 7);
  LOG_DEBUG("registry", "suppressed below INFO");

  logger.set_output(nullptr);
  logger.set_level(previous);

  std::string output = captured.str();
  ASSERT_CONTAINS(output, "INFO");
  ASSERT_CONTAINS(output, "registry");
  ASSERT_CONTAINS(output, "Admitted listing 7");
  ASSERT_TRUE(output.find("suppressed") == std::string::npos);
}

void test_logger_json_rejection() {
  std::ostringstream captured;
  Logger &logger = Logger::instance();
  LogLevel previous = logger.level();

  logger.set_output(&captured);
  logger.set_json_format(true);
  logger.set_level(LogLevel::DEBUG);

  LOG_REJECTED("escrow", "open_escrow", ErrorKind::EscrowMismatch);

  logger.set_json_format(false);
  logger.set_output(nullptr);
  logger.set_level(previous);

  std::string output = captured.str();
  ASSERT_CONTAINS(output, "\"module\":\"escrow\"");
  ASSERT_CONTAINS(output, "open_escrow rejected");
  ASSERT_CONTAINS(output, "EscrowMismatch");
}

void test_sha256_known_vector() {
  // SHA-256("abc")
  ASSERT_EQ(std::string("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"),
            hashing::sha256_hex("abc"));

  Hash digest = hashing::sha256(std::vector<uint8_t>{'a', 'b', 'c'});
  ASSERT_EQ(static_cast<size_t>(32), digest.size());
  ASSERT_EQ(hashing::sha256_hex("abc"), hashing::to_hex(digest));
}

void test_sha256_multi_matches_concatenation() {
  Hash split = hashing::sha256_multi({"ab", "c"});
  Hash whole = hashing::sha256(std::vector<uint8_t>{'a', 'b', 'c'});
  ASSERT_EQ(whole, split);
}

void test_item_digest() {
  std::string digest = hashing::item_digest("ST1SELLER", "red bicycle, serial 42");
  ASSERT_EQ(hashing::HEX_DIGEST_LENGTH, digest.size());
  ASSERT_EQ(std::string::npos, digest.find_first_not_of("0123456789abcdef"));

  // Length prefixes keep field boundaries distinct
  ASSERT_NE(hashing::item_digest("ab", "c"), hashing::item_digest("a", "bc"));
  ASSERT_EQ(digest, hashing::item_digest("ST1SELLER", "red bicycle, serial 42"));
}

void test_content_ref() {
  std::string ref = hashing::content_ref("photo of damaged parcel");
  ASSERT_EQ(hashing::HEX_DIGEST_LENGTH, ref.size());
  ASSERT_EQ(hashing::sha256_hex("photo of damaged parcel"), ref);
  ASSERT_NE(ref, hashing::content_ref("photo of intact parcel"));
}

void test_unsigned_json_fields() {
  nlohmann::json doc = nlohmann::json::parse(
      R"({"count": 7, "negative": -1, "fraction": 2.5, "text": "7", "scores": {"a": 1, "b": -2}})");

  ASSERT_EQ(7u, require_u64(doc, "count"));
  ASSERT_EQ(9u, as_u64(nlohmann::json(9), "literal"));
  ASSERT_EQ(42u, u64_or(doc, "absent", 42));
  ASSERT_THROWS(require_u64(doc, "negative"), std::invalid_argument);
  ASSERT_THROWS(require_u64(doc, "fraction"), std::invalid_argument);
  ASSERT_THROWS(require_u64(doc, "text"), std::invalid_argument);
  ASSERT_THROWS(u64_or(doc, "negative", 0), std::invalid_argument);
  ASSERT_THROWS(require_u64(doc, "absent"), nlohmann::json::out_of_range);

  ASSERT_THROWS(require_u64_map(doc.at("scores"), "scores"), std::invalid_argument);
  ASSERT_THROWS(require_u64_map(doc.at("count"), "count"), std::invalid_argument);
  doc["scores"]["b"] = 2;
  ASSERT_EQ(static_cast<size_t>(2), require_u64_map(doc.at("scores"), "scores").size());

  try {
    as_u64(nlohmann::json(-4), "price");
    throw std::runtime_error("expected rejection");
  } catch (const std::invalid_argument &e) {
    ASSERT_CONTAINS(e.what(), "price");
  }
}

void run_common_tests(TestRunner &runner) {
  runner.run_test("Result Type Basic", test_result_type);
  runner.run_test("Result Type Detail Message", test_result_type_detail_message);
  runner.run_test("Result Type Move Semantics", test_result_type_move_semantics);
  runner.run_test("Result Type Copy Semantics", test_result_type_copy_semantics);
  runner.run_test("Result Type Error Propagation",
                  test_result_type_error_propagation);
  runner.run_test("Error Kind Names Round Trip", test_error_kind_names_round_trip);
  runner.run_test("Error Categories", test_error_categories);
  runner.run_test("Error Codes", test_error_codes);
  runner.run_test("Log Level Parsing", test_log_level_parsing);
  runner.run_test("Logger Text Output", test_logger_text_output);
  runner.run_test("Logger JSON Rejection", test_logger_json_rejection);
  runner.run_test("SHA-256 Known Vector", test_sha256_known_vector);
  runner.run_test("SHA-256 Multi Chunk", test_sha256_multi_matches_concatenation);
  runner.run_test("Item Digest", test_item_digest);
  runner.run_test("Content Ref", test_content_ref);
  runner.run_test("Unsigned JSON Fields", test_unsigned_json_fields);
}

// Standalone test main for common tests
#ifndef COMPREHENSIVE_TESTS
int main() {
  std::cout << "=== Common Types Test Suite ===" << std::endl;
  TestRunner runner;
  run_common_tests(runner);
  runner.print_summary();
  return runner.all_passed() ? 0 : 1;
}
#endif
