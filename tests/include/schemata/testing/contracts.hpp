#pragma once

#include <gtest/gtest.h>
#include <schemata/contract/contract_builder.hpp>
#include <schemata/contract/transition_builder.hpp>
#include <schemata/crypto/pedersen.hpp>

#include <variant>

// Fungible states commit on secp256k1; skip when OpenSSL was built without
// it.
#define SCHEMATA_REQUIRE_SECP256K1()                     \
  do {                                                 \
    if (!schemata::crypto::available()) {              \
      GTEST_SKIP() << "OpenSSL build lacks secp256k1"; \
    }                                                  \
  } while (false)

namespace schemata::testing {

inline schemata::contract::issued_contract_t unwrap(
    const schemata::contract::issue_result_t& result) {
  if (const auto* error =
          std::get_if<schemata::contract::issue_error_t>(&result)) {
    ADD_FAILURE() << "issue failed: [" << to_string(error->code) << "] "
                  << error->message;
    return {};
  }
  return std::get<schemata::contract::issued_contract_t>(result);
}

inline schemata::schema::transition_t unwrap(
    const schemata::contract::transition_result_t& result) {
  if (const auto* error =
          std::get_if<schemata::contract::issue_error_t>(&result)) {
    ADD_FAILURE() << "transition failed: [" << to_string(error->code) << "] "
                  << error->message;
    return {};
  }
  return std::get<schemata::schema::transition_t>(result);
}

inline schemata::contract::issue_error_code_t error_of(
    const schemata::contract::issue_result_t& result) {
  if (const auto* error =
          std::get_if<schemata::contract::issue_error_t>(&result)) {
    return error->code;
  }
  ADD_FAILURE() << "issue unexpectedly succeeded";
  return schemata::contract::issue_error_code_t::validation_failed;
}

}  // namespace schemata::testing
