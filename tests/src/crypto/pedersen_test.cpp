#include <gtest/gtest.h>
#include <schemata/crypto/pedersen.hpp>
#include <schemata/testing/common.hpp>
#include <schemata/testing/contracts.hpp>

#include <array>

using namespace schemata::crypto;
using schemata::testing::make_blinding;
using schemata::testing::make_hash;


TEST(pedersen, commitment_opens_to_its_value) {
  SCHEMATA_REQUIRE_SECP256K1();
  auto blinding = make_blinding(9);
  auto commitment = commit(1000, blinding);
  EXPECT_TRUE(verify_opening(commitment, 1000, blinding));
  EXPECT_FALSE(verify_opening(commitment, 1001, blinding));
  EXPECT_FALSE(verify_opening(commitment, 1000, make_blinding(10)));
}

TEST(pedersen, commitments_are_homomorphic) {
  SCHEMATA_REQUIRE_SECP256K1();
  auto inputs = std::array{commit(100, make_blinding(7))};
  auto outputs = std::array{commit(60, make_blinding(3)),
                            commit(40, make_blinding(4))};
  EXPECT_TRUE(verify_commit_sum(inputs, outputs));

  auto skewed = std::array{commit(60, make_blinding(3)),
                           commit(39, make_blinding(4))};
  EXPECT_FALSE(verify_commit_sum(inputs, skewed));
}

TEST(pedersen, empty_sides_balance) {
  SCHEMATA_REQUIRE_SECP256K1();
  EXPECT_TRUE(verify_commit_sum({}, {}));
}

TEST(pedersen, balance_blinding_closes_the_sum) {
  SCHEMATA_REQUIRE_SECP256K1();
  auto seed = make_hash(1);
  auto in = std::array{derive_blinding(seed, "in", 0),
                       derive_blinding(seed, "in", 1)};
  auto others = std::array{derive_blinding(seed, "out", 0)};
  auto last = balance_blinding(in, others);

  auto inputs = std::array{commit(70, in[0]), commit(30, in[1])};
  auto outputs = std::array{commit(55, others[0]), commit(45, last)};
  EXPECT_TRUE(verify_commit_sum(inputs, outputs));
}

TEST(pedersen, outputs_with_zero_total_blinding_open_to_the_value) {
  SCHEMATA_REQUIRE_SECP256K1();
  auto first = make_blinding(42);
  auto last = balance_blinding({}, std::array{first});
  auto outputs = std::array{commit(60, first), commit(40, last)};
  EXPECT_TRUE(verify_commit_value(outputs, 100));
  EXPECT_FALSE(verify_commit_value(outputs, 99));
}

TEST(pedersen, derived_blindings_are_deterministic_and_distinct) {
  SCHEMATA_REQUIRE_SECP256K1();
  auto seed = make_hash(5);
  EXPECT_EQ(derive_blinding(seed, "4000", 0), derive_blinding(seed, "4000", 0));
  EXPECT_NE(derive_blinding(seed, "4000", 0), derive_blinding(seed, "4000", 1));
  EXPECT_NE(derive_blinding(seed, "4000", 0), derive_blinding(seed, "4200", 0));
  EXPECT_NE(derive_blinding(seed, "4000", 0),
            derive_blinding(make_hash(6), "4000", 0));
}
