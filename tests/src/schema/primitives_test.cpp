#include <gtest/gtest.h>
#include <bastion/schema/operation_id.hpp>
#include <bastion/schema/primitives.hpp>
#include <bastion/schema/role_id.hpp>

#include <set>

TEST(primitives, make_hash32_from_bytes_round_trips) {
  auto input = bastion::schema::bytes_t(32, 0xAB);
  auto hash = bastion::schema::make_hash32(input);
  EXPECT_EQ(hash.size(), 32u);
  EXPECT_EQ(hash[0], 0xAB);
  EXPECT_EQ(hash[31], 0xAB);
}

TEST(primitives, make_hash32_from_hex_string_decodes) {
  auto hash = bastion::schema::make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
  EXPECT_EQ(bastion::schema::to_hex(hash),
            "0102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f20");
}

TEST(primitives, try_make_hash32_rejects_malformed_hex) {
  EXPECT_FALSE(bastion::schema::try_make_hash32("0x0102").has_value());
  EXPECT_FALSE(bastion::schema::try_make_hash32(std::string(64, 'g')).has_value());
  EXPECT_FALSE(bastion::schema::try_make_hash32(std::string(63, '0')).has_value());
  EXPECT_TRUE(bastion::schema::try_make_hash32(std::string(64, 'F')).has_value());
}

TEST(primitives, make_zero_hash_returns_zero_bytes) {
  auto zero = bastion::schema::make_zero_hash();
  for (auto byte : zero) {
    EXPECT_EQ(byte, 0u);
  }
}

TEST(primitives, operation_ids_are_stable_and_distinct) {
  const auto& ops = bastion::schema::default_vault_operations();
  EXPECT_EQ(ops.deposit,
            bastion::schema::make_operation_id(bastion::schema::kDepositSignature));

  auto ids = std::set<bastion::schema::operation_id_t>{
      ops.deposit, ops.mint,   ops.deposit_with_permit, ops.withdraw,
      ops.redeem,  ops.transfer, ops.transfer_from};
  EXPECT_EQ(ids.size(), 7u);
}

TEST(primitives, try_operation_id_reads_payload_prefix) {
  auto payload = bastion::schema::bytes_t{0xDE, 0xAD, 0xBE, 0xEF, 0x01};
  auto id = bastion::schema::try_operation_id(bastion::schema::make_bytes_view(payload));
  ASSERT_TRUE(id.has_value());
  EXPECT_EQ(*id, (bastion::schema::operation_id_t{0xDE, 0xAD, 0xBE, 0xEF}));

  auto short_payload = bastion::schema::bytes_t{0xDE, 0xAD};
  EXPECT_FALSE(bastion::schema::try_operation_id(
                   bastion::schema::make_bytes_view(short_payload))
                   .has_value());
}

TEST(primitives, role_names_map_both_ways) {
  EXPECT_EQ(bastion::schema::role_name(bastion::schema::kAtomistRole), "atomist");
  EXPECT_EQ(bastion::schema::role_name(4242), "custom");
  EXPECT_EQ(bastion::schema::try_role_from_string("guardian").value_or(0),
            bastion::schema::kGuardianRole);
  EXPECT_EQ(bastion::schema::try_role_from_string("public").value_or(0),
            bastion::schema::kPublicRole);
  EXPECT_FALSE(bastion::schema::try_role_from_string("nobody").has_value());
}
