#include <gtest/gtest.h>
#include <bastion/blake3/hash.hpp>
#include <bastion/schema/key/access_keys.hpp>
#include <bastion/testing/common.hpp>

#include <algorithm>
#include <set>

using namespace bastion::schema;

TEST(access_keys, namespace_slots_are_distinct) {
  EXPECT_TRUE(key::namespace_slots_are_distinct());

  auto slots = std::set<hash32_t>{};
  for (const auto& name : key::kAccessNamespaces) {
    slots.insert(key::namespace_slot(name));
  }
  EXPECT_EQ(slots.size(), key::kAccessNamespaces.size());
}

TEST(access_keys, slot_is_blake3_of_namespace) {
  EXPECT_EQ(key::namespace_slot(key::kRedemptionLocksNamespace),
            bastion::blake3::hash(key::kRedemptionLocksNamespace));
}

TEST(access_keys, keys_start_with_their_table_slot) {
  auto account = bastion::testing::make_account(7);
  auto lock_key = key::make_redemption_lock_key(account);
  const auto& slot = key::namespace_slot(key::kRedemptionLocksNamespace);

  ASSERT_EQ(lock_key.size(), slot.size() + account.size());
  EXPECT_TRUE(std::equal(std::begin(slot), std::end(slot), std::begin(lock_key)));
  EXPECT_TRUE(std::equal(std::begin(account), std::end(account),
                         std::begin(lock_key) + slot.size()));
}

TEST(access_keys, same_id_in_different_tables_never_aliases) {
  EXPECT_NE(key::make_role_key(7), key::make_minimal_execution_delay_key(7));

  auto id = bastion::testing::make_hash(3);
  EXPECT_NE(key::make_redemption_lock_key(id), key::make_vault_latch_key(id));
  EXPECT_NE(key::make_target_key(id), key::make_schedule_key(id));
}

TEST(access_keys, member_keys_are_fixed_width) {
  auto first = key::make_member_key(1, bastion::testing::make_account(1));
  auto second = key::make_member_key(1'000'000, bastion::testing::make_account(2));
  EXPECT_EQ(first.size(), second.size());
  EXPECT_NE(first, second);
  EXPECT_NE(key::make_member_key(1, bastion::testing::make_account(1)),
            key::make_member_key(2, bastion::testing::make_account(1)));
}
