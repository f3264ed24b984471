#include <bastion/access/events.hpp>
#include <bastion/access/managed_target.hpp>
#include <bastion/testing/access_fixture.hpp>
#include <gtest/gtest.h>

#include <stdexcept>

namespace {

using namespace bastion::schema;
using bastion::access::managed_target;
using bastion::testing::access_fixture;
using bastion::testing::capture_access_error;
using bastion::testing::make_account;

const auto kOwner = make_account(0x02);
const auto kAlice = make_account(0x10);
const auto kSlowAtomist = make_account(0x11);
const auto kStranger = make_account(0x12);

void initialize_vault(access_fixture& fixture) {
  fixture.core().initialize(access_fixture::admin(),
                            fixture.default_bootstrap());
  fixture.core().grant_role(kOwner, kAtomistRole, kAlice, 0);
}

}  // namespace

TEST(managed_target, immediate_call_returns_body_result) {
  auto fixture = access_fixture{"bastion_target_immediate"};
  initialize_vault(fixture);
  auto vault = managed_target{fixture.core(), access_fixture::vault()};

  auto shares = vault.guarded_call(
      kAlice, access_fixture::vault_call(fixture.operations().deposit),
      [] { return uint64_t{42}; });
  EXPECT_EQ(shares, 42u);
}

TEST(managed_target, unauthorized_call_never_runs_body) {
  auto fixture = access_fixture{"bastion_target_unauthorized", 600};
  initialize_vault(fixture);
  auto vault = managed_target{fixture.core(), access_fixture::vault()};
  auto ran = false;

  auto error = capture_access_error([&] {
    vault.guarded_call(kStranger,
                       access_fixture::vault_call(fixture.operations().deposit),
                       [&] { ran = true; });
  });
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code(), access_error_code::access_managed_unauthorized);
  EXPECT_EQ(error->account, kStranger);
  EXPECT_FALSE(ran);
  EXPECT_EQ(fixture.core().get_account_lock_time(kStranger), 0u);
}

TEST(managed_target, delayed_member_consumes_own_schedule) {
  auto fixture = access_fixture{"bastion_target_delayed"};
  initialize_vault(fixture);
  fixture.core().grant_role(kOwner, kAtomistRole, kSlowAtomist, 600);
  auto vault = managed_target{fixture.core(), access_fixture::vault()};
  const auto data = access_fixture::vault_call(fixture.operations().deposit);

  auto early = capture_access_error(
      [&] { vault.check_can_call(kSlowAtomist, data); });
  ASSERT_TRUE(early.has_value());
  EXPECT_EQ(early->code(), access_error_code::not_scheduled);
  EXPECT_EQ(vault.is_consuming_scheduled_op(), operation_id_t{});

  auto scheduled =
      fixture.core().schedule_operation(kSlowAtomist, access_fixture::vault(),
                                        data, 0);
  EXPECT_EQ(scheduled.timepoint, 1600u);
  fixture.clock().advance(600);

  vault.guarded_call(kSlowAtomist, data, [] {});
  EXPECT_EQ(vault.is_consuming_scheduled_op(), operation_id_t{});
  EXPECT_EQ(fixture.manager().get_schedule(scheduled.hash), 0u);

  auto replay = capture_access_error(
      [&] { vault.check_can_call(kSlowAtomist, data); });
  ASSERT_TRUE(replay.has_value());
  EXPECT_EQ(replay->code(), access_error_code::not_scheduled);
}

TEST(managed_target, failed_body_discards_lock_update) {
  auto fixture = access_fixture{"bastion_target_rollback", 600};
  initialize_vault(fixture);
  auto vault = managed_target{fixture.core(), access_fixture::vault()};

  EXPECT_THROW(
      vault.guarded_call(
          kAlice, access_fixture::vault_call(fixture.operations().deposit),
          []() -> uint64_t { throw std::runtime_error{"deposit failed"}; }),
      std::runtime_error);
  EXPECT_EQ(fixture.core().get_account_lock_time(kAlice), 0u);
  EXPECT_EQ(fixture.count_events(
                bastion::access::kRedemptionDelayForAccountUpdatedEvent),
            0u);
}

TEST(managed_target, withdraw_after_deposit_is_locked) {
  auto fixture = access_fixture{"bastion_target_locked", 600};
  initialize_vault(fixture);
  auto vault = managed_target{fixture.core(), access_fixture::vault()};
  const auto& ops = fixture.operations();

  vault.guarded_call(kAlice, access_fixture::vault_call(ops.deposit), [] {});
  EXPECT_EQ(fixture.core().get_account_lock_time(kAlice), 1600u);

  fixture.clock().advance(599);
  auto error = capture_access_error([&] {
    vault.guarded_call(kAlice, access_fixture::vault_call(ops.redeem), [] {});
  });
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code(), access_error_code::account_is_locked);

  fixture.clock().advance(1);
  EXPECT_NO_THROW(vault.guarded_call(
      kAlice, access_fixture::vault_call(ops.redeem), [] {}));
}

TEST(managed_target, short_payload_is_rejected) {
  auto fixture = access_fixture{"bastion_target_short"};
  auto vault = managed_target{fixture.core(), access_fixture::vault()};

  auto error = capture_access_error(
      [&] { vault.check_can_call(kAlice, bytes_t{0x01, 0x02}); });
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code(), access_error_code::invalid_call_data);
}
