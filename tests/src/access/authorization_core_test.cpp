#include <bastion/access/authorization_core.hpp>
#include <bastion/access/call_data.hpp>
#include <bastion/access/events.hpp>
#include <bastion/testing/access_fixture.hpp>
#include <gtest/gtest.h>

#include <vector>

namespace {

using namespace bastion::schema;
using bastion::testing::access_fixture;
using bastion::testing::capture_access_error;
using bastion::testing::make_account;

const auto kOwner = make_account(0x02);
const auto kGuardian = make_account(0x03);
const auto kAlice = make_account(0x10);
const auto kStranger = make_account(0x12);

/// Forwards to an access_manager and records the marker reported by the
/// consuming target.
class recording_oracle final : public bastion::access::permission_oracle {
 public:
  explicit recording_oracle(bastion::access::access_manager& inner)
      : inner_{inner} {}

  bastion::access::access_decision check(
      const account_id_t& caller,
      const target_id_t& target,
      const operation_id_t& operation) const override {
    return inner_.check(caller, target, operation);
  }
  void grant(const account_id_t& caller,
             const role_id_t role,
             const account_id_t& account,
             const duration_seconds_t delay) override {
    inner_.grant(caller, role, account, delay);
  }
  bastion::access::scheduled_operation schedule(
      const account_id_t& caller,
      const target_id_t& target,
      const bytes_t& data,
      const timestamp_seconds_t when) override {
    return inner_.schedule(caller, target, data, when);
  }
  uint32_t consume(const bastion::access::consumption_context& context,
                   const account_id_t& caller,
                   const bytes_t& data) override {
    observed.push_back(context.is_consuming_scheduled_op());
    return inner_.consume(context, caller, data);
  }
  uint32_t cancel(const account_id_t& sender,
                  const account_id_t& caller,
                  const target_id_t& target,
                  const bytes_t& data) override {
    return inner_.cancel(sender, caller, target, data);
  }

  std::vector<operation_id_t> observed;

 private:
  bastion::access::access_manager& inner_;
};

void initialize_default(access_fixture& fixture) {
  fixture.core().initialize(access_fixture::admin(),
                            fixture.default_bootstrap());
  fixture.core().grant_role(kOwner, kAtomistRole, kAlice, 0);
}

}  // namespace

TEST(authorization_core, initialize_wires_bootstrap_state) {
  auto fixture = access_fixture{"bastion_core_initialize"};
  auto& manager = fixture.manager();
  fixture.core().initialize(access_fixture::admin(), fixture.default_bootstrap());

  EXPECT_TRUE(fixture.core().is_initialized());
  EXPECT_EQ(manager.get_target_function_role(access_fixture::vault(),
                                             fixture.operations().deposit),
            kAtomistRole);
  EXPECT_EQ(manager.get_target_function_role(
                access_fixture::authority(),
                make_operation_id(bastion::access::kUpdateTargetClosedSignature)),
            kGuardianRole);
  EXPECT_EQ(manager.get_role_guardian(kAtomistRole), kGuardianRole);
  EXPECT_EQ(manager.get_role_guardian(kGuardianRole), kAdminRole);
  EXPECT_EQ(manager.get_role_admin(kAtomistRole), kOwnerRole);
  EXPECT_TRUE(manager.has_role(kOwnerRole, kOwner).first);
  EXPECT_TRUE(manager.has_role(kGuardianRole, kGuardian).first);
  EXPECT_EQ(fixture.count_events(bastion::access::kAccessInitializedEvent), 1u);
}

TEST(authorization_core, initialize_succeeds_only_once) {
  auto fixture = access_fixture{"bastion_core_initialize_once"};
  auto& manager = fixture.manager();
  const auto& ops = fixture.operations();
  fixture.core().initialize(access_fixture::admin(), fixture.default_bootstrap());
  const auto events = fixture.events().size();

  auto conflicting = initialization_data_t{};
  conflicting.role_to_functions.push_back(role_function_binding_t{
      .target = access_fixture::vault(),
      .operation = ops.deposit,
      .role = kAlphaRole,
      .minimal_execution_delay = 3600});
  conflicting.admin_roles.push_back(
      admin_role_binding_t{.role = kAtomistRole, .admin_role = kAlphaRole});
  conflicting.account_to_roles.push_back(account_role_grant_t{
      .role = kAlphaRole, .account = kAlice, .execution_delay = 3600});

  for (const auto& caller : {access_fixture::admin(), kStranger}) {
    auto error = capture_access_error(
        [&] { fixture.core().initialize(caller, conflicting); });
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code(), access_error_code::already_initialized);
  }

  EXPECT_EQ(manager.get_target_function_role(access_fixture::vault(),
                                             ops.deposit),
            kAtomistRole);
  EXPECT_EQ(manager.get_role_admin(kAtomistRole), kOwnerRole);
  EXPECT_EQ(manager.get_role_guardian(kAlphaRole), kAdminRole);
  EXPECT_EQ(fixture.core().get_minimal_execution_delay_for_role(kAlphaRole), 0u);
  EXPECT_FALSE(manager.has_role(kAlphaRole, kAlice).first);
  EXPECT_TRUE(manager.has_role(kOwnerRole, kOwner).first);
  EXPECT_EQ(fixture.events().size(), events);
}

TEST(authorization_core, initialize_is_restricted) {
  auto fixture = access_fixture{"bastion_core_initialize_restricted"};
  auto error = capture_access_error([&] {
    fixture.core().initialize(kStranger, fixture.default_bootstrap());
  });
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code(), access_error_code::access_managed_unauthorized);
  EXPECT_EQ(error->account, kStranger);
  EXPECT_FALSE(fixture.core().is_initialized());
}

TEST(authorization_core, failed_initialize_leaves_no_trace) {
  auto fixture = access_fixture{"bastion_core_initialize_rollback"};
  auto data = initialization_data_t{};
  data.role_to_functions.push_back(role_function_binding_t{
      .target = access_fixture::vault(),
      .operation = fixture.operations().withdraw,
      .role = kAlphaRole,
      .minimal_execution_delay = 3600});
  data.account_to_roles.push_back(account_role_grant_t{
      .role = kAlphaRole, .account = kAlice, .execution_delay = 0});

  auto error = capture_access_error(
      [&] { fixture.core().initialize(access_fixture::admin(), data); });
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code(), access_error_code::too_short_execution_delay_for_role);

  EXPECT_FALSE(fixture.core().is_initialized());
  EXPECT_EQ(fixture.manager().get_target_function_role(
                access_fixture::vault(), fixture.operations().withdraw),
            kAdminRole);
  EXPECT_EQ(fixture.core().get_minimal_execution_delay_for_role(kAlphaRole), 0u);
  EXPECT_TRUE(fixture.events().empty());
}

TEST(authorization_core, minimal_delay_floor_blocks_short_grants) {
  auto fixture = access_fixture{"bastion_core_delay_floor"};
  auto& core = fixture.core();
  core.set_minimal_execution_delays_for_roles(access_fixture::admin(), {7},
                                              {3600});

  auto error = capture_access_error(
      [&] { core.grant_role(access_fixture::admin(), 7, kAlice, 1800); });
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code(), access_error_code::too_short_execution_delay_for_role);
  EXPECT_EQ(error->role, role_id_t{7});
  EXPECT_EQ(error->delay, duration_seconds_t{1800});
  EXPECT_FALSE(fixture.manager().has_role(7, kAlice).first);

  core.grant_role(access_fixture::admin(), 7, kAlice, 3600);
  auto [member, delay] = fixture.manager().has_role(7, kAlice);
  EXPECT_TRUE(member);
  EXPECT_EQ(delay, 3600u);
}

TEST(authorization_core, registry_grants_respect_minimal_delay) {
  auto fixture = access_fixture{"bastion_core_registry_floor"};
  auto& manager = fixture.manager();
  fixture.core().set_minimal_execution_delays_for_roles(access_fixture::admin(),
                                                        {7}, {3600});

  auto direct = capture_access_error(
      [&] { manager.grant_role(access_fixture::admin(), 7, kAlice, 0); });
  ASSERT_TRUE(direct.has_value());
  EXPECT_EQ(direct->code(), access_error_code::too_short_execution_delay_for_role);
  EXPECT_FALSE(manager.has_role(7, kAlice).first);

  const auto slow_admin = make_account(0x20);
  manager.grant_role(access_fixture::admin(), kAdminRole, slow_admin, 600);
  auto data = bastion::access::make_call_data(
      make_operation_id(bastion::access::kGrantRoleSignature), role_id_t{7},
      kAlice, duration_seconds_t{0});
  auto scheduled =
      manager.schedule(slow_admin, access_fixture::authority(), data, 0);
  fixture.clock().advance(600);

  auto delayed = capture_access_error(
      [&] { manager.grant_role(slow_admin, 7, kAlice, 0); });
  ASSERT_TRUE(delayed.has_value());
  EXPECT_EQ(delayed->code(),
            access_error_code::too_short_execution_delay_for_role);
  EXPECT_FALSE(manager.has_role(7, kAlice).first);
  EXPECT_EQ(manager.get_schedule(scheduled.hash), scheduled.timepoint);

  manager.grant_role(access_fixture::admin(), 7, kAlice, 3600);
  EXPECT_EQ(manager.has_role(7, kAlice).second, 3600u);
}

TEST(authorization_core, raising_the_floor_keeps_existing_grants) {
  auto fixture = access_fixture{"bastion_core_floor_existing"};
  auto& core = fixture.core();
  core.grant_role(access_fixture::admin(), 7, kAlice, 3600);
  core.set_minimal_execution_delays_for_roles(access_fixture::admin(), {7},
                                              {7200});

  EXPECT_EQ(fixture.manager().has_role(7, kAlice).second, 3600u);
  EXPECT_EQ(core.get_minimal_execution_delay_for_role(7), 7200u);
}

TEST(authorization_core, batch_delay_update_is_independent_per_role) {
  auto fixture = access_fixture{"bastion_core_batch"};
  auto& core = fixture.core();
  core.set_minimal_execution_delays_for_roles(access_fixture::admin(), {7, 8},
                                              {100, 200});
  core.set_minimal_execution_delays_for_roles(access_fixture::admin(), {7},
                                              {50});

  EXPECT_EQ(core.get_minimal_execution_delay_for_role(7), 50u);
  EXPECT_EQ(core.get_minimal_execution_delay_for_role(8), 200u);
  EXPECT_EQ(
      fixture.count_events(bastion::access::kMinimalExecutionDelayUpdatedEvent),
      3u);

  auto error = capture_access_error([&] {
    core.set_minimal_execution_delays_for_roles(access_fixture::admin(), {7, 8},
                                                {1});
  });
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code(), access_error_code::invalid_argument_length);
  EXPECT_EQ(core.get_minimal_execution_delay_for_role(7), 50u);
}

TEST(authorization_core, deposit_locks_withdrawals_of_the_caller) {
  auto fixture = access_fixture{"bastion_core_lock", 600};
  initialize_default(fixture);
  auto& core = fixture.core();
  const auto& ops = fixture.operations();
  EXPECT_EQ(core.redemption_delay_in_seconds(), 600u);

  EXPECT_TRUE(
      core.can_call_and_update(kAlice, access_fixture::vault(), ops.deposit)
          .immediate);
  EXPECT_EQ(core.get_account_lock_time(kAlice), 1600u);

  fixture.clock().set(1500);
  auto error = capture_access_error([&] {
    core.can_call_and_update(kAlice, access_fixture::vault(), ops.withdraw);
  });
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code(), access_error_code::account_is_locked);
  EXPECT_EQ(error->unlock_time, timestamp_seconds_t{1600});

  fixture.clock().set(1600);
  EXPECT_TRUE(
      core.can_call_and_update(kAlice, access_fixture::vault(), ops.withdraw)
          .immediate);
}

TEST(authorization_core, denied_deposit_does_not_lock) {
  auto fixture = access_fixture{"bastion_core_denied_deposit", 600};
  initialize_default(fixture);
  auto& core = fixture.core();
  const auto& ops = fixture.operations();
  fixture.manager().set_target_function_role(access_fixture::admin(),
                                             access_fixture::vault(),
                                             {ops.withdraw}, kPublicRole);

  auto denied =
      core.can_call_and_update(kStranger, access_fixture::vault(), ops.deposit);
  EXPECT_FALSE(denied.immediate);
  EXPECT_EQ(denied.delay, 0u);
  EXPECT_EQ(core.get_account_lock_time(kStranger), 0u);
  EXPECT_EQ(fixture.count_events(
                bastion::access::kRedemptionDelayForAccountUpdatedEvent),
            0u);

  EXPECT_TRUE(
      core.can_call_and_update(kStranger, access_fixture::vault(), ops.withdraw)
          .immediate);
}

TEST(authorization_core, zero_redemption_delay_never_locks) {
  auto fixture = access_fixture{"bastion_core_no_lock"};
  initialize_default(fixture);
  const auto& ops = fixture.operations();

  fixture.core().can_call_and_update(kAlice, access_fixture::vault(),
                                     ops.deposit);
  EXPECT_EQ(fixture.core().get_account_lock_time(kAlice), 0u);
  EXPECT_TRUE(fixture.core()
                  .can_call_and_update(kAlice, access_fixture::vault(),
                                       ops.withdraw)
                  .immediate);
}

TEST(authorization_core, redemption_delay_is_bounded_at_construction) {
  auto path = bastion::testing::scoped_db_path{"bastion_core_bound"};
  auto storage =
      bastion::storage::make_storage<bastion::storage::rocksdb_storage_tag>(
          path.path());
  auto store = bastion::access::state_store{storage};
  auto clock = bastion::testing::manual_clock{};
  auto manager = bastion::access::access_manager{
      store,
      bastion::access::access_manager_config{
          .authority = access_fixture::authority(),
          .initial_admin = access_fixture::admin()},
      clock.source()};

  auto make_core = [&](const duration_seconds_t delay) {
    return bastion::access::authorization_core{
        store, manager, manager,
        bastion::access::authorization_config{
            .authority = access_fixture::authority(),
            .redemption_delay = delay},
        clock.source()};
  };

  EXPECT_EQ(make_core(604800).redemption_delay_in_seconds(), 604800u);
  auto error = capture_access_error([&] { make_core(604801); });
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code(), access_error_code::too_long_redemption_delay);
}

TEST(authorization_core, public_vault_conversion_is_one_way) {
  auto fixture = access_fixture{"bastion_core_public_vault"};
  initialize_default(fixture);
  auto& core = fixture.core();
  const auto& ops = fixture.operations();

  auto denied =
      core.can_call_and_update(kStranger, access_fixture::vault(), ops.deposit);
  EXPECT_FALSE(denied.immediate);
  EXPECT_EQ(denied.delay, 0u);

  core.convert_to_public_vault(access_fixture::admin(), access_fixture::vault());
  EXPECT_TRUE(core.is_public_vault(access_fixture::vault()));
  EXPECT_TRUE(
      core.can_call_and_update(kStranger, access_fixture::vault(), ops.deposit)
          .immediate);
  EXPECT_TRUE(
      core.can_call_and_update(kStranger, access_fixture::vault(), ops.mint)
          .immediate);
  EXPECT_FALSE(
      core.can_call_and_update(kStranger, access_fixture::vault(), ops.withdraw)
          .immediate);

  auto error = capture_access_error([&] {
    fixture.manager().set_target_function_role(
        access_fixture::admin(), access_fixture::vault(), {ops.deposit},
        kAtomistRole);
  });
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code(), access_error_code::locked_function_role);
  EXPECT_EQ(fixture.manager().get_target_function_role(access_fixture::vault(),
                                                       ops.deposit),
            kPublicRole);

  EXPECT_NO_THROW(core.convert_to_public_vault(access_fixture::admin(),
                                               access_fixture::vault()));
  EXPECT_TRUE(core.is_public_vault(access_fixture::vault()));
}

TEST(authorization_core, share_transfers_once_enabled_stay_public) {
  auto fixture = access_fixture{"bastion_core_transfers"};
  initialize_default(fixture);
  auto& core = fixture.core();
  const auto& ops = fixture.operations();

  EXPECT_FALSE(core.is_transfer_shares_enabled(access_fixture::vault()));
  core.enable_transfer_shares(access_fixture::admin(), access_fixture::vault());
  EXPECT_TRUE(core.is_transfer_shares_enabled(access_fixture::vault()));
  EXPECT_FALSE(core.is_public_vault(access_fixture::vault()));
  EXPECT_TRUE(core.can_call_and_update(kStranger, access_fixture::vault(),
                                       ops.transfer_from)
                  .immediate);

  auto error = capture_access_error([&] {
    fixture.manager().set_target_function_role(
        access_fixture::admin(), access_fixture::vault(),
        {ops.transfer, ops.transfer_from}, kAtomistRole);
  });
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code(), access_error_code::locked_function_role);
  EXPECT_EQ(fixture.manager().get_target_function_role(access_fixture::vault(),
                                                       ops.transfer),
            kPublicRole);
}

TEST(authorization_core, guardian_closes_targets) {
  auto fixture = access_fixture{"bastion_core_close"};
  initialize_default(fixture);
  auto& core = fixture.core();
  const auto& ops = fixture.operations();

  auto error = capture_access_error([&] {
    core.update_target_closed(kStranger, access_fixture::vault(), true);
  });
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code(), access_error_code::access_managed_unauthorized);

  core.update_target_closed(kGuardian, access_fixture::vault(), true);
  EXPECT_TRUE(fixture.manager().is_target_closed(access_fixture::vault()));
  EXPECT_FALSE(
      core.can_call_and_update(kAlice, access_fixture::vault(), ops.deposit)
          .immediate);
}

TEST(authorization_core, grant_role_requires_role_admin) {
  auto fixture = access_fixture{"bastion_core_grant_admin"};
  auto error = capture_access_error([&] {
    fixture.core().grant_role(kStranger, kAtomistRole, kAlice, 0);
  });
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code(), access_error_code::unauthorized_account);
}

TEST(authorization_core, delayed_restricted_call_is_consumed_inline) {
  auto path = bastion::testing::scoped_db_path{"bastion_core_consume"};
  auto storage =
      bastion::storage::make_storage<bastion::storage::rocksdb_storage_tag>(
          path.path());
  auto store = bastion::access::state_store{storage};
  auto clock = bastion::testing::manual_clock{};
  auto manager = bastion::access::access_manager{
      store,
      bastion::access::access_manager_config{
          .authority = access_fixture::authority(),
          .initial_admin = access_fixture::admin()},
      clock.source()};
  auto oracle = recording_oracle{manager};
  auto core = bastion::access::authorization_core{
      store, oracle, manager,
      bastion::access::authorization_config{
          .authority = access_fixture::authority()},
      clock.source()};
  const auto slow_admin = make_account(0x20);
  manager.grant_role(access_fixture::admin(), kAdminRole, slow_admin, 600);

  auto direct = capture_access_error([&] {
    core.update_target_closed(slow_admin, access_fixture::vault(), true);
  });
  ASSERT_TRUE(direct.has_value());
  EXPECT_EQ(direct->code(), access_error_code::not_scheduled);
  EXPECT_EQ(core.is_consuming_scheduled_op(), operation_id_t{});

  auto data = bastion::access::make_call_data(
      make_operation_id(bastion::access::kUpdateTargetClosedSignature),
      access_fixture::vault(), true);
  core.schedule_operation(slow_admin, access_fixture::authority(), data, 0);
  clock.advance(600);
  core.update_target_closed(slow_admin, access_fixture::vault(), true);

  EXPECT_TRUE(manager.is_target_closed(access_fixture::vault()));
  EXPECT_EQ(core.is_consuming_scheduled_op(), operation_id_t{});
  ASSERT_EQ(oracle.observed.size(), 2u);
  EXPECT_EQ(oracle.observed[0], bastion::access::consuming_scheduled_op_marker());
  EXPECT_EQ(oracle.observed[1], bastion::access::consuming_scheduled_op_marker());
}
