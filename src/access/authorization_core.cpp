#include <bastion/access/access_error.hpp>
#include <bastion/access/authorization_core.hpp>
#include <bastion/access/call_data.hpp>
#include <bastion/access/consuming_scope.hpp>
#include <bastion/access/events.hpp>
#include <bastion/schema/key/access_keys.hpp>
#include <bastion/schema/role_id.hpp>

#include <spdlog/spdlog.h>

#include <set>
#include <tuple>
#include <utility>

using namespace bastion::schema;

namespace bastion::access {

bytes_t make_initialize_call_data(const initialization_data_t& data) {
  auto functions = std::vector<
      std::tuple<target_id_t, operation_id_t, role_id_t, duration_seconds_t>>{};
  for (const auto& binding : data.role_to_functions) {
    functions.emplace_back(binding.target, binding.operation, binding.role,
                           binding.minimal_execution_delay);
  }
  auto admins = std::vector<std::tuple<role_id_t, role_id_t>>{};
  for (const auto& binding : data.admin_roles) {
    admins.emplace_back(binding.role, binding.admin_role);
  }
  auto accounts =
      std::vector<std::tuple<role_id_t, account_id_t, duration_seconds_t>>{};
  for (const auto& grant : data.account_to_roles) {
    accounts.emplace_back(grant.role, grant.account, grant.execution_delay);
  }
  return make_call_data(make_operation_id(kInitializeSignature), functions,
                        admins, accounts);
}

authorization_core::authorization_core(state_store& store,
                                       permission_oracle& oracle,
                                       permission_configurator& configurator,
                                       authorization_config config,
                                       time_source_t now)
    : store_{store},
      oracle_{oracle},
      configurator_{configurator},
      config_{std::move(config)},
      now_{std::move(now)},
      ledger_{store,
              config_.classifier.value_or(
                  operation_classifier::for_vault(config_.operations)),
              config_.redemption_delay, now_},
      delays_{store},
      initialization_{store},
      latches_{store,
               [](const target_id_t& vault) {
                 return key::make_vault_latch_key(vault);
               }},
      initialize_op_{make_operation_id(kInitializeSignature)},
      update_target_closed_op_{make_operation_id(kUpdateTargetClosedSignature)},
      convert_to_public_vault_op_{
          make_operation_id(kConvertToPublicVaultSignature)},
      enable_transfer_shares_op_{
          make_operation_id(kEnableTransferSharesSignature)},
      set_minimal_execution_delays_op_{
          make_operation_id(kSetMinimalExecutionDelaysSignature)} {
  configurator_.set_function_role_guard(
      [this](const target_id_t& target, const operation_id_t& operation,
             const role_id_t role) {
        guard_function_role(target, operation, role);
      });
  configurator_.set_grant_guard(
      [this](const role_id_t role, const duration_seconds_t delay) {
        delays_.require_at_least(role, delay);
      });
  spdlog::info("Authorization core {} ready, redemption delay {}s",
               to_hex(config_.authority), ledger_.redemption_delay());
}

authorization_core::~authorization_core() {
  configurator_.set_function_role_guard(nullptr);
  configurator_.set_grant_guard(nullptr);
}

void authorization_core::restricted(const account_id_t& caller,
                                    const bytes_t& data) {
  auto operation = try_operation_id(make_bytes_view(data));
  if (!operation) {
    throw invalid_call_data();
  }
  auto decision = oracle_.check(caller, config_.authority, *operation);
  if (decision.immediate) {
    return;
  }
  if (decision.delay == 0) {
    spdlog::debug("Denied restricted call {} from {}", to_hex(*operation),
                  to_hex(caller));
    throw access_managed_unauthorized(caller);
  }
  auto consuming = consuming_scope{consuming_};
  oracle_.consume(*this, caller, data);
}

operation_id_t authorization_core::is_consuming_scheduled_op() const {
  return consuming_ ? consuming_scheduled_op_marker() : operation_id_t{};
}

void authorization_core::initialize(const account_id_t& caller,
                                    const initialization_data_t& data) {
  auto scope = state_store::write_scope{store_};
  initialization_.require_uninitialized();
  restricted(caller, make_initialize_call_data(data));
  initialization_.latch();

  auto roles = std::vector<role_id_t>{};
  auto delays = std::vector<duration_seconds_t>{};
  auto guarded_roles = std::set<role_id_t>{};
  for (const auto& binding : data.role_to_functions) {
    configurator_.bind_function_role(binding.target, binding.operation,
                                     binding.role);
    if (binding.role != kAdminRole && binding.role != kGuardianRole &&
        binding.role != kPublicRole &&
        guarded_roles.insert(binding.role).second) {
      configurator_.bind_role_guardian(binding.role, kGuardianRole);
    }
    roles.push_back(binding.role);
    delays.push_back(binding.minimal_execution_delay);
  }
  delays_.set_minimal_delays(roles, delays);

  for (const auto& binding : data.admin_roles) {
    configurator_.bind_role_admin(binding.role, binding.admin_role);
  }

  for (const auto& grant : data.account_to_roles) {
    delays_.require_at_least(grant.role, grant.execution_delay);
    configurator_.bind_member(grant.role, grant.account, grant.execution_delay);
  }

  store_.emit(make_event(
      kAccessInitializedEvent,
      {{"authority", hex_value(config_.authority)},
       {"functions", std::to_string(data.role_to_functions.size())},
       {"admin_roles", std::to_string(data.admin_roles.size())},
       {"grants", std::to_string(data.account_to_roles.size())}}));
  scope.commit();

  spdlog::info(
      "Initialized access control: {} function binding(s), {} admin role(s), "
      "{} grant(s)",
      data.role_to_functions.size(), data.admin_roles.size(),
      data.account_to_roles.size());
}

access_decision authorization_core::can_call_and_update(
    const account_id_t& caller,
    const target_id_t& target,
    const operation_id_t& operation) {
  auto scope = state_store::write_scope{store_};
  ledger_.require_unlocked(caller, operation);
  auto decision = oracle_.check(caller, target, operation);
  // A denied deposit leaves the caller's lock untouched.
  if (decision.immediate || decision.delay > 0) {
    ledger_.record_lock(caller, operation);
  }
  scope.commit();
  return decision;
}

void authorization_core::update_target_closed(const account_id_t& caller,
                                              const target_id_t& target,
                                              const bool closed) {
  auto scope = state_store::write_scope{store_};
  restricted(caller, make_call_data(update_target_closed_op_, target, closed));
  configurator_.bind_target_closed(target, closed);
  scope.commit();
}

void authorization_core::convert_to_public_vault(const account_id_t& caller,
                                                 const target_id_t& vault) {
  auto scope = state_store::write_scope{store_};
  restricted(caller, make_call_data(convert_to_public_vault_op_, vault));
  auto latches = vault_latches(vault);
  latches.deposit_access = deposit_access_t::public_access;
  latches_.set(vault, latches);
  for (const auto& operation :
       {config_.operations.deposit, config_.operations.mint,
        config_.operations.deposit_with_permit}) {
    configurator_.bind_function_role(vault, operation, kPublicRole);
  }
  scope.commit();
  spdlog::info("Vault {} converted to public deposits", to_hex(vault));
}

void authorization_core::enable_transfer_shares(const account_id_t& caller,
                                                const target_id_t& vault) {
  auto scope = state_store::write_scope{store_};
  restricted(caller, make_call_data(enable_transfer_shares_op_, vault));
  auto latches = vault_latches(vault);
  latches.share_transfer = share_transfer_t::enabled;
  latches_.set(vault, latches);
  for (const auto& operation :
       {config_.operations.transfer, config_.operations.transfer_from}) {
    configurator_.bind_function_role(vault, operation, kPublicRole);
  }
  scope.commit();
  spdlog::info("Share transfers enabled on vault {}", to_hex(vault));
}

void authorization_core::set_minimal_execution_delays_for_roles(
    const account_id_t& caller,
    const std::vector<role_id_t>& roles,
    const std::vector<duration_seconds_t>& delays) {
  auto scope = state_store::write_scope{store_};
  restricted(caller,
             make_call_data(set_minimal_execution_delays_op_, roles, delays));
  delays_.set_minimal_delays(roles, delays);
  scope.commit();
}

void authorization_core::grant_role(const account_id_t& caller,
                                    const role_id_t role,
                                    const account_id_t& account,
                                    const duration_seconds_t execution_delay) {
  auto scope = state_store::write_scope{store_};
  delays_.require_at_least(role, execution_delay);
  oracle_.grant(caller, role, account, execution_delay);
  scope.commit();
}

void authorization_core::guard_function_role(const target_id_t& target,
                                             const operation_id_t& operation,
                                             const role_id_t role) const {
  if (role == kPublicRole) {
    return;
  }
  auto latches = vault_latches(target);
  auto deposit_latched =
      latches.deposit_access == deposit_access_t::public_access &&
      is_deposit_operation(operation);
  auto transfer_latched =
      latches.share_transfer == share_transfer_t::enabled &&
      is_transfer_operation(operation);
  if (deposit_latched || transfer_latched) {
    throw locked_function_role(target, operation);
  }
}

bool authorization_core::is_deposit_operation(
    const operation_id_t& operation) const {
  return operation == config_.operations.deposit ||
         operation == config_.operations.mint ||
         operation == config_.operations.deposit_with_permit;
}

bool authorization_core::is_transfer_operation(
    const operation_id_t& operation) const {
  return operation == config_.operations.transfer ||
         operation == config_.operations.transfer_from;
}

duration_seconds_t authorization_core::get_minimal_execution_delay_for_role(
    const role_id_t role) const {
  return delays_.minimal_delay(role);
}

timestamp_seconds_t authorization_core::get_account_lock_time(
    const account_id_t& account) const {
  return ledger_.lock_time(account);
}

duration_seconds_t authorization_core::redemption_delay_in_seconds() const {
  return ledger_.redemption_delay();
}

bool authorization_core::is_initialized() const {
  return initialization_.is_initialized();
}

vault_latches_t authorization_core::vault_latches(
    const target_id_t& vault) const {
  return latches_.get_or(vault, vault_latches_t{});
}

bool authorization_core::is_public_vault(const target_id_t& vault) const {
  return vault_latches(vault).deposit_access == deposit_access_t::public_access;
}

bool authorization_core::is_transfer_shares_enabled(
    const target_id_t& vault) const {
  return vault_latches(vault).share_transfer == share_transfer_t::enabled;
}

scheduled_operation authorization_core::schedule_operation(
    const account_id_t& caller,
    const target_id_t& target,
    const bytes_t& data,
    const timestamp_seconds_t when) {
  return oracle_.schedule(caller, target, data, when);
}

uint32_t authorization_core::cancel_scheduled_operation(
    const account_id_t& sender,
    const account_id_t& caller,
    const target_id_t& target,
    const bytes_t& data) {
  return oracle_.cancel(sender, caller, target, data);
}

uint32_t authorization_core::consume_scheduled_op(
    const consumption_context& context,
    const account_id_t& caller,
    const bytes_t& data) {
  return oracle_.consume(context, caller, data);
}

}  // namespace bastion::access
