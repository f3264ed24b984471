#include <bastion/access/access_error.hpp>
#include <bastion/access/access_manager.hpp>
#include <bastion/access/call_data.hpp>
#include <bastion/access/events.hpp>
#include <bastion/blake3/hash.hpp>
#include <bastion/schema/key/access_keys.hpp>
#include <bastion/schema/operation_id.hpp>
#include <bastion/schema/role_id.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>
#include <tuple>

using namespace bastion::schema;

namespace bastion::access {

namespace {

using member_key_t = std::pair<role_id_t, account_id_t>;
using function_key_t = std::pair<target_id_t, operation_id_t>;

bool is_locked_for_administration(const role_id_t role) {
  return role == kAdminRole || role == kPublicRole;
}

}  // namespace

const operation_id_t& consuming_scheduled_op_marker() {
  static const auto marker = make_operation_id("isConsumingScheduledOp()");
  return marker;
}

access_manager::access_manager(state_store& store,
                               access_manager_config config,
                               time_source_t now)
    : store_{store},
      config_{std::move(config)},
      now_{std::move(now)},
      roles_{store,
             [](const role_id_t& role) { return key::make_role_key(role); }},
      members_{store,
               [](const member_key_t& member) {
                 return key::make_member_key(member.first, member.second);
               }},
      function_roles_{store,
                      [](const function_key_t& function) {
                        return key::make_function_role_key(function.first,
                                                           function.second);
                      }},
      closed_targets_{store,
                      [](const target_id_t& target) {
                        return key::make_target_key(target);
                      }},
      schedules_{store,
                 [](const operation_hash_t& hash) {
                   return key::make_schedule_key(hash);
                 }},
      grant_role_op_{make_operation_id(kGrantRoleSignature)},
      revoke_role_op_{make_operation_id(kRevokeRoleSignature)},
      set_role_admin_op_{make_operation_id(kSetRoleAdminSignature)},
      set_role_guardian_op_{make_operation_id(kSetRoleGuardianSignature)},
      set_grant_delay_op_{make_operation_id(kSetGrantDelaySignature)},
      set_target_function_role_op_{
          make_operation_id(kSetTargetFunctionRoleSignature)},
      set_target_closed_op_{make_operation_id(kSetTargetClosedSignature)} {
  auto deployment = slot<account_id_t>{store_, key::make_deployment_key()};
  if (deployment.find()) {
    return;
  }
  // First deployment only: a later revocation of the initial admin must
  // survive a restart.
  auto scope = state_store::write_scope{store_};
  grant_member(kAdminRole, config_.initial_admin, 0, 0);
  deployment.set(config_.initial_admin);
  scope.commit();
}

role_state_t access_manager::role_state(const role_id_t role) const {
  return roles_.get_or(role, role_state_t{});
}

role_id_t access_manager::get_role_admin(const role_id_t role) const {
  return role_state(role).admin;
}

role_id_t access_manager::get_role_guardian(const role_id_t role) const {
  return role_state(role).guardian;
}

duration_seconds_t access_manager::get_role_grant_delay(
    const role_id_t role) const {
  return current_delay(role_state(role).grant_delay, now_());
}

std::optional<member_access> access_manager::get_access(
    const role_id_t role,
    const account_id_t& account) const {
  auto member = members_.find({role, account});
  if (!member) {
    return std::nullopt;
  }
  auto now = now_();
  auto pending = member->execution_delay.effect > now;
  return member_access{
      .since = member->since,
      .current_delay = current_delay(member->execution_delay, now),
      .pending_delay = pending ? member->execution_delay.value_after : 0,
      .effect = pending ? member->execution_delay.effect : 0};
}

std::pair<bool, duration_seconds_t> access_manager::has_role(
    const role_id_t role,
    const account_id_t& account) const {
  if (role == kPublicRole) {
    return {true, 0};
  }
  auto member = members_.find({role, account});
  auto now = now_();
  if (!member || member->since > now) {
    return {false, 0};
  }
  return {true, current_delay(member->execution_delay, now)};
}

role_id_t access_manager::get_target_function_role(
    const target_id_t& target,
    const operation_id_t& operation) const {
  return function_roles_.get_or({target, operation}, kAdminRole);
}

bool access_manager::is_target_closed(const target_id_t& target) const {
  return closed_targets_.get_or(target, 0) != 0;
}

bool access_manager::is_expired(const timestamp_seconds_t timepoint) const {
  auto now = now_();
  return config_.expiration > 0 && timepoint <= now &&
         now - timepoint >= config_.expiration;
}

timestamp_seconds_t access_manager::get_schedule(
    const operation_hash_t& operation) const {
  auto timepoint = schedules_.get_or(operation, schedule_state_t{}).timepoint;
  return is_expired(timepoint) ? 0 : timepoint;
}

uint32_t access_manager::get_nonce(const operation_hash_t& operation) const {
  return schedules_.get_or(operation, schedule_state_t{}).nonce;
}

operation_hash_t access_manager::hash_operation(const account_id_t& caller,
                                                const target_id_t& target,
                                                const bytes_t& data) const {
  auto encoded = store_.encoder().encode(std::tuple{caller, target, data});
  return bastion::blake3::hash(bytes_view_t{encoded.data(), encoded.size()});
}

access_decision access_manager::check(const account_id_t& caller,
                                      const target_id_t& target,
                                      const operation_id_t& operation) const {
  if (is_target_closed(target)) {
    return {};
  }
  auto [member, delay] =
      has_role(get_target_function_role(target, operation), caller);
  if (!member) {
    return {};
  }
  return access_decision{.immediate = delay == 0, .delay = delay};
}

std::optional<role_id_t> access_manager::admin_restriction(
    const bytes_t& data) const {
  auto operation = try_operation_id(make_bytes_view(data));
  if (!operation) {
    return std::nullopt;
  }
  if (*operation == grant_role_op_ || *operation == revoke_role_op_) {
    // The managed role is the first argument.
    constexpr auto kRoleEnd = sizeof(operation_id_t) + sizeof(role_id_t);
    if (data.size() < kRoleEnd) {
      throw invalid_call_data();
    }
    auto role = store_.encoder().try_decode<role_id_t>(
        bytes_view_t{data.data() + sizeof(operation_id_t), sizeof(role_id_t)});
    if (!role) {
      throw invalid_call_data();
    }
    return get_role_admin(*role);
  }
  if (*operation == set_role_admin_op_ || *operation == set_role_guardian_op_ ||
      *operation == set_grant_delay_op_ ||
      *operation == set_target_function_role_op_ ||
      *operation == set_target_closed_op_) {
    return kAdminRole;
  }
  return std::nullopt;
}

access_decision access_manager::can_call_extended(const account_id_t& caller,
                                                  const target_id_t& target,
                                                  const bytes_t& data) const {
  if (target == config_.authority) {
    if (auto required = admin_restriction(data)) {
      auto [member, delay] = has_role(*required, caller);
      if (!member) {
        return {};
      }
      return access_decision{.immediate = delay == 0, .delay = delay};
    }
  }
  auto operation = try_operation_id(make_bytes_view(data));
  if (!operation) {
    return {};
  }
  return check(caller, target, *operation);
}

void access_manager::authorize_admin(const account_id_t& caller,
                                     const bytes_t& data) {
  auto decision = can_call_extended(caller, config_.authority, data);
  if (decision.immediate) {
    return;
  }
  if (decision.delay == 0) {
    auto required = admin_restriction(data).value_or(kAdminRole);
    spdlog::debug("Account {} lacks role {} for an administrative call",
                  to_hex(caller), required);
    throw unauthorized_account(caller, required);
  }
  consume_operation(hash_operation(caller, config_.authority, data));
}

scheduled_operation access_manager::schedule(const account_id_t& caller,
                                             const target_id_t& target,
                                             const bytes_t& data,
                                             const timestamp_seconds_t when) {
  auto operation = try_operation_id(make_bytes_view(data));
  if (!operation) {
    throw invalid_call_data();
  }

  auto scope = state_store::write_scope{store_};
  auto decision = can_call_extended(caller, target, data);
  auto now = now_();
  auto earliest = now + decision.delay;
  if (decision.delay == 0 || (when > 0 && when < earliest)) {
    throw unauthorized_call(caller, target, *operation);
  }
  auto timepoint = std::max(when, earliest);

  auto hash = hash_operation(caller, target, data);
  auto state = schedules_.get_or(hash, schedule_state_t{});
  if (state.timepoint != 0 && !is_expired(state.timepoint)) {
    throw already_scheduled(hash);
  }
  state.timepoint = timepoint;
  ++state.nonce;
  schedules_.set(hash, state);

  store_.emit(make_event(kOperationScheduledEvent,
                         {{"operation", hex_value(hash)},
                          {"nonce", std::to_string(state.nonce)},
                          {"schedule", std::to_string(timepoint)},
                          {"caller", hex_value(caller)},
                          {"target", hex_value(target)},
                          {"data", hex_value(make_bytes_view(data))}}));
  scope.commit();

  spdlog::info("Scheduled operation {} (nonce {}) for {}", to_hex(hash),
               state.nonce, timepoint);
  return scheduled_operation{
      .hash = hash, .nonce = state.nonce, .timepoint = timepoint};
}

uint32_t access_manager::consume(const consumption_context& context,
                                 const account_id_t& caller,
                                 const bytes_t& data) {
  const auto& target = context.target_id();
  if (context.is_consuming_scheduled_op() != consuming_scheduled_op_marker()) {
    throw unauthorized_consume(target);
  }
  auto scope = state_store::write_scope{store_};
  auto nonce = consume_operation(hash_operation(caller, target, data));
  scope.commit();
  return nonce;
}

uint32_t access_manager::consume_operation(const operation_hash_t& hash) {
  auto state = schedules_.get_or(hash, schedule_state_t{});
  if (state.timepoint == 0) {
    throw not_scheduled(hash);
  }
  if (state.timepoint > now_()) {
    throw not_ready(hash);
  }
  if (is_expired(state.timepoint)) {
    throw expired(hash);
  }
  state.timepoint = 0;
  schedules_.set(hash, state);
  store_.emit(make_event(kOperationExecutedEvent,
                         {{"operation", hex_value(hash)},
                          {"nonce", std::to_string(state.nonce)}}));
  spdlog::info("Consumed operation {} (nonce {})", to_hex(hash), state.nonce);
  return state.nonce;
}

uint32_t access_manager::cancel(const account_id_t& sender,
                                const account_id_t& caller,
                                const target_id_t& target,
                                const bytes_t& data) {
  auto operation = try_operation_id(make_bytes_view(data));
  if (!operation) {
    throw invalid_call_data();
  }

  auto scope = state_store::write_scope{store_};
  auto hash = hash_operation(caller, target, data);
  auto state = schedules_.get_or(hash, schedule_state_t{});
  if (state.timepoint == 0) {
    throw not_scheduled(hash);
  }
  if (sender != caller) {
    auto is_admin = has_role(kAdminRole, sender).first;
    auto guardian =
        get_role_guardian(get_target_function_role(target, *operation));
    auto is_guardian = has_role(guardian, sender).first;
    if (!is_admin && !is_guardian) {
      throw unauthorized_cancel(sender, caller, target, *operation);
    }
  }
  state.timepoint = 0;
  schedules_.set(hash, state);
  store_.emit(make_event(kOperationCanceledEvent,
                         {{"operation", hex_value(hash)},
                          {"nonce", std::to_string(state.nonce)}}));
  scope.commit();

  spdlog::info("Canceled operation {} (nonce {})", to_hex(hash), state.nonce);
  return state.nonce;
}

void access_manager::grant_member(const role_id_t role,
                                  const account_id_t& account,
                                  const duration_seconds_t grant_delay,
                                  const duration_seconds_t execution_delay) {
  if (role == kPublicRole) {
    throw locked_role(role);
  }
  auto now = now_();
  auto existing = members_.find({role, account});
  auto member = member_state_t{};
  auto newly_granted = !existing.has_value();
  if (newly_granted) {
    member.since = now + grant_delay;
    member.execution_delay = make_delay(execution_delay);
  } else {
    member = *existing;
    member.execution_delay =
        with_update(member.execution_delay, now, execution_delay, 0).first;
  }
  members_.set({role, account}, member);

  store_.emit(make_event(kRoleGrantedEvent,
                         {{"role", std::to_string(role)},
                          {"account", hex_value(account)},
                          {"delay", std::to_string(execution_delay)},
                          {"since", std::to_string(member.since)},
                          {"new_member", newly_granted ? "true" : "false"}}));
  spdlog::info("Granted role {} ({}) to {} with execution delay {}s", role,
               role_name(role), to_hex(account), execution_delay);
}

bool access_manager::revoke_member(const role_id_t role,
                                   const account_id_t& account) {
  if (role == kPublicRole) {
    throw locked_role(role);
  }
  if (!members_.find({role, account})) {
    return false;
  }
  members_.erase({role, account});
  store_.emit(make_event(kRoleRevokedEvent, {{"role", std::to_string(role)},
                                             {"account", hex_value(account)}}));
  spdlog::info("Revoked role {} ({}) from {}", role, role_name(role),
               to_hex(account));
  return true;
}

void access_manager::grant(const account_id_t& caller,
                           const role_id_t role,
                           const account_id_t& account,
                           const duration_seconds_t execution_delay) {
  grant_role(caller, role, account, execution_delay);
}

void access_manager::grant_role(const account_id_t& caller,
                                const role_id_t role,
                                const account_id_t& account,
                                const duration_seconds_t execution_delay) {
  auto scope = state_store::write_scope{store_};
  if (grant_guard_) {
    grant_guard_(role, execution_delay);
  }
  authorize_admin(caller, make_call_data(grant_role_op_, role, account,
                                         execution_delay));
  grant_member(role, account,
               current_delay(role_state(role).grant_delay, now_()),
               execution_delay);
  scope.commit();
}

void access_manager::revoke_role(const account_id_t& caller,
                                 const role_id_t role,
                                 const account_id_t& account) {
  auto scope = state_store::write_scope{store_};
  authorize_admin(caller, make_call_data(revoke_role_op_, role, account));
  revoke_member(role, account);
  scope.commit();
}

void access_manager::renounce_role(const account_id_t& caller,
                                   const role_id_t role,
                                   const account_id_t& confirmation) {
  if (confirmation != caller) {
    throw bad_confirmation();
  }
  auto scope = state_store::write_scope{store_};
  revoke_member(role, caller);
  scope.commit();
}

void access_manager::set_role_admin(const account_id_t& caller,
                                    const role_id_t role,
                                    const role_id_t admin) {
  auto scope = state_store::write_scope{store_};
  authorize_admin(caller, make_call_data(set_role_admin_op_, role, admin));
  bind_role_admin(role, admin);
  scope.commit();
}

void access_manager::set_role_guardian(const account_id_t& caller,
                                       const role_id_t role,
                                       const role_id_t guardian) {
  auto scope = state_store::write_scope{store_};
  authorize_admin(caller,
                  make_call_data(set_role_guardian_op_, role, guardian));
  bind_role_guardian(role, guardian);
  scope.commit();
}

void access_manager::set_grant_delay(const account_id_t& caller,
                                     const role_id_t role,
                                     const duration_seconds_t delay) {
  auto scope = state_store::write_scope{store_};
  authorize_admin(caller, make_call_data(set_grant_delay_op_, role, delay));
  if (role == kPublicRole) {
    throw locked_role(role);
  }
  auto state = role_state(role);
  auto [updated, effect] =
      with_update(state.grant_delay, now_(), delay, config_.minimum_setback);
  state.grant_delay = updated;
  roles_.set(role, state);
  store_.emit(make_event(kRoleGrantDelayChangedEvent,
                         {{"role", std::to_string(role)},
                          {"delay", std::to_string(delay)},
                          {"since", std::to_string(effect)}}));
  scope.commit();
  spdlog::info("Grant delay of role {} set to {}s effective at {}", role,
               delay, effect);
}

void access_manager::set_target_function_role(
    const account_id_t& caller,
    const target_id_t& target,
    const std::vector<operation_id_t>& operations,
    const role_id_t role) {
  auto scope = state_store::write_scope{store_};
  authorize_admin(caller, make_call_data(set_target_function_role_op_, target,
                                         operations, role));
  for (const auto& operation : operations) {
    bind_function_role(target, operation, role);
  }
  scope.commit();
}

void access_manager::set_target_closed(const account_id_t& caller,
                                       const target_id_t& target,
                                       const bool closed) {
  auto scope = state_store::write_scope{store_};
  authorize_admin(caller, make_call_data(set_target_closed_op_, target,
                                         closed));
  bind_target_closed(target, closed);
  scope.commit();
}

void access_manager::bind_function_role(const target_id_t& target,
                                        const operation_id_t& operation,
                                        const role_id_t role) {
  if (function_role_guard_) {
    function_role_guard_(target, operation, role);
  }
  function_roles_.set({target, operation}, role);
  store_.emit(make_event(kTargetFunctionRoleUpdatedEvent,
                         {{"target", hex_value(target)},
                          {"operation", hex_value(operation)},
                          {"role", std::to_string(role)}}));
  spdlog::debug("Bound operation {} of {} to role {}", to_hex(operation),
                to_hex(target), role);
}

void access_manager::bind_role_admin(const role_id_t role,
                                     const role_id_t admin) {
  if (is_locked_for_administration(role)) {
    throw locked_role(role);
  }
  // Walk the parent chain from the new admin; reaching `role` would close a
  // loop. The chain is acyclic by construction and ends at kAdminRole.
  auto visited = std::set<role_id_t>{};
  for (auto current = admin; current != kAdminRole;
       current = get_role_admin(current)) {
    if (current == role) {
      throw admin_role_cycle(role, admin);
    }
    if (!visited.insert(current).second) {
      break;
    }
  }
  auto state = role_state(role);
  state.admin = admin;
  roles_.set(role, state);
  store_.emit(make_event(kRoleAdminChangedEvent,
                         {{"role", std::to_string(role)},
                          {"admin", std::to_string(admin)}}));
  spdlog::info("Admin of role {} ({}) set to {} ({})", role, role_name(role),
               admin, role_name(admin));
}

void access_manager::bind_role_guardian(const role_id_t role,
                                        const role_id_t guardian) {
  if (is_locked_for_administration(role)) {
    throw locked_role(role);
  }
  auto state = role_state(role);
  state.guardian = guardian;
  roles_.set(role, state);
  store_.emit(make_event(kRoleGuardianChangedEvent,
                         {{"role", std::to_string(role)},
                          {"guardian", std::to_string(guardian)}}));
  spdlog::debug("Guardian of role {} set to {}", role, guardian);
}

void access_manager::bind_target_closed(const target_id_t& target,
                                        const bool closed) {
  closed_targets_.set(target, closed ? 1 : 0);
  store_.emit(make_event(kTargetClosedEvent,
                         {{"target", hex_value(target)},
                          {"closed", closed ? "true" : "false"}}));
  spdlog::info("Target {} {}", to_hex(target), closed ? "closed" : "opened");
}

void access_manager::bind_member(const role_id_t role,
                                 const account_id_t& account,
                                 const duration_seconds_t delay) {
  grant_member(role, account, 0, delay);
}

void access_manager::set_function_role_guard(function_role_guard_t guard) {
  function_role_guard_ = std::move(guard);
}

void access_manager::set_grant_guard(grant_guard_t guard) {
  grant_guard_ = std::move(guard);
}

}  // namespace bastion::access
