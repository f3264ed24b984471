#pragma once

#include <bastion/access/permission_oracle.hpp>
#include <bastion/access/state_store.hpp>
#include <bastion/access/time_source.hpp>
#include <bastion/schema/primitives.hpp>
#include <bastion/schema/role_state.hpp>
#include <bastion/schema/schedule_state.hpp>

#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace bastion::access {

inline constexpr std::string_view kGrantRoleSignature{
    "grantRole(uint64,address,uint32)"};
inline constexpr std::string_view kRevokeRoleSignature{
    "revokeRole(uint64,address)"};
inline constexpr std::string_view kSetRoleAdminSignature{
    "setRoleAdmin(uint64,uint64)"};
inline constexpr std::string_view kSetRoleGuardianSignature{
    "setRoleGuardian(uint64,uint64)"};
inline constexpr std::string_view kSetGrantDelaySignature{
    "setGrantDelay(uint64,uint32)"};
inline constexpr std::string_view kSetTargetFunctionRoleSignature{
    "setTargetFunctionRole(address,bytes4[],uint64)"};
inline constexpr std::string_view kSetTargetClosedSignature{
    "setTargetClosed(address,bool)"};

struct access_manager_config final {
  /// Target id of the registry and of the authorization core it serves.
  /// Administrative operations are scheduled against it.
  bastion::schema::target_id_t authority{};
  bastion::schema::account_id_t initial_admin{};
  /// Lifetime of a ready operation; zero disables expiry.
  bastion::schema::duration_seconds_t expiration{7 * 24 * 60 * 60};
  /// Floor for grant-delay and execution-delay decreases.
  bastion::schema::duration_seconds_t minimum_setback{5 * 24 * 60 * 60};
};

/// Membership as stored, with the delay split into its current and pending
/// halves.
struct member_access final {
  bastion::schema::timestamp_seconds_t since{};
  bastion::schema::duration_seconds_t current_delay{};
  bastion::schema::duration_seconds_t pending_delay{};
  bastion::schema::timestamp_seconds_t effect{};
};

/// Role-based permission registry with delayed execution.
///
/// Roles form a tree through their admin role, rooted at kAdminRole. A
/// member with a non-zero execution delay must schedule a call and have the
/// target consume it once the delay elapsed. Administrative operations
/// follow the same rule with the registry itself as the target.
class access_manager final : public permission_oracle,
                             public permission_configurator {
 public:
  /// Grants kAdminRole to `config.initial_admin` on first deployment. That
  /// grant is not subject to minimal execution delays.
  access_manager(state_store& store,
                 access_manager_config config,
                 time_source_t now);

  // permission_oracle
  access_decision check(
      const bastion::schema::account_id_t& caller,
      const bastion::schema::target_id_t& target,
      const bastion::schema::operation_id_t& operation) const override;
  void grant(const bastion::schema::account_id_t& caller,
             bastion::schema::role_id_t role,
             const bastion::schema::account_id_t& account,
             bastion::schema::duration_seconds_t execution_delay) override;
  scheduled_operation schedule(
      const bastion::schema::account_id_t& caller,
      const bastion::schema::target_id_t& target,
      const bastion::schema::bytes_t& data,
      bastion::schema::timestamp_seconds_t when) override;
  uint32_t consume(const consumption_context& context,
                   const bastion::schema::account_id_t& caller,
                   const bastion::schema::bytes_t& data) override;
  uint32_t cancel(const bastion::schema::account_id_t& sender,
                  const bastion::schema::account_id_t& caller,
                  const bastion::schema::target_id_t& target,
                  const bastion::schema::bytes_t& data) override;

  // permission_configurator
  void bind_function_role(const bastion::schema::target_id_t& target,
                          const bastion::schema::operation_id_t& operation,
                          bastion::schema::role_id_t role) override;
  void bind_role_admin(bastion::schema::role_id_t role,
                       bastion::schema::role_id_t admin) override;
  void bind_role_guardian(bastion::schema::role_id_t role,
                          bastion::schema::role_id_t guardian) override;
  void bind_target_closed(const bastion::schema::target_id_t& target,
                          bool closed) override;
  void bind_member(bastion::schema::role_id_t role,
                   const bastion::schema::account_id_t& account,
                   bastion::schema::duration_seconds_t delay) override;
  void set_function_role_guard(function_role_guard_t guard) override;
  void set_grant_guard(grant_guard_t guard) override;

  // Administrative operations. Each authorizes `caller` against the
  // registry as target and consumes a schedule when the caller is delayed.
  void grant_role(const bastion::schema::account_id_t& caller,
                  bastion::schema::role_id_t role,
                  const bastion::schema::account_id_t& account,
                  bastion::schema::duration_seconds_t execution_delay);
  void revoke_role(const bastion::schema::account_id_t& caller,
                   bastion::schema::role_id_t role,
                   const bastion::schema::account_id_t& account);
  /// `confirmation` must equal `caller`.
  void renounce_role(const bastion::schema::account_id_t& caller,
                     bastion::schema::role_id_t role,
                     const bastion::schema::account_id_t& confirmation);
  void set_role_admin(const bastion::schema::account_id_t& caller,
                      bastion::schema::role_id_t role,
                      bastion::schema::role_id_t admin);
  void set_role_guardian(const bastion::schema::account_id_t& caller,
                         bastion::schema::role_id_t role,
                         bastion::schema::role_id_t guardian);
  void set_grant_delay(const bastion::schema::account_id_t& caller,
                       bastion::schema::role_id_t role,
                       bastion::schema::duration_seconds_t delay);
  void set_target_function_role(
      const bastion::schema::account_id_t& caller,
      const bastion::schema::target_id_t& target,
      const std::vector<bastion::schema::operation_id_t>& operations,
      bastion::schema::role_id_t role);
  void set_target_closed(const bastion::schema::account_id_t& caller,
                         const bastion::schema::target_id_t& target,
                         bool closed);

  // Queries.
  bastion::schema::role_id_t get_role_admin(
      bastion::schema::role_id_t role) const;
  bastion::schema::role_id_t get_role_guardian(
      bastion::schema::role_id_t role) const;
  bastion::schema::duration_seconds_t get_role_grant_delay(
      bastion::schema::role_id_t role) const;
  std::optional<member_access> get_access(
      bastion::schema::role_id_t role,
      const bastion::schema::account_id_t& account) const;
  /// (is member, current execution delay). Every account holds kPublicRole.
  std::pair<bool, bastion::schema::duration_seconds_t> has_role(
      bastion::schema::role_id_t role,
      const bastion::schema::account_id_t& account) const;
  bastion::schema::role_id_t get_target_function_role(
      const bastion::schema::target_id_t& target,
      const bastion::schema::operation_id_t& operation) const;
  bool is_target_closed(const bastion::schema::target_id_t& target) const;
  /// Timepoint of a pending operation; zero when none or expired.
  bastion::schema::timestamp_seconds_t get_schedule(
      const bastion::schema::operation_hash_t& operation) const;
  uint32_t get_nonce(const bastion::schema::operation_hash_t& operation) const;
  bastion::schema::operation_hash_t hash_operation(
      const bastion::schema::account_id_t& caller,
      const bastion::schema::target_id_t& target,
      const bastion::schema::bytes_t& data) const;

  const bastion::schema::target_id_t& authority() const {
    return config_.authority;
  }
  bastion::schema::duration_seconds_t expiration() const {
    return config_.expiration;
  }
  bastion::schema::duration_seconds_t minimum_setback() const {
    return config_.minimum_setback;
  }

 private:
  bastion::schema::role_state_t role_state(
      bastion::schema::role_id_t role) const;
  access_decision can_call_extended(
      const bastion::schema::account_id_t& caller,
      const bastion::schema::target_id_t& target,
      const bastion::schema::bytes_t& data) const;
  std::optional<bastion::schema::role_id_t> admin_restriction(
      const bastion::schema::bytes_t& data) const;
  void authorize_admin(const bastion::schema::account_id_t& caller,
                       const bastion::schema::bytes_t& data);
  uint32_t consume_operation(const bastion::schema::operation_hash_t& hash);
  bool is_expired(bastion::schema::timestamp_seconds_t timepoint) const;
  void grant_member(bastion::schema::role_id_t role,
                    const bastion::schema::account_id_t& account,
                    bastion::schema::duration_seconds_t grant_delay,
                    bastion::schema::duration_seconds_t execution_delay);
  bool revoke_member(bastion::schema::role_id_t role,
                     const bastion::schema::account_id_t& account);

  state_store& store_;
  access_manager_config config_;
  time_source_t now_;
  function_role_guard_t function_role_guard_;
  grant_guard_t grant_guard_;

  table<bastion::schema::role_id_t, bastion::schema::role_state_t> roles_;
  table<std::pair<bastion::schema::role_id_t, bastion::schema::account_id_t>,
        bastion::schema::member_state_t>
      members_;
  table<std::pair<bastion::schema::target_id_t,
                  bastion::schema::operation_id_t>,
        bastion::schema::role_id_t>
      function_roles_;
  table<bastion::schema::target_id_t, uint8_t> closed_targets_;
  table<bastion::schema::operation_hash_t, bastion::schema::schedule_state_t>
      schedules_;

  bastion::schema::operation_id_t grant_role_op_;
  bastion::schema::operation_id_t revoke_role_op_;
  bastion::schema::operation_id_t set_role_admin_op_;
  bastion::schema::operation_id_t set_role_guardian_op_;
  bastion::schema::operation_id_t set_grant_delay_op_;
  bastion::schema::operation_id_t set_target_function_role_op_;
  bastion::schema::operation_id_t set_target_closed_op_;
};

}  // namespace bastion::access
