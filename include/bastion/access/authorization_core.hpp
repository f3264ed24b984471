#pragma once

#include <bastion/access/execution_delay_registry.hpp>
#include <bastion/access/initialization_guard.hpp>
#include <bastion/access/operation_classifier.hpp>
#include <bastion/access/permission_oracle.hpp>
#include <bastion/access/redemption_lock_ledger.hpp>
#include <bastion/access/state_store.hpp>
#include <bastion/access/time_source.hpp>
#include <bastion/schema/initialization_data.hpp>
#include <bastion/schema/operation_id.hpp>
#include <bastion/schema/primitives.hpp>
#include <bastion/schema/vault_latches.hpp>

#include <optional>
#include <string_view>
#include <vector>

namespace bastion::access {

inline constexpr std::string_view kInitializeSignature{
    "initialize((address,bytes4,uint64,uint32)[],(uint64,uint64)[],"
    "(uint64,address,uint32)[])"};
inline constexpr std::string_view kUpdateTargetClosedSignature{
    "updateTargetClosed(address,bool)"};
inline constexpr std::string_view kConvertToPublicVaultSignature{
    "convertToPublicVault(address)"};
inline constexpr std::string_view kEnableTransferSharesSignature{
    "enableTransferShares(address)"};
inline constexpr std::string_view kSetMinimalExecutionDelaysSignature{
    "setMinimalExecutionDelaysForRoles(uint64[],uint256[])"};

struct authorization_config final {
  /// Target id under which the core's own operations are permissioned.
  bastion::schema::target_id_t authority{};
  bastion::schema::duration_seconds_t redemption_delay{};
  bastion::schema::vault_operations operations{
      bastion::schema::default_vault_operations()};
  /// Defaults to operation_classifier::for_vault(operations).
  std::optional<operation_classifier> classifier;
};

/// Payload of `initialize`, as scheduled by a delayed admin.
bastion::schema::bytes_t make_initialize_call_data(
    const bastion::schema::initialization_data_t& data);

/// Access-control authority for a family of vaults.
///
/// Composes a permission oracle with the redemption lock ledger, the
/// minimal execution delay registry, the initialization latch and the
/// one-way vault latches. Restricted operations are permissioned on
/// `authority` like any other target, so delayed members schedule them and
/// the core consumes the schedule inline.
class authorization_core final : public consumption_context {
 public:
  /// Throws too_long_redemption_delay when the redemption delay exceeds
  /// redemption_lock_ledger::kMaxRedemptionDelay.
  authorization_core(state_store& store,
                     permission_oracle& oracle,
                     permission_configurator& configurator,
                     authorization_config config,
                     time_source_t now);
  ~authorization_core() override;

  authorization_core(const authorization_core&) = delete;
  authorization_core& operator=(const authorization_core&) = delete;

  void initialize(const bastion::schema::account_id_t& caller,
                  const bastion::schema::initialization_data_t& data);

  /// Redemption-lock check for `caller`, the oracle's verdict, then the
  /// deposit lock unless the verdict is a denial. Guarded targets call this
  /// exactly once per guarded call.
  access_decision can_call_and_update(
      const bastion::schema::account_id_t& caller,
      const bastion::schema::target_id_t& target,
      const bastion::schema::operation_id_t& operation);

  void update_target_closed(const bastion::schema::account_id_t& caller,
                            const bastion::schema::target_id_t& target,
                            bool closed);
  void convert_to_public_vault(const bastion::schema::account_id_t& caller,
                               const bastion::schema::target_id_t& vault);
  void enable_transfer_shares(const bastion::schema::account_id_t& caller,
                              const bastion::schema::target_id_t& vault);
  void set_minimal_execution_delays_for_roles(
      const bastion::schema::account_id_t& caller,
      const std::vector<bastion::schema::role_id_t>& roles,
      const std::vector<bastion::schema::duration_seconds_t>& delays);

  /// Enforces the role's minimal execution delay, then the oracle's
  /// admin-checked grant.
  void grant_role(const bastion::schema::account_id_t& caller,
                  bastion::schema::role_id_t role,
                  const bastion::schema::account_id_t& account,
                  bastion::schema::duration_seconds_t execution_delay);

  bastion::schema::duration_seconds_t get_minimal_execution_delay_for_role(
      bastion::schema::role_id_t role) const;
  bastion::schema::timestamp_seconds_t get_account_lock_time(
      const bastion::schema::account_id_t& account) const;
  bastion::schema::duration_seconds_t redemption_delay_in_seconds() const;
  bool is_initialized() const;
  bastion::schema::vault_latches_t vault_latches(
      const bastion::schema::target_id_t& vault) const;
  bool is_public_vault(const bastion::schema::target_id_t& vault) const;
  bool is_transfer_shares_enabled(
      const bastion::schema::target_id_t& vault) const;

  // consumption_context
  const bastion::schema::target_id_t& target_id() const override {
    return config_.authority;
  }
  bastion::schema::operation_id_t is_consuming_scheduled_op() const override;

  scheduled_operation schedule_operation(
      const bastion::schema::account_id_t& caller,
      const bastion::schema::target_id_t& target,
      const bastion::schema::bytes_t& data,
      bastion::schema::timestamp_seconds_t when);
  uint32_t cancel_scheduled_operation(
      const bastion::schema::account_id_t& sender,
      const bastion::schema::account_id_t& caller,
      const bastion::schema::target_id_t& target,
      const bastion::schema::bytes_t& data);
  uint32_t consume_scheduled_op(const consumption_context& context,
                                const bastion::schema::account_id_t& caller,
                                const bastion::schema::bytes_t& data);

  state_store& store() { return store_; }
  const bastion::schema::vault_operations& operations() const {
    return config_.operations;
  }

 private:
  void restricted(const bastion::schema::account_id_t& caller,
                  const bastion::schema::bytes_t& data);
  void guard_function_role(const bastion::schema::target_id_t& target,
                           const bastion::schema::operation_id_t& operation,
                           bastion::schema::role_id_t role) const;
  bool is_deposit_operation(
      const bastion::schema::operation_id_t& operation) const;
  bool is_transfer_operation(
      const bastion::schema::operation_id_t& operation) const;

  state_store& store_;
  permission_oracle& oracle_;
  permission_configurator& configurator_;
  authorization_config config_;
  time_source_t now_;
  redemption_lock_ledger ledger_;
  execution_delay_registry delays_;
  initialization_guard initialization_;
  table<bastion::schema::target_id_t, bastion::schema::vault_latches_t>
      latches_;
  bool consuming_{false};

  bastion::schema::operation_id_t initialize_op_;
  bastion::schema::operation_id_t update_target_closed_op_;
  bastion::schema::operation_id_t convert_to_public_vault_op_;
  bastion::schema::operation_id_t enable_transfer_shares_op_;
  bastion::schema::operation_id_t set_minimal_execution_delays_op_;
};

}  // namespace bastion::access
