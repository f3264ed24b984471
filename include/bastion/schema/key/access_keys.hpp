#pragma once

#include <bastion/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema key type: access keys.
// Access workflow: every logical table lives at BLAKE3(namespace) followed by
// its fixed-width key. Namespaces are globally unique strings, so tables of
// the authorization core never alias registry tables or later extensions.
namespace bastion::schema::key {

inline constexpr std::string_view kRedemptionLocksNamespace{
    "bastion.storage.AuthorizationCore.RedemptionLocks"};
inline constexpr std::string_view kMinimalExecutionDelayNamespace{
    "bastion.storage.AuthorizationCore.MinimalExecutionDelayForRole"};
inline constexpr std::string_view kRedemptionDelayNamespace{
    "bastion.storage.AuthorizationCore.RedemptionDelay"};
inline constexpr std::string_view kInitializationNamespace{
    "bastion.storage.AuthorizationCore.InitializationFlag"};
inline constexpr std::string_view kVaultLatchNamespace{
    "bastion.storage.AuthorizationCore.VaultLatches"};
inline constexpr std::string_view kRoleNamespace{
    "bastion.storage.AccessManager.Roles"};
inline constexpr std::string_view kMemberNamespace{
    "bastion.storage.AccessManager.Members"};
inline constexpr std::string_view kFunctionRoleNamespace{
    "bastion.storage.AccessManager.TargetFunctionRoles"};
inline constexpr std::string_view kTargetNamespace{
    "bastion.storage.AccessManager.Targets"};
inline constexpr std::string_view kScheduleNamespace{
    "bastion.storage.AccessManager.Schedules"};
inline constexpr std::string_view kDeploymentNamespace{
    "bastion.storage.AccessManager.Deployment"};

inline constexpr std::array<std::string_view, 11> kAccessNamespaces{
    kRedemptionLocksNamespace, kMinimalExecutionDelayNamespace,
    kRedemptionDelayNamespace, kInitializationNamespace,
    kVaultLatchNamespace,      kRoleNamespace,
    kMemberNamespace,          kFunctionRoleNamespace,
    kTargetNamespace,          kScheduleNamespace,
    kDeploymentNamespace};

/// BLAKE3 of the namespace string; computed once per namespace.
const hash32_t& namespace_slot(std::string_view name);

/// True when every namespace in kAccessNamespaces hashes to a distinct slot.
bool namespace_slots_are_distinct();

bytes_t make_table_prefix(std::string_view name);

bytes_t make_redemption_lock_key(const account_id_t& account);
bytes_t make_minimal_execution_delay_key(role_id_t role);
bytes_t make_redemption_delay_key();
bytes_t make_initialization_key();
bytes_t make_vault_latch_key(const target_id_t& vault);

bytes_t make_role_key(role_id_t role);
bytes_t make_member_key(role_id_t role, const account_id_t& account);
bytes_t make_function_role_key(const target_id_t& target,
                               const operation_id_t& operation);
bytes_t make_target_key(const target_id_t& target);
bytes_t make_schedule_key(const operation_hash_t& operation);
bytes_t make_deployment_key();

}  // namespace bastion::schema::key
