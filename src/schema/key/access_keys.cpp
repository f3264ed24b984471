#include <bastion/blake3/hash.hpp>
#include <bastion/common/critical.hpp>
#include <bastion/schema/key/access_keys.hpp>
#include <bastion/schema/key/builder.hpp>

#include <algorithm>
#include <map>
#include <set>
#include <span>

namespace bastion::schema::key {

namespace {

struct slot_table final {
  std::map<std::string_view, hash32_t> slots;

  slot_table() {
    for (const auto& name : kAccessNamespaces) {
      slots.emplace(name, bastion::blake3::hash(name));
    }
  }
};

const slot_table& slots() {
  static const auto table = slot_table{};
  return table;
}

builder make_builder(std::string_view name) {
  auto out = builder{};
  out.write(std::span<const uint8_t>{namespace_slot(name)});
  return out;
}

}  // namespace

const hash32_t& namespace_slot(std::string_view name) {
  auto it = slots().slots.find(name);
  if (it == std::end(slots().slots)) {
    bastion::common::critical("unknown storage namespace '{}'", name);
  }
  return it->second;
}

bool namespace_slots_are_distinct() {
  auto seen = std::set<hash32_t>{};
  for (const auto& name : kAccessNamespaces) {
    if (!seen.insert(namespace_slot(name)).second) {
      return false;
    }
  }
  return true;
}

bytes_t make_table_prefix(std::string_view name) {
  return make_builder(name).data;
}

bytes_t make_redemption_lock_key(const account_id_t& account) {
  return make_builder(kRedemptionLocksNamespace)
      .write(std::span<const uint8_t>{account})
      .data;
}

bytes_t make_minimal_execution_delay_key(role_id_t role) {
  return make_builder(kMinimalExecutionDelayNamespace).write(role).data;
}

bytes_t make_redemption_delay_key() {
  return make_table_prefix(kRedemptionDelayNamespace);
}

bytes_t make_initialization_key() {
  return make_table_prefix(kInitializationNamespace);
}

bytes_t make_vault_latch_key(const target_id_t& vault) {
  return make_builder(kVaultLatchNamespace)
      .write(std::span<const uint8_t>{vault})
      .data;
}

bytes_t make_role_key(role_id_t role) {
  return make_builder(kRoleNamespace).write(role).data;
}

bytes_t make_member_key(role_id_t role, const account_id_t& account) {
  return make_builder(kMemberNamespace)
      .write(role)
      .write(std::span<const uint8_t>{account})
      .data;
}

bytes_t make_function_role_key(const target_id_t& target,
                               const operation_id_t& operation) {
  return make_builder(kFunctionRoleNamespace)
      .write(std::span<const uint8_t>{target})
      .write(std::span<const uint8_t>{operation})
      .data;
}

bytes_t make_target_key(const target_id_t& target) {
  return make_builder(kTargetNamespace)
      .write(std::span<const uint8_t>{target})
      .data;
}

bytes_t make_schedule_key(const operation_hash_t& operation) {
  return make_builder(kScheduleNamespace)
      .write(std::span<const uint8_t>{operation})
      .data;
}

bytes_t make_deployment_key() {
  return make_table_prefix(kDeploymentNamespace);
}

}  // namespace bastion::schema::key
