#pragma once

#include <bastion/schema/event.hpp>
#include <bastion/schema/primitives.hpp>

#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>

namespace bastion::access {

inline constexpr std::string_view kRoleGrantedEvent{"role_granted"};
inline constexpr std::string_view kRoleRevokedEvent{"role_revoked"};
inline constexpr std::string_view kRoleAdminChangedEvent{"role_admin_changed"};
inline constexpr std::string_view kRoleGuardianChangedEvent{
    "role_guardian_changed"};
inline constexpr std::string_view kRoleGrantDelayChangedEvent{
    "role_grant_delay_changed"};
inline constexpr std::string_view kTargetFunctionRoleUpdatedEvent{
    "target_function_role_updated"};
inline constexpr std::string_view kTargetClosedEvent{"target_closed"};
inline constexpr std::string_view kOperationScheduledEvent{
    "operation_scheduled"};
inline constexpr std::string_view kOperationExecutedEvent{
    "operation_executed"};
inline constexpr std::string_view kOperationCanceledEvent{
    "operation_canceled"};
inline constexpr std::string_view kRedemptionDelayForAccountUpdatedEvent{
    "redemption_delay_for_account_updated"};
inline constexpr std::string_view kMinimalExecutionDelayUpdatedEvent{
    "minimal_execution_delay_updated"};
inline constexpr std::string_view kAccessInitializedEvent{
    "access_initialized"};

/// Build an event; the first attribute is marked as the index key.
inline bastion::schema::event_t make_event(
    const std::string_view type,
    std::initializer_list<std::pair<std::string_view, std::string>>
        attributes) {
  auto event = bastion::schema::event_t{};
  event.type = std::string{type};
  auto first = true;
  for (const auto& [key, value] : attributes) {
    event.attributes.push_back(bastion::schema::event_attribute_t{
        .key = std::string{key}, .value = value, .index = first});
    first = false;
  }
  return event;
}

inline std::string hex_value(const bastion::schema::bytes_view_t& bytes) {
  return "0x" + bastion::schema::to_hex(bytes);
}

}  // namespace bastion::access
