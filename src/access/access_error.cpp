#include <bastion/access/access_error.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <span>

using namespace bastion::schema;

namespace bastion::access {

namespace {

std::string short_hex(const std::span<const uint8_t>& bytes) {
  return to_hex(bytes.first(std::min<std::size_t>(bytes.size(), 8)));
}

}  // namespace

access_error::access_error(access_error_code code, std::string message)
    : std::runtime_error{std::move(message)}, code_{code} {}

access_error already_initialized() {
  return access_error{access_error_code::already_initialized,
                      "already initialized"};
}

access_error too_long_redemption_delay(duration_seconds_t delay,
                                       duration_seconds_t maximum) {
  auto error = access_error{
      access_error_code::too_long_redemption_delay,
      fmt::format("redemption delay {}s exceeds maximum {}s", delay, maximum)};
  error.delay = delay;
  return error;
}

access_error invalid_argument_length(std::size_t roles, std::size_t delays) {
  return access_error{
      access_error_code::invalid_argument_length,
      fmt::format("got {} role ids but {} delays", roles, delays)};
}

access_error admin_role_cycle(role_id_t role, role_id_t admin) {
  auto error = access_error{
      access_error_code::admin_role_cycle,
      fmt::format("admin role {} of role {} would form a cycle", admin, role)};
  error.role = role;
  return error;
}

access_error locked_role(role_id_t role) {
  auto error = access_error{access_error_code::locked_role,
                            fmt::format("role {} is locked", role)};
  error.role = role;
  return error;
}

access_error locked_function_role(const target_id_t& target,
                                  const operation_id_t& op) {
  auto error = access_error{
      access_error_code::locked_function_role,
      fmt::format("operation {} on target {} is latched public", to_hex(op),
                  short_hex(target))};
  error.target = target;
  error.operation = op;
  return error;
}

access_error invalid_call_data() {
  return access_error{access_error_code::invalid_call_data,
                      "call data shorter than an operation id"};
}

access_error access_managed_unauthorized(const account_id_t& caller) {
  auto error = access_error{
      access_error_code::access_managed_unauthorized,
      fmt::format("caller {} is not authorized", short_hex(caller))};
  error.account = caller;
  return error;
}

access_error unauthorized_account(const account_id_t& caller,
                                  role_id_t required_role) {
  auto error = access_error{
      access_error_code::unauthorized_account,
      fmt::format("account {} lacks role {}", short_hex(caller),
                  required_role)};
  error.account = caller;
  error.role = required_role;
  return error;
}

access_error too_short_execution_delay_for_role(role_id_t role,
                                                duration_seconds_t delay) {
  auto error = access_error{
      access_error_code::too_short_execution_delay_for_role,
      fmt::format("execution delay {}s too short for role {}", delay, role)};
  error.role = role;
  error.delay = delay;
  return error;
}

access_error unauthorized_call(const account_id_t& caller,
                               const target_id_t& target,
                               const operation_id_t& op) {
  auto error = access_error{
      access_error_code::unauthorized_call,
      fmt::format("account {} cannot schedule {} on {}", short_hex(caller),
                  to_hex(op), short_hex(target))};
  error.account = caller;
  error.target = target;
  error.operation = op;
  return error;
}

access_error unauthorized_consume(const target_id_t& target) {
  auto error = access_error{
      access_error_code::unauthorized_consume,
      fmt::format("target {} is not consuming a scheduled operation",
                  short_hex(target))};
  error.target = target;
  return error;
}

access_error unauthorized_cancel(const account_id_t& sender,
                                 const account_id_t& caller,
                                 const target_id_t& target,
                                 const operation_id_t& op) {
  auto error = access_error{
      access_error_code::unauthorized_cancel,
      fmt::format("account {} cannot cancel {} scheduled by {}",
                  short_hex(sender), to_hex(op), short_hex(caller))};
  error.account = sender;
  error.other_account = caller;
  error.target = target;
  error.operation = op;
  return error;
}

access_error bad_confirmation() {
  return access_error{access_error_code::bad_confirmation,
                      "renounce confirmation does not match caller"};
}

access_error account_is_locked(timestamp_seconds_t unlock_time) {
  auto error =
      access_error{access_error_code::account_is_locked,
                   fmt::format("account is locked until {}", unlock_time)};
  error.unlock_time = unlock_time;
  return error;
}

access_error not_scheduled(const operation_hash_t& operation) {
  auto error = access_error{
      access_error_code::not_scheduled,
      fmt::format("operation {} is not scheduled", short_hex(operation))};
  error.operation_hash = operation;
  return error;
}

access_error not_ready(const operation_hash_t& operation) {
  auto error = access_error{
      access_error_code::not_ready,
      fmt::format("operation {} is not ready", short_hex(operation))};
  error.operation_hash = operation;
  return error;
}

access_error expired(const operation_hash_t& operation) {
  auto error = access_error{
      access_error_code::expired,
      fmt::format("operation {} has expired", short_hex(operation))};
  error.operation_hash = operation;
  return error;
}

access_error already_scheduled(const operation_hash_t& operation) {
  auto error = access_error{
      access_error_code::already_scheduled,
      fmt::format("operation {} is already scheduled", short_hex(operation))};
  error.operation_hash = operation;
  return error;
}

}  // namespace bastion::access
