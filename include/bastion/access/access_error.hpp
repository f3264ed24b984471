#pragma once

#include <bastion/schema/access_error_code.hpp>
#include <bastion/schema/primitives.hpp>

#include <optional>
#include <stdexcept>
#include <string>

namespace bastion::access {

/// Domain failure of an access operation. Thrown before the enclosing write
/// scope commits, so the whole call is discarded. Parameters relevant to
/// the code are set; the rest stay empty.
class access_error final : public std::runtime_error {
 public:
  access_error(bastion::schema::access_error_code code, std::string message);

  bastion::schema::access_error_code code() const noexcept { return code_; }

  std::optional<bastion::schema::account_id_t> account;
  std::optional<bastion::schema::account_id_t> other_account;
  std::optional<bastion::schema::target_id_t> target;
  std::optional<bastion::schema::role_id_t> role;
  std::optional<bastion::schema::duration_seconds_t> delay;
  std::optional<bastion::schema::timestamp_seconds_t> unlock_time;
  std::optional<bastion::schema::operation_id_t> operation;
  std::optional<bastion::schema::operation_hash_t> operation_hash;

 private:
  bastion::schema::access_error_code code_;
};

access_error already_initialized();
access_error too_long_redemption_delay(
    bastion::schema::duration_seconds_t delay,
    bastion::schema::duration_seconds_t maximum);
access_error invalid_argument_length(std::size_t roles, std::size_t delays);
access_error admin_role_cycle(bastion::schema::role_id_t role,
                              bastion::schema::role_id_t admin);
access_error locked_role(bastion::schema::role_id_t role);
access_error locked_function_role(const bastion::schema::target_id_t& target,
                                  const bastion::schema::operation_id_t& op);
access_error invalid_call_data();
access_error access_managed_unauthorized(
    const bastion::schema::account_id_t& caller);
access_error unauthorized_account(const bastion::schema::account_id_t& caller,
                                  bastion::schema::role_id_t required_role);
access_error too_short_execution_delay_for_role(
    bastion::schema::role_id_t role,
    bastion::schema::duration_seconds_t delay);
access_error unauthorized_call(const bastion::schema::account_id_t& caller,
                               const bastion::schema::target_id_t& target,
                               const bastion::schema::operation_id_t& op);
access_error unauthorized_consume(const bastion::schema::target_id_t& target);
access_error unauthorized_cancel(const bastion::schema::account_id_t& sender,
                                 const bastion::schema::account_id_t& caller,
                                 const bastion::schema::target_id_t& target,
                                 const bastion::schema::operation_id_t& op);
access_error bad_confirmation();
access_error account_is_locked(bastion::schema::timestamp_seconds_t unlock_time);
access_error not_scheduled(const bastion::schema::operation_hash_t& operation);
access_error not_ready(const bastion::schema::operation_hash_t& operation);
access_error expired(const bastion::schema::operation_hash_t& operation);
access_error already_scheduled(
    const bastion::schema::operation_hash_t& operation);

}  // namespace bastion::access
