#pragma once

#include <bastion/schema/primitives.hpp>

#include <cstdint>
#include <functional>

namespace bastion::access {

/// Verdict of a permission check. `immediate` means the caller may proceed
/// now; otherwise a non-zero `delay` means the call must be scheduled and
/// consumed, and zero means it is denied.
struct access_decision final {
  bool immediate{};
  bastion::schema::duration_seconds_t delay{};
};

struct scheduled_operation final {
  bastion::schema::operation_hash_t hash{};
  uint32_t nonce{};
  bastion::schema::timestamp_seconds_t timepoint{};
};

/// Marker a target reports while it is consuming a scheduled operation.
const bastion::schema::operation_id_t& consuming_scheduled_op_marker();

/// A guarded target as seen by the registry during consumption.
class consumption_context {
 public:
  virtual ~consumption_context() = default;

  virtual const bastion::schema::target_id_t& target_id() const = 0;

  /// consuming_scheduled_op_marker() while consuming, zero bytes otherwise.
  virtual bastion::schema::operation_id_t is_consuming_scheduled_op() const = 0;
};

/// Role-based permission registry consumed by the authorization core.
class permission_oracle {
 public:
  virtual ~permission_oracle() = default;

  virtual access_decision check(
      const bastion::schema::account_id_t& caller,
      const bastion::schema::target_id_t& target,
      const bastion::schema::operation_id_t& operation) const = 0;

  /// Grant `role` to `account`; `caller` must administer `role`.
  virtual void grant(const bastion::schema::account_id_t& caller,
                     bastion::schema::role_id_t role,
                     const bastion::schema::account_id_t& account,
                     bastion::schema::duration_seconds_t execution_delay) = 0;

  /// Record `data` for later consumption by `target`. `when` of zero means
  /// as early as the caller's delay allows.
  virtual scheduled_operation schedule(
      const bastion::schema::account_id_t& caller,
      const bastion::schema::target_id_t& target,
      const bastion::schema::bytes_t& data,
      bastion::schema::timestamp_seconds_t when) = 0;

  /// Consume the operation `caller` scheduled on `context.target_id()`.
  /// Returns the nonce of the consumed operation.
  virtual uint32_t consume(const consumption_context& context,
                           const bastion::schema::account_id_t& caller,
                           const bastion::schema::bytes_t& data) = 0;

  /// Cancel a pending operation. `sender` must be the scheduler, an admin,
  /// or a guardian of the operation's role.
  virtual uint32_t cancel(const bastion::schema::account_id_t& sender,
                          const bastion::schema::account_id_t& caller,
                          const bastion::schema::target_id_t& target,
                          const bastion::schema::bytes_t& data) = 0;
};

/// Throws to refuse binding `role` to an operation of a target.
using function_role_guard_t =
    std::function<void(const bastion::schema::target_id_t&,
                       const bastion::schema::operation_id_t&,
                       bastion::schema::role_id_t)>;

/// Throws to refuse granting `role` with the given execution delay.
using grant_guard_t = std::function<void(bastion::schema::role_id_t,
                                         bastion::schema::duration_seconds_t)>;

/// Unchecked registry mutators reserved for the authorization core. The
/// core performs its own authorization before calling them.
class permission_configurator {
 public:
  virtual ~permission_configurator() = default;

  virtual void bind_function_role(
      const bastion::schema::target_id_t& target,
      const bastion::schema::operation_id_t& operation,
      bastion::schema::role_id_t role) = 0;

  virtual void bind_role_admin(bastion::schema::role_id_t role,
                               bastion::schema::role_id_t admin) = 0;

  virtual void bind_role_guardian(bastion::schema::role_id_t role,
                                  bastion::schema::role_id_t guardian) = 0;

  virtual void bind_target_closed(const bastion::schema::target_id_t& target,
                                  bool closed) = 0;

  /// Grant without admin checks and without grant delay.
  virtual void bind_member(bastion::schema::role_id_t role,
                           const bastion::schema::account_id_t& account,
                           bastion::schema::duration_seconds_t delay) = 0;

  virtual void set_function_role_guard(function_role_guard_t guard) = 0;

  /// Consulted by every authorized grant, bind_member excluded.
  virtual void set_grant_guard(grant_guard_t guard) = 0;
};

}  // namespace bastion::access
