#pragma once

#include <bastion/access/state_store.hpp>
#include <bastion/schema/primitives.hpp>

#include <vector>

namespace bastion::access {

/// Minimal execution delay that every member of a role must carry. Roles
/// without an entry have no minimum.
class execution_delay_registry final {
 public:
  explicit execution_delay_registry(state_store& store);

  bastion::schema::duration_seconds_t minimal_delay(
      bastion::schema::role_id_t role) const;

  void set_minimal_delay(bastion::schema::role_id_t role,
                         bastion::schema::duration_seconds_t delay);

  /// Pairwise update; fails with invalid_argument_length when the lists
  /// differ in size.
  void set_minimal_delays(
      const std::vector<bastion::schema::role_id_t>& roles,
      const std::vector<bastion::schema::duration_seconds_t>& delays);

  /// Throws too_short_execution_delay_for_role when `delay` is below the
  /// role's minimum.
  void require_at_least(bastion::schema::role_id_t role,
                        bastion::schema::duration_seconds_t delay) const;

 private:
  state_store& store_;
  table<bastion::schema::role_id_t, bastion::schema::duration_seconds_t>
      delays_;
};

}  // namespace bastion::access
