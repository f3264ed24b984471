#pragma once

#include <bastion/schema/delay.hpp>
#include <bastion/schema/primitives.hpp>
#include <bastion/schema/role_id.hpp>

// Schema type: role state.
// Access workflow: admin (parent pointer), guardian and grant delay of a
// role. Absent roles read as admin-administered with no guardian override.
namespace bastion::schema {

template <uint16_t Version>
struct role_state;

template <>
struct role_state<1> final {
  uint16_t version{1};
  role_id_t admin{kAdminRole};
  role_id_t guardian{kAdminRole};
  delay_t grant_delay;
};

using role_state_t = role_state<1>;

template <uint16_t Version>
struct member_state;

/// Membership of one account in one role. `since` is the first timepoint at
/// which the membership counts.
template <>
struct member_state<1> final {
  uint16_t version{1};
  timestamp_seconds_t since{};
  delay_t execution_delay;
};

using member_state_t = member_state<1>;

}  // namespace bastion::schema
