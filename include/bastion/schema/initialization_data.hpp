#pragma once

#include <bastion/schema/primitives.hpp>

#include <cstdint>
#include <vector>

// Schema type: initialization data.
// Access workflow: one-time bootstrap of the authorization core. Function
// bindings come first, then minimal delays, admin roles and account grants.
namespace bastion::schema {

template <uint16_t Version>
struct role_function_binding;

template <>
struct role_function_binding<1> final {
  uint16_t version{1};
  target_id_t target{};
  operation_id_t operation{};
  role_id_t role{};
  duration_seconds_t minimal_execution_delay{};
};

using role_function_binding_t = role_function_binding<1>;

template <uint16_t Version>
struct admin_role_binding;

template <>
struct admin_role_binding<1> final {
  uint16_t version{1};
  role_id_t role{};
  role_id_t admin_role{};
};

using admin_role_binding_t = admin_role_binding<1>;

template <uint16_t Version>
struct account_role_grant;

template <>
struct account_role_grant<1> final {
  uint16_t version{1};
  role_id_t role{};
  account_id_t account{};
  duration_seconds_t execution_delay{};
};

using account_role_grant_t = account_role_grant<1>;

template <uint16_t Version>
struct initialization_data;

template <>
struct initialization_data<1> final {
  uint16_t version{1};
  std::vector<role_function_binding_t> role_to_functions;
  std::vector<admin_role_binding_t> admin_roles;
  std::vector<account_role_grant_t> account_to_roles;
};

using initialization_data_t = initialization_data<1>;

}  // namespace bastion::schema
