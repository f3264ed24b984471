#pragma once

#include <bastion/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace bastion::schema {

enum class access_error_code : uint32_t {
  already_initialized = 1,
  too_long_redemption_delay = 2,
  invalid_argument_length = 3,
  admin_role_cycle = 4,
  locked_role = 5,
  locked_function_role = 6,
  invalid_call_data = 7,
  access_managed_unauthorized = 20,
  unauthorized_account = 21,
  too_short_execution_delay_for_role = 22,
  unauthorized_call = 23,
  unauthorized_consume = 24,
  unauthorized_cancel = 25,
  bad_confirmation = 26,
  account_is_locked = 40,
  not_scheduled = 41,
  not_ready = 42,
  expired = 43,
  already_scheduled = 44,
};

inline constexpr auto kAccessErrorCodeMappings = std::array{
    std::pair<std::string_view, access_error_code>{
        "already_initialized", access_error_code::already_initialized},
    std::pair<std::string_view, access_error_code>{
        "too_long_redemption_delay",
        access_error_code::too_long_redemption_delay},
    std::pair<std::string_view, access_error_code>{
        "invalid_argument_length", access_error_code::invalid_argument_length},
    std::pair<std::string_view, access_error_code>{
        "admin_role_cycle", access_error_code::admin_role_cycle},
    std::pair<std::string_view, access_error_code>{
        "locked_role", access_error_code::locked_role},
    std::pair<std::string_view, access_error_code>{
        "locked_function_role", access_error_code::locked_function_role},
    std::pair<std::string_view, access_error_code>{
        "invalid_call_data", access_error_code::invalid_call_data},
    std::pair<std::string_view, access_error_code>{
        "access_managed_unauthorized",
        access_error_code::access_managed_unauthorized},
    std::pair<std::string_view, access_error_code>{
        "unauthorized_account", access_error_code::unauthorized_account},
    std::pair<std::string_view, access_error_code>{
        "too_short_execution_delay_for_role",
        access_error_code::too_short_execution_delay_for_role},
    std::pair<std::string_view, access_error_code>{
        "unauthorized_call", access_error_code::unauthorized_call},
    std::pair<std::string_view, access_error_code>{
        "unauthorized_consume", access_error_code::unauthorized_consume},
    std::pair<std::string_view, access_error_code>{
        "unauthorized_cancel", access_error_code::unauthorized_cancel},
    std::pair<std::string_view, access_error_code>{
        "bad_confirmation", access_error_code::bad_confirmation},
    std::pair<std::string_view, access_error_code>{
        "account_is_locked", access_error_code::account_is_locked},
    std::pair<std::string_view, access_error_code>{
        "not_scheduled", access_error_code::not_scheduled},
    std::pair<std::string_view, access_error_code>{
        "not_ready", access_error_code::not_ready},
    std::pair<std::string_view, access_error_code>{
        "expired", access_error_code::expired},
    std::pair<std::string_view, access_error_code>{
        "already_scheduled", access_error_code::already_scheduled},
};

inline constexpr std::string_view to_string(const access_error_code value) {
  return to_string(value, kAccessErrorCodeMappings).value_or("unknown");
}

}  // namespace bastion::schema
