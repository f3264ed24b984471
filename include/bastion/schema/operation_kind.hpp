#pragma once

#include <bastion/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: operation kind.
// Access workflow: redemption-lock classification of a guarded operation.
namespace bastion::schema {

enum class operation_kind_t : uint8_t { other = 0, deposit = 1, withdraw = 2 };

inline constexpr auto kOperationKindMappings = std::array{
    std::pair<std::string_view, operation_kind_t>{"other",
                                                  operation_kind_t::other},
    std::pair<std::string_view, operation_kind_t>{"deposit",
                                                  operation_kind_t::deposit},
    std::pair<std::string_view, operation_kind_t>{"withdraw",
                                                  operation_kind_t::withdraw},
};

inline constexpr std::string_view to_string(const operation_kind_t value) {
  return to_string(value, kOperationKindMappings).value_or("unknown");
}

}  // namespace bastion::schema
