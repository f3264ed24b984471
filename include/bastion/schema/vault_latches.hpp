#pragma once

#include <bastion/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: vault latches.
// Access workflow: one-way switches opening vault operations to the public
// role. Neither has a transition back.
namespace bastion::schema {

enum class deposit_access_t : uint8_t { restricted = 0, public_access = 1 };

enum class share_transfer_t : uint8_t { restricted = 0, enabled = 1 };

template <uint16_t Version>
struct vault_latches;

template <>
struct vault_latches<1> final {
  uint16_t version{1};
  deposit_access_t deposit_access{deposit_access_t::restricted};
  share_transfer_t share_transfer{share_transfer_t::restricted};
};

using vault_latches_t = vault_latches<1>;

inline constexpr auto kDepositAccessMappings = std::array{
    std::pair<std::string_view, deposit_access_t>{
        "restricted", deposit_access_t::restricted},
    std::pair<std::string_view, deposit_access_t>{
        "public", deposit_access_t::public_access},
};

inline constexpr auto kShareTransferMappings = std::array{
    std::pair<std::string_view, share_transfer_t>{
        "restricted", share_transfer_t::restricted},
    std::pair<std::string_view, share_transfer_t>{"enabled",
                                                  share_transfer_t::enabled},
};

inline constexpr std::string_view to_string(const deposit_access_t value) {
  return to_string(value, kDepositAccessMappings).value_or("unknown");
}

inline constexpr std::string_view to_string(const share_transfer_t value) {
  return to_string(value, kShareTransferMappings).value_or("unknown");
}

}  // namespace bastion::schema
