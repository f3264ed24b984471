#pragma once

#include <bastion/schema/enum_string.hpp>
#include <bastion/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>

// Schema type: role id.
// Access workflow: well-known role buckets of a managed vault deployment.
// Role ids are open-ended; deployments may define further ids.
namespace bastion::schema {

/// Root of the admin graph. Default role of every unbound operation.
inline constexpr role_id_t kAdminRole = 0;
inline constexpr role_id_t kOwnerRole = 1;
/// Emergency role: cancels scheduled operations and closes targets.
inline constexpr role_id_t kGuardianRole = 2;
inline constexpr role_id_t kAtomistRole = 100;
inline constexpr role_id_t kAlphaRole = 200;
inline constexpr role_id_t kFuseManagerRole = 300;
inline constexpr role_id_t kClaimRewardsRole = 600;
inline constexpr role_id_t kTransferRewardsRole = 700;
inline constexpr role_id_t kWhitelistRole = 800;
inline constexpr role_id_t kConfigInstantWithdrawalFusesRole = 900;
inline constexpr role_id_t kUpdateMarketsBalancesRole = 1000;
/// Held implicitly by every account, with no execution delay.
inline constexpr role_id_t kPublicRole = std::numeric_limits<role_id_t>::max();

inline constexpr auto kRoleIdMappings = std::array{
    std::pair<std::string_view, role_id_t>{"admin", kAdminRole},
    std::pair<std::string_view, role_id_t>{"owner", kOwnerRole},
    std::pair<std::string_view, role_id_t>{"guardian", kGuardianRole},
    std::pair<std::string_view, role_id_t>{"atomist", kAtomistRole},
    std::pair<std::string_view, role_id_t>{"alpha", kAlphaRole},
    std::pair<std::string_view, role_id_t>{"fuse_manager", kFuseManagerRole},
    std::pair<std::string_view, role_id_t>{"claim_rewards", kClaimRewardsRole},
    std::pair<std::string_view, role_id_t>{"transfer_rewards",
                                           kTransferRewardsRole},
    std::pair<std::string_view, role_id_t>{"whitelist", kWhitelistRole},
    std::pair<std::string_view, role_id_t>{"config_instant_withdrawal_fuses",
                                           kConfigInstantWithdrawalFusesRole},
    std::pair<std::string_view, role_id_t>{"update_markets_balances",
                                           kUpdateMarketsBalancesRole},
    std::pair<std::string_view, role_id_t>{"public", kPublicRole},
};

inline std::optional<role_id_t> try_role_from_string(
    const std::string_view value) {
  return from_string(value, kRoleIdMappings);
}

inline constexpr std::string_view role_name(const role_id_t value) {
  return to_string(value, kRoleIdMappings).value_or("custom");
}

}  // namespace bastion::schema
