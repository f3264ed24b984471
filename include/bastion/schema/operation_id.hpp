#pragma once

#include <bastion/schema/primitives.hpp>

#include <string_view>

// Schema type: operation id.
// Access workflow: compact identifier of a guarded operation, derived from
// its canonical signature. Call payloads start with the operation id.
namespace bastion::schema {

inline constexpr std::string_view kDepositSignature{"deposit(uint256,address)"};
inline constexpr std::string_view kMintSignature{"mint(uint256,address)"};
inline constexpr std::string_view kDepositWithPermitSignature{
    "depositWithPermit(uint256,address,address,uint256,uint8,bytes32,bytes32)"};
inline constexpr std::string_view kWithdrawSignature{
    "withdraw(uint256,address,address)"};
inline constexpr std::string_view kRedeemSignature{
    "redeem(uint256,address,address)"};
inline constexpr std::string_view kTransferSignature{
    "transfer(address,uint256)"};
inline constexpr std::string_view kTransferFromSignature{
    "transferFrom(address,address,uint256)"};

/// First four bytes of BLAKE3(signature).
operation_id_t make_operation_id(const std::string_view& signature);

/// Operation id carried in the first four bytes of a call payload, or
/// std::nullopt when the payload is too short.
std::optional<operation_id_t> try_operation_id(const bytes_view_t& data);

/// Operation ids a managed vault exposes to the access layer.
struct vault_operations final {
  operation_id_t deposit;
  operation_id_t mint;
  operation_id_t deposit_with_permit;
  operation_id_t withdraw;
  operation_id_t redeem;
  operation_id_t transfer;
  operation_id_t transfer_from;
};

/// Vault operation ids derived from the canonical signatures above.
const vault_operations& default_vault_operations();

}  // namespace bastion::schema
