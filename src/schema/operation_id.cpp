#include <bastion/blake3/hash.hpp>
#include <bastion/schema/operation_id.hpp>

#include <algorithm>

namespace bastion::schema {

operation_id_t make_operation_id(const std::string_view& signature) {
  auto digest = bastion::blake3::hash(signature);
  auto id = operation_id_t{};
  std::copy_n(std::begin(digest), id.size(), std::begin(id));
  return id;
}

std::optional<operation_id_t> try_operation_id(const bytes_view_t& data) {
  auto id = operation_id_t{};
  if (data.size() < id.size()) {
    return std::nullopt;
  }
  std::copy_n(std::begin(data), id.size(), std::begin(id));
  return id;
}

const vault_operations& default_vault_operations() {
  static const auto operations = vault_operations{
      .deposit = make_operation_id(kDepositSignature),
      .mint = make_operation_id(kMintSignature),
      .deposit_with_permit = make_operation_id(kDepositWithPermitSignature),
      .withdraw = make_operation_id(kWithdrawSignature),
      .redeem = make_operation_id(kRedeemSignature),
      .transfer = make_operation_id(kTransferSignature),
      .transfer_from = make_operation_id(kTransferFromSignature)};
  return operations;
}

}  // namespace bastion::schema
