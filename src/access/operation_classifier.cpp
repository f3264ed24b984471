#include <bastion/access/operation_classifier.hpp>

using namespace bastion::schema;

namespace bastion::access {

operation_classifier operation_classifier::for_vault(
    const vault_operations& operations) {
  auto classifier = operation_classifier{};
  classifier.assign(operations.deposit, operation_kind_t::deposit);
  classifier.assign(operations.mint, operation_kind_t::deposit);
  classifier.assign(operations.deposit_with_permit, operation_kind_t::deposit);
  classifier.assign(operations.withdraw, operation_kind_t::withdraw);
  classifier.assign(operations.redeem, operation_kind_t::withdraw);
  classifier.assign(operations.transfer, operation_kind_t::withdraw);
  classifier.assign(operations.transfer_from, operation_kind_t::withdraw);
  return classifier;
}

void operation_classifier::assign(const operation_id_t& operation,
                                  const operation_kind_t kind) {
  kinds_.insert_or_assign(operation, kind);
}

operation_kind_t operation_classifier::classify(
    const operation_id_t& operation) const {
  auto it = kinds_.find(operation);
  return it == std::end(kinds_) ? operation_kind_t::other : it->second;
}

}  // namespace bastion::access
