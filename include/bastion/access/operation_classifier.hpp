#pragma once

#include <bastion/schema/operation_id.hpp>
#include <bastion/schema/operation_kind.hpp>
#include <bastion/schema/primitives.hpp>

#include <map>

namespace bastion::access {

/// Operation id -> redemption-lock class. Unknown ids classify as `other`.
class operation_classifier final {
 public:
  operation_classifier() = default;

  /// Deposit, mint and deposit-with-permit are deposit-like; withdraw,
  /// redeem, transfer and transfer-from are withdraw-like.
  static operation_classifier for_vault(
      const bastion::schema::vault_operations& operations);

  void assign(const bastion::schema::operation_id_t& operation,
              bastion::schema::operation_kind_t kind);

  bastion::schema::operation_kind_t classify(
      const bastion::schema::operation_id_t& operation) const;

  std::size_t size() const { return kinds_.size(); }

 private:
  std::map<bastion::schema::operation_id_t, bastion::schema::operation_kind_t>
      kinds_;
};

}  // namespace bastion::access
