#pragma once
#include <bastion/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace bastion::storage {

using key_value_entry_t =
    std::pair<bastion::schema::bytes_t, bastion::schema::bytes_t>;

/// One buffered mutation: a value to write, or std::nullopt to delete.
using write_entry_t = std::pair<bastion::schema::bytes_t,
                                std::optional<bastion::schema::bytes_t>>;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const bastion::schema::bytes_view_t& key);

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const bastion::schema::bytes_view_t& key,
           const T& value);

  /// Return the raw bytes stored at key, or std::nullopt when missing.
  std::optional<bastion::schema::bytes_t> read(
      const bastion::schema::bytes_view_t& key) const;

  /// Atomically apply all entries (puts and deletes) in order.
  void write(const std::vector<write_entry_t>& entries) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const bastion::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace bastion::storage
