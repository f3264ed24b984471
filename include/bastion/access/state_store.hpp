#pragma once

#include <bastion/access/record_codec.hpp>
#include <bastion/common/critical.hpp>
#include <bastion/schema/encoding/scale/encoder.hpp>
#include <bastion/schema/event.hpp>
#include <bastion/schema/primitives.hpp>
#include <bastion/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace bastion::access {

using storage_t =
    bastion::storage::storage<bastion::storage::rocksdb_storage_tag>;
using encoder_t = bastion::schema::encoding::scale_encoder_t;

/// Namespaced key-value state shared by the registry and the authorization
/// core.
///
/// Reads see committed state overlaid with the writes of the open scope.
/// Writes are only legal inside a write_scope and reach RocksDB as a single
/// batch when the outermost scope commits. A scope destroyed without commit
/// discards every write and event of the enclosing top-level call.
class state_store final {
 public:
  explicit state_store(storage_t& storage);

  state_store(const state_store&) = delete;
  state_store& operator=(const state_store&) = delete;

  class write_scope final {
   public:
    explicit write_scope(state_store& store);
    ~write_scope();

    write_scope(const write_scope&) = delete;
    write_scope& operator=(const write_scope&) = delete;
    write_scope(write_scope&&) = delete;
    write_scope& operator=(write_scope&&) = delete;

    void commit();

   private:
    state_store& store_;
    bool committed_{false};
  };

  template <typename T>
  std::optional<T> get(const bastion::schema::bytes_t& key) const;

  template <typename T>
  void put(const bastion::schema::bytes_t& key, const T& value);

  void erase(const bastion::schema::bytes_t& key);

  /// Buffer an event; delivered to the sink after the outermost commit.
  void emit(bastion::schema::event_t event);

  void set_event_sink(bastion::schema::event_sink_t sink);

  bool in_scope() const { return depth_ > 0; }

  /// Committed rows of one namespace, keys with the namespace slot stripped.
  std::vector<bastion::storage::key_value_entry_t> list_committed(
      std::string_view name) const;

  encoder_t& encoder() const { return encoder_; }

 private:
  std::optional<bastion::schema::bytes_t> read(
      const bastion::schema::bytes_t& key) const;
  void require_scope() const;
  void enter();
  void leave(bool committed);

  storage_t& storage_;
  mutable encoder_t encoder_;
  std::map<bastion::schema::bytes_t, std::optional<bastion::schema::bytes_t>>
      pending_;
  std::vector<bastion::schema::event_t> pending_events_;
  bastion::schema::event_sink_t event_sink_;
  uint32_t depth_{};
  bool aborted_{false};
};

template <typename T>
std::optional<T> state_store::get(const bastion::schema::bytes_t& key) const {
  auto raw = read(key);
  if (!raw) {
    return std::nullopt;
  }
  auto decoded =
      encoder_.try_decode<typename record_codec<T>::stored_t>(
          bastion::schema::bytes_view_t{raw->data(), raw->size()});
  if (!decoded) {
    bastion::common::critical("failed to decode stored access record");
  }
  return record_codec<T>::from_stored(*decoded);
}

template <typename T>
void state_store::put(const bastion::schema::bytes_t& key, const T& value) {
  require_scope();
  pending_.insert_or_assign(key,
                            encoder_.encode(record_codec<T>::to_stored(value)));
}

/// Typed view over one namespaced table of a state_store.
template <typename Key, typename Value>
class table final {
 public:
  using key_fn_t = std::function<bastion::schema::bytes_t(const Key&)>;

  table(state_store& store, key_fn_t make_key)
      : store_{store}, make_key_{std::move(make_key)} {}

  std::optional<Value> find(const Key& key) const {
    return store_.get<Value>(make_key_(key));
  }

  Value get_or(const Key& key, Value fallback) const {
    return find(key).value_or(std::move(fallback));
  }

  void set(const Key& key, const Value& value) {
    store_.put(make_key_(key), value);
  }

  void erase(const Key& key) { store_.erase(make_key_(key)); }

 private:
  state_store& store_;
  key_fn_t make_key_;
};

/// Single-value slot of a state_store.
template <typename Value>
class slot final {
 public:
  slot(state_store& store, bastion::schema::bytes_t key)
      : store_{store}, key_{std::move(key)} {}

  std::optional<Value> find() const { return store_.get<Value>(key_); }
  Value get_or(Value fallback) const {
    return find().value_or(std::move(fallback));
  }
  void set(const Value& value) { store_.put(key_, value); }

 private:
  state_store& store_;
  bastion::schema::bytes_t key_;
};

}  // namespace bastion::access
