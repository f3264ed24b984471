#include <bastion/storage/rocksdb/storage.hpp>

#include <string>

namespace bastion::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;

  auto* raw = static_cast<ROCKSDB_NAMESPACE::DB*>(nullptr);
  auto status = ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &raw);
  if (!status.ok()) {
    bastion::common::critical("Failed to open RocksDB at '{}': {}", path,
                              status.ToString());
  }
  spdlog::debug("Opened RocksDB at '{}'", path);

  auto result = storage<rocksdb_storage_tag>{};
  result.database.reset(raw);
  return result;
}

std::optional<bastion::schema::bytes_t> storage<rocksdb_storage_tag>::read(
    const bastion::schema::bytes_view_t& key) const {
  if (!database) {
    bastion::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    bastion::common::critical("Failed to get value from RocksDB: {}",
                              status.ToString());
  }
  return bastion::schema::bytes_t(std::begin(value), std::end(value));
}

void storage<rocksdb_storage_tag>::write(
    const std::vector<write_entry_t>& entries) const {
  if (!database) {
    bastion::common::critical("RocksDB database is not initialized");
  }
  if (entries.empty()) {
    return;
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto key_slice =
        detail::to_slice(bastion::schema::bytes_view_t{key.data(), key.size()});
    auto status =
        value ? batch.Put(key_slice,
                          detail::to_slice(bastion::schema::bytes_view_t{
                              value->data(), value->size()}))
              : batch.Delete(key_slice);
    if (!status.ok()) {
      bastion::common::critical("Failed staging key in write batch: {}",
                                status.ToString());
    }
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    bastion::common::critical("Failed to commit write batch: {}",
                              write_status.ToString());
  }
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const bastion::schema::bytes_view_t& prefix) const {
  if (!database) {
    bastion::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  return entries;
}

}  // namespace bastion::storage
