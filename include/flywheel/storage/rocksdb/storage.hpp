#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <flywheel/common/critical.hpp>
#include <flywheel/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string_view>

namespace flywheel::storage {

namespace detail {

inline flywheel::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const flywheel::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  std::optional<flywheel::schema::bytes_t> get(
      const flywheel::schema::bytes_view_t& key) const;
  void write_batch(const std::vector<write_entry_t>& writes) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const flywheel::schema::bytes_view_t& prefix) const;
};

using rocksdb_storage_t = storage<rocksdb_storage_tag>;

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline std::optional<flywheel::schema::bytes_t>
storage<rocksdb_storage_tag>::get(
    const flywheel::schema::bytes_view_t& key) const {
  if (!database) {
    flywheel::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    flywheel::common::critical("Failed to get value from RocksDB");
  }
  return flywheel::schema::bytes_t(std::begin(value), std::end(value));
}

inline void storage<rocksdb_storage_tag>::write_batch(
    const std::vector<write_entry_t>& writes) const {
  if (!database) {
    flywheel::common::critical("RocksDB database is not initialized");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : writes) {
    auto status =
        value.has_value()
            ? batch.Put(detail::to_slice(key), detail::to_slice(*value))
            : batch.Delete(detail::to_slice(key));
    if (!status.ok()) {
      spdlog::error("Failed staging RocksDB write: {}", status.ToString());
      flywheel::common::critical("failed staging write batch");
    }
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit RocksDB write batch: {}",
                  write_status.ToString());
    flywheel::common::critical("failed to commit write batch");
  }
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const flywheel::schema::bytes_view_t& prefix) const {
  if (!database) {
    flywheel::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_slice = detail::to_slice(prefix);

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_slice);
  while (iterator->Valid()) {
    if (!iterator->key().starts_with(prefix_slice)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  return entries;
}

}  // namespace flywheel::storage
