#pragma once
#include <flywheel/schema/encoding/scale/encoder.hpp>
#include <flywheel/schema/primitives.hpp>
#include <flywheel/storage/rocksdb/storage.hpp>

#include <map>
#include <optional>

namespace flywheel::state {

/// Pending-write buffer in front of committed storage.
///
/// Reads see staged writes first. `commit` flushes everything as one RocksDB
/// write batch; `discard` drops the buffer, which is how a failed engine call
/// leaves no trace.
class overlay final {
 public:
  explicit overlay(flywheel::storage::rocksdb_storage_t& storage);

  std::optional<flywheel::schema::bytes_t> get(
      const flywheel::schema::bytes_view_t& key) const;
  void put(const flywheel::schema::bytes_view_t& key,
           flywheel::schema::bytes_t value);
  void erase(const flywheel::schema::bytes_view_t& key);

  template <typename T>
  std::optional<T> get_value(const flywheel::schema::bytes_view_t& key) const {
    auto raw = get(key);
    if (!raw) {
      return std::nullopt;
    }
    auto encoder = flywheel::schema::encoding::scale_encoder_t{};
    return encoder.decode<T>(flywheel::schema::make_bytes_view(*raw));
  }

  template <typename T>
  void put_value(const flywheel::schema::bytes_view_t& key, const T& value) {
    auto encoder = flywheel::schema::encoding::scale_encoder_t{};
    put(key, encoder.encode(value));
  }

  /// Committed rows under prefix merged with staged writes, in key order.
  std::vector<flywheel::storage::key_value_entry_t> list_by_prefix(
      const flywheel::schema::bytes_view_t& prefix) const;

  void commit();
  void discard();
  bool dirty() const;

 private:
  flywheel::storage::rocksdb_storage_t& storage_;
  std::map<flywheel::schema::bytes_t, std::optional<flywheel::schema::bytes_t>>
      pending_;
};

}  // namespace flywheel::state
