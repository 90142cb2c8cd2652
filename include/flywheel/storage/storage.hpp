#pragma once
#include <flywheel/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace flywheel::storage {

using key_value_entry_t =
    std::pair<flywheel::schema::bytes_t, flywheel::schema::bytes_t>;

/// One staged mutation; a missing value deletes the key.
using write_entry_t = std::pair<flywheel::schema::bytes_t,
                                std::optional<flywheel::schema::bytes_t>>;

template <typename Library>
struct storage {
  /// Return raw value at key, or std::nullopt when missing.
  std::optional<flywheel::schema::bytes_t> get(
      const flywheel::schema::bytes_view_t& key) const;

  /// Apply all writes atomically.
  void write_batch(const std::vector<write_entry_t>& writes) const;

  /// Return all key-value pairs that share the provided key prefix, in key
  /// order.
  std::vector<key_value_entry_t> list_by_prefix(
      const flywheel::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace flywheel::storage
