#include <flywheel/state/overlay.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

namespace flywheel::state {

overlay::overlay(flywheel::storage::rocksdb_storage_t& storage)
    : storage_{storage} {}

std::optional<flywheel::schema::bytes_t> overlay::get(
    const flywheel::schema::bytes_view_t& key) const {
  auto pending = pending_.find(flywheel::schema::make_bytes(key));
  if (pending != std::end(pending_)) {
    return pending->second;
  }
  return storage_.get(key);
}

void overlay::put(const flywheel::schema::bytes_view_t& key,
                  flywheel::schema::bytes_t value) {
  pending_[flywheel::schema::make_bytes(key)] = std::move(value);
}

void overlay::erase(const flywheel::schema::bytes_view_t& key) {
  pending_[flywheel::schema::make_bytes(key)] = std::nullopt;
}

std::vector<flywheel::storage::key_value_entry_t> overlay::list_by_prefix(
    const flywheel::schema::bytes_view_t& prefix) const {
  auto merged = std::map<flywheel::schema::bytes_t, flywheel::schema::bytes_t>{};
  for (auto& [key, value] : storage_.list_by_prefix(prefix)) {
    merged.emplace(std::move(key), std::move(value));
  }

  auto start = pending_.lower_bound(flywheel::schema::make_bytes(prefix));
  for (auto it = start; it != std::end(pending_); ++it) {
    const auto& key = it->first;
    if (key.size() < prefix.size() ||
        !std::equal(std::begin(prefix), std::end(prefix), std::begin(key))) {
      break;
    }
    if (it->second.has_value()) {
      merged.insert_or_assign(key, *it->second);
    } else {
      merged.erase(key);
    }
  }

  auto entries = std::vector<flywheel::storage::key_value_entry_t>{};
  entries.reserve(merged.size());
  for (auto& [key, value] : merged) {
    entries.emplace_back(key, std::move(value));
  }
  return entries;
}

void overlay::commit() {
  if (pending_.empty()) {
    return;
  }
  auto writes = std::vector<flywheel::storage::write_entry_t>{};
  writes.reserve(pending_.size());
  for (auto& [key, value] : pending_) {
    writes.emplace_back(key, std::move(value));
  }
  storage_.write_batch(writes);
  pending_.clear();
}

void overlay::discard() {
  pending_.clear();
}

bool overlay::dirty() const {
  return !pending_.empty();
}

}  // namespace flywheel::state
