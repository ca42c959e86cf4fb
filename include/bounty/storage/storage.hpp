#pragma once
#include <bounty/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace bounty::storage {

using key_value_entry_t =
    std::pair<bounty::schema::bytes_t, bounty::schema::bytes_t>;

/// Ordered set of writes applied atomically by `storage::commit`.
/// A missing value marks a delete.
struct write_batch final {
  std::vector<std::pair<bounty::schema::bytes_t,
                        std::optional<bounty::schema::bytes_t>>>
      operations;

  void put(bounty::schema::bytes_t key, bounty::schema::bytes_t value) {
    operations.emplace_back(std::move(key), std::move(value));
  }

  void erase(bounty::schema::bytes_t key) {
    operations.emplace_back(std::move(key), std::nullopt);
  }

  bool empty() const { return operations.empty(); }
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const bounty::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const bounty::schema::bytes_view_t& key,
           const T& value) const;

  /// True when a value is stored at key.
  bool contains(const bounty::schema::bytes_view_t& key) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const bounty::schema::bytes_view_t& prefix) const;

  /// Apply every operation of the batch atomically.
  void commit(const write_batch& batch) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace bounty::storage
