#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <bounty/common/critical.hpp>
#include <bounty/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string_view>

namespace bounty::storage {

namespace detail {

inline bounty::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const bounty::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const bounty::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const bounty::schema::bytes_view_t& key,
           const T& value) const;

  bool contains(const bounty::schema::bytes_view_t& key) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const bounty::schema::bytes_view_t& prefix) const;
  void commit(const write_batch& batch) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const bounty::schema::bytes_view_t& key) const {
  if (!database) {
    bounty::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    } else {
      spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
      bounty::common::critical("Failed to get value from RocksDB");
    }
  }
  return {encoder.template decode<T>(bounty::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const bounty::schema::bytes_view_t& key,
                                       const T& value) const {
  if (!database) {
    bounty::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(bounty::schema::make_bytes_view(encoded_value)));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    bounty::common::critical("Failed to put value into RocksDB");
  }
}

inline bool storage<rocksdb_storage_tag>::contains(
    const bounty::schema::bytes_view_t& key) const {
  if (!database) {
    bounty::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return false;
  }
  if (!status.ok()) {
    spdlog::error("Failed to look up RocksDB key: {}", status.ToString());
    bounty::common::critical("Failed to look up RocksDB key");
  }
  return true;
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const bounty::schema::bytes_view_t& prefix) const {
  if (!database) {
    bounty::common::critical("RocksDB database is not initialized");
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
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    bounty::common::critical("RocksDB iteration failed");
  }
  return entries;
}

inline void storage<rocksdb_storage_tag>::commit(
    const write_batch& batch) const {
  if (!database) {
    bounty::common::critical("RocksDB database is not initialized");
  }

  auto rocks_batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : batch.operations) {
    auto key_slice = detail::to_slice(bounty::schema::make_bytes_view(key));
    auto status = value.has_value()
                      ? rocks_batch.Put(key_slice,
                                        detail::to_slice(
                                            bounty::schema::make_bytes_view(
                                                *value)))
                      : rocks_batch.Delete(key_slice);
    if (!status.ok()) {
      bounty::common::critical("failed staging key in write batch");
    }
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &rocks_batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit write batch: {}",
                  write_status.ToString());
    bounty::common::critical("failed to commit write batch");
  }
}

}  // namespace bounty::storage
