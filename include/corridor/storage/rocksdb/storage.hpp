#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <corridor/common/critical.hpp>
#include <corridor/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace corridor::storage {

namespace detail {

inline corridor::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const corridor::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;
  ROCKSDB_NAMESPACE::WriteOptions write_options;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const corridor::schema::bytes_view_t& key) const;

  std::vector<key_value_entry_t> list_by_prefix(
      const corridor::schema::bytes_view_t& prefix,
      std::optional<std::size_t> limit = std::nullopt) const;
  std::vector<key_value_entry_t> list_range(
      const corridor::schema::bytes_view_t& first,
      const corridor::schema::bytes_view_t& last,
      std::optional<std::size_t> limit = std::nullopt) const;
  void write_batch(const std::vector<key_value_entry_t>& entries) const;

 private:
  // Walk forward from `start` while `keep` accepts the key.
  template <typename Predicate>
  std::vector<key_value_entry_t> scan(const ROCKSDB_NAMESPACE::Slice& start,
                                      Predicate keep,
                                      std::optional<std::size_t> limit) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path,
    const storage_options& options);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const corridor::schema::bytes_view_t& key) const {
  if (!database) {
    corridor::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("RocksDB read failed: {}", status.ToString());
    corridor::common::critical("RocksDB read failed");
  }
  return {encoder.template decode<T>(corridor::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

template <typename Predicate>
std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::scan(
    const ROCKSDB_NAMESPACE::Slice& start,
    Predicate keep,
    const std::optional<std::size_t> limit) const {
  if (!database) {
    corridor::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  if (limit.has_value() && *limit == 0) {
    return entries;
  }
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(start); iterator->Valid(); iterator->Next()) {
    if (!keep(iterator->key())) {
      break;
    }
    entries.emplace_back(detail::to_bytes(iterator->key()),
                         detail::to_bytes(iterator->value()));
    if (limit.has_value() && entries.size() >= *limit) {
      break;
    }
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB scan failed: {}", iterator->status().ToString());
    corridor::common::critical("RocksDB scan failed");
  }
  return entries;
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const corridor::schema::bytes_view_t& prefix,
    const std::optional<std::size_t> limit) const {
  const auto start = detail::to_slice(prefix);
  return scan(
      start,
      [&start](const ROCKSDB_NAMESPACE::Slice& key) {
        return key.starts_with(start);
      },
      limit);
}

inline std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_range(
    const corridor::schema::bytes_view_t& first,
    const corridor::schema::bytes_view_t& last,
    const std::optional<std::size_t> limit) const {
  const auto start = detail::to_slice(first);
  const auto stop = detail::to_slice(last);
  if (start.compare(stop) > 0) {
    return {};
  }
  return scan(
      start,
      [&stop](const ROCKSDB_NAMESPACE::Slice& key) {
        return key.compare(stop) <= 0;
      },
      limit);
}

inline void storage<rocksdb_storage_tag>::write_batch(
    const std::vector<key_value_entry_t>& entries) const {
  if (!database) {
    corridor::common::critical("RocksDB database is not initialized");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto staged = batch.Put(
        detail::to_slice(corridor::schema::bytes_view_t{key.data(), key.size()}),
        detail::to_slice(
            corridor::schema::bytes_view_t{value.data(), value.size()}));
    if (!staged.ok()) {
      corridor::common::critical("failed staging key in write batch");
    }
  }

  auto status = database->Write(write_options, &batch);
  if (!status.ok()) {
    spdlog::error("Failed to commit {} entries: {}", entries.size(),
                  status.ToString());
    corridor::common::critical("failed to commit write batch");
  }
}

}  // namespace corridor::storage
