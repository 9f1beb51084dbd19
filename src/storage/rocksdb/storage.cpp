#include <corridor/common/critical.hpp>
#include <corridor/storage/rocksdb/storage.hpp>

namespace corridor::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path,
    const storage_options& options) {
  auto db_options = ROCKSDB_NAMESPACE::Options{};
  db_options.create_if_missing = options.create_if_missing;
  db_options.IncreaseParallelism();
  db_options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(db_options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Cannot open state store at {}: {}", path,
                  status.ToString());
    corridor::common::critical("Failed to open RocksDB");
  }

  auto store = storage<rocksdb_storage_tag>{};
  store.database.reset(database);
  store.write_options.sync = options.sync_writes;
  spdlog::info("Opened state store at {} (sync writes {})", path,
               options.sync_writes ? "on" : "off");
  return store;
}

}  // namespace corridor::storage
