#pragma once
#include <corridor/schema/primitives.hpp>
#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace corridor::storage {

using key_value_entry_t =
    std::pair<corridor::schema::bytes_t, corridor::schema::bytes_t>;

struct storage_options final {
  bool create_if_missing{true};
  /// fsync every committed batch before returning.
  bool sync_writes{false};
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const corridor::schema::bytes_view_t& key) const;

  /// Key-value pairs sharing the prefix in key order, at most `limit` of them
  /// when a limit is given.
  std::vector<key_value_entry_t> list_by_prefix(
      const corridor::schema::bytes_view_t& prefix,
      std::optional<std::size_t> limit = std::nullopt) const;

  /// Key-value pairs with `first <= key <= last` in key order.
  std::vector<key_value_entry_t> list_range(
      const corridor::schema::bytes_view_t& first,
      const corridor::schema::bytes_view_t& last,
      std::optional<std::size_t> limit = std::nullopt) const;

  /// Atomically persist every entry; either all are written or none.
  void write_batch(const std::vector<key_value_entry_t>& entries) const;
};

template <typename Library>
storage<Library> make_storage(const std::string_view& path,
                              const storage_options& options = {});

}  // namespace corridor::storage
