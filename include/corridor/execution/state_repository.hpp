#pragma once

#include <corridor/schema/corridor_state.hpp>
#include <corridor/schema/encoding/scale/encoder.hpp>
#include <corridor/schema/event_record.hpp>
#include <corridor/schema/fee_params.hpp>
#include <corridor/schema/flow_state.hpp>
#include <corridor/schema/intent_state.hpp>
#include <corridor/schema/transaction_event.hpp>
#include <corridor/storage/rocksdb/storage.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace corridor::execution {

using encoder_t = corridor::schema::encoding::scale_encoder_t;
using storage_t =
    corridor::storage::storage<corridor::storage::rocksdb_storage_tag>;

/// Writes and events staged by one operation.
///
/// Nothing reaches storage until the owning repository commits the set.
class change_set final {
 public:
  explicit change_set(encoder_t& encoder);

  void put_intent(const corridor::schema::intent_state_t& intent);
  void put_intent_sequence(corridor::schema::intent_id_t last_id);
  void put_owner_index(const corridor::schema::account_id_t& owner,
                       corridor::schema::intent_id_t intent_id);
  void put_fee_params(const corridor::schema::fee_params_t& params);
  void put_flow(const corridor::schema::flow_state_t& flow);
  void put_corridor(const corridor::schema::corridor_state_t& corridor);
  void emit(corridor::schema::transaction_event_t event);

  bool empty() const { return entries_.empty() && events_.empty(); }
  const std::vector<corridor::storage::key_value_entry_t>& entries() const {
    return entries_;
  }
  const std::vector<corridor::schema::transaction_event_t>& events() const {
    return events_;
  }

 private:
  encoder_t& encoder_;
  std::vector<corridor::storage::key_value_entry_t> entries_;
  std::vector<corridor::schema::transaction_event_t> events_;
};

/// Typed view over the engine keyspaces. Owned by the engine and shared by
/// reference with every component.
class state_repository final {
 public:
  state_repository(encoder_t& encoder, storage_t& storage);

  std::optional<corridor::schema::intent_state_t> load_intent(
      corridor::schema::intent_id_t intent_id) const;
  /// Highest id issued so far; 0 when no intent exists.
  corridor::schema::intent_id_t last_intent_id() const;
  std::vector<corridor::schema::intent_id_t> load_owner_intents(
      const corridor::schema::account_id_t& owner,
      std::size_t max_results) const;

  std::optional<corridor::schema::fee_params_t> load_fee_params(
      const corridor::schema::corridor_id_t& corridor_id) const;
  /// Missing flow reads as zero.
  corridor::schema::flow_state_t load_flow(
      const corridor::schema::corridor_id_t& corridor_id) const;
  std::optional<corridor::schema::corridor_state_t> load_corridor(
      const corridor::schema::corridor_id_t& corridor_id) const;

  uint64_t last_event_id() const;
  /// Events with ids in the inclusive range, in id order.
  std::vector<corridor::schema::event_record_t> load_events(
      uint64_t from_id,
      uint64_t to_id) const;

  change_set begin() const;

  /// Assign event ids, then persist staged entries and events in one atomic
  /// write. Returns the committed event records.
  std::vector<corridor::schema::event_record_t> commit(
      const change_set& changes,
      corridor::schema::timestamp_milliseconds_t recorded_at);

 private:
  encoder_t& encoder_;
  storage_t& storage_;
};

}  // namespace corridor::execution
