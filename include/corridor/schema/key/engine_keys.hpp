#pragma once

#include <boost/endian/buffers.hpp>
#include <corridor/schema/primitives.hpp>
#include <cstdint>
#include <iterator>
#include <string_view>

// Schema key type: engine keys.
// Canonical key prefixes and key codecs for intents, the owner index,
// corridor configuration, flow and the event log.
namespace corridor::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kIntentKeyPrefix{"SYS|STATE|INTENT|"};
inline constexpr std::string_view kIntentSeqKey{"SYS|STATE|INTENT_SEQ|"};
inline constexpr std::string_view kOwnerIntentKeyPrefix{
    "SYS|STATE|OWNER_INTENT|"};
inline constexpr std::string_view kFeeParamsKeyPrefix{"SYS|STATE|FEE_PARAMS|"};
inline constexpr std::string_view kFlowKeyPrefix{"SYS|STATE|FLOW|"};
inline constexpr std::string_view kCorridorKeyPrefix{"SYS|STATE|CORRIDOR|"};
inline constexpr std::string_view kEventSeqKey{"SYS|STATE|EVENT_SEQ|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

namespace detail {

// Sequence numbers are appended big-endian so RocksDB's bytewise ordering
// matches numeric ordering during prefix scans.
inline void append_sequence(corridor::schema::bytes_t& key,
                            const uint64_t value) {
  auto buffer = boost::endian::big_uint64_buf_t{value};
  key.insert(std::end(key), buffer.data(), buffer.data() + sizeof(uint64_t));
}

inline void append_hash(corridor::schema::bytes_t& key,
                        const corridor::schema::hash32_t& value) {
  key.insert(std::end(key), std::begin(value), std::end(value));
}

}  // namespace detail

template <typename Encoder>
corridor::schema::bytes_t make_prefix_key(Encoder& encoder,
                                          std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
corridor::schema::bytes_t make_intent_key(
    Encoder& encoder,
    const corridor::schema::intent_id_t intent_id) {
  auto key = make_prefix_key(encoder, kIntentKeyPrefix);
  detail::append_sequence(key, intent_id);
  return key;
}

template <typename Encoder>
corridor::schema::bytes_t make_intent_seq_key(Encoder& encoder) {
  return make_prefix_key(encoder, kIntentSeqKey);
}

template <typename Encoder>
corridor::schema::bytes_t make_owner_intent_prefix(
    Encoder& encoder,
    const corridor::schema::account_id_t& owner) {
  auto key = make_prefix_key(encoder, kOwnerIntentKeyPrefix);
  detail::append_hash(key, owner);
  return key;
}

template <typename Encoder>
corridor::schema::bytes_t make_owner_intent_key(
    Encoder& encoder,
    const corridor::schema::account_id_t& owner,
    const corridor::schema::intent_id_t intent_id) {
  auto key = make_owner_intent_prefix(encoder, owner);
  detail::append_sequence(key, intent_id);
  return key;
}

template <typename Encoder>
corridor::schema::bytes_t make_fee_params_key(
    Encoder& encoder,
    const corridor::schema::corridor_id_t& corridor_id) {
  auto key = make_prefix_key(encoder, kFeeParamsKeyPrefix);
  detail::append_hash(key, corridor_id);
  return key;
}

template <typename Encoder>
corridor::schema::bytes_t make_flow_key(
    Encoder& encoder,
    const corridor::schema::corridor_id_t& corridor_id) {
  auto key = make_prefix_key(encoder, kFlowKeyPrefix);
  detail::append_hash(key, corridor_id);
  return key;
}

template <typename Encoder>
corridor::schema::bytes_t make_corridor_key(
    Encoder& encoder,
    const corridor::schema::corridor_id_t& corridor_id) {
  auto key = make_prefix_key(encoder, kCorridorKeyPrefix);
  detail::append_hash(key, corridor_id);
  return key;
}

template <typename Encoder>
corridor::schema::bytes_t make_event_seq_key(Encoder& encoder) {
  return make_prefix_key(encoder, kEventSeqKey);
}

template <typename Encoder>
corridor::schema::bytes_t make_event_key(Encoder& encoder,
                                         const uint64_t event_id) {
  auto key = make_prefix_key(encoder, kEventPrefix);
  detail::append_sequence(key, event_id);
  return key;
}

}  // namespace corridor::schema::key
