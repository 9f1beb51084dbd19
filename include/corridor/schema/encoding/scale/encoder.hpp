#pragma once
#include <corridor/common/critical.hpp>
#include <corridor/schema/corridor_state.hpp>
#include <corridor/schema/deferred_settlement.hpp>
#include <corridor/schema/encoding/encoder.hpp>
#include <corridor/schema/encoding/scale/direction.hpp>
#include <corridor/schema/event_record.hpp>
#include <corridor/schema/fee_params.hpp>
#include <corridor/schema/flow_state.hpp>
#include <corridor/schema/intent_state.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace corridor::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  corridor::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, corridor::schema::bytes_t& out);

  template <typename T>
  T decode(const corridor::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const corridor::schema::bytes_view_t& bytes);
};

template <typename T>
corridor::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    corridor::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        corridor::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const corridor::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    corridor::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const corridor::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

using scale_encoder_t = encoder<scale_encoder_tag>;

}  // namespace corridor::schema::encoding
