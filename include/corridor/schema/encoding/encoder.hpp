#pragma once
#include <corridor/schema/primitives.hpp>
#include <optional>
#include <span>

namespace corridor::schema::encoding {

// Storage codec, selected at build time by tag.
template <typename Library>
struct encoder {
  template <typename T>
  corridor::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, corridor::schema::bytes_t& out);

  template <typename T>
  T decode(const corridor::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const corridor::schema::bytes_view_t& bytes);
};

}  // namespace corridor::schema::encoding
