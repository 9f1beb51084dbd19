#pragma once
#include <corridor/schema/primitives.hpp>

// Schema type: corridor state.
// Registry entry; only nettable corridors accept batch settlement.
namespace corridor::schema {

template <uint16_t Version>
struct corridor_state;

template <>
struct corridor_state<1> final {
  uint16_t version{1};
  corridor_id_t corridor_id{};
  bool nettable{};
};

using corridor_state_t = corridor_state<1>;

}  // namespace corridor::schema
