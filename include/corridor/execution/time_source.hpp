#pragma once

#include <corridor/schema/primitives.hpp>
#include <chrono>
#include <functional>

namespace corridor::execution {

/// Supplies "now" for deadline checks and event stamps. The host decides
/// what time means (wall clock, block time); tests inject a manual source.
using time_source_t = std::function<corridor::schema::timestamp_milliseconds_t()>;

inline time_source_t system_time_source() {
  return [] {
    return static_cast<corridor::schema::timestamp_milliseconds_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
  };
}

}  // namespace corridor::execution
