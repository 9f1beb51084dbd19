#pragma once

#include <corridor/schema/error_code.hpp>
#include <corridor/schema/event_record.hpp>

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace corridor::schema {

/// Outcome of one engine operation.
///
/// `code` is 0 on success, in which case `value` holds the payload and
/// `events` the signals the operation committed. On failure `log` carries the
/// failure parameters and nothing was committed.
template <typename T>
struct operation_result final {
  uint32_t code{};
  std::string log;
  std::string codespace;
  T value{};
  std::vector<event_record_t> events;

  bool ok() const { return code == 0; }
  error_code error() const { return static_cast<error_code>(code); }
};

using status_result_t = operation_result<std::monostate>;

template <typename T>
operation_result<T> make_success(T value,
                                 std::vector<event_record_t> events = {}) {
  auto result = operation_result<T>{};
  result.value = std::move(value);
  result.events = std::move(events);
  return result;
}

template <typename T>
operation_result<T> make_failure(const error_code code, std::string log) {
  auto result = operation_result<T>{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.codespace = std::string{codespace(code)};
  return result;
}

/// Carry a failure across payload types.
template <typename T, typename U>
operation_result<T> forward_failure(const operation_result<U>& failed) {
  auto result = operation_result<T>{};
  result.code = failed.code;
  result.log = failed.log;
  result.codespace = failed.codespace;
  return result;
}

}  // namespace corridor::schema
