#pragma once

#include <string>
#include <utility>

namespace r4mw4tch {

// error codes for structured results
enum class error_code {
  ok,
  invalid_argument,
  io_error,
  host_fault,
  internal_error
};

inline const char* error_code_name(error_code code) {
  switch (code) {
  case error_code::ok:
    return "ok";
  case error_code::invalid_argument:
    return "invalid_argument";
  case error_code::io_error:
    return "io_error";
  case error_code::host_fault:
    return "host_fault";
  case error_code::internal_error:
    return "internal_error";
  }
  return "unknown";
}

// status holds an error code and a human-readable message
struct trace_status {
  error_code code = error_code::ok;
  std::string message;

  bool ok() const noexcept { return code == error_code::ok; }
};

inline trace_status ok_status() { return {}; }

inline trace_status make_status(error_code code, std::string message) {
  return trace_status{code, std::move(message)};
}

// result carries a value and a status; value is default-initialized on errors
template <typename T> struct trace_result {
  T value{};
  trace_status status{};

  bool ok() const noexcept { return status.ok(); }
};

template <typename T> inline trace_result<T> ok_result(T value) {
  return trace_result<T>{std::move(value), ok_status()};
}

template <typename T> inline trace_result<T> error_result(error_code code, std::string message) {
  return trace_result<T>{T{}, make_status(code, std::move(message))};
}

} // namespace r4mw4tch
