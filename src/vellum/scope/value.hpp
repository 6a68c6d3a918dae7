#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace vellum::scope {

enum class value_type : uint8_t {
  undefined = 0,
  none = 1,
  boolean = 2,
  integer = 3,
  floating = 4,
  string = 5
};

struct value {
  value_type type = value_type::undefined;
  bool bool_v = false;
  int64_t int_v = 0;
  double float_v = 0.0;
  std::string string_v = {};

  bool operator==(const value &) const = default;
};

inline value make_undefined() { return value{}; }

inline value make_none() {
  value out;
  out.type = value_type::none;
  return out;
}

inline value make_bool(const bool v) {
  value out;
  out.type = value_type::boolean;
  out.bool_v = v;
  return out;
}

inline value make_int(const int64_t v) {
  value out;
  out.type = value_type::integer;
  out.int_v = v;
  return out;
}

inline value make_float(const double v) {
  value out;
  out.type = value_type::floating;
  out.float_v = v;
  return out;
}

inline value make_string(std::string_view v) {
  value out;
  out.type = value_type::string;
  out.string_v = std::string(v);
  return out;
}

inline bool is_truthy(const value & v) noexcept {
  switch (v.type) {
    case value_type::undefined:
    case value_type::none:
      return false;
    case value_type::boolean:
      return v.bool_v;
    case value_type::integer:
      return v.int_v != 0;
    case value_type::floating:
      return v.float_v != 0.0;
    case value_type::string:
      return !v.string_v.empty();
  }
  return false;
}

}  // namespace vellum::scope
