#pragma once
#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "nj/core/dtype.hpp"
#include "nj/core/types.hpp"

namespace nj {

// Opaque non-scalar record (a reference aggregate). Only its type name is kept.
struct Object {
  std::string type_name;
  bool operator==(const Object& o) const { return type_name == o.type_name; }
};

class Value;
using Array = std::vector<Value>;

// Integer types without a dedicated Value alternative.
template <class T>
inline constexpr bool is_other_integer_v =
    std::is_integral_v<T> && !std::is_same_v<T, bool> && !std::is_same_v<T, char>
    && !std::is_same_v<T, std::int8_t> && !std::is_same_v<T, std::int16_t>
    && !std::is_same_v<T, std::int32_t> && !std::is_same_v<T, std::int64_t>;

// Dynamically typed nested value, as handed to array construction before a
// dtype and shape are known. Arrays nest arbitrarily and may be ragged.
class Value {
public:
  using Storage = std::variant<std::monostate, bool, char,
                               std::int8_t, std::int16_t, std::int32_t, std::int64_t,
                               float, double, std::string, Object, Array>;

  Value() = default;
  Value(bool v) : v_(v) {}
  Value(char v) : v_(v) {}
  Value(std::int8_t v) : v_(v) {}
  Value(std::int16_t v) : v_(v) {}
  Value(std::int32_t v) : v_(v) {}
  Value(std::int64_t v) : v_(v) {}
  // Remaining integer types (unsigned, long long, size_t, ...) are stored
  // as int64; unsigned values above INT64_MAX wrap.
  template <class T, std::enable_if_t<is_other_integer_v<T>, int> = 0>
  Value(T v) : v_(static_cast<std::int64_t>(v)) {}
  Value(float v) : v_(v) {}
  Value(double v) : v_(v) {}
  Value(std::string v) : v_(std::move(v)) {}
  Value(const char* v) : v_(std::string(v)) {}
  Value(Object v) : v_(std::move(v)) {}
  Value(Array v) : v_(std::move(v)) {}

  bool is_none() const noexcept { return std::holds_alternative<std::monostate>(v_); }
  bool is_array() const noexcept { return std::holds_alternative<Array>(v_); }
  bool is_object() const noexcept { return std::holds_alternative<Object>(v_); }

  // Precondition: is_array().
  const Array& as_array() const { return std::get<Array>(v_); }

  // Kind of a non-array value; none and Object map to DType::Object.
  // Precondition: !is_array().
  DType kind() const;

  const Storage& storage() const noexcept { return v_; }

private:
  Storage v_;
};

// Innermost element kind of a nested array, found by descending through the
// first element of each level. An empty level has nothing to inspect and
// resolves to DType::Object. A non-array resolves to its own kind().
DType resolve_scalar_kind(const Value& v);

// True when `v` is an array whose leaves are numeric, text, bool or char.
// Only the first element of each level is inspected, so the answer follows
// the first leaf: [1, Object{}] is primitive while [Object{}, 1] is not. An
// empty array (at any level) is vacuously primitive. Non-arrays are false.
bool is_primitive_array(const Value& v);

// Numeric (any integer or floating width) or text. bool/char are not.
bool is_scalar_value(const Value& v);

// float or double.
bool is_floating_scalar(const Value& v);

// Shape of a nested array literal; rank 0 for a scalar. Every array at the
// same depth must have the same length, and siblings must agree on being
// arrays or leaves. Otherwise throws InhomogeneousShapeError.
Shape infer_shape(const Value& v);

} // namespace nj
