#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

#include "nj/core/types.hpp"

namespace nj {

// Scalar element kinds. Bool and Char are real kinds but carry no entry in
// the default size table; asking for their width is an error.
enum class DType : int {
  Int8 = 0,   // byte
  Int16,      // short
  Int32,
  Int64,
  Float32,
  Float64,
  String,     // boxed text
  Object,     // generic object
  Bool,
  Char,
};

inline constexpr std::size_t kNumDTypes = 10;

const char* dtype_name(DType kind) noexcept;

// C++ scalar type -> kind.
template <class T> struct dtype_of;
template <> struct dtype_of<std::int8_t>  { static constexpr DType value = DType::Int8; };
template <> struct dtype_of<std::int16_t> { static constexpr DType value = DType::Int16; };
template <> struct dtype_of<std::int32_t> { static constexpr DType value = DType::Int32; };
template <> struct dtype_of<std::int64_t> { static constexpr DType value = DType::Int64; };
template <> struct dtype_of<float>        { static constexpr DType value = DType::Float32; };
template <> struct dtype_of<double>       { static constexpr DType value = DType::Float64; };
template <> struct dtype_of<std::string>  { static constexpr DType value = DType::String; };
template <> struct dtype_of<bool>         { static constexpr DType value = DType::Bool; };
template <> struct dtype_of<char>         { static constexpr DType value = DType::Char; };

template <class T>
inline constexpr DType dtype_of_v = dtype_of<T>::value;

// Element kind -> byte width. Immutable once built: the fixed machine widths
// plus one reference width shared by String and Object. The reference width
// is a bookkeeping placeholder for boxed values, not a physical size, so a
// caller modelling a different object layout builds its own table.
class SizeTable {
public:
  // A reference width of 0 or above INT64_MAX falls back to the default.
  explicit SizeTable(std::size_t reference_width);

  bool contains(DType kind) const noexcept;
  // Throws UnsupportedKindError for kinds without an entry.
  dim_t size_of(DType kind) const;
  std::size_t reference_width() const noexcept { return reference_width_; }

private:
  std::array<dim_t, kNumDTypes> widths_{};  // 0 = not registered
  std::size_t reference_width_;
};

// Process-wide table, built once on first use from NJ_REFERENCE_WIDTH and
// read-only afterwards. Safe for concurrent readers.
const SizeTable& default_size_table();

// element_size(k) == default_size_table().size_of(k)
dim_t element_size(DType kind);

template <class T>
inline dim_t element_size() { return element_size(dtype_of_v<T>); }

} // namespace nj
