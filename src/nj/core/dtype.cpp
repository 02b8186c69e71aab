#include "nj/core/dtype.hpp"
#include "nj/core/config.hpp"
#include "nj/core/errors.hpp"

namespace nj {

const char* dtype_name(DType kind) noexcept {
  switch (kind) {
    case DType::Int8:    return "int8";
    case DType::Int16:   return "int16";
    case DType::Int32:   return "int32";
    case DType::Int64:   return "int64";
    case DType::Float32: return "float32";
    case DType::Float64: return "float64";
    case DType::String:  return "string";
    case DType::Object:  return "object";
    case DType::Bool:    return "bool";
    case DType::Char:    return "char";
  }
  return "unknown";
}

static std::size_t slot(DType kind) noexcept { return static_cast<std::size_t>(kind); }

SizeTable::SizeTable(std::size_t reference_width)
    : reference_width_(reference_width && reference_width <= config::kMaxSize
                           ? reference_width : config::kDefaultReferenceWidth) {
  widths_[slot(DType::Int8)]    = 1;
  widths_[slot(DType::Int16)]   = 2;
  widths_[slot(DType::Int32)]   = 4;
  widths_[slot(DType::Int64)]   = 8;
  widths_[slot(DType::Float32)] = 4;
  widths_[slot(DType::Float64)] = 8;
  widths_[slot(DType::String)]  = dim_t(reference_width_);
  widths_[slot(DType::Object)]  = dim_t(reference_width_);
}

bool SizeTable::contains(DType kind) const noexcept {
  const std::size_t i = slot(kind);
  return i < widths_.size() && widths_[i] != 0;
}

dim_t SizeTable::size_of(DType kind) const {
  if (!contains(kind)) throw UnsupportedKindError(kind);
  return widths_[slot(kind)];
}

const SizeTable& default_size_table() {
  static const SizeTable table(config::reference_width_from_env());
  return table;
}

dim_t element_size(DType kind) {
  return default_size_table().size_of(kind);
}

} // namespace nj
