#include "nj/core/errors.hpp"

#include <sstream>
#include <utility>

namespace nj {

std::string format_shape(const std::vector<dim_t>& dims) {
  std::ostringstream oss;
  oss << '[';
  for (std::size_t i = 0; i < dims.size(); ++i) {
    if (i) oss << ", ";
    oss << dims[i];
  }
  oss << ']';
  return oss.str();
}

namespace {

std::string incompatible_msg(const Shape& a, const Shape& b) {
  return "Shapes cannot be broadcast together: " + format_shape(a) + " and " + format_shape(b);
}

std::string invalid_size_msg(const Shape& s, std::size_t axis) {
  std::ostringstream oss;
  oss << "Invalid dimension " << (axis < s.size() ? s[axis] : 0)
      << " at axis " << axis << " in shape " << format_shape(s);
  return oss.str();
}

std::string mismatch_msg(std::size_t c, std::size_t s) {
  std::ostringstream oss;
  oss << "Coordinate rank " << c << " does not match stride rank " << s;
  return oss.str();
}

std::string out_of_range_msg(dim_t index, const Shape& s) {
  std::ostringstream oss;
  oss << "Flat index " << index << " is out of range for shape " << format_shape(s);
  return oss.str();
}

std::string inhomogeneous_msg(std::size_t ndim, const Shape& detected) {
  std::ostringstream oss;
  oss << "The requested array has an inhomogeneous shape after " << ndim
      << " dimensions. The detected shape was " << format_shape(detected)
      << " + inhomogeneous part.";
  return oss.str();
}

} // namespace

ShapeIncompatibilityError::ShapeIncompatibilityError(Shape lhs, Shape rhs)
    : std::invalid_argument(incompatible_msg(lhs, rhs)),
      lhs_(std::move(lhs)), rhs_(std::move(rhs)) {}

InvalidSizeError::InvalidSizeError(Shape shape, std::size_t axis)
    : std::invalid_argument(invalid_size_msg(shape, axis)),
      shape_(std::move(shape)), axis_(axis) {}

UnsupportedKindError::UnsupportedKindError(DType kind)
    : std::invalid_argument(std::string("Unsupported data type: ") + dtype_name(kind)),
      kind_(kind) {}

DimensionMismatchError::DimensionMismatchError(std::size_t coords_rank, std::size_t strides_rank)
    : std::invalid_argument(mismatch_msg(coords_rank, strides_rank)),
      coords_rank_(coords_rank), strides_rank_(strides_rank) {}

IndexOutOfRangeError::IndexOutOfRangeError(dim_t index, Shape shape)
    : std::out_of_range(out_of_range_msg(index, shape)),
      index_(index), shape_(std::move(shape)) {}

InhomogeneousShapeError::InhomogeneousShapeError(std::size_t ndim, Shape detected)
    : std::invalid_argument(inhomogeneous_msg(ndim, detected)),
      ndim_(ndim), detected_(std::move(detected)) {}

} // namespace nj
