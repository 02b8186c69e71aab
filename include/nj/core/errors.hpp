#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "nj/core/dtype.hpp"
#include "nj/core/types.hpp"

namespace nj {

// "[8, 1, 6, 1]"; used by every error message below.
std::string format_shape(const std::vector<dim_t>& dims);

// Two shapes whose aligned trailing dims are neither equal nor 1.
// lhs()/rhs() keep the order the operands were given in.
class ShapeIncompatibilityError : public std::invalid_argument {
public:
  ShapeIncompatibilityError(Shape lhs, Shape rhs);
  const Shape& lhs() const noexcept { return lhs_; }
  const Shape& rhs() const noexcept { return rhs_; }
private:
  Shape lhs_, rhs_;
};

// A shape with a zero or negative extent. axis() is the first offending one.
class InvalidSizeError : public std::invalid_argument {
public:
  InvalidSizeError(Shape shape, std::size_t axis);
  const Shape& shape() const noexcept { return shape_; }
  std::size_t axis() const noexcept { return axis_; }
private:
  Shape shape_;
  std::size_t axis_;
};

class UnsupportedKindError : public std::invalid_argument {
public:
  explicit UnsupportedKindError(DType kind);
  DType kind() const noexcept { return kind_; }
private:
  DType kind_;
};

// Coordinate tuple and stride vector of different rank.
class DimensionMismatchError : public std::invalid_argument {
public:
  DimensionMismatchError(std::size_t coords_rank, std::size_t strides_rank);
  std::size_t coords_rank() const noexcept { return coords_rank_; }
  std::size_t strides_rank() const noexcept { return strides_rank_; }
private:
  std::size_t coords_rank_, strides_rank_;
};

// Flat index outside [0, numel(shape)).
class IndexOutOfRangeError : public std::out_of_range {
public:
  IndexOutOfRangeError(dim_t index, Shape shape);
  dim_t index() const noexcept { return index_; }
  const Shape& shape() const noexcept { return shape_; }
private:
  dim_t index_;
  Shape shape_;
};

// Nested array literal that is ragged. ndim() counts the dimensions that
// were consistent; detected() is the shape over those dimensions.
class InhomogeneousShapeError : public std::invalid_argument {
public:
  InhomogeneousShapeError(std::size_t ndim, Shape detected);
  std::size_t ndim() const noexcept { return ndim_; }
  const Shape& detected() const noexcept { return detected_; }
private:
  std::size_t ndim_;
  Shape detected_;
};

} // namespace nj
