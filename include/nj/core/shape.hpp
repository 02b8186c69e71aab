#pragma once
#include <vector>

#include "nj/core/types.hpp"

namespace nj {

// Product of extents; 1 for the rank-0 shape, 0 if any extent is 0. Throws
// InvalidSizeError (axis = where the product first overflows dim_t) when the
// element count is not representable, or on a negative extent.
dim_t numel(const Shape& shape);

// NumPy-style broadcast: right-aligned, missing leading dims count as 1, and
// an extent of 1 stretches to the other operand's. Throws
// ShapeIncompatibilityError naming (a, b) in the order given; throws
// InvalidSizeError if either operand has a negative extent.
Shape broadcast_two(const Shape& a, const Shape& b);

// Validation pass-through for a single shape: returns it unchanged, or throws
// InvalidSizeError if any extent is <= 0. Does no broadcasting.
Shape normalize_one(const Shape& shape);

// Left fold of broadcast_two. An empty list gives the rank-0 shape.
Shape broadcast_all(const std::vector<Shape>& shapes);

} // namespace nj
