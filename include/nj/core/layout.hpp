#pragma once
#include "nj/core/types.hpp"

namespace nj {

// Contiguous C-order strides in elements: last dim 1, each earlier dim the
// product of the extents after it.
Strides row_major_strides(const Shape& shape);

// Flat row-major index -> coordinates, decomposing from the last dim to the
// first (c[i] = flat % shape[i]; flat /= shape[i]). Strides are implied by
// `shape`, so this inverts to_flat_index only for row_major_strides(shape).
// Throws IndexOutOfRangeError unless 0 <= flat < numel(shape).
Coords to_coordinates(dim_t flat, const Shape& shape);

// sum(coords[i] * strides[i]). Any strides are accepted (transposed,
// broadcast zero-strides, reversed). Throws DimensionMismatchError when the
// ranks differ.
dim_t to_flat_index(const Coords& coords, const Strides& strides);

} // namespace nj
