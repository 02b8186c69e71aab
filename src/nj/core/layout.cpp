#include "nj/core/layout.hpp"
#include "nj/core/errors.hpp"
#include "nj/core/shape.hpp"

namespace nj {

Strides row_major_strides(const Shape& shape) {
  Strides st(shape.size(), 1);
  for (int i = int(shape.size()) - 2; i >= 0; --i)
    st[std::size_t(i)] = st[std::size_t(i + 1)] * shape[std::size_t(i + 1)];
  return st;
}

Coords to_coordinates(dim_t flat, const Shape& shape) {
  for (std::size_t i = 0; i < shape.size(); ++i)
    if (shape[i] < 0) throw InvalidSizeError(shape, i);
  if (flat < 0 || flat >= numel(shape)) throw IndexOutOfRangeError(flat, shape);
  Coords idx(shape.size());
  for (int i = int(shape.size()) - 1; i >= 0; --i) {
    const auto ui = std::size_t(i);
    idx[ui] = flat % shape[ui];
    flat /= shape[ui];
  }
  return idx;
}

dim_t to_flat_index(const Coords& coords, const Strides& strides) {
  if (coords.size() != strides.size())
    throw DimensionMismatchError(coords.size(), strides.size());
  dim_t off = 0;
  for (std::size_t d = 0; d < coords.size(); ++d) off += coords[d] * strides[d];
  return off;
}

} // namespace nj
