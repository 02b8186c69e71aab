#include "nj/core/shape.hpp"
#include "nj/core/errors.hpp"

#include <algorithm>
#include <limits>

namespace nj {

static void check_non_negative(const Shape& s) {
  for (std::size_t i = 0; i < s.size(); ++i)
    if (s[i] < 0) throw InvalidSizeError(s, i);
}

dim_t numel(const Shape& shape) {
  check_non_negative(shape);
  if (std::find(shape.begin(), shape.end(), dim_t{0}) != shape.end()) return 0;
  dim_t n = 1;
  for (std::size_t i = 0; i < shape.size(); ++i) {
    const dim_t d = shape[i];
    if (n > std::numeric_limits<dim_t>::max() / d) throw InvalidSizeError(shape, i);
    n *= d;
  }
  return n;
}

Shape broadcast_two(const Shape& a, const Shape& b) {
  check_non_negative(a);
  check_non_negative(b);
  const std::size_t r = std::max(a.size(), b.size());
  Shape out(r, 1);
  // walk from the trailing dim; i counts positions from the right
  for (std::size_t i = 0; i < r; ++i) {
    const dim_t ad = (i < a.size()) ? a[a.size() - 1 - i] : 1;
    const dim_t bd = (i < b.size()) ? b[b.size() - 1 - i] : 1;
    if (ad != bd && ad != 1 && bd != 1)
      throw ShapeIncompatibilityError(a, b);
    out[r - 1 - i] = std::max(ad, bd);
  }
  return out;
}

Shape normalize_one(const Shape& shape) {
  for (std::size_t i = 0; i < shape.size(); ++i)
    if (shape[i] <= 0) throw InvalidSizeError(shape, i);
  return shape;
}

Shape broadcast_all(const std::vector<Shape>& shapes) {
  Shape acc;
  for (const auto& s : shapes) acc = broadcast_two(acc, s);
  return acc;
}

} // namespace nj
