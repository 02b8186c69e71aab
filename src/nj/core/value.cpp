#include "nj/core/value.hpp"
#include "nj/core/errors.hpp"

#include <type_traits>

namespace nj {

namespace {

template <class T>
constexpr bool is_number_v = std::is_arithmetic_v<T> && !std::is_same_v<T, bool>
                             && !std::is_same_v<T, char>;

// First non-array value reached through first elements, or nullptr if an
// empty array is hit on the way down.
const Value* first_leaf(const Value& v) {
  const Value* cur = &v;
  while (cur->is_array()) {
    const auto& a = cur->as_array();
    if (a.empty()) return nullptr;
    cur = &a.front();
  }
  return cur;
}

} // namespace

DType Value::kind() const {
  return std::visit([](const auto& x) -> DType {
    using T = std::decay_t<decltype(x)>;
    if constexpr (std::is_same_v<T, std::monostate> || std::is_same_v<T, Object>
                  || std::is_same_v<T, Array>) {
      return DType::Object;
    } else {
      return dtype_of_v<T>;
    }
  }, v_);
}

DType resolve_scalar_kind(const Value& v) {
  const Value* leaf = first_leaf(v);
  return leaf ? leaf->kind() : DType::Object;
}

bool is_primitive_array(const Value& v) {
  if (!v.is_array()) return false;
  const Value* leaf = first_leaf(v);
  if (!leaf) return true;
  return std::visit([](const auto& x) {
    using T = std::decay_t<decltype(x)>;
    return std::is_arithmetic_v<T> || std::is_same_v<T, std::string>;
  }, leaf->storage());
}

bool is_scalar_value(const Value& v) {
  return std::visit([](const auto& x) {
    using T = std::decay_t<decltype(x)>;
    return is_number_v<T> || std::is_same_v<T, std::string>;
  }, v.storage());
}

bool is_floating_scalar(const Value& v) {
  return std::visit([](const auto& x) {
    using T = std::decay_t<decltype(x)>;
    return std::is_floating_point_v<T>;
  }, v.storage());
}

Shape infer_shape(const Value& v) {
  Shape shape;
  std::vector<const Value*> level{&v};
  while (!level.empty()) {
    std::size_t arrays = 0;
    for (const Value* x : level) arrays += x->is_array() ? 1 : 0;
    if (arrays == 0) break;
    if (arrays != level.size()) throw InhomogeneousShapeError(shape.size(), shape);

    const std::size_t len = level.front()->as_array().size();
    std::vector<const Value*> next;
    next.reserve(len * level.size());
    for (const Value* x : level) {
      const auto& a = x->as_array();
      if (a.size() != len) throw InhomogeneousShapeError(shape.size(), shape);
      for (const auto& e : a) next.push_back(&e);
    }
    shape.push_back(dim_t(len));
    level.swap(next);
  }
  return shape;
}

} // namespace nj
