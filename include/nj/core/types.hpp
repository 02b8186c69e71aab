#pragma once
#include <cstdint>
#include <vector>

namespace nj {

// Extents, strides, coordinates and flat offsets share one signed type:
// strides may be negative for reversed views.
using dim_t = std::int64_t;

using Shape  = std::vector<dim_t>;
using Strides = std::vector<dim_t>;
using Coords = std::vector<dim_t>;

} // namespace nj
