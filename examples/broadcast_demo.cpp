// Usage: nj_broadcast_demo 8,1,6,1 7,1,5 [more shapes...]
// Prints the broadcast shape, its row-major strides and element count.
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "nj/all.hpp"

static nj::Shape parse_shape(const std::string& text) {
  nj::Shape s;
  if (text.empty() || text == "()") return s;
  std::stringstream ss(text);
  std::string tok;
  while (std::getline(ss, tok, ',')) {
    std::size_t used = 0;
    const long long v = std::stoll(tok, &used);
    if (used != tok.size()) throw std::invalid_argument("bad extent '" + tok + "'");
    s.push_back(nj::dim_t(v));
  }
  return s;
}

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "usage: " << argv[0] << " SHAPE [SHAPE...]   (SHAPE = d0,d1,...)\n";
    return 2;
  }

  try {
    std::vector<nj::Shape> shapes;
    for (int i = 1; i < argc; ++i) shapes.push_back(parse_shape(argv[i]));

    const nj::Shape out = nj::normalize_one(nj::broadcast_all(shapes));
    const nj::Strides st = nj::row_major_strides(out);

    std::cout << "shape   " << nj::format_shape(out) << "\n"
              << "strides " << nj::format_shape(st) << "\n"
              << "numel   " << nj::numel(out) << "\n"
              << "bytes   " << nj::numel(out) * nj::element_size(nj::DType::Float64)
              << " (float64)\n";
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
