// bindings/nj.cpp — pybind11 module exposing the shape/layout core.
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <string>

#include "nj/all.hpp"

namespace py = pybind11;

#ifndef NJ_BINDINGS_VERSION
#define NJ_BINDINGS_VERSION "0.1.0"
#endif

namespace {

// Python object -> nj::Value. Lists and tuples nest; dict and any other
// object become an opaque Object named after its Python type.
nj::Value to_value(const py::handle& h) {
  if (h.is_none()) return nj::Value();
  if (py::isinstance<py::bool_>(h)) return nj::Value(h.cast<bool>());
  if (py::isinstance<py::int_>(h)) return nj::Value(h.cast<std::int64_t>());
  if (py::isinstance<py::float_>(h)) return nj::Value(h.cast<double>());
  if (py::isinstance<py::str>(h)) return nj::Value(h.cast<std::string>());
  if (py::isinstance<py::list>(h) || py::isinstance<py::tuple>(h)) {
    nj::Array a;
    for (const auto& item : h) a.push_back(to_value(item));
    return nj::Value(std::move(a));
  }
  return nj::Value(nj::Object{py::str(h.get_type().attr("__name__")).cast<std::string>()});
}

} // anon

PYBIND11_MODULE(nj, m) {
  m.attr("__version__") = NJ_BINDINGS_VERSION;

  py::enum_<nj::DType>(m, "DType")
    .value("int8", nj::DType::Int8)
    .value("int16", nj::DType::Int16)
    .value("int32", nj::DType::Int32)
    .value("int64", nj::DType::Int64)
    .value("float32", nj::DType::Float32)
    .value("float64", nj::DType::Float64)
    .value("string", nj::DType::String)
    .value("object", nj::DType::Object)
    .value("bool", nj::DType::Bool)
    .value("char", nj::DType::Char);

  // --- errors: each maps to a Python exception class of the same name ---
  py::register_exception<nj::ShapeIncompatibilityError>(m, "ShapeIncompatibilityError", PyExc_ValueError);
  py::register_exception<nj::InvalidSizeError>(m, "InvalidSizeError", PyExc_ValueError);
  py::register_exception<nj::UnsupportedKindError>(m, "UnsupportedKindError", PyExc_ValueError);
  py::register_exception<nj::DimensionMismatchError>(m, "DimensionMismatchError", PyExc_ValueError);
  py::register_exception<nj::InhomogeneousShapeError>(m, "InhomogeneousShapeError", PyExc_ValueError);
  py::register_exception<nj::IndexOutOfRangeError>(m, "IndexOutOfRangeError", PyExc_IndexError);

  // --- shapes ---
  m.def("broadcast_two", &nj::broadcast_two, py::arg("a"), py::arg("b"),
        "Broadcast two shapes (right-aligned, 1 stretches)");
  m.def("normalize_one", &nj::normalize_one, py::arg("shape"),
        "Return shape unchanged; raise InvalidSizeError on a zero/negative extent");
  m.def("broadcast_all", &nj::broadcast_all, py::arg("shapes"));
  m.def("numel", &nj::numel, py::arg("shape"));

  // --- layout ---
  m.def("row_major_strides", &nj::row_major_strides, py::arg("shape"));
  m.def("to_coordinates", &nj::to_coordinates, py::arg("flat"), py::arg("shape"));
  m.def("to_flat_index", &nj::to_flat_index, py::arg("coords"), py::arg("strides"));

  // --- element sizes ---
  m.def("element_size", [](nj::DType k){ return nj::element_size(k); }, py::arg("kind"));
  m.def("reference_width", []{ return nj::default_size_table().reference_width(); });

  // --- introspection over Python values ---
  m.def("resolve_scalar_kind", [](py::object v){ return nj::resolve_scalar_kind(to_value(v)); });
  m.def("is_primitive_array", [](py::object v){ return nj::is_primitive_array(to_value(v)); });
  m.def("is_scalar_value", [](py::object v){ return nj::is_scalar_value(to_value(v)); });
  m.def("is_floating_scalar", [](py::object v){ return nj::is_floating_scalar(to_value(v)); });
  m.def("infer_shape", [](py::object v){ return nj::infer_shape(to_value(v)); });
}
