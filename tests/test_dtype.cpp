#include "test_framework.hpp"
#include "nj/core/config.hpp"
#include "nj/core/dtype.hpp"
#include "nj/core/errors.hpp"

#include <string>
#include <thread>
#include <vector>

using nj::DType;
using nj::dim_t;

TEST("dtype/element_size/fixed_widths") {
  ASSERT_EQ(nj::element_size(DType::Int8), dim_t{1});
  ASSERT_EQ(nj::element_size(DType::Int16), dim_t{2});
  ASSERT_EQ(nj::element_size(DType::Int32), dim_t{4});
  ASSERT_EQ(nj::element_size(DType::Int64), dim_t{8});
  ASSERT_EQ(nj::element_size(DType::Float32), dim_t{4});
  ASSERT_EQ(nj::element_size(DType::Float64), dim_t{8});
  ASSERT_EQ(nj::element_size<double>(), dim_t{8});
  ASSERT_EQ(nj::element_size<std::int16_t>(), dim_t{2});
}

TEST("dtype/element_size/reference_kinds_share_width") {
  const auto w = dim_t(nj::default_size_table().reference_width());
  ASSERT_EQ(nj::element_size(DType::String), w);
  ASSERT_EQ(nj::element_size(DType::Object), w);
}

TEST("dtype/element_size/unsupported_kind") {
  ASSERT_THROWS(nj::element_size(DType::Bool), nj::UnsupportedKindError);
  try {
    nj::element_size(DType::Char);
    ASSERT_TRUE(false);
  } catch (const nj::UnsupportedKindError& e) {
    ASSERT_TRUE(e.kind() == DType::Char);
    ASSERT_EQ(std::string(e.what()), std::string("Unsupported data type: char"));
  }
  ASSERT_FALSE(nj::default_size_table().contains(DType::Bool));
  ASSERT_TRUE(nj::default_size_table().contains(DType::Object));
}

TEST("dtype/size_table/custom_reference_width") {
  const nj::SizeTable t32(8);
  ASSERT_EQ(t32.size_of(DType::Object), dim_t{8});
  ASSERT_EQ(t32.size_of(DType::String), dim_t{8});
  ASSERT_EQ(t32.size_of(DType::Int32), dim_t{4});
  // zero falls back to the default placeholder
  const nj::SizeTable t0(0);
  ASSERT_EQ(t0.reference_width(), nj::config::kDefaultReferenceWidth);
  // a width that cannot be an int64 byte count never becomes negative
  const nj::SizeTable huge(nj::config::kMaxSize + 1);
  ASSERT_EQ(huge.reference_width(), nj::config::kDefaultReferenceWidth);
  ASSERT_TRUE(huge.size_of(DType::Object) > 0);
}

TEST("dtype/default_table/concurrent_readers") {
  std::vector<std::thread> ts;
  std::vector<dim_t> got(8, 0);
  for (std::size_t i = 0; i < got.size(); ++i)
    ts.emplace_back([&got, i]{ got[i] = nj::default_size_table().size_of(DType::Float64); });
  for (auto& t : ts) t.join();
  for (auto g : got) ASSERT_EQ(g, dim_t{8});
}

TEST("config/parse_size") {
  using nj::config::parse_size;
  ASSERT_EQ(parse_size(nullptr, 16), std::size_t{16});
  ASSERT_EQ(parse_size("", 16), std::size_t{16});
  ASSERT_EQ(parse_size("24", 16), std::size_t{24});
  ASSERT_EQ(parse_size("0", 16), std::size_t{16});
  ASSERT_EQ(parse_size("12b", 16), std::size_t{16});
  ASSERT_EQ(parse_size("9223372036854775807", 16), std::size_t{9223372036854775807ull});
  // past INT64_MAX, and past SIZE_MAX where it would wrap
  ASSERT_EQ(parse_size("9223372036854775808", 16), std::size_t{16});
  ASSERT_EQ(parse_size("99999999999999999999999", 16), std::size_t{16});
}

TEST("dtype/names") {
  ASSERT_EQ(std::string(nj::dtype_name(DType::Float32)), std::string("float32"));
  ASSERT_EQ(std::string(nj::dtype_name(DType::Object)), std::string("object"));
  ASSERT_TRUE(nj::dtype_of_v<std::int32_t> == DType::Int32);
  ASSERT_TRUE(nj::dtype_of_v<std::string> == DType::String);
}
