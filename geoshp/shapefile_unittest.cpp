#include "shapefile.hpp"

#include <sstream>

#include "byte_cursor.hpp"
#include "error.hpp"
#include "testing/shapefile_builder.hpp"

#define BOOST_TEST_MODULE shapefile_unittest
#include <boost/test/included/unit_test.hpp>

using namespace geoshp;
using namespace geoshp::testing;
using shp::shape_type;

namespace {

shp::file_header parse(const std::string& bytes) {
  byte_cursor in(std::unique_ptr<std::istream>(new std::istringstream(bytes)));
  return shp::read_header(in);
}

// Overwrites 4 bytes of `bytes` at `at`.
template <class T>
std::string patch(std::string bytes, std::size_t at, T value) {
  std::string word;
  append(word, value);
  bytes.replace(at, word.size(), word);
  return bytes;
}

} // namespace

BOOST_AUTO_TEST_CASE( header_is_100_bytes ) {
  BOOST_CHECK_EQUAL(sizeof(shp::detail::header), 100u);
  BOOST_CHECK_EQUAL(shapefile_builder(shape_type::point).bytes().size(), 100u);
}

BOOST_AUTO_TEST_CASE( parses_length_type_and_bounds ) {
  shapefile_builder file(shape_type::polyline);
  file.add_poly({0}, {{0, 0}, {1, 1}})
      .bounds(-10.5, -20, 30, 40.25);
  const shp::file_header header = parse(file.bytes());

  BOOST_CHECK_EQUAL(header.file_length, file.file_length());
  BOOST_CHECK(header.type == shape_type::polyline);
  BOOST_CHECK_EQUAL(header.version, 1000);
  BOOST_CHECK_EQUAL(header.bounds.min_corner().x(), -10.5);
  BOOST_CHECK_EQUAL(header.bounds.min_corner().y(), -20);
  BOOST_CHECK_EQUAL(header.bounds.max_corner().x(), 30);
  BOOST_CHECK_EQUAL(header.bounds.max_corner().y(), 40.25);
}

BOOST_AUTO_TEST_CASE( file_length_is_stored_in_words ) {
  const std::string bytes = shapefile_builder(shape_type::point)
    .add_point(1, 2).add_point(3, 4).bytes();
  // 100 byte header plus two records of 8 + 20 bytes.
  BOOST_CHECK_EQUAL(parse(bytes).file_length, 156);
  BOOST_CHECK_EQUAL(bytes.substr(24, 4), std::string("\0\0\0\x4e", 4));
}

BOOST_AUTO_TEST_CASE( reads_z_and_m_ranges ) {
  std::string bytes = shapefile_builder(shape_type::point_z).bytes();
  bytes = patch(bytes, 68, boost::endian::little_float64_t(1));
  bytes = patch(bytes, 76, boost::endian::little_float64_t(2));
  bytes = patch(bytes, 84, boost::endian::little_float64_t(3));
  bytes = patch(bytes, 92, boost::endian::little_float64_t(4));
  const shp::file_header header = parse(bytes);
  BOOST_CHECK_EQUAL(header.z.min, 1);
  BOOST_CHECK_EQUAL(header.z.max, 2);
  BOOST_CHECK_EQUAL(header.m.min, 3);
  BOOST_CHECK_EQUAL(header.m.max, 4);
}

BOOST_AUTO_TEST_CASE( rejects_unknown_shape_type ) {
  const std::string bytes = shapefile_builder(shape_type::point).bytes();
  BOOST_CHECK_THROW(parse(patch(bytes, 32, boost::endian::little_int32_t(2))),
                    malformed_header);
  BOOST_CHECK_THROW(parse(patch(bytes, 32, boost::endian::little_int32_t(99))),
                    malformed_header);
}

BOOST_AUTO_TEST_CASE( rejects_bad_file_code ) {
  const std::string bytes = shapefile_builder(shape_type::point).bytes();
  BOOST_CHECK_THROW(parse(patch(bytes, 0, boost::endian::big_int32_t(1234))),
                    malformed_header);
}

BOOST_AUTO_TEST_CASE( rejects_short_files ) {
  const std::string bytes = shapefile_builder(shape_type::point).bytes();
  BOOST_CHECK_THROW(parse(bytes.substr(0, 60)), malformed_header);
  BOOST_CHECK_THROW(parse(""), malformed_header);
  BOOST_CHECK_THROW(parse(shapefile_builder(shape_type::point)
                            .declared_length(80).bytes()),
                    malformed_header);
}

BOOST_AUTO_TEST_CASE( shape_type_set_is_closed ) {
  for (int32_t code : {0, 1, 3, 5, 8, 11, 13, 15, 18, 21, 23, 25, 28, 31}) {
    BOOST_CHECK(shp::is_shape_type(code));
  }
  for (int32_t code : {-1, 2, 4, 6, 7, 9, 10, 12, 30, 32}) {
    BOOST_CHECK(!shp::is_shape_type(code));
  }
  BOOST_CHECK(shp::has_z(shape_type::multipatch));
  BOOST_CHECK(shp::has_m(shape_type::polyline_z));
  BOOST_CHECK(!shp::has_z(shape_type::polygon_m));
  BOOST_CHECK(!shp::has_m(shape_type::polygon));
  BOOST_CHECK_EQUAL(std::string(shp::to_string(shape_type::polygon_z)),
                    "PolygonZ");
}
