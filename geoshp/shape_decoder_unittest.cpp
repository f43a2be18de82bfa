#include "shape_decoder.hpp"

#include <sstream>

#include "byte_cursor.hpp"
#include "error.hpp"
#include "testing/shapefile_builder.hpp"

#define BOOST_TEST_MODULE shape_decoder_unittest
#include <boost/test/included/unit_test.hpp>

using namespace geoshp;
using namespace geoshp::testing;
using shp::shape_type;

namespace {

shp::geometry decode(shape_type file_type, const payload& p,
                     reader_options options = {}) {
  const std::string& bytes = p.bytes();
  return shp::shape_decoder(file_type, options)
    .decode(bytes.data(), bytes.data() + bytes.size());
}

template <class G>
G decode_as(shape_type file_type, const payload& p) {
  const shp::geometry g = decode(file_type, p);
  const G* typed = boost::get<G>(&g);
  BOOST_REQUIRE(typed != nullptr);
  return *typed;
}

const std::vector<xy> square = {{0, 0}, {0, 10}, {10, 10}, {10, 0}, {0, 0}};

} // namespace

BOOST_AUTO_TEST_CASE( polyline_parts_are_half_open_slices ) {
  const shp::polyline line = decode_as<shp::polyline>(
    shape_type::polyline,
    poly_payload(shape_type::polyline, {0, 3},
                 {{0, 0}, {1, 1}, {2, 0}, {5, 5}, {6, 7}}));

  BOOST_REQUIRE_EQUAL(line.parts.size(), 2u);
  BOOST_CHECK_EQUAL(line.parts[0].size(), 3u);
  BOOST_CHECK_EQUAL(line.parts[1].size(), 2u);
  BOOST_CHECK_EQUAL(line.parts[1][0].x(), 5);
  BOOST_CHECK_EQUAL(line.parts[1][1].y(), 7);
  BOOST_CHECK_EQUAL(line.bounds.max_corner().x(), 6);
  BOOST_CHECK(!line.z);
  BOOST_CHECK(!line.m);
}

BOOST_AUTO_TEST_CASE( polygon_keeps_rings_in_file_order ) {
  std::vector<xy> points = square;
  points.insert(points.end(), {{2, 2}, {4, 2}, {4, 4}, {2, 2}});
  const shp::polygon poly = decode_as<shp::polygon>(
    shape_type::polygon, poly_payload(shape_type::polygon, {0, 5}, points));

  BOOST_REQUIRE_EQUAL(poly.rings.size(), 2u);
  BOOST_CHECK_EQUAL(poly.rings[0].size(), 5u);
  BOOST_CHECK_EQUAL(poly.rings[1].size(), 4u);
  BOOST_CHECK_EQUAL(shp::num_points(poly), 9u);
  BOOST_CHECK_EQUAL(shp::to_wkt(poly),
    "POLYGON((0 0,0 10,10 10,10 0,0 0),(2 2,4 2,4 4,2 2))");
}

BOOST_AUTO_TEST_CASE( point_variants ) {
  const shp::point p = decode_as<shp::point>(
    shape_type::point, payload(shape_type::point).f64(1.5).f64(-2));
  BOOST_CHECK_EQUAL(p.xy.x(), 1.5);
  BOOST_CHECK_EQUAL(p.xy.y(), -2);
  BOOST_CHECK(!p.z && !p.m);

  const shp::point pz = decode_as<shp::point>(
    shape_type::point_z,
    payload(shape_type::point_z).f64(1).f64(2).f64(3).f64(4));
  BOOST_CHECK_EQUAL(*pz.z, 3);
  BOOST_CHECK_EQUAL(*pz.m, 4);

  const shp::point pz_no_m = decode_as<shp::point>(
    shape_type::point_z, payload(shape_type::point_z).f64(1).f64(2).f64(3));
  BOOST_CHECK_EQUAL(*pz_no_m.z, 3);
  BOOST_CHECK(!pz_no_m.m);

  const shp::point pm = decode_as<shp::point>(
    shape_type::point_m, payload(shape_type::point_m).f64(1).f64(2).f64(9));
  BOOST_CHECK(!pm.z);
  BOOST_CHECK_EQUAL(*pm.m, 9);
}

BOOST_AUTO_TEST_CASE( multipoint_with_z_and_m ) {
  const std::vector<xy> points = {{1, 1}, {2, 3}, {-1, 0}};
  payload p(shape_type::multipoint_z);
  p.box(points).i32(3).points(points)
   .values(0, 30, {10, 20, 30})
   .values(-1, 1, {-1, 0, 1});
  const shp::multipoint g = decode_as<shp::multipoint>(shape_type::multipoint_z, p);

  BOOST_CHECK_EQUAL(g.points.size(), 3u);
  BOOST_REQUIRE(g.z);
  BOOST_CHECK_EQUAL(g.z->bounds.max, 30);
  BOOST_CHECK(g.z->values == std::vector<double>({10, 20, 30}));
  BOOST_REQUIRE(g.m);
  BOOST_CHECK(g.m->values == std::vector<double>({-1, 0, 1}));
  BOOST_CHECK_EQUAL(g.bounds.min_corner().x(), -1);
}

BOOST_AUTO_TEST_CASE( m_block_is_optional ) {
  const std::vector<xy> points = {{0, 0}, {1, 1}};
  const shp::polyline zm = decode_as<shp::polyline>(
    shape_type::polyline_z,
    poly_payload(shape_type::polyline_z, {0}, points).values(0, 1, {0, 1}));
  BOOST_CHECK(zm.z);
  BOOST_CHECK(!zm.m);

  const shp::polyline m = decode_as<shp::polyline>(
    shape_type::polyline_m, poly_payload(shape_type::polyline_m, {0}, points));
  BOOST_CHECK(!m.z);
  BOOST_CHECK(!m.m);

  const shp::polyline with_m = decode_as<shp::polyline>(
    shape_type::polyline_m,
    poly_payload(shape_type::polyline_m, {0}, points).values(5, 6, {5, 6}));
  BOOST_REQUIRE(with_m.m);
  BOOST_CHECK_EQUAL(with_m.m->values[1], 6);
}

BOOST_AUTO_TEST_CASE( multipatch_parts_carry_their_type ) {
  const std::vector<xy> points = {{0, 0}, {1, 0}, {0, 1}, {5, 5}, {6, 5}, {5, 6}, {5, 5}};
  payload p(shape_type::multipatch);
  p.box(points).i32(2).i32(int32_t(points.size()))
   .i32(0).i32(3)
   .i32(int32_t(shp::patch_type::triangle_fan))
   .i32(int32_t(shp::patch_type::outer_ring))
   .points(points)
   .values(0, 6, {0, 1, 2, 3, 4, 5, 6});
  const shp::multipatch g = decode_as<shp::multipatch>(shape_type::multipatch, p);

  BOOST_REQUIRE_EQUAL(g.patches.size(), 2u);
  BOOST_CHECK(g.patches[0].type == shp::patch_type::triangle_fan);
  BOOST_CHECK_EQUAL(g.patches[0].points.size(), 3u);
  BOOST_CHECK(g.patches[1].type == shp::patch_type::outer_ring);
  BOOST_CHECK_EQUAL(g.patches[1].points.size(), 4u);
  BOOST_CHECK_EQUAL(g.z.values.size(), 7u);
  BOOST_CHECK(!g.m);
}

BOOST_AUTO_TEST_CASE( null_record_in_typed_file ) {
  const shp::geometry g =
    decode(shape_type::polygon, payload(shape_type::null_shape));
  BOOST_CHECK(shp::is_null(g));
  BOOST_CHECK(!shp::envelope(g));
  BOOST_CHECK_EQUAL(shp::num_points(g), 0u);
}

BOOST_AUTO_TEST_CASE( truncated_payloads ) {
  BOOST_CHECK_THROW(
    decode(shape_type::point, payload(shape_type::point).f64(1)),
    truncated_record);
  BOOST_CHECK_THROW(
    decode(shape_type::polyline,
           poly_payload(shape_type::polyline, {0}, square).truncate(8)),
    truncated_record);
  BOOST_CHECK_THROW(
    decode(shape_type::polygon, payload(shape_type::polygon).box(0, 0, 1, 1)),
    truncated_record);
  BOOST_CHECK_THROW(
    decode(shape_type::polyline_z,
           poly_payload(shape_type::polyline_z, {0}, square).values(0, 1, {0})),
    truncated_record);
  BOOST_CHECK_THROW(decode(shape_type::point, payload(shape_type::point).truncate(4)),
                    truncated_record);
}

BOOST_AUTO_TEST_CASE( inconsistent_structure_is_malformed ) {
  BOOST_CHECK_THROW(
    decode(shape_type::polyline,
           poly_payload(shape_type::polyline, {0, 7}, square)),
    malformed_record);
  BOOST_CHECK_THROW(
    decode(shape_type::polyline,
           poly_payload(shape_type::polyline, {3, 1}, square)),
    malformed_record);
  BOOST_CHECK_THROW(
    decode(shape_type::multipoint,
           payload(shape_type::multipoint).box(0, 0, 1, 1).i32(-1)),
    malformed_record);
}

BOOST_AUTO_TEST_CASE( record_type_must_match_file_type ) {
  BOOST_CHECK_THROW(
    decode(shape_type::polygon, payload(shape_type::point).f64(1).f64(2)),
    malformed_record);
  BOOST_CHECK_THROW(
    decode(shape_type::polygon, payload(static_cast<shape_type>(2)).f64(1)),
    unsupported_shape_type);
}

BOOST_AUTO_TEST_CASE( unsupported_file_type ) {
  BOOST_CHECK_THROW(shp::shape_decoder(static_cast<shape_type>(7)),
                    unsupported_shape_type);
  try {
    shp::shape_decoder decoder(static_cast<shape_type>(40));
    BOOST_ERROR("expected unsupported_shape_type");
  } catch (const unsupported_shape_type& e) {
    BOOST_CHECK_EQUAL(e.code(), 40);
  }
}

BOOST_AUTO_TEST_CASE( trailing_bytes ) {
  const payload padded = payload(shape_type::point).f64(1).f64(2).i32(0);
  BOOST_CHECK_THROW(decode(shape_type::point, padded), malformed_record);

  reader_options lenient;
  lenient.strict_content_length = false;
  const shp::geometry g = decode(shape_type::point, padded, lenient);
  BOOST_CHECK_EQUAL(boost::get<shp::point>(g).xy.y(), 2);
}

BOOST_AUTO_TEST_CASE( decodes_from_a_cursor ) {
  const payload p = poly_payload(shape_type::polyline, {0}, square);
  const std::string bytes = p.bytes() + "tail";
  byte_cursor in(std::unique_ptr<std::istream>(new std::istringstream(bytes)));
  const shp::geometry g =
    shp::decode(shape_type::polyline, in, int32_t(p.bytes().size() / 2));
  BOOST_CHECK_EQUAL(shp::num_points(g), 5u);
  BOOST_CHECK_EQUAL(in.position(), int64_t(p.bytes().size()));
  BOOST_CHECK_THROW(shp::decode(shape_type::polyline, in, 10), io_error);
}

BOOST_AUTO_TEST_CASE( same_bytes_decode_to_equal_geometries ) {
  const payload p = poly_payload(shape_type::polygon_m, {0}, square)
    .values(0, 4, {0, 1, 2, 3, 4});
  BOOST_CHECK(decode(shape_type::polygon_m, p) == decode(shape_type::polygon_m, p));

  const payload q = poly_payload(shape_type::polygon_m, {0}, square)
    .values(0, 4, {0, 1, 2, 3, 5});
  BOOST_CHECK(!(decode(shape_type::polygon_m, p) == decode(shape_type::polygon_m, q)));
}

BOOST_AUTO_TEST_CASE( bounds_without_coordinates ) {
  const shp::shape_decoder decoder(shape_type::polyline);
  const std::string line = poly_payload(shape_type::polyline, {0}, square).bytes();
  const std::string prefix = line.substr(0, shp::shape_decoder::bounds_prefix);
  boost::optional<shp::box> b =
    decoder.read_bounds(prefix.data(), prefix.data() + prefix.size());
  BOOST_REQUIRE(b);
  BOOST_CHECK_EQUAL(b->max_corner().y(), 10);

  const std::string null = payload(shape_type::null_shape).bytes();
  BOOST_CHECK(!decoder.read_bounds(null.data(), null.data() + null.size()));

  const shp::shape_decoder points(shape_type::point);
  const std::string pt = payload(shape_type::point).f64(3).f64(4).bytes();
  b = points.read_bounds(pt.data(), pt.data() + pt.size());
  BOOST_REQUIRE(b);
  BOOST_CHECK(shp::same(*b, shp::box(shp::point_xy(3, 4), shp::point_xy(3, 4))));
}

BOOST_AUTO_TEST_CASE( box_overlap_test ) {
  const shp::box a(shp::point_xy(0, 0), shp::point_xy(10, 10));
  BOOST_CHECK(shp::intersects(a, shp::box(shp::point_xy(5, 5), shp::point_xy(20, 20))));
  BOOST_CHECK(shp::intersects(a, shp::box(shp::point_xy(10, 10), shp::point_xy(20, 20))));
  BOOST_CHECK(shp::intersects(a, shp::box(shp::point_xy(2, 2), shp::point_xy(3, 3))));
  BOOST_CHECK(!shp::intersects(a, shp::box(shp::point_xy(11, 0), shp::point_xy(20, 10))));
  BOOST_CHECK(!shp::intersects(a, shp::box(shp::point_xy(0, -5), shp::point_xy(10, -1))));
}
