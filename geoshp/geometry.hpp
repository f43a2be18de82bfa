#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <boost/geometry/geometries/box.hpp>
#include <boost/geometry/geometries/linestring.hpp>
#include <boost/geometry/geometries/multi_linestring.hpp>
#include <boost/geometry/geometries/multi_point.hpp>
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/geometries/ring.hpp>
#include <boost/optional.hpp>
#include <boost/variant.hpp>

namespace geoshp {

namespace shp {

namespace bg = boost::geometry;

using point_xy = bg::model::d2::point_xy<double>;
using box = bg::model::box<point_xy>;
using linestring = bg::model::linestring<point_xy>;
using ring = bg::model::ring<point_xy>;
using multi_point = bg::model::multi_point<point_xy>;
using multi_linestring = bg::model::multi_linestring<linestring>;

struct range {
  double min = 0;
  double max = 0;
};

// Z or M ordinates, one per point of the owning geometry, in point order.
struct measures {
  range bounds;
  std::vector<double> values;
};

// Decoded form of a null-shape record.
struct null_shape {};

struct point {
  point_xy xy;
  boost::optional<double> z;
  boost::optional<double> m;
};

struct multipoint {
  box bounds;
  multi_point points;
  boost::optional<measures> z;
  boost::optional<measures> m;
};

struct polyline {
  box bounds;
  multi_linestring parts;
  boost::optional<measures> z;
  boost::optional<measures> m;
};

// Rings in file order. Outer and inner rings are not told apart here.
struct polygon {
  box bounds;
  std::vector<ring> rings;
  boost::optional<measures> z;
  boost::optional<measures> m;
};

enum class patch_type : int32_t {
  triangle_strip = 0,
  triangle_fan = 1,
  outer_ring = 2,
  inner_ring = 3,
  first_ring = 4,
  ring = 5,
};

struct patch {
  patch_type type;
  linestring points;
};

struct multipatch {
  box bounds;
  std::vector<patch> patches;
  measures z;
  boost::optional<measures> m;
};

using geometry =
  boost::variant<null_shape, point, multipoint, polyline, polygon, multipatch>;

bool is_null(const geometry& g);

// Stored bounding box of the record; a degenerate box for points.
boost::optional<box> envelope(const geometry& g);

std::size_t num_points(const geometry& g);

// Axis-aligned overlap. Touching edges count as intersecting.
bool intersects(const box& a, const box& b);

// XY only. Polygon rings are written as one polygon, first ring outer.
std::string to_wkt(const geometry& g);

// Exact coordinate comparison.
bool operator==(const range& a, const range& b);
bool operator==(const measures& a, const measures& b);
bool operator==(const null_shape&, const null_shape&);
bool operator==(const point& a, const point& b);
bool operator==(const multipoint& a, const multipoint& b);
bool operator==(const polyline& a, const polyline& b);
bool operator==(const polygon& a, const polygon& b);
bool operator==(const patch& a, const patch& b);
bool operator==(const multipatch& a, const multipatch& b);

bool same(const point_xy& a, const point_xy& b);
bool same(const box& a, const box& b);

} // namespace shp

} // namespace geoshp
