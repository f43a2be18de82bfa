#pragma once

#include <cstddef>
#include <cstdint>

#include <boost/endian/arithmetic.hpp>
#include <boost/optional.hpp>

#include "geometry.hpp"

namespace geoshp {

class byte_cursor;

namespace shp {

enum class shape_type : int32_t {
	null_shape = 0,
	point = 1,
	polyline = 3,
	polygon = 5,
	multipoint = 8,
	point_z = 11,
	polyline_z = 13,
	polygon_z = 15,
	multipoint_z = 18,
	point_m = 21,
	polyline_m = 23,
	polygon_m = 25,
	multipoint_m = 28,
	multipatch = 31,
};

bool is_shape_type(int32_t code);
const char* to_string(shape_type type);

bool has_z(shape_type type);
bool has_m(shape_type type);

const int32_t file_code = 9994;
const int64_t header_length = 100;

namespace detail {

using namespace boost::endian;
#pragma pack(push, 1)

struct header {
	big_int32_t 		file_code;
  big_int32_t			unused_1;
  big_int32_t			unused_2;
  big_int32_t			unused_3;
  big_int32_t			unused_4;
  big_int32_t			unused_5;
  big_int32_t     file_length;
  little_int32_t  version;
  little_int32_t  shape_type;
  little_float64_t x_min;
  little_float64_t y_min;
  little_float64_t x_max;
  little_float64_t y_max;
  little_float64_t z_min;
  little_float64_t z_max;
  little_float64_t m_min;
  little_float64_t m_max;
};
static_assert(sizeof(header) == 100,
  "shp::header is not packed");

struct record_header {
	big_int32_t number;
	big_int32_t length;
};
static_assert(sizeof(record_header) == 8,
  "shp::record_header is not packed");

struct box {
  little_float64_t x_min;
  little_float64_t y_min;
  little_float64_t x_max;
  little_float64_t y_max;
};
static_assert(sizeof(box) == 32,
  "shp::box is not packed");

struct point {
  little_float64_t x;
  little_float64_t y;
};
static_assert(sizeof(point) == 16,
  "shp::point is not packed");

struct multipoint_header {
  box bounds;
  little_int32_t num_points;
};
static_assert(sizeof(multipoint_header) == 36,
  "shp::multipoint_header is not packed");

struct polyline_header {
  box bounds;
  little_int32_t num_parts;
  little_int32_t num_points;
};
static_assert(sizeof(polyline_header) == 40,
  "shp::polyline_header is not packed");

struct range {
  little_float64_t min;
  little_float64_t max;
};
static_assert(sizeof(range) == 16,
  "shp::range is not packed");

#pragma pack(pop)
} // namespace detail

struct file_header {
  int64_t file_length = 0;  // bytes
  int32_t version = 0;
  shape_type type = shape_type::null_shape;
  box bounds;
  range z;
  range m;
};

// Reads the 100 byte header at the cursor's position.
file_header read_header(byte_cursor& in);

struct record_offset {
  int64_t offset = 0;  // of the record header, from file start
  int32_t number = 0;
  int32_t length = 0;  // content length in 16-bit words
  boost::optional<box> bounds;  // none for null-shape records
};

// One record seen by a streaming bounding-box scan.
struct mbr_info {
  std::size_t ordinal = 0;
  record_offset record;
};

} // namespace shp

} // namespace geoshp
