#include "shape_decoder.hpp"

#include <boost/log/trivial.hpp>

#include "byte_cursor.hpp"
#include "error.hpp"
#include "utility.hpp"

namespace geoshp {

namespace shp {

const std::size_t shape_decoder::bounds_prefix;

namespace {

// Bounds-checked little-endian reads over one record's payload.
class payload {
 public:
  payload(const char* first, const char* last)
      : current_(first), last_(last) {}

  template <class T>
  T read() {
    const T* value = as<T>(current_, last_);
    if (value == nullptr) {
      throw truncated_record("record ends " + std::to_string(remaining()) +
                             " bytes into a " + std::to_string(sizeof(T)) +
                             " byte field");
    }
    current_ += sizeof(T);
    return *value;
  }

  // Checks `count` items of `size` bytes fit before reading them.
  void require(int32_t count, std::size_t size, const char* what) const {
    if (count < 0) {
      throw malformed_record(std::string("negative ") + what + " count");
    }
    if (std::size_t(count) * size > remaining()) {
      throw truncated_record(std::string("record too short for ") +
                             std::to_string(count) + " " + what);
    }
  }

  std::size_t remaining() const { return std::size_t(last_ - current_); }

 private:
  const char* current_;
  const char* last_;
};

box read_box(payload& in) {
  const detail::box raw = in.read<detail::box>();
  return box(point_xy(raw.x_min, raw.y_min), point_xy(raw.x_max, raw.y_max));
}

point_xy read_point(payload& in) {
  const detail::point raw = in.read<detail::point>();
  return point_xy(raw.x, raw.y);
}

std::vector<point_xy> read_points(payload& in, int32_t count) {
  in.require(count, sizeof(detail::point), "points");
  std::vector<point_xy> points;
  points.reserve(count);
  for (int32_t i = 0; i < count; ++i) {
    points.push_back(read_point(in));
  }
  return points;
}

std::vector<int32_t> read_ints(payload& in, int32_t count, const char* what) {
  in.require(count, sizeof(int32_t), what);
  std::vector<int32_t> values;
  values.reserve(count);
  for (int32_t i = 0; i < count; ++i) {
    values.push_back(in.read<boost::endian::little_int32_t>());
  }
  return values;
}

measures read_measures(payload& in, int32_t count) {
  in.require(count, sizeof(double), "measures");
  measures result;
  const detail::range raw = in.read<detail::range>();
  result.bounds.min = raw.min;
  result.bounds.max = raw.max;
  result.values.reserve(count);
  for (int32_t i = 0; i < count; ++i) {
    result.values.push_back(in.read<boost::endian::little_float64_t>());
  }
  return result;
}

// An M block is optional in Z and M files: it is there when bytes remain.
boost::optional<measures> read_optional_measures(payload& in, int32_t count) {
  if (in.remaining() == 0) {
    return {};
  }
  return read_measures(in, count);
}

void read_zm(payload& in, shape_type type, int32_t count,
             boost::optional<measures>& z, boost::optional<measures>& m) {
  if (has_z(type)) {
    z = read_measures(in, count);
  }
  if (has_m(type)) {
    m = read_optional_measures(in, count);
  }
}

// Splits `points` into half-open slices [parts[i], parts[i+1]); the last part
// runs to the end.
template <class Part>
std::vector<Part> split(const std::vector<int32_t>& parts,
                        const std::vector<point_xy>& points) {
  std::vector<Part> result;
  result.reserve(parts.size());
  for (std::size_t i = 0; i < parts.size(); ++i) {
    const int32_t first = parts[i];
    const int32_t last = i + 1 < parts.size() ? parts[i + 1]
                                              : int32_t(points.size());
    if (first < 0 || first > last || last > int32_t(points.size())) {
      throw malformed_record("part " + std::to_string(i) + " spans [" +
                             std::to_string(first) + ", " +
                             std::to_string(last) + ") of " +
                             std::to_string(points.size()) + " points");
    }
    result.emplace_back(points.begin() + first, points.begin() + last);
  }
  return result;
}

geometry decode_null(payload&, shape_type) {
  return null_shape();
}

geometry decode_point(payload& in, shape_type type) {
  point g;
  g.xy = read_point(in);
  if (has_z(type)) {
    g.z = double(in.read<boost::endian::little_float64_t>());
  }
  if (has_m(type) && (!has_z(type) || in.remaining() != 0)) {
    g.m = double(in.read<boost::endian::little_float64_t>());
  }
  return g;
}

geometry decode_multipoint(payload& in, shape_type type) {
  multipoint g;
  g.bounds = read_box(in);
  const int32_t num_points = in.read<boost::endian::little_int32_t>();
  const std::vector<point_xy> points = read_points(in, num_points);
  g.points.assign(points.begin(), points.end());
  read_zm(in, type, num_points, g.z, g.m);
  return g;
}

geometry decode_polyline(payload& in, shape_type type) {
  polyline g;
  g.bounds = read_box(in);
  const int32_t num_parts = in.read<boost::endian::little_int32_t>();
  const int32_t num_points = in.read<boost::endian::little_int32_t>();
  const std::vector<int32_t> parts = read_ints(in, num_parts, "parts");
  const std::vector<point_xy> points = read_points(in, num_points);
  for (auto&& part : split<linestring>(parts, points)) {
    g.parts.push_back(std::move(part));
  }
  read_zm(in, type, num_points, g.z, g.m);
  return g;
}

geometry decode_polygon(payload& in, shape_type type) {
  polygon g;
  g.bounds = read_box(in);
  const int32_t num_parts = in.read<boost::endian::little_int32_t>();
  const int32_t num_points = in.read<boost::endian::little_int32_t>();
  const std::vector<int32_t> parts = read_ints(in, num_parts, "parts");
  const std::vector<point_xy> points = read_points(in, num_points);
  g.rings = split<ring>(parts, points);
  read_zm(in, type, num_points, g.z, g.m);
  return g;
}

geometry decode_multipatch(payload& in, shape_type) {
  multipatch g;
  g.bounds = read_box(in);
  const int32_t num_parts = in.read<boost::endian::little_int32_t>();
  const int32_t num_points = in.read<boost::endian::little_int32_t>();
  const std::vector<int32_t> parts = read_ints(in, num_parts, "parts");
  const std::vector<int32_t> types = read_ints(in, num_parts, "part types");
  const std::vector<point_xy> points = read_points(in, num_points);
  std::vector<linestring> lines = split<linestring>(parts, points);
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (types[i] < int32_t(patch_type::triangle_strip) ||
        types[i] > int32_t(patch_type::ring)) {
      throw malformed_record("unknown multipatch part type " +
                             std::to_string(types[i]));
    }
    g.patches.push_back({static_cast<patch_type>(types[i]),
                         std::move(lines[i])});
  }
  g.z = read_measures(in, num_points);
  g.m = read_optional_measures(in, num_points);
  return g;
}

using decode_fn = geometry (*)(payload&, shape_type);

decode_fn routine_for(shape_type type) {
  switch (type) {
    case shape_type::null_shape:
      return decode_null;
    case shape_type::point:
    case shape_type::point_z:
    case shape_type::point_m:
      return decode_point;
    case shape_type::multipoint:
    case shape_type::multipoint_z:
    case shape_type::multipoint_m:
      return decode_multipoint;
    case shape_type::polyline:
    case shape_type::polyline_z:
    case shape_type::polyline_m:
      return decode_polyline;
    case shape_type::polygon:
    case shape_type::polygon_z:
    case shape_type::polygon_m:
      return decode_polygon;
    case shape_type::multipatch:
      return decode_multipatch;
  }
  throw unsupported_shape_type(int32_t(type));
}

bool is_point(shape_type type) {
  return type == shape_type::point || type == shape_type::point_z ||
         type == shape_type::point_m;
}

} // namespace

shape_decoder::shape_decoder(shape_type type, reader_options options)
    : type_(type), options_(options) {
  if (!is_shape_type(int32_t(type))) {
    throw unsupported_shape_type(int32_t(type));
  }
}

geometry shape_decoder::decode(byte_cursor& in, int32_t length) const {
  if (length < 0) {
    throw malformed_record("negative content length " +
                           std::to_string(length));
  }
  const std::vector<char> bytes =
    in.read_bytes(std::size_t(length) * sizeof(uint16_t));
  return decode(bytes.data(), bytes.data() + bytes.size());
}

geometry shape_decoder::decode(const char* first, const char* last) const {
  payload in(first, last);
  const shape_type type = record_type(in.read<boost::endian::little_int32_t>());
  geometry g = routine_for(type)(in, type);
  if (in.remaining() != 0) {
    if (options_.strict_content_length) {
      throw malformed_record(std::string(to_string(type)) + " record has " +
                             std::to_string(in.remaining()) +
                             " bytes past its geometry");
    }
    BOOST_LOG_TRIVIAL(warning) << "ignoring " << in.remaining()
                               << " trailing bytes in " << to_string(type)
                               << " record";
  }
  return g;
}

boost::optional<box>
    shape_decoder::read_bounds(const char* first, const char* last) const {
  payload in(first, last);
  const shape_type type = record_type(in.read<boost::endian::little_int32_t>());
  if (type == shape_type::null_shape) {
    return {};
  }
  if (is_point(type)) {
    const point_xy xy = read_point(in);
    return box(xy, xy);
  }
  return read_box(in);
}

shape_type shape_decoder::record_type(int32_t code) const {
  if (!is_shape_type(code)) {
    throw unsupported_shape_type(code);
  }
  const shape_type type = static_cast<shape_type>(code);
  if (type != shape_type::null_shape && type != type_) {
    throw malformed_record(std::string(to_string(type)) +
                           " record in a " + to_string(type_) + " file");
  }
  return type;
}

} // namespace shp

} // namespace geoshp
