#include "shapefile.hpp"

#include "byte_cursor.hpp"
#include "error.hpp"

namespace geoshp {

namespace shp {

bool is_shape_type(int32_t code) {
  switch (static_cast<shape_type>(code)) {
    case shape_type::null_shape:
    case shape_type::point:
    case shape_type::polyline:
    case shape_type::polygon:
    case shape_type::multipoint:
    case shape_type::point_z:
    case shape_type::polyline_z:
    case shape_type::polygon_z:
    case shape_type::multipoint_z:
    case shape_type::point_m:
    case shape_type::polyline_m:
    case shape_type::polygon_m:
    case shape_type::multipoint_m:
    case shape_type::multipatch:
      return true;
  }
  return false;
}

const char* to_string(shape_type type) {
  switch (type) {
    case shape_type::null_shape: return "NullShape";
    case shape_type::point: return "Point";
    case shape_type::polyline: return "PolyLine";
    case shape_type::polygon: return "Polygon";
    case shape_type::multipoint: return "MultiPoint";
    case shape_type::point_z: return "PointZ";
    case shape_type::polyline_z: return "PolyLineZ";
    case shape_type::polygon_z: return "PolygonZ";
    case shape_type::multipoint_z: return "MultiPointZ";
    case shape_type::point_m: return "PointM";
    case shape_type::polyline_m: return "PolyLineM";
    case shape_type::polygon_m: return "PolygonM";
    case shape_type::multipoint_m: return "MultiPointM";
    case shape_type::multipatch: return "MultiPatch";
  }
  return "Unknown";
}

bool has_z(shape_type type) {
  switch (type) {
    case shape_type::point_z:
    case shape_type::polyline_z:
    case shape_type::polygon_z:
    case shape_type::multipoint_z:
    case shape_type::multipatch:
      return true;
    default:
      return false;
  }
}

bool has_m(shape_type type) {
  switch (type) {
    case shape_type::point_m:
    case shape_type::polyline_m:
    case shape_type::polygon_m:
    case shape_type::multipoint_m:
      return true;
    default:
      return has_z(type);
  }
}

file_header read_header(byte_cursor& in) {
  if (in.size() - in.position() < header_length) {
    throw malformed_header("file is shorter than the " +
                           std::to_string(header_length) + " byte header");
  }
  const detail::header raw = in.read<detail::header>();
  if (raw.file_code != file_code) {
    throw malformed_header("bad file code " +
                           std::to_string(int32_t(raw.file_code)));
  }
  if (!is_shape_type(raw.shape_type)) {
    throw malformed_header("unknown shape type " +
                           std::to_string(int32_t(raw.shape_type)));
  }

  file_header header;
  header.file_length = int64_t(raw.file_length) * sizeof(uint16_t);
  if (header.file_length < header_length) {
    throw malformed_header("declared file length " +
                           std::to_string(header.file_length) +
                           " is shorter than the header");
  }
  header.version = raw.version;
  header.type = static_cast<shape_type>(int32_t(raw.shape_type));
  header.bounds = box(point_xy(raw.x_min, raw.y_min),
                      point_xy(raw.x_max, raw.y_max));
  header.z.min = raw.z_min;
  header.z.max = raw.z_max;
  header.m.min = raw.m_min;
  header.m.max = raw.m_max;
  return header;
}

} // namespace shp

} // namespace geoshp
