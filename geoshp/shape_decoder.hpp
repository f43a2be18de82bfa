#pragma once

#include <cstdint>

#include <boost/optional.hpp>

#include "geometry.hpp"
#include "options.hpp"
#include "shapefile.hpp"

namespace geoshp {

class byte_cursor;

namespace shp {

// Decodes the records of a file declaring one shape type. Null-shape records
// are accepted whatever the declared type; any other mismatch is a
// malformed_record.
class shape_decoder {
 public:
  // Throws unsupported_shape_type for a code outside the closed set.
  explicit shape_decoder(shape_type type, reader_options options = {});

  shape_type type() const { return type_; }

  // Consumes `length` 16-bit words of payload at the cursor, starting with
  // the record's own shape type code.
  geometry decode(byte_cursor& in, int32_t length) const;
  geometry decode(const char* first, const char* last) const;

  // Bounding box of the payload without decoding coordinates. Only the
  // leading fields need to be present.
  boost::optional<box> read_bounds(const char* first, const char* last) const;

  // Bytes read_bounds() may look at, type code included.
  static const std::size_t bounds_prefix = 4 + sizeof(detail::box);

 private:
  shape_type record_type(int32_t code) const;

  shape_type type_;
  reader_options options_;
};

inline geometry decode(shape_type type, byte_cursor& in, int32_t length) {
  return shape_decoder(type).decode(in, length);
}

} // namespace shp

} // namespace geoshp
