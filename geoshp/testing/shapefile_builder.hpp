#pragma once

// Writes small .shp and .dbf images in memory for the unit tests.

#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <boost/endian/arithmetic.hpp>
#include <boost/optional.hpp>

#include "../shapefile.hpp"

namespace geoshp {

namespace testing {

using xy = std::pair<double, double>;

template <class T>
void append(std::string& out, const T& value) {
  out.append(reinterpret_cast<const char*>(&value), sizeof(T));
}

// Payload of one record, starting with its shape type code.
class payload {
 public:
  explicit payload(shp::shape_type type) { i32(int32_t(type)); }

  payload& i32(int32_t v) {
    append(bytes_, boost::endian::little_int32_t(v));
    return *this;
  }
  payload& f64(double v) {
    append(bytes_, boost::endian::little_float64_t(v));
    return *this;
  }
  payload& box(double min_x, double min_y, double max_x, double max_y) {
    return f64(min_x).f64(min_y).f64(max_x).f64(max_y);
  }
  payload& box(const std::vector<xy>& points) {
    double min_x = points.front().first, max_x = min_x;
    double min_y = points.front().second, max_y = min_y;
    for (const xy& p : points) {
      min_x = std::min(min_x, p.first);
      max_x = std::max(max_x, p.first);
      min_y = std::min(min_y, p.second);
      max_y = std::max(max_y, p.second);
    }
    return box(min_x, min_y, max_x, max_y);
  }
  payload& points(const std::vector<xy>& points) {
    for (const xy& p : points) {
      f64(p.first).f64(p.second);
    }
    return *this;
  }
  payload& values(double min, double max, const std::vector<double>& values) {
    f64(min).f64(max);
    for (double v : values) {
      f64(v);
    }
    return *this;
  }
  // Drops the last `count` bytes.
  payload& truncate(std::size_t count) {
    bytes_.resize(bytes_.size() - count);
    return *this;
  }

  const std::string& bytes() const { return bytes_; }

 private:
  std::string bytes_;
};

inline payload poly_payload(shp::shape_type type,
                            const std::vector<int32_t>& parts,
                            const std::vector<xy>& points) {
  payload p(type);
  p.box(points).i32(int32_t(parts.size())).i32(int32_t(points.size()));
  for (int32_t part : parts) {
    p.i32(part);
  }
  p.points(points);
  return p;
}

class shapefile_builder {
 public:
  explicit shapefile_builder(shp::shape_type type) : type_(type) {}

  shapefile_builder& add(const payload& p) {
    offsets_.push_back(100 + int64_t(records_.size()));
    std::string& out = records_;
    append(out, boost::endian::big_int32_t(int32_t(offsets_.size())));
    append(out, boost::endian::big_int32_t(int32_t(p.bytes().size() / 2)));
    out += p.bytes();
    return *this;
  }
  shapefile_builder& add_null() {
    return add(payload(shp::shape_type::null_shape));
  }
  shapefile_builder& add_point(double x, double y) {
    return add(payload(type_).f64(x).f64(y));
  }
  shapefile_builder& add_multipoint(const std::vector<xy>& points) {
    return add(payload(type_).box(points).i32(int32_t(points.size()))
                             .points(points));
  }
  shapefile_builder& add_poly(const std::vector<int32_t>& parts,
                              const std::vector<xy>& points) {
    return add(poly_payload(type_, parts, points));
  }

  shapefile_builder& bounds(double min_x, double min_y,
                            double max_x, double max_y) {
    bounds_ = {min_x, min_y, max_x, max_y};
    return *this;
  }
  // Overrides the file length stored in the header, in bytes.
  shapefile_builder& declared_length(int64_t bytes) {
    declared_length_ = bytes;
    return *this;
  }

  const std::vector<int64_t>& offsets() const { return offsets_; }
  int64_t file_length() const { return 100 + int64_t(records_.size()); }

  std::string bytes() const {
    using namespace boost::endian;
    std::string out;
    append(out, big_int32_t(shp::file_code));
    for (int i = 0; i < 5; ++i) {
      append(out, big_int32_t(0));
    }
    const int64_t length = declared_length_ ? *declared_length_
                                            : file_length();
    append(out, big_int32_t(int32_t(length / 2)));
    append(out, little_int32_t(1000));
    append(out, little_int32_t(int32_t(type_)));
    for (double v : bounds_) {
      append(out, little_float64_t(v));
    }
    for (int i = 0; i < 4; ++i) {
      append(out, little_float64_t(0));
    }
    return out + records_;
  }

 private:
  shp::shape_type type_;
  std::string records_;
  std::vector<int64_t> offsets_;
  std::vector<double> bounds_ = {0, 0, 0, 0};
  boost::optional<int64_t> declared_length_;
};

class dbase_builder {
 public:
  dbase_builder& field(const std::string& name, char type, uint8_t length,
                       uint8_t decimals = 0) {
    fields_.push_back({name, type, length, decimals});
    return *this;
  }
  dbase_builder& row(const std::vector<std::string>& values,
                     bool deleted = false) {
    rows_.push_back({values, deleted});
    return *this;
  }

  std::string bytes() const {
    using namespace boost::endian;
    uint16_t record_length = 1;
    for (const field_def& f : fields_) {
      record_length += f.length;
    }
    const uint16_t header_length = uint16_t(32 + 32 * fields_.size() + 1);

    std::string out;
    out += char(0x03);
    out += char(124);
    out += char(1);
    out += char(1);
    append(out, little_uint32_t(uint32_t(rows_.size())));
    append(out, little_uint16_t(header_length));
    append(out, little_uint16_t(record_length));
    out.append(20, '\0');
    for (const field_def& f : fields_) {
      std::string name = f.name.substr(0, 10);
      name.resize(11, '\0');
      out += name;
      out += f.type;
      out.append(4, '\0');
      out += char(f.length);
      out += char(f.decimals);
      out.append(14, '\0');
    }
    out += char(0x0D);
    for (const row_def& r : rows_) {
      out += r.deleted ? '*' : ' ';
      for (std::size_t i = 0; i < fields_.size(); ++i) {
        std::string v = i < r.values.size() ? r.values[i] : std::string();
        v = v.substr(0, fields_[i].length);
        const std::string pad(fields_[i].length - v.size(), ' ');
        out += fields_[i].type == 'C' ? v + pad : pad + v;
      }
    }
    out += char(0x1A);
    return out;
  }

 private:
  struct field_def {
    std::string name;
    char type;
    uint8_t length;
    uint8_t decimals;
  };
  struct row_def {
    std::vector<std::string> values;
    bool deleted;
  };

  std::vector<field_def> fields_;
  std::vector<row_def> rows_;
};

} // namespace testing

} // namespace geoshp
