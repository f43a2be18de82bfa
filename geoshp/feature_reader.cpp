#include "feature_reader.hpp"

#include "byte_cursor.hpp"
#include "error.hpp"

namespace geoshp {

namespace {

std::unique_ptr<dbf::attribute_source>
    open_attributes(const stream_provider& streams) {
  std::unique_ptr<byte_cursor> in(
    new byte_cursor(streams.open_read(stream_role::data)));
  return std::unique_ptr<dbf::attribute_source>(
    new dbf::dbase_reader(std::move(in)));
}

} // namespace

feature_iterator::feature_iterator(const feature_reader* reader,
                                   const shp::box& query,
                                   shp::mbr_iterator first)
    : reader_(reader), query_(query), records_(std::move(first)) {
  satisfy();
}

void feature_iterator::increment() {
  ++records_;
  satisfy();
}

void feature_iterator::satisfy() {
  const shp::mbr_iterator last;
  while (records_ != last) {
    const shp::mbr_info& info = *records_;
    if (info.record.bounds && shp::intersects(*info.record.bounds, query_)) {
      current_ = reader_->join(info);
      return;
    }
    ++records_;
  }
}

feature_reader::feature_reader(std::shared_ptr<const stream_provider> streams,
                               reader_options options)
    : shapes_(new shp::shape_reader(streams, options)),
      attributes_(open_attributes(*streams)) {}

feature_reader::feature_reader(const std::string& path,
                               reader_options options)
    : feature_reader(std::make_shared<file_stream_provider>(path), options) {}

feature_reader::feature_reader(
    std::unique_ptr<shp::shape_reader> shapes,
    std::unique_ptr<dbf::attribute_source> attributes)
    : shapes_(std::move(shapes)),
      attributes_(std::move(attributes)) {
  if (!shapes_ || !attributes_) {
    throw error("feature_reader needs a shape reader and an attribute source");
  }
}

feature_reader::~feature_reader() {
  close();
}

feature_range feature_reader::read_by_bounds(const shp::box& query) const {
  return feature_range(this, query, shapes_->read_bounding_boxes());
}

feature feature_reader::read_feature(int64_t ordinal) const {
  std::shared_ptr<const shp::offset_index::table> offsets = shapes_->offsets();
  if (ordinal < 0 || ordinal >= int64_t(offsets->size())) {
    throw index_out_of_range("feature " + std::to_string(ordinal) +
                             " outside [0, " +
                             std::to_string(offsets->size()) + ")");
  }
  shp::mbr_info info;
  info.ordinal = std::size_t(ordinal);
  info.record = (*offsets)[info.ordinal];
  return join(info);
}

void feature_reader::close() {
  if (shapes_) {
    shapes_->close();
  }
  if (attributes_) {
    attributes_->close();
  }
}

feature feature_reader::join(const shp::mbr_info& info) const {
  if (info.ordinal >= attributes_->record_count()) {
    throw malformed_record("no attribute row for record " +
                           std::to_string(info.ordinal) + " of " +
                           std::to_string(attributes_->record_count()));
  }
  feature f;
  f.ordinal = info.ordinal;
  f.geometry = shapes_->read_shape_at_offset(info.record.offset);
  f.bounds = info.record.bounds;
  f.attributes = attributes_->read_record(int64_t(info.ordinal));
  return f;
}

} // namespace geoshp
