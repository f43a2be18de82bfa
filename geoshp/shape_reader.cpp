#include "shape_reader.hpp"

#include <boost/log/trivial.hpp>

#include "byte_cursor.hpp"
#include "error.hpp"

namespace geoshp {

namespace shp {

geometry shape_iterator::dereference() const {
  return reader_->read_shape_at_offset((*offsets_)[position_].offset);
}

mbr_iterator::mbr_iterator(std::shared_ptr<record_scanner> scanner)
    : scanner_(std::move(scanner)) {
  increment();
}

void mbr_iterator::increment() {
  if (!scanner_->next(current_)) {
    scanner_.reset();
  }
}

shape_reader::shape_reader(std::shared_ptr<const stream_provider> streams,
                           reader_options options)
    : streams_(std::move(streams)),
      shape_(open_cursor()),
      header_(read_header(*shape_)),
      decoder_(header_.type, options),
      index_([this] { return open_cursor(); }, header_, decoder_) {
  BOOST_LOG_TRIVIAL(debug) << "opened " << to_string(header_.type)
                           << " shapefile of " << header_.file_length
                           << " bytes";
}

shape_reader::shape_reader(const std::string& path, reader_options options)
    : shape_reader(std::make_shared<file_stream_provider>(path), options) {}

shape_reader::~shape_reader() {
  close();
}

std::size_t shape_reader::record_count() const {
  check_open();
  return index_.size();
}

std::shared_ptr<const offset_index::table> shape_reader::offsets() const {
  check_open();
  return index_.all();
}

shape_range shape_reader::read_all_shapes() const {
  check_open();
  return shape_range(this, index_.all());
}

geometry shape_reader::read_shape_at_index(int64_t index) const {
  check_open();
  return read_shape_at_offset(index_.offset_at(index).offset);
}

geometry shape_reader::read_shape_at_offset(int64_t offset) const {
  check_open();
  if (offset < header_length || offset >= header_.file_length) {
    throw invalid_offset("offset " + std::to_string(offset) +
                         " outside [" + std::to_string(header_length) +
                         ", " + std::to_string(header_.file_length) + ")");
  }

  std::vector<char> bytes;
  {
    std::lock_guard<std::mutex> lock(shape_mutex_);
    shape_->seek(offset);
    const detail::record_header framing = shape_->read<detail::record_header>();
    const int32_t length = framing.length;
    const int64_t record_end = offset + int64_t(sizeof(detail::record_header)) +
                               int64_t(length) * sizeof(uint16_t);
    if (length < 0 || record_end > header_.file_length) {
      throw malformed_record("record at " + std::to_string(offset) +
                             " declares " + std::to_string(length) +
                             " words, past end of file");
    }
    bytes = shape_->read_bytes(std::size_t(length) * sizeof(uint16_t));
  }
  return decoder_.decode(bytes.data(), bytes.data() + bytes.size());
}

mbr_range shape_reader::read_bounding_boxes() const {
  check_open();
  return mbr_range(
    std::make_shared<record_scanner>(open_cursor(), header_, decoder_));
}

void shape_reader::close() {
  if (closed_) {
    return;
  }
  closed_ = true;
  std::lock_guard<std::mutex> lock(shape_mutex_);
  shape_.reset();
  BOOST_LOG_TRIVIAL(debug) << "closed shapefile";
}

void shape_reader::check_open() const {
  if (closed_) {
    throw reader_closed("shape reader is closed");
  }
}

std::unique_ptr<byte_cursor> shape_reader::open_cursor() const {
  if (!streams_) {
    throw io_error("no stream provider");
  }
  return std::unique_ptr<byte_cursor>(
    new byte_cursor(streams_->open_read(stream_role::shape)));
}

} // namespace shp

} // namespace geoshp
